/**
 * lode CLI - pack command
 *
 * Create a .lode archive from a directory holding metadata.json.
 */

#include "../common.hpp"
#include "lode/archive.hpp"

#include <CLI/CLI.hpp>

namespace lode::cli::commands {

namespace {

struct PackOptions {
    std::string dir;
    std::string output;
};

int cmd_pack(const GlobalOptions& opts, const PackOptions& pack_opts) {
    auto packed = pack_directory(pack_opts.dir);
    if (!packed.ok) {
        print_error(packed.error, opts.json);
        return 1;
    }

    std::string output_path = pack_opts.output;
    if (output_path.empty()) {
        output_path = archive_file_name(packed.spec);
    }

    auto write = atomic_write_file(output_path, packed.archive_data);
    if (!write.ok) {
        print_error("Failed to write " + output_path + ": " + write.error, opts.json);
        return 1;
    }

    auto hash = compute_sha256(packed.archive_data);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["name"] = packed.spec.name;
        j["version"] = packed.spec.version;
        j["package"] = output_path;
        if (hash.ok) {
            j["sha256"] = hash.hex_digest;
        }
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "Created package: " << output_path << std::endl;
        std::cout << "  Name: " << packed.spec.name << std::endl;
        std::cout << "  Version: " << packed.spec.version << std::endl;
        if (hash.ok) {
            std::cout << "  SHA-256: " << hash.hex_digest << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_pack(CLI::App* app, GlobalOptions& opts) {
    static PackOptions pack_opts;

    app->add_option("dir", pack_opts.dir, "Directory to pack")->required();
    app->add_option("-o,--output", pack_opts.output, "Output file path");

    app->callback([&opts]() {
        init_logging(opts);
        std::exit(cmd_pack(opts, pack_opts));
    });
}

} // namespace lode::cli::commands
