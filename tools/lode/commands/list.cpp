/**
 * lode CLI - list command
 *
 * List installed packages.
 */

#include "../common.hpp"
#include "lode/package_index.hpp"

#include <CLI/CLI.hpp>

namespace lode::cli::commands {

namespace {

struct ListOptions {
    std::string name;
};

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    std::string install_dir = resolve_root(opts);

    InstalledPackageIndex index(install_dir);
    auto specs = list_opts.name.empty() ? index.all() : index.search(list_opts.name);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["packages"] = nlohmann::json::array();
        for (const auto& spec : specs) {
            nlohmann::json p;
            p["name"] = spec.name;
            p["version"] = spec.version;
            p["summary"] = spec.summary;
            p["path"] = spec.full_gem_path();
            j["packages"].push_back(p);
        }
        output_json(j);
        return 0;
    }

    if (specs.empty()) {
        if (!opts.quiet) {
            std::cout << "No packages installed." << std::endl;
        }
        return 0;
    }

    // Group versions under their package name, newest first
    size_t i = 0;
    while (i < specs.size()) {
        size_t end = i;
        while (end < specs.size() && specs[end].name == specs[i].name) ++end;

        std::cout << specs[i].name << " (";
        for (size_t k = end; k > i; --k) {
            std::cout << specs[k - 1].version << (k - 1 > i ? ", " : "");
        }
        std::cout << ")" << std::endl;
        if (opts.verbose && !specs[end - 1].summary.empty()) {
            std::cout << "    " << specs[end - 1].summary << std::endl;
        }
        i = end;
    }

    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_option("name", list_opts.name, "Only list versions of this package");

    app->callback([&opts]() {
        init_logging(opts);
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace lode::cli::commands
