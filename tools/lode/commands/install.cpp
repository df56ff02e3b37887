/**
 * lode CLI - install command
 *
 * Install a package archive into the install root.
 */

#include "../common.hpp"
#include "lode/installer.hpp"
#include "lode/package_index.hpp"
#include "lode/process.hpp"

#include <CLI/CLI.hpp>

namespace lode::cli::commands {

namespace {

struct InstallCmdOptions {
    std::string archive;
    bool force = false;
    bool no_stub = false;
    std::vector<std::string> build_args;
};

nlohmann::json extension_reports_to_json(const std::vector<ExtensionBuildReport>& reports) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& report : reports) {
        nlohmann::json j;
        j["extension"] = report.extension;
        j["ok"] = report.ok;
        if (!report.ok) {
            j["error"] = report.error;
        }
        j["log"] = report.log_path;
        j["commands"] = report.commands;
        arr.push_back(j);
    }
    return arr;
}

int cmd_install(const GlobalOptions& opts, const InstallCmdOptions& install_opts) {
    std::string install_dir = resolve_root(opts);

    WarningCollector config_warnings;
    std::string config_error;
    auto config = load_config(install_dir, config_warnings, config_error);
    if (!config) {
        print_error(config_error, opts.json);
        return 1;
    }

    InstalledPackageIndex index(install_dir);
    IndexDependencyResolver resolver(index);
    SystemProcessRunner runner;
    Installer installer(*config, resolver, runner);

    InstallOptions options;
    options.install_dir = install_dir;
    options.force = install_opts.force;
    options.install_stub = !install_opts.no_stub;
    options.build_args = install_opts.build_args;

    auto result = installer.install(install_opts.archive, options);

    std::vector<WarningObject> all_warnings = config_warnings.get_warnings();
    all_warnings.insert(all_warnings.end(), result.warnings.begin(), result.warnings.end());
    bool warning_errors = config_warnings.has_errors() || result.warning_errors;

    if (!result.ok) {
        print_warnings(all_warnings, opts);
        print_error(result.error, opts.json,
                    result.error_kind ? package_error_to_string(*result.error_kind) : "",
                    all_warnings);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = !warning_errors;
        j["package"]["name"] = result.spec.name;
        j["package"]["version"] = result.spec.version;
        j["paths"]["package_dir"] = result.package_dir;
        j["paths"]["descriptor"] = result.descriptor_path;
        j["paths"]["cache"] = result.cache_path;
        j["stubs"]["bin"] = result.bin_stubs;
        if (result.library_stub.empty()) {
            j["stubs"]["library"] = nullptr;
        } else {
            j["stubs"]["library"] = result.library_stub;
        }
        j["extensions"] = extension_reports_to_json(result.extension_reports);
        j["warnings"] = warnings_to_json(all_warnings);
        output_json(j);
    } else {
        print_warnings(all_warnings, opts);
        if (!opts.quiet) {
            print_success(result.message, opts.json);
        }
    }

    return warning_errors ? 1 : 0;
}

} // anonymous namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallCmdOptions install_opts;

    app->add_option("archive", install_opts.archive, "Package archive (.lode)")->required();
    app->add_flag("-f,--force", install_opts.force, "Skip the dependency check");
    app->add_flag("--no-stub", install_opts.no_stub, "Do not write the autorequire library stub");
    app->add_option("build_args", install_opts.build_args, "Arguments passed to extension scripts (after --)");

    app->callback([&opts]() {
        init_logging(opts);
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace lode::cli::commands
