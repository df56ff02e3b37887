/**
 * lode CLI - uninstall command
 *
 * Remove installed versions of a package.
 */

#include "../common.hpp"
#include "lode/package_index.hpp"
#include "lode/prompter.hpp"
#include "lode/uninstaller.hpp"

#include <CLI/CLI.hpp>
#include <memory>

namespace lode::cli::commands {

namespace {

struct UninstallOptions {
    std::string name;
    std::string version = "> 0";
    bool yes = false;
};

int cmd_uninstall(const GlobalOptions& opts, const UninstallOptions& uninstall_opts) {
    std::string install_dir = resolve_root(opts);

    WarningCollector config_warnings;
    std::string config_error;
    auto config = load_config(install_dir, config_warnings, config_error);
    if (!config) {
        print_error(config_error, opts.json);
        return 1;
    }

    InstalledPackageIndex index(install_dir);

    // Prompts stay off stdout when it carries JSON
    std::ostream& prompt_out = opts.json ? std::cerr : std::cout;
    std::unique_ptr<Prompter> prompter;
    if (uninstall_opts.yes) {
        // "All versions" is always the entry after the last match
        auto matches = index.search(uninstall_opts.name, uninstall_opts.version);
        prompter = std::make_unique<AssumeYesPrompter>(prompt_out, std::to_string(matches.size() + 1));
    } else {
        prompter = std::make_unique<ConsolePrompter>(std::cin, prompt_out);
    }

    Uninstaller uninstaller(*config, index, *prompter);
    auto result = uninstaller.uninstall(uninstall_opts.name, uninstall_opts.version);

    std::vector<WarningObject> all_warnings = config_warnings.get_warnings();
    all_warnings.insert(all_warnings.end(), result.warnings.begin(), result.warnings.end());
    bool warning_errors = config_warnings.has_errors() || result.warning_errors;

    if (!result.ok) {
        print_warnings(all_warnings, opts);
        // The prompter already showed a bad selection
        if (opts.json || result.error_kind != PackageError::AMBIGUOUS_SELECTION) {
            print_error(result.error, opts.json,
                        result.error_kind ? package_error_to_string(*result.error_kind) : "",
                        all_warnings);
        }
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = !warning_errors;
        j["unknown_package"] = result.unknown_package;
        j["removed"] = nlohmann::json::array();
        for (const auto& spec : result.removed) {
            j["removed"].push_back({{"name", spec.name}, {"version", spec.version}});
        }
        j["messages"] = result.messages;
        j["warnings"] = warnings_to_json(all_warnings);
        output_json(j);
    } else {
        print_warnings(all_warnings, opts);
    }

    return warning_errors ? 1 : 0;
}

} // anonymous namespace

void setup_uninstall(CLI::App* app, GlobalOptions& opts) {
    static UninstallOptions uninstall_opts;

    app->add_option("name", uninstall_opts.name, "Package name")->required();
    app->add_option("--version", uninstall_opts.version, "Version requirement (default \"> 0\")");
    app->add_flag("-y,--yes", uninstall_opts.yes, "Answer yes to every prompt and remove all matching versions");

    app->callback([&opts]() {
        init_logging(opts);
        std::exit(cmd_uninstall(opts, uninstall_opts));
    });
}

} // namespace lode::cli::commands
