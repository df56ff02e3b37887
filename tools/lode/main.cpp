/**
 * lode CLI - Entry Point
 *
 * Package installer command-line interface.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#ifndef LODE_VERSION
#define LODE_VERSION "0.0.0"
#endif

// Forward declarations for commands
namespace lode::cli::commands {
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_uninstall(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_pack(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace lode::cli;

    CLI::App app{"lode - package installer"};
    app.set_version_flag("-V,--version", LODE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "Install root directory");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Install a package archive");
    commands::setup_install(install_cmd, opts);

    auto* uninstall_cmd = app.add_subcommand("uninstall", "Remove an installed package");
    commands::setup_uninstall(uninstall_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List installed packages");
    commands::setup_list(list_cmd, opts);

    auto* pack_cmd = app.add_subcommand("pack", "Create a .lode package");
    commands::setup_pack(pack_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
