#pragma once

#include "lode/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lode {

// ============================================================================
// Host Configuration
// ============================================================================

struct HostConfig {
    std::string schema;  // "lode.config.v1" when loaded from a file

    // Install root (D). Always absolute once resolved.
    std::string install_dir;

    // [interpreter] section
    struct {
        std::string path;               // Shebang target for launchers
        std::string bindir;             // Where launchers are written
        std::string sitelibdir;         // Where library stubs are written
        std::string script_extension = ".rb";
        std::string loader = "rubygems";
    } interpreter;

    // [build] section
    struct {
        std::string make;  // Empty means platform default
        std::vector<std::string> install_dir_variables = {"RUBYARCHDIR", "RUBYLIBDIR"};
    } build;

    // [warnings] section - maps warning key to action
    std::unordered_map<std::string, WarningAction> warnings;

    // Source path for trace
    std::string source_path;
};

// Built-in configuration for an install root (no config file present)
HostConfig get_builtin_config(const std::string& install_dir);

// ============================================================================
// Host Configuration Parsing Result
// ============================================================================

struct HostConfigParseResult {
    bool ok = false;
    std::string error;
    HostConfig config;
    std::vector<std::string> warnings;
};

// Parse a host configuration from JSON string. Unset keys keep the built-in
// defaults for `install_dir`.
HostConfigParseResult parse_host_config_full(const std::string& json_str,
                                              const std::string& install_dir,
                                              const std::string& source_path = "");

// Load <install_dir>/config.json if present, else the built-in defaults,
// then apply environment overrides.
HostConfigParseResult load_host_config(const std::string& install_dir);

// Apply LODE_INTERPRETER / LODE_BINDIR / LODE_SITELIBDIR overrides
void apply_env_overrides(HostConfig& config);

// ============================================================================
// Resolution Helpers
// ============================================================================

// Resolve the install root.
// Priority: explicit override > LODE_HOME env > ~/.lode
std::string resolve_install_dir(const std::optional<std::string>& override_root);

// Resolve the external build-tool program.
// Priority: MAKE env > config build.make > platform default
std::string resolve_make_program(const HostConfig& config);

// Platform default build tool ("nmake" on Windows, "make" elsewhere)
std::string default_make_program();

} // namespace lode
