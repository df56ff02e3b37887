/**
 * lode CLI - Common utilities and types
 */

#pragma once

#include "lode/host_config.hpp"
#include "lode/platform.hpp"
#include "lode/warnings.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace lode::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route library logging to stderr and pick the level.
 * Priority: -v / -q flags > LODE_LOG_LEVEL env > warn
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("lode");
    if (!logger) {
        logger = spdlog::stderr_color_mt("lode");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%l] %v");

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
        return;
    }

    std::string level = get_env("LODE_LOG_LEVEL").value_or("");
    if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

inline std::string resolve_root(const GlobalOptions& opts) {
    return resolve_install_dir(opts.root.empty() ? std::nullopt : std::make_optional(opts.root));
}

/**
 * Load the host configuration for an install root, turning soft problems in
 * the config file into invalid_configuration warnings.
 */
inline std::optional<HostConfig> load_config(const std::string& install_dir,
                                             WarningCollector& collector,
                                             std::string& error) {
    auto loaded = load_host_config(install_dir);
    if (!loaded.ok) {
        error = "invalid configuration " + join_path(install_dir, layout::CONFIG_FILE) + ": " +
                loaded.error;
        return std::nullopt;
    }

    collector.set_config(&loaded.config);
    for (const auto& reason : loaded.warnings) {
        collector.emit(Warning::invalid_configuration,
                       warnings::invalid_configuration(reason, loaded.config.source_path));
    }
    return loaded.config;
}

/**
 * Output utilities.
 */
inline nlohmann::json warnings_to_json(const std::vector<WarningObject>& list) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : list) {
        nlohmann::json j;
        j["key"] = w.key;
        j["action"] = w.action;
        nlohmann::json fields = nlohmann::json::object();
        for (const auto& [k, v] : w.fields) {
            fields[k] = v;
        }
        j["fields"] = fields;
        arr.push_back(j);
    }
    return arr;
}

inline void print_warnings(const std::vector<WarningObject>& list, const GlobalOptions& opts) {
    if (opts.json || opts.quiet) {
        return;
    }
    for (const auto& w : list) {
        std::cerr << (w.action == "error" ? "Error: " : "Warning: ") << format_warning(w) << std::endl;
    }
}

inline void print_error(const std::string& msg, bool json_mode,
                        const std::string& kind = "",
                        const std::vector<WarningObject>& warnings = {}) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (!kind.empty()) {
            j["error_kind"] = kind;
        }
        if (!warnings.empty()) {
            j["warnings"] = warnings_to_json(warnings);
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace lode::cli
