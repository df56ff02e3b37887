#include "lode/host_config.hpp"
#include "lode/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lode {

namespace {

constexpr const char* CONFIG_SCHEMA = "lode.config.v1";

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Relative directories in the config file are taken relative to the install root
std::string resolve_against(const std::string& install_dir, const std::string& value) {
    if (value.empty()) return value;
    if (value[0] == '/' || (value.size() >= 2 && value[1] == ':')) {
        return to_portable_path(value);
    }
    return join_path(install_dir, value);
}

} // namespace

HostConfig get_builtin_config(const std::string& install_dir) {
    HostConfig config;
    config.install_dir = install_dir;
#ifdef _WIN32
    config.interpreter.path = "ruby";
#else
    config.interpreter.path = "/usr/bin/ruby";
#endif
    config.interpreter.bindir = join_path(install_dir, "bin");
    config.interpreter.sitelibdir = join_path(install_dir, "site_lib");
    return config;
}

HostConfigParseResult parse_host_config_full(const std::string& json_str,
                                              const std::string& install_dir,
                                              const std::string& source_path) {
    HostConfigParseResult result;
    result.config = get_builtin_config(install_dir);
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        // "interpreter" section
        if (j.contains("interpreter") && j["interpreter"].is_object()) {
            const auto& interp = j["interpreter"];
            if (auto path = get_string(interp, "path")) {
                result.config.interpreter.path = *path;
            }
            if (auto bindir = get_string(interp, "bindir")) {
                result.config.interpreter.bindir = resolve_against(install_dir, *bindir);
            }
            if (auto sitelibdir = get_string(interp, "sitelibdir")) {
                result.config.interpreter.sitelibdir = resolve_against(install_dir, *sitelibdir);
            }
            if (auto ext = get_string(interp, "script_extension")) {
                if (!ext->empty() && (*ext)[0] != '.') {
                    result.warnings.push_back("invalid_configuration:script_extension_without_dot");
                    result.config.interpreter.script_extension = "." + *ext;
                } else {
                    result.config.interpreter.script_extension = *ext;
                }
            }
            if (auto loader = get_string(interp, "loader")) {
                if (trim(*loader).empty()) {
                    result.warnings.push_back("invalid_configuration:empty_loader");
                } else {
                    result.config.interpreter.loader = trim(*loader);
                }
            }
        }

        // "build" section
        if (j.contains("build") && j["build"].is_object()) {
            const auto& build = j["build"];
            if (auto make = get_string(build, "make")) {
                result.config.build.make = trim(*make);
            }
            if (build.contains("install_dir_variables")) {
                const auto& vars = build["install_dir_variables"];
                if (vars.is_array()) {
                    std::vector<std::string> names;
                    for (const auto& elem : vars) {
                        if (elem.is_string() && !trim(elem.get<std::string>()).empty()) {
                            names.push_back(trim(elem.get<std::string>()));
                        } else {
                            result.warnings.push_back("invalid_configuration:invalid_install_dir_variable");
                        }
                    }
                    result.config.build.install_dir_variables = names;
                } else {
                    result.warnings.push_back("invalid_configuration:install_dir_variables_not_array");
                }
            }
        }

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                if (val.is_string()) {
                    std::string key_str = to_lower(key);
                    if (!parse_warning_key(key_str)) {
                        result.warnings.push_back("invalid_configuration:unknown_warning:" + key_str);
                        continue;
                    }
                    auto action = parse_warning_action(val.get<std::string>());
                    if (action) {
                        result.config.warnings[key_str] = *action;
                    } else {
                        result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                    }
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

void apply_env_overrides(HostConfig& config) {
    if (auto interp = get_env("LODE_INTERPRETER"); interp && !interp->empty()) {
        config.interpreter.path = *interp;
    }
    if (auto bindir = get_env("LODE_BINDIR"); bindir && !bindir->empty()) {
        config.interpreter.bindir = absolute_path(*bindir);
    }
    if (auto sitelibdir = get_env("LODE_SITELIBDIR"); sitelibdir && !sitelibdir->empty()) {
        config.interpreter.sitelibdir = absolute_path(*sitelibdir);
    }
}

HostConfigParseResult load_host_config(const std::string& install_dir) {
    std::string config_path = join_path(install_dir, layout::CONFIG_FILE);

    HostConfigParseResult result;
    auto content = read_text_file(config_path);
    if (!content) {
        spdlog::debug("no configuration at {}, using built-in defaults", config_path);
        result.ok = true;
        result.config = get_builtin_config(install_dir);
    } else {
        result = parse_host_config_full(*content, install_dir, config_path);
        if (!result.ok) {
            return result;
        }
        spdlog::debug("loaded configuration from {}", config_path);
    }

    apply_env_overrides(result.config);
    return result;
}

std::string resolve_install_dir(const std::optional<std::string>& override_root) {
    // 1. Explicit override
    if (override_root && !override_root->empty()) {
        return absolute_path(*override_root);
    }

    // 2. Environment variable
    if (auto env_root = get_env("LODE_HOME"); env_root && !env_root->empty()) {
        return absolute_path(*env_root);
    }

    // 3. Default: ~/.lode
    if (auto home = get_env("HOME"); home && !home->empty()) {
        return join_path(*home, ".lode");
    }

    // Fallback for Windows
    if (auto userprofile = get_env("USERPROFILE"); userprofile && !userprofile->empty()) {
        return join_path(*userprofile, ".lode");
    }

    return absolute_path(".lode");
}

std::string default_make_program() {
    return get_current_platform() == Platform::Windows ? "nmake" : "make";
}

std::string resolve_make_program(const HostConfig& config) {
    if (auto make = get_env("MAKE"); make && !trim(*make).empty()) {
        return trim(*make);
    }
    if (!config.build.make.empty()) {
        return config.build.make;
    }
    return default_make_program();
}

} // namespace lode
