#include "lode/specification.hpp"
#include "lode/path_utils.hpp"
#include "lode/platform.hpp"
#include "lode/semver.hpp"
#include "lode/types.hpp"

#include <algorithm>
#include <cctype>

namespace lode {

namespace {

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

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

bool is_valid_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    for (unsigned char c : name) {
        if (std::isspace(c) || c == '/' || c == '\\' || c == ':' || c < 0x20) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string Specification::full_gem_path() const {
    if (installation_path.empty()) return "";
    return join_path(join_path(installation_path, layout::GEMS_DIR), full_name());
}

SpecificationParseResult parse_specification_json(const nlohmann::json& j) {
    SpecificationParseResult result;

    if (!j.is_object()) {
        result.error = "specification must be an object";
        return result;
    }

    // name, version (REQUIRED)
    if (auto name = get_string(j, "name")) {
        result.spec.name = trim(*name);
    } else {
        result.error = "name missing";
        return result;
    }
    if (auto version = get_string(j, "version")) {
        result.spec.version = trim(*version);
    } else {
        result.error = "version missing";
        return result;
    }

    if (auto summary = get_string(j, "summary")) {
        result.spec.summary = *summary;
    }

    if (j.contains("dependencies")) {
        if (!j["dependencies"].is_array()) {
            result.error = "dependencies must be an array";
            return result;
        }
        for (const auto& dep : j["dependencies"]) {
            Dependency d;
            if (dep.is_string()) {
                d.name = trim(dep.get<std::string>());
            } else if (dep.is_object()) {
                if (auto name = get_string(dep, "name")) {
                    d.name = trim(*name);
                }
                if (auto req = get_string(dep, "requirement")) {
                    if (!trim(*req).empty()) d.requirement = trim(*req);
                }
            } else {
                result.error = "dependency entries must be strings or objects";
                return result;
            }
            if (d.name.empty()) {
                result.error = "dependency name missing";
                return result;
            }
            result.spec.dependencies.push_back(std::move(d));
        }
    }

    result.spec.executables = get_string_array(j, "executables");
    result.spec.extensions = get_string_array(j, "extensions");

    if (j.contains("autorequire") && j["autorequire"].is_string()) {
        std::string lib = trim(j["autorequire"].get<std::string>());
        if (!lib.empty()) result.spec.autorequire = lib;
    }

    if (j.contains("require_paths")) {
        auto paths = get_string_array(j, "require_paths");
        if (!paths.empty()) result.spec.require_paths = paths;
    }

    if (auto bindir = get_string(j, "bindir")) {
        if (!trim(*bindir).empty()) result.spec.bindir = trim(*bindir);
    }

    std::string error;
    if (!validate_specification(result.spec, error)) {
        result.error = error;
        return result;
    }

    result.ok = true;
    return result;
}

SpecificationParseResult parse_specification(const std::string& json_str) {
    try {
        return parse_specification_json(nlohmann::json::parse(json_str));
    } catch (const nlohmann::json::parse_error& e) {
        SpecificationParseResult result;
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        SpecificationParseResult result;
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

nlohmann::json specification_to_json(const Specification& spec) {
    nlohmann::json j;
    j["name"] = spec.name;
    j["version"] = spec.version;
    if (!spec.summary.empty()) {
        j["summary"] = spec.summary;
    }

    j["dependencies"] = nlohmann::json::array();
    for (const auto& dep : spec.dependencies) {
        j["dependencies"].push_back({{"name", dep.name}, {"requirement", dep.requirement}});
    }

    j["executables"] = spec.executables;
    if (spec.autorequire) {
        j["autorequire"] = *spec.autorequire;
    } else {
        j["autorequire"] = nullptr;
    }
    j["extensions"] = spec.extensions;
    j["require_paths"] = spec.require_paths;
    j["bindir"] = spec.bindir;
    return j;
}

std::string serialize_specification(const Specification& spec) {
    return specification_to_json(spec).dump(2);
}

bool validate_specification(const Specification& spec, std::string& error) {
    if (!is_valid_name(spec.name)) {
        error = "invalid package name '" + spec.name + "'";
        return false;
    }
    if (spec.version.empty() || !parse_version(spec.version)) {
        error = "invalid version '" + spec.version + "' for " + spec.name;
        return false;
    }

    for (const auto& dep : spec.dependencies) {
        if (!is_valid_name(dep.name)) {
            error = "invalid dependency name '" + dep.name + "'";
            return false;
        }
        if (!parse_range(dep.requirement)) {
            error = "invalid requirement '" + dep.requirement + "' for dependency " + dep.name;
            return false;
        }
    }

    for (const auto& exe : spec.executables) {
        if (!is_valid_name(exe)) {
            error = "invalid executable name '" + exe + "'";
            return false;
        }
    }

    for (const auto& ext : spec.extensions) {
        if (!is_safe_relative_path(ext)) {
            error = "unsafe extension path '" + ext + "'";
            return false;
        }
    }

    for (const auto& path : spec.require_paths) {
        if (!is_safe_relative_path(path)) {
            error = "unsafe require path '" + path + "'";
            return false;
        }
    }

    if (!is_safe_relative_path(spec.bindir)) {
        error = "unsafe bindir '" + spec.bindir + "'";
        return false;
    }

    if (spec.autorequire && !is_safe_relative_path(*spec.autorequire)) {
        error = "unsafe autorequire '" + *spec.autorequire + "'";
        return false;
    }

    return true;
}

bool specification_less(const Specification& a, const Specification& b) {
    if (a.name != b.name) return a.name < b.name;
    return compare_versions(a.version, b.version) < 0;
}

} // namespace lode
