#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lode {

// ============================================================================
// Package Specification
// ============================================================================

struct Dependency {
    std::string name;
    std::string requirement = ">= 0";

    std::string to_string() const { return name + " (" + requirement + ")"; }
};

struct Specification {
    std::string name;
    std::string version;
    std::string summary;
    std::vector<Dependency> dependencies;
    std::vector<std::string> executables;      // File names under bindir
    std::optional<std::string> autorequire;    // Library loaded by the library stub
    std::vector<std::string> extensions;       // Build scripts, package-relative
    std::vector<std::string> require_paths = {"lib"};
    std::string bindir = "bin";

    // Set once installed
    std::string installation_path;  // Install root (D)
    std::string loaded_from;        // Descriptor path

    // "<name>-<version>"
    std::string full_name() const { return name + "-" + version; }

    // <installation_path>/gems/<full_name>; empty when not installed
    std::string full_gem_path() const;
};

struct SpecificationParseResult {
    bool ok = false;
    std::string error;
    Specification spec;
};

// Parse the metadata document shipped inside an archive
SpecificationParseResult parse_specification(const std::string& json_str);
SpecificationParseResult parse_specification_json(const nlohmann::json& j);

// Serialize without the installation-only fields
nlohmann::json specification_to_json(const Specification& spec);
std::string serialize_specification(const Specification& spec);

// Check name, version, requirements and the relative paths a spec declares.
// Returns false and fills `error` on the first problem found.
bool validate_specification(const Specification& spec, std::string& error);

// Order by name, then by version (ascending)
bool specification_less(const Specification& a, const Specification& b);

} // namespace lode
