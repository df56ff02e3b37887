#pragma once

#include "lode/specification.hpp"

#include <string>
#include <vector>

namespace lode {

// ============================================================================
// Installed Package Record
// ============================================================================

// Persisted at D/specifications/<full_name>.json
struct InstalledPackageRecord {
    std::string schema = "lode.installed.v1";

    Specification spec;

    // [provenance] section
    struct {
        std::string installed_at;  // RFC3339 timestamp
        std::string source;        // Archive path the package was installed from
        std::string cache_file;    // File name under D/cache/
        std::string package_hash;  // "sha256:..."
    } provenance;

    // [stubs] section, what the install wrote outside the package dir
    struct {
        std::vector<std::string> bin_stubs;  // Absolute launcher paths
        std::string library_stub;            // Absolute path; empty when none
        bool library_stub_requested = false; // Asked for, even if another file was in the way
    } stubs;

    // Source path for trace
    std::string source_path;
};

// ============================================================================
// Installed Package Record Parsing Result
// ============================================================================

struct InstalledRecordParseResult {
    bool ok = false;
    std::string error;
    InstalledPackageRecord record;
    std::vector<std::string> warnings;
};

// Parse a descriptor from JSON string
InstalledRecordParseResult parse_installed_record(const std::string& json_str,
                                                  const std::string& source_path = "");

// Serialize a descriptor to JSON string
std::string serialize_installed_record(const InstalledPackageRecord& record);

// D/specifications/<full_name>.json
std::string descriptor_path(const std::string& install_dir, const std::string& full_name);

// Read and parse the descriptor at `path`; installation_path and loaded_from
// are filled in from `install_dir` and `path`.
InstalledRecordParseResult load_installed_record(const std::string& install_dir,
                                                 const std::string& path);

} // namespace lode
