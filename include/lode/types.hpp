#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lode {

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    library_stub_exists,       // Target library stub already present; left untouched
    library_stub_unwritable,   // Site library directory not writable
    bin_stub_unwritable,       // Launcher could not be written to the binary directory
    extension_build_failed,    // Native extension build reported a failure
    cache_copy_failed,         // Archive could not be copied into cache/
    cache_remove_failed,       // Cached archive could not be deleted during uninstall
    stub_remove_failed,        // Stale stub could not be deleted during uninstall
    doc_remove_failed,         // Generated documentation could not be deleted
    invalid_descriptor,        // Installed descriptor could not be parsed
    invalid_configuration,     // Host configuration is malformed
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::library_stub_exists: return "library_stub_exists";
        case Warning::library_stub_unwritable: return "library_stub_unwritable";
        case Warning::bin_stub_unwritable: return "bin_stub_unwritable";
        case Warning::extension_build_failed: return "extension_build_failed";
        case Warning::cache_copy_failed: return "cache_copy_failed";
        case Warning::cache_remove_failed: return "cache_remove_failed";
        case Warning::stub_remove_failed: return "stub_remove_failed";
        case Warning::doc_remove_failed: return "doc_remove_failed";
        case Warning::invalid_descriptor: return "invalid_descriptor";
        case Warning::invalid_configuration: return "invalid_configuration";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

// ============================================================================
// Warning Action
// ============================================================================

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

// ============================================================================
// Package Errors
// ============================================================================

enum class PackageError {
    MISSING_DEPENDENCY,
    EXTRACTION_IO,
    EXTENSION_BUILD,
    STUB_WRITE_PERMISSION,
    DEPENDENT_EXISTS,
    AMBIGUOUS_SELECTION,
    ARCHIVE_INVALID,
    PERSISTENCE_IO,
    REMOVAL_IO,
};

inline const char* package_error_to_string(PackageError e) {
    switch (e) {
        case PackageError::MISSING_DEPENDENCY: return "MISSING_DEPENDENCY";
        case PackageError::EXTRACTION_IO: return "EXTRACTION_IO";
        case PackageError::EXTENSION_BUILD: return "EXTENSION_BUILD";
        case PackageError::STUB_WRITE_PERMISSION: return "STUB_WRITE_PERMISSION";
        case PackageError::DEPENDENT_EXISTS: return "DEPENDENT_EXISTS";
        case PackageError::AMBIGUOUS_SELECTION: return "AMBIGUOUS_SELECTION";
        case PackageError::ARCHIVE_INVALID: return "ARCHIVE_INVALID";
        case PackageError::PERSISTENCE_IO: return "PERSISTENCE_IO";
        case PackageError::REMOVAL_IO: return "REMOVAL_IO";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Warning Object
// ============================================================================

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

// ============================================================================
// Layout Constants
// ============================================================================

namespace layout {
    constexpr const char* GEMS_DIR = "gems";
    constexpr const char* SPECIFICATIONS_DIR = "specifications";
    constexpr const char* CACHE_DIR = "cache";
    constexpr const char* DOC_DIR = "doc";
    constexpr const char* DESCRIPTOR_EXTENSION = ".json";
    constexpr const char* ARCHIVE_EXTENSION = ".lode";
    constexpr const char* CONFIG_FILE = "config.json";
}

} // namespace lode
