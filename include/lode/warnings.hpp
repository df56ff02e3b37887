#pragma once

#include "lode/types.hpp"
#include "lode/host_config.hpp"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lode {

// ============================================================================
// Warning Collector
// ============================================================================

using WarningFields = std::unordered_map<std::string, std::string>;

/**
 * Collects the non-fatal problems of one install or uninstall.
 *
 * Each warning key is mapped to an action by the host config's [warnings]
 * table (default: warn). Ignored warnings are dropped at emit time; an
 * "error" action does not stop the operation, it only makes has_errors()
 * true so the caller can report failure once the operation is done.
 */
class WarningCollector {
public:
    WarningCollector() = default;
    explicit WarningCollector(std::unordered_map<std::string, WarningAction> policy)
        : policy_(std::move(policy)) {}
    explicit WarningCollector(const HostConfig* config);

    // Replace the policy with the one in `config` (none when null)
    void set_config(const HostConfig* config);

    void emit(Warning warning, WarningFields fields = {});

    // Emitted warnings that were not ignored, in emit order
    const std::vector<WarningObject>& get_warnings() const { return warnings_; }

    // True when a warning was escalated to an error by policy
    bool has_errors() const { return errors_ > 0; }

private:
    WarningAction action_for(Warning warning) const;

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<WarningObject> warnings_;
    size_t errors_ = 0;
};

// Render a warning as a single human-readable line
std::string format_warning(const WarningObject& warning);

// ============================================================================
// Convenience functions for building warning fields
// ============================================================================

namespace warnings {

inline WarningFields library_stub_exists(
    const std::string& package,
    const std::string& target_file) {
    return {{"package", package}, {"path", target_file},
            {"error_kind", package_error_to_string(PackageError::STUB_WRITE_PERMISSION)},
            {"message", "library file '" + target_file +
                        "' already exists; not overwriting. Delete it and reinstall to force a stub"}};
}

inline WarningFields library_stub_unwritable(
    const std::string& package,
    const std::string& directory) {
    return {{"package", package}, {"path", directory},
            {"error_kind", package_error_to_string(PackageError::STUB_WRITE_PERMISSION)},
            {"message", "can't install library stub for '" + package +
                        "' (no write permission on '" + directory + "')"}};
}

inline WarningFields bin_stub_unwritable(
    const std::string& package,
    const std::string& target_file) {
    return {{"package", package}, {"path", target_file},
            {"error_kind", package_error_to_string(PackageError::STUB_WRITE_PERMISSION)},
            {"message", "can't write launcher '" + target_file + "'"}};
}

inline WarningFields extension_build_failed(
    const std::string& extension,
    const std::string& reason,
    const std::string& log_path) {
    return {{"extension", extension}, {"reason", reason}, {"log", log_path},
            {"error_kind", package_error_to_string(PackageError::EXTENSION_BUILD)},
            {"message", reason}};
}

inline WarningFields path_failure(
    const std::string& path,
    const std::string& message) {
    return {{"path", path}, {"message", message}};
}

inline WarningFields invalid_configuration(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path},
            {"message", reason}};
}

} // namespace warnings

} // namespace lode
