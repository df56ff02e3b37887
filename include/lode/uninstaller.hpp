#pragma once

#include "lode/host_config.hpp"
#include "lode/package_index.hpp"
#include "lode/prompter.hpp"
#include "lode/specification.hpp"
#include "lode/types.hpp"
#include "lode/warnings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lode {

// ============================================================================
// Uninstallation
// ============================================================================

struct RemoveResult {
    bool ok = false;
    std::optional<PackageError> error_kind;
    std::string error;

    Specification removed;
    std::vector<Specification> remaining;  // The input list without `removed`

    std::vector<std::string> deleted_paths;
    std::vector<std::string> regenerated_stubs;

    std::vector<WarningObject> warnings;
    bool warning_errors = false;

    std::string message;  // "Successfully uninstalled <name> version <version>"
};

struct UninstallResult {
    bool ok = false;
    std::optional<PackageError> error_kind;
    std::string error;

    bool unknown_package = false;          // Nothing matched; still ok
    std::vector<Specification> removed;    // In removal order
    std::vector<std::string> messages;

    std::vector<WarningObject> warnings;
    bool warning_errors = false;
};

/**
 * Removes installed packages.
 *
 * Candidates come from the index; several matches are disambiguated through
 * the prompter, and a package other installed packages depend on is only
 * removed after confirmation. Launchers and library stubs are cleaned up
 * and regenerated for what remains installed.
 */
class Uninstaller {
public:
    Uninstaller(HostConfig config, PackageIndex& index, Prompter& prompter);

    // Remove the installed versions of `name` matching `requirement`
    UninstallResult uninstall(const std::string& name, const std::string& requirement = "> 0");

    // Remove `spec`, one of `list`; the returned `remaining` is `list` minus `spec`
    RemoveResult remove(const Specification& spec, const std::vector<Specification>& list);

    // Show every installed dependent of `spec` and ask to continue.
    // Returns true when a confirmation was declined.
    bool has_dependents(const Specification& spec);

private:
    void cleanup_stubs(const Specification& spec,
                       const std::vector<std::string>& recorded_bin_stubs,
                       const std::string& recorded_library_stub,
                       bool record_loaded,
                       RemoveResult& result,
                       WarningCollector& collector);

    HostConfig config_;
    PackageIndex& index_;
    Prompter& prompter_;
};

} // namespace lode
