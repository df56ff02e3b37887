#pragma once

#include "lode/archive.hpp"
#include "lode/extension_builder.hpp"
#include "lode/host_config.hpp"
#include "lode/process.hpp"
#include "lode/specification.hpp"
#include "lode/types.hpp"
#include "lode/warnings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lode {

// ============================================================================
// Dependency Preflight
// ============================================================================

class DependencyResolver {
public:
    virtual ~DependencyResolver() = default;

    // True when some installed package satisfies `dependency`
    virtual bool is_satisfied(const Dependency& dependency) = 0;
};

// ============================================================================
// Installation
// ============================================================================

struct InstallOptions {
    std::string install_dir;               // D; empty uses the config's install_dir
    bool force = false;                    // Skip the dependency preflight
    bool install_stub = true;              // Write the autorequire library stub
    std::vector<std::string> build_args;   // Forwarded to extension scripts
};

struct InstallResult {
    bool ok = false;
    std::optional<PackageError> error_kind;
    std::string error;

    Specification spec;  // installation_path and loaded_from set on success
    std::string package_dir;
    std::string descriptor_path;
    std::string cache_path;

    std::vector<std::string> missing_dependencies;  // "name (requirement)"
    std::vector<std::string> bin_stubs;
    std::string library_stub;
    std::vector<ExtensionBuildReport> extension_reports;

    std::vector<WarningObject> warnings;
    bool warning_errors = false;  // A warning was escalated by policy

    std::string message;  // "Successfully installed <name> version <version>"
};

/**
 * Installs package archives into an install directory.
 *
 * Layout under D:
 *   gems/<full_name>/            extracted files
 *   specifications/<full_name>.json
 *   cache/<archive file>
 *   doc/
 *
 * Launchers go to the configured bindir, library stubs to sitelibdir.
 * All paths are absolute; the process working directory is never changed.
 */
class Installer {
public:
    Installer(HostConfig config, DependencyResolver& resolver, ProcessRunner& runner);

    InstallResult install(const std::string& archive_path, const InstallOptions& options);
    InstallResult install(const PackageArchive& archive, const InstallOptions& options);

    // Requirements of `spec` the resolver cannot satisfy, as "name (requirement)"
    std::vector<std::string> unsatisfied_dependencies(const Specification& spec);

    const HostConfig& config() const { return config_; }

private:
    InstallResult install_archive(const PackageArchive& archive,
                                  const std::optional<std::vector<uint8_t>>& archive_bytes,
                                  const InstallOptions& options);

    HostConfig config_;
    DependencyResolver& resolver_;
    ProcessRunner& runner_;
};

// Write every entry under `package_dir` with its declared mode.
// Fails on unsafe paths or any write error.
bool extract_files(const std::string& package_dir,
                   const std::vector<FileEntry>& files,
                   std::string& error);

// Write one launcher per executable into the configured bindir (mode 0755).
// Returns the launcher paths written; problems become warnings.
std::vector<std::string> generate_bin_scripts(const Specification& spec,
                                              const HostConfig& config,
                                              WarningCollector& collector);

// Write <sitelibdir>/<autorequire><ext> (mode 0644) unless it already exists
// or the directory is not writable. Returns the stub path, or empty.
std::string generate_library_stub(const Specification& spec,
                                  const HostConfig& config,
                                  WarningCollector& collector);

// Path the library stub for `autorequire` lives at
std::string library_stub_path(const HostConfig& config, const std::string& autorequire);

// Path the launcher for `executable` lives at
std::string bin_stub_path(const HostConfig& config, const std::string& executable);

} // namespace lode
