#pragma once

#include "lode/host_config.hpp"
#include "lode/process.hpp"
#include "lode/specification.hpp"
#include "lode/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lode {

// Build log written next to each extension script
constexpr const char* EXTENSION_BUILD_LOG = "lode_make.out";

struct ExtensionBuildOptions {
    std::string interpreter;                         // Runs the extension script
    std::string make_program;                        // May carry extra words ("make -j4")
    std::vector<std::string> install_dir_variables;  // Makefile variables pointed at the package
    std::vector<std::string> build_args;             // Forwarded to every extension script
};

// Options for `config` with the make program resolved from MAKE/config/platform
ExtensionBuildOptions make_extension_build_options(const HostConfig& config,
                                                   std::vector<std::string> build_args = {});

struct ExtensionBuildReport {
    std::string extension;                  // As declared in the specification
    bool ok = false;
    std::optional<PackageError> error_kind; // EXTENSION_BUILD when !ok
    std::string error;
    std::string log_path;
    std::vector<std::string> commands;      // Every command issued, in order
};

/**
 * Drives the external toolchain for a package's native extensions.
 *
 * Each extension script runs in its own directory; a produced Makefile has
 * its install-dir variables pointed at <package_dir>/<first require path>,
 * then `make` and `make install` run there. Failures are reported, never
 * thrown, and the caller's working directory is never touched.
 */
class ExtensionBuilder {
public:
    ExtensionBuilder(ExtensionBuildOptions options, ProcessRunner& runner);

    // One report per declared extension; empty (no process spawned) when
    // `spec` declares none. `package_dir` must be absolute.
    std::vector<ExtensionBuildReport> build(const std::string& package_dir,
                                            const Specification& spec);

private:
    ExtensionBuildReport build_one(const std::string& package_dir,
                                   const std::string& dest_path,
                                   const std::string& extension);

    ExtensionBuildOptions options_;
    ProcessRunner& runner_;
};

// Rewrite every line "<VAR> = $..." to "<VAR> = <dest_path>" for each variable.
// Lines that do not assign from a make variable are left alone.
std::string patch_makefile(const std::string& makefile,
                           const std::vector<std::string>& variables,
                           const std::string& dest_path);

} // namespace lode
