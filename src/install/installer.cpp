#include "lode/installer.hpp"
#include "lode/install_record.hpp"
#include "lode/path_utils.hpp"
#include "lode/platform.hpp"
#include "lode/stub_generator.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace lode {

namespace {

InstallResult fail(InstallResult result, PackageError kind, const std::string& error) {
    result.ok = false;
    result.error_kind = kind;
    result.error = error;
    spdlog::error("install failed ({}): {}", package_error_to_string(kind), error);
    return result;
}

} // namespace

// ============================================================================
// Extraction
// ============================================================================

bool extract_files(const std::string& package_dir,
                   const std::vector<FileEntry>& files,
                   std::string& error) {
    for (const auto& entry : files) {
        auto target = normalize_under_root(package_dir, entry.path);
        if (!target.ok) {
            error = std::string(path_error_to_string(target.error)) + ": " + entry.path;
            return false;
        }

        std::string parent = get_parent_directory(target.path);
        if (!parent.empty() && !create_directories(parent)) {
            error = "failed to create directory: " + parent;
            return false;
        }

        auto write = write_file_with_mode(target.path, entry.content, entry.mode);
        if (!write.ok) {
            error = write.error;
            return false;
        }
    }
    return true;
}

// ============================================================================
// Stubs
// ============================================================================

std::string bin_stub_path(const HostConfig& config, const std::string& executable) {
    return join_path(config.interpreter.bindir, executable);
}

std::string library_stub_path(const HostConfig& config, const std::string& autorequire) {
    return join_path(config.interpreter.sitelibdir,
                     autorequire + config.interpreter.script_extension);
}

std::vector<std::string> generate_bin_scripts(const Specification& spec,
                                              const HostConfig& config,
                                              WarningCollector& collector) {
    std::vector<std::string> written;
    if (spec.executables.empty()) {
        return written;
    }

    const std::string& bindir = config.interpreter.bindir;
    create_directories(bindir);

    StubGenerator generator(config);
    std::string exe_dir = join_path(spec.full_gem_path(), spec.bindir);

    for (const auto& exe : spec.executables) {
        std::string target = bin_stub_path(config, exe);

        if (!is_writable(bindir)) {
            collector.emit(Warning::bin_stub_unwritable, warnings::bin_stub_unwritable(spec.name, target));
            continue;
        }

        auto text = generator.app_script_text(spec.name, spec.version, join_path(exe_dir, exe));
        auto write = write_file_with_mode(target, text, 0755);
        if (!write.ok) {
            collector.emit(Warning::bin_stub_unwritable, warnings::bin_stub_unwritable(spec.name, target));
            continue;
        }

        spdlog::debug("wrote launcher {}", target);
        written.push_back(target);
    }

    return written;
}

std::string generate_library_stub(const Specification& spec,
                                  const HostConfig& config,
                                  WarningCollector& collector) {
    if (!spec.autorequire) {
        return "";
    }

    const std::string& sitelibdir = config.interpreter.sitelibdir;
    create_directories(sitelibdir);

    if (!is_writable(sitelibdir)) {
        collector.emit(Warning::library_stub_unwritable,
                       warnings::library_stub_unwritable(spec.name, sitelibdir));
        return "";
    }

    std::string target = library_stub_path(config, *spec.autorequire);
    if (path_exists(target)) {
        collector.emit(Warning::library_stub_exists, warnings::library_stub_exists(spec.name, target));
        return "";
    }

    // autorequire may name a nested library ("net/thing")
    std::string parent = get_parent_directory(target);
    if (!create_directories(parent) || !is_writable(parent)) {
        collector.emit(Warning::library_stub_unwritable,
                       warnings::library_stub_unwritable(spec.name, parent));
        return "";
    }

    StubGenerator generator(config);
    auto write = write_file_with_mode(target, generator.library_stub_text(spec.name), 0644);
    if (!write.ok) {
        collector.emit(Warning::library_stub_unwritable,
                       warnings::library_stub_unwritable(spec.name, sitelibdir));
        return "";
    }

    spdlog::debug("wrote library stub {}", target);
    return target;
}

// ============================================================================
// Installer
// ============================================================================

Installer::Installer(HostConfig config, DependencyResolver& resolver, ProcessRunner& runner)
    : config_(std::move(config)), resolver_(resolver), runner_(runner) {}

std::vector<std::string> Installer::unsatisfied_dependencies(const Specification& spec) {
    std::vector<std::string> missing;
    for (const auto& dep : spec.dependencies) {
        if (!resolver_.is_satisfied(dep)) {
            missing.push_back(dep.to_string());
        }
    }
    return missing;
}

InstallResult Installer::install(const std::string& archive_path, const InstallOptions& options) {
    std::string source = absolute_path(archive_path);

    auto bytes = read_file_bytes(source);
    if (!bytes) {
        return fail({}, PackageError::ARCHIVE_INVALID, "failed to open archive: " + source);
    }

    auto read = read_package_archive(*bytes, source);
    if (!read.ok) {
        return fail({}, PackageError::ARCHIVE_INVALID, source + ": " + read.error);
    }

    return install_archive(read.archive, bytes, options);
}

InstallResult Installer::install(const PackageArchive& archive, const InstallOptions& options) {
    std::optional<std::vector<uint8_t>> bytes;
    if (!archive.source_path.empty()) {
        bytes = read_file_bytes(archive.source_path);
    }
    return install_archive(archive, bytes, options);
}

InstallResult Installer::install_archive(const PackageArchive& archive,
                                         const std::optional<std::vector<uint8_t>>& archive_bytes,
                                         const InstallOptions& options) {
    InstallResult result;
    result.spec = archive.spec;
    const Specification& spec = archive.spec;

    std::string spec_error;
    if (!validate_specification(spec, spec_error)) {
        return fail(result, PackageError::ARCHIVE_INVALID, spec_error);
    }

    std::string install_dir = absolute_path(options.install_dir.empty() ? config_.install_dir
                                                                        : options.install_dir);
    HostConfig config = config_;
    config.install_dir = install_dir;

    spdlog::debug("installing {} into {}", spec.full_name(), install_dir);

    // Dependency preflight: nothing touches the disk before this passes
    if (!options.force) {
        result.missing_dependencies = unsatisfied_dependencies(spec);
        if (!result.missing_dependencies.empty()) {
            std::string list;
            for (const auto& dep : result.missing_dependencies) {
                if (!list.empty()) list += ", ";
                list += dep;
            }
            return fail(result, PackageError::MISSING_DEPENDENCY,
                        spec.full_name() + " requires " + list);
        }
    }

    WarningCollector collector(&config);

    // Layout
    for (const char* sub : {layout::GEMS_DIR, layout::SPECIFICATIONS_DIR,
                            layout::CACHE_DIR, layout::DOC_DIR}) {
        std::string dir = join_path(install_dir, sub);
        if (!create_directories(dir)) {
            return fail(result, PackageError::EXTRACTION_IO, "failed to create directory: " + dir);
        }
    }

    Specification installed = spec;
    installed.installation_path = install_dir;
    result.package_dir = installed.full_gem_path();

    bool existed = path_exists(result.package_dir);
    if (existed) {
        spdlog::debug("{} already present, overwriting files", result.package_dir);
    }
    if (!create_directories(result.package_dir)) {
        return fail(result, PackageError::EXTRACTION_IO,
                    "failed to create directory: " + result.package_dir);
    }

    std::string extract_error;
    if (!extract_files(result.package_dir, archive.files, extract_error)) {
        if (!existed) {
            remove_directory(result.package_dir);
        }
        return fail(result, PackageError::EXTRACTION_IO, extract_error);
    }
    spdlog::debug("extracted {} files into {}", archive.files.size(), result.package_dir);

    // Stubs
    std::vector<std::string> prior_launchers;
    for (const auto& exe : installed.executables) {
        std::string path = bin_stub_path(config, exe);
        if (path_exists(path)) prior_launchers.push_back(path);
    }
    result.bin_stubs = generate_bin_scripts(installed, config, collector);
    if (options.install_stub && installed.autorequire) {
        result.library_stub = generate_library_stub(installed, config, collector);
    }

    // Native extensions
    ExtensionBuilder builder(make_extension_build_options(config, options.build_args), runner_);
    result.extension_reports = builder.build(result.package_dir, installed);
    for (const auto& report : result.extension_reports) {
        if (!report.ok) {
            collector.emit(Warning::extension_build_failed,
                           warnings::extension_build_failed(report.extension, report.error,
                                                            report.log_path));
        }
    }

    // Cache copy
    std::string cache_dir = join_path(install_dir, layout::CACHE_DIR);
    std::string cache_file = archive.source_path.empty() ? archive_file_name(spec)
                                                         : get_filename(archive.source_path);
    result.cache_path = join_path(cache_dir, cache_file);

    std::vector<uint8_t> cache_bytes;
    if (archive_bytes) {
        cache_bytes = *archive_bytes;
    } else {
        auto built = build_package_archive(spec, archive.files);
        if (built.ok) cache_bytes = std::move(built.archive_data);
    }

    bool cache_written = false;
    if (path_exists(result.cache_path)) {
        spdlog::debug("cache entry {} already present", result.cache_path);
    } else if (cache_bytes.empty()) {
        collector.emit(Warning::cache_copy_failed,
                       warnings::path_failure(result.cache_path, "archive bytes unavailable"));
    } else {
        auto write = atomic_write_file(result.cache_path, cache_bytes);
        if (!write.ok) {
            collector.emit(Warning::cache_copy_failed,
                           warnings::path_failure(result.cache_path, write.error));
        } else {
            cache_written = true;
        }
    }

    // Descriptor
    InstalledPackageRecord record;
    record.spec = spec;
    record.provenance.installed_at = get_current_timestamp();
    record.provenance.source = archive.source_path;
    record.provenance.cache_file = cache_file;
    if (!cache_bytes.empty()) {
        auto hash = compute_sha256(cache_bytes);
        if (hash.ok) {
            record.provenance.package_hash = "sha256:" + hash.hex_digest;
        } else {
            spdlog::warn("could not hash archive: {}", hash.error);
        }
    }
    record.stubs.bin_stubs = result.bin_stubs;
    record.stubs.library_stub = result.library_stub;
    record.stubs.library_stub_requested = options.install_stub && installed.autorequire.has_value();

    result.descriptor_path = descriptor_path(install_dir, spec.full_name());
    auto write = atomic_write_file(result.descriptor_path, serialize_installed_record(record));
    if (!write.ok) {
        // Without a descriptor nothing can find the package again, so take
        // back what this install put on disk
        auto discard = [](const std::string& path, bool removed) {
            if (!removed) spdlog::warn("could not roll back {}", path);
        };
        if (!existed) {
            discard(result.package_dir, remove_directory(result.package_dir));
        }
        for (const auto& path : result.bin_stubs) {
            if (std::find(prior_launchers.begin(), prior_launchers.end(), path) == prior_launchers.end()) {
                discard(path, remove_file(path));
            }
        }
        if (!result.library_stub.empty()) {
            discard(result.library_stub, remove_file(result.library_stub));
        }
        if (cache_written) {
            discard(result.cache_path, remove_file(result.cache_path));
        }
        result.bin_stubs.clear();
        result.library_stub.clear();
        result.warnings = collector.get_warnings();
        return fail(result, PackageError::PERSISTENCE_IO,
                    "failed to write " + result.descriptor_path + ": " + write.error);
    }

    installed.loaded_from = result.descriptor_path;
    result.spec = installed;
    result.warnings = collector.get_warnings();
    result.warning_errors = collector.has_errors();
    result.message = "Successfully installed " + spec.name + " version " + spec.version;
    result.ok = true;

    spdlog::debug("{}", result.message);
    return result;
}

} // namespace lode
