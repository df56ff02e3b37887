#include "lode/uninstaller.hpp"
#include "lode/install_record.hpp"
#include "lode/installer.hpp"
#include "lode/platform.hpp"
#include "lode/stub_generator.hpp"
#include "lode/warnings.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <spdlog/spdlog.h>

namespace lode {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// 1-based menu choice, or 0 when the answer is not a number in [1, max]
size_t parse_selection(const std::string& answer, size_t max) {
    std::string s = trim(answer);
    if (s.empty() || s.size() > 9) return 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return 0;
    }
    size_t choice = static_cast<size_t>(std::stoul(s));
    return (choice >= 1 && choice <= max) ? choice : 0;
}

// Delete a file only when lode generated it
bool remove_generated_file(const std::string& path, bool& removed) {
    removed = false;
    auto text = read_text_file(path);
    if (!text) return true;
    if (!StubGenerator::is_generated_stub(*text)) {
        spdlog::debug("leaving {} in place: not generated by lode", path);
        return true;
    }
    if (!remove_file(path)) return false;
    removed = true;
    return true;
}

// Record stubs regenerated for `spec` in its descriptor so a later uninstall
// of that package cleans them up too
void record_regenerated_stubs(const Specification& spec,
                              const std::vector<std::string>& bin_stubs,
                              const std::string& library_stub) {
    if (spec.loaded_from.empty()) return;

    auto loaded = load_installed_record(spec.installation_path, spec.loaded_from);
    if (!loaded.ok) return;

    auto& stubs = loaded.record.stubs;
    for (const auto& path : bin_stubs) {
        if (std::find(stubs.bin_stubs.begin(), stubs.bin_stubs.end(), path) == stubs.bin_stubs.end()) {
            stubs.bin_stubs.push_back(path);
        }
    }
    if (!library_stub.empty()) {
        stubs.library_stub = library_stub;
    }

    auto write = atomic_write_file(spec.loaded_from, serialize_installed_record(loaded.record));
    if (!write.ok) {
        spdlog::warn("could not update {}: {}", spec.loaded_from, write.error);
    }
}

} // namespace

Uninstaller::Uninstaller(HostConfig config, PackageIndex& index, Prompter& prompter)
    : config_(std::move(config)), index_(index), prompter_(prompter) {}

// ============================================================================
// Selection
// ============================================================================

UninstallResult Uninstaller::uninstall(const std::string& name, const std::string& requirement) {
    UninstallResult result;

    auto list = index_.search(name, requirement);
    if (list.empty()) {
        std::string message = "Unknown package: " + name + " (" + requirement + ")";
        prompter_.say(message);
        result.messages.push_back(message);
        result.unknown_package = true;
        result.ok = true;
        return result;
    }

    std::vector<Specification> targets;
    if (list.size() == 1) {
        targets = list;
    } else {
        prompter_.say("Select package to uninstall:");
        for (size_t i = 0; i < list.size(); ++i) {
            prompter_.say(" " + std::to_string(i + 1) + ". " + list[i].full_name());
        }
        prompter_.say(" " + std::to_string(list.size() + 1) + ". All versions");

        size_t choice = parse_selection(prompter_.ask("> "), list.size() + 1);
        if (choice == 0) {
            result.error_kind = PackageError::AMBIGUOUS_SELECTION;
            result.error = "must enter a number [1-" + std::to_string(list.size() + 1) + "]";
            prompter_.say("Error: " + result.error);
            return result;
        }

        if (choice == list.size() + 1) {
            targets = list;
        } else {
            targets.push_back(list[choice - 1]);
        }
    }

    for (const auto& target : targets) {
        auto removed = remove(target, list);
        result.warnings.insert(result.warnings.end(), removed.warnings.begin(), removed.warnings.end());
        result.warning_errors = result.warning_errors || removed.warning_errors;

        if (!removed.ok) {
            result.error_kind = removed.error_kind;
            result.error = removed.error;
            return result;
        }

        list = removed.remaining;
        result.removed.push_back(removed.removed);
        result.messages.push_back(removed.message);
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Dependents
// ============================================================================

bool Uninstaller::has_dependents(const Specification& spec) {
    for (const auto& edge : find_dependents(spec, index_)) {
        prompter_.say("WARNING: " + edge.dependent.full_name() + " depends on [" +
                      edge.dependency.to_string() +
                      "], which is satisfied by this package. This dependency is satisfied by:");
        for (const auto& sat : edge.satisfying) {
            prompter_.say("\t" + sat.full_name());
        }
        if (!prompter_.confirm("Uninstall anyway? [Y/n]")) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Removal
// ============================================================================

RemoveResult Uninstaller::remove(const Specification& spec, const std::vector<Specification>& list) {
    RemoveResult result;
    result.removed = spec;
    result.remaining = list;

    WarningCollector collector(&config_);

    auto finish_failed = [&](PackageError kind, const std::string& error) {
        result.ok = false;
        result.error_kind = kind;
        result.error = error;
        result.warnings = collector.get_warnings();
        result.warning_errors = collector.has_errors();
        spdlog::error("uninstall of {} failed ({}): {}", spec.full_name(),
                      package_error_to_string(kind), error);
        return result;
    };

    if (has_dependents(spec)) {
        return finish_failed(PackageError::DEPENDENT_EXISTS,
                             "Uninstallation aborted due to dependent package(s)");
    }

    Specification target = spec;
    if (target.installation_path.empty()) {
        target.installation_path = config_.install_dir;
    }
    const std::string& install_dir = target.installation_path;

    std::string descriptor = target.loaded_from.empty()
                                 ? descriptor_path(install_dir, target.full_name())
                                 : target.loaded_from;

    auto record = load_installed_record(install_dir, descriptor);
    if (!record.ok) {
        collector.emit(Warning::invalid_descriptor, warnings::path_failure(descriptor, record.error));
    }

    // Package directory
    std::string package_dir = target.full_gem_path();
    if (path_exists(package_dir)) {
        if (!remove_directory(package_dir)) {
            return finish_failed(PackageError::REMOVAL_IO, "failed to remove " + package_dir);
        }
        result.deleted_paths.push_back(package_dir);
    }

    // Descriptor
    if (path_exists(descriptor)) {
        if (!remove_file(descriptor)) {
            return finish_failed(PackageError::REMOVAL_IO, "failed to remove " + descriptor);
        }
        result.deleted_paths.push_back(descriptor);
    }

    // Cached archive
    std::string cache_file = (record.ok && !record.record.provenance.cache_file.empty())
                                 ? record.record.provenance.cache_file
                                 : target.full_name() + layout::ARCHIVE_EXTENSION;
    std::string cache_path = join_path(join_path(install_dir, layout::CACHE_DIR), cache_file);
    if (path_exists(cache_path)) {
        if (remove_file(cache_path)) {
            result.deleted_paths.push_back(cache_path);
        } else {
            collector.emit(Warning::cache_remove_failed,
                           warnings::path_failure(cache_path, "could not delete cached archive"));
        }
    }

    // Documentation
    std::string doc_dir = join_path(join_path(install_dir, layout::DOC_DIR), target.full_name());
    if (path_exists(doc_dir)) {
        if (remove_directory(doc_dir)) {
            result.deleted_paths.push_back(doc_dir);
        } else {
            collector.emit(Warning::doc_remove_failed,
                           warnings::path_failure(doc_dir, "could not delete documentation"));
        }
    }

    cleanup_stubs(target,
                  record.ok ? record.record.stubs.bin_stubs : std::vector<std::string>{},
                  record.ok ? record.record.stubs.library_stub : std::string{},
                  record.ok, result, collector);

    result.remaining.erase(
        std::remove_if(result.remaining.begin(), result.remaining.end(),
                       [&](const Specification& s) { return s.full_name() == spec.full_name(); }),
        result.remaining.end());

    result.message = "Successfully uninstalled " + spec.name + " version " + spec.version;
    prompter_.say(result.message);

    result.warnings = collector.get_warnings();
    result.warning_errors = collector.has_errors();
    result.ok = true;
    return result;
}

void Uninstaller::cleanup_stubs(const Specification& spec,
                                const std::vector<std::string>& recorded_bin_stubs,
                                const std::string& recorded_library_stub,
                                bool record_loaded,
                                RemoveResult& result,
                                WarningCollector& collector) {
    // Launchers written for this package
    std::vector<std::string> launchers = recorded_bin_stubs;
    if (!record_loaded) {
        for (const auto& exe : spec.executables) {
            launchers.push_back(bin_stub_path(config_, exe));
        }
    }

    for (const auto& path : launchers) {
        bool removed = false;
        if (!remove_generated_file(path, removed)) {
            collector.emit(Warning::stub_remove_failed,
                           warnings::path_failure(path, "could not delete launcher"));
        } else if (removed) {
            result.deleted_paths.push_back(path);
        }
    }

    // Point launchers at the newest version still installed
    auto same_name = index_.search(spec.name, ">= 0");
    if (!same_name.empty() && !same_name.back().executables.empty()) {
        const auto& latest = same_name.back();
        auto written = generate_bin_scripts(latest, config_, collector);
        if (!written.empty()) {
            spdlog::debug("regenerated launchers for {}", latest.full_name());
            result.regenerated_stubs.insert(result.regenerated_stubs.end(), written.begin(), written.end());
            record_regenerated_stubs(latest, written, "");
        }
    }

    auto installed = index_.all();

    // Library stub written for this package. Without a descriptor, only a stub
    // that loads this package by name counts as ours.
    std::string library_stub = recorded_library_stub;
    if (library_stub.empty() && !record_loaded && spec.autorequire) {
        std::string candidate = library_stub_path(config_, *spec.autorequire);
        auto text = read_text_file(candidate);
        if (text && *text == StubGenerator(config_).library_stub_text(spec.name)) {
            library_stub = candidate;
        }
    }

    if (!library_stub.empty() && spec.autorequire) {
        // The stub loads the package by name, so another installed version
        // of it keeps the stub valid and takes it over
        auto heir = std::find_if(installed.begin(), installed.end(), [&](const Specification& s) {
            return s.name == spec.name && s.autorequire == spec.autorequire;
        });
        if (heir != installed.end()) {
            spdlog::debug("library stub {} passes to {}", library_stub, heir->full_name());
            record_regenerated_stubs(*heir, {}, library_stub);
        } else {
            bool removed = false;
            if (!remove_generated_file(library_stub, removed)) {
                collector.emit(Warning::stub_remove_failed,
                               warnings::path_failure(library_stub, "could not delete library stub"));
            } else if (removed) {
                result.deleted_paths.push_back(library_stub);
            }
        }
    }

    // Restore missing library stubs for packages that asked for one
    std::set<std::string> restored;
    for (const auto& other : installed) {
        if (!other.autorequire || restored.count(*other.autorequire)) continue;

        auto other_record = load_installed_record(other.installation_path, other.loaded_from);
        if (!other_record.ok) continue;
        const auto& stubs = other_record.record.stubs;
        if (stubs.library_stub.empty() && !stubs.library_stub_requested) continue;
        restored.insert(*other.autorequire);

        if (path_exists(library_stub_path(config_, *other.autorequire))) continue;

        auto written = generate_library_stub(other, config_, collector);
        if (!written.empty()) {
            spdlog::debug("regenerated library stub {} for {}", written, other.full_name());
            result.regenerated_stubs.push_back(written);
            record_regenerated_stubs(other, {}, written);
        }
    }
}

} // namespace lode
