#include "lode/package_index.hpp"
#include "lode/install_record.hpp"
#include "lode/platform.hpp"
#include "lode/semver.hpp"
#include "lode/types.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace lode {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::vector<Specification> PackageIndex::search(const std::string& name,
                                                const std::string& requirement) {
    std::vector<Specification> matches;

    auto range = parse_range(requirement);
    if (!range) {
        spdlog::debug("unparseable requirement '{}'", requirement);
        return matches;
    }

    for (auto& spec : all()) {
        if (spec.name != name) continue;
        auto version = parse_version(spec.version);
        if (version && satisfies(*version, *range)) {
            matches.push_back(std::move(spec));
        }
    }

    std::sort(matches.begin(), matches.end(), specification_less);
    return matches;
}

InstalledPackageIndex::InstalledPackageIndex(std::string install_dir)
    : install_dir_(std::move(install_dir)) {}

std::vector<Specification> InstalledPackageIndex::all() {
    std::vector<Specification> specs;
    load_errors_.clear();

    std::string spec_dir = join_path(install_dir_, layout::SPECIFICATIONS_DIR);
    for (const auto& entry : list_directory(spec_dir)) {
        if (!ends_with(entry, layout::DESCRIPTOR_EXTENSION)) continue;

        std::string path = join_path(spec_dir, entry);
        if (!is_regular_file(path)) continue;

        auto result = load_installed_record(install_dir_, path);
        if (!result.ok) {
            spdlog::warn("skipping descriptor {}: {}", path, result.error);
            load_errors_.push_back(path + ": " + result.error);
            continue;
        }

        // The file name is the identity; a mismatch means a hand-edited descriptor
        std::string expected = result.record.spec.full_name() + layout::DESCRIPTOR_EXTENSION;
        if (entry != expected) {
            spdlog::warn("skipping descriptor {}: holds {}", path, result.record.spec.full_name());
            load_errors_.push_back(path + ": descriptor is for " + result.record.spec.full_name());
            continue;
        }

        specs.push_back(std::move(result.record.spec));
    }

    std::sort(specs.begin(), specs.end(), specification_less);
    return specs;
}

std::vector<DependencyEdge> find_dependents(const Specification& spec, PackageIndex& index) {
    std::vector<DependencyEdge> edges;

    for (const auto& installed : index.all()) {
        if (installed.full_name() == spec.full_name()) continue;

        for (const auto& dep : installed.dependencies) {
            if (dep.name != spec.name) continue;
            if (!version_satisfies(spec.version, dep.requirement)) continue;

            DependencyEdge edge;
            edge.dependent = installed;
            edge.dependency = dep;
            edge.satisfying = index.search(dep.name, dep.requirement);
            edges.push_back(std::move(edge));
        }
    }

    return edges;
}

bool IndexDependencyResolver::is_satisfied(const Dependency& dependency) {
    return !index_.search(dependency.name, dependency.requirement).empty();
}

} // namespace lode
