#pragma once

#include "lode/installer.hpp"
#include "lode/specification.hpp"

#include <string>
#include <vector>

namespace lode {

// ============================================================================
// Package Index
// ============================================================================

class PackageIndex {
public:
    virtual ~PackageIndex() = default;

    // Every installed specification, sorted by (name, version)
    virtual std::vector<Specification> all() = 0;

    // Installed specifications named `name` whose version satisfies
    // `requirement`, ascending by version. An unparseable requirement matches
    // nothing.
    virtual std::vector<Specification> search(const std::string& name,
                                              const std::string& requirement = ">= 0");
};

/**
 * Index over D/specifications/*.json.
 *
 * Descriptors are re-read on every query so removals are seen immediately.
 * Unreadable descriptors are skipped and listed in load_errors().
 */
class InstalledPackageIndex : public PackageIndex {
public:
    explicit InstalledPackageIndex(std::string install_dir);

    std::vector<Specification> all() override;

    // Problems from the most recent scan, one "path: error" per descriptor
    const std::vector<std::string>& load_errors() const { return load_errors_; }

    const std::string& install_dir() const { return install_dir_; }

private:
    std::string install_dir_;
    std::vector<std::string> load_errors_;
};

// ============================================================================
// Reverse Dependencies
// ============================================================================

struct DependencyEdge {
    Specification dependent;              // Installed package that declares the dependency
    Dependency dependency;                // Its requirement on the package being examined
    std::vector<Specification> satisfying;  // Installed versions meeting the requirement
};

// Installed packages with a dependency that `spec` satisfies
std::vector<DependencyEdge> find_dependents(const Specification& spec, PackageIndex& index);

// Answers dependency preflight queries from an index
class IndexDependencyResolver : public DependencyResolver {
public:
    explicit IndexDependencyResolver(PackageIndex& index) : index_(index) {}

    bool is_satisfied(const Dependency& dependency) override;

private:
    PackageIndex& index_;
};

} // namespace lode
