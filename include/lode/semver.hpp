#pragma once

/**
 * @file semver.hpp
 * @brief Package version and requirement handling
 *
 * lode stores versions as SemVer 2.0.0 (https://semver.org/spec/v2.0.0.html).
 * Package authors frequently write short versions ("1", "1.2"), so parsing
 * pads missing MINOR/PATCH components with zero. This header provides:
 * - Version parsing and comparison
 * - Requirement parsing (>=, <, !=, ~>, etc.)
 * - Requirement satisfaction checking
 *
 * @example
 * ```cpp
 * #include <lode/semver.hpp>
 *
 * auto version = lode::parse_version("1.2.3");
 * auto range = lode::parse_range("~> 1.2");
 *
 * if (version && range && lode::satisfies(*version, *range)) {
 *     // Version satisfies the requirement
 * }
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lode {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/// Comparator operators for requirement expressions
enum class Comparator {
    Eq,   ///< =X.Y.Z or X.Y.Z (exact match)
    Ne,   ///< !=X.Y.Z
    Lt,   ///< <X.Y.Z
    Le,   ///< <=X.Y.Z
    Gt,   ///< >X.Y.Z
    Ge    ///< >=X.Y.Z
};

/// A single comparator constraint (e.g., ">=1.0.0" or "<2.0.0")
struct Constraint {
    Comparator op;
    Version version;
};

/// A comparator set is constraints that must ALL be satisfied (AND)
/// e.g., ">= 1.0, < 2.0" is two constraints ANDed together.
/// "~> 1.2" expands to ">= 1.2.0" and "< 2.0.0".
using ComparatorSet = std::vector<Constraint>;

/**
 * @brief A version range is a union of comparator sets (OR)
 *
 * e.g., ">=1.0.0 <2.0.0 || >=3.0.0" is two sets ORed together
 */
struct VersionRange {
    std::vector<ComparatorSet> sets;

    /// Get the minimum version from the range
    std::optional<Version> min_version() const;
};

/**
 * @brief Parse a version string, padding short forms
 * @param str Version string (e.g., "1.2.3", "1.2", "1.0.0-alpha+build")
 * @return Parsed version or nullopt on failure
 */
std::optional<Version> parse_version(const std::string& str);

/**
 * @brief Parse a requirement string
 * @param str Requirement (e.g., "> 0", ">= 1.0, < 2.0", "~> 1.2 || 3.0.0")
 * @return Parsed range or nullopt on failure
 *
 * Supports: =, !=, <, <=, >, >=, ~> comparators, whitespace or comma
 * separated AND, || for OR. An operator may be separated from its version
 * by whitespace.
 */
std::optional<VersionRange> parse_range(const std::string& str);

/// Check if a version satisfies a single constraint
bool satisfies(const Version& version, const Constraint& constraint);

/// Check if a version satisfies a comparator set (all constraints)
bool satisfies(const Version& version, const ComparatorSet& set);

/// Check if a version satisfies a version range (any set)
bool satisfies(const Version& version, const VersionRange& range);

/// Convenience: parse both sides and check; false if either fails to parse
bool version_satisfies(const std::string& version, const std::string& requirement);

/// Order two version strings; unparseable versions sort before parseable ones
/// and fall back to string comparison among themselves.
int compare_versions(const std::string& a, const std::string& b);

} // namespace lode
