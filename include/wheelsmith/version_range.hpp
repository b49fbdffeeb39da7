#pragma once

/**
 * @file version_range.hpp
 * @brief Interpreter compatibility ranges
 *
 * Projects declare which interpreter versions they support with a range
 * expression such as ">=2.7 <4.0" or "^3.8". Versions are held as SemVer
 * values; partial versions are padded ("2.7" is read as "2.7.0").
 *
 * @example
 * ```cpp
 * auto range = wheelsmith::parse_range(">=2.7, <4.0");
 * auto py2 = wheelsmith::parse_range(">=2.0.0 <3.0.0");
 *
 * if (range && py2 && wheelsmith::intersects(*range, *py2)) {
 *     // the project still supports Python 2
 * }
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>
#include <vector>

namespace wheelsmith {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/// Comparator operators for range expressions
enum class Comparator {
    Eq,   ///< ==X.Y.Z, =X.Y.Z or X.Y.Z (exact match)
    Lt,   ///< <X.Y.Z
    Le,   ///< <=X.Y.Z
    Gt,   ///< >X.Y.Z
    Ge,   ///< >=X.Y.Z
    Ne    ///< !=X.Y.Z (never narrows a range's bounds)
};

/// A single comparator constraint (e.g., ">=1.0.0" or "<2.0.0")
struct Constraint {
    Comparator op;
    Version version;
};

/// Constraints that must ALL be satisfied (AND). Empty matches everything.
using ComparatorSet = std::vector<Constraint>;

/**
 * @brief A version range is a union of comparator sets (OR)
 *
 * e.g., ">=2.7 <3.0 || >=3.5" is two sets ORed together
 */
struct VersionRange {
    std::vector<ComparatorSet> sets;
};

/**
 * @brief Parse a version, padding missing minor/patch components with 0
 * @return Parsed version or nullopt on failure
 */
std::optional<Version> parse_version(const std::string& str);

/**
 * @brief Parse a range expression
 *
 * Supports: comparators (==, =, !=, <, <=, >, >=), caret (^2.7), tilde (~2.7),
 * compatible release (~=2.7), wildcards (2.*, ==2.7.*, *), whitespace or
 * comma for AND, and || for OR. Wildcard exclusions (!=3.0.*) are accepted
 * and dropped.
 */
std::optional<VersionRange> parse_range(const std::string& str);

/// Check if a version satisfies a single constraint
bool satisfies(const Version& version, const Constraint& constraint);

/// Check if a version satisfies a comparator set (all constraints)
bool satisfies(const Version& version, const ComparatorSet& set);

/// Check if a version satisfies a version range (any set)
bool satisfies(const Version& version, const VersionRange& range);

/// Check whether two ranges admit at least one common version
bool intersects(const VersionRange& a, const VersionRange& b);

} // namespace wheelsmith
