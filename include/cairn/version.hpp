#pragma once

/**
 * @file version.hpp
 * @brief Loose version ordering for content versions
 *
 * Publishers version content in many ways ("1.2.3", "1.08", "20251226",
 * "2024-03-01", "beta"). SemVer strings are ordered by SemVer 2.0.0 rules;
 * everything else is ordered segment by segment.
 *
 * @example
 * ```cpp
 * cairn::compare_versions("1.04", "1.08");       // < 0
 * cairn::compare_versions("2.0.0", "2.0.0-rc1"); // > 0
 * cairn::version_in_range("1.5", "1.0", "");     // true
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>

namespace cairn {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using SemanticVersion = semver::version;

/**
 * @brief Parse a strict SemVer 2.0.0 version string
 * @return Parsed version or nullopt when the string is not SemVer
 */
std::optional<SemanticVersion> parse_semantic_version(const std::string& str);

/**
 * @brief Compare two loosely formatted version strings
 * @return negative, zero or positive like strcmp
 *
 * - both SemVer: SemVer precedence
 * - otherwise: '.', '-' and '_' separated segments, numeric where both
 *   segments are digits, lexical otherwise; a missing segment counts as 0
 * - an empty version sorts below any non-empty one
 */
int compare_versions(const std::string& a, const std::string& b);

/// Inclusive range check; an empty bound is open
bool version_in_range(const std::string& version,
                      const std::string& min_version,
                      const std::string& max_version);

} // namespace cairn
