#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fp {

/*
 * Predicate families used by rule conditions. Positive predicates hold when
 * any object matches. Negated predicates hold when no object matches.
 * Objects that fail to parse never match. An unknown predicate never holds.
 */

bool matchString(
    const std::string &predicate,
    const std::string &value,
    const std::vector<std::string> &objects);

bool matchNumber(
    const std::string &predicate,
    double value,
    const std::vector<std::string> &objects);

/* value and objects are unix seconds */
bool matchDatetime(
    const std::string &predicate,
    std::int64_t value,
    const std::vector<std::string> &objects);

bool matchSemver(
    const std::string &predicate,
    const std::string &value,
    const std::vector<std::string> &objects);

struct SemVer {
    std::int64_t major = 0;
    std::int64_t minor = 0;
    std::int64_t patch = 0;
    std::vector<std::string> prerelease;
};

/* accepts an optional leading 'v' and missing minor or patch components,
 * build metadata is ignored */
std::optional<SemVer> parseSemVer(const std::string &text);

/* negative, zero or positive as in strcmp, per semver precedence rules */
int compareSemVer(const SemVer &a, const SemVer &b);

} // namespace fp
