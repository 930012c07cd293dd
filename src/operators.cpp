#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <re2/re2.h>

#include <featureprobe/logging.hpp>

#include "operators.hpp"
#include "utility.hpp"

namespace fp {

static bool
anyObject(const std::vector<std::string> &objects,
    const std::function<bool(const std::string &)> &matcher)
{
    return std::any_of(objects.begin(), objects.end(), matcher);
}

/* compiled patterns are shared across evaluations, the cache is dropped
 * whole once it reaches this many entries */
static const std::size_t REGEX_CACHE_LIMIT = 1024;

static std::mutex regexCacheLock;
static std::unordered_map<std::string, std::shared_ptr<const re2::RE2>> regexCache;

static std::shared_ptr<const re2::RE2>
compiledPattern(const std::string &pattern)
{
    std::lock_guard<std::mutex> guard(regexCacheLock);

    const auto found = regexCache.find(pattern);
    if (found != regexCache.end()) {
        return found->second;
    }

    re2::RE2::Options options;
    options.set_log_errors(false);

    auto compiled = std::make_shared<const re2::RE2>(pattern, options);
    if (!compiled->ok()) {
        FP_LOG(LogLevel::Warning, "invalid regex '%s': %s", pattern.c_str(), compiled->error().c_str());
    }

    if (regexCache.size() >= REGEX_CACHE_LIMIT) {
        regexCache.clear();
    }
    regexCache.emplace(pattern, compiled);

    return compiled;
}

static bool
regexMatches(const std::string &pattern, const std::string &value)
{
    const std::shared_ptr<const re2::RE2> compiled = compiledPattern(pattern);

    return compiled->ok() && re2::RE2::PartialMatch(value, *compiled);
}

bool
matchString(
    const std::string &predicate,
    const std::string &value,
    const std::vector<std::string> &objects)
{
    if (predicate == "is one of") {
        return anyObject(objects, [&](const std::string &o) { return value == o; });
    } else if (predicate == "ends with") {
        return anyObject(objects, [&](const std::string &o) { return endsWith(value, o); });
    } else if (predicate == "starts with") {
        return anyObject(objects, [&](const std::string &o) { return startsWith(value, o); });
    } else if (predicate == "contains") {
        return anyObject(objects, [&](const std::string &o) { return value.find(o) != std::string::npos; });
    } else if (predicate == "matches regex") {
        return anyObject(objects, [&](const std::string &o) { return regexMatches(o, value); });
    } else if (predicate == "is not any of") {
        return !matchString("is one of", value, objects);
    } else if (predicate == "does not end with") {
        return !matchString("ends with", value, objects);
    } else if (predicate == "does not start with") {
        return !matchString("starts with", value, objects);
    } else if (predicate == "does not contain") {
        return !matchString("contains", value, objects);
    } else if (predicate == "does not match regex") {
        return !matchString("matches regex", value, objects);
    }

    FP_LOG(LogLevel::Debug, "unknown string predicate '%s'", predicate.c_str());
    return false;
}

static bool
anyNumber(const std::vector<std::string> &objects, const std::function<bool(double)> &matcher)
{
    return anyObject(objects, [&](const std::string &o) {
        double parsed;
        return parseDouble(o, parsed) && matcher(parsed);
    });
}

bool
matchNumber(
    const std::string &predicate,
    const double value,
    const std::vector<std::string> &objects)
{
    if (predicate == "=") {
        return anyNumber(objects, [&](const double o) { return value == o; });
    } else if (predicate == "!=") {
        return !anyNumber(objects, [&](const double o) { return value == o; });
    } else if (predicate == ">") {
        return anyNumber(objects, [&](const double o) { return value > o; });
    } else if (predicate == ">=") {
        return anyNumber(objects, [&](const double o) { return value >= o; });
    } else if (predicate == "<") {
        return anyNumber(objects, [&](const double o) { return value < o; });
    } else if (predicate == "<=") {
        return anyNumber(objects, [&](const double o) { return value <= o; });
    }

    FP_LOG(LogLevel::Debug, "unknown number predicate '%s'", predicate.c_str());
    return false;
}

bool
matchDatetime(
    const std::string &predicate,
    const std::int64_t value,
    const std::vector<std::string> &objects)
{
    const auto anyTime = [&](const std::function<bool(std::int64_t)> &matcher) {
        return anyObject(objects, [&](const std::string &o) {
            std::int64_t parsed;
            return parseInt64(o, parsed) && matcher(parsed);
        });
    };

    if (predicate == "after") {
        return anyTime([&](const std::int64_t o) { return value >= o; });
    } else if (predicate == "before") {
        return anyTime([&](const std::int64_t o) { return value < o; });
    }

    FP_LOG(LogLevel::Debug, "unknown datetime predicate '%s'", predicate.c_str());
    return false;
}

static bool
parseNumericIdentifier(const std::string &text, std::int64_t &result)
{
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](const char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    return parseInt64(text, result);
}

static std::vector<std::string>
splitOn(const std::string &text, const char separator)
{
    std::vector<std::string> parts;
    std::string::size_type start = 0;

    for (;;) {
        const std::string::size_type next = text.find(separator, start);
        if (next == std::string::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, next - start));
        start = next + 1;
    }
}

std::optional<SemVer>
parseSemVer(const std::string &text)
{
    SemVer result;
    std::string core = text;

    if (!core.empty() && (core[0] == 'v' || core[0] == 'V')) {
        core.erase(0, 1);
    }

    const std::string::size_type plus = core.find('+');
    if (plus != std::string::npos) {
        core.erase(plus);
    }

    const std::string::size_type dash = core.find('-');
    if (dash != std::string::npos) {
        const std::string prerelease = core.substr(dash + 1);
        core.erase(dash);
        if (prerelease.empty()) {
            return std::nullopt;
        }
        result.prerelease = splitOn(prerelease, '.');
        for (const std::string &identifier : result.prerelease) {
            if (identifier.empty()) {
                return std::nullopt;
            }
        }
    }

    const std::vector<std::string> numbers = splitOn(core, '.');
    if (numbers.empty() || numbers.size() > 3) {
        return std::nullopt;
    }

    std::int64_t *const components[] = {&result.major, &result.minor, &result.patch};
    for (std::size_t i = 0; i < numbers.size(); i++) {
        if (!parseNumericIdentifier(numbers[i], *components[i])) {
            return std::nullopt;
        }
    }

    return result;
}

static int
compareIdentifier(const std::string &a, const std::string &b)
{
    std::int64_t na, nb;
    const bool aNumeric = parseNumericIdentifier(a, na);
    const bool bNumeric = parseNumericIdentifier(b, nb);

    if (aNumeric && bNumeric) {
        return na < nb ? -1 : (na > nb ? 1 : 0);
    }
    /* numeric identifiers have lower precedence than alphanumeric ones */
    if (aNumeric) {
        return -1;
    }
    if (bNumeric) {
        return 1;
    }
    const int result = a.compare(b);
    return result < 0 ? -1 : (result > 0 ? 1 : 0);
}

int
compareSemVer(const SemVer &a, const SemVer &b)
{
    if (a.major != b.major) {
        return a.major < b.major ? -1 : 1;
    }
    if (a.minor != b.minor) {
        return a.minor < b.minor ? -1 : 1;
    }
    if (a.patch != b.patch) {
        return a.patch < b.patch ? -1 : 1;
    }

    /* a release outranks any of its prereleases */
    if (a.prerelease.empty() || b.prerelease.empty()) {
        if (a.prerelease.empty() && b.prerelease.empty()) {
            return 0;
        }
        return a.prerelease.empty() ? 1 : -1;
    }

    const std::size_t shared = std::min(a.prerelease.size(), b.prerelease.size());
    for (std::size_t i = 0; i < shared; i++) {
        const int result = compareIdentifier(a.prerelease[i], b.prerelease[i]);
        if (result != 0) {
            return result;
        }
    }

    if (a.prerelease.size() == b.prerelease.size()) {
        return 0;
    }
    return a.prerelease.size() < b.prerelease.size() ? -1 : 1;
}

bool
matchSemver(
    const std::string &predicate,
    const std::string &value,
    const std::vector<std::string> &objects)
{
    const std::optional<SemVer> version = parseSemVer(value);
    if (!version) {
        return false;
    }

    const auto anyVersion = [&](const std::function<bool(int)> &matcher) {
        return anyObject(objects, [&](const std::string &o) {
            const std::optional<SemVer> parsed = parseSemVer(o);
            return parsed && matcher(compareSemVer(*version, *parsed));
        });
    };

    if (predicate == "=") {
        return anyVersion([](const int c) { return c == 0; });
    } else if (predicate == "!=") {
        return !anyVersion([](const int c) { return c == 0; });
    } else if (predicate == ">") {
        return anyVersion([](const int c) { return c > 0; });
    } else if (predicate == ">=") {
        return anyVersion([](const int c) { return c >= 0; });
    } else if (predicate == "<") {
        return anyVersion([](const int c) { return c < 0; });
    } else if (predicate == "<=") {
        return anyVersion([](const int c) { return c <= 0; });
    }

    FP_LOG(LogLevel::Debug, "unknown semver predicate '%s'", predicate.c_str());
    return false;
}

} // namespace fp
