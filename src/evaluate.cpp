#include <algorithm>
#include <utility>

#include <openssl/evp.h>

#include <featureprobe/logging.hpp>

#include "evaluate.hpp"
#include "operators.hpp"
#include "utility.hpp"

namespace fp {

std::uint32_t
saltHash(const std::string &key, const std::string &salt, const std::uint32_t bucketSize)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    const std::string data = key + salt;

    if (bucketSize == 0 ||
        EVP_Digest(data.data(), data.size(), digest, &digestLength, EVP_sha1(), nullptr) != 1 ||
        digestLength < 4)
    {
        FP_LOG(LogLevel::Error, "failed to hash bucketing key");
        return 0;
    }

    const std::uint32_t value =
        (static_cast<std::uint32_t>(digest[digestLength - 4]) << 24) |
        (static_cast<std::uint32_t>(digest[digestLength - 3]) << 16) |
        (static_cast<std::uint32_t>(digest[digestLength - 2]) << 8) |
        static_cast<std::uint32_t>(digest[digestLength - 1]);

    return value % bucketSize;
}

bool
variationIndexForUser(
    const Serve &serve,
    const std::string &toggleKey,
    const User &user,
    std::int64_t &index,
    std::string &reason)
{
    if (serve.select) {
        index = *serve.select;
        return true;
    }

    if (!serve.split) {
        reason = "Serve has neither select nor split";
        return false;
    }

    const Split &split = *serve.split;
    std::string hashKey = user.key();

    if (!split.bucketBy.empty()) {
        const std::optional<std::string> attribute = user.get(split.bucketBy);
        if (!attribute) {
            reason = "User with key " + user.key() +
                " does not have attribute named: [" + split.bucketBy + "]";
            return false;
        }
        hashKey = *attribute;
    }

    const std::string &salt = split.salt.empty() ? toggleKey : split.salt;
    const std::uint32_t bucket = saltHash(hashKey, salt, FP_BUCKET_SIZE);

    /* ranges are ordered by upper bound, first one above the bucket wins */
    for (const SplitRange &range : split.ranges) {
        if (bucket < range.upper) {
            if (bucket < range.lower) {
                break;
            }
            index = range.variation;
            return true;
        }
    }

    reason = "Split bucket " + std::to_string(bucket) + " not covered, variation overflow";
    return false;
}

static bool
segmentConditionMatches(
    const Condition &condition,
    const User &user,
    const SegmentMap *const segments)
{
    if (!segments) {
        return false;
    }

    const bool inAny = std::any_of(condition.objects.begin(), condition.objects.end(),
        [&](const std::string &segmentKey) {
            const auto it = segments->find(segmentKey);
            return it != segments->end() && segmentMatchesUser(it->second, user);
        });

    if (condition.predicate == "is in") {
        return inAny;
    } else if (condition.predicate == "is not in") {
        return !inAny;
    }

    FP_LOG(LogLevel::Debug, "unknown segment predicate '%s'", condition.predicate.c_str());
    return false;
}

bool
conditionMatchesUser(
    const Condition &condition,
    const User &user,
    const SegmentMap *const segments)
{
    switch (condition.type) {
        case Condition::Type::Segment:
            return segmentConditionMatches(condition, user, segments);

        case Condition::Type::Datetime: {
            std::int64_t when = getUnixSeconds();
            const std::optional<std::string> attribute = user.get(condition.subject);
            if (attribute && !parseInt64(*attribute, when)) {
                return false;
            }
            return matchDatetime(condition.predicate, when, condition.objects);
        }

        case Condition::Type::String:
        case Condition::Type::Number:
        case Condition::Type::Semver:
            break;

        case Condition::Type::Unknown:
            return false;
    }

    const std::optional<std::string> attribute = user.get(condition.subject);
    if (!attribute) {
        return false;
    }

    if (condition.type == Condition::Type::String) {
        return matchString(condition.predicate, *attribute, condition.objects);
    } else if (condition.type == Condition::Type::Number) {
        double number;
        return parseDouble(*attribute, number) && matchNumber(condition.predicate, number, condition.objects);
    }

    return matchSemver(condition.predicate, *attribute, condition.objects);
}

bool
ruleMatchesUser(const Rule &rule, const User &user, const SegmentMap &segments)
{
    return std::all_of(rule.conditions.begin(), rule.conditions.end(),
        [&](const Condition &condition) { return conditionMatchesUser(condition, user, &segments); });
}

bool
segmentMatchesUser(const Segment &segment, const User &user)
{
    return std::any_of(segment.rules.begin(), segment.rules.end(), [&](const SegmentRule &rule) {
        return std::all_of(rule.conditions.begin(), rule.conditions.end(),
            [&](const Condition &condition) { return conditionMatchesUser(condition, user, nullptr); });
    });
}

static EvalDetail
serveDetail(
    const Toggle &toggle,
    const Serve &serve,
    const User &user,
    const std::optional<int> ruleIndex,
    std::string reason)
{
    EvalDetail detail;
    std::int64_t index = 0;

    detail.ruleIndex = ruleIndex;
    detail.version = toggle.version;

    if (!variationIndexForUser(serve, toggle.key, user, index, detail.reason)) {
        FP_LOG(LogLevel::Debug, "toggle '%s': %s", toggle.key.c_str(), detail.reason.c_str());
        return detail;
    }

    if (index < 0 || static_cast<std::uint64_t>(index) >= toggle.variations.size()) {
        detail.reason = "Variation index " + std::to_string(index) + " overflow";
        FP_LOG(LogLevel::Warning, "toggle '%s': variation index %lld overflow, %zu variations",
            toggle.key.c_str(), static_cast<long long>(index), toggle.variations.size());
        return detail;
    }

    detail.value = toggle.variations[static_cast<std::size_t>(index)];
    detail.variationIndex = static_cast<int>(index);
    detail.reason = std::move(reason);

    return detail;
}

EvalDetail
evaluate(const Toggle &toggle, const User &user, const SegmentMap &segments)
{
    if (!toggle.enabled) {
        return serveDetail(toggle, toggle.disabledServe, user, std::nullopt, "Toggle disabled");
    }

    for (std::size_t i = 0; i < toggle.rules.size(); i++) {
        if (ruleMatchesUser(toggle.rules[i], user, segments)) {
            const int ruleIndex = static_cast<int>(i);
            return serveDetail(toggle, toggle.rules[i].serve, user, ruleIndex,
                "Rule " + std::to_string(ruleIndex) + " hit");
        }
    }

    return serveDetail(toggle, toggle.defaultServe, user, std::nullopt, "Default rule hit");
}

} // namespace fp
