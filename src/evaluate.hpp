#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <featureprobe/model.hpp>
#include <featureprobe/user.hpp>
#include <featureprobe/value.hpp>

namespace fp {

/*
 * Result of evaluating one toggle for one user. `value` and `variationIndex`
 * are absent when the serve could not be resolved to a variation, in which
 * case the caller supplies its default and `reason` says what went wrong.
 */
struct EvalDetail {
    std::optional<Value> value;
    std::optional<int> variationIndex;
    std::optional<int> ruleIndex;
    std::optional<std::uint64_t> version;
    std::string reason;
};

EvalDetail evaluate(const Toggle &toggle, const User &user, const SegmentMap &segments);

/* `segments` is null when evaluating conditions that belong to a segment,
 * which keeps segment membership from recursing */
bool conditionMatchesUser(
    const Condition &condition,
    const User &user,
    const SegmentMap *segments);

bool ruleMatchesUser(const Rule &rule, const User &user, const SegmentMap &segments);

bool segmentMatchesUser(const Segment &segment, const User &user);

/* last four bytes of SHA-1(key + salt), big endian, modulo bucketSize */
std::uint32_t saltHash(const std::string &key, const std::string &salt, std::uint32_t bucketSize);

/* On success `index` is the chosen variation, which may still be out of
 * range for the toggle. On failure `reason` explains why. */
bool variationIndexForUser(
    const Serve &serve,
    const std::string &toggleKey,
    const User &user,
    std::int64_t &index,
    std::string &reason);

} // namespace fp
