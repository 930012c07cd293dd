/*!
 * @file model.hpp
 * @brief Public API Interface for the toggle and segment data model
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <featureprobe/export.hpp>
#include <featureprobe/value.hpp>

namespace fp {

/** @brief Number of slots a percentage split is expressed in. */
constexpr std::uint32_t FP_BUCKET_SIZE = 10000;

struct Condition {
    enum class Type {
        String,
        Segment,
        Datetime,
        Number,
        Semver,
        Unknown
    };

    Type type = Type::Unknown;
    /** @brief Name of the user attribute tested. Unused for segments. */
    std::string subject;
    std::string predicate;
    std::vector<std::string> objects;
};

/** @brief One contiguous slice of a split, in bucket slots. Serves
 * `variation` to users whose bucket falls in `[lower, upper)`. */
struct SplitRange {
    std::uint32_t lower = 0;
    std::uint32_t upper = 0;
    int variation = 0;
};

struct Split {
    /** @brief Ordered by ascending upper bound. */
    std::vector<SplitRange> ranges;
    /** @brief Attribute hashed instead of the user key, when not empty. */
    std::string bucketBy;
    /** @brief Appended to the hash input. Empty means the toggle key. */
    std::string salt;
};

/** @brief Exactly one of `select` or `split` is expected to be present.
 * `select` keeps the full wire value so an out of range index is reported
 * as an overflow. */
struct Serve {
    std::optional<std::int64_t> select;
    std::optional<Split> split;
};

struct Rule {
    std::vector<Condition> conditions;
    Serve serve;
};

struct SegmentRule {
    std::vector<Condition> conditions;
};

struct Segment {
    std::string key;
    std::string uniqueId;
    std::uint64_t version = 0;
    std::vector<SegmentRule> rules;
};

struct Toggle {
    std::string key;
    bool enabled = false;
    std::uint64_t version = 0;
    bool forClient = false;
    Serve disabledServe;
    Serve defaultServe;
    std::vector<Rule> rules;
    std::vector<Value> variations;
};

using ToggleMap = std::unordered_map<std::string, Toggle>;
using SegmentMap = std::unordered_map<std::string, Segment>;

/** @brief A complete snapshot. Published as a whole and never edited
 * afterwards. */
struct Repository {
    ToggleMap toggles;
    SegmentMap segments;
};

/** @brief Decode a snapshot document. Toggles or segments that fail to decode
 * are skipped with a warning. Returns `std::nullopt` if the document itself is
 * not valid JSON or is not an object. */
FP_EXPORT std::optional<Repository> parseRepository(const std::string &text);

} // namespace fp
