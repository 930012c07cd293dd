#include <algorithm>

#include "test-utils/flags.hpp"

fp::Toggle
makeMinimalToggle(const std::string &key, const std::uint64_t version, const bool enabled)
{
    fp::Toggle toggle;

    toggle.key = key;
    toggle.version = version;
    toggle.enabled = enabled;

    return toggle;
}

void
setDefaultServe(fp::Toggle &toggle, const fp::Serve &serve)
{
    toggle.defaultServe = serve;
}

void
setDisabledServe(fp::Toggle &toggle, const fp::Serve &serve)
{
    toggle.disabledServe = serve;
}

void
addVariation(fp::Toggle &toggle, const fp::Value &variation)
{
    toggle.variations.push_back(variation);
}

void
addBooleanVariations(fp::Toggle &toggle)
{
    addVariation(toggle, fp::Value(false));
    addVariation(toggle, fp::Value(true));
    setDefaultServe(toggle, makeSelect(0));
    setDisabledServe(toggle, makeSelect(0));
}

fp::Serve
makeSelect(const int variation)
{
    fp::Serve serve;
    serve.select = variation;
    return serve;
}

fp::Serve
makeSplit(
    const std::vector<std::vector<std::pair<std::uint32_t, std::uint32_t>>> &distribution,
    const std::string &bucketBy,
    const std::string &salt)
{
    fp::Split split;

    for (std::size_t variation = 0; variation < distribution.size(); variation++) {
        for (const auto &range : distribution[variation]) {
            split.ranges.push_back(fp::SplitRange{range.first, range.second, static_cast<int>(variation)});
        }
    }

    std::stable_sort(split.ranges.begin(), split.ranges.end(),
        [](const fp::SplitRange &a, const fp::SplitRange &b) { return a.upper < b.upper; });

    split.bucketBy = bucketBy;
    split.salt = salt;

    fp::Serve serve;
    serve.split = split;
    return serve;
}

fp::Condition
makeCondition(
    const fp::Condition::Type type,
    const std::string &subject,
    const std::string &predicate,
    const std::vector<std::string> &objects)
{
    fp::Condition condition;

    condition.type = type;
    condition.subject = subject;
    condition.predicate = predicate;
    condition.objects = objects;

    return condition;
}

void
addRule(fp::Toggle &toggle, const std::vector<fp::Condition> &conditions, const fp::Serve &serve)
{
    fp::Rule rule;

    rule.conditions = conditions;
    rule.serve = serve;

    toggle.rules.push_back(rule);
}

fp::Segment
makeSegment(const std::string &key, const std::vector<std::vector<fp::Condition>> &rules)
{
    fp::Segment segment;

    segment.key = key;
    segment.uniqueId = "project$" + key;
    segment.version = 1;

    for (const auto &conditions : rules) {
        segment.rules.push_back(fp::SegmentRule{conditions});
    }

    return segment;
}
