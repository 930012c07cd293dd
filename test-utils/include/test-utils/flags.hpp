#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <featureprobe/model.hpp>
#include <featureprobe/value.hpp>

fp::Toggle
makeMinimalToggle(const std::string &key, std::uint64_t version, bool enabled);

void
setDefaultServe(fp::Toggle &toggle, const fp::Serve &serve);

void
setDisabledServe(fp::Toggle &toggle, const fp::Serve &serve);

void
addVariation(fp::Toggle &toggle, const fp::Value &variation);

/* variations [false, true], both serves on false */
void
addBooleanVariations(fp::Toggle &toggle);

fp::Serve
makeSelect(int variation);

/* entry i of distribution lists the [lower, upper) slots serving variation i */
fp::Serve
makeSplit(
    const std::vector<std::vector<std::pair<std::uint32_t, std::uint32_t>>> &distribution,
    const std::string &bucketBy = "",
    const std::string &salt = "");

fp::Condition
makeCondition(
    fp::Condition::Type type,
    const std::string &subject,
    const std::string &predicate,
    const std::vector<std::string> &objects);

void
addRule(fp::Toggle &toggle, const std::vector<fp::Condition> &conditions, const fp::Serve &serve);

fp::Segment
makeSegment(const std::string &key, const std::vector<std::vector<fp::Condition>> &rules);
