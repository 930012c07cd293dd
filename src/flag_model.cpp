#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include <featureprobe/logging.hpp>

#include "flag_model.hpp"

namespace fp {

static Condition::Type
conditionTypeFromString(const std::string &type)
{
    if (type == "string") {
        return Condition::Type::String;
    } else if (type == "segment") {
        return Condition::Type::Segment;
    } else if (type == "datetime") {
        return Condition::Type::Datetime;
    } else if (type == "number") {
        return Condition::Type::Number;
    } else if (type == "semver") {
        return Condition::Type::Semver;
    }

    FP_LOG(LogLevel::Warning, "unknown condition type '%s'", type.c_str());
    return Condition::Type::Unknown;
}

Condition
decodeCondition(const nlohmann::json &json)
{
    Condition condition;

    condition.type = conditionTypeFromString(json.at("type").get<std::string>());
    condition.subject = json.value("subject", "");
    condition.predicate = json.at("predicate").get<std::string>();

    if (json.contains("objects")) {
        for (const nlohmann::json &object : json.at("objects")) {
            condition.objects.push_back(object.is_string() ? object.get<std::string>() : object.dump());
        }
    }

    return condition;
}

/* integral and within [0, UINT32_MAX], anything else is not a slot */
static bool
decodeBound(const nlohmann::json &json, std::uint32_t &bound)
{
    if (json.is_number_unsigned()) {
        const std::uint64_t value = json.get<std::uint64_t>();
        if (value <= std::numeric_limits<std::uint32_t>::max()) {
            bound = static_cast<std::uint32_t>(value);
            return true;
        }
    } else if (json.is_number_integer()) {
        const std::int64_t value = json.get<std::int64_t>();
        if (value >= 0 && value <= std::numeric_limits<std::uint32_t>::max()) {
            bound = static_cast<std::uint32_t>(value);
            return true;
        }
    }

    return false;
}

static Split
decodeSplit(const nlohmann::json &json)
{
    Split split;
    const nlohmann::json &distribution = json.at("distribution");

    for (std::size_t variation = 0; variation < distribution.size(); variation++) {
        for (const nlohmann::json &range : distribution.at(variation)) {
            SplitRange decoded;
            decoded.variation = static_cast<int>(variation);
            if (!decodeBound(range.at(0), decoded.lower) || !decodeBound(range.at(1), decoded.upper)) {
                FP_LOG(LogLevel::Warning, "skipping split range %s for variation %zu",
                    range.dump().c_str(), variation);
                continue;
            }
            if (decoded.upper > decoded.lower) {
                split.ranges.push_back(decoded);
            }
        }
    }

    std::stable_sort(split.ranges.begin(), split.ranges.end(),
        [](const SplitRange &a, const SplitRange &b) { return a.upper < b.upper; });

    if (json.contains("bucketBy") && json.at("bucketBy").is_string()) {
        split.bucketBy = json.at("bucketBy").get<std::string>();
    }
    if (json.contains("salt") && json.at("salt").is_string()) {
        split.salt = json.at("salt").get<std::string>();
    }

    return split;
}

Serve
decodeServe(const nlohmann::json &json)
{
    Serve serve;

    if (json.contains("select") && !json.at("select").is_null()) {
        const nlohmann::json &select = json.at("select");
        if (select.is_number_unsigned()) {
            /* beyond int64 is as out of range as anything else */
            const std::uint64_t index = select.get<std::uint64_t>();
            serve.select = index > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())
                ? std::numeric_limits<std::int64_t>::max()
                : static_cast<std::int64_t>(index);
        } else if (select.is_number_integer()) {
            serve.select = select.get<std::int64_t>();
        } else {
            FP_LOG(LogLevel::Warning, "ignoring non integral select %s", select.dump().c_str());
        }
    } else if (json.contains("split") && !json.at("split").is_null()) {
        serve.split = decodeSplit(json.at("split"));
    }

    return serve;
}

static std::vector<Condition>
decodeConditions(const nlohmann::json &json)
{
    std::vector<Condition> conditions;

    if (json.contains("conditions") && !json.at("conditions").is_null()) {
        for (const nlohmann::json &condition : json.at("conditions")) {
            conditions.push_back(decodeCondition(condition));
        }
    }

    return conditions;
}

Toggle
decodeToggle(const nlohmann::json &json)
{
    Toggle toggle;

    toggle.key = json.at("key").get<std::string>();
    toggle.enabled = json.at("enabled").get<bool>();
    toggle.version = json.value("version", std::uint64_t{0});
    toggle.forClient = json.value("forClient", false);
    toggle.disabledServe = decodeServe(json.at("disabledServe"));
    toggle.defaultServe = decodeServe(json.at("defaultServe"));

    if (json.contains("rules") && !json.at("rules").is_null()) {
        for (const nlohmann::json &rule : json.at("rules")) {
            Rule decoded;
            decoded.conditions = decodeConditions(rule);
            decoded.serve = decodeServe(rule.at("serve"));
            toggle.rules.push_back(std::move(decoded));
        }
    }

    for (const nlohmann::json &variation : json.at("variations")) {
        toggle.variations.emplace_back(variation);
    }

    return toggle;
}

Segment
decodeSegment(const nlohmann::json &json)
{
    Segment segment;

    segment.key = json.at("key").get<std::string>();
    segment.uniqueId = json.value("uniqueId", "");
    segment.version = json.value("version", std::uint64_t{0});

    if (json.contains("rules") && !json.at("rules").is_null()) {
        for (const nlohmann::json &rule : json.at("rules")) {
            SegmentRule decoded;
            decoded.conditions = decodeConditions(rule);
            segment.rules.push_back(std::move(decoded));
        }
    }

    return segment;
}

std::optional<Repository>
decodeRepository(const nlohmann::json &json)
{
    Repository repository;

    if (!json.is_object()) {
        FP_LOG(LogLevel::Error, "snapshot is not an object");
        return std::nullopt;
    }

    const auto toggles = json.find("toggles");
    if (toggles != json.end() && toggles->is_object()) {
        for (const auto &item : toggles->items()) {
            try {
                repository.toggles.emplace(item.key(), decodeToggle(item.value()));
            } catch (const nlohmann::json::exception &e) {
                FP_LOG(LogLevel::Warning, "skipping malformed toggle '%s': %s", item.key().c_str(), e.what());
            }
        }
    }

    const auto segments = json.find("segments");
    if (segments != json.end() && segments->is_object()) {
        for (const auto &item : segments->items()) {
            try {
                repository.segments.emplace(item.key(), decodeSegment(item.value()));
            } catch (const nlohmann::json::exception &e) {
                FP_LOG(LogLevel::Warning, "skipping malformed segment '%s': %s", item.key().c_str(), e.what());
            }
        }
    }

    return repository;
}

std::optional<Repository>
parseRepository(const std::string &text)
{
    const nlohmann::json json = nlohmann::json::parse(text, nullptr, false);

    if (json.is_discarded()) {
        FP_LOG(LogLevel::Error, "snapshot is not valid JSON");
        return std::nullopt;
    }

    return decodeRepository(json);
}

} // namespace fp
