#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <featureprobe/value.hpp>

namespace fp {

/* one evaluation, as recorded by the client */
struct AccessEvent {
    std::int64_t time = 0;
    std::string key;
    Value value;
    std::optional<int> index;
    std::optional<std::uint64_t> version;
    std::string reason;
};

struct ToggleCounter {
    Value value;
    std::optional<std::uint64_t> version;
    std::optional<int> index;
    std::size_t count = 0;
};

struct Access {
    std::int64_t startTime = 0;
    std::int64_t endTime = 0;
    /* per toggle, in first seen order */
    std::map<std::string, std::vector<ToggleCounter>> counters;
};

/* Collapse events sharing (key, index, version) into one counter keeping the
 * first value seen. The window spans the earliest to the latest event. */
Access buildAccess(const std::vector<AccessEvent> &events);

/* the document posted to the events endpoint */
nlohmann::json packEvents(const std::vector<AccessEvent> &events, const Access &access);

void to_json(nlohmann::json &j, const AccessEvent &event);
void to_json(nlohmann::json &j, const ToggleCounter &counter);
void to_json(nlohmann::json &j, const Access &access);

} // namespace fp
