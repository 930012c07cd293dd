#include <algorithm>

#include "events.hpp"

namespace fp {

template <typename T>
static nlohmann::json
optionalToJson(const std::optional<T> &value)
{
    if (value) {
        return nlohmann::json(*value);
    }
    return nlohmann::json();
}

Access
buildAccess(const std::vector<AccessEvent> &events)
{
    Access access;

    if (events.empty()) {
        return access;
    }

    access.startTime = events.front().time;
    access.endTime = events.front().time;

    for (const AccessEvent &event : events) {
        access.startTime = std::min(access.startTime, event.time);
        access.endTime = std::max(access.endTime, event.time);

        std::vector<ToggleCounter> &counters = access.counters[event.key];

        const auto existing = std::find_if(counters.begin(), counters.end(),
            [&](const ToggleCounter &counter) {
                return counter.index == event.index && counter.version == event.version;
            });

        if (existing != counters.end()) {
            existing->count++;
        } else {
            counters.push_back(ToggleCounter{event.value, event.version, event.index, 1});
        }
    }

    return access;
}

nlohmann::json
packEvents(const std::vector<AccessEvent> &events, const Access &access)
{
    nlohmann::json packed = nlohmann::json::object();

    packed["events"] = events;
    packed["access"] = access;

    return nlohmann::json::array({packed});
}

void
to_json(nlohmann::json &j, const AccessEvent &event)
{
    j = nlohmann::json{
        {"time", event.time},
        {"key", event.key},
        {"value", event.value.toJson()},
        {"index", optionalToJson(event.index)},
        {"version", optionalToJson(event.version)},
        {"reason", event.reason}
    };
}

void
to_json(nlohmann::json &j, const ToggleCounter &counter)
{
    j = nlohmann::json{
        {"value", counter.value.toJson()},
        {"version", optionalToJson(counter.version)},
        {"index", optionalToJson(counter.index)},
        {"count", counter.count}
    };
}

void
to_json(nlohmann::json &j, const Access &access)
{
    nlohmann::json counters = nlohmann::json::object();

    for (const auto &entry : access.counters) {
        counters[entry.first] = entry.second;
    }

    j = nlohmann::json{
        {"startTime", access.startTime},
        {"endTime", access.endTime},
        {"counters", counters}
    };
}

} // namespace fp
