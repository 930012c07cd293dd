#include "gtest/gtest.h"
#include "commonfixture.h"

#include <vector>

#include <nlohmann/json.hpp>

#include "events.hpp"

// Inherit from the CommonFixture to give a reasonable name for the test output.
// Any custom setup and teardown would happen in this derived class.
class EventsFixture : public CommonFixture {
};

static fp::AccessEvent
makeEvent(
    const std::int64_t time,
    const std::string &key,
    const fp::Value &value,
    const std::optional<int> index,
    const std::optional<std::uint64_t> version)
{
    fp::AccessEvent event;

    event.time = time;
    event.key = key;
    event.value = value;
    event.index = index;
    event.version = version;
    event.reason = "Default rule hit";

    return event;
}

TEST_F(EventsFixture, EmptyBatch) {
    const fp::Access access = fp::buildAccess({});

    ASSERT_EQ(access.startTime, 0);
    ASSERT_EQ(access.endTime, 0);
    ASSERT_TRUE(access.counters.empty());
}

TEST_F(EventsFixture, CountsIdenticalEvaluations) {
    std::vector<fp::AccessEvent> events;
    for (int i = 0; i < 5; i++) {
        events.push_back(makeEvent(100 + i, "toggle", fp::Value(true), 1, 3));
    }

    const fp::Access access = fp::buildAccess(events);

    ASSERT_EQ(access.counters.size(), 1u);
    const std::vector<fp::ToggleCounter> &counters = access.counters.at("toggle");
    ASSERT_EQ(counters.size(), 1u);
    ASSERT_EQ(counters[0].count, 5u);
    ASSERT_EQ(counters[0].value, fp::Value(true));
    ASSERT_EQ(counters[0].index, std::optional<int>(1));
    ASSERT_EQ(counters[0].version, std::optional<std::uint64_t>(3));
}

TEST_F(EventsFixture, SeparatesByIndexAndVersion) {
    const std::vector<fp::AccessEvent> events = {
        makeEvent(10, "toggle", fp::Value("a"), 0, 1),
        makeEvent(11, "toggle", fp::Value("b"), 1, 1),
        makeEvent(12, "toggle", fp::Value("a"), 0, 2),
        makeEvent(13, "toggle", fp::Value("a"), 0, 1),
        makeEvent(14, "other", fp::Value("x"), 0, 1)
    };

    const fp::Access access = fp::buildAccess(events);

    ASSERT_EQ(access.counters.size(), 2u);

    const std::vector<fp::ToggleCounter> &counters = access.counters.at("toggle");
    ASSERT_EQ(counters.size(), 3u);
    ASSERT_EQ(counters[0].count, 2u);
    ASSERT_EQ(counters[1].value, fp::Value("b"));
    ASSERT_EQ(counters[2].version, std::optional<std::uint64_t>(2));

    ASSERT_EQ(access.counters.at("other")[0].count, 1u);
}

TEST_F(EventsFixture, MissingToggleEventsAggregateTogether) {
    const std::vector<fp::AccessEvent> events = {
        makeEvent(10, "missing", fp::Value(false), std::nullopt, std::nullopt),
        makeEvent(11, "missing", fp::Value(false), std::nullopt, std::nullopt)
    };

    const fp::Access access = fp::buildAccess(events);

    const std::vector<fp::ToggleCounter> &counters = access.counters.at("missing");
    ASSERT_EQ(counters.size(), 1u);
    ASSERT_EQ(counters[0].count, 2u);
    ASSERT_FALSE(counters[0].index);
}

TEST_F(EventsFixture, WindowSpansEarliestToLatest) {
    const std::vector<fp::AccessEvent> events = {
        makeEvent(500, "toggle", fp::Value(1), 0, 1),
        makeEvent(100, "toggle", fp::Value(1), 0, 1),
        makeEvent(900, "toggle", fp::Value(1), 0, 1),
        makeEvent(300, "toggle", fp::Value(1), 0, 1)
    };

    const fp::Access access = fp::buildAccess(events);

    ASSERT_EQ(access.startTime, 100);
    ASSERT_EQ(access.endTime, 900);
    ASSERT_LE(access.startTime, access.endTime);
}

TEST_F(EventsFixture, PackedDocumentShape) {
    const std::vector<fp::AccessEvent> events = {
        makeEvent(10, "toggle", fp::Value("a"), 0, 7),
        makeEvent(20, "missing", fp::Value(2.5), std::nullopt, std::nullopt)
    };

    const nlohmann::json packed = fp::packEvents(events, fp::buildAccess(events));

    ASSERT_TRUE(packed.is_array());
    ASSERT_EQ(packed.size(), 1u);

    const nlohmann::json &entry = packed.at(0);
    ASSERT_EQ(entry.at("events").size(), 2u);

    const nlohmann::json &first = entry.at("events").at(0);
    ASSERT_EQ(first.at("time"), 10);
    ASSERT_EQ(first.at("key"), "toggle");
    ASSERT_EQ(first.at("value"), "a");
    ASSERT_EQ(first.at("index"), 0);
    ASSERT_EQ(first.at("version"), 7);
    ASSERT_EQ(first.at("reason"), "Default rule hit");

    const nlohmann::json &second = entry.at("events").at(1);
    ASSERT_TRUE(second.at("index").is_null());
    ASSERT_TRUE(second.at("version").is_null());
    ASSERT_EQ(second.at("value"), 2.5);

    const nlohmann::json &access = entry.at("access");
    ASSERT_EQ(access.at("startTime"), 10);
    ASSERT_EQ(access.at("endTime"), 20);
    ASSERT_EQ(access.at("counters").at("toggle").at(0).at("count"), 1);
    ASSERT_EQ(access.at("counters").at("toggle").at(0).at("value"), "a");
    ASSERT_TRUE(access.at("counters").at("missing").at(0).at("index").is_null());
}
