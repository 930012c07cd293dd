#include "gtest/gtest.h"
#include "concurrencyfixture.h"

#include <chrono>
#include <memory>
#include <thread>

#include "store.hpp"
#include "synchronizer.hpp"
#include "test-utils/flags.hpp"
#include "test-utils/network.hpp"

// Inherit from the CommonFixture to give a reasonable name for the test output.
// Any custom setup and teardown would happen in this derived class.
class SynchronizerFixture : public CommonFixture {
protected:
    std::shared_ptr<fp::Store> store = std::make_shared<fp::Store>();
};

class SynchronizerConcurrencyFixture : public ConcurrencyFixture {
};

static fp::Repository
makeRepository(const std::uint64_t version)
{
    fp::Repository repository;
    repository.toggles.emplace("toggle", makeMinimalToggle("toggle", version, true));
    return repository;
}

/* polls until the predicate holds or a few seconds pass */
template <typename Predicate>
static bool
eventually(Predicate predicate)
{
    for (int i = 0; i < 500; i++) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

TEST_F(SynchronizerFixture, WaitsForFirstSnapshot) {
    auto source = std::make_shared<StaticDataSource>(makeRepository(1));
    fp::Synchronizer synchronizer(source, store, std::chrono::milliseconds(60000));

    ASSERT_TRUE(synchronizer.start(true, std::chrono::milliseconds(5000)));
    ASSERT_TRUE(synchronizer.initialized());
    ASSERT_EQ(store->snapshot()->toggles.at("toggle").version, 1u);

    synchronizer.stop();
}

TEST_F(SynchronizerFixture, WaitTimesOutWithoutData) {
    auto source = std::make_shared<StaticDataSource>();
    fp::Synchronizer synchronizer(source, store, std::chrono::milliseconds(60000));

    const auto started = std::chrono::steady_clock::now();
    ASSERT_FALSE(synchronizer.start(true, std::chrono::milliseconds(100)));
    ASSERT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(100));

    ASSERT_FALSE(store->initialized());
    ASSERT_TRUE(store->snapshot()->toggles.empty());

    synchronizer.stop();
}

TEST_F(SynchronizerFixture, NoWaitReturnsImmediately) {
    auto source = std::make_shared<StaticDataSource>(makeRepository(1));
    fp::Synchronizer synchronizer(source, store, std::chrono::milliseconds(60000));

    synchronizer.start(false, std::chrono::milliseconds(60000));

    ASSERT_TRUE(eventually([&]() { return synchronizer.initialized(); }));

    synchronizer.stop();
}

TEST_F(SynchronizerFixture, RefreshesOnInterval) {
    auto source = std::make_shared<StaticDataSource>(makeRepository(1));
    fp::Synchronizer synchronizer(source, store, std::chrono::milliseconds(10));

    ASSERT_TRUE(synchronizer.start(true, std::chrono::milliseconds(5000)));

    source->setRepository(makeRepository(2));

    ASSERT_TRUE(eventually([&]() { return store->snapshot()->toggles.at("toggle").version == 2u; }));
    ASSERT_GE(source->fetchCount(), 2u);

    synchronizer.stop();
}

TEST_F(SynchronizerFixture, FailedFetchKeepsSnapshot) {
    auto source = std::make_shared<StaticDataSource>(makeRepository(1));
    fp::Synchronizer synchronizer(source, store, std::chrono::milliseconds(10));

    ASSERT_TRUE(synchronizer.start(true, std::chrono::milliseconds(5000)));

    source->setRepository(std::nullopt);
    const std::size_t fetched = source->fetchCount();
    ASSERT_TRUE(eventually([&]() { return source->fetchCount() >= fetched + 3; }));

    ASSERT_EQ(store->snapshot()->toggles.at("toggle").version, 1u);
    ASSERT_TRUE(synchronizer.initialized());

    synchronizer.stop();
}

TEST_F(SynchronizerFixture, StopClosesSourceAndHaltsPolling) {
    auto source = std::make_shared<StaticDataSource>(makeRepository(1));
    fp::Synchronizer synchronizer(source, store, std::chrono::milliseconds(10));

    ASSERT_TRUE(synchronizer.start(true, std::chrono::milliseconds(5000)));
    synchronizer.stop();

    ASSERT_TRUE(source->closed());

    const std::size_t fetched = source->fetchCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_EQ(source->fetchCount(), fetched);

    synchronizer.stop();
}

TEST_F(SynchronizerFixture, StopBeforeStartDoesNothing) {
    auto source = std::make_shared<StaticDataSource>(makeRepository(1));
    fp::Synchronizer synchronizer(source, store, std::chrono::milliseconds(10));

    synchronizer.stop();

    ASSERT_FALSE(source->closed());
    ASSERT_EQ(source->fetchCount(), 0u);
    ASSERT_FALSE(synchronizer.start(false, std::chrono::milliseconds(0)));
}

TEST_F(SynchronizerConcurrencyFixture, StartRacingStop) {
    for (int round = 0; round < 100; round++) {
        auto store = std::make_shared<fp::Store>();
        auto source = std::make_shared<StaticDataSource>(makeRepository(1));
        fp::Synchronizer synchronizer(source, store, std::chrono::milliseconds(60000));

        Run([&]() { synchronizer.start(round % 2 == 0, std::chrono::milliseconds(1000)); });
        Run([&]() { synchronizer.stop(); });
        Join();

        synchronizer.stop();
    }
}
