#include "gtest/gtest.h"
#include "concurrencyfixture.h"

#include <atomic>
#include <memory>

#include "store.hpp"
#include "test-utils/flags.hpp"

// Inherit from the CommonFixture to give a reasonable name for the test output.
// Any custom setup and teardown would happen in this derived class.
class StoreFixture : public CommonFixture {
};

class StoreConcurrencyFixture : public ConcurrencyFixture {
};

static fp::Repository
makeRepository(const std::uint64_t version)
{
    fp::Repository repository;

    fp::Toggle first = makeMinimalToggle("first", version, true);
    fp::Toggle second = makeMinimalToggle("second", version, true);
    repository.toggles.emplace("first", first);
    repository.toggles.emplace("second", second);
    repository.segments.emplace("segment", makeSegment("segment", {}));

    return repository;
}

TEST_F(StoreFixture, StartsEmptyAndUninitialized) {
    fp::Store store;

    ASSERT_FALSE(store.initialized());
    ASSERT_TRUE(store.snapshot());
    ASSERT_TRUE(store.snapshot()->toggles.empty());
}

TEST_F(StoreFixture, PublishReplacesSnapshot) {
    fp::Store store;

    store.publish(makeRepository(1));
    ASSERT_TRUE(store.initialized());
    ASSERT_EQ(store.snapshot()->toggles.at("first").version, 1u);

    store.publish(makeRepository(2));
    ASSERT_EQ(store.snapshot()->toggles.at("first").version, 2u);
    ASSERT_EQ(store.snapshot()->segments.size(), 1u);
}

TEST_F(StoreFixture, HeldSnapshotIsUnaffectedByPublish) {
    fp::Store store;

    store.publish(makeRepository(1));
    const std::shared_ptr<const fp::Repository> held = store.snapshot();

    store.publish(fp::Repository());

    ASSERT_EQ(held->toggles.size(), 2u);
    ASSERT_TRUE(store.snapshot()->toggles.empty());
}

TEST_F(StoreFixture, ClearEmptiesButStaysInitialized) {
    fp::Store store;

    store.publish(makeRepository(1));
    store.clear();

    ASSERT_TRUE(store.snapshot()->toggles.empty());
    ASSERT_TRUE(store.snapshot()->segments.empty());
    ASSERT_TRUE(store.initialized());
}

TEST_F(StoreConcurrencyFixture, ReadersSeeWholeSnapshots) {
    fp::Store store;
    std::atomic<bool> torn{false};

    store.publish(makeRepository(0));

    Run([&]() {
        for (std::uint64_t version = 1; version <= 500; version++) {
            store.publish(makeRepository(version));
        }
    });

    RunMany(4, [&]() {
        for (int i = 0; i < 500; i++) {
            const std::shared_ptr<const fp::Repository> repository = store.snapshot();
            if (repository->toggles.at("first").version != repository->toggles.at("second").version) {
                torn.store(true);
            }
        }
    });

    Join();

    ASSERT_FALSE(torn.load());
    ASSERT_EQ(store.snapshot()->toggles.at("first").version, 500u);
}
