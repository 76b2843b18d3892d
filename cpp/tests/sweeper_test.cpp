#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "snap/core/clock.hpp"
#include "snap/store/memory_store.hpp"
#include "snap/store/sweeper.hpp"

using namespace snap::core;
using namespace snap::store;
using namespace std::chrono_literals;

namespace {

void add(MemorySecretStore& store, DurationMs ttl) {
    SecretDraft d;
    d.text = "x";
    d.expire_in = ttl;
    SecretId id{};
    ASSERT_TRUE(is_ok(store.create(d, &id)));
}

} // namespace

TEST(Sweeper, SweepOnceCountsRemovals) {
    ManualClock clock;
    MemorySecretStore store(StoreConfig{}, clock);
    Sweeper sweeper(store, 1h);

    add(store, 10);
    add(store, 20);
    add(store, kMillisPerHour);

    clock.advance(15);
    u64 removed = 0;
    ASSERT_TRUE(is_ok(sweeper.sweep_once(&removed)));
    EXPECT_EQ(removed, 1u);

    clock.advance(10);
    ASSERT_TRUE(is_ok(sweeper.sweep_once(nullptr)));
    EXPECT_EQ(sweeper.total_removed(), 2u);
}

TEST(Sweeper, BackgroundLoopSweeps) {
    ManualClock clock;
    MemorySecretStore store(StoreConfig{}, clock);
    add(store, 5);
    add(store, 5);
    clock.advance(5);

    Sweeper sweeper(store, 10ms);
    sweeper.start();
    EXPECT_TRUE(sweeper.isRunning());

    for (int i = 0; i < 200 && sweeper.total_removed() < 2; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    sweeper.stop();

    EXPECT_FALSE(sweeper.isRunning());
    EXPECT_EQ(sweeper.total_removed(), 2u);
}

TEST(Sweeper, StopReturnsPromptlyFromLongSleep) {
    MemorySecretStore store;
    Sweeper sweeper(store, 1h);
    sweeper.start();
    std::this_thread::sleep_for(20ms);

    const auto begin = std::chrono::steady_clock::now();
    sweeper.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    EXPECT_EQ(sweeper.name(), "Sweeper");
}
