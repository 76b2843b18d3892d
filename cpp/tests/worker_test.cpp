#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "snap/core/clock.hpp"
#include "snap/ingest/sqlite_queue.hpp"
#include "snap/ingest/worker.hpp"
#include "snap/store/memory_store.hpp"
#include "test_support.hpp"

using namespace snap::core;
using namespace snap::ingest;
using namespace std::chrono_literals;

namespace {

class CountingSink final : public ReplySink {
public:
    Status deliver(const Reply&) noexcept override {
        delivered.fetch_add(1);
        return ok_status();
    }

    std::atomic<int> delivered{0};
};

class WorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(is_ok(queue.open(tmp.config())));
    }

    void enqueue(int n) {
        for (int i = 0; i < n; ++i) {
            CreateSecretMessage m;
            m.text = "message " + std::to_string(i);
            m.reply_to = "r";
            ASSERT_TRUE(is_ok(adapter.enqueue(m)));
        }
    }

    snap::test::TempDbPath tmp{"snap_worker"};
    SqliteMessageQueue queue{"snap-create"};
    snap::store::MemorySecretStore store;
    snap::lifecycle::Orchestrator orch{store};
    CountingSink sink;
    IngestionAdapter adapter{queue, orch, sink};
};

} // namespace

TEST_F(WorkerTest, DrainProcessesEverything) {
    enqueue(5);
    IngestionWorker worker(adapter, 1h);

    u64 handled = 0;
    ASSERT_TRUE(is_ok(worker.drain(0, &handled)));
    EXPECT_EQ(handled, 5u);
    EXPECT_EQ(sink.delivered.load(), 5);

    ASSERT_TRUE(is_ok(worker.drain(0, &handled)));
    EXPECT_EQ(handled, 0u);
}

TEST_F(WorkerTest, DrainHonoursLimit) {
    enqueue(5);
    IngestionWorker worker(adapter, 1h);

    u64 handled = 0;
    ASSERT_TRUE(is_ok(worker.drain(2, &handled)));
    EXPECT_EQ(handled, 2u);

    u64 depth = 0;
    ASSERT_TRUE(is_ok(queue.depth(&depth)));
    EXPECT_EQ(depth, 3u);
}

TEST_F(WorkerTest, BackgroundLoopPicksUpNewMessages) {
    IngestionWorker worker(adapter, 10ms);
    worker.start();
    EXPECT_TRUE(worker.isRunning());

    enqueue(3);
    for (int i = 0; i < 400 && sink.delivered.load() < 3; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    worker.stop();

    EXPECT_FALSE(worker.isRunning());
    EXPECT_EQ(sink.delivered.load(), 3);

    u64 live = 0;
    ASSERT_TRUE(is_ok(store.count(&live)));
    EXPECT_EQ(live, 3u);
}

TEST_F(WorkerTest, RestartAfterStop) {
    IngestionWorker worker(adapter, 10ms);
    worker.start();
    worker.stop();
    worker.start();
    EXPECT_TRUE(worker.isRunning());
    worker.stop();
    EXPECT_EQ(worker.name(), "IngestionWorker");
}
