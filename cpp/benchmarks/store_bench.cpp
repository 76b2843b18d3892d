#include <cstdio>
#include <string>
#include <unistd.h>

#include <benchmark/benchmark.h>

#include "snap/store/memory_store.hpp"
#include "snap/store/sqlite_store.hpp"

namespace {
snap::core::SecretDraft make_draft(bool challenged) {
    snap::core::SecretDraft d;
    d.text = "launch codes: 1234";
    if (challenged) {
        d.prompt = "color of the sky";
        d.answer = "blue";
    }
    return d;
}

std::string bench_db_path(const char* tag) {
    return std::string("/tmp/snap_bench_") + tag + "_" + std::to_string(::getpid()) + ".db";
}

void remove_db(const std::string& path) {
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

// Create then reveal; one full secret lifetime per iteration.
void run_lifecycle(benchmark::State& state, snap::store::SecretStore& store, bool challenged) {
    const auto draft = make_draft(challenged);
    for (auto _ : state) {
        snap::core::SecretId id{};
        snap::core::Status s = store.create(draft, &id);
        if (!snap::core::is_ok(s)) {
            state.SkipWithError("create failed");
            return;
        }
        snap::store::ConsumeResult r;
        s = challenged ? store.validate_and_consume(id, "blue", &r) : store.consume_if_valid(id, &r);
        benchmark::DoNotOptimize(s.code);
        benchmark::DoNotOptimize(r.text.data());
    }
}
} // namespace

static void BM_MemoryStoreLifecycle(benchmark::State& state) {
    snap::store::MemorySecretStore store;
    run_lifecycle(state, store, state.range(0) != 0);
}
BENCHMARK(BM_MemoryStoreLifecycle)->Arg(0)->Arg(1);

static void BM_SqliteStoreLifecycle(benchmark::State& state) {
    const std::string path = bench_db_path("store");
    remove_db(path);

    snap::db::DbConfig cfg;
    cfg.path = path;
    {
        snap::store::SqliteSecretStore store;
        if (!snap::core::is_ok(store.open(cfg))) {
            state.SkipWithError("open failed");
            remove_db(path);
            return;
        }
        run_lifecycle(state, store, state.range(0) != 0);
    }
    remove_db(path);
}
BENCHMARK(BM_SqliteStoreLifecycle)->Arg(0)->Arg(1);

static void BM_MemoryStoreMissing(benchmark::State& state) {
    snap::store::MemorySecretStore store;
    snap::core::SecretId id{};
    id.b[0] = 1;
    for (auto _ : state) {
        snap::store::ConsumeResult r;
        benchmark::DoNotOptimize(store.consume_if_valid(id, &r).code);
    }
}
BENCHMARK(BM_MemoryStoreMissing);

static void BM_MemoryStoreContended(benchmark::State& state) {
    static snap::store::MemorySecretStore store;
    run_lifecycle(state, store, false);
}
BENCHMARK(BM_MemoryStoreContended)->Threads(1)->Threads(4)->Threads(8);
