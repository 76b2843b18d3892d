#pragma once

#include <atomic>
#include <cstdio>
#include <string>

#include <unistd.h>

#include "snap/db/db.hpp"

namespace snap::test {

// Unique database file under /tmp, removed together with its WAL side files.
class TempDbPath {
public:
    explicit TempDbPath(const char* tag = "snap") {
        static std::atomic<unsigned> counter{0};
        path_ = std::string("/tmp/") + tag + "_test_" + std::to_string(::getpid()) + "_" +
                std::to_string(counter.fetch_add(1)) + ".db";
        remove_files();
    }

    ~TempDbPath() { remove_files(); }

    TempDbPath(const TempDbPath&) = delete;
    TempDbPath& operator=(const TempDbPath&) = delete;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    [[nodiscard]] snap::db::DbConfig config() const {
        snap::db::DbConfig cfg;
        cfg.path = path_;
        cfg.journal_mode = "WAL";
        cfg.busy_timeout_ms = 10000;
        return cfg;
    }

private:
    void remove_files() const {
        std::remove(path_.c_str());
        std::remove((path_ + "-wal").c_str());
        std::remove((path_ + "-shm").c_str());
        std::remove((path_ + "-journal").c_str());
    }

    std::string path_;
};

} // namespace snap::test
