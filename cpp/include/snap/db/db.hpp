#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "snap/core/errors.hpp"
#include "snap/core/types.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace snap::db {
    using u32 = snap::core::u32;
    using i64 = snap::core::i64;

    struct DbConfig {
        std::string path{":memory:"};
        std::string journal_mode{"WAL"};
        u32 busy_timeout_ms{5000};
    };

    // Maps an SQLite result code onto the Db status domain; aux keeps the raw code.
    [[nodiscard]] snap::core::Status status_from_sqlite(int rc) noexcept;

    // One SQLite connection with the snap schema applied. Calls are serialised
    // by mutex(); callers lock it around every statement sequence.
    class Database {
    public:
        Database() noexcept = default;
        ~Database() noexcept;

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        [[nodiscard]] snap::core::Status open(const DbConfig& cfg) noexcept;
        void close() noexcept;

        [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }
        [[nodiscard]] sqlite3* raw() const noexcept { return db_; }
        [[nodiscard]] std::mutex& mutex() noexcept { return mutex_; }
        [[nodiscard]] const std::string& path() const noexcept { return path_; }

        [[nodiscard]] snap::core::Status exec(const char* sql) noexcept;

        // Rows changed by the last statement on this connection.
        [[nodiscard]] int changes() const noexcept;

    private:
        sqlite3* db_{nullptr};
        std::string path_;
        std::mutex mutex_;
    };

    // Prepared statement, finalised on destruction. Bind indices are 1-based.
    class Statement {
    public:
        Statement(Database& db, const char* sql) noexcept;
        ~Statement() noexcept;

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        [[nodiscard]] snap::core::Status prepared() const noexcept { return prepare_status_; }

        void bind_blob(int idx, const void* data, int len) noexcept;
        void bind_text(int idx, std::string_view text) noexcept;
        void bind_i64(int idx, i64 v) noexcept;
        void bind_null(int idx) noexcept;

        // SQLITE_ROW, SQLITE_DONE or an error code.
        [[nodiscard]] int step() noexcept;

        [[nodiscard]] bool column_is_null(int col) const noexcept;
        [[nodiscard]] i64 column_i64(int col) const noexcept;
        [[nodiscard]] std::string column_text(int col) const;
        // Copies at most len bytes; false if the stored blob has a different size.
        [[nodiscard]] bool column_blob(int col, void* out, int len) const noexcept;
        [[nodiscard]] std::vector<snap::core::u8> column_bytes(int col) const;

    private:
        sqlite3_stmt* stmt_{nullptr};
        snap::core::Status prepare_status_{};
    };

    // BEGIN IMMEDIATE on construction; rolls back unless commit() succeeded.
    class ImmediateTxn {
    public:
        explicit ImmediateTxn(Database& db) noexcept;
        ~ImmediateTxn() noexcept;

        ImmediateTxn(const ImmediateTxn&) = delete;
        ImmediateTxn& operator=(const ImmediateTxn&) = delete;

        [[nodiscard]] snap::core::Status begun() const noexcept { return begin_status_; }
        [[nodiscard]] snap::core::Status commit() noexcept;

    private:
        Database& db_;
        snap::core::Status begin_status_{};
        bool active_{false};
    };

} // namespace snap::db
