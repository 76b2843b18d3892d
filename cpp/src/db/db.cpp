#include "snap/db/db.hpp"
#include "snap/core/log.hpp"

#include <sqlite3.h>

#include <cstring>
#include <string>

namespace snap::db {

using namespace snap::core;

namespace {
    // Secrets are keyed by BLAKE3(id); the queue is shared by every named queue.
    constexpr const char* kSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS secrets (
            lookup_key BLOB PRIMARY KEY,
            text TEXT NOT NULL,
            prompt TEXT,
            answer_digest BLOB,
            answer_match INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL,
            expires_at INTEGER,
            state INTEGER NOT NULL DEFAULT 0,
            failed_attempts INTEGER NOT NULL DEFAULT 0
        ) WITHOUT ROWID;
        CREATE INDEX IF NOT EXISTS idx_secrets_expires ON secrets(expires_at)
            WHERE expires_at IS NOT NULL;

        CREATE TABLE IF NOT EXISTS queue_messages (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            queue TEXT NOT NULL,
            body BLOB NOT NULL,
            enqueued_at INTEGER NOT NULL,
            visible_at INTEGER NOT NULL,
            dequeue_count INTEGER NOT NULL DEFAULT 0,
            receipt INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_queue_visible ON queue_messages(queue, visible_at);
    )SQL";

    [[nodiscard]] bool journal_mode_known(const std::string& mode) noexcept {
        static constexpr const char* kModes[] = {"WAL", "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "OFF"};
        for (const char* m : kModes) {
            if (mode == m) {
                return true;
            }
        }
        return false;
    }
}

Status status_from_sqlite(int rc) noexcept {
    const u32 aux = static_cast<u32>(rc);
    switch (rc & 0xff) {
        case SQLITE_OK:
        case SQLITE_ROW:
        case SQLITE_DONE:
            return ok_status();
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return make_status(StatusDomain::Db, StatusCode::Busy, aux);
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_READONLY:
            return make_status(StatusDomain::Db, StatusCode::Io, aux);
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return make_status(StatusDomain::Db, StatusCode::Corrupt, aux);
        case SQLITE_CONSTRAINT:
            return make_status(StatusDomain::Db, StatusCode::Conflict, aux);
        case SQLITE_MISUSE:
        case SQLITE_RANGE:
            return make_status(StatusDomain::Db, StatusCode::Invalid, aux);
        default:
            return make_status(StatusDomain::Db, StatusCode::Unknown, aux);
    }
}

// ============================================================================
// Database Lifecycle
// ============================================================================

Database::~Database() noexcept {
    close();
}

Status Database::open(const DbConfig& cfg) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (!journal_mode_known(cfg.journal_mode)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* path = cfg.path.empty() ? ":memory:" : cfg.path.c_str();
    int rc = sqlite3_open_v2(path, &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        LogRegistry::db()->error("[Database] Failed to open {}: {}", path, db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return status_from_sqlite(rc);
    }

    sqlite3_busy_timeout(db_, static_cast<int>(cfg.busy_timeout_ms));

    char* err_msg = nullptr;
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += cfg.journal_mode;
    rc = sqlite3_exec(db_, journal_sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        // In-memory databases refuse WAL; keep going with the default journal.
        LogRegistry::db()->debug("[Database] journal_mode={} not applied: {}", cfg.journal_mode, err_msg ? err_msg : "");
        sqlite3_free(err_msg);
        err_msg = nullptr;
    }

    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY", nullptr, nullptr, nullptr);
    // Consumed secrets must not linger in free pages.
    rc = sqlite3_exec(db_, "PRAGMA secure_delete=ON", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        LogRegistry::db()->error("[Database] secure_delete refused on {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return status_from_sqlite(rc);
    }

    rc = sqlite3_exec(db_, kSchemaSQL, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LogRegistry::db()->error("[Database] Schema setup failed on {}: {}", path, err_msg ? err_msg : "");
        sqlite3_free(err_msg);
        sqlite3_close(db_);
        db_ = nullptr;
        return status_from_sqlite(rc);
    }

    path_ = path;
    LogRegistry::db()->debug("[Database] Opened {}", path_);
    return ok_status();
}

void Database::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Status Database::exec(const char* sql) noexcept {
    if (!db_ || !sql) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (err_msg) {
        LogRegistry::db()->warn("[Database] exec failed: {}", err_msg);
        sqlite3_free(err_msg);
    }
    return status_from_sqlite(rc);
}

int Database::changes() const noexcept {
    return db_ ? sqlite3_changes(db_) : 0;
}

// ============================================================================
// Statements
// ============================================================================

Statement::Statement(Database& db, const char* sql) noexcept {
    if (!db.raw()) {
        prepare_status_ = make_status(StatusDomain::Db, StatusCode::Invalid);
        return;
    }
    const int rc = sqlite3_prepare_v2(db.raw(), sql, -1, &stmt_, nullptr);
    if (rc != SQLITE_OK || stmt_ == nullptr) {
        LogRegistry::db()->error("[Database] prepare failed: {}", sqlite3_errmsg(db.raw()));
        prepare_status_ = status_from_sqlite(rc == SQLITE_OK ? SQLITE_ERROR : rc);
    }
}

Statement::~Statement() noexcept {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

void Statement::bind_blob(int idx, const void* data, int len) noexcept {
    sqlite3_bind_blob(stmt_, idx, data, len, SQLITE_TRANSIENT);
}

void Statement::bind_text(int idx, std::string_view text) noexcept {
    sqlite3_bind_text(stmt_, idx, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

void Statement::bind_i64(int idx, i64 v) noexcept {
    sqlite3_bind_int64(stmt_, idx, v);
}

void Statement::bind_null(int idx) noexcept {
    sqlite3_bind_null(stmt_, idx);
}

int Statement::step() noexcept {
    if (!stmt_) {
        return SQLITE_MISUSE;
    }
    return sqlite3_step(stmt_);
}

bool Statement::column_is_null(int col) const noexcept {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

i64 Statement::column_i64(int col) const noexcept {
    return sqlite3_column_int64(stmt_, col);
}

std::string Statement::column_text(int col) const {
    const unsigned char* p = sqlite3_column_text(stmt_, col);
    const int n = sqlite3_column_bytes(stmt_, col);
    if (!p || n <= 0) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(p), static_cast<std::size_t>(n));
}

bool Statement::column_blob(int col, void* out, int len) const noexcept {
    const void* p = sqlite3_column_blob(stmt_, col);
    const int n = sqlite3_column_bytes(stmt_, col);
    if (!p || n != len) {
        return false;
    }
    std::memcpy(out, p, static_cast<std::size_t>(n));
    return true;
}

std::vector<u8> Statement::column_bytes(int col) const {
    const auto* p = static_cast<const u8*>(sqlite3_column_blob(stmt_, col));
    const int n = sqlite3_column_bytes(stmt_, col);
    if (!p || n <= 0) {
        return {};
    }
    return std::vector<u8>(p, p + n);
}

// ============================================================================
// Transaction Management
// ============================================================================

ImmediateTxn::ImmediateTxn(Database& db) noexcept : db_(db) {
    begin_status_ = db_.exec("BEGIN IMMEDIATE");
    active_ = is_ok(begin_status_);
}

ImmediateTxn::~ImmediateTxn() noexcept {
    if (active_) {
        (void)db_.exec("ROLLBACK");
    }
}

Status ImmediateTxn::commit() noexcept {
    if (!active_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    const Status s = db_.exec("COMMIT");
    if (is_ok(s)) {
        active_ = false;
    }
    return s;
}

} // namespace snap::db
