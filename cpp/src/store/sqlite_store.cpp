#include "snap/store/sqlite_store.hpp"
#include "snap/core/log.hpp"
#include "snap/security/challenge.hpp"
#include "snap/security/id.hpp"

#include <sqlite3.h>

#include <mutex>
#include <utility>

namespace snap::store {

using namespace snap::core;
using snap::db::ImmediateTxn;
using snap::db::Statement;
using snap::db::status_from_sqlite;

namespace {
    constexpr const char* kInsertSQL =
        "INSERT INTO secrets (lookup_key, text, prompt, answer_digest, answer_match, "
        "created_at, expires_at, state, failed_attempts) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    constexpr const char* kSelectSQL =
        "SELECT text, prompt, answer_digest, answer_match, expires_at, failed_attempts "
        "FROM secrets WHERE lookup_key = ?";

    constexpr const char* kDeleteSQL = "DELETE FROM secrets WHERE lookup_key = ?";

    constexpr const char* kMarkPendingSQL = "UPDATE secrets SET state = ? WHERE lookup_key = ?";

    constexpr const char* kFailedAttemptSQL =
        "UPDATE secrets SET failed_attempts = ?, state = ? WHERE lookup_key = ?";

    constexpr const char* kSweepSQL =
        "DELETE FROM secrets WHERE expires_at IS NOT NULL AND expires_at <= ?";

    constexpr const char* kCountLiveSQL =
        "SELECT COUNT(*) FROM secrets WHERE expires_at IS NULL OR expires_at > ?";

    constexpr const char* kCountAllSQL = "SELECT COUNT(*) FROM secrets";

    // Columns of kSelectSQL.
    struct Row {
        std::string text;
        std::optional<std::string> prompt;
        std::optional<Hash256> answer_digest;
        AnswerMatch answer_match{AnswerMatch::Exact};
        std::optional<Timestamp> expires_at;
        u32 failed_attempts{0};
    };

    // found=false when no row exists for key.
    [[nodiscard]] Status load_row(snap::db::Database& db, const Hash256& key, Row* out, bool* found) {
        Statement st(db, kSelectSQL);
        if (!is_ok(st.prepared())) {
            return st.prepared();
        }
        st.bind_blob(1, key.b.data(), static_cast<int>(key.b.size()));

        const int rc = st.step();
        if (rc == SQLITE_DONE) {
            *found = false;
            return ok_status();
        }
        if (rc != SQLITE_ROW) {
            return status_from_sqlite(rc);
        }

        out->text = st.column_text(0);
        if (!st.column_is_null(1)) {
            out->prompt = st.column_text(1);
        }
        if (!st.column_is_null(2)) {
            Hash256 d{};
            if (!st.column_blob(2, d.b.data(), static_cast<int>(d.b.size()))) {
                return make_status(StatusDomain::Store, StatusCode::Corrupt);
            }
            out->answer_digest = d;
        }
        out->answer_match = st.column_i64(3) == static_cast<i64>(AnswerMatch::IgnoreAsciiCase)
            ? AnswerMatch::IgnoreAsciiCase
            : AnswerMatch::Exact;
        if (!st.column_is_null(4)) {
            out->expires_at = st.column_i64(4);
        }
        out->failed_attempts = static_cast<u32>(st.column_i64(5));
        *found = true;
        return ok_status();
    }

    [[nodiscard]] Status delete_row(snap::db::Database& db, const Hash256& key) noexcept {
        Statement st(db, kDeleteSQL);
        if (!is_ok(st.prepared())) {
            return st.prepared();
        }
        st.bind_blob(1, key.b.data(), static_cast<int>(key.b.size()));
        const int rc = st.step();
        return rc == SQLITE_DONE ? ok_status() : status_from_sqlite(rc);
    }

    [[nodiscard]] Status count_query(snap::db::Database& db, const char* sql, const Timestamp* now, u64* out) noexcept {
        Statement st(db, sql);
        if (!is_ok(st.prepared())) {
            return st.prepared();
        }
        if (now) {
            st.bind_i64(1, *now);
        }
        const int rc = st.step();
        if (rc != SQLITE_ROW) {
            return status_from_sqlite(rc == SQLITE_DONE ? SQLITE_ERROR : rc);
        }
        *out = static_cast<u64>(st.column_i64(0));
        return ok_status();
    }
}

SqliteSecretStore::SqliteSecretStore(StoreConfig cfg, const Clock& clock) noexcept
    : cfg_(std::move(cfg)), clock_(clock) {}

Status SqliteSecretStore::open(const snap::db::DbConfig& cfg) noexcept {
    return db_.open(cfg);
}

void SqliteSecretStore::close() noexcept {
    db_.close();
}

Status SqliteSecretStore::create(const SecretDraft& draft, SecretId* out_id) noexcept {
    if (!out_id) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    if (!db_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }

    SecretId id{};
    Status s = security::secret_id_generate(&id);
    if (!is_ok(s)) {
        return s;
    }

    SecretRecord rec;
    s = build_record(cfg_, draft, id, clock_.now_ms(), &rec);
    if (!is_ok(s)) {
        return s;
    }

    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement st(db_, kInsertSQL);
    if (!is_ok(st.prepared())) {
        return st.prepared();
    }
    st.bind_blob(1, rec.key.b.data(), static_cast<int>(rec.key.b.size()));
    st.bind_text(2, rec.text);
    if (rec.prompt) {
        st.bind_text(3, *rec.prompt);
    } else {
        st.bind_null(3);
    }
    if (rec.answer_digest) {
        st.bind_blob(4, rec.answer_digest->b.data(), static_cast<int>(rec.answer_digest->b.size()));
    } else {
        st.bind_null(4);
    }
    st.bind_i64(5, static_cast<i64>(rec.answer_match));
    st.bind_i64(6, rec.created_at);
    if (rec.expires_at) {
        st.bind_i64(7, *rec.expires_at);
    } else {
        st.bind_null(7);
    }
    st.bind_i64(8, static_cast<i64>(rec.state));
    st.bind_i64(9, 0);

    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        const Status err = status_from_sqlite(rc);
        LogRegistry::store()->error("[SqliteSecretStore] Insert failed: {} ({})",
                                    status_code_name(err.code), err.aux);
        return err;
    }

    *out_id = id;
    return ok_status();
}

Status SqliteSecretStore::consume_if_valid(const SecretId& id, ConsumeResult* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    if (!db_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }

    const Hash256 key = security::secret_id_lookup_key(id);
    const Timestamp now = clock_.now_ms();

    std::lock_guard<std::mutex> lock(db_.mutex());
    ImmediateTxn txn(db_);
    if (!is_ok(txn.begun())) {
        return txn.begun();
    }

    Row row;
    bool found = false;
    Status s = load_row(db_, key, &row, &found);
    if (!is_ok(s)) {
        return s;
    }
    if (!found) {
        return not_found_status();
    }

    if (is_expired(row.expires_at, now)) {
        s = delete_row(db_, key);
        if (is_ok(s)) {
            s = txn.commit();
        }
        return is_ok(s) ? not_found_status() : s;
    }

    if (row.answer_digest.has_value()) {
        Statement st(db_, kMarkPendingSQL);
        if (!is_ok(st.prepared())) {
            return st.prepared();
        }
        st.bind_i64(1, static_cast<i64>(SecretState::PendingAnswer));
        st.bind_blob(2, key.b.data(), static_cast<int>(key.b.size()));
        const int rc = st.step();
        if (rc != SQLITE_DONE) {
            return status_from_sqlite(rc);
        }
        s = txn.commit();
        if (!is_ok(s)) {
            return s;
        }
        out->outcome = ConsumeOutcome::ChallengeRequired;
        out->prompt = row.prompt.value_or(std::string());
        out->text.clear();
        return ok_status();
    }

    s = delete_row(db_, key);
    if (!is_ok(s)) {
        return s;
    }
    s = txn.commit();
    if (!is_ok(s)) {
        return s;
    }

    out->outcome = ConsumeOutcome::Revealed;
    out->text = std::move(row.text);
    out->prompt.clear();
    return ok_status();
}

Status SqliteSecretStore::validate_and_consume(const SecretId& id, std::string_view answer, ConsumeResult* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    if (!db_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }

    const Hash256 key = security::secret_id_lookup_key(id);
    const Timestamp now = clock_.now_ms();

    std::lock_guard<std::mutex> lock(db_.mutex());
    ImmediateTxn txn(db_);
    if (!is_ok(txn.begun())) {
        return txn.begun();
    }

    Row row;
    bool found = false;
    Status s = load_row(db_, key, &row, &found);
    if (!is_ok(s)) {
        return s;
    }
    if (!found) {
        return not_found_status();
    }

    if (is_expired(row.expires_at, now)) {
        s = delete_row(db_, key);
        if (is_ok(s)) {
            s = txn.commit();
        }
        return is_ok(s) ? not_found_status() : s;
    }

    if (row.answer_digest.has_value() &&
        !security::challenge_matches(*row.answer_digest, id, answer, row.answer_match)) {
        const u32 attempts = row.failed_attempts + 1;
        if (cfg_.max_answer_attempts > 0 && attempts >= cfg_.max_answer_attempts) {
            s = delete_row(db_, key);
            if (is_ok(s)) {
                LogRegistry::store()->info("[SqliteSecretStore] Secret destroyed after {} failed answers", attempts);
            }
        } else {
            Statement st(db_, kFailedAttemptSQL);
            s = st.prepared();
            if (is_ok(s)) {
                st.bind_i64(1, static_cast<i64>(attempts));
                st.bind_i64(2, static_cast<i64>(SecretState::PendingAnswer));
                st.bind_blob(3, key.b.data(), static_cast<int>(key.b.size()));
                const int rc = st.step();
                s = rc == SQLITE_DONE ? ok_status() : status_from_sqlite(rc);
            }
        }
        if (is_ok(s)) {
            s = txn.commit();
        }
        return is_ok(s) ? mismatch_status() : s;
    }

    s = delete_row(db_, key);
    if (!is_ok(s)) {
        return s;
    }
    s = txn.commit();
    if (!is_ok(s)) {
        return s;
    }

    out->outcome = ConsumeOutcome::Revealed;
    out->text = std::move(row.text);
    out->prompt.clear();
    return ok_status();
}

Status SqliteSecretStore::sweep_expired(u64* removed) noexcept {
    if (!removed) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    if (!db_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }

    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement st(db_, kSweepSQL);
    if (!is_ok(st.prepared())) {
        return st.prepared();
    }
    st.bind_i64(1, clock_.now_ms());
    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        return status_from_sqlite(rc);
    }
    *removed = static_cast<u64>(db_.changes());
    return ok_status();
}

Status SqliteSecretStore::count(u64* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    if (!db_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }
    const Timestamp now = clock_.now_ms();
    std::lock_guard<std::mutex> lock(db_.mutex());
    return count_query(db_, kCountLiveSQL, &now, out);
}

Status SqliteSecretStore::stored_rows(u64* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    if (!db_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }
    std::lock_guard<std::mutex> lock(db_.mutex());
    return count_query(db_, kCountAllSQL, nullptr, out);
}

} // namespace snap::store
