#include "snap/ingest/sqlite_queue.hpp"
#include "snap/core/log.hpp"
#include "snap/security/id.hpp"

#include <sqlite3.h>

#include <cstring>
#include <mutex>
#include <utility>

namespace snap::ingest {

using namespace snap::core;
using snap::db::ImmediateTxn;
using snap::db::Statement;
using snap::db::status_from_sqlite;

namespace {
    constexpr const char* kEnqueueSQL =
        "INSERT INTO queue_messages (queue, body, enqueued_at, visible_at, dequeue_count, receipt) "
        "VALUES (?, ?, ?, ?, 0, 0)";

    constexpr const char* kPeekSQL =
        "SELECT id, body, dequeue_count, enqueued_at FROM queue_messages "
        "WHERE queue = ? AND visible_at <= ? ORDER BY visible_at, id LIMIT 1";

    constexpr const char* kLeaseSQL =
        "UPDATE queue_messages SET visible_at = ?, dequeue_count = dequeue_count + 1, receipt = ? "
        "WHERE id = ?";

    constexpr const char* kAckSQL = "DELETE FROM queue_messages WHERE id = ? AND queue = ? AND receipt = ?";

    constexpr const char* kReleaseSQL =
        "UPDATE queue_messages SET visible_at = ?, receipt = 0 WHERE id = ? AND queue = ? AND receipt = ?";

    constexpr const char* kDeadLetterSQL =
        "UPDATE queue_messages SET queue = ?, visible_at = ?, receipt = 0 "
        "WHERE id = ? AND queue = ? AND receipt = ?";

    constexpr const char* kDepthSQL = "SELECT COUNT(*) FROM queue_messages WHERE queue = ?";

    // Receipts live in a signed column; only the bit pattern matters.
    [[nodiscard]] i64 receipt_to_column(u64 r) noexcept {
        i64 v = 0;
        std::memcpy(&v, &r, sizeof(v));
        return v;
    }

    [[nodiscard]] Status stale_receipt_status() noexcept {
        return make_status(StatusDomain::Ingest, StatusCode::Conflict);
    }
}

SqliteMessageQueue::SqliteMessageQueue(std::string name, const Clock& clock)
    : name_(std::move(name)), poison_name_(name_ + "-poison"), clock_(clock) {}

Status SqliteMessageQueue::open(const snap::db::DbConfig& cfg) noexcept {
    return db_.open(cfg);
}

void SqliteMessageQueue::close() noexcept {
    db_.close();
}

Status SqliteMessageQueue::enqueue(const std::vector<u8>& body) noexcept {
    if (body.empty()) {
        return make_status(StatusDomain::Ingest, StatusCode::Invalid);
    }
    if (!db_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }
    const Timestamp now = clock_.now_ms();

    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement st(db_, kEnqueueSQL);
    if (!is_ok(st.prepared())) {
        return st.prepared();
    }
    st.bind_text(1, name_);
    st.bind_blob(2, body.data(), static_cast<int>(body.size()));
    st.bind_i64(3, now);
    st.bind_i64(4, now);
    const int rc = st.step();
    return rc == SQLITE_DONE ? ok_status() : status_from_sqlite(rc);
}

Status SqliteMessageQueue::receive(DurationMs visibility_timeout, QueueMessage* out) noexcept {
    if (!out || visibility_timeout < 0) {
        return make_status(StatusDomain::Ingest, StatusCode::Invalid);
    }
    if (!db_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }

    u64 receipt = 0;
    Status s = security::random_u64(&receipt);
    if (!is_ok(s)) {
        return s;
    }
    if (receipt == 0) {
        receipt = 1; // 0 marks "not leased"
    }

    const Timestamp now = clock_.now_ms();

    std::lock_guard<std::mutex> lock(db_.mutex());
    ImmediateTxn txn(db_);
    if (!is_ok(txn.begun())) {
        return txn.begun();
    }

    QueueMessage msg;
    {
        Statement st(db_, kPeekSQL);
        if (!is_ok(st.prepared())) {
            return st.prepared();
        }
        st.bind_text(1, name_);
        st.bind_i64(2, now);
        const int rc = st.step();
        if (rc == SQLITE_DONE) {
            return queue_empty_status();
        }
        if (rc != SQLITE_ROW) {
            return status_from_sqlite(rc);
        }
        msg.id = st.column_i64(0);
        msg.body = st.column_bytes(1);
        msg.dequeue_count = static_cast<u32>(st.column_i64(2)) + 1;
        msg.enqueued_at = st.column_i64(3);
    }

    {
        Statement st(db_, kLeaseSQL);
        if (!is_ok(st.prepared())) {
            return st.prepared();
        }
        st.bind_i64(1, now + visibility_timeout);
        st.bind_i64(2, receipt_to_column(receipt));
        st.bind_i64(3, msg.id);
        const int rc = st.step();
        if (rc != SQLITE_DONE) {
            return status_from_sqlite(rc);
        }
    }

    s = txn.commit();
    if (!is_ok(s)) {
        return s;
    }

    msg.receipt = receipt;
    *out = std::move(msg);
    return ok_status();
}

Status SqliteMessageQueue::ack(const QueueMessage& msg) noexcept {
    if (!db_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }
    if (msg.receipt == 0) {
        return stale_receipt_status();
    }

    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement st(db_, kAckSQL);
    if (!is_ok(st.prepared())) {
        return st.prepared();
    }
    st.bind_i64(1, msg.id);
    st.bind_text(2, name_);
    st.bind_i64(3, receipt_to_column(msg.receipt));
    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        return status_from_sqlite(rc);
    }
    return db_.changes() == 1 ? ok_status() : stale_receipt_status();
}

Status SqliteMessageQueue::release(const QueueMessage& msg) noexcept {
    if (!db_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }
    if (msg.receipt == 0) {
        return stale_receipt_status();
    }
    const Timestamp now = clock_.now_ms();

    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement st(db_, kReleaseSQL);
    if (!is_ok(st.prepared())) {
        return st.prepared();
    }
    st.bind_i64(1, now);
    st.bind_i64(2, msg.id);
    st.bind_text(3, name_);
    st.bind_i64(4, receipt_to_column(msg.receipt));
    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        return status_from_sqlite(rc);
    }
    return db_.changes() == 1 ? ok_status() : stale_receipt_status();
}

Status SqliteMessageQueue::dead_letter(const QueueMessage& msg) noexcept {
    if (!db_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }
    if (msg.receipt == 0) {
        return stale_receipt_status();
    }
    const Timestamp now = clock_.now_ms();

    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement st(db_, kDeadLetterSQL);
    if (!is_ok(st.prepared())) {
        return st.prepared();
    }
    st.bind_text(1, poison_name_);
    st.bind_i64(2, now);
    st.bind_i64(3, msg.id);
    st.bind_text(4, name_);
    st.bind_i64(5, receipt_to_column(msg.receipt));
    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        return status_from_sqlite(rc);
    }
    if (db_.changes() != 1) {
        return stale_receipt_status();
    }
    LogRegistry::ingest()->warn("[SqliteMessageQueue] Message {} moved to {} after {} deliveries",
                                msg.id, poison_name_, msg.dequeue_count);
    return ok_status();
}

Status SqliteMessageQueue::depth(u64* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Ingest, StatusCode::Invalid);
    }
    if (!db_.is_open()) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }

    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement st(db_, kDepthSQL);
    if (!is_ok(st.prepared())) {
        return st.prepared();
    }
    st.bind_text(1, name_);
    const int rc = st.step();
    if (rc != SQLITE_ROW) {
        return status_from_sqlite(rc == SQLITE_DONE ? SQLITE_ERROR : rc);
    }
    *out = static_cast<u64>(st.column_i64(0));
    return ok_status();
}

} // namespace snap::ingest
