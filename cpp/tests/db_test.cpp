#include <gtest/gtest.h>
#include <sqlite3.h>

#include "snap/db/db.hpp"
#include "test_support.hpp"

using namespace snap::db;
using namespace snap::core;

namespace {

i64 scalar(Database& db, const char* sql) {
    Statement st(db, sql);
    EXPECT_TRUE(is_ok(st.prepared()));
    EXPECT_EQ(st.step(), SQLITE_ROW);
    return st.column_i64(0);
}

} // namespace

//=============================================================================
// Database Lifecycle Tests
//=============================================================================

TEST(Database, OpenCloseInMemory) {
    Database db;
    ASSERT_TRUE(is_ok(db.open(DbConfig{})));
    EXPECT_TRUE(db.is_open());
    EXPECT_EQ(db.path(), ":memory:");

    db.close();
    EXPECT_FALSE(db.is_open());
}

TEST(Database, OpenTwiceIsInvalid) {
    Database db;
    ASSERT_TRUE(is_ok(db.open(DbConfig{})));
    const Status s = db.open(DbConfig{});
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Db);
}

TEST(Database, UnknownJournalModeIsInvalid) {
    DbConfig cfg{};
    cfg.journal_mode = "YOLO";
    Database db;
    EXPECT_EQ(db.open(cfg).code, StatusCode::Invalid);
    EXPECT_FALSE(db.is_open());
}

TEST(Database, SchemaAndPragmas) {
    snap::test::TempDbPath tmp("snap_db");
    Database db;
    ASSERT_TRUE(is_ok(db.open(tmp.config())));

    EXPECT_EQ(scalar(db, "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name='secrets'"), 1);
    EXPECT_EQ(scalar(db, "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name='queue_messages'"), 1);
    EXPECT_EQ(scalar(db, "PRAGMA secure_delete"), 1);

    Statement st(db, "PRAGMA journal_mode");
    ASSERT_EQ(st.step(), SQLITE_ROW);
    EXPECT_EQ(st.column_text(0), "wal");
}

TEST(Database, ReopenKeepsData) {
    snap::test::TempDbPath tmp("snap_db");
    {
        Database db;
        ASSERT_TRUE(is_ok(db.open(tmp.config())));
        ASSERT_TRUE(is_ok(db.exec("INSERT INTO queue_messages (queue, body, enqueued_at, visible_at) "
                                  "VALUES ('q', x'01', 1, 1)")));
    }
    Database db;
    ASSERT_TRUE(is_ok(db.open(tmp.config())));
    EXPECT_EQ(scalar(db, "SELECT COUNT(*) FROM queue_messages"), 1);
}

TEST(Database, ExecReportsErrors) {
    Database db;
    EXPECT_EQ(db.exec("SELECT 1").code, StatusCode::Invalid); // not open
    ASSERT_TRUE(is_ok(db.open(DbConfig{})));
    EXPECT_FALSE(is_ok(db.exec("SELEKT nonsense")));
}

//=============================================================================
// Statement Tests
//=============================================================================

TEST(Statement, BindAndReadColumns) {
    Database db;
    ASSERT_TRUE(is_ok(db.open(DbConfig{})));
    ASSERT_TRUE(is_ok(db.exec("CREATE TABLE t (a INTEGER, b TEXT, c BLOB, d TEXT)")));

    const u8 blob[4] = {1, 2, 3, 4};
    {
        Statement st(db, "INSERT INTO t VALUES (?, ?, ?, ?)");
        ASSERT_TRUE(is_ok(st.prepared()));
        st.bind_i64(1, -42);
        st.bind_text(2, "hello");
        st.bind_blob(3, blob, sizeof(blob));
        st.bind_null(4);
        EXPECT_EQ(st.step(), SQLITE_DONE);
    }
    EXPECT_EQ(db.changes(), 1);

    Statement st(db, "SELECT a, b, c, d FROM t");
    ASSERT_EQ(st.step(), SQLITE_ROW);
    EXPECT_EQ(st.column_i64(0), -42);
    EXPECT_EQ(st.column_text(1), "hello");

    u8 out[4]{};
    EXPECT_TRUE(st.column_blob(2, out, sizeof(out)));
    EXPECT_EQ(out[3], 4);
    u8 wrong[8]{};
    EXPECT_FALSE(st.column_blob(2, wrong, sizeof(wrong)));
    EXPECT_EQ(st.column_bytes(2).size(), 4u);

    EXPECT_TRUE(st.column_is_null(3));
    EXPECT_EQ(st.step(), SQLITE_DONE);
}

TEST(Statement, PrepareFailureIsReported) {
    Database db;
    ASSERT_TRUE(is_ok(db.open(DbConfig{})));
    Statement st(db, "SELECT * FROM no_such_table");
    EXPECT_FALSE(is_ok(st.prepared()));
    EXPECT_EQ(st.step(), SQLITE_MISUSE);
}

TEST(Statement, ClosedDatabase) {
    Database db;
    Statement st(db, "SELECT 1");
    EXPECT_EQ(st.prepared().code, StatusCode::Invalid);
}

//=============================================================================
// Transaction Tests
//=============================================================================

TEST(ImmediateTxn, RollsBackWithoutCommit) {
    Database db;
    ASSERT_TRUE(is_ok(db.open(DbConfig{})));
    {
        ImmediateTxn txn(db);
        ASSERT_TRUE(is_ok(txn.begun()));
        ASSERT_TRUE(is_ok(db.exec("INSERT INTO queue_messages (queue, body, enqueued_at, visible_at) "
                                  "VALUES ('q', x'01', 1, 1)")));
    }
    EXPECT_EQ(scalar(db, "SELECT COUNT(*) FROM queue_messages"), 0);
}

TEST(ImmediateTxn, CommitPersists) {
    Database db;
    ASSERT_TRUE(is_ok(db.open(DbConfig{})));
    {
        ImmediateTxn txn(db);
        ASSERT_TRUE(is_ok(txn.begun()));
        ASSERT_TRUE(is_ok(db.exec("INSERT INTO queue_messages (queue, body, enqueued_at, visible_at) "
                                  "VALUES ('q', x'01', 1, 1)")));
        EXPECT_TRUE(is_ok(txn.commit()));
        EXPECT_EQ(txn.commit().code, StatusCode::Invalid); // already committed
    }
    EXPECT_EQ(scalar(db, "SELECT COUNT(*) FROM queue_messages"), 1);
}

TEST(ImmediateTxn, SecondWriterWaitsThenFailsBusy) {
    snap::test::TempDbPath tmp("snap_db");
    DbConfig cfg = tmp.config();
    cfg.busy_timeout_ms = 50;

    Database a;
    Database b;
    ASSERT_TRUE(is_ok(a.open(cfg)));
    ASSERT_TRUE(is_ok(b.open(cfg)));

    ImmediateTxn held(a);
    ASSERT_TRUE(is_ok(held.begun()));

    ImmediateTxn blocked(b);
    EXPECT_EQ(blocked.begun().code, StatusCode::Busy);
}

//=============================================================================
// Status mapping
//=============================================================================

TEST(StatusFromSqlite, Mapping) {
    EXPECT_TRUE(is_ok(status_from_sqlite(SQLITE_OK)));
    EXPECT_TRUE(is_ok(status_from_sqlite(SQLITE_DONE)));
    EXPECT_EQ(status_from_sqlite(SQLITE_BUSY).code, StatusCode::Busy);
    EXPECT_EQ(status_from_sqlite(SQLITE_CONSTRAINT_PRIMARYKEY).code, StatusCode::Conflict);
    EXPECT_EQ(status_from_sqlite(SQLITE_CONSTRAINT_PRIMARYKEY).aux,
              static_cast<u32>(SQLITE_CONSTRAINT_PRIMARYKEY));
    EXPECT_EQ(status_from_sqlite(SQLITE_CORRUPT).code, StatusCode::Corrupt);
    EXPECT_EQ(status_from_sqlite(SQLITE_IOERR).code, StatusCode::Io);
    EXPECT_EQ(status_from_sqlite(SQLITE_ERROR).code, StatusCode::Unknown);
    EXPECT_EQ(status_from_sqlite(SQLITE_ERROR).domain, StatusDomain::Db);
}
