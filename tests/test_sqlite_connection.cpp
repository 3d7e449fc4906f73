#include <catch2/catch_test_macros.hpp>
#include "db/snapshot_transaction.hpp"
#include "fixtures/snapshot_fixture.hpp"

using namespace snapredact;
using namespace snapredact::testing;

// ============================================================================
// SqliteConnection
// ============================================================================

TEST_CASE("SQLite connection binds parameters and reports NULLs", "[sqlite]") {
    auto conn = open_memory_snapshot();
    exec(*conn, "CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT, note TEXT)");
    exec(*conn, "INSERT INTO t (id, name, note) VALUES (?, ?, ?)",
         {int64_t{7}, std::string("it's \"quoted\""), std::monostate{}});

    const auto res = conn->execute("SELECT id, name, note FROM t WHERE id = ?", {int64_t{7}});
    REQUIRE(res.success);
    REQUIRE(res.has_rows);
    REQUIRE(res.rows.size() == 1);
    CHECK(res.column_names == std::vector<std::string>{"id", "name", "note"});
    CHECK(res.rows[0][0] == "7");
    CHECK(res.rows[0][1] == "it's \"quoted\"");
    CHECK_FALSE(res.is_null(0, 1));
    CHECK(res.is_null(0, 2));
}

TEST_CASE("SQLite connection reports affected rows for DML", "[sqlite]") {
    auto conn = open_memory_snapshot();
    exec(*conn, "CREATE TABLE t (v INTEGER)");
    exec(*conn, "INSERT INTO t VALUES (1), (2), (3)");

    const auto res = conn->execute("UPDATE t SET v = 0 WHERE v > ?", {int64_t{1}});
    REQUIRE(res.success);
    CHECK_FALSE(res.has_rows);
    CHECK(res.affected_rows == 2);
}

TEST_CASE("SQLite connection surfaces errors as failed result sets", "[sqlite]") {
    auto conn = open_memory_snapshot();

    SECTION("bad SQL") {
        const auto res = conn->execute("SELEC 1");
        CHECK_FALSE(res.success);
        CHECK_FALSE(res.error_message.empty());
    }
    SECTION("parameter count mismatch") {
        const auto res = conn->execute("SELECT ?", {});
        CHECK_FALSE(res.success);
        CHECK(res.error_message.find("parameter count") != std::string::npos);
    }
    SECTION("closed connection") {
        conn->close();
        CHECK_FALSE(conn->is_connected());
        CHECK_FALSE(conn->execute("SELECT 1").success);
    }
}

TEST_CASE("SQLite factory enforces foreign keys", "[sqlite]") {
    auto conn = open_memory_snapshot();
    CHECK(query_int(*conn, "PRAGMA foreign_keys") == 1);

    create_schema(*conn);
    const auto res = conn->execute(
        "INSERT INTO agents (project_id, name) VALUES (99, 'Orphan')");
    CHECK_FALSE(res.success);
}

TEST_CASE("SQLite factory refuses a missing snapshot file", "[sqlite]") {
    SqliteConnectionFactory factory;
    CHECK(factory.create("/nonexistent/dir/snapshot.sqlite3") == nullptr);
}

// ============================================================================
// SnapshotTransaction
// ============================================================================

TEST_CASE("Snapshot transaction commits", "[sqlite][transaction]") {
    auto conn = open_memory_snapshot();
    exec(*conn, "CREATE TABLE t (v INTEGER)");

    SnapshotTransaction txn(*conn);
    REQUIRE(txn.begin().empty());
    CHECK(txn.is_open());
    exec(*conn, "INSERT INTO t VALUES (1)");
    REQUIRE(txn.commit().empty());
    CHECK_FALSE(txn.is_open());

    CHECK(query_int(*conn, "SELECT COUNT(*) FROM t") == 1);
}

TEST_CASE("Snapshot transaction rolls back when dropped open", "[sqlite][transaction]") {
    auto conn = open_memory_snapshot();
    exec(*conn, "CREATE TABLE t (v INTEGER)");

    {
        SnapshotTransaction txn(*conn);
        REQUIRE(txn.begin().empty());
        exec(*conn, "INSERT INTO t VALUES (1)");
    }
    CHECK(query_int(*conn, "SELECT COUNT(*) FROM t") == 0);

    SnapshotTransaction txn(*conn);
    CHECK_FALSE(txn.commit().empty());  // never begun
    REQUIRE(txn.begin().empty());
    CHECK_FALSE(txn.begin().empty());   // already open
}

TEST_CASE("Moved-from snapshot transaction does not roll back", "[sqlite][transaction]") {
    auto conn = open_memory_snapshot();
    exec(*conn, "CREATE TABLE t (v INTEGER)");

    SnapshotTransaction outer(*conn);
    REQUIRE(outer.begin().empty());
    exec(*conn, "INSERT INTO t VALUES (1)");
    {
        SnapshotTransaction moved(std::move(outer));
        CHECK_FALSE(outer.is_open());
        REQUIRE(moved.commit().empty());
    }
    CHECK(query_int(*conn, "SELECT COUNT(*) FROM t") == 1);
}
