#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"

#include <sqlite3.h>

#include <format>
#include <type_traits>

namespace snapredact {

namespace {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

bool is_memory_path(const std::string& path) {
    return path == ":memory:" || path.starts_with("file::memory:");
}

} // anonymous namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::execute(const std::string& sql,
                                      const std::vector<SqlParam>& params) {
    if (!db_) {
        return DbResultSet::failure("Connection is null");
    }

    StmtGuard guard;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
        return DbResultSet::failure(std::format("prepare failed: {}", sqlite3_errmsg(db_)));
    }
    if (!guard.stmt) {
        // Whitespace or comment only
        DbResultSet empty;
        empty.success = true;
        return empty;
    }

    if (auto err = bind_params(guard.stmt, params); !err.empty()) {
        return DbResultSet::failure(std::move(err));
    }

    DbResultSet result;
    const int ncols = sqlite3_column_count(guard.stmt);
    result.has_rows = ncols > 0;
    for (int i = 0; i < ncols; ++i) {
        const char* name = sqlite3_column_name(guard.stmt, i);
        result.column_names.emplace_back(name ? name : "");
    }

    for (;;) {
        const int rc = sqlite3_step(guard.stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            return DbResultSet::failure(std::format("step failed: {}", sqlite3_errmsg(db_)));
        }

        std::vector<std::string> row;
        std::vector<bool> nulls;
        row.reserve(ncols);
        nulls.reserve(ncols);
        for (int j = 0; j < ncols; ++j) {
            if (sqlite3_column_type(guard.stmt, j) == SQLITE_NULL) {
                row.emplace_back();
                nulls.push_back(true);
                continue;
            }
            const auto* text = sqlite3_column_text(guard.stmt, j);
            const int len = sqlite3_column_bytes(guard.stmt, j);
            row.emplace_back(text ? reinterpret_cast<const char*>(text) : "",
                             static_cast<size_t>(len));
            nulls.push_back(false);
        }
        result.rows.push_back(std::move(row));
        result.null_mask.push_back(std::move(nulls));
    }

    if (!result.has_rows) {
        result.affected_rows = static_cast<uint64_t>(sqlite3_changes(db_));
    }
    result.success = true;
    return result;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::string SqliteConnection::bind_params(sqlite3_stmt* stmt,
                                          const std::vector<SqlParam>& params) {
    const int expected = sqlite3_bind_parameter_count(stmt);
    if (expected != static_cast<int>(params.size())) {
        return std::format("parameter count mismatch: statement expects {}, got {}",
                           expected, params.size());
    }

    for (size_t i = 0; i < params.size(); ++i) {
        const int idx = static_cast<int>(i) + 1;
        const int rc = std::visit([&](const auto& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return sqlite3_bind_null(stmt, idx);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(v));
            } else {
                return sqlite3_bind_text(stmt, idx, v.data(),
                                         static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }, params[i]);

        if (rc != SQLITE_OK) {
            return std::format("bind of parameter {} failed: {}", idx, sqlite3_errmsg(db_));
        }
    }
    return {};
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> SqliteConnectionFactory::create(
    const std::string& connection_string) {

    int flags = SQLITE_OPEN_READWRITE;
    if (is_memory_path(connection_string)) {
        flags |= SQLITE_OPEN_CREATE | SQLITE_OPEN_URI;
    }

    sqlite3* db = nullptr;
    if (sqlite3_open_v2(connection_string.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        const std::string err = db ? sqlite3_errmsg(db) : "out of memory";
        utils::log::error(std::format("Failed to open snapshot {}: {}", connection_string, err));
        if (db) sqlite3_close(db);
        return nullptr;
    }

    auto conn = std::make_unique<SqliteConnection>(db);
    const auto fk = conn->execute("PRAGMA foreign_keys = ON");
    if (!fk.success) {
        utils::log::error(std::format("PRAGMA foreign_keys failed on {}: {}",
                                      connection_string, fk.error_message));
        return nullptr;
    }
    return conn;
}

} // namespace snapredact
