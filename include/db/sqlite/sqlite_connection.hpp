#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace snapredact {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* and provides a database-agnostic interface.
 * All sqlite3 calls are encapsulated here.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open sqlite3* (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql,
                        const std::vector<SqlParam>& params = {}) override;
    bool is_connected() const override;
    void close() override;

private:
    /**
     * @brief Bind params to '?' placeholders (1-based)
     * @return empty string on success, error text otherwise
     */
    std::string bind_params(sqlite3_stmt* stmt, const std::vector<SqlParam>& params);

    sqlite3* db_;
};

/**
 * @brief SQLite connection factory
 *
 * Opens an existing snapshot file read-write (":memory:" is created).
 * Foreign-key enforcement is switched on for every connection.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace snapredact
