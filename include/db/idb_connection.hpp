#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <variant>

namespace snapredact {

/**
 * @brief Bound statement parameter (NULL, INTEGER or TEXT)
 */
using SqlParam = std::variant<std::monostate, int64_t, std::string>;

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied out of native statement handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;
    std::vector<std::vector<bool>> null_mask;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;

    static DbResultSet failure(std::string message) {
        DbResultSet r;
        r.error_message = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_null(size_t row, size_t col) const {
        return row < null_mask.size() && col < null_mask[row].size() && null_mask[row][col];
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (sqlite3*).
 * Implementations are not thread-safe; one caller owns a connection at a time.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a single SQL statement
     * @param sql SQL text, with '?' placeholders
     * @param params Values bound to the placeholders, in order
     * @return Result set with rows or affected count
     */
    [[nodiscard]] virtual DbResultSet execute(
        const std::string& sql,
        const std::vector<SqlParam>& params = {}) = 0;

    /**
     * @brief Check if connection is in a valid state (open)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace snapredact
