#pragma once

#include "db/idb_connection.hpp"
#include <string>

namespace snapredact {

/**
 * @brief RAII exclusive transaction on a snapshot connection
 *
 * begin() issues BEGIN IMMEDIATE. commit() issues COMMIT. If the guard is
 * destroyed while still open (error path, early return), it issues ROLLBACK,
 * so no partial write survives a failed operation.
 *
 * Move-only.
 */
class SnapshotTransaction {
public:
    explicit SnapshotTransaction(IDbConnection& conn);
    ~SnapshotTransaction();

    SnapshotTransaction(SnapshotTransaction&& other) noexcept;
    SnapshotTransaction& operator=(SnapshotTransaction&&) = delete;
    SnapshotTransaction(const SnapshotTransaction&) = delete;
    SnapshotTransaction& operator=(const SnapshotTransaction&) = delete;

    /**
     * @brief Start the transaction
     * @return empty string on success, storage error text otherwise
     */
    [[nodiscard]] std::string begin();

    /**
     * @brief Commit; on failure the transaction is rolled back
     * @return empty string on success, storage error text otherwise
     */
    [[nodiscard]] std::string commit();

    void rollback() noexcept;

    [[nodiscard]] bool is_open() const { return open_; }

private:
    IDbConnection* conn_;
    bool open_ = false;
};

} // namespace snapredact
