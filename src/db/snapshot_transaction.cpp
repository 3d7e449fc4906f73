#include "db/snapshot_transaction.hpp"
#include "core/utils.hpp"

#include <format>

namespace snapredact {

SnapshotTransaction::SnapshotTransaction(IDbConnection& conn)
    : conn_(&conn) {}

SnapshotTransaction::~SnapshotTransaction() {
    rollback();
}

SnapshotTransaction::SnapshotTransaction(SnapshotTransaction&& other) noexcept
    : conn_(other.conn_), open_(other.open_) {
    other.open_ = false;
}

std::string SnapshotTransaction::begin() {
    if (open_) return "transaction already open";

    const auto res = conn_->execute("BEGIN IMMEDIATE");
    if (!res.success) {
        return std::format("BEGIN transaction failed: {}", res.error_message);
    }
    open_ = true;
    return {};
}

std::string SnapshotTransaction::commit() {
    if (!open_) return "no open transaction";

    const auto res = conn_->execute("COMMIT");
    if (!res.success) {
        rollback();
        return std::format("COMMIT failed: {}", res.error_message);
    }
    open_ = false;
    return {};
}

void SnapshotTransaction::rollback() noexcept {
    if (!open_) return;
    open_ = false;
    try {
        const auto res = conn_->execute("ROLLBACK");
        if (!res.success) {
            utils::log::error(std::format("ROLLBACK failed: {}", res.error_message));
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("ROLLBACK threw: {}", e.what()));
    }
}

} // namespace snapredact
