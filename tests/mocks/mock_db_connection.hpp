#pragma once

#include "db/idb_connection.hpp"

#include <cstdint>
#include <string>

namespace snapredact::testing {

/**
 * @brief Decorator that fails statements containing a given fragment
 *
 * Everything else (including BEGIN/COMMIT/ROLLBACK) reaches the wrapped
 * connection, so rollback behaviour can be checked against real data.
 */
class FailingConnection : public IDbConnection {
public:
    FailingConnection(IDbConnection& inner, std::string fail_on)
        : inner_(inner), fail_on_(std::move(fail_on)) {}

    [[nodiscard]] DbResultSet execute(
        const std::string& sql, const std::vector<SqlParam>& params = {}) override {
        if (sql.find(fail_on_) != std::string::npos) {
            ++failures_;
            return DbResultSet::failure("Mock failure: " + fail_on_);
        }
        return inner_.execute(sql, params);
    }

    [[nodiscard]] bool is_connected() const override { return inner_.is_connected(); }
    void close() override {}

    [[nodiscard]] uint64_t failures() const { return failures_; }

private:
    IDbConnection& inner_;
    std::string fail_on_;
    uint64_t failures_ = 0;
};

} // namespace snapredact::testing
