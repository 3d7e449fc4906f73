#include "db/snapshot_tables.hpp"

#include <array>
#include <charconv>
#include <format>
#include <string>

namespace snapredact::db {

namespace {

constexpr std::array<std::string_view, 7> kKnownTables = {
    kProjects, kAgents, kMessages, kMessageRecipients,
    kFileReservations, kAgentLinks, kProjectSiblingSuggestions,
};

bool is_known_table(std::string_view table) {
    for (const auto t : kKnownTables) {
        if (t == table) return true;
    }
    return false;
}

} // anonymous namespace

Result<int64_t> scalar_int(const DbResultSet& res, std::string_view what) {
    if (!res.success) {
        return Result<int64_t>::error(ErrorCategory::STORAGE_ERROR,
            std::format("{} failed: {}", what, res.error_message));
    }
    if (res.rows.empty() || res.rows[0].empty() || res.is_null(0, 0)) {
        return Result<int64_t>::ok(0);
    }

    const auto& cell = res.rows[0][0];
    int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
    if (ec != std::errc{}) {
        return Result<int64_t>::error(ErrorCategory::STORAGE_ERROR,
            std::format("{} returned non-integer value '{}'", what, cell));
    }
    return Result<int64_t>::ok(value);
}

Result<bool> table_exists(IDbConnection& conn, std::string_view name) {
    const auto res = conn.execute(
        "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = ?",
        {std::string(name)});
    auto count = scalar_int(res, "table_exists check");
    if (count.is_error()) {
        return Result<bool>::error(count.error_category(), count.error_message());
    }
    return Result<bool>::ok(count.value() > 0);
}

Result<int64_t> count_rows(IDbConnection& conn, std::string_view table) {
    if (!is_known_table(table)) {
        return Result<int64_t>::error(ErrorCategory::STORAGE_ERROR,
            std::format("unsupported table for COUNT(*): {}", table));
    }
    const auto res = conn.execute(std::format("SELECT COUNT(*) FROM {}", table));
    return scalar_int(res, std::format("COUNT(*) from {}", table));
}

Result<int64_t> count_rows_if_exists(IDbConnection& conn, std::string_view table) {
    auto exists = table_exists(conn, table);
    if (exists.is_error()) {
        return Result<int64_t>::error(exists.error_category(), exists.error_message());
    }
    if (!exists.value()) return Result<int64_t>::ok(0);
    return count_rows(conn, table);
}

Result<RemainingCounts> count_remaining(IDbConnection& conn) {
    RemainingCounts counts;

    struct Slot {
        std::string_view table;
        int64_t* out;
        bool optional;
    };
    const std::array<Slot, 7> slots = {{
        {kProjects, &counts.projects, false},
        {kAgents, &counts.agents, false},
        {kMessages, &counts.messages, false},
        {kMessageRecipients, &counts.recipients, false},
        {kFileReservations, &counts.file_reservations, false},
        {kAgentLinks, &counts.agent_links, true},
        {kProjectSiblingSuggestions, &counts.project_sibling_suggestions, true},
    }};

    for (const auto& slot : slots) {
        auto n = slot.optional ? count_rows_if_exists(conn, slot.table)
                               : count_rows(conn, slot.table);
        if (n.is_error()) {
            return Result<RemainingCounts>::error(n.error_category(), n.error_message());
        }
        *slot.out = n.value();
    }
    return Result<RemainingCounts>::ok(counts);
}

} // namespace snapredact::db
