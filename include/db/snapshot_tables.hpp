#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"

#include <cstdint>
#include <string_view>

namespace snapredact::db {

inline constexpr std::string_view kProjects                  = "projects";
inline constexpr std::string_view kAgents                    = "agents";
inline constexpr std::string_view kMessages                  = "messages";
inline constexpr std::string_view kMessageRecipients         = "message_recipients";
inline constexpr std::string_view kFileReservations          = "file_reservations";
inline constexpr std::string_view kAgentLinks                = "agent_links";
inline constexpr std::string_view kProjectSiblingSuggestions = "project_sibling_suggestions";

/**
 * @brief Row counts per snapshot table
 */
struct RemainingCounts {
    int64_t projects = 0;
    int64_t agents = 0;
    int64_t messages = 0;
    int64_t recipients = 0;
    int64_t file_reservations = 0;
    int64_t agent_links = 0;
    int64_t project_sibling_suggestions = 0;

    bool operator==(const RemainingCounts&) const = default;
};

/**
 * @brief Check sqlite_master for a table
 */
[[nodiscard]] Result<bool> table_exists(IDbConnection& conn, std::string_view name);

/**
 * @brief COUNT(*) of one of the snapshot tables above
 *
 * Table names cannot be bound; anything outside the allow-list is refused
 * with STORAGE_ERROR.
 */
[[nodiscard]] Result<int64_t> count_rows(IDbConnection& conn, std::string_view table);

/**
 * @brief count_rows(), treating a missing table as empty
 */
[[nodiscard]] Result<int64_t> count_rows_if_exists(IDbConnection& conn, std::string_view table);

/**
 * @brief Row counts of all seven snapshot tables
 *
 * agent_links and project_sibling_suggestions are optional.
 */
[[nodiscard]] Result<RemainingCounts> count_remaining(IDbConnection& conn);

/**
 * @brief Parse the first cell of a single-row integer query
 */
[[nodiscard]] Result<int64_t> scalar_int(const DbResultSet& res, std::string_view what);

} // namespace snapredact::db
