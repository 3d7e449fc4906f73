#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include "db/snapshot_tables.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace snapredact {

struct ProjectRecord {
    int64_t id = 0;
    std::string slug;
    std::string human_key;
};

/**
 * @brief Outcome of restricting a snapshot to a set of projects
 */
struct ProjectScopeResult {
    std::vector<std::string> identifiers;   // As requested
    std::vector<ProjectRecord> projects;    // Kept, in identifier order
    size_t removed_count = 0;               // Distinct projects deleted
    db::RemainingCounts remaining;          // Row counts after the call
};

/**
 * @brief Project scope filter
 *
 * Keeps the projects named by slug or human_key (trimmed, case-insensitive)
 * and deletes every row belonging to the others, children before parents:
 *
 *   agent_links -> project_sibling_suggestions -> message_recipients
 *     -> messages -> file_reservations -> agents -> projects
 *
 * The two link tables are optional. The whole plan runs in one exclusive
 * transaction; any failure rolls it back.
 *
 * Errors:
 *   EMPTY_SNAPSHOT        snapshot has no projects
 *   UNKNOWN_IDENTIFIER    an identifier matches no project
 *   NO_MATCHING_PROJECTS  every identifier was blank
 *   STORAGE_ERROR         any SQL failure
 */
class ProjectScopeFilter {
public:
    /**
     * @param identifiers Slugs or human keys; empty keeps everything
     */
    [[nodiscard]] static Result<ProjectScopeResult> apply(
        IDbConnection& conn,
        const std::vector<std::string>& identifiers);
};

} // namespace snapredact
