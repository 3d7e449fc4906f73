#include "scope/project_scope.hpp"
#include "core/utils.hpp"
#include "db/snapshot_transaction.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>
#include <unordered_set>

namespace snapredact {

namespace {

Result<std::vector<ProjectRecord>> load_projects(IDbConnection& conn) {
    const auto res = conn.execute("SELECT id, slug, human_key FROM projects ORDER BY id");
    if (!res.success) {
        return Result<std::vector<ProjectRecord>>::error(ErrorCategory::STORAGE_ERROR,
            std::format("SELECT projects failed: {}", res.error_message));
    }

    std::vector<ProjectRecord> projects;
    projects.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        if (row.size() < 3) {
            return Result<std::vector<ProjectRecord>>::error(ErrorCategory::STORAGE_ERROR,
                "SELECT projects returned a short row");
        }
        ProjectRecord p;
        try {
            p.id = std::stoll(row[0]);
        } catch (const std::exception&) {
            return Result<std::vector<ProjectRecord>>::error(ErrorCategory::STORAGE_ERROR,
                std::format("projects.id is not an integer: '{}'", row[0]));
        }
        p.slug = row[1];
        p.human_key = row[2];
        projects.push_back(std::move(p));
    }
    return Result<std::vector<ProjectRecord>>::ok(std::move(projects));
}

Result<ProjectScopeResult> finish(IDbConnection& conn, ProjectScopeResult result) {
    auto remaining = db::count_remaining(conn);
    if (remaining.is_error()) {
        return Result<ProjectScopeResult>::error(remaining.error_category(),
                                                 remaining.error_message());
    }
    result.remaining = remaining.value();
    return Result<ProjectScopeResult>::ok(std::move(result));
}

/**
 * @brief One step of the ordered delete plan
 */
struct DeleteStep {
    std::string_view table;
    std::string sql;
    bool optional;
};

std::vector<DeleteStep> build_delete_plan(size_t kept) {
    const std::string p = utils::sql_placeholders(kept);
    return {
        {db::kAgentLinks,
         std::format("DELETE FROM agent_links "
                     "WHERE a_project_id NOT IN ({0}) OR b_project_id NOT IN ({0})", p),
         true},
        {db::kProjectSiblingSuggestions,
         std::format("DELETE FROM project_sibling_suggestions "
                     "WHERE project_a_id NOT IN ({0}) OR project_b_id NOT IN ({0})", p),
         true},
        {db::kMessageRecipients,
         std::format("DELETE FROM message_recipients WHERE message_id IN "
                     "(SELECT id FROM messages WHERE project_id NOT IN ({}))", p),
         false},
        {db::kMessages,
         std::format("DELETE FROM messages WHERE project_id NOT IN ({})", p),
         false},
        {db::kFileReservations,
         std::format("DELETE FROM file_reservations WHERE project_id NOT IN ({})", p),
         false},
        {db::kAgents,
         std::format("DELETE FROM agents WHERE project_id NOT IN ({})", p),
         false},
        {db::kProjects,
         std::format("DELETE FROM projects WHERE id NOT IN ({})", p),
         false},
    };
}

// Placeholder lists appear once or twice per statement
std::vector<SqlParam> bind_ids(const std::vector<int64_t>& ids, const std::string& sql) {
    const auto placeholders = static_cast<size_t>(std::count(sql.begin(), sql.end(), '?'));
    std::vector<SqlParam> params;
    params.reserve(placeholders);
    while (params.size() < placeholders) {
        for (const auto id : ids) params.emplace_back(id);
    }
    return params;
}

} // anonymous namespace

Result<ProjectScopeResult> ProjectScopeFilter::apply(
    IDbConnection& conn,
    const std::vector<std::string>& identifiers) {

    auto loaded = load_projects(conn);
    if (loaded.is_error()) {
        return Result<ProjectScopeResult>::error(loaded.error_category(), loaded.error_message());
    }
    const auto& all_projects = loaded.value();
    if (all_projects.empty()) {
        return Result<ProjectScopeResult>::error(ErrorCategory::EMPTY_SNAPSHOT,
            "Snapshot contains no projects");
    }

    ProjectScopeResult result;
    result.identifiers = identifiers;

    if (identifiers.empty()) {
        result.projects = all_projects;
        return finish(conn, std::move(result));
    }

    // slug and human_key share one lookup; first project wins on collision
    std::unordered_map<std::string, const ProjectRecord*> lookup;
    for (const auto& p : all_projects) {
        lookup.emplace(utils::to_lower(p.slug), &p);
        lookup.emplace(utils::to_lower(p.human_key), &p);
    }

    std::unordered_set<int64_t> selected;
    std::vector<int64_t> kept_ids;
    for (const auto& ident : identifiers) {
        const auto key = utils::to_lower(utils::trim(ident));
        if (key.empty()) continue;

        const auto it = lookup.find(key);
        if (it == lookup.end()) {
            return Result<ProjectScopeResult>::error(ErrorCategory::UNKNOWN_IDENTIFIER,
                std::format("Project identifier '{}' not found in snapshot", ident));
        }
        if (selected.insert(it->second->id).second) {
            result.projects.push_back(*it->second);
            kept_ids.push_back(it->second->id);
        }
    }

    if (kept_ids.empty()) {
        return Result<ProjectScopeResult>::error(ErrorCategory::NO_MATCHING_PROJECTS,
            "No project identifiers left after ignoring blank entries");
    }

    result.removed_count = all_projects.size() - kept_ids.size();
    if (result.removed_count == 0) {
        return finish(conn, std::move(result));
    }

    SnapshotTransaction txn(conn);
    if (auto err = txn.begin(); !err.empty()) {
        return Result<ProjectScopeResult>::error(ErrorCategory::STORAGE_ERROR, err);
    }

    for (const auto& step : build_delete_plan(kept_ids.size())) {
        if (step.optional) {
            auto exists = db::table_exists(conn, step.table);
            if (exists.is_error()) {
                return Result<ProjectScopeResult>::error(exists.error_category(),
                                                         exists.error_message());
            }
            if (!exists.value()) continue;
        }

        const auto res = conn.execute(step.sql, bind_ids(kept_ids, step.sql));
        if (!res.success) {
            utils::log::error(std::format("Scope delete on {} failed: {}",
                                          step.table, res.error_message));
            return Result<ProjectScopeResult>::error(ErrorCategory::STORAGE_ERROR,
                std::format("DELETE from {} failed: {}", step.table, res.error_message));
        }
        utils::log::debug(std::format("Scope removed {} rows from {}",
                                      res.affected_rows, step.table));
    }

    // Counted inside the transaction so the report matches what is committed
    auto scoped = finish(conn, std::move(result));
    if (scoped.is_error()) return scoped;

    if (auto err = txn.commit(); !err.empty()) {
        return Result<ProjectScopeResult>::error(ErrorCategory::STORAGE_ERROR, err);
    }

    utils::log::info(std::format("Scope kept {} project(s), removed {}",
                                 scoped.value().projects.size(),
                                 scoped.value().removed_count));
    return scoped;
}

} // namespace snapredact
