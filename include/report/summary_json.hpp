#pragma once

#include "core/json.hpp"
#include "db/snapshot_tables.hpp"
#include "scope/project_scope.hpp"
#include "scrub/redaction_audit.hpp"
#include "scrub/snapshot_scrubber.hpp"

#include <string>

namespace snapredact::report {

// Structured forms; keys are the snake_case field names
[[nodiscard]] JsonValue to_json(const ScrubSummary& summary);
[[nodiscard]] JsonValue to_json(const db::RemainingCounts& counts);
[[nodiscard]] JsonValue to_json(const ProjectScopeResult& result);
[[nodiscard]] JsonValue to_json(const RedactionAuditLog& log);

/**
 * @brief Canonical (sorted-key, compact) JSON text for any of the above
 */
template <typename T>
[[nodiscard]] std::string to_json_string(const T& value) {
    return to_json(value).dump();
}

/**
 * @brief {"error": category, "message": text} line for CLI failures
 */
[[nodiscard]] std::string error_json(ErrorCategory category, const std::string& message);

} // namespace snapredact::report
