#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "db/idb_connection.hpp"
#include "scrub/redaction_audit.hpp"
#include "scrub/scrub_preset.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace snapredact {

/**
 * @brief What one scrub pass changed
 *
 * Every counter reflects rows actually mutated, never rows examined.
 */
struct ScrubSummary {
    std::string preset;
    std::string pseudonym_salt;
    int64_t agents_total = 0;
    int64_t agents_pseudonymized = 0;
    int64_t ack_flags_cleared = 0;
    int64_t recipients_cleared = 0;
    int64_t file_reservations_removed = 0;
    int64_t agent_links_removed = 0;
    int64_t secrets_replaced = 0;
    int64_t attachments_sanitized = 0;
    int64_t bodies_redacted = 0;
    int64_t attachments_cleared = 0;
};

/**
 * @brief Decoded attachments column
 */
struct DecodedAttachments {
    JsonValue list = JsonValue::array();
    bool malformed = false;
};

/**
 * @brief Decode a messages.attachments value
 *
 * Empty text is an empty list. A JSON array is taken as-is; a JSON string
 * holding an array is decoded once more. Anything else is an empty list
 * with malformed set.
 */
[[nodiscard]] DecodedAttachments decode_attachments(std::string_view text);

/**
 * @brief Applies a scrub preset to a snapshot database in place
 *
 * All mutations happen in one exclusive transaction; on any storage error
 * the transaction is rolled back and nothing persists.
 */
class SnapshotScrubber {
public:
    /**
     * @param conn Open snapshot connection
     * @param preset Preset to apply
     * @param audit Optional sink for per-message redaction events
     */
    [[nodiscard]] static Result<ScrubSummary> scrub(
        IDbConnection& conn,
        ScrubPreset preset,
        RedactionAuditLog* audit = nullptr);

    /**
     * @brief Resolve preset_name first; UNKNOWN_PRESET touches nothing
     */
    [[nodiscard]] static Result<ScrubSummary> scrub(
        IDbConnection& conn,
        std::string_view preset_name,
        RedactionAuditLog* audit = nullptr);
};

} // namespace snapredact
