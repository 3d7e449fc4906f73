#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snapredact {

/**
 * @brief Why a piece of content was hidden or replaced
 */
enum class RedactionReason {
    SCRUB_PRESET,       // Removed by the preset during the database pass
    SECRET_DETECTED,    // Secret pattern matched and replaced
    BODY_REDACTED       // Body replaced under strict policy
};

[[nodiscard]] const char* redaction_reason_to_string(RedactionReason reason);

/**
 * @brief Operator-facing explanation for a reason code
 */
[[nodiscard]] const char* redaction_reason_description(RedactionReason reason);

struct RedactionEvent {
    RedactionReason reason;
    std::string context;            // e.g. "message 42"
    std::optional<int64_t> entity_id;
};

/**
 * @brief Append-only record of redactions made during one run
 *
 * Not thread-safe; owned by a single scrub pass.
 */
class RedactionAuditLog {
public:
    void record(RedactionReason reason, std::string context,
                std::optional<int64_t> entity_id = std::nullopt);

    [[nodiscard]] const std::vector<RedactionEvent>& events() const { return events_; }
    [[nodiscard]] size_t total() const { return events_.size(); }

    [[nodiscard]] size_t secrets_caught() const { return secrets_caught_; }
    [[nodiscard]] size_t bodies_redacted() const { return bodies_redacted_; }

private:
    std::vector<RedactionEvent> events_;
    size_t secrets_caught_ = 0;
    size_t bodies_redacted_ = 0;
};

} // namespace snapredact
