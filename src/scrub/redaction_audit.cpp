#include "scrub/redaction_audit.hpp"

namespace snapredact {

const char* redaction_reason_to_string(RedactionReason reason) {
    switch (reason) {
        case RedactionReason::SCRUB_PRESET:      return "scrub_preset";
        case RedactionReason::SECRET_DETECTED:   return "secret_detected";
        case RedactionReason::BODY_REDACTED:     return "body_redacted";
    }
    return "unknown";
}

const char* redaction_reason_description(RedactionReason reason) {
    switch (reason) {
        case RedactionReason::SCRUB_PRESET:
            return "Content removed during scrub pass (preset policy)";
        case RedactionReason::SECRET_DETECTED:
            return "Secret pattern detected and replaced";
        case RedactionReason::BODY_REDACTED:
            return "Message body hidden per strict export policy";
    }
    return "";
}

void RedactionAuditLog::record(RedactionReason reason, std::string context,
                               std::optional<int64_t> entity_id) {
    switch (reason) {
        case RedactionReason::SECRET_DETECTED:
            ++secrets_caught_;
            break;
        case RedactionReason::BODY_REDACTED:
        case RedactionReason::SCRUB_PRESET:
            ++bodies_redacted_;
            break;
    }
    events_.push_back(RedactionEvent{reason, std::move(context), entity_id});
}

} // namespace snapredact
