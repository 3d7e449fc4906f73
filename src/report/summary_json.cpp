#include "report/summary_json.hpp"

namespace snapredact::report {

namespace {

JsonValue num(int64_t v) {
    return JsonValue(static_cast<long long>(v));
}

JsonValue num(size_t v) {
    return JsonValue(static_cast<long long>(v));
}

} // anonymous namespace

JsonValue to_json(const ScrubSummary& summary) {
    auto out = JsonValue::object();
    out.set("preset", summary.preset);
    out.set("pseudonym_salt", summary.pseudonym_salt);
    out.set("agents_total", num(summary.agents_total));
    out.set("agents_pseudonymized", num(summary.agents_pseudonymized));
    out.set("ack_flags_cleared", num(summary.ack_flags_cleared));
    out.set("recipients_cleared", num(summary.recipients_cleared));
    out.set("file_reservations_removed", num(summary.file_reservations_removed));
    out.set("agent_links_removed", num(summary.agent_links_removed));
    out.set("secrets_replaced", num(summary.secrets_replaced));
    out.set("attachments_sanitized", num(summary.attachments_sanitized));
    out.set("bodies_redacted", num(summary.bodies_redacted));
    out.set("attachments_cleared", num(summary.attachments_cleared));
    return out;
}

JsonValue to_json(const db::RemainingCounts& counts) {
    auto out = JsonValue::object();
    out.set("projects", num(counts.projects));
    out.set("agents", num(counts.agents));
    out.set("messages", num(counts.messages));
    out.set("recipients", num(counts.recipients));
    out.set("file_reservations", num(counts.file_reservations));
    out.set("agent_links", num(counts.agent_links));
    out.set("project_sibling_suggestions", num(counts.project_sibling_suggestions));
    return out;
}

JsonValue to_json(const ProjectScopeResult& result) {
    auto identifiers = JsonValue::array();
    for (const auto& ident : result.identifiers) {
        identifiers.push_back(ident);
    }

    auto projects = JsonValue::array();
    for (const auto& p : result.projects) {
        auto rec = JsonValue::object();
        rec.set("id", num(p.id));
        rec.set("slug", p.slug);
        rec.set("human_key", p.human_key);
        projects.push_back(std::move(rec));
    }

    auto out = JsonValue::object();
    out.set("identifiers", std::move(identifiers));
    out.set("projects", std::move(projects));
    out.set("removed_count", num(result.removed_count));
    out.set("remaining", to_json(result.remaining));
    return out;
}

JsonValue to_json(const RedactionAuditLog& log) {
    auto events = JsonValue::array();
    for (const auto& ev : log.events()) {
        auto rec = JsonValue::object();
        rec.set("reason", redaction_reason_to_string(ev.reason));
        rec.set("context", ev.context);
        rec.set("entity_id", ev.entity_id ? num(*ev.entity_id) : JsonValue(nullptr));
        events.push_back(std::move(rec));
    }

    auto out = JsonValue::object();
    out.set("events", std::move(events));
    out.set("secrets_caught", num(log.secrets_caught()));
    out.set("bodies_redacted", num(log.bodies_redacted()));
    out.set("total", num(log.total()));
    return out;
}

std::string error_json(ErrorCategory category, const std::string& message) {
    auto out = JsonValue::object();
    out.set("error", error_category_to_string(category));
    out.set("message", message);
    return out.dump();
}

} // namespace snapredact::report
