#include "scrub/snapshot_scrubber.hpp"
#include "core/utils.hpp"
#include "db/snapshot_tables.hpp"
#include "db/snapshot_transaction.hpp"
#include "scrub/structure_scrubber.hpp"
#include "secrets/secret_scanner.hpp"

#include <format>
#include <vector>

namespace snapredact {

namespace {

struct MessageRow {
    int64_t id = 0;
    std::string subject;
    std::string body;
    std::string attachments;
};

Result<int64_t> exec_count(IDbConnection& conn, const std::string& sql,
                           const std::vector<SqlParam>& params = {}) {
    const auto res = conn.execute(sql, params);
    if (!res.success) {
        return Result<int64_t>::error(ErrorCategory::STORAGE_ERROR,
            std::format("'{}' failed: {}", sql, res.error_message));
    }
    return Result<int64_t>::ok(static_cast<int64_t>(res.affected_rows));
}

Result<std::vector<MessageRow>> load_messages(IDbConnection& conn) {
    const auto res = conn.execute(
        "SELECT id, subject, body_md, attachments FROM messages ORDER BY id");
    if (!res.success) {
        return Result<std::vector<MessageRow>>::error(ErrorCategory::STORAGE_ERROR,
            std::format("SELECT messages failed: {}", res.error_message));
    }

    std::vector<MessageRow> rows;
    rows.reserve(res.rows.size());
    for (size_t r = 0; r < res.rows.size(); ++r) {
        const auto& row = res.rows[r];
        if (row.size() < 4) {
            return Result<std::vector<MessageRow>>::error(ErrorCategory::STORAGE_ERROR,
                "SELECT messages returned a short row");
        }
        MessageRow msg;
        try {
            msg.id = std::stoll(row[0]);
        } catch (const std::exception&) {
            return Result<std::vector<MessageRow>>::error(ErrorCategory::STORAGE_ERROR,
                std::format("messages.id is not an integer: '{}'", row[0]));
        }
        // NULL columns arrive as empty strings
        msg.subject = res.is_null(r, 1) ? std::string{} : row[1];
        msg.body = res.is_null(r, 2) ? std::string{} : row[2];
        msg.attachments = res.is_null(r, 3) ? std::string{} : row[3];
        rows.push_back(std::move(msg));
    }
    return Result<std::vector<MessageRow>>::ok(std::move(rows));
}

Result<ScrubSummary> storage_failure(const std::string& message) {
    utils::log::error(std::format("Scrub aborted: {}", message));
    return Result<ScrubSummary>::error(ErrorCategory::STORAGE_ERROR, message);
}

} // anonymous namespace

DecodedAttachments decode_attachments(std::string_view text) {
    DecodedAttachments out;
    if (text.empty()) return out;

    try {
        auto parsed = JsonValue::parse(std::string(text));
        if (parsed.is_array()) {
            out.list = std::move(parsed);
            return out;
        }
        if (parsed.is_string()) {
            auto inner = JsonValue::parse(parsed.get<std::string>());
            if (inner.is_array()) {
                out.list = std::move(inner);
                return out;
            }
        }
    } catch (const JsonValue::parse_error&) {
        // falls through to malformed
    }
    out.malformed = true;
    return out;
}

Result<ScrubSummary> SnapshotScrubber::scrub(IDbConnection& conn,
                                             std::string_view preset_name,
                                             RedactionAuditLog* audit) {
    auto preset = parse_scrub_preset(preset_name);
    if (preset.is_error()) {
        return Result<ScrubSummary>::error(preset.error_category(), preset.error_message());
    }
    return scrub(conn, preset.value(), audit);
}

Result<ScrubSummary> SnapshotScrubber::scrub(IDbConnection& conn,
                                             ScrubPreset preset,
                                             RedactionAuditLog* audit) {
    const ScrubConfig& cfg = preset_config(preset);
    const utils::Timer timer;

    ScrubSummary summary;
    summary.preset = scrub_preset_name(preset);
    summary.pseudonym_salt = summary.preset;

    SnapshotTransaction txn(conn);
    if (auto err = txn.begin(); !err.empty()) {
        return storage_failure(err);
    }

    auto agents = db::count_rows(conn, db::kAgents);
    if (agents.is_error()) return storage_failure(agents.error_message());
    summary.agents_total = agents.value();

    if (cfg.clear_ack_state) {
        auto n = exec_count(conn, "UPDATE messages SET ack_required = 0");
        if (n.is_error()) return storage_failure(n.error_message());
        summary.ack_flags_cleared = n.value();
    }

    if (cfg.clear_recipients) {
        auto n = exec_count(conn,
            "UPDATE message_recipients SET read_ts = NULL, ack_ts = NULL");
        if (n.is_error()) return storage_failure(n.error_message());
        summary.recipients_cleared = n.value();
    }

    if (cfg.clear_file_reservations) {
        auto n = exec_count(conn, "DELETE FROM file_reservations");
        if (n.is_error()) return storage_failure(n.error_message());
        summary.file_reservations_removed = n.value();
    }

    if (cfg.clear_agent_links) {
        auto exists = db::table_exists(conn, db::kAgentLinks);
        if (exists.is_error()) return storage_failure(exists.error_message());
        if (exists.value()) {
            auto n = exec_count(conn, "DELETE FROM agent_links");
            if (n.is_error()) return storage_failure(n.error_message());
            summary.agent_links_removed = n.value();
        }
    }

    auto messages = load_messages(conn);
    if (messages.is_error()) return storage_failure(messages.error_message());

    const bool touches_attachments = cfg.drop_attachments || cfg.scrub_secrets;

    for (const auto& msg : messages.value()) {
        std::string subject = msg.subject;
        std::string body = msg.body;
        int64_t text_replacements = 0;

        if (cfg.scrub_secrets) {
            auto s = SecretScanner::scrub(subject);
            auto b = SecretScanner::scrub(body);
            subject = std::move(s.text);
            body = std::move(b.text);
            text_replacements = s.replacements + b.replacements;
        }

        // archive leaves even malformed attachment text untouched
        auto decoded = decode_attachments(msg.attachments);
        JsonValue attachments = std::move(decoded.list);
        bool attachments_updated = decoded.malformed && touches_attachments;
        bool attachments_cleared = false;
        int64_t attachment_replacements = 0;

        if (cfg.drop_attachments && !attachments.empty()) {
            attachments = JsonValue::array();
            ++summary.attachments_cleared;
            attachments_cleared = true;
            attachments_updated = true;
        }

        if (cfg.scrub_secrets && !attachments.empty()) {
            auto scrubbed = scrub_structure(attachments);
            attachment_replacements = scrubbed.replacements;
            if (!(scrubbed.value == attachments)) {
                attachments = std::move(scrubbed.value);
                attachments_updated = true;
            }
            if (scrubbed.keys_removed > 0) {
                attachments_updated = true;
            }
        }

        if (attachments_updated) {
            auto n = exec_count(conn, "UPDATE messages SET attachments = ? WHERE id = ?",
                                {attachments.dump(), msg.id});
            if (n.is_error()) return storage_failure(n.error_message());
        }

        if (subject != msg.subject) {
            auto n = exec_count(conn, "UPDATE messages SET subject = ? WHERE id = ?",
                                {subject, msg.id});
            if (n.is_error()) return storage_failure(n.error_message());
        }

        bool body_redacted = false;
        if (cfg.redact_body) {
            if (msg.body != cfg.body_placeholder) {
                auto n = exec_count(conn, "UPDATE messages SET body_md = ? WHERE id = ?",
                                    {cfg.body_placeholder, msg.id});
                if (n.is_error()) return storage_failure(n.error_message());
                ++summary.bodies_redacted;
                body_redacted = true;
            }
        } else if (body != msg.body) {
            auto n = exec_count(conn, "UPDATE messages SET body_md = ? WHERE id = ?",
                                {body, msg.id});
            if (n.is_error()) return storage_failure(n.error_message());
        }

        summary.secrets_replaced += text_replacements + attachment_replacements;
        const bool attachments_sanitized = attachments_updated || attachment_replacements > 0;
        if (attachments_sanitized) {
            ++summary.attachments_sanitized;
        }

        if (audit) {
            const auto context = std::format("message {}", msg.id);
            if (text_replacements + attachment_replacements > 0) {
                audit->record(RedactionReason::SECRET_DETECTED, context, msg.id);
            }
            if (body_redacted) {
                audit->record(RedactionReason::BODY_REDACTED, context, msg.id);
            }
            if (attachments_cleared || attachments_sanitized) {
                audit->record(RedactionReason::SCRUB_PRESET, context, msg.id);
            }
        }
    }

    if (auto err = txn.commit(); !err.empty()) {
        return storage_failure(err);
    }

    utils::log::info(std::format(
        "Scrub '{}' complete: {} secrets replaced, {} attachments sanitized, "
        "{} bodies redacted ({} ms)",
        summary.preset, summary.secrets_replaced, summary.attachments_sanitized,
        summary.bodies_redacted, timer.elapsed_ms().count()));

    return Result<ScrubSummary>::ok(std::move(summary));
}

} // namespace snapredact
