#include <catch2/catch_test_macros.hpp>
#include "scrub/redaction_audit.hpp"

#include <string>

using namespace snapredact;

TEST_CASE("Audit log counts events by reason", "[audit]") {
    RedactionAuditLog log;
    log.record(RedactionReason::SECRET_DETECTED, "msg-1", 1);
    log.record(RedactionReason::BODY_REDACTED, "msg-2", 2);
    log.record(RedactionReason::SCRUB_PRESET, "msg-3", 3);
    log.record(RedactionReason::SCRUB_PRESET, "agent_links");

    CHECK(log.total() == 4);
    CHECK(log.events().size() == 4);
    CHECK(log.secrets_caught() == 1);
    CHECK(log.bodies_redacted() == 3);

    CHECK(log.events()[0].entity_id == 1);
    CHECK_FALSE(log.events()[3].entity_id.has_value());
    CHECK(log.events()[3].context == "agent_links");
}

TEST_CASE("Audit log starts empty", "[audit]") {
    const RedactionAuditLog log;
    CHECK(log.total() == 0);
    CHECK(log.secrets_caught() == 0);
    CHECK(log.events().empty());
}

TEST_CASE("Redaction reasons have descriptions", "[audit]") {
    CHECK(std::string(redaction_reason_description(RedactionReason::SECRET_DETECTED)) ==
          "Secret pattern detected and replaced");
    CHECK(std::string(redaction_reason_description(RedactionReason::SCRUB_PRESET)) ==
          "Content removed during scrub pass (preset policy)");
    CHECK(std::string(redaction_reason_to_string(RedactionReason::SECRET_DETECTED)) ==
          "secret_detected");
}
