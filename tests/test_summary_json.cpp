#include <catch2/catch_test_macros.hpp>
#include "report/summary_json.hpp"

using namespace snapredact;

TEST_CASE("Scrub summary serializes with sorted keys", "[report]") {
    ScrubSummary summary;
    summary.preset = "standard";
    summary.pseudonym_salt = "standard";
    summary.agents_total = 2;
    summary.secrets_replaced = 3;
    summary.attachments_sanitized = 1;

    const auto text = report::to_json_string(summary);
    CHECK(text.starts_with(R"({"ack_flags_cleared":)"));
    CHECK(text.find(R"("preset":"standard")") != std::string::npos);
    CHECK(text.find(' ') == std::string::npos);

    const auto parsed = JsonValue::parse(text);
    CHECK(parsed.size() == 12);
    CHECK(parsed["agents_total"].get<int64_t>() == 2);
    CHECK(parsed["agents_pseudonymized"].get<int64_t>() == 0);
    CHECK(parsed["secrets_replaced"].get<int64_t>() == 3);
    CHECK(parsed["pseudonym_salt"].get<std::string>() == "standard");

    // Canonical: repeated serialization is byte-identical
    CHECK(report::to_json_string(summary) == text);
}

TEST_CASE("Scope result serializes projects and remaining counts", "[report]") {
    ProjectScopeResult result;
    result.identifiers = {"proj-alpha", ""};
    result.projects.push_back({1, "proj-alpha", "/data/projects/alpha"});
    result.removed_count = 1;
    result.remaining.projects = 1;
    result.remaining.messages = 2;

    const auto parsed = JsonValue::parse(report::to_json_string(result));
    REQUIRE(parsed.is_object());
    CHECK(parsed["removed_count"].get<int64_t>() == 1);
    CHECK(parsed["identifiers"].size() == 2);
    CHECK(parsed["identifiers"][1].get<std::string>().empty());

    const auto project = parsed["projects"][0];
    CHECK(project["id"].get<int64_t>() == 1);
    CHECK(project["slug"].get<std::string>() == "proj-alpha");
    CHECK(project["human_key"].get<std::string>() == "/data/projects/alpha");

    const auto remaining = parsed["remaining"];
    CHECK(remaining.size() == 7);
    CHECK(remaining["messages"].get<int64_t>() == 2);
    CHECK(remaining["project_sibling_suggestions"].get<int64_t>() == 0);
}

TEST_CASE("Audit log serializes events", "[report][audit]") {
    RedactionAuditLog log;
    log.record(RedactionReason::SECRET_DETECTED, "message 4", 4);
    log.record(RedactionReason::SCRUB_PRESET, "agent_links");

    const auto parsed = JsonValue::parse(report::to_json_string(log));
    CHECK(parsed["total"].get<int64_t>() == 2);
    CHECK(parsed["secrets_caught"].get<int64_t>() == 1);
    CHECK(parsed["bodies_redacted"].get<int64_t>() == 1);
    CHECK_FALSE(parsed.contains("snippets_filtered"));

    const auto events = parsed["events"];
    REQUIRE(events.size() == 2);
    CHECK(events[0]["reason"].get<std::string>() == "secret_detected");
    CHECK(events[0]["entity_id"].get<int64_t>() == 4);
    CHECK(events[1]["entity_id"].is_null());
}

TEST_CASE("Error line carries category and message", "[report]") {
    const auto parsed = JsonValue::parse(
        report::error_json(ErrorCategory::UNKNOWN_IDENTIFIER, "Project identifier 'x' not found"));
    CHECK(parsed["error"].get<std::string>() == "unknown_identifier");
    CHECK(parsed["message"].get<std::string>() == "Project identifier 'x' not found");
}
