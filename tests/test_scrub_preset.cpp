#include <catch2/catch_test_macros.hpp>
#include "scrub/scrub_preset.hpp"

using namespace snapredact;

TEST_CASE("Preset names parse case-insensitively with trimming", "[preset]") {
    auto strict = parse_scrub_preset("  StRiCt  ");
    REQUIRE(strict.is_ok());
    CHECK(strict.value() == ScrubPreset::STRICT);

    auto standard = parse_scrub_preset("standard");
    REQUIRE(standard.is_ok());
    CHECK(standard.value() == ScrubPreset::STANDARD);

    auto archive = parse_scrub_preset("ARCHIVE\n");
    REQUIRE(archive.is_ok());
    CHECK(archive.value() == ScrubPreset::ARCHIVE);
}

TEST_CASE("Unknown preset name is an error, not a fallback", "[preset]") {
    for (const char* name : {"", "   ", "paranoid", "standard-ish"}) {
        auto result = parse_scrub_preset(name);
        CHECK(result.is_error());
        CHECK(result.error_category() == ErrorCategory::UNKNOWN_PRESET);
    }

    auto named = parse_scrub_preset(" Paranoid ");
    CHECK(named.error_message().find("paranoid") != std::string::npos);
}

TEST_CASE("Preset names round-trip", "[preset]") {
    const auto presets = all_scrub_presets();
    REQUIRE(presets.size() == 3);
    for (const auto preset : presets) {
        auto parsed = parse_scrub_preset(scrub_preset_name(preset));
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value() == preset);
    }
}

TEST_CASE("Preset switch tables", "[preset]") {
    SECTION("standard scrubs secrets and clears ephemeral state") {
        const auto& cfg = preset_config(ScrubPreset::STANDARD);
        CHECK_FALSE(cfg.redact_body);
        CHECK_FALSE(cfg.drop_attachments);
        CHECK(cfg.scrub_secrets);
        CHECK(cfg.clear_ack_state);
        CHECK(cfg.clear_recipients);
        CHECK(cfg.clear_file_reservations);
        CHECK(cfg.clear_agent_links);
    }
    SECTION("strict also redacts bodies and drops attachments") {
        const auto& cfg = preset_config(ScrubPreset::STRICT);
        CHECK(cfg.redact_body);
        CHECK(cfg.body_placeholder == "[Message body redacted]");
        CHECK(cfg.drop_attachments);
        CHECK(cfg.scrub_secrets);
        CHECK(cfg.clear_ack_state);
        CHECK(cfg.clear_recipients);
        CHECK(cfg.clear_file_reservations);
        CHECK(cfg.clear_agent_links);
    }
    SECTION("archive disables every switch") {
        const auto& cfg = preset_config(ScrubPreset::ARCHIVE);
        CHECK_FALSE(cfg.redact_body);
        CHECK_FALSE(cfg.drop_attachments);
        CHECK_FALSE(cfg.scrub_secrets);
        CHECK_FALSE(cfg.clear_ack_state);
        CHECK_FALSE(cfg.clear_recipients);
        CHECK_FALSE(cfg.clear_file_reservations);
        CHECK_FALSE(cfg.clear_agent_links);
    }
}
