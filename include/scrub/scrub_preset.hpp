#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace snapredact {

inline constexpr std::string_view kBodyPlaceholder = "[Message body redacted]";

enum class ScrubPreset {
    STANDARD,
    STRICT,
    ARCHIVE
};

/**
 * @brief Switch set driving one scrub pass
 */
struct ScrubConfig {
    bool redact_body = false;
    std::string body_placeholder;
    bool drop_attachments = false;
    bool scrub_secrets = false;
    bool clear_ack_state = false;
    bool clear_recipients = false;
    bool clear_file_reservations = false;
    bool clear_agent_links = false;
};

/**
 * @brief Immutable switch set for a preset
 */
[[nodiscard]] const ScrubConfig& preset_config(ScrubPreset preset);

/**
 * @brief Resolve a preset name (trimmed, case-insensitive)
 *
 * Unknown names fail with UNKNOWN_PRESET; there is no fallback.
 */
[[nodiscard]] Result<ScrubPreset> parse_scrub_preset(std::string_view name);

[[nodiscard]] const char* scrub_preset_name(ScrubPreset preset);

/**
 * @brief All presets in declaration order
 */
[[nodiscard]] std::vector<ScrubPreset> all_scrub_presets();

} // namespace snapredact
