#include "scrub/scrub_preset.hpp"
#include "core/utils.hpp"

#include <format>

namespace snapredact {

namespace {

struct PresetEntry {
    ScrubPreset preset;
    const char* name;
    ScrubConfig config;
};

const std::vector<PresetEntry>& preset_table() {
    static const std::vector<PresetEntry> table = [] {
        ScrubConfig standard;
        standard.scrub_secrets = true;
        standard.clear_ack_state = true;
        standard.clear_recipients = true;
        standard.clear_file_reservations = true;
        standard.clear_agent_links = true;

        ScrubConfig strict = standard;
        strict.redact_body = true;
        strict.body_placeholder = std::string(kBodyPlaceholder);
        strict.drop_attachments = true;

        return std::vector<PresetEntry>{
            {ScrubPreset::STANDARD, "standard", standard},
            {ScrubPreset::STRICT, "strict", strict},
            {ScrubPreset::ARCHIVE, "archive", ScrubConfig{}},
        };
    }();
    return table;
}

} // anonymous namespace

const ScrubConfig& preset_config(ScrubPreset preset) {
    for (const auto& entry : preset_table()) {
        if (entry.preset == preset) return entry.config;
    }
    // Every enumerator has a table row
    return preset_table().front().config;
}

Result<ScrubPreset> parse_scrub_preset(std::string_view name) {
    const std::string normalized = utils::to_lower(utils::trim(std::string(name)));
    for (const auto& entry : preset_table()) {
        if (normalized == entry.name) return Result<ScrubPreset>::ok(entry.preset);
    }
    return Result<ScrubPreset>::error(ErrorCategory::UNKNOWN_PRESET,
        std::format("Unsupported scrub preset '{}'", normalized));
}

const char* scrub_preset_name(ScrubPreset preset) {
    switch (preset) {
        case ScrubPreset::STANDARD: return "standard";
        case ScrubPreset::STRICT:   return "strict";
        case ScrubPreset::ARCHIVE:  return "archive";
    }
    return "standard";
}

std::vector<ScrubPreset> all_scrub_presets() {
    std::vector<ScrubPreset> out;
    out.reserve(preset_table().size());
    for (const auto& entry : preset_table()) {
        out.push_back(entry.preset);
    }
    return out;
}

} // namespace snapredact
