#pragma once

#include "core/json.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace snapredact {

/**
 * @brief Sanitized copy of a JSON value plus what was changed
 */
struct StructureScrubResult {
    JsonValue value;
    int64_t replacements = 0;
    int64_t keys_removed = 0;
};

/**
 * @brief Lowercase a mapping key and strip whitespace and NUL characters
 */
[[nodiscard]] std::string normalize_redact_key(std::string_view key);

/**
 * @brief True for download_url, headers, authorization, signed_url, bearer_token
 *        (after normalize_redact_key)
 */
[[nodiscard]] bool is_sensitive_key(std::string_view key);

/**
 * @brief null, "", [] and {} count as empty
 */
[[nodiscard]] bool is_empty_value(const JsonValue& value);

/**
 * @brief Recursively scrub a JSON value
 *
 * Strings: SecretScanner::scrub. Arrays: element-wise. Objects: sensitive
 * keys are dropped (counted only when the value is non-empty), other values
 * are scrubbed. Keys themselves are never scanned. Numbers, booleans and
 * null pass through.
 */
[[nodiscard]] StructureScrubResult scrub_structure(const JsonValue& input);

} // namespace snapredact
