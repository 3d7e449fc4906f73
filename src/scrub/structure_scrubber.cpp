#include "scrub/structure_scrubber.hpp"
#include "secrets/secret_scanner.hpp"

#include <array>
#include <cctype>
#include <type_traits>
#include <variant>

namespace snapredact {

namespace {

constexpr std::array<std::string_view, 5> kSensitiveKeys = {
    "download_url", "headers", "authorization", "signed_url", "bearer_token",
};

struct Counters {
    int64_t replacements = 0;
    int64_t keys_removed = 0;
};

glz::json_t scrub_node(const glz::json_t& node, Counters& counters) {
    return std::visit([&](const auto& v) -> glz::json_t {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::string>) {
            auto scrubbed = SecretScanner::scrub(v);
            counters.replacements += scrubbed.replacements;
            glz::json_t out;
            out = std::move(scrubbed.text);
            return out;
        } else if constexpr (std::is_same_v<T, JsonValue::array_t>) {
            JsonValue::array_t arr;
            arr.reserve(v.size());
            for (const auto& item : v) {
                arr.push_back(scrub_node(item, counters));
            }
            glz::json_t out;
            out = std::move(arr);
            return out;
        } else if constexpr (std::is_same_v<T, JsonValue::object_t>) {
            JsonValue::object_t obj;
            for (const auto& [key, child] : v) {
                if (is_sensitive_key(key)) {
                    if (!is_empty_value(JsonValue(child))) ++counters.keys_removed;
                    continue;
                }
                obj.emplace(key, scrub_node(child, counters));
            }
            glz::json_t out;
            out = std::move(obj);
            return out;
        } else {
            return node;
        }
    }, node.data);
}

} // anonymous namespace

std::string normalize_redact_key(std::string_view key) {
    std::string out;
    out.reserve(key.size());
    for (const char c : key) {
        if (c == '\0' || std::isspace(static_cast<unsigned char>(c))) continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

bool is_sensitive_key(std::string_view key) {
    const auto normalized = normalize_redact_key(key);
    for (const auto k : kSensitiveKeys) {
        if (normalized == k) return true;
    }
    return false;
}

bool is_empty_value(const JsonValue& value) {
    if (value.is_null()) return true;
    if (value.is_string()) return value.get<std::string>().empty();
    if (value.is_array() || value.is_object()) return value.empty();
    return false;
}

StructureScrubResult scrub_structure(const JsonValue& input) {
    Counters counters;
    auto scrubbed = scrub_node(input.raw(), counters);
    return StructureScrubResult{JsonValue(std::move(scrubbed)),
                                counters.replacements, counters.keys_removed};
}

} // namespace snapredact
