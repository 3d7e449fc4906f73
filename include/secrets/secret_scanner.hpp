#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace snapredact {

inline constexpr std::string_view kRedactedPlaceholder = "[REDACTED]";

/**
 * @brief Result of scanning one text value
 */
struct TextScrubResult {
    std::string text;
    int64_t replacements = 0;
};

/**
 * @brief Secret pattern matcher - replaces secret-shaped substrings
 *
 * Ordered rule table, compiled once per process:
 *  1. GitHub classic PAT        ghp_...
 *  2. GitHub fine-grained PAT   github_pat_...
 *  3. Slack token               xox[baprs]-...
 *  4. OpenAI-style key          sk-...
 *  5. Bearer phrase             bearer <token>
 *  6. URL basic-auth creds      https://user:pass@
 *  7. Env-var secret reference  $..._TOKEN / _SECRET / _KEY / _PASSWORD
 *  8. JWT                       eyJ....xxx.yyy
 *  9. AWS access key id         AKIA...
 * 10. PEM private key block
 * 11. Anthropic key             sk-ant-...
 * 12. GitLab token              glpat-...
 *
 * Rules run sequentially: each rule replaces all of its matches before the
 * next rule sees the updated text. The placeholder contains '[', ']' and
 * no rule alphabet covers them, so scrubbing is idempotent.
 */
class SecretScanner {
public:
    /**
     * @brief Replace every secret match with kRedactedPlaceholder
     * @return scrubbed text plus total replacements across all rules
     */
    [[nodiscard]] static TextScrubResult scrub(std::string_view input);

    /**
     * @brief True if any rule matches
     */
    [[nodiscard]] static bool contains_secret(std::string_view input);

    /**
     * @brief Rule names in application order
     */
    [[nodiscard]] static std::vector<std::string> pattern_names();
};

} // namespace snapredact
