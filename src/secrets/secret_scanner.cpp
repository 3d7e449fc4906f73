#include "secrets/secret_scanner.hpp"

#include <re2/re2.h>

#include <memory>
#include <stdexcept>

namespace snapredact {

namespace {

struct SecretRule {
    std::string name;
    std::unique_ptr<re2::RE2> regex;
};

SecretRule make_rule(std::string name, const char* pattern, bool icase) {
    // Latin-1 keeps matching byte-oriented; every rule alphabet is ASCII
    re2::RE2::Options options;
    options.set_encoding(re2::RE2::Options::EncodingLatin1);
    options.set_case_sensitive(!icase);
    options.set_log_errors(false);

    auto regex = std::make_unique<re2::RE2>(pattern, options);
    if (!regex->ok()) {
        throw std::invalid_argument("secret rule " + name + ": " + regex->error());
    }
    return SecretRule{std::move(name), std::move(regex)};
}

const std::vector<SecretRule>& rules() {
    static const std::vector<SecretRule> table = [] {
        std::vector<SecretRule> r;
        r.reserve(12);
        r.push_back(make_rule("github_pat_classic",
            R"(ghp_[A-Za-z0-9]{36,})", true));
        r.push_back(make_rule("github_pat_fine_grained",
            R"(github_pat_[A-Za-z0-9_]{20,})", true));
        r.push_back(make_rule("slack_token",
            R"(xox[baprs]-[A-Za-z0-9\-]{10,})", true));
        r.push_back(make_rule("openai_key",
            R"(sk-[A-Za-z0-9]{20,})", true));
        r.push_back(make_rule("bearer_token",
            R"(bearer\s+[A-Za-z0-9_\-\./+=]{16,})", true));
        r.push_back(make_rule("url_credentials",
            R"(https?://[^/\s:@]+:[^@\s/]+@)", true));
        r.push_back(make_rule("env_secret_reference",
            R"(\$[A-Z_][A-Z0-9_]*(?:SECRET|TOKEN|KEY|PASSWORD)[A-Z0-9_]*)", true));
        r.push_back(make_rule("jwt",
            R"(eyJ[0-9A-Za-z_\-]+\.[0-9A-Za-z_\-]+\.[0-9A-Za-z_\-]+)", false));
        r.push_back(make_rule("aws_access_key",
            R"(AKIA[0-9A-Z]{16})", false));
        r.push_back(make_rule("pem_private_key",
            R"(-----BEGIN[A-Z ]* PRIVATE KEY-----[\s\S]*?-----END[A-Z ]* PRIVATE KEY-----)", false));
        r.push_back(make_rule("anthropic_key",
            R"(sk-ant-[A-Za-z0-9\-]{20,})", true));
        r.push_back(make_rule("gitlab_token",
            R"(glpat-[A-Za-z0-9\-_]{20,})", false));
        return r;
    }();
    return table;
}

} // anonymous namespace

TextScrubResult SecretScanner::scrub(std::string_view input) {
    TextScrubResult result{std::string(input), 0};
    if (result.text.empty()) return result;

    for (const auto& rule : rules()) {
        result.replacements += re2::RE2::GlobalReplace(
            &result.text, *rule.regex, kRedactedPlaceholder);
    }
    return result;
}

bool SecretScanner::contains_secret(std::string_view input) {
    for (const auto& rule : rules()) {
        if (re2::RE2::PartialMatch(input, *rule.regex)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> SecretScanner::pattern_names() {
    std::vector<std::string> names;
    names.reserve(rules().size());
    for (const auto& rule : rules()) {
        names.push_back(rule.name);
    }
    return names;
}

} // namespace snapredact
