#pragma once

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace snapredact {

// ============================================================================
// Redactor Config (mirrors TOML hierarchy)
// ============================================================================

struct SnapshotConfig {
    std::string path;
};

struct ScrubSectionConfig {
    bool enabled = true;
    std::string preset = "standard";
};

struct ScopeConfig {
    std::vector<std::string> projects;   // Empty keeps all
};

struct LoggingConfig {
    std::string level = "info";
};

struct RedactorConfig {
    SnapshotConfig snapshot;
    ScrubSectionConfig scrub;
    ScopeConfig scope;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        RedactorConfig config;

        static LoadResult ok(RedactorConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to snapredact.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Every problem with a config, one message each (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RedactorConfig& config);

private:
    static RedactorConfig extract_all_sections(const toml::table& root);
    static SnapshotConfig extract_snapshot(const toml::table& root);
    static ScrubSectionConfig extract_scrub(const toml::table& root);
    static ScopeConfig extract_scope(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static LoadResult validate_and_return(RedactorConfig config);
};

} // namespace snapredact
