#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace airlock {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads airlock.toml into an AirlockConfig
 *
 * Supports ${ENV_VAR} expansion in every string value and
 * include = "file.toml" / include = [...] merging (main file wins,
 * arrays of tables are concatenated, depth limit 10, cycles rejected).
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AirlockConfig config;

        static LoadResult ok(AirlockConfig cfg) {
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
     *
     * Relative allowlist paths are resolved against the file's directory.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks on an extracted config
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AirlockConfig& config);

private:
    static AnonymizerSection extract_anonymizer(const toml::table& root);
    static DeanonymizerSection extract_deanonymizer(const toml::table& root);
    static StoreSection extract_store(const toml::table& root);
    static SecretScannerSection extract_secret_scanner(const toml::table& root);
    static std::vector<CustomPatternConfig> extract_patterns(const toml::table& root);
    static std::vector<AllowlistConfig> extract_allowlists(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static AirlockConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(AirlockConfig config);
};

} // namespace airlock
