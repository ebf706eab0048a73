#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace anonymizer {

// ============================================================================
// ConfigLoader - Extract typed config from TOML (toml++)
// ============================================================================

/**
 * @brief Loads anonymizer.toml
 *
 * Strings support ${VAR} environment expansion. After extraction, the PORT
 * and LOG_LEVEL environment variables override server.port and
 * logging.level, then the whole config is validated; every problem found is
 * reported in one combined message.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AnonymizerConfig config;

        static LoadResult ok(AnonymizerConfig cfg) {
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
     * @brief Load config from a TOML file
     *
     * A missing file is not an error: defaults (plus env overrides) are used
     * and a warning is logged.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    // Empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const AnonymizerConfig& config);

private:
    static LoadResult finish(AnonymizerConfig config);
    static void apply_env_overrides(AnonymizerConfig& config, std::vector<std::string>& errors);
};

} // namespace anonymizer
