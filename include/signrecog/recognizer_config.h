#pragma once

#include <string>
#include <vector>
#include <cJSON.h>
#include "model_selector.h"
#include "hmm_trainer.h"
#include "logger.h"

namespace signrecog {
namespace config {

    /**
     * @brief Logging settings applied before a run
     */
    struct LoggingSettings {
        LogLevel level;                 // Minimum level written
        std::string log_file_path;      // Log file path (empty = console only)

        LoggingSettings()
            : level(LogLevel::INFO) {}
    };

    /**
     * @brief Complete recognizer configuration
     *
     * Groups the selection strategy, its search parameters, the Baum-Welch
     * settings and logging. Serialized to JSON by ConfigManager.
     */
    struct RecognizerConfig {
        std::string config_version;     // Configuration schema version
        selection::SelectorKind selector;
        selection::SelectorConfig selector_config;
        hmm::TrainingConfig training_config;
        LoggingSettings logging;

        RecognizerConfig()
            : config_version("1.0")
            , selector(selection::SelectorKind::CONSTANT) {}
    };

    /**
     * @brief Configuration validation result
     */
    struct ConfigValidationResult {
        bool is_valid;                          // Overall validation result
        std::vector<std::string> errors;        // Validation errors
        std::vector<std::string> warnings;      // Validation warnings

        ConfigValidationResult() : is_valid(true) {}
    };

    /**
     * @brief Loads, saves and validates recognizer configuration files
     */
    class ConfigManager {
    public:
        bool load_config(const std::string& file_path, RecognizerConfig& config);
        bool save_config(const std::string& file_path, const RecognizerConfig& config);

        std::string config_to_json(const RecognizerConfig& config);
        bool config_from_json(const std::string& json_str, RecognizerConfig& config);

        ConfigValidationResult validate_config(const RecognizerConfig& config);

        /**
         * @brief Load a file and reject invalid values
         * @throws ConfigError if the file cannot be read, parsed or validated
         */
        RecognizerConfig load_validated(const std::string& file_path);

        static constexpr const char* CURRENT_CONFIG_VERSION = "1.0";

    private:
        cJSON* selector_config_to_json(const selection::SelectorConfig& config);
        bool selector_config_from_json(const cJSON* json, selection::SelectorConfig& config);

        cJSON* training_config_to_json(const hmm::TrainingConfig& config);
        bool training_config_from_json(const cJSON* json, hmm::TrainingConfig& config);

        cJSON* logging_config_to_json(const LoggingSettings& config);
        bool logging_config_from_json(const cJSON* json, LoggingSettings& config);
    };

    /// Copy the logging settings onto the global logger
    void apply_logging(const LoggingSettings& settings);

} // namespace config
} // namespace signrecog
