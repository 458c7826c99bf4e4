#include "signrecog/recognizer_config.h"
#include "signrecog/errors.h"

#include <fstream>
#include <filesystem>
#include <cstdlib>

namespace signrecog {
namespace config {

bool ConfigManager::load_config(const std::string& file_path, RecognizerConfig& config) {
    try {
        std::ifstream file(file_path);
        if (!file.is_open()) {
            SIGNRECOG_LOG_ERROR("Cannot open configuration file: " + file_path);
            return false;
        }

        std::string json_content((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
        file.close();

        if (json_content.empty()) {
            SIGNRECOG_LOG_ERROR("Configuration file is empty: " + file_path);
            return false;
        }

        bool success = config_from_json(json_content, config);
        if (success) {
            SIGNRECOG_LOG_DEBUG("Loaded configuration from: " + file_path);
        } else {
            SIGNRECOG_LOG_ERROR("Failed to parse configuration file: " + file_path);
        }

        return success;

    } catch (const std::exception& e) {
        SIGNRECOG_LOG_ERROR("Exception loading configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::save_config(const std::string& file_path, const RecognizerConfig& config) {
    try {
        auto validation = validate_config(config);
        if (!validation.is_valid) {
            SIGNRECOG_LOG_ERROR("Cannot save invalid configuration");
            for (const auto& error : validation.errors) {
                SIGNRECOG_LOG_ERROR("Validation error: " + error);
            }
            return false;
        }

        std::string json_str = config_to_json(config);
        if (json_str.empty()) {
            SIGNRECOG_LOG_ERROR("Failed to serialize configuration to JSON");
            return false;
        }

        std::filesystem::path parent_dir = std::filesystem::path(file_path).parent_path();
        if (!parent_dir.empty()) {
            std::filesystem::create_directories(parent_dir);
        }

        std::ofstream file(file_path);
        if (!file.is_open()) {
            SIGNRECOG_LOG_ERROR("Cannot create configuration file: " + file_path);
            return false;
        }

        file << json_str;
        file.close();

        SIGNRECOG_LOG_INFO("Configuration saved to: " + file_path);
        return true;

    } catch (const std::exception& e) {
        SIGNRECOG_LOG_ERROR("Exception saving configuration: " + std::string(e.what()));
        return false;
    }
}

std::string ConfigManager::config_to_json(const RecognizerConfig& config) {
    cJSON* root = cJSON_CreateObject();
    if (!root) return "";

    cJSON_AddStringToObject(root, "config_version", config.config_version.c_str());
    cJSON_AddStringToObject(root, "selector", selection::selector_kind_name(config.selector).c_str());
    cJSON_AddItemToObject(root, "selector_config", selector_config_to_json(config.selector_config));
    cJSON_AddItemToObject(root, "training_config", training_config_to_json(config.training_config));
    cJSON_AddItemToObject(root, "logging", logging_config_to_json(config.logging));

    char* json_string = cJSON_Print(root);
    std::string result = json_string ? json_string : "";

    if (json_string) free(json_string);
    cJSON_Delete(root);

    return result;
}

bool ConfigManager::config_from_json(const std::string& json_str, RecognizerConfig& config) {
    cJSON* root = cJSON_Parse(json_str.c_str());
    if (!root) {
        SIGNRECOG_LOG_ERROR("Invalid JSON format in configuration");
        return false;
    }

    bool ok = true;

    cJSON* item = cJSON_GetObjectItem(root, "config_version");
    if (item && cJSON_IsString(item)) {
        config.config_version = item->valuestring;
    }

    item = cJSON_GetObjectItem(root, "selector");
    if (item && cJSON_IsString(item)) {
        auto kind = selection::parse_selector_kind(item->valuestring);
        if (kind) {
            config.selector = *kind;
        } else {
            SIGNRECOG_LOG_ERROR("Unknown selector in configuration: " + std::string(item->valuestring));
            ok = false;
        }
    }

    item = cJSON_GetObjectItem(root, "selector_config");
    if (item && cJSON_IsObject(item)) {
        ok = selector_config_from_json(item, config.selector_config) && ok;
    }

    item = cJSON_GetObjectItem(root, "training_config");
    if (item && cJSON_IsObject(item)) {
        ok = training_config_from_json(item, config.training_config) && ok;
    }

    item = cJSON_GetObjectItem(root, "logging");
    if (item && cJSON_IsObject(item)) {
        ok = logging_config_from_json(item, config.logging) && ok;
    }

    cJSON_Delete(root);
    return ok;
}

ConfigValidationResult ConfigManager::validate_config(const RecognizerConfig& config) {
    ConfigValidationResult result;
    const auto& sc = config.selector_config;

    if (config.config_version.empty()) {
        result.errors.push_back("Configuration version is required");
    } else if (config.config_version != CURRENT_CONFIG_VERSION) {
        result.warnings.push_back("Configuration version mismatch. Current: " +
                                  std::string(CURRENT_CONFIG_VERSION) + ", Found: " + config.config_version);
    }

    if (sc.n_constant < 1) {
        result.errors.push_back("n_constant must be at least 1");
    }
    if (sc.min_states < 1) {
        result.errors.push_back("min_states must be at least 1");
    }
    if (sc.max_states < sc.min_states) {
        result.errors.push_back("max_states must not be below min_states");
    } else if (sc.max_states == sc.min_states) {
        result.warnings.push_back("Empty state range; bic and dic fall back to n_constant, cv yields no model");
    }
    if (sc.max_iterations < 1) {
        result.errors.push_back("max_iterations must be at least 1");
    }
    if (sc.cv_folds < 2) {
        result.errors.push_back("cv_folds must be at least 2");
    }
    if (sc.num_threads < 1) {
        result.errors.push_back("num_threads must be at least 1");
    }

    if (!(config.training_config.tolerance >= 0.0)) {
        result.errors.push_back("tolerance must be non-negative");
    }
    if (!(config.training_config.min_covariance > 0.0)) {
        result.errors.push_back("min_covariance must be positive");
    }
    if (config.training_config.kmeans_iterations < 1) {
        result.errors.push_back("kmeans_iterations must be at least 1");
    }

    result.is_valid = result.errors.empty();
    return result;
}

RecognizerConfig ConfigManager::load_validated(const std::string& file_path) {
    RecognizerConfig config;
    if (!load_config(file_path, config)) {
        throw ConfigError("Cannot load configuration: " + file_path);
    }

    auto validation = validate_config(config);
    for (const auto& warning : validation.warnings) {
        SIGNRECOG_LOG_WARN("Configuration warning: " + warning);
    }
    if (!validation.is_valid) {
        std::string message = "Invalid configuration " + file_path + ":";
        for (const auto& error : validation.errors) {
            message += " " + error + ";";
        }
        throw ConfigError(message);
    }

    return config;
}

cJSON* ConfigManager::selector_config_to_json(const selection::SelectorConfig& config) {
    cJSON* obj = cJSON_CreateObject();

    cJSON_AddNumberToObject(obj, "n_constant", config.n_constant);
    cJSON_AddNumberToObject(obj, "min_states", config.min_states);
    cJSON_AddNumberToObject(obj, "max_states", config.max_states);
    cJSON_AddNumberToObject(obj, "random_seed", config.random_seed);
    cJSON_AddBoolToObject(obj, "verbose", config.verbose);
    cJSON_AddNumberToObject(obj, "max_iterations", config.max_iterations);
    cJSON_AddNumberToObject(obj, "cv_folds", config.cv_folds);
    cJSON_AddNumberToObject(obj, "num_threads", config.num_threads);

    return obj;
}

bool ConfigManager::selector_config_from_json(const cJSON* json, selection::SelectorConfig& config) {
    cJSON* item = cJSON_GetObjectItem(json, "n_constant");
    if (item && cJSON_IsNumber(item)) config.n_constant = item->valueint;

    item = cJSON_GetObjectItem(json, "min_states");
    if (item && cJSON_IsNumber(item)) config.min_states = item->valueint;

    item = cJSON_GetObjectItem(json, "max_states");
    if (item && cJSON_IsNumber(item)) config.max_states = item->valueint;

    item = cJSON_GetObjectItem(json, "random_seed");
    if (item && cJSON_IsNumber(item)) {
        if (item->valuedouble < 0) {
            SIGNRECOG_LOG_ERROR("random_seed must be non-negative");
            return false;
        }
        config.random_seed = static_cast<std::uint32_t>(item->valuedouble);
    }

    item = cJSON_GetObjectItem(json, "verbose");
    if (item && cJSON_IsBool(item)) config.verbose = cJSON_IsTrue(item);

    item = cJSON_GetObjectItem(json, "max_iterations");
    if (item && cJSON_IsNumber(item)) config.max_iterations = item->valueint;

    item = cJSON_GetObjectItem(json, "cv_folds");
    if (item && cJSON_IsNumber(item)) config.cv_folds = item->valueint;

    item = cJSON_GetObjectItem(json, "num_threads");
    if (item && cJSON_IsNumber(item)) config.num_threads = item->valueint;

    return true;
}

cJSON* ConfigManager::training_config_to_json(const hmm::TrainingConfig& config) {
    cJSON* obj = cJSON_CreateObject();

    cJSON_AddNumberToObject(obj, "tolerance", config.tolerance);
    cJSON_AddNumberToObject(obj, "min_covariance", config.min_covariance);
    cJSON_AddNumberToObject(obj, "kmeans_iterations", config.kmeans_iterations);
    cJSON_AddBoolToObject(obj, "verbose", config.verbose);

    return obj;
}

bool ConfigManager::training_config_from_json(const cJSON* json, hmm::TrainingConfig& config) {
    cJSON* item = cJSON_GetObjectItem(json, "tolerance");
    if (item && cJSON_IsNumber(item)) config.tolerance = item->valuedouble;

    item = cJSON_GetObjectItem(json, "min_covariance");
    if (item && cJSON_IsNumber(item)) config.min_covariance = item->valuedouble;

    item = cJSON_GetObjectItem(json, "kmeans_iterations");
    if (item && cJSON_IsNumber(item)) config.kmeans_iterations = item->valueint;

    item = cJSON_GetObjectItem(json, "verbose");
    if (item && cJSON_IsBool(item)) config.verbose = cJSON_IsTrue(item);

    return true;
}

cJSON* ConfigManager::logging_config_to_json(const LoggingSettings& config) {
    cJSON* obj = cJSON_CreateObject();

    cJSON_AddStringToObject(obj, "level", log_level_name(config.level).c_str());
    cJSON_AddStringToObject(obj, "log_file_path", config.log_file_path.c_str());

    return obj;
}

bool ConfigManager::logging_config_from_json(const cJSON* json, LoggingSettings& config) {
    cJSON* item = cJSON_GetObjectItem(json, "level");
    if (item && cJSON_IsString(item)) {
        auto level = parse_log_level(item->valuestring);
        if (!level) {
            SIGNRECOG_LOG_ERROR("Unknown log level in configuration: " + std::string(item->valuestring));
            return false;
        }
        config.level = *level;
    }

    item = cJSON_GetObjectItem(json, "log_file_path");
    if (item && cJSON_IsString(item)) config.log_file_path = item->valuestring;

    return true;
}

void apply_logging(const LoggingSettings& settings) {
    logging_utils::initialize_logging(settings.log_file_path, settings.level == LogLevel::DEBUG);
    Logger::instance().set_level(settings.level);
}

} // namespace config
} // namespace signrecog
