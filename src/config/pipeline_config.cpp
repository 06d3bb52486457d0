#include "emodata/pipeline_config.h"
#include "emodata/corpus_registry.h"
#include "emodata/error_handler.h"
#include "emodata/logger.h"

#include <cJSON.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace emodata {
namespace config {

namespace {
    bool is_known_format(const std::string& name) {
        try {
            parse_source_format(name);
            return true;
        } catch (const InvalidParameterError&) {
            return false;
        }
    }

    SourceFormat effective_format(const PipelineConfig& config) {
        SourceFormat format = parse_source_format(config.source_format);
        return format == SourceFormat::AUTO ? detect_source_format(config.source_path) : format;
    }
}

bool ConfigManager::load_config(const std::string& file_path, PipelineConfig& config) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        EMODATA_LOG_ERROR("Cannot open configuration file: " + file_path);
        return false;
    }

    std::string json_content((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
    file.close();

    if (json_content.empty()) {
        EMODATA_LOG_ERROR("Configuration file is empty: " + file_path);
        return false;
    }

    bool success = config_from_json(json_content, config);
    if (success) {
        EMODATA_LOG_DEBUG("Loaded configuration from: " + file_path);
    } else {
        EMODATA_LOG_ERROR("Failed to parse configuration file: " + file_path);
    }
    return success;
}

bool ConfigManager::save_config(const std::string& file_path, const PipelineConfig& config) {
    auto validation = validate_config(config);
    if (!validation.is_valid) {
        EMODATA_LOG_ERROR("Cannot save invalid configuration");
        for (const auto& error : validation.errors) {
            EMODATA_LOG_ERROR("Validation error: " + error);
        }
        return false;
    }

    std::string json_str = config_to_json(config);
    if (json_str.empty()) {
        EMODATA_LOG_ERROR("Failed to serialize configuration to JSON");
        return false;
    }

    std::filesystem::path parent_dir = std::filesystem::path(file_path).parent_path();
    if (!parent_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent_dir, ec);
        if (ec) {
            EMODATA_LOG_ERROR("Cannot create directory " + parent_dir.string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(file_path);
    if (!file.is_open()) {
        EMODATA_LOG_ERROR("Cannot create configuration file: " + file_path);
        return false;
    }
    file << json_str;
    file.close();

    Logger::instance().log_file_operation("write", file_path, !file.fail());
    return !file.fail();
}

std::string ConfigManager::config_to_json(const PipelineConfig& config) {
    cJSON* root = cJSON_CreateObject();
    if (!root) return "";

    cJSON_AddStringToObject(root, "config_version", config.config_version.c_str());
    cJSON_AddStringToObject(root, "config_name", config.config_name.c_str());

    cJSON_AddStringToObject(root, "source_path", config.source_path.c_str());
    cJSON_AddStringToObject(root, "source_format", config.source_format.c_str());
    cJSON_AddStringToObject(root, "granularity", config.granularity.c_str());
    cJSON_AddStringToObject(root, "corpus", config.corpus.c_str());
    cJSON_AddStringToObject(root, "annotation_path", config.annotation_path.c_str());
    cJSON_AddStringToObject(root, "normalization", config.normalization.c_str());
    cJSON_AddBoolToObject(root, "binarize", config.binarize);
    cJSON_AddBoolToObject(root, "labels_from_names", config.labels_from_names);
    cJSON_AddNumberToObject(root, "pad_multiple", config.pad_multiple);

    cJSON_AddItemToObject(root, "logging", logging_settings_to_json(config.logging));

    char* json_string = cJSON_Print(root);
    std::string result = json_string ? json_string : "";

    if (json_string) free(json_string);
    cJSON_Delete(root);
    return result;
}

bool ConfigManager::config_from_json(const std::string& json_str, PipelineConfig& config) {
    cJSON* root = cJSON_Parse(json_str.c_str());
    if (!root) {
        EMODATA_LOG_ERROR("Invalid JSON format in configuration");
        return false;
    }
    if (!cJSON_IsObject(root)) {
        EMODATA_LOG_ERROR("Configuration root must be a JSON object");
        cJSON_Delete(root);
        return false;
    }

    auto read_string = [root](const char* key, std::string& target) {
        cJSON* item = cJSON_GetObjectItem(root, key);
        if (item && cJSON_IsString(item)) {
            target = item->valuestring;
        }
    };
    auto read_bool = [root](const char* key, bool& target) {
        cJSON* item = cJSON_GetObjectItem(root, key);
        if (item && cJSON_IsBool(item)) {
            target = cJSON_IsTrue(item);
        }
    };

    read_string("config_version", config.config_version);
    read_string("config_name", config.config_name);
    read_string("source_path", config.source_path);
    read_string("source_format", config.source_format);
    read_string("granularity", config.granularity);
    read_string("corpus", config.corpus);
    read_string("annotation_path", config.annotation_path);
    read_string("normalization", config.normalization);
    read_bool("binarize", config.binarize);
    read_bool("labels_from_names", config.labels_from_names);

    cJSON* item = cJSON_GetObjectItem(root, "pad_multiple");
    if (item && cJSON_IsNumber(item)) {
        config.pad_multiple = item->valueint;
    }

    item = cJSON_GetObjectItem(root, "logging");
    if (item && cJSON_IsObject(item)) {
        logging_settings_from_json(item, config.logging);
    }

    cJSON_Delete(root);
    return true;
}

ConfigValidationResult ConfigManager::validate_config(const PipelineConfig& config) {
    ConfigValidationResult result;

    if (config.config_version != get_supported_config_version()) {
        result.warnings.push_back("Configuration version " + config.config_version +
                                  " differs from supported version " + get_supported_config_version());
    }

    if (config.source_path.empty()) {
        result.errors.push_back("Source path must not be empty");
    } else if (!std::filesystem::exists(config.source_path)) {
        result.warnings.push_back("Source path does not exist: " + config.source_path);
    }

    bool format_known = is_known_format(config.source_format);
    if (!format_known) {
        result.errors.push_back("Unknown source format: " + config.source_format);
    }

    bool frame_level = config.granularity == "frame";
    if (config.granularity != "utterance" && !frame_level) {
        result.errors.push_back("Granularity must be utterance or frame, got: " + config.granularity);
    }

    if (config.normalization != "all" && config.normalization != "speaker" &&
        config.normalization != "none") {
        result.errors.push_back("Unknown normalization method: " + config.normalization);
    }

    if (!config.corpus.empty() && !CorpusRegistry::instance().contains(config.corpus)) {
        result.errors.push_back("Unknown corpus: " + config.corpus);
    }

    if (format_known && !config.source_path.empty()) {
        SourceFormat format = effective_format(config);
        bool needs_corpus = format == SourceFormat::NETCDF || format == SourceFormat::RAW;
        if (needs_corpus && config.corpus.empty()) {
            result.errors.push_back("Source format " + source_format_to_string(format) +
                                    " requires a corpus");
        }
        if (needs_corpus && frame_level) {
            result.errors.push_back("Source format " + source_format_to_string(format) +
                                    " does not support frame granularity");
        }
        if (config.pad_multiple > 0 && !frame_level && format != SourceFormat::RAW) {
            result.warnings.push_back("Padding is ignored for utterance-level datasets");
        }
    }

    if (config.pad_multiple < 0) {
        result.errors.push_back("Pad multiple must be non-negative");
    }

    LogLevel level;
    if (!Logger::level_from_string(config.logging.level, level)) {
        result.errors.push_back("Unknown log level: " + config.logging.level);
    }

    result.is_valid = result.errors.empty();
    return result;
}

PipelineConfig ConfigManager::get_default_config() {
    return PipelineConfig();
}

cJSON* ConfigManager::logging_settings_to_json(const LoggingSettings& settings) {
    cJSON* obj = cJSON_CreateObject();

    cJSON_AddStringToObject(obj, "level", settings.level.c_str());
    cJSON_AddStringToObject(obj, "log_file", settings.log_file.c_str());
    cJSON_AddBoolToObject(obj, "use_colors", settings.use_colors);

    return obj;
}

void ConfigManager::logging_settings_from_json(const cJSON* json, LoggingSettings& settings) {
    cJSON* item = cJSON_GetObjectItem(json, "level");
    if (item && cJSON_IsString(item)) settings.level = item->valuestring;

    item = cJSON_GetObjectItem(json, "log_file");
    if (item && cJSON_IsString(item)) settings.log_file = item->valuestring;

    item = cJSON_GetObjectItem(json, "use_colors");
    if (item && cJSON_IsBool(item)) settings.use_colors = cJSON_IsTrue(item);
}

LoaderOptions to_loader_options(const PipelineConfig& config) {
    LoaderOptions options;
    if (!config.corpus.empty()) {
        options.corpus = config.corpus;
    }
    if (!config.annotation_path.empty()) {
        options.annotation_path = config.annotation_path;
    }
    options.normalization = parse_normalization_method(config.normalization);
    options.binarize = config.binarize;
    options.labels_from_names = config.labels_from_names;
    return options;
}

void apply_logging_settings(const LoggingSettings& settings) {
    Logger& logger = Logger::instance();

    LogLevel level;
    if (Logger::level_from_string(settings.level, level)) {
        logger.set_level(level);
    } else {
        EMODATA_LOG_WARN("Ignoring unknown log level: " + settings.level);
    }

    LogFormat format = logger.get_format();
    format.use_colors = settings.use_colors;
    logger.set_format(format);

    if (!settings.log_file.empty()) {
        logger.set_log_file(settings.log_file);
        logger.set_output(LogOutput::BOTH);
    }
}

Dataset build_dataset(const PipelineConfig& config) {
    ConfigManager manager;
    auto validation = manager.validate_config(config);
    for (const auto& warning : validation.warnings) {
        EMODATA_LOG_WARN(config.config_name + ": " + warning);
    }
    if (!validation.is_valid) {
        std::ostringstream oss;
        oss << "Invalid configuration '" << config.config_name << "'";
        for (const auto& error : validation.errors) {
            oss << "; " << error;
        }
        throw ConfigurationError(oss.str());
    }

    SourceFormat format = effective_format(config);
    Granularity granularity = format == SourceFormat::RAW ? Granularity::RAW
                                                          : parse_granularity(config.granularity);

    Dataset dataset = load_dataset(config.source_path, format, granularity, to_loader_options(config));
    if (config.pad_multiple > 0 && dataset.granularity != Granularity::UTTERANCE) {
        dataset.pad_sequences(config.pad_multiple);
    }
    return dataset;
}

} // namespace config
} // namespace emodata
