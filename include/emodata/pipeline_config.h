#pragma once

#include "dataset.h"
#include "dataset_loader.h"
#include <string>
#include <vector>

// Forward declaration for JSON handling
struct cJSON;

namespace emodata {
namespace config {

    /**
     * @brief Logging section of a pipeline configuration
     */
    struct LoggingSettings {
        std::string level = "info";     // debug, info, warn, error, fatal
        std::string log_file;           // empty = console only
        bool use_colors = true;
    };

    /**
     * @brief One dataset-building configuration
     *
     * Enumerated fields are kept as strings so that validation can report
     * unknown values instead of failing at parse time.
     */
    struct PipelineConfig {
        std::string config_version = "1.0";
        std::string config_name = "default";

        std::string source_path;
        std::string source_format = "auto";    // auto, arff, packed, netcdf, raw
        std::string granularity = "utterance"; // utterance, frame
        std::string corpus;                    // empty = relation name
        std::string annotation_path;           // empty = reader default
        std::string normalization = "speaker"; // all, speaker, none
        bool binarize = false;
        bool labels_from_names = false;
        int pad_multiple = 0;                  // 0 = no padding

        LoggingSettings logging;
    };

    struct ConfigValidationResult {
        bool is_valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        ConfigValidationResult() : is_valid(true) {}
    };

    /**
     * @brief Loads, saves and validates pipeline configurations (cJSON)
     */
    class ConfigManager {
    public:
        ConfigManager() = default;

        // Configuration loading and saving
        bool load_config(const std::string& file_path, PipelineConfig& config);
        bool save_config(const std::string& file_path, const PipelineConfig& config);

        // JSON serialization
        std::string config_to_json(const PipelineConfig& config);
        bool config_from_json(const std::string& json_str, PipelineConfig& config);

        ConfigValidationResult validate_config(const PipelineConfig& config);

        PipelineConfig get_default_config();
        std::string get_supported_config_version() const { return "1.0"; }

    private:
        cJSON* logging_settings_to_json(const LoggingSettings& settings);
        void logging_settings_from_json(const cJSON* json, LoggingSettings& settings);
    };

    /**
     * @brief Loader options described by a configuration
     * @throws InvalidParameterError for unknown enumerated values
     */
    LoaderOptions to_loader_options(const PipelineConfig& config);

    /**
     * @brief Apply the logging section to the global logger
     */
    void apply_logging_settings(const LoggingSettings& settings);

    /**
     * @brief Validate a configuration and build its dataset, padding
     *        sequences when pad_multiple > 0
     * @throws ConfigurationError when validation fails
     */
    Dataset build_dataset(const PipelineConfig& config);

} // namespace config
} // namespace emodata
