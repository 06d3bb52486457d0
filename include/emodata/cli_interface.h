#pragma once

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "dataset.h"
#include "pipeline_config.h"

namespace emodata {
namespace cli {

    /**
     * @brief Commands supported by the emodata tool
     */
    enum class CliCommand {
        INFO,           // Load one source and print the dataset summary
        BATCH,          // Build every dataset described by a list of config files
        PACK,           // Convert ARFF text to the packed binary encoding
        CORPORA,        // List registered corpora
        HELP,
        VERSION
    };

    /**
     * @brief Parsed command line
     *
     * Optional fields override the corresponding configuration value only
     * when given on the command line.
     */
    struct CliArguments {
        CliCommand command = CliCommand::HELP;

        std::string input_path;
        std::string output_path;
        std::string config_path;
        std::string log_file;
        std::vector<std::string> batch_inputs;

        std::optional<std::string> corpus;
        std::optional<std::string> source_format;
        std::optional<std::string> granularity;
        std::optional<std::string> normalization;
        std::optional<std::string> annotation_path;
        std::optional<int> pad_multiple;
        bool binarize = false;
        bool labels_from_names = false;

        bool verbose = false;
        bool quiet = false;
        bool no_color = false;

        std::string parse_error;    // non-empty when the command line is malformed
    };

    /**
     * @brief CLI operation result
     */
    struct CliResult {
        bool success = false;
        int exit_code = 0;
        std::string message;
        std::vector<std::string> warnings;
        std::vector<std::string> errors;

        size_t configs_processed = 0;
        size_t configs_succeeded = 0;
        size_t configs_failed = 0;
        std::chrono::duration<double> total_time{0};
    };

    /**
     * @brief Command-line front end for dataset loading
     *
     * Dataset failures are reported through the ErrorHandler and mapped to
     * the exit code of their ErrorCode. The batch command skips failed
     * configurations and continues with the next one.
     */
    class CliInterface {
    public:
        explicit CliInterface(std::ostream& out = std::cout);

        CliResult run(int argc, char* argv[]);
        CliResult run(const std::vector<std::string>& args);

        CliArguments parse_arguments(const std::vector<std::string>& args);

        // Command execution
        CliResult execute_info(const CliArguments& args);
        CliResult execute_batch(const CliArguments& args);
        CliResult execute_pack(const CliArguments& args);
        CliResult execute_corpora(const CliArguments& args);
        CliResult execute_help(const CliArguments& args);
        CliResult execute_version(const CliArguments& args);

        /**
         * @brief Configuration for the info command: the -c file if given,
         *        with command-line overrides applied
         * @throws ConfigurationError when the config file cannot be loaded
         */
        config::PipelineConfig create_config_from_args(const CliArguments& args);

    private:
        std::ostream& out_;
        bool quiet_ = false;
        bool use_color_ = false;

        CliCommand parse_command(const std::string& command_str);
        bool parse_flag(const std::vector<std::string>& args, size_t& index, CliArguments& out);
        bool validate_arguments(const CliArguments& args, std::string& error);
        void configure_logging(const CliArguments& args);

        void print_dataset_summary(const Dataset& dataset);
        void print_help();
        void print_version();
        void print_result_summary(const CliResult& result);

        CliResult failure_result(const std::exception& e, const std::string& operation);
        std::string color_text(const std::string& text, const std::string& color) const;

        // ANSI color codes
        static const std::string RESET;
        static const std::string BOLD;
        static const std::string RED;
        static const std::string GREEN;
        static const std::string CYAN;
    };

    namespace cli_utils {
        std::string get_dependency_versions();
        std::string default_pack_output(const std::string& input_path);
    }

} // namespace cli
} // namespace emodata
