#include "emodata/cli_interface.h"
#include "emodata/arff_reader.h"
#include "emodata/corpus_registry.h"
#include "emodata/error_handler.h"
#include "emodata/logger.h"
#include "emodata/packed_table.h"

#include <cJSON.h>
#include <hdf5.h>
#include <zlib.h>
#include <Eigen/Core>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace emodata {
namespace cli {

const std::string CliInterface::RESET = "\033[0m";
const std::string CliInterface::BOLD = "\033[1m";
const std::string CliInterface::RED = "\033[31m";
const std::string CliInterface::GREEN = "\033[32m";
const std::string CliInterface::CYAN = "\033[36m";

namespace {
    const char* VERSION_STRING = "1.0.0";
}

CliInterface::CliInterface(std::ostream& out)
    : out_(out) {
}

CliResult CliInterface::run(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return run(args);
}

CliResult CliInterface::run(const std::vector<std::string>& raw_args) {
    auto start_time = std::chrono::steady_clock::now();
    CliArguments args = parse_arguments(raw_args);

    quiet_ = args.quiet;
    use_color_ = !args.no_color && &out_ == &std::cout && isatty(STDOUT_FILENO) != 0;
    configure_logging(args);

    CliResult result;
    std::string error;
    if (!validate_arguments(args, error)) {
        EMODATA_LOG_ERROR(error);
        result.success = false;
        result.exit_code = static_cast<int>(ErrorCode::INVALID_PARAMETERS);
        result.message = error;
        out_ << "Run 'emodata help' for usage.\n";
        return result;
    }

    switch (args.command) {
        case CliCommand::INFO:
            result = execute_info(args);
            break;
        case CliCommand::BATCH:
            result = execute_batch(args);
            break;
        case CliCommand::PACK:
            result = execute_pack(args);
            break;
        case CliCommand::CORPORA:
            result = execute_corpora(args);
            break;
        case CliCommand::VERSION:
            result = execute_version(args);
            break;
        case CliCommand::HELP:
        default:
            result = execute_help(args);
            break;
    }

    result.total_time = std::chrono::steady_clock::now() - start_time;
    if (args.command == CliCommand::BATCH || !result.success) {
        print_result_summary(result);
    }
    return result;
}

CliArguments CliInterface::parse_arguments(const std::vector<std::string>& args) {
    CliArguments parsed;
    if (args.empty()) {
        parsed.command = CliCommand::HELP;
        return parsed;
    }

    parsed.command = parse_command(args[0]);

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (parse_flag(args, i, parsed)) {
            if (!parsed.parse_error.empty()) {
                break;
            }
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            parsed.parse_error = "Unknown option: " + arg;
            break;
        }

        // Positional arguments
        if (parsed.command == CliCommand::BATCH) {
            parsed.batch_inputs.push_back(arg);
        } else if ((parsed.command == CliCommand::INFO || parsed.command == CliCommand::PACK) &&
                   parsed.input_path.empty()) {
            parsed.input_path = arg;
        } else if (parsed.command == CliCommand::PACK && parsed.output_path.empty()) {
            parsed.output_path = arg;
        } else {
            parsed.parse_error = "Unexpected argument: " + arg;
            break;
        }
    }

    return parsed;
}

CliCommand CliInterface::parse_command(const std::string& command_str) {
    std::string cmd = command_str;
    std::transform(cmd.begin(), cmd.end(), cmd.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (cmd == "info" || cmd == "i") return CliCommand::INFO;
    if (cmd == "batch" || cmd == "b") return CliCommand::BATCH;
    if (cmd == "pack" || cmd == "p") return CliCommand::PACK;
    if (cmd == "corpora" || cmd == "list") return CliCommand::CORPORA;
    if (cmd == "version" || cmd == "--version") return CliCommand::VERSION;
    return CliCommand::HELP;
}

bool CliInterface::parse_flag(const std::vector<std::string>& args, size_t& index, CliArguments& out) {
    const std::string& arg = args[index];
    const bool has_value = index + 1 < args.size();

    auto take_value = [&](std::string& target) {
        if (!has_value) {
            out.parse_error = "Option " + arg + " requires a value";
            return true;
        }
        target = args[++index];
        return true;
    };
    auto take_optional = [&](std::optional<std::string>& target) {
        std::string value;
        take_value(value);
        if (out.parse_error.empty()) {
            target = value;
        }
        return true;
    };

    if (arg == "-i" || arg == "--input") return take_value(out.input_path);
    if (arg == "-o" || arg == "--output") return take_value(out.output_path);
    if (arg == "-c" || arg == "--config") return take_value(out.config_path);
    if (arg == "--log-file") return take_value(out.log_file);
    if (arg == "--corpus") return take_optional(out.corpus);
    if (arg == "--format") return take_optional(out.source_format);
    if (arg == "--granularity") return take_optional(out.granularity);
    if (arg == "--normalize") return take_optional(out.normalization);
    if (arg == "--annotations") return take_optional(out.annotation_path);
    if (arg == "--pad") {
        std::string value;
        take_value(value);
        if (!out.parse_error.empty()) {
            return true;
        }
        try {
            size_t consumed = 0;
            int multiple = std::stoi(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            out.pad_multiple = multiple;
        } catch (const std::logic_error&) {
            out.parse_error = "Invalid value for --pad: " + value;
        }
        return true;
    }
    if (arg == "--binarize") {
        out.binarize = true;
        return true;
    }
    if (arg == "--labels-from-names") {
        out.labels_from_names = true;
        return true;
    }
    if (arg == "-v" || arg == "--verbose") {
        out.verbose = true;
        return true;
    }
    if (arg == "-q" || arg == "--quiet") {
        out.quiet = true;
        return true;
    }
    if (arg == "--no-color") {
        out.no_color = true;
        return true;
    }
    if (arg == "-h" || arg == "--help") {
        out.command = CliCommand::HELP;
        return true;
    }
    return false;
}

bool CliInterface::validate_arguments(const CliArguments& args, std::string& error) {
    if (!args.parse_error.empty()) {
        error = args.parse_error;
        return false;
    }
    if (args.verbose && args.quiet) {
        error = "Options --verbose and --quiet are mutually exclusive";
        return false;
    }

    switch (args.command) {
        case CliCommand::INFO:
            if (args.input_path.empty() && args.config_path.empty()) {
                error = "Info command requires a source path or a configuration file";
                return false;
            }
            break;
        case CliCommand::BATCH:
            if (args.batch_inputs.empty() && args.config_path.empty()) {
                error = "Batch command requires at least one configuration file";
                return false;
            }
            break;
        case CliCommand::PACK:
            if (args.input_path.empty()) {
                error = "Pack command requires an input ARFF file";
                return false;
            }
            break;
        default:
            break;
    }

    if (args.pad_multiple && *args.pad_multiple < 0) {
        error = "Pad multiple must be non-negative";
        return false;
    }
    return true;
}

void CliInterface::configure_logging(const CliArguments& args) {
    Logger& logger = Logger::instance();
    if (args.verbose) {
        logger.set_level(LogLevel::DEBUG);
    } else if (args.quiet) {
        logger.set_level(LogLevel::WARN);
    }

    if (args.no_color) {
        LogFormat format = logger.get_format();
        format.use_colors = false;
        logger.set_format(format);
    }

    if (!args.log_file.empty()) {
        logger.set_log_file(args.log_file);
        logger.set_output(LogOutput::BOTH);
    }
}

config::PipelineConfig CliInterface::create_config_from_args(const CliArguments& args) {
    config::ConfigManager manager;
    config::PipelineConfig pipeline = manager.get_default_config();
    pipeline.config_name = "command-line";

    if (!args.config_path.empty() && !manager.load_config(args.config_path, pipeline)) {
        throw ConfigurationError("Cannot load configuration file: " + args.config_path);
    }

    if (!args.input_path.empty()) pipeline.source_path = args.input_path;
    if (args.corpus) pipeline.corpus = *args.corpus;
    if (args.source_format) pipeline.source_format = *args.source_format;
    if (args.granularity) pipeline.granularity = *args.granularity;
    if (args.normalization) pipeline.normalization = *args.normalization;
    if (args.annotation_path) pipeline.annotation_path = *args.annotation_path;
    if (args.pad_multiple) pipeline.pad_multiple = *args.pad_multiple;
    if (args.binarize) pipeline.binarize = true;
    if (args.labels_from_names) pipeline.labels_from_names = true;
    if (!args.log_file.empty()) pipeline.logging.log_file = args.log_file;
    if (args.no_color) pipeline.logging.use_colors = false;

    return pipeline;
}

CliResult CliInterface::execute_info(const CliArguments& args) {
    CliResult result;
    result.configs_processed = 1;

    try {
        config::PipelineConfig pipeline = create_config_from_args(args);
        if (!args.config_path.empty()) {
            config::apply_logging_settings(pipeline.logging);
            configure_logging(args);
        }

        Dataset dataset = config::build_dataset(pipeline);
        print_dataset_summary(dataset);

        result.success = true;
        result.exit_code = 0;
        result.configs_succeeded = 1;
        result.message = "Loaded " + std::to_string(dataset.n_instances()) +
                         " instances from " + pipeline.source_path;
    } catch (const std::exception& e) {
        result = failure_result(e, "info");
        result.configs_processed = 1;
        result.configs_failed = 1;
    }
    return result;
}

CliResult CliInterface::execute_batch(const CliArguments& args) {
    CliResult result;
    ErrorHandler& errors = ErrorHandler::instance();
    config::ConfigManager manager;

    std::vector<std::string> inputs = args.batch_inputs;
    if (!args.config_path.empty()) {
        inputs.insert(inputs.begin(), args.config_path);
    }

    ErrorCode last_failure = ErrorCode::SUCCESS;
    for (const auto& path : inputs) {
        ++result.configs_processed;
        errors.set_context("config", path);

        try {
            config::PipelineConfig pipeline;
            if (!manager.load_config(path, pipeline)) {
                throw ConfigurationError("Cannot load configuration file: " + path);
            }
            config::apply_logging_settings(pipeline.logging);
            configure_logging(args);

            Dataset dataset = config::build_dataset(pipeline);
            ++result.configs_succeeded;

            if (!quiet_) {
                out_ << color_text("[ok]", GREEN) << " " << pipeline.config_name << ": "
                     << dataset.n_instances() << " instances, "
                     << dataset.n_classes() << " classes, "
                     << dataset.n_speakers() << " speakers\n";
            }
        } catch (const std::exception& e) {
            // Skip this configuration and continue with the next one
            errors.report_exception(e, "batch");
            const auto* dataset_error = dynamic_cast<const DatasetException*>(&e);
            last_failure = dataset_error ? dataset_error->get_error_code() : ErrorCode::GENERAL_ERROR;

            ++result.configs_failed;
            result.errors.push_back(path + ": " + e.what());
            if (!quiet_) {
                out_ << color_text("[failed]", RED) << " " << path << ": " << e.what() << "\n";
            }
        }
    }
    errors.clear_context();

    result.success = result.configs_failed == 0;
    result.exit_code = result.success ? 0 : errors.get_exit_code(last_failure);
    result.message = std::to_string(result.configs_succeeded) + " of " +
                     std::to_string(result.configs_processed) + " configurations built";
    return result;
}

CliResult CliInterface::execute_pack(const CliArguments& args) {
    CliResult result;
    const std::string output = args.output_path.empty()
        ? cli_utils::default_pack_output(args.input_path) : args.output_path;

    try {
        io::ArffParser parser;
        io::ArffRelation relation = parser.parse_file(args.input_path);
        std::vector<uint8_t> bytes = io::encode_packed_table(relation);

        std::ofstream file(output, std::ios::binary);
        if (!file.is_open()) {
            throw SourceReadError("Cannot create packed table: " + output);
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.close();
        if (file.fail()) {
            throw SourceReadError("Failed writing packed table: " + output);
        }
        Logger::instance().log_file_operation("write", output, true);

        result.success = true;
        result.exit_code = 0;
        result.message = "Packed " + std::to_string(relation.data.size()) + " rows into " + output;
        if (!quiet_) {
            out_ << result.message << " (" << bytes.size() << " bytes)\n";
        }
    } catch (const std::exception& e) {
        result = failure_result(e, "pack");
    }
    return result;
}

CliResult CliInterface::execute_corpora(const CliArguments& args) {
    (void)args;
    CliResult result;
    const CorpusRegistry& registry = CorpusRegistry::instance();

    out_ << color_text("Registered corpora:", BOLD) << "\n";
    char line[128];
    for (const auto& id : registry.corpus_ids()) {
        const CorpusMetadata& corpus = registry.resolve(id);
        std::snprintf(line, sizeof(line), "  %-12s %3zu classes %4zu speakers%s%s\n",
                      id.c_str(), corpus.classes().size(), corpus.speakers.size(),
                      corpus.has_gender_split() ? "  gender" : "",
                      corpus.has_affect_groups() ? "  arousal/valence" : "");
        out_ << line;
    }

    result.success = true;
    result.exit_code = 0;
    result.message = std::to_string(registry.size()) + " corpora";
    return result;
}

CliResult CliInterface::execute_help(const CliArguments& args) {
    (void)args;
    CliResult result;
    result.success = true;
    result.exit_code = 0;
    result.message = "Help information displayed";
    print_help();
    return result;
}

CliResult CliInterface::execute_version(const CliArguments& args) {
    (void)args;
    CliResult result;
    result.success = true;
    result.exit_code = 0;
    result.message = "Version information displayed";
    print_version();
    return result;
}

CliResult CliInterface::failure_result(const std::exception& e, const std::string& operation) {
    ErrorHandler& errors = ErrorHandler::instance();
    errors.report_exception(e, operation);

    const auto* dataset_error = dynamic_cast<const DatasetException*>(&e);
    ErrorCode code = dataset_error ? dataset_error->get_error_code() : ErrorCode::GENERAL_ERROR;

    CliResult result;
    result.success = false;
    result.exit_code = errors.get_exit_code(code);
    result.message = e.what();
    result.errors.push_back(ErrorHandler::code_to_string(code) + ": " + e.what());
    return result;
}

void CliInterface::print_dataset_summary(const Dataset& dataset) {
    out_ << color_text("Corpus: ", BOLD) << dataset.corpus << "\n";
    out_ << "Granularity: " << granularity_to_string(dataset.granularity) << "\n";
    out_ << "Instances: " << dataset.n_instances() << "\n";
    out_ << "Features: " << dataset.n_features() << "\n";

    if (!dataset.sequences.empty()) {
        auto by_rows = [](const Eigen::MatrixXd& a, const Eigen::MatrixXd& b) { return a.rows() < b.rows(); };
        auto [shortest, longest] = std::minmax_element(dataset.sequences.begin(),
                                                       dataset.sequences.end(), by_rows);
        out_ << "Sequence length: " << shortest->rows() << " - " << longest->rows() << "\n";
    }

    out_ << "Classes (" << dataset.n_classes() << "):\n";
    auto counts = class_counts(dataset);
    for (const auto& label : dataset.classes) {
        out_ << "  " << label << ": " << counts[label] << "\n";
    }

    out_ << "Speakers: " << dataset.n_speakers() << "\n";
    for (const auto& [partition, indices] : dataset.gender_indices) {
        out_ << "  " << partition << ": " << indices.size() << " instances\n";
    }

    out_ << "Label views:";
    for (const auto& view : dataset.labels) {
        out_ << " " << view.first;
    }
    out_ << "\n";
}

void CliInterface::print_help() {
    out_ << color_text("USAGE:", BOLD) << "\n";
    out_ << "  emodata <command> [options] [arguments]\n\n";

    out_ << color_text("COMMANDS:", BOLD) << "\n";
    out_ << "  info, i           Load a dataset source and print its summary\n";
    out_ << "  batch, b          Build every dataset described by the given config files\n";
    out_ << "  pack, p           Convert an ARFF file to the packed binary encoding\n";
    out_ << "  corpora           List registered corpora\n";
    out_ << "  version           Show version information\n";
    out_ << "  help              Show this help message\n\n";

    out_ << color_text("OPTIONS:", BOLD) << "\n";
    out_ << "  -i, --input PATH        Source file (ARFF, .bin, netCDF or audio list)\n";
    out_ << "  -o, --output PATH       Output path for pack\n";
    out_ << "  -c, --config FILE       Pipeline configuration file\n";
    out_ << "  --corpus NAME           Corpus id (required for netCDF and raw audio)\n";
    out_ << "  --format FMT            auto, arff, packed, netcdf or raw\n";
    out_ << "  --granularity G         utterance or frame\n";
    out_ << "  --normalize METHOD      all, speaker or none\n";
    out_ << "  --binarize              Build one-vs-rest and arousal/valence label views\n";
    out_ << "  --labels-from-names     Take label codes from instance names\n";
    out_ << "  --annotations FILE      Classification annotation CSV\n";
    out_ << "  --pad N                 Zero-pad sequences to a multiple of N frames\n";
    out_ << "  --log-file FILE         Also write log messages to FILE\n";
    out_ << "  -v, --verbose           Verbose output\n";
    out_ << "  -q, --quiet             Quiet mode\n";
    out_ << "  --no-color              Disable colored output\n\n";

    out_ << color_text("EXAMPLES:", BOLD) << "\n";
    out_ << "  emodata info features/emodb.arff --binarize\n";
    out_ << "  emodata info embeddings.nc --corpus iemocap --normalize all\n";
    out_ << "  emodata batch configs/*.json\n";
    out_ << "  emodata pack frames.arff frames.bin\n";
}

void CliInterface::print_version() {
    out_ << "emodata v" << VERSION_STRING << "\n";
    out_ << "Dependencies:\n";
    out_ << cli_utils::get_dependency_versions() << "\n";
}

void CliInterface::print_result_summary(const CliResult& result) {
    if (quiet_ && result.success) return;

    out_ << "\n" << color_text("=== SUMMARY ===", BOLD) << "\n";
    if (result.success) {
        out_ << color_text("SUCCESS", GREEN + BOLD) << ": " << result.message << "\n";
    } else {
        out_ << color_text("FAILED", RED + BOLD) << ": " << result.message << "\n";
    }

    if (result.configs_processed > 1) {
        out_ << "Configurations processed: " << result.configs_processed << "\n";
        out_ << "Configurations succeeded: " << result.configs_succeeded << "\n";
        if (result.configs_failed > 0) {
            out_ << color_text("Configurations failed: " + std::to_string(result.configs_failed), RED) << "\n";
        }
    }

    char elapsed[32];
    std::snprintf(elapsed, sizeof(elapsed), "%.2fs", result.total_time.count());
    out_ << "Time: " << elapsed << "\n";
}

std::string CliInterface::color_text(const std::string& text, const std::string& color) const {
    if (!use_color_) {
        return text;
    }
    return color + text + RESET;
}

namespace cli_utils {

    std::string get_dependency_versions() {
        std::ostringstream oss;
        oss << "  Eigen " << EIGEN_WORLD_VERSION << "." << EIGEN_MAJOR_VERSION << "."
            << EIGEN_MINOR_VERSION << "\n";
        oss << "  zlib " << zlibVersion() << "\n";
        oss << "  HDF5 " << H5_VERS_MAJOR << "." << H5_VERS_MINOR << "." << H5_VERS_RELEASE << "\n";
        oss << "  cJSON " << cJSON_Version();
        return oss.str();
    }

    std::string default_pack_output(const std::string& input_path) {
        std::filesystem::path path(input_path);
        path.replace_extension(io::packed_constants::FILE_EXTENSION);
        return path.string();
    }

} // namespace cli_utils

} // namespace cli
} // namespace emodata
