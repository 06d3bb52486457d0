#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <exception>
#include <chrono>
#include <mutex>

namespace emodata {

/**
 * @brief Error codes for dataset construction failures
 *
 * Every code other than SUCCESS is fatal to the dataset build in
 * progress; callers may catch and skip a whole corpus or configuration.
 */
enum class ErrorCode {
    SUCCESS = 0,
    GENERAL_ERROR = 1,          // Exception not raised by this library
    UNKNOWN_CORPUS = 2,         // Corpus id not registered
    SOURCE_READ_ERROR = 3,      // Artifact missing, unreadable or corrupt
    MISSING_LABEL = 4,          // Feature name absent from annotation join
    UNKNOWN_LABEL = 5,          // Label token not in the corpus label map
    UNKNOWN_SPEAKER = 6,        // Speaker id not in the corpus speaker list
    INVALID_PARAMETERS = 7,     // Bad argument to a pipeline stage
    CONFIGURATION_ERROR = 8     // Invalid pipeline configuration
};

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory {
    SYSTEM,         // File I/O and container access
    METADATA,       // Corpus registry lookups (corpus, label, speaker)
    PARAMETER,      // Parameter and configuration validation
    INTERNAL        // Anything else
};

/**
 * @brief Error information carried by every DatasetException
 */
struct ErrorInfo {
    ErrorCode code;
    ErrorCategory category;
    std::string message;
    std::chrono::system_clock::time_point timestamp;

    // Context information (corpus, path, instance name, ...)
    std::unordered_map<std::string, std::string> context;

    ErrorInfo(ErrorCode err_code, const std::string& msg = "")
        : code(err_code), category(ErrorCategory::INTERNAL), message(msg),
          timestamp(std::chrono::system_clock::now()) {
        classify_error();
    }

private:
    void classify_error();
};

/**
 * @brief Base exception for all dataset construction errors
 */
class DatasetException : public std::exception {
public:
    explicit DatasetException(const ErrorInfo& info) : error_info_(info) {}
    DatasetException(ErrorCode code, const std::string& message)
        : error_info_(code, message) {}

    const char* what() const noexcept override {
        return error_info_.message.c_str();
    }

    const ErrorInfo& get_error_info() const { return error_info_; }
    ErrorCode get_error_code() const { return error_info_.code; }

private:
    ErrorInfo error_info_;
};

class UnknownCorpusError : public DatasetException {
public:
    explicit UnknownCorpusError(const std::string& corpus)
        : DatasetException(ErrorCode::UNKNOWN_CORPUS,
                           "Corpus " + corpus + " hasn't been implemented yet.") {}
};

class SourceReadError : public DatasetException {
public:
    explicit SourceReadError(const std::string& message)
        : DatasetException(ErrorCode::SOURCE_READ_ERROR, message) {}
};

class MissingLabelError : public DatasetException {
public:
    explicit MissingLabelError(const std::string& name)
        : DatasetException(ErrorCode::MISSING_LABEL,
                           "No label annotation for instance " + name) {}
};

class UnknownLabelError : public DatasetException {
public:
    explicit UnknownLabelError(const std::string& message)
        : DatasetException(ErrorCode::UNKNOWN_LABEL, message) {}
};

class UnknownSpeakerError : public DatasetException {
public:
    explicit UnknownSpeakerError(const std::string& message)
        : DatasetException(ErrorCode::UNKNOWN_SPEAKER, message) {}
};

class InvalidParameterError : public DatasetException {
public:
    explicit InvalidParameterError(const std::string& message)
        : DatasetException(ErrorCode::INVALID_PARAMETERS, message) {}
};

class ConfigurationError : public DatasetException {
public:
    explicit ConfigurationError(const std::string& message)
        : DatasetException(ErrorCode::CONFIGURATION_ERROR, message) {}
};

/**
 * @brief Records errors reported by batch drivers
 *
 * The core never reports into the handler itself; it throws. Drivers that
 * skip failed configurations report the caught exception here so the
 * failures are logged once and summarised at the end of a run.
 */
class ErrorHandler {
public:
    ErrorHandler();

    static ErrorHandler& instance();

    // Error reporting methods
    void report_error(ErrorCode code, const std::string& message = "");
    void report_error(const ErrorInfo& error_info);
    void report_exception(const std::exception& e, const std::string& context = "");

    void set_log_errors(bool log_errors) { log_errors_ = log_errors; }

    // Error statistics
    size_t get_error_count() const;
    size_t get_error_count(ErrorCode code) const;
    size_t get_error_count(ErrorCategory category) const;
    std::vector<ErrorInfo> get_recent_errors(size_t max_count = 10) const;
    void clear_error_history();

    // Context management
    void set_context(const std::string& key, const std::string& value);
    void clear_context();
    std::string get_context_string() const;

    int get_exit_code(ErrorCode code) const { return static_cast<int>(code); }

    static std::string code_to_string(ErrorCode code);
    static std::string category_to_string(ErrorCategory category);

private:
    bool log_errors_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_;
    mutable std::mutex error_mutex_;
    std::unordered_map<std::string, std::string> current_context_;

    std::string format_error_message(const ErrorInfo& error_info) const;
};

} // namespace emodata
