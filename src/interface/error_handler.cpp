#include "emodata/error_handler.h"
#include "emodata/logger.h"
#include <algorithm>
#include <sstream>
#include <map>

namespace emodata {

void ErrorInfo::classify_error() {
    switch (code) {
        case ErrorCode::SOURCE_READ_ERROR:
        case ErrorCode::MISSING_LABEL:
            category = ErrorCategory::SYSTEM;
            break;

        case ErrorCode::UNKNOWN_CORPUS:
        case ErrorCode::UNKNOWN_LABEL:
        case ErrorCode::UNKNOWN_SPEAKER:
            category = ErrorCategory::METADATA;
            break;

        case ErrorCode::INVALID_PARAMETERS:
        case ErrorCode::CONFIGURATION_ERROR:
            category = ErrorCategory::PARAMETER;
            break;

        default:
            category = ErrorCategory::INTERNAL;
            break;
    }
}

ErrorHandler::ErrorHandler()
    : log_errors_(true)
    , max_history_size_(100) {
}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::report_error(ErrorCode code, const std::string& message) {
    ErrorInfo error_info(code, message);
    report_error(error_info);
}

void ErrorHandler::report_error(const ErrorInfo& error_info) {
    ErrorInfo recorded = error_info;
    std::string formatted;
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        for (const auto& entry : current_context_) {
            recorded.context.emplace(entry.first, entry.second);
        }

        error_history_.push_back(recorded);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        formatted = format_error_message(recorded);
    }

    if (log_errors_) {
        EMODATA_LOG_ERROR(formatted);
    }
}

void ErrorHandler::report_exception(const std::exception& e, const std::string& context) {
    const auto* dataset_error = dynamic_cast<const DatasetException*>(&e);
    ErrorInfo info = dataset_error ? dataset_error->get_error_info()
                                   : ErrorInfo(ErrorCode::GENERAL_ERROR, e.what());
    if (!context.empty()) {
        info.context["operation"] = context;
    }
    report_error(info);
}

size_t ErrorHandler::get_error_count() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_history_.size();
}

size_t ErrorHandler::get_error_count(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return std::count_if(error_history_.begin(), error_history_.end(),
        [code](const ErrorInfo& info) { return info.code == code; });
}

size_t ErrorHandler::get_error_count(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return std::count_if(error_history_.begin(), error_history_.end(),
        [category](const ErrorInfo& info) { return info.category == category; });
}

std::vector<ErrorInfo> ErrorHandler::get_recent_errors(size_t max_count) const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    size_t start_idx = (error_history_.size() > max_count) ?
        error_history_.size() - max_count : 0;
    return std::vector<ErrorInfo>(error_history_.begin() + start_idx, error_history_.end());
}

void ErrorHandler::clear_error_history() {
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_history_.clear();
}

void ErrorHandler::set_context(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    current_context_[key] = value;
}

void ErrorHandler::clear_context() {
    std::lock_guard<std::mutex> lock(error_mutex_);
    current_context_.clear();
}

std::string ErrorHandler::get_context_string() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    // Sorted so the string is stable across runs
    std::map<std::string, std::string> sorted(current_context_.begin(), current_context_.end());
    std::ostringstream oss;
    for (const auto& [key, value] : sorted) {
        if (oss.tellp() > 0) oss << ", ";
        oss << key << "=" << value;
    }
    return oss.str();
}

std::string ErrorHandler::code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::GENERAL_ERROR: return "GeneralError";
        case ErrorCode::UNKNOWN_CORPUS: return "UnknownCorpus";
        case ErrorCode::SOURCE_READ_ERROR: return "SourceReadError";
        case ErrorCode::MISSING_LABEL: return "MissingLabelError";
        case ErrorCode::UNKNOWN_LABEL: return "UnknownLabel";
        case ErrorCode::UNKNOWN_SPEAKER: return "UnknownSpeaker";
        case ErrorCode::INVALID_PARAMETERS: return "InvalidParameters";
        case ErrorCode::CONFIGURATION_ERROR: return "ConfigurationError";
        default: return "Unknown";
    }
}

std::string ErrorHandler::category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::SYSTEM: return "SYSTEM";
        case ErrorCategory::METADATA: return "METADATA";
        case ErrorCategory::PARAMETER: return "PARAMETER";
        case ErrorCategory::INTERNAL: return "INTERNAL";
        default: return "UNKNOWN";
    }
}

std::string ErrorHandler::format_error_message(const ErrorInfo& error_info) const {
    std::ostringstream oss;
    oss << "[" << category_to_string(error_info.category) << "] ";
    oss << code_to_string(error_info.code) << ": " << error_info.message;

    if (!error_info.context.empty()) {
        std::map<std::string, std::string> sorted(error_info.context.begin(), error_info.context.end());
        oss << " (";
        bool first = true;
        for (const auto& [key, value] : sorted) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << ")";
    }
    return oss.str();
}

} // namespace emodata
