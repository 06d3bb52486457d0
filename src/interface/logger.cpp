#include "emodata/logger.h"
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <thread>
#include <map>
#include <cctype>
#include <ctime>

#include <unistd.h>

namespace emodata {

namespace {
    // ANSI color codes for different log levels
    const std::map<LogLevel, std::string> LEVEL_COLORS = {
        {LogLevel::DEBUG, "\033[36m"},    // Cyan
        {LogLevel::INFO, "\033[32m"},     // Green
        {LogLevel::WARN, "\033[33m"},     // Yellow
        {LogLevel::ERROR, "\033[31m"},    // Red
        {LogLevel::FATAL, "\033[35m"}     // Magenta
    };

    const std::string COLOR_RESET = "\033[0m";
}

Logger& Logger::instance() {
    static Logger global_instance("emodata");
    return global_instance;
}

Logger::Logger(const std::string& name)
    : logger_name_(name) {
    console_is_tty_ = isatty(STDERR_FILENO) != 0;
}

Logger::~Logger() {
    close();
}

void Logger::set_log_file(const std::string& file_path) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }

    log_file_path_ = file_path;
    if (file_path.empty()) {
        return;
    }

    std::filesystem::path log_path(file_path);
    if (log_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }

    file_stream_ = std::make_unique<std::ofstream>(file_path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Warning: Failed to open log file: " << file_path << std::endl;
        file_stream_.reset();
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!should_log(level)) return;

    std::lock_guard<std::mutex> lock(log_mutex_);

    switch (level) {
        case LogLevel::DEBUG: stats_.debug_count++; break;
        case LogLevel::INFO: stats_.info_count++; break;
        case LogLevel::WARN: stats_.warn_count++; break;
        case LogLevel::ERROR: stats_.error_count++; break;
        case LogLevel::FATAL: stats_.fatal_count++; break;
    }

    std::string formatted_message = format_message(level, message);
    stats_.total_bytes_written += formatted_message.size();

    if (output_dest_ == LogOutput::CONSOLE || output_dest_ == LogOutput::BOTH) {
        write_to_console(formatted_message, level);
    }

    if ((output_dest_ == LogOutput::FILE || output_dest_ == LogOutput::BOTH) && file_stream_) {
        write_to_file(formatted_message);
    }
}

void Logger::log_source_read(const std::string& reader, const std::string& path, size_t n_rows) {
    info_f("%s: read %zu rows from %s", reader.c_str(), n_rows, path.c_str());
}

void Logger::log_file_operation(const std::string& operation, const std::string& file_path, bool success) {
    if (success) {
        debug_f("File %s successful: %s", operation.c_str(), file_path.c_str());
    } else {
        warn_f("File %s failed: %s", operation.c_str(), file_path.c_str());
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cerr.flush();
    if (file_stream_) {
        file_stream_->flush();
    }
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
}

Logger::LogStats Logger::get_stats() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return stats_;
}

void Logger::reset_stats() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    stats_ = LogStats{};
}

std::string Logger::format_message(LogLevel level, const std::string& message) {
    std::ostringstream oss;

    if (format_.include_timestamp) {
        oss << "[" << get_timestamp() << "]";
    }

    if (format_.include_level) {
        oss << "[" << level_to_string(level) << "]";
    }

    if (format_.include_thread_id) {
        oss << "[" << std::this_thread::get_id() << "]";
    }

    if (!logger_name_.empty()) {
        oss << "[" << logger_name_ << "]";
    }

    oss << " " << message;

    return oss.str();
}

std::string Logger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, format_.timestamp_format.c_str());
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

bool Logger::level_from_string(const std::string& name, LogLevel& level) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") { level = LogLevel::DEBUG; return true; }
    if (upper == "INFO") { level = LogLevel::INFO; return true; }
    if (upper == "WARN" || upper == "WARNING") { level = LogLevel::WARN; return true; }
    if (upper == "ERROR") { level = LogLevel::ERROR; return true; }
    if (upper == "FATAL") { level = LogLevel::FATAL; return true; }
    return false;
}

void Logger::write_to_console(const std::string& message, LogLevel level) {
    if (format_.use_colors && console_is_tty_) {
        auto it = LEVEL_COLORS.find(level);
        const std::string& color = (it != LEVEL_COLORS.end()) ? it->second : COLOR_RESET;
        std::cerr << color << message << COLOR_RESET << std::endl;
    } else {
        std::cerr << message << std::endl;
    }
}

void Logger::write_to_file(const std::string& message) {
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << message << std::endl;
    }
}

// PerformanceTimer implementation
Logger::PerformanceTimer::PerformanceTimer(Logger& logger, LogLevel level, const std::string& operation)
    : logger_(logger), level_(level), operation_(operation),
      start_time_(std::chrono::steady_clock::now()) {
    logger_.log(level_, operation_ + " started");
}

Logger::PerformanceTimer::~PerformanceTimer() {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time_);
    double ms = duration.count() / 1000.0;

    std::ostringstream oss;
    oss << operation_ << " completed in " << std::fixed << std::setprecision(2) << ms << "ms";
    logger_.log(level_, oss.str());
}

// ScopedLevel implementation
Logger::ScopedLevel::ScopedLevel(Logger& logger, LogLevel new_level)
    : logger_(logger), original_level_(logger.get_level()) {
    logger_.set_level(new_level);
}

Logger::ScopedLevel::~ScopedLevel() {
    logger_.set_level(original_level_);
}

} // namespace emodata
