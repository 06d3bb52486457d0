#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <mutex>
#include <chrono>
#include <sstream>
#include <cstdio>

namespace emodata {

/**
 * @brief Log levels following standard conventions
 *
 * Ordered by severity from lowest (DEBUG) to highest (FATAL)
 */
enum class LogLevel {
    DEBUG = 0,    ///< Detailed debug information
    INFO = 1,     ///< General information messages
    WARN = 2,     ///< Warning messages
    ERROR = 3,    ///< Error messages
    FATAL = 4     ///< Critical errors that cause termination
};

/**
 * @brief Log output destinations
 */
enum class LogOutput {
    NONE = 0,        ///< No output
    CONSOLE = 1,     ///< Console output (stderr)
    FILE = 2,        ///< File output
    BOTH = 3         ///< Both console and file output
};

/**
 * @brief Log format configuration
 */
struct LogFormat {
    bool include_timestamp = true;     ///< Include timestamp in log messages
    bool include_level = true;         ///< Include log level in messages
    bool include_thread_id = false;    ///< Include thread ID in messages
    bool use_colors = true;            ///< Use ANSI color codes for console output
    std::string timestamp_format = "%Y-%m-%d %H:%M:%S"; ///< strftime format string
};

/**
 * @brief Process-wide logger for dataset loading
 *
 * Provides structured logging with console and file destinations,
 * level filtering and printf-style helpers. Dataset summaries and
 * reader diagnostics are emitted at INFO; per-file detail at DEBUG.
 */
class Logger {
public:
    // Singleton access for global logging
    static Logger& instance();

    explicit Logger(const std::string& name = "emodata");
    ~Logger();

    // Configuration
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel get_level() const { return min_level_; }
    void set_output(LogOutput output) { output_dest_ = output; }
    void set_log_file(const std::string& file_path);
    void set_format(const LogFormat& format) { format_ = format; }
    const LogFormat& get_format() const { return format_; }

    // Main logging interface
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    // printf-style variants; the format is only expanded when the level is enabled
    template<typename... Args>
    void log_f(LogLevel level, const std::string& format, Args... args) {
        if (should_log(level)) {
            log(level, format_string(format, args...));
        }
    }

    template<typename... Args>
    void debug_f(const std::string& format, Args... args) { log_f(LogLevel::DEBUG, format, args...); }
    template<typename... Args>
    void info_f(const std::string& format, Args... args) { log_f(LogLevel::INFO, format, args...); }
    template<typename... Args>
    void warn_f(const std::string& format, Args... args) { log_f(LogLevel::WARN, format, args...); }
    template<typename... Args>
    void error_f(const std::string& format, Args... args) { log_f(LogLevel::ERROR, format, args...); }

    // Generic log method
    void log(LogLevel level, const std::string& message);

    // Context-aware logging for dataset operations
    void log_source_read(const std::string& reader, const std::string& path, size_t n_rows);
    void log_file_operation(const std::string& operation, const std::string& file_path, bool success);

    // Performance tracking
    struct PerformanceTimer {
        PerformanceTimer(Logger& logger, LogLevel level, const std::string& operation);
        ~PerformanceTimer();

    private:
        Logger& logger_;
        LogLevel level_;
        std::string operation_;
        std::chrono::steady_clock::time_point start_time_;
    };

    // Utility methods
    void flush();
    void close();
    bool is_enabled(LogLevel level) const { return level >= min_level_; }

    // Statistics and diagnostics
    struct LogStats {
        size_t debug_count = 0;
        size_t info_count = 0;
        size_t warn_count = 0;
        size_t error_count = 0;
        size_t fatal_count = 0;
        size_t total_bytes_written = 0;
    };

    LogStats get_stats() const;
    void reset_stats();

    // Scoped log level changes
    class ScopedLevel {
    public:
        ScopedLevel(Logger& logger, LogLevel new_level);
        ~ScopedLevel();
    private:
        Logger& logger_;
        LogLevel original_level_;
    };

    static std::string level_to_string(LogLevel level);
    static bool level_from_string(const std::string& name, LogLevel& level);

private:
    std::string logger_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogOutput output_dest_ = LogOutput::CONSOLE;
    LogFormat format_;

    std::string log_file_path_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex log_mutex_;

    LogStats stats_;
    bool console_is_tty_ = false;

    bool should_log(LogLevel level) const { return level >= min_level_; }
    std::string format_message(LogLevel level, const std::string& message);
    std::string get_timestamp();

    void write_to_console(const std::string& message, LogLevel level);
    void write_to_file(const std::string& message);

    template<typename... Args>
    std::string format_string(const std::string& format, Args... args) {
        int size = std::snprintf(nullptr, 0, format.c_str(), args...);
        if (size <= 0) {
            return format;
        }
        std::unique_ptr<char[]> buf(new char[size + 1]);
        std::snprintf(buf.get(), size + 1, format.c_str(), args...);
        return std::string(buf.get(), buf.get() + size);
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

/**
 * @brief Global logging macros for convenience
 */
#define EMODATA_LOG_DEBUG(msg) emodata::Logger::instance().debug(msg)
#define EMODATA_LOG_INFO(msg) emodata::Logger::instance().info(msg)
#define EMODATA_LOG_WARN(msg) emodata::Logger::instance().warn(msg)
#define EMODATA_LOG_ERROR(msg) emodata::Logger::instance().error(msg)
#define EMODATA_LOG_FATAL(msg) emodata::Logger::instance().fatal(msg)

#define EMODATA_LOG_DEBUG_F(fmt, ...) emodata::Logger::instance().debug_f(fmt, __VA_ARGS__)
#define EMODATA_LOG_INFO_F(fmt, ...) emodata::Logger::instance().info_f(fmt, __VA_ARGS__)
#define EMODATA_LOG_WARN_F(fmt, ...) emodata::Logger::instance().warn_f(fmt, __VA_ARGS__)
#define EMODATA_LOG_ERROR_F(fmt, ...) emodata::Logger::instance().error_f(fmt, __VA_ARGS__)

// Performance timing macro
#define EMODATA_LOG_TIMER(level, operation) \
    emodata::Logger::PerformanceTimer emodata_scope_timer(emodata::Logger::instance(), level, operation)

} // namespace emodata
