#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <optional>

namespace signrecog {

/**
 * @brief Log levels ordered by severity
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

/**
 * @brief Log output destinations
 */
enum class LogOutput {
    NONE = 0,
    CONSOLE = 1,
    FILE = 2,
    BOTH = 3
};

/**
 * @brief Message prefix configuration
 */
struct LogFormat {
    bool include_timestamp = true;     ///< Prefix with local time
    bool include_level = true;         ///< Prefix with the level name
    bool include_thread_id = false;    ///< Prefix with the calling thread id
    bool use_colors = true;            ///< ANSI colors on console output
    std::string timestamp_format = "%Y-%m-%d %H:%M:%S";
};

/**
 * @brief Thread-safe logger writing to the console and/or a file
 *
 * A process-wide instance backs the SIGNRECOG_LOG_* macros; separate
 * instances can be created for scoped diagnostics.
 */
class Logger {
public:
    static Logger& instance();

    explicit Logger(const std::string& name = "signrecog");
    ~Logger();

    void set_level(LogLevel level) { min_level_.store(level); }
    LogLevel level() const { return min_level_.load(); }
    void set_output(LogOutput output) { output_dest_ = output; }
    void set_log_file(const std::string& file_path);
    void set_format(const LogFormat& format) { format_ = format; }

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    template<typename... Args>
    void debug_f(const std::string& format, Args... args) {
        if (is_enabled(LogLevel::DEBUG)) {
            log(LogLevel::DEBUG, format_string(format, args...));
        }
    }

    template<typename... Args>
    void info_f(const std::string& format, Args... args) {
        if (is_enabled(LogLevel::INFO)) {
            log(LogLevel::INFO, format_string(format, args...));
        }
    }

    template<typename... Args>
    void warn_f(const std::string& format, Args... args) {
        if (is_enabled(LogLevel::WARN)) {
            log(LogLevel::WARN, format_string(format, args...));
        }
    }

    template<typename... Args>
    void error_f(const std::string& format, Args... args) {
        if (is_enabled(LogLevel::ERROR)) {
            log(LogLevel::ERROR, format_string(format, args...));
        }
    }

    void log(LogLevel level, const std::string& message);

    // Selection diagnostics
    void log_candidate(const std::string& word, int num_states, bool success);
    void log_selection(const std::string& word, const std::string& selector, int num_states);

    /**
     * @brief Logs the elapsed time of a scope on destruction
     */
    struct PerformanceTimer {
        PerformanceTimer(Logger& logger, LogLevel level, const std::string& operation);
        ~PerformanceTimer();

    private:
        Logger& logger_;
        LogLevel level_;
        std::string operation_;
        std::chrono::steady_clock::time_point start_time_;
    };

    void flush();
    void close();
    bool is_enabled(LogLevel level) const { return level >= min_level_.load(); }

    struct LogStats {
        size_t debug_count = 0;
        size_t info_count = 0;
        size_t warn_count = 0;
        size_t error_count = 0;
        size_t fatal_count = 0;
    };

    LogStats get_stats() const;
    void reset_stats();

    /**
     * @brief Temporarily overrides the minimum level
     */
    class ScopedLevel {
    public:
        ScopedLevel(Logger& logger, LogLevel new_level);
        ~ScopedLevel();
        ScopedLevel(const ScopedLevel&) = delete;
        ScopedLevel& operator=(const ScopedLevel&) = delete;
    private:
        Logger& logger_;
        LogLevel original_level_;
    };

private:
    std::string logger_name_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    LogOutput output_dest_ = LogOutput::CONSOLE;
    LogFormat format_;

    std::string log_file_path_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex log_mutex_;

    LogStats stats_;

    std::string format_message(LogLevel level, const std::string& message) const;
    std::string get_timestamp() const;

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

std::string log_level_name(LogLevel level);

/// Parses "debug", "info", "warn", "error" or "fatal" (case-insensitive)
std::optional<LogLevel> parse_log_level(const std::string& name);

#define SIGNRECOG_LOG_DEBUG(msg) signrecog::Logger::instance().debug(msg)
#define SIGNRECOG_LOG_INFO(msg) signrecog::Logger::instance().info(msg)
#define SIGNRECOG_LOG_WARN(msg) signrecog::Logger::instance().warn(msg)
#define SIGNRECOG_LOG_ERROR(msg) signrecog::Logger::instance().error(msg)

#define SIGNRECOG_LOG_DEBUG_F(fmt, ...) signrecog::Logger::instance().debug_f(fmt, __VA_ARGS__)
#define SIGNRECOG_LOG_INFO_F(fmt, ...) signrecog::Logger::instance().info_f(fmt, __VA_ARGS__)
#define SIGNRECOG_LOG_WARN_F(fmt, ...) signrecog::Logger::instance().warn_f(fmt, __VA_ARGS__)
#define SIGNRECOG_LOG_ERROR_F(fmt, ...) signrecog::Logger::instance().error_f(fmt, __VA_ARGS__)

namespace logging_utils {
    /**
     * @brief Configure the global logger for a run
     * @param log_file_path Also write to this file when non-empty
     * @param debug_mode Lower the threshold to DEBUG
     */
    void initialize_logging(const std::string& log_file_path = "", bool debug_mode = false);
}

} // namespace signrecog
