#include "signrecog/logger.h"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <thread>
#include <map>
#include <ctime>

namespace signrecog {

namespace {
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
    static Logger global_instance("signrecog");
    return global_instance;
}

Logger::Logger(const std::string& name)
    : logger_name_(name) {
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
    if (!is_enabled(level)) return;

    std::lock_guard<std::mutex> lock(log_mutex_);

    switch (level) {
        case LogLevel::DEBUG: stats_.debug_count++; break;
        case LogLevel::INFO: stats_.info_count++; break;
        case LogLevel::WARN: stats_.warn_count++; break;
        case LogLevel::ERROR: stats_.error_count++; break;
        case LogLevel::FATAL: stats_.fatal_count++; break;
    }

    std::string formatted_message = format_message(level, message);

    if (output_dest_ == LogOutput::CONSOLE || output_dest_ == LogOutput::BOTH) {
        write_to_console(formatted_message, level);
    }

    if ((output_dest_ == LogOutput::FILE || output_dest_ == LogOutput::BOTH) && file_stream_) {
        write_to_file(formatted_message);
    }
}

void Logger::log_candidate(const std::string& word, int num_states, bool success) {
    if (success) {
        info_f("model created for %s with %d states", word.c_str(), num_states);
    } else {
        info_f("failure on %s with %d states", word.c_str(), num_states);
    }
}

void Logger::log_selection(const std::string& word, const std::string& selector, int num_states) {
    if (num_states > 0) {
        info_f("%s selected %d states for %s", selector.c_str(), num_states, word.c_str());
    } else {
        warn_f("%s found no usable model for %s", selector.c_str(), word.c_str());
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cout.flush();
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

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream oss;

    if (format_.include_timestamp) {
        oss << "[" << get_timestamp() << "]";
    }

    if (format_.include_level) {
        oss << "[" << log_level_name(level) << "]";
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

std::string Logger::get_timestamp() const {
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

void Logger::write_to_console(const std::string& message, LogLevel level) {
    std::ostream& stream = (level >= LogLevel::ERROR) ? std::cerr : std::cout;

    if (format_.use_colors) {
        auto it = LEVEL_COLORS.find(level);
        const std::string& color = (it != LEVEL_COLORS.end()) ? it->second : COLOR_RESET;
        stream << color << message << COLOR_RESET << std::endl;
    } else {
        stream << message << std::endl;
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
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time_);
    double ms = duration.count() / 1000.0;
    logger_.log(level_, operation_ + " completed in " + std::to_string(ms) + "ms");
}

// ScopedLevel implementation
Logger::ScopedLevel::ScopedLevel(Logger& logger, LogLevel new_level)
    : logger_(logger), original_level_(logger.level()) {
    logger_.set_level(new_level);
}

Logger::ScopedLevel::~ScopedLevel() {
    logger_.set_level(original_level_);
}

std::string log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

namespace logging_utils {

void initialize_logging(const std::string& log_file_path, bool debug_mode) {
    auto& logger = Logger::instance();

    logger.set_level(debug_mode ? LogLevel::DEBUG : LogLevel::INFO);

    if (log_file_path.empty()) {
        logger.set_output(LogOutput::CONSOLE);
    } else {
        logger.set_log_file(log_file_path);
        logger.set_output(LogOutput::BOTH);
    }

    LogFormat format;
    format.include_timestamp = true;
    format.include_level = true;
    format.use_colors = true;
    logger.set_format(format);

    logger.debug("Logging initialized");
}

} // namespace logging_utils

} // namespace signrecog
