#include "logger.hpp"
#include <iostream>
#include <iomanip>
#include <ctime>
#include <algorithm>
#include <cctype>

namespace mssql_mcp::core {

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (lowered == "trace") return LogLevel::TRACE;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_output(std::string_view filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    
    if (!filename.empty()) {
        file_stream_.open(std::string(filename), std::ios::app);
    }
}

void Logger::set_console_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

void Logger::log(LogLevel level, std::string_view file, int line,
                std::string_view function, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (level < min_level_) {
        return;
    }
    
    // Format: [TIMESTAMP] [LEVEL] [file:line] [function] message
    std::ostringstream oss;
    oss << "[" << timestamp() << "] "
        << "[" << std::setw(5) << level_to_string(level) << "] "
        << "[" << file << ":" << line << "] "
        << "[" << function << "] "
        << message;
    
    std::string formatted = oss.str();
    
    if (console_enabled_) {
        std::cerr << formatted << std::endl;
    }
    
    if (file_stream_.is_open()) {
        file_stream_ << formatted << std::endl;
        file_stream_.flush(); // Ensure immediate write
    }
}

void Logger::log_branch(bool condition, std::string_view file, int line,
                       std::string_view function,
                       std::string_view true_msg,
                       std::string_view false_msg) {
    if (level() > LogLevel::DEBUG) {
        return;
    }
    
    std::ostringstream oss;
    oss << "BRANCH: " << (condition ? "TRUE" : "FALSE") << " - ";
    
    if (condition) {
        oss << true_msg;
    } else if (!false_msg.empty()) {
        oss << false_msg;
    } else {
        oss << "condition false";
    }
    
    log(LogLevel::DEBUG, file, line, function, oss.str());
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    
    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &time_t_now);
#else
    localtime_r(&time_t_now, &local_tm);
#endif
    
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    
    return oss.str();
}

} // namespace mssql_mcp::core
