#pragma once

#include <string>
#include <string_view>
#include <sstream>
#include <fstream>
#include <chrono>
#include <mutex>
#include <optional>

namespace mssql_mcp::core {

/**
 * @brief Log levels for debugging and diagnostics
 */
enum class LogLevel {
    TRACE,   // Bind values, every ODBC call
    DEBUG,   // Batch text, branch decisions
    INFO,    // Informational messages
    WARN,    // Warnings
    ERROR,   // Operation failures
    FATAL    // Fatal errors
};

/**
 * @brief Parse a level name ("trace", "debug", ... case-insensitive)
 * @return std::nullopt for an unknown name
 */
std::optional<LogLevel> parse_log_level(std::string_view name);

/**
 * @brief Simple thread-safe logger
 * 
 * stdout belongs to the MCP transport, so the console sink is always stderr.
 * 
 * Usage:
 *   Logger::instance().set_level(LogLevel::DEBUG);
 *   Logger::instance().set_output("mssql_mcp.log");
 *   
 *   LOG_DEBUG("Executing batch: " + sql);
 *   LOG_IF(params.empty(), "No parameters, zero-argument call");
 */
class Logger {
public:
    /**
     * @brief Get singleton instance
     */
    static Logger& instance();

    /**
     * @brief Set minimum log level
     */
    void set_level(LogLevel level);
    LogLevel level() const;

    /**
     * @brief Set output file (empty for console only)
     */
    void set_output(std::string_view filename);

    /**
     * @brief Enable/disable the stderr sink
     */
    void set_console_enabled(bool enabled);

    /**
     * @brief Log a message
     */
    void log(LogLevel level, std::string_view file, int line,
             std::string_view function, std::string_view message);

    /**
     * @brief Log a conditional branch decision
     * @param condition The condition value
     * @param true_msg Message if condition is true
     * @param false_msg Message if condition is false (optional)
     */
    void log_branch(bool condition, std::string_view file, int line,
                   std::string_view function,
                   std::string_view true_msg,
                   std::string_view false_msg = "");

private:
    Logger();
    ~Logger();

    LogLevel min_level_ = LogLevel::INFO;
    bool console_enabled_ = true;
    std::ofstream file_stream_;
    mutable std::mutex mutex_;

    std::string level_to_string(LogLevel level);
    std::string timestamp();
};

} // namespace mssql_mcp::core

// Convenience macros - simple string-based logging
#define LOG_TRACE(msg) \
    mssql_mcp::core::Logger::instance().log( \
        mssql_mcp::core::LogLevel::TRACE, __FILE__, __LINE__, __func__, msg)

#define LOG_DEBUG(msg) \
    mssql_mcp::core::Logger::instance().log( \
        mssql_mcp::core::LogLevel::DEBUG, __FILE__, __LINE__, __func__, msg)

#define LOG_INFO(msg) \
    mssql_mcp::core::Logger::instance().log( \
        mssql_mcp::core::LogLevel::INFO, __FILE__, __LINE__, __func__, msg)

#define LOG_WARN(msg) \
    mssql_mcp::core::Logger::instance().log( \
        mssql_mcp::core::LogLevel::WARN, __FILE__, __LINE__, __func__, msg)

#define LOG_ERROR(msg) \
    mssql_mcp::core::Logger::instance().log( \
        mssql_mcp::core::LogLevel::ERROR, __FILE__, __LINE__, __func__, msg)

#define LOG_FATAL(msg) \
    mssql_mcp::core::Logger::instance().log( \
        mssql_mcp::core::LogLevel::FATAL, __FILE__, __LINE__, __func__, msg)

// Log branch decisions (IF statements)
#define LOG_IF(condition, true_msg, ...) \
    mssql_mcp::core::Logger::instance().log_branch( \
        (condition), __FILE__, __LINE__, __func__, \
        true_msg, ##__VA_ARGS__)
