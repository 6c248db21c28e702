#pragma once

#include <string>
#include <string_view>
#include <sstream>
#include <fstream>
#include <chrono>
#include <mutex>
#include <vector>

namespace mssql_conncheck::core {

/**
 * @brief Log levels for the connection layer
 */
enum class LogLevel {
    TRACE,   // Every driver call
    DEBUG,   // Branch decisions, defaults applied
    INFO,    // Informational messages
    WARN,    // Ignored options, cleanup failures
    ERROR,   // Errors
    FATAL    // Fatal errors
};

/**
 * @brief Thread-safe process-wide logger
 *
 * Every formatted line passes through the secret mask before it reaches a
 * sink: any registered secret is replaced with "******".
 *
 * Usage:
 *   Logger::instance().set_level(LogLevel::DEBUG);
 *   Logger::instance().set_output("mssql_conncheck.log");
 *   Logger::instance().add_secret(password);
 *
 *   LOG_DEBUG("Opening connection");
 *   LOG_IF(port_invalid, "Falling back to default port");
 */
class Logger {
public:
    static constexpr std::string_view SECRET_MASK = "******";

    /**
     * @brief Get singleton instance
     */
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const noexcept { return min_level_; }

    /**
     * @brief Set output file (empty for console only)
     */
    void set_output(std::string_view filename);

    void set_console_enabled(bool enabled);

    /**
     * @brief Register a value that must never appear in a log line
     *
     * Empty values are ignored.
     */
    void add_secret(std::string_view secret);
    void clear_secrets();

    /**
     * @brief Replace every registered secret in \p text with SECRET_MASK
     */
    std::string mask(std::string_view text) const;

    void log(LogLevel level, std::string_view file, int line,
             std::string_view function, std::string_view message);

    /**
     * @brief Log a conditional branch decision at DEBUG level
     */
    void log_branch(bool condition, std::string_view file, int line,
                    std::string_view function,
                    std::string_view true_msg,
                    std::string_view false_msg = "");

private:
    Logger();
    ~Logger();

    std::string mask_unlocked(std::string_view text) const;

    LogLevel min_level_ = LogLevel::INFO;
    bool console_enabled_ = true;
    std::ofstream file_stream_;
    std::vector<std::string> secrets_;
    mutable std::mutex mutex_;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp();
};

} // namespace mssql_conncheck::core

#define LOG_TRACE(msg) \
    mssql_conncheck::core::Logger::instance().log( \
        mssql_conncheck::core::LogLevel::TRACE, __FILE__, __LINE__, __func__, msg)

#define LOG_DEBUG(msg) \
    mssql_conncheck::core::Logger::instance().log( \
        mssql_conncheck::core::LogLevel::DEBUG, __FILE__, __LINE__, __func__, msg)

#define LOG_INFO(msg) \
    mssql_conncheck::core::Logger::instance().log( \
        mssql_conncheck::core::LogLevel::INFO, __FILE__, __LINE__, __func__, msg)

#define LOG_WARN(msg) \
    mssql_conncheck::core::Logger::instance().log( \
        mssql_conncheck::core::LogLevel::WARN, __FILE__, __LINE__, __func__, msg)

#define LOG_ERROR(msg) \
    mssql_conncheck::core::Logger::instance().log( \
        mssql_conncheck::core::LogLevel::ERROR, __FILE__, __LINE__, __func__, msg)

#define LOG_FATAL(msg) \
    mssql_conncheck::core::Logger::instance().log( \
        mssql_conncheck::core::LogLevel::FATAL, __FILE__, __LINE__, __func__, msg)

#define LOG_IF(condition, true_msg, ...) \
    mssql_conncheck::core::Logger::instance().log_branch( \
        (condition), __FILE__, __LINE__, __func__, \
        true_msg, ##__VA_ARGS__)
