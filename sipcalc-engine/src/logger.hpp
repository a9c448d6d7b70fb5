/**
 * @file logger.hpp
 * @brief Structured logging for the planner with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text output
 * - Context tracking (component, goal, phase)
 * - Events for state loading, goal computation and exports
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef SIPCALC_LOGGER_HPP
#define SIPCALC_LOGGER_HPP

#include "goal.hpp"
#include <string>
#include <map>
#include <memory>
#include <chrono>
#include <ostream>
#include <fstream>

namespace sipcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (per-goal intermediate values)
    INFO,    ///< Informational messages (state loaded, goals computed, exports)
    WARN,    ///< Warning messages (fallbacks, ignored input)
    ERROR    ///< Error messages (failures, exceptions)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (defaults to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Where a log event comes from
 */
struct LogContext {
    std::string component;   ///< Emitting component (cli, store, export, planner)
    std::string phase;       ///< Current phase (load, compute, export, save)

    LogContext() : component(""), phase("") {}

    LogContext(const std::string& component_, const std::string& phase_ = "")
        : component(component_), phase(phase_) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("sipcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   LogContext ctx("cli", "compute");
 *   logger.log_goal_computed(ctx, goal);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a portfolio restored from storage or imported from a file
     *
     * @param ctx Log context
     * @param source Where the portfolio came from (file path, "memory", "default")
     * @param goal_count Number of goals loaded
     */
    void log_portfolio_loaded(
        const LogContext& ctx,
        const std::string& source,
        size_t goal_count
    );

    /**
     * @brief Log that stored state was unusable and the default portfolio is used
     */
    void log_state_fallback(
        const LogContext& ctx,
        const std::string& reason
    );

    /**
     * @brief Log a freshly computed goal (no-op if the goal has no Results)
     */
    void log_goal_computed(
        const LogContext& ctx,
        const Goal& goal
    );

    /**
     * @brief Log an export or report written to disk
     *
     * @param ctx Log context
     * @param format Output format (csv, parquet, json)
     * @param path Destination path
     * @param rows Number of rows or goals written
     */
    void log_export_written(
        const LogContext& ctx,
        const std::string& format,
        const std::string& path,
        size_t rows
    );

    void log_info(
        const LogContext& ctx,
        const std::string& message
    );

    void log_warning(
        const LogContext& ctx,
        const std::string& warning_message
    );

    void log_error(
        const LogContext& ctx,
        const std::string& error_message
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace sipcalc

#endif // SIPCALC_LOGGER_HPP
