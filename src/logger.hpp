/**
 * @file logger.hpp
 * @brief Structured logging for the sandbox with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (execution ID, language, session, phase)
 * - Typed events for engine loads, executions, violations and cache evictions
 * - Debug mode with a bounded preview of submitted code
 *
 * Design Pattern: Singleton logger with structured event emission. Components
 * take an optional Logger* and fall back to the singleton.
 */

#ifndef LIVERUN_LOGGER_HPP
#define LIVERUN_LOGGER_HPP

#include "engine_interface.hpp"
#include "context_protocol.hpp"
#include "execution_types.hpp"
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <chrono>
#include <fstream>

namespace liverun {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (code previews, protocol traffic)
    INFO,    ///< Informational messages (engine loads, execution start/end)
    WARN,    ///< Warning messages (preload failures, evictions under pressure)
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
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Request context attached to log events
 */
struct LogContext {
    std::string execution_id;   ///< Correlation id of the request
    std::string language;       ///< Language id
    std::string session_id;     ///< Caller session
    std::string phase;          ///< validate, load, execute, classify

    LogContext() = default;

    LogContext(const std::string& id, const std::string& lang)
        : execution_id(id), language(lang) {}
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
    bool enable_code_preview;        ///< Log a preview of submitted code at DEBUG
    size_t max_code_preview_chars;   ///< Preview length (default: 80)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("liverun.log"),
          enable_json(true),
          enable_code_preview(false),
          max_code_preview_chars(80) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "liverun.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   LogContext ctx("exec_42", "python");
 *   logger.log_execution_start(ctx, code.size());
 *   logger.log_execution_complete(ctx, result);
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
     * @brief Log a runtime bootstrap
     *
     * @param language Language id
     * @param info Engine metadata (only meaningful when success is true)
     * @param duration_ms Bootstrap time
     * @param success Whether the runtime came up
     * @param error Failure message
     */
    void log_engine_load(
        const std::string& language,
        const EngineInfo& info,
        double duration_ms,
        bool success,
        const std::string& error = ""
    );

    /**
     * @brief Log execution start
     *
     * @param ctx Request context
     * @param code_size Source length in bytes
     */
    void log_execution_start(const LogContext& ctx, size_t code_size);

    /**
     * @brief Log execution completion
     */
    void log_execution_complete(const LogContext& ctx, const ExecutionResult& result);

    /**
     * @brief Log a policy violation caught before or during execution
     */
    void log_security_violation(const LogContext& ctx, const std::string& rule, const std::string& message);

    /**
     * @brief Log removal of a cached engine
     *
     * @param key Cache key
     * @param reason "expired", "size_budget", "invalidated"
     * @param size_bytes Estimated size released
     */
    void log_cache_eviction(const std::string& key, const std::string& reason, size_t size_bytes);

    /**
     * @brief Log a metrics flush
     */
    void log_metrics_flush(size_t flushed, size_t retained);

    /**
     * @brief Log error with context
     */
    void log_error(
        const LogContext& ctx,
        const std::string& error_message,
        const std::string& stack_trace = ""
    );

    /**
     * @brief Log warning message
     */
    void log_warning(const LogContext& ctx, const std::string& warning_message);

    /**
     * @brief Log a preview of submitted code (debug mode only)
     *
     * Never logs more than max_code_preview_chars characters.
     */
    void log_code_preview(const LogContext& ctx, const std::string& code);

    /**
     * @brief Log execution context state transition
     */
    void log_state_transition(const LogContext& ctx, ContextState old_state, ContextState new_state);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    void add_context(std::map<std::string, std::string>& fields, const LogContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace liverun

#endif // LIVERUN_LOGGER_HPP
