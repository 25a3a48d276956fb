/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <algorithm>

namespace liverun {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    file_stream_.reset();
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_engine_load(
    const std::string& language,
    const EngineInfo& info,
    double duration_ms,
    bool success,
    const std::string& error
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "engine_load";
    fields["language"] = language;
    fields["duration_ms"] = std::to_string(duration_ms);
    fields["success"] = success ? "true" : "false";

    if (success) {
        fields["engine_name"] = info.name;
        fields["engine_version"] = info.version;
        fields["heavy_runtime"] = info.heavy_runtime ? "true" : "false";
        fields["footprint_bytes"] = std::to_string(info.approx_footprint_bytes);
        log(LogLevel::INFO, "Engine loaded", fields);
    } else {
        fields["error"] = error;
        log(LogLevel::ERROR, "Engine load failed", fields);
    }
}

void Logger::log_execution_start(const LogContext& ctx, size_t code_size) {
    std::map<std::string, std::string> fields;
    fields["event"] = "execution_start";
    add_context(fields, ctx);
    fields["code_size_bytes"] = std::to_string(code_size);

    log(LogLevel::INFO, "Starting execution", fields);
}

void Logger::log_execution_complete(const LogContext& ctx, const ExecutionResult& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "execution_complete";
    add_context(fields, ctx);
    fields["success"] = result.success ? "true" : "false";
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);
    fields["artifact_count"] = std::to_string(result.artifacts.size());

    if (result.output) {
        fields["output_size_bytes"] = std::to_string(result.output->size());
    }
    if (result.memory_bytes) {
        fields["memory_bytes"] = std::to_string(*result.memory_bytes);
    }

    // Error details if failed
    if (!result.success) {
        fields["error_kind"] = error_kind_to_string(result.error_kind);
        if (result.error_raw) {
            // First line only; full tracebacks belong in the result, not the log
            fields["error"] = result.error_raw->substr(0, result.error_raw->find('\n'));
        }
    }

    log(result.success ? LogLevel::INFO : LogLevel::WARN, "Execution completed", fields);
}

void Logger::log_security_violation(
    const LogContext& ctx,
    const std::string& rule,
    const std::string& message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "security_violation";
    add_context(fields, ctx);
    fields["rule"] = rule;
    fields["violation"] = message;

    log(LogLevel::WARN, "Security policy violation", fields);
}

void Logger::log_cache_eviction(const std::string& key, const std::string& reason, size_t size_bytes) {
    std::map<std::string, std::string> fields;
    fields["event"] = "cache_eviction";
    fields["key"] = key;
    fields["reason"] = reason;
    fields["size_bytes"] = std::to_string(size_bytes);

    log(reason == "size_budget" ? LogLevel::WARN : LogLevel::INFO, "Cache entry evicted", fields);
}

void Logger::log_metrics_flush(size_t flushed, size_t retained) {
    std::map<std::string, std::string> fields;
    fields["event"] = "metrics_flush";
    fields["flushed"] = std::to_string(flushed);
    fields["retained"] = std::to_string(retained);

    log(LogLevel::DEBUG, "Metrics flushed", fields);
}

void Logger::log_error(
    const LogContext& ctx,
    const std::string& error_message,
    const std::string& stack_trace
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    if (!stack_trace.empty()) {
        fields["stack_trace"] = stack_trace;
    }

    log(LogLevel::ERROR, "Sandbox error", fields);
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_code_preview(const LogContext& ctx, const std::string& code) {
    size_t max_chars = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_.enable_code_preview) {
            return;
        }
        max_chars = config_.max_code_preview_chars;
    }

    std::map<std::string, std::string> fields;
    fields["event"] = "code_preview";
    add_context(fields, ctx);
    fields["code_size"] = std::to_string(code.size());
    fields["preview"] = code.substr(0, std::min(code.size(), max_chars));

    if (code.size() > max_chars) {
        fields["truncated"] = "true";
    }

    log(LogLevel::DEBUG, "Code preview", fields);
}

void Logger::log_state_transition(const LogContext& ctx, ContextState old_state, ContextState new_state) {
    std::map<std::string, std::string> fields;
    fields["event"] = "state_transition";
    add_context(fields, ctx);
    fields["old_state"] = state_to_string(old_state);
    fields["new_state"] = state_to_string(new_state);

    log(LogLevel::DEBUG, "State transition", fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::add_context(std::map<std::string, std::string>& fields, const LogContext& ctx) const {
    if (!ctx.execution_id.empty()) fields["execution_id"] = ctx.execution_id;
    if (!ctx.language.empty()) fields["language"] = ctx.language;
    if (!ctx.session_id.empty()) fields["session_id"] = ctx.session_id;
    if (!ctx.phase.empty()) fields["phase"] = ctx.phase;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace liverun
