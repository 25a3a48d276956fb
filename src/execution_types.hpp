/**
 * @file execution_types.hpp
 * @brief Request, result and error report types shared across the sandbox
 *
 * These are the stable shapes exchanged with callers. Whatever language ran
 * and however it failed, the caller always receives an ExecutionResult with
 * the same fields.
 */

#ifndef LIVERUN_EXECUTION_TYPES_HPP
#define LIVERUN_EXECUTION_TYPES_HPP

#include "engine_interface.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <set>
#include <cstdint>

namespace liverun {

/**
 * @brief Failure taxonomy
 */
enum class ErrorKind {
    NONE,                ///< Execution succeeded
    VALIDATION,          ///< Bad request, never executed
    SECURITY_VIOLATION,  ///< Policy denied an import, builtin or statement
    TIMEOUT,             ///< Caller stopped waiting
    ENGINE_LOAD,         ///< Runtime or dependency failed to initialize
    RUNTIME,             ///< User code raised during execution
    UNKNOWN              ///< Unclassified
};

/**
 * @brief Convert error kind to its taxonomy name
 */
inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::VALIDATION: return "ValidationError";
        case ErrorKind::SECURITY_VIOLATION: return "SecurityViolation";
        case ErrorKind::TIMEOUT: return "TimeoutError";
        case ErrorKind::ENGINE_LOAD: return "EngineLoadError";
        case ErrorKind::RUNTIME: return "RuntimeError";
        case ErrorKind::UNKNOWN: return "UnknownError";
        default: return "UnknownError";
    }
}

/**
 * @brief Options attached to a request
 */
struct RequestOptions {
    uint32_t timeout_ms;                 ///< 0 selects the language default
    std::set<std::string> dependencies;  ///< Extra packages to make importable first

    RequestOptions() : timeout_ms(0) {}
};

/**
 * @brief A unit of untrusted code to run
 */
struct ExecutionRequest {
    std::string code;          ///< Source code (must be non-empty after trimming)
    std::string language;      ///< Language id ("python", "sql", "json", ...)
    std::string session_id;    ///< Opaque id grouping related runs
    RequestOptions options;

    ExecutionRequest() = default;
    ExecutionRequest(const std::string& code_, const std::string& language_,
                     const std::string& session_id_ = "")
        : code(code_), language(language_), session_id(session_id_) {}
};

/**
 * @brief Suggested remediation for a failure
 */
struct ErrorSuggestion {
    enum class Type { FIX, ALTERNATIVE, DOCUMENTATION, EXAMPLE };

    Type type;
    std::string title;
    std::string description;
    int priority;                        ///< 1-10, higher is more important
    std::optional<std::string> code;     ///< Complete example snippet
    std::optional<std::string> link;     ///< Documentation URL

    ErrorSuggestion() : type(Type::FIX), priority(0) {}
    ErrorSuggestion(Type type_, const std::string& title_, const std::string& description_,
                    int priority_,
                    std::optional<std::string> code_ = std::nullopt,
                    std::optional<std::string> link_ = std::nullopt)
        : type(type_), title(title_), description(description_), priority(priority_),
          code(std::move(code_)), link(std::move(link_)) {}
};

std::string suggestion_type_to_string(ErrorSuggestion::Type type);

/**
 * @brief Error severity
 */
enum class Severity { LOW, MEDIUM, HIGH, CRITICAL };

std::string severity_to_string(Severity severity);

/**
 * @brief Structured, user-facing error report
 */
struct ProcessedError {
    std::string error_type;              ///< Token such as "NameError", or "UnknownError"
    std::string category;                ///< validation, security, network, timeout, memory, syntax, runtime, language_specific, unknown
    std::string message;                 ///< Human message from the raw error
    std::string user_message;            ///< Plain-language explanation
    std::vector<std::string> stack_trace;
    Severity severity;
    std::vector<ErrorSuggestion> suggestions;  ///< Sorted by priority, descending
    bool can_retry;
    std::optional<uint32_t> retry_delay_ms;

    ProcessedError() : severity(Severity::LOW), can_retry(false) {}
};

/**
 * @brief Normalized outcome of one request
 *
 * Exactly one of output (success) or error_raw (failure) is the primary
 * signal. execution_time_ms is always set.
 */
struct ExecutionResult {
    std::string execution_id;
    bool success;
    std::optional<std::string> output;
    std::optional<std::string> error_raw;
    std::optional<std::string> visual_artifact;  ///< Artifacts combined into one renderable payload
    std::vector<Artifact> artifacts;
    ErrorKind error_kind;
    double execution_time_ms;
    std::optional<uint64_t> memory_bytes;
    json metadata;
    std::optional<ProcessedError> processed_error;

    ExecutionResult()
        : success(false), error_kind(ErrorKind::NONE), execution_time_ms(0.0),
          metadata(json::object()) {}
};

json to_json(const ErrorSuggestion& suggestion);
json to_json(const ProcessedError& error);
json to_json(const ExecutionResult& result);

/**
 * @brief Parse a request document
 *
 * Accepts {"code", "language", "sessionId"?, "options"?: {"timeoutMs", "dependencies"}}.
 *
 * @throws ValidationError on missing or mistyped fields
 */
ExecutionRequest request_from_json(const json& j);

} // namespace liverun

#endif // LIVERUN_EXECUTION_TYPES_HPP
