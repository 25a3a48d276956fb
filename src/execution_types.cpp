/**
 * @file execution_types.cpp
 * @brief JSON conversion for request and result types
 */

#include "execution_types.hpp"

namespace liverun {

std::string suggestion_type_to_string(ErrorSuggestion::Type type) {
    switch (type) {
        case ErrorSuggestion::Type::FIX: return "fix";
        case ErrorSuggestion::Type::ALTERNATIVE: return "alternative";
        case ErrorSuggestion::Type::DOCUMENTATION: return "documentation";
        case ErrorSuggestion::Type::EXAMPLE: return "example";
        default: return "fix";
    }
}

std::string severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::LOW: return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH: return "high";
        case Severity::CRITICAL: return "critical";
        default: return "low";
    }
}

json to_json(const ErrorSuggestion& suggestion) {
    json j;
    j["type"] = suggestion_type_to_string(suggestion.type);
    j["title"] = suggestion.title;
    j["description"] = suggestion.description;
    j["priority"] = suggestion.priority;
    if (suggestion.code) {
        j["code"] = *suggestion.code;
    }
    if (suggestion.link) {
        j["link"] = *suggestion.link;
    }
    return j;
}

json to_json(const ProcessedError& error) {
    json j;
    j["errorType"] = error.error_type;
    j["category"] = error.category;
    j["message"] = error.message;
    j["userMessage"] = error.user_message;
    j["stackTrace"] = error.stack_trace;
    j["severity"] = severity_to_string(error.severity);
    j["canRetry"] = error.can_retry;
    if (error.retry_delay_ms) {
        j["retryDelayMs"] = *error.retry_delay_ms;
    }

    json suggestions = json::array();
    for (const auto& suggestion : error.suggestions) {
        suggestions.push_back(to_json(suggestion));
    }
    j["suggestions"] = suggestions;
    return j;
}

json to_json(const ExecutionResult& result) {
    json j;
    j["executionId"] = result.execution_id;
    j["success"] = result.success;
    if (result.output) {
        j["output"] = *result.output;
    }
    if (result.error_raw) {
        j["errorRaw"] = *result.error_raw;
        j["errorKind"] = error_kind_to_string(result.error_kind);
    }
    if (result.visual_artifact) {
        j["visualArtifact"] = *result.visual_artifact;
    }
    j["executionTimeMs"] = result.execution_time_ms;
    if (result.memory_bytes) {
        j["memoryBytes"] = *result.memory_bytes;
    }
    j["metadata"] = result.metadata;
    if (result.processed_error) {
        j["processedError"] = to_json(*result.processed_error);
    }
    return j;
}

ExecutionRequest request_from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("request must be a JSON object");
    }

    ExecutionRequest request;
    try {
        if (!j.contains("code") || !j["code"].is_string()) {
            throw ValidationError("missing required string field: code");
        }
        request.code = j["code"].get<std::string>();

        if (!j.contains("language") || !j["language"].is_string()) {
            throw ValidationError("missing required string field: language");
        }
        request.language = j["language"].get<std::string>();

        if (j.contains("sessionId")) {
            request.session_id = j["sessionId"].get<std::string>();
        }

        if (j.contains("options")) {
            const auto& options = j["options"];
            if (options.contains("timeoutMs")) {
                int64_t timeout = options["timeoutMs"].get<int64_t>();
                if (timeout < 0) {
                    throw ValidationError("timeoutMs must not be negative");
                }
                request.options.timeout_ms = static_cast<uint32_t>(timeout);
            }
            if (options.contains("dependencies")) {
                for (const auto& dep : options["dependencies"]) {
                    request.options.dependencies.insert(dep.get<std::string>());
                }
            }
        }
    } catch (const json::exception& e) {
        throw ValidationError(std::string("malformed request: ") + e.what());
    }

    return request;
}

} // namespace liverun
