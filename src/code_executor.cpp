/**
 * @file code_executor.cpp
 * @brief Implementation of CodeExecutor
 */

#include "code_executor.hpp"
#include <algorithm>
#include <future>
#include <sstream>

namespace liverun {

namespace {

const char* const kTruncationMarker = "\n... (output truncated)";

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += separator;
        joined += item;
    }
    return joined;
}

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // anonymous namespace

json to_json(const CodeValidation& validation) {
    return json{
        {"valid", validation.valid},
        {"errors", validation.problems}
    };
}

json to_json(const ExecutionStats& stats) {
    json loader = {
        {"loads", stats.loader.loads},
        {"loadFailures", stats.loader.load_failures},
        {"sharedLoads", stats.loader.shared_loads},
        {"cachedEngines", stats.loader.cached_engines},
        {"cacheSizeBytes", stats.loader.cache_size_bytes},
        {"cacheHits", stats.loader.cache.hits},
        {"cacheMisses", stats.loader.cache.misses},
        {"cacheEvictions", stats.loader.cache.evictions},
        {"cacheExpirations", stats.loader.cache.expirations}
    };

    return json{
        {"activeExecutions", stats.active_executions},
        {"loadedEngines", stats.loaded_engines},
        {"performanceStats", to_json(stats.performance)},
        {"realTime", to_json(stats.real_time)},
        {"loader", loader},
        {"errors", to_json(stats.errors)}
    };
}

CodeExecutor::CodeExecutor(const SandboxConfig& config, Logger* logger)
    : CodeExecutor(config, std::make_unique<EngineFactory>(config), logger) {}

CodeExecutor::CodeExecutor(const SandboxConfig& config, std::unique_ptr<EngineFactory> factory,
                           Logger* logger)
    : config_(config),
      logger_(logger ? logger : &Logger::get_instance()),
      factory_(std::move(factory)),
      loader_(*factory_, config_, logger_),
      metrics_(config_.metrics, logger_),
      analyzer_(config_.security.build_policy()),
      execution_counter_(0) {

    validate_sandbox_config(config_);
}

CodeExecutor::~CodeExecutor() {
    shutdown();
}

std::map<std::string, std::string> CodeExecutor::start() {
    metrics_.start();
    loader_.start_sweeper();

    std::vector<std::string> preload;
    for (const auto& language : config_.cache.preload) {
        if (factory_->is_registered(language)) {
            preload.push_back(language);
        }
    }
    return loader_.preload(preload);
}

void CodeExecutor::shutdown() {
    loader_.stop_sweeper();
    metrics_.stop();
    metrics_.flush();
}

// ============================================================================
// Request validation
// ============================================================================

std::vector<std::string> CodeExecutor::supported_languages() const {
    std::vector<std::string> languages;
    for (const auto& language : config_.language_ids()) {
        if (factory_->is_registered(language)) {
            languages.push_back(language);
        }
    }
    return languages;
}

void CodeExecutor::validate_request(const ExecutionRequest& request) const {
    if (is_blank(request.code)) {
        throw ValidationError("Code must not be empty");
    }
    if (request.language.empty()) {
        throw ValidationError("Language is required");
    }
    if (!config_.is_supported(request.language) || !factory_->is_registered(request.language)) {
        throw ValidationError("Unsupported language: " + request.language +
                              ". Supported languages: " + join(supported_languages(), ", "));
    }
    if (request.code.size() > config_.limits.max_code_length) {
        throw ValidationError("Code exceeds maximum length of " +
                              std::to_string(config_.limits.max_code_length) + " characters");
    }
    if (request.options.timeout_ms > config_.limits.max_timeout_ms) {
        throw ValidationError("Timeout must be between 1 and " +
                              std::to_string(config_.limits.max_timeout_ms) + "ms");
    }
}

uint32_t CodeExecutor::resolve_timeout(const ExecutionRequest& request) const {
    if (request.options.timeout_ms > 0) {
        return request.options.timeout_ms;
    }
    uint32_t language_timeout = config_.language(request.language).timeout_ms;
    return language_timeout > 0 ? language_timeout : config_.limits.default_timeout_ms;
}

std::string CodeExecutor::next_execution_id() {
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "exec_" + std::to_string(now_ms) + "_" + std::to_string(++execution_counter_);
}

// ============================================================================
// Execution
// ============================================================================

ExecutionResult CodeExecutor::execute(const ExecutionRequest& request) {
    LogContext ctx("", request.language);
    ctx.session_id = request.session_id;
    ctx.phase = "validate";

    try {
        validate_request(request);
    } catch (const ValidationError& e) {
        logger_->log_warning(ctx, e.what());
        throw;
    }

    const auto start_time = std::chrono::steady_clock::now();
    const uint32_t timeout_ms = resolve_timeout(request);

    ExecutionResult result;
    result.execution_id = next_execution_id();
    ctx.execution_id = result.execution_id;
    ctx.phase = "execute";

    logger_->log_code_preview(ctx, request.code);
    logger_->log_execution_start(ctx, request.code.size());
    metrics_.start_execution(result.execution_id, request.language, request.code.size());

    // Static analysis: obvious violations never reach a runtime
    if (config_.security.static_analysis) {
        std::vector<SecurityFinding> findings = analyzer_.analyze(request.code, request.language);
        if (!findings.empty()) {
            std::vector<std::string> messages;
            for (const auto& finding : findings) {
                logger_->log_security_violation(ctx, finding.rule, finding.message);
                messages.push_back("SecurityError: " + finding.message +
                                   " (line " + std::to_string(finding.line) + ")");
            }
            fail(result, ErrorKind::SECURITY_VIOLATION, join(messages, "\n"));
            result.metadata["violations"] = findings.size();
            return finish(std::move(result), request, ctx, start_time);
        }
    }

    const auto load_timeout = std::chrono::milliseconds(config_.limits.engine_load_timeout_ms);

    // A context terminated underneath a queued request is replaced once
    for (int attempt = 0; attempt < 2; ++attempt) {
        ctx.phase = "load";
        EngineHandle handle;
        try {
            handle = loader_.load_engine(request.language, load_timeout);
        } catch (const EngineLoadError& e) {
            logger_->log_error(ctx, e.what());
            fail(result, ErrorKind::ENGINE_LOAD, e.what());
            break;
        }
        track_active(result.execution_id, handle);
        ctx.phase = "execute";

        // The execution budget starts once the context is ready
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::milliseconds(timeout_ms + config_.limits.termination_grace_ms);

        if (!request.options.dependencies.empty()) {
            std::vector<std::string> dependencies(request.options.dependencies.begin(),
                                                  request.options.dependencies.end());
            auto reply = handle->post(ContextCommand::install_dependencies(
                result.execution_id, dependencies));
            if (reply.wait_until(deadline) == std::future_status::timeout &&
                expire_command(handle, request.language, result.execution_id)) {
                fail(result, ErrorKind::TIMEOUT,
                     "Execution timed out after " + std::to_string(timeout_ms) + "ms");
                break;
            }
            ContextEvent installed = reply.get();
            if (installed.type == EventType::ERROR) {
                if (installed.context_terminated && attempt == 0 && !was_cancelled(result.execution_id)) {
                    loader_.invalidate(request.language, handle);
                    continue;
                }
                fail(result, ErrorKind::ENGINE_LOAD, "Dependency installation failed: " + installed.error);
                break;
            }
            result.metadata["installedDependencies"] = installed.installed;
        }

        auto reply = handle->post(ContextCommand::execute(result.execution_id, request.code, timeout_ms));
        if (reply.wait_until(deadline) == std::future_status::timeout &&
            expire_command(handle, request.language, result.execution_id)) {
            logger_->log_warning(ctx, "Execution exceeded " + std::to_string(timeout_ms) + "ms");
            fail(result, ErrorKind::TIMEOUT,
                 "Execution timed out after " + std::to_string(timeout_ms) + "ms");
            break;
        }

        ContextEvent event = reply.get();
        if (event.type == EventType::ERROR && event.context_terminated) {
            loader_.invalidate(request.language, handle);
            if (was_cancelled(result.execution_id)) {
                fail(result, ErrorKind::UNKNOWN, "Execution terminated");
                break;
            }
            if (attempt == 0 && std::chrono::steady_clock::now() < deadline) {
                continue;
            }
        }

        apply_event(result, event);
        break;
    }

    return finish(std::move(result), request, ctx, start_time);
}

bool CodeExecutor::expire_command(const EngineHandle& handle, const std::string& language,
                                  const std::string& command_id) {
    if (handle->cancel_queued(command_id)) {
        return true;
    }
    if (handle->is_running(command_id)) {
        handle->terminate();
        loader_.invalidate(language, handle);
        return true;
    }
    // Finished while the deadline passed; its reply is ready
    return false;
}

void CodeExecutor::apply_event(ExecutionResult& result, const ContextEvent& event) const {
    json metadata = event.metadata.is_object() ? event.metadata : json::object();
    for (auto it = result.metadata.begin(); it != result.metadata.end(); ++it) {
        metadata[it.key()] = it.value();
    }
    result.metadata = std::move(metadata);

    if (event.memory_bytes > 0) {
        result.memory_bytes = event.memory_bytes;
    }
    result.metadata["engineDurationMs"] = event.duration_ms;

    std::string output = event.output;
    if (output.size() > config_.limits.max_output_size) {
        output = output.substr(0, config_.limits.max_output_size) + kTruncationMarker;
        result.metadata["truncated"] = true;
    }

    if (event.type == EventType::RESULT && event.success) {
        result.success = true;
        result.error_kind = ErrorKind::NONE;
        result.output = output;
        result.artifacts = event.artifacts;
        if (!event.artifacts.empty()) {
            result.visual_artifact = compose_visual_artifact(event.artifacts);
        }
        return;
    }

    if (!output.empty()) {
        result.metadata["partial_output"] = output;
    }
    fail(result, kind_of(event), event.error.empty() ? "Unknown error" : event.error);
}

void CodeExecutor::fail(ExecutionResult& result, ErrorKind kind, const std::string& error) const {
    result.success = false;
    result.error_kind = kind;
    result.error_raw = error;
    result.output.reset();
    result.visual_artifact.reset();
}

ExecutionResult CodeExecutor::finish(ExecutionResult result, const ExecutionRequest& request,
                                     const LogContext& ctx,
                                     std::chrono::steady_clock::time_point start_time) {
    untrack_active(result.execution_id);
    result.execution_time_ms = std::max(0.0, elapsed_ms(start_time));

    if (!result.success) {
        ProcessedError report = classifier_.classify(
            result.error_raw.value_or("Unknown error"),
            ErrorContext(request.language, result.execution_id, request.code));
        classifier_.track(report, request.language);
        result.processed_error = report;

        if (result.error_kind == ErrorKind::SECURITY_VIOLATION && !result.metadata.contains("violations")) {
            logger_->log_security_violation(ctx, "runtime", *result.error_raw);
        }
    }

    size_t violations = result.error_kind == ErrorKind::SECURITY_VIOLATION
        ? result.metadata.value("violations", static_cast<size_t>(1)) : 0;
    metrics_.end_execution(
        result.execution_id,
        result.success,
        result.output ? result.output->size() : 0,
        result.success ? "" : error_kind_to_string(result.error_kind),
        result.execution_time_ms,
        result.memory_bytes.value_or(0),
        violations);

    logger_->log_execution_complete(ctx, result);
    return result;
}

ErrorKind CodeExecutor::kind_of(const ContextEvent& event) {
    const std::string& message = event.error;
    if (message.find("timed out") != std::string::npos) {
        return ErrorKind::TIMEOUT;
    }
    if (message.find("not allowed for security reasons") != std::string::npos) {
        return ErrorKind::SECURITY_VIOLATION;
    }
    if (event.type == EventType::ERROR && message.rfind("Engine load failed", 0) == 0) {
        return ErrorKind::ENGINE_LOAD;
    }
    if (event.type == EventType::ERROR && event.context_terminated) {
        return ErrorKind::UNKNOWN;
    }
    return ErrorKind::RUNTIME;
}

std::string CodeExecutor::compose_visual_artifact(const std::vector<Artifact>& artifacts) {
    std::ostringstream html;
    for (size_t i = 0; i < artifacts.size(); ++i) {
        const Artifact& artifact = artifacts[i];
        if (i > 0) html << "\n";
        if (artifact.kind == "image") {
            html << "<img src=\"" << artifact.data << "\" alt=\"Plot " << (i + 1) << "\" />";
        } else {
            html << artifact.data;
        }
    }
    return html.str();
}

// ============================================================================
// Validation, termination and statistics
// ============================================================================

CodeValidation CodeExecutor::validate_code(const std::string& code, const std::string& language) {
    ExecutionRequest request(code, language);
    validate_request(request);

    CodeValidation validation;
    if (config_.security.static_analysis) {
        for (const auto& finding : analyzer_.analyze(code, language)) {
            validation.problems.push_back("Line " + std::to_string(finding.line) + ": " + finding.message);
        }
    }

    const std::string id = next_execution_id();
    LogContext ctx(id, language);
    ctx.phase = "validate";

    try {
        EngineHandle handle = loader_.load_engine(language);
        auto reply = handle->validate(id, code);
        if (reply.wait_for(std::chrono::milliseconds(resolve_timeout(request))) ==
            std::future_status::timeout) {
            handle->terminate();
            loader_.invalidate(language, handle);
            validation.problems.push_back("Validation timed out");
        } else {
            ContextEvent event = reply.get();
            if (event.type == EventType::RESULT && event.metadata.contains("problems")) {
                for (const auto& problem : event.metadata["problems"]) {
                    validation.problems.push_back(problem.get<std::string>());
                }
            } else if (!event.success && !event.error.empty()) {
                validation.problems.push_back(event.error);
            }
        }
    } catch (const EngineLoadError& e) {
        logger_->log_error(ctx, e.what());
        validation.problems.push_back(e.what());
    }

    validation.valid = validation.problems.empty();
    return validation;
}

bool CodeExecutor::terminate_execution(const std::string& execution_id) {
    EngineHandle handle;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        auto it = active_.find(execution_id);
        if (it == active_.end()) {
            return false;
        }
        handle = it->second;
        cancelled_.insert(execution_id);
    }

    LogContext ctx(execution_id, handle->language());
    logger_->log_warning(ctx, "Terminating execution on request");
    handle->terminate();
    loader_.invalidate(handle->language(), handle);
    return true;
}

std::vector<std::string> CodeExecutor::active_execution_ids() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    std::vector<std::string> ids;
    for (const auto& pair : active_) {
        ids.push_back(pair.first);
    }
    return ids;
}

ExecutionStats CodeExecutor::get_execution_stats() const {
    ExecutionStats stats;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        stats.active_executions = active_.size();
    }
    stats.loaded_engines = loader_.loaded_languages();
    stats.performance = metrics_.get_performance_stats();
    stats.real_time = metrics_.get_real_time_metrics();
    stats.loader = loader_.get_stats();
    stats.errors = classifier_.get_error_analytics();
    return stats;
}

void CodeExecutor::track_active(const std::string& execution_id, const EngineHandle& handle) {
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_[execution_id] = handle;
}

void CodeExecutor::untrack_active(const std::string& execution_id) {
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_.erase(execution_id);
    cancelled_.erase(execution_id);
}

bool CodeExecutor::was_cancelled(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    return cancelled_.count(execution_id) > 0;
}

} // namespace liverun
