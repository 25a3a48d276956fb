/**
 * @file code_executor.hpp
 * @brief Request dispatcher coordinating validation, engine loading and execution
 *
 * The CodeExecutor is responsible for:
 * - Validating requests (code, language, timeout and length bounds)
 * - Short-circuiting obvious policy violations with static analysis
 * - Resolving a hot engine context through the EngineLoader
 * - Enforcing the caller-side timeout and discarding timed-out contexts
 * - Normalizing engine events into ExecutionResult
 * - Classifying failures and recording one execution metric per request
 *
 * Only validation failures throw. Every other outcome, including engine load
 * failures and user-code errors, is returned as an ExecutionResult.
 */

#ifndef LIVERUN_CODE_EXECUTOR_HPP
#define LIVERUN_CODE_EXECUTOR_HPP

#include "engine_factory.hpp"
#include "engine_loader.hpp"
#include "error_classifier.hpp"
#include "execution_types.hpp"
#include "logger.hpp"
#include "metrics_collector.hpp"
#include "sandbox_config.hpp"
#include "security_policy.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace liverun {

/**
 * @brief Outcome of a syntax-only check
 */
struct CodeValidation {
    bool valid;
    std::vector<std::string> problems;   ///< Syntax problems and static policy findings

    CodeValidation() : valid(true) {}
};

/**
 * @brief Snapshot of dispatcher activity
 */
struct ExecutionStats {
    size_t active_executions;
    std::vector<std::string> loaded_engines;
    PerformanceStats performance;
    RealTimeMetrics real_time;
    LoaderStats loader;
    ErrorAnalytics errors;

    ExecutionStats() : active_executions(0) {}
};

nlohmann::json to_json(const CodeValidation& validation);
nlohmann::json to_json(const ExecutionStats& stats);

/**
 * @brief Code execution dispatcher
 *
 * Usage Example:
 *   @code
 *   SandboxConfig config = parse_sandbox_config_from_file("config/sandbox.json");
 *   CodeExecutor executor(config);
 *   executor.start();
 *
 *   ExecutionRequest request("print('hello')", "python", "session_1");
 *   ExecutionResult result = executor.execute(request);
 *
 *   if (result.success) {
 *       std::cout << *result.output;
 *   } else {
 *       std::cerr << result.processed_error->user_message << std::endl;
 *   }
 *   @endcode
 */
class CodeExecutor {
public:
    /**
     * @brief Constructor with the built-in engines
     *
     * @param config Sandbox configuration (validated here)
     * @param logger Logger instance (optional, uses default if nullptr)
     *
     * @throws ConfigurationError If the configuration is invalid
     */
    explicit CodeExecutor(const SandboxConfig& config, Logger* logger = nullptr);

    /**
     * @brief Constructor with a caller-provided factory
     *
     * @param config Sandbox configuration (validated here)
     * @param factory Engine factory (transfers ownership)
     * @param logger Logger instance (optional, uses default if nullptr)
     */
    CodeExecutor(const SandboxConfig& config, std::unique_ptr<EngineFactory> factory,
                 Logger* logger = nullptr);

    /**
     * @brief Destructor - stops background threads and drops cached engines
     */
    ~CodeExecutor();

    CodeExecutor(const CodeExecutor&) = delete;
    CodeExecutor& operator=(const CodeExecutor&) = delete;

    /**
     * @brief Preload configured engines and start the cache sweeper and metrics flusher
     *
     * @return Map of language -> error message for preloads that failed
     */
    std::map<std::string, std::string> start();

    /**
     * @brief Stop background threads and flush metrics
     */
    void shutdown();

    /**
     * @brief Run one request
     *
     * @param request Code, language and options
     * @return Normalized result (never throws for user-code failures)
     *
     * @throws ValidationError If the request is malformed (nothing executed, nothing recorded)
     */
    ExecutionResult execute(const ExecutionRequest& request);

    /**
     * @brief Check syntax without running the code
     *
     * @throws ValidationError If the language is unknown or the code is empty
     */
    CodeValidation validate_code(const std::string& code, const std::string& language);

    /**
     * @brief Stop a running or queued execution
     *
     * Terminates the context hosting the execution and drops it from the
     * cache. Other requests queued on that context are resubmitted to a
     * fresh one.
     *
     * @return True if the execution was found
     */
    bool terminate_execution(const std::string& execution_id);

    /**
     * @brief Ids of executions that are queued or running
     */
    std::vector<std::string> active_execution_ids() const;

    ExecutionStats get_execution_stats() const;

    /**
     * @brief Languages that are both configured and served by the factory
     */
    std::vector<std::string> supported_languages() const;

    const SandboxConfig& config() const { return config_; }
    EngineLoader& loader() { return loader_; }
    MetricsCollector& metrics() { return metrics_; }
    ErrorClassifier& classifier() { return classifier_; }

private:
    SandboxConfig config_;
    Logger* logger_;
    std::unique_ptr<EngineFactory> factory_;
    EngineLoader loader_;
    MetricsCollector metrics_;
    ErrorClassifier classifier_;
    CodeAnalyzer analyzer_;

    mutable std::mutex active_mutex_;
    std::map<std::string, EngineHandle> active_;   ///< execution id -> hosting context
    std::set<std::string> cancelled_;
    std::atomic<uint64_t> execution_counter_;

    std::string next_execution_id();
    uint32_t resolve_timeout(const ExecutionRequest& request) const;
    void validate_request(const ExecutionRequest& request) const;

    void track_active(const std::string& execution_id, const EngineHandle& handle);
    void untrack_active(const std::string& execution_id);
    bool was_cancelled(const std::string& execution_id) const;

    /**
     * @brief Withdraw a command whose deadline passed
     *
     * A queued command is dropped and the context kept. A running command
     * takes its context down (terminated and removed from the cache).
     *
     * @return False if the command already finished
     */
    bool expire_command(const EngineHandle& handle, const std::string& language,
                        const std::string& command_id);

    void apply_event(ExecutionResult& result, const ContextEvent& event) const;
    void fail(ExecutionResult& result, ErrorKind kind, const std::string& error) const;
    ExecutionResult finish(ExecutionResult result, const ExecutionRequest& request,
                           const LogContext& ctx, std::chrono::steady_clock::time_point start_time);

    static ErrorKind kind_of(const ContextEvent& event);
    static std::string compose_visual_artifact(const std::vector<Artifact>& artifacts);
};

} // namespace liverun

#endif // LIVERUN_CODE_EXECUTOR_HPP
