/**
 * @file engine_interface.hpp
 * @brief Abstract interface for per-language execution engines
 *
 * Every supported language is served by an engine implementing ILanguageEngine.
 * Engines never run on the caller's thread directly: an IsolatedExecutionContext
 * hosts exactly one engine and feeds it commands one at a time.
 *
 * Design Principles:
 * - Uniform: execute(code, options) returns the same raw shape for every language
 * - Bootstrapped once: initialize() pays the runtime cost, execute() reuses it
 * - Policy first: the SecurityPolicy is handed over before any user code runs
 * - Interruptible: interrupt() may be called from another thread at any time
 */

#ifndef LIVERUN_ENGINE_INTERFACE_HPP
#define LIVERUN_ENGINE_INTERFACE_HPP

#include "security_policy.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include <cstdint>
#include <functional>

namespace liverun {

using json = nlohmann::json;

/**
 * @brief Engine metadata and capabilities
 */
struct EngineInfo {
    std::string name;                    ///< Human-readable engine name (e.g., "Python Worker Engine")
    std::string version;                 ///< Engine version string
    std::string language;                ///< Language served by the engine
    bool heavy_runtime;                  ///< Whether initialize() bootstraps an expensive runtime
    size_t approx_footprint_bytes;       ///< Estimated resident cost, charged against the cache budget

    EngineInfo(
        const std::string& name_,
        const std::string& version_,
        const std::string& language_,
        bool heavy_runtime_ = false,
        size_t approx_footprint_bytes_ = 64 * 1024
    ) : name(name_), version(version_), language(language_),
        heavy_runtime(heavy_runtime_), approx_footprint_bytes(approx_footprint_bytes_) {}
};

/**
 * @brief Renderable output produced by user code
 */
struct Artifact {
    std::string kind;        ///< "image", "table" or "html"
    std::string mime_type;   ///< e.g. "image/png", "text/html"
    std::string data;        ///< Self-contained payload (data URI or inline markup)

    Artifact() = default;
    Artifact(const std::string& kind_, const std::string& mime_type_, const std::string& data_)
        : kind(kind_), mime_type(mime_type_), data(data_) {}
};

/**
 * @brief Per-call execution options forwarded to the engine
 */
struct ExecutionOptions {
    std::string execution_id;              ///< Correlation id of the request
    uint32_t timeout_ms;                   ///< Engine-side budget (engines may stop cooperatively)
    std::vector<std::string> dependencies; ///< Packages the caller expects to be importable

    ExecutionOptions() : timeout_ms(30000) {}
};

/**
 * @brief Raw result of a single engine call
 *
 * Exactly one of success / error is meaningful as the primary signal.
 */
struct EngineOutput {
    bool success;                        ///< True if user code completed without raising
    std::string stdout_text;             ///< Captured standard output
    std::string stderr_text;             ///< Captured standard error
    std::string error;                   ///< Raw error text (traceback, engine message) if !success
    std::vector<Artifact> artifacts;     ///< Rendered artifacts from this call only
    double duration_ms;                  ///< Engine-measured wall time
    uint64_t memory_bytes;               ///< Peak memory observed by the engine (0 if unknown)
    json metadata;                       ///< Engine-specific facts (packages, query type, ...)

    EngineOutput()
        : success(true), duration_ms(0.0), memory_bytes(0), metadata(json::object()) {}
};

/**
 * @brief Base exception for sandbox errors
 */
class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a request is malformed; nothing is executed
 */
class ValidationError : public SandboxError {
public:
    explicit ValidationError(const std::string& message)
        : SandboxError("Validation error: " + message) {}
};

/**
 * @brief Raised when configuration is invalid
 */
class ConfigurationError : public SandboxError {
public:
    explicit ConfigurationError(const std::string& message)
        : SandboxError("Configuration error: " + message) {}
};

/**
 * @brief Raised when a runtime or its default packages fail to bootstrap
 */
class EngineLoadError : public SandboxError {
public:
    explicit EngineLoadError(const std::string& message)
        : SandboxError("Engine load failed: " + message) {}
};

/**
 * @brief Raised when the security policy rejects code before it runs
 */
class SecurityViolationError : public SandboxError {
public:
    explicit SecurityViolationError(const std::string& message)
        : SandboxError(message) {}
};

/**
 * @brief Raised when an engine cannot carry out a command
 */
class ExecutionError : public SandboxError {
public:
    explicit ExecutionError(const std::string& message)
        : SandboxError("Execution failed: " + message) {}
};

/**
 * @brief Raised on malformed context protocol messages
 */
class ProtocolError : public SandboxError {
public:
    explicit ProtocolError(const std::string& message)
        : SandboxError("Protocol error: " + message) {}
};

/**
 * @brief Progress callback used by engines that stream status lines
 */
using ProgressCallback = std::function<void(const std::string& text)>;

/**
 * @brief Abstract interface for language execution engines
 *
 * Lifecycle:
 *   1. initialize(policy) - bootstrap runtime, install the security policy
 *   2. execute(code, options) - run one snippet (called many times, never concurrently)
 *   3. dispose() - release runtime resources
 *
 * Usage Example:
 *   @code
 *   auto engine = std::make_unique<JsonEngine>();
 *   engine->initialize(SecurityPolicy::defaults());
 *
 *   ExecutionOptions options;
 *   options.timeout_ms = 5000;
 *   EngineOutput out = engine->execute("{\"a\": 1}", options);
 *   if (!out.success) {
 *       std::cerr << out.error << std::endl;
 *   }
 *
 *   engine->dispose();
 *   @endcode
 */
class ILanguageEngine {
public:
    virtual ~ILanguageEngine() = default;

    /**
     * @brief Bootstrap the runtime and apply the security policy
     *
     * Called exactly once per engine instance, before any execute().
     *
     * @param policy Capability object describing what user code may touch
     * @throws EngineLoadError if the runtime cannot be started
     */
    virtual void initialize(const SecurityPolicy& policy) = 0;

    /**
     * @brief Get engine metadata
     */
    virtual EngineInfo get_info() const = 0;

    /**
     * @brief Execute one snippet of user code
     *
     * User code failures are reported through EngineOutput::success/error,
     * never thrown. Exceptions are reserved for engine faults.
     *
     * @param code Source code
     * @param options Per-call options
     * @return Raw engine output
     * @throws ExecutionError if the engine itself is broken
     */
    virtual EngineOutput execute(const std::string& code, const ExecutionOptions& options) = 0;

    /**
     * @brief Make additional packages available to later calls
     *
     * @param dependencies Package names
     * @return Names that are now importable
     * @throws ExecutionError if the engine has no package concept or installation fails
     */
    virtual std::vector<std::string> install_dependencies(const std::vector<std::string>& dependencies) {
        (void)dependencies;
        throw ExecutionError(get_info().language + " engine does not support dependencies");
    }

    /**
     * @brief Check syntax without running the code
     *
     * @return Problems found (empty if the code looks valid)
     */
    virtual std::vector<std::string> validate_syntax(const std::string& code) {
        (void)code;
        return {};
    }

    /**
     * @brief Best-effort cancellation of the call currently in execute()
     *
     * Thread-safe. Engines that cannot be preempted leave this as a no-op.
     */
    virtual void interrupt() noexcept {}

    /**
     * @brief Register a listener for progress lines
     */
    virtual void set_progress_callback(ProgressCallback callback) {
        (void)callback;
    }

    /**
     * @brief Release runtime resources
     */
    virtual void dispose() noexcept = 0;

    /**
     * @brief Check if initialize() completed
     */
    virtual bool is_initialized() const = 0;
};

} // namespace liverun

#endif // LIVERUN_ENGINE_INTERFACE_HPP
