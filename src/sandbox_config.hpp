/**
 * @file sandbox_config.hpp
 * @brief Configuration model for the execution sandbox
 *
 * Everything tunable lives here: request limits, per-language defaults, cache
 * budget, metric retention, the security deny-lists and logging. Defaults
 * reproduce the playground's behaviour; config_parser.hpp reads overrides from
 * JSON.
 */

#ifndef LIVERUN_SANDBOX_CONFIG_HPP
#define LIVERUN_SANDBOX_CONFIG_HPP

#include "logger.hpp"
#include "security_policy.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <cstdint>
#include <stdexcept>

namespace liverun {

/**
 * @brief Request limits
 */
struct LimitsConfig {
    uint32_t max_timeout_ms;         ///< Upper bound for a request's timeout
    uint32_t default_timeout_ms;     ///< Used when neither request nor language sets one
    size_t max_code_length;          ///< Longest accepted source, in bytes
    size_t max_output_size;          ///< Output longer than this is truncated
    uint32_t termination_grace_ms;   ///< Extra wait for an engine-side timeout before terminating
    uint32_t engine_load_timeout_ms; ///< Longest a request waits for its engine to bootstrap

    LimitsConfig()
        : max_timeout_ms(60000),
          default_timeout_ms(30000),
          max_code_length(100000),
          max_output_size(10000),
          termination_grace_ms(250),
          engine_load_timeout_ms(60000) {}
};

/**
 * @brief Per-language defaults
 */
struct LanguageConfig {
    uint32_t timeout_ms;                        ///< Default timeout for this language
    uint64_t memory_limit_bytes;                ///< Runtime memory cap (0 = unlimited)
    std::vector<std::string> default_packages;  ///< Loaded at bootstrap

    LanguageConfig() : timeout_ms(5000), memory_limit_bytes(0) {}
    LanguageConfig(uint32_t timeout, uint64_t memory, std::vector<std::string> packages = {})
        : timeout_ms(timeout), memory_limit_bytes(memory), default_packages(std::move(packages)) {}
};

/**
 * @brief Engine cache settings
 */
struct CacheConfig {
    size_t max_size_bytes;             ///< Global budget for cached engines
    uint32_t default_ttl_ms;           ///< Lifetime of a cached engine
    uint32_t sweep_interval_ms;        ///< Period of the expiry sweep (0 disables the sweeper)
    std::vector<std::string> preload;  ///< Languages loaded at startup

    CacheConfig()
        : max_size_bytes(50 * 1024 * 1024),
          default_ttl_ms(30 * 60 * 1000),
          sweep_interval_ms(60 * 1000),
          preload({"python"}) {}
};

/**
 * @brief Metrics retention settings
 */
struct MetricsConfig {
    uint32_t flush_interval_ms;   ///< Period of the background flush (0 disables the thread)
    size_t max_buffer;            ///< Flush early once the buffer grows past this
    size_t max_retained;          ///< Ring capacity; oldest samples dropped beyond it

    MetricsConfig()
        : flush_interval_ms(5000),
          max_buffer(100),
          max_retained(1000) {}
};

/**
 * @brief Security deny-lists (defaults from SecurityPolicy::defaults())
 */
struct SecurityConfig {
    std::set<std::string> blocked_modules;
    std::set<std::string> blocked_builtins;
    std::set<std::string> blocked_sql_statements;
    bool static_analysis;         ///< Reject obvious violations before dispatch

    SecurityConfig();

    /**
     * @brief Build the capability object handed to engines
     */
    SecurityPolicy build_policy() const;
};

/**
 * @brief Python runtime settings
 */
struct PythonConfig {
    std::string interpreter;      ///< Interpreter executable (searched on PATH)

    PythonConfig() : interpreter("python3") {}
};

/**
 * @brief Complete sandbox configuration
 */
struct SandboxConfig {
    LimitsConfig limits;
    std::map<std::string, LanguageConfig> languages;
    CacheConfig cache;
    MetricsConfig metrics;
    SecurityConfig security;
    PythonConfig python;
    LoggerConfig logging;

    SandboxConfig();

    /**
     * @brief Whether a language has an entry
     */
    bool is_supported(const std::string& language) const;

    /**
     * @brief Language settings
     * @throws ConfigurationError if the language is not configured
     */
    const LanguageConfig& language(const std::string& language) const;

    /**
     * @brief Configured language ids, sorted
     */
    std::vector<std::string> language_ids() const;
};

/**
 * @brief Validates a configuration
 *
 * Checks:
 * - Timeouts are positive and the default does not exceed the maximum
 * - Every language timeout is within the maximum
 * - Cache budget and metric retention are non-zero
 * - Preloaded languages are configured
 * - A Python interpreter is named
 *
 * @throws ConfigurationError describing the first problem found
 */
void validate_sandbox_config(const SandboxConfig& config);

} // namespace liverun

#endif // LIVERUN_SANDBOX_CONFIG_HPP
