/**
 * @file sandbox_config.cpp
 * @brief Defaults and validation for SandboxConfig
 */

#include "sandbox_config.hpp"
#include "engine_interface.hpp"

namespace liverun {

SecurityConfig::SecurityConfig() : static_analysis(true) {
    SecurityPolicy defaults = SecurityPolicy::defaults();
    blocked_modules = defaults.blocked_modules();
    blocked_builtins = defaults.blocked_builtins();
    blocked_sql_statements = defaults.blocked_sql_statements();
}

SecurityPolicy SecurityConfig::build_policy() const {
    return SecurityPolicy(blocked_modules, blocked_builtins, blocked_sql_statements);
}

SandboxConfig::SandboxConfig() {
    const uint64_t mb = 1024 * 1024;

    // The Python cap is address space, which numpy/BLAS reserve generously
    languages["python"] = LanguageConfig(30000, 1024 * mb, {"numpy", "pandas", "matplotlib"});
    languages["sql"] = LanguageConfig(15000, 64 * mb);
    languages["json"] = LanguageConfig(5000, 0);
    languages["markdown"] = LanguageConfig(5000, 0);
    languages["regex"] = LanguageConfig(5000, 0);
    languages["html"] = LanguageConfig(5000, 0);
    languages["css"] = LanguageConfig(5000, 0);
    languages["yaml"] = LanguageConfig(5000, 0);
}

bool SandboxConfig::is_supported(const std::string& id) const {
    return languages.find(id) != languages.end();
}

const LanguageConfig& SandboxConfig::language(const std::string& id) const {
    auto it = languages.find(id);
    if (it == languages.end()) {
        throw ConfigurationError("Language '" + id + "' is not configured");
    }
    return it->second;
}

std::vector<std::string> SandboxConfig::language_ids() const {
    std::vector<std::string> ids;
    for (const auto& [id, _] : languages) {
        ids.push_back(id);
    }
    return ids;
}

void validate_sandbox_config(const SandboxConfig& config) {
    const auto& limits = config.limits;

    if (limits.max_timeout_ms == 0) {
        throw ConfigurationError("limits.max_timeout_ms must be positive");
    }
    if (limits.default_timeout_ms == 0 || limits.default_timeout_ms > limits.max_timeout_ms) {
        throw ConfigurationError("limits.default_timeout_ms must be in [1, max_timeout_ms]");
    }
    if (limits.max_code_length == 0) {
        throw ConfigurationError("limits.max_code_length must be positive");
    }
    if (limits.max_output_size == 0) {
        throw ConfigurationError("limits.max_output_size must be positive");
    }
    if (limits.engine_load_timeout_ms == 0) {
        throw ConfigurationError("limits.engine_load_timeout_ms must be positive");
    }

    if (config.languages.empty()) {
        throw ConfigurationError("at least one language must be configured");
    }
    for (const auto& [id, lang] : config.languages) {
        if (lang.timeout_ms == 0 || lang.timeout_ms > limits.max_timeout_ms) {
            throw ConfigurationError("languages." + id + ".timeout_ms must be in [1, max_timeout_ms]");
        }
    }

    if (config.cache.max_size_bytes == 0) {
        throw ConfigurationError("cache.max_size_bytes must be positive");
    }
    if (config.cache.default_ttl_ms == 0) {
        throw ConfigurationError("cache.default_ttl_ms must be positive");
    }
    for (const auto& id : config.cache.preload) {
        if (!config.is_supported(id)) {
            throw ConfigurationError("cache.preload names unknown language '" + id + "'");
        }
    }

    if (config.metrics.max_retained == 0) {
        throw ConfigurationError("metrics.max_retained must be positive");
    }
    if (config.metrics.max_buffer == 0) {
        throw ConfigurationError("metrics.max_buffer must be positive");
    }

    if (config.python.interpreter.empty()) {
        throw ConfigurationError("python.interpreter must not be empty");
    }
}

} // namespace liverun
