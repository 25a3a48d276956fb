#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <cstdlib>
#include <cctype>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace liverun {

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        size_t name_end = pos;

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated "${": leave the text alone
                pos = start + 1;
                continue;
            }
            pos++; // Skip '}'
        }

        if (name_end == name_start) {
            // A lone '$' is not a reference
            pos = start + 1;
            continue;
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    fs::path resolved = config_dir / p;
    return resolved.string();
}

namespace {

std::set<std::string> parse_string_set(const json& j, const std::string& field) {
    if (!j.is_array()) {
        throw ConfigParseError("Field '" + field + "' must be an array of strings");
    }
    std::set<std::string> values;
    for (const auto& item : j) {
        values.insert(item.get<std::string>());
    }
    return values;
}

void parse_limits(const json& j, LimitsConfig& limits) {
    limits.max_timeout_ms = j.value("max_timeout_ms", limits.max_timeout_ms);
    limits.default_timeout_ms = j.value("default_timeout_ms", limits.default_timeout_ms);
    limits.max_code_length = j.value("max_code_length", limits.max_code_length);
    limits.max_output_size = j.value("max_output_size", limits.max_output_size);
    limits.termination_grace_ms = j.value("termination_grace_ms", limits.termination_grace_ms);
    limits.engine_load_timeout_ms = j.value("engine_load_timeout_ms", limits.engine_load_timeout_ms);
}

void parse_languages(const json& j, std::map<std::string, LanguageConfig>& languages) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& id = it.key();
        const json& entry = it.value();

        if (entry.is_null()) {
            // "python": null disables a built-in language
            languages.erase(id);
            continue;
        }
        if (!entry.is_object()) {
            throw ConfigParseError("Language '" + id + "' must be an object");
        }

        LanguageConfig lang = languages.count(id) ? languages[id] : LanguageConfig();
        lang.timeout_ms = entry.value("timeout_ms", lang.timeout_ms);
        lang.memory_limit_bytes = entry.value("memory_limit_bytes", lang.memory_limit_bytes);
        if (entry.contains("default_packages")) {
            lang.default_packages = entry["default_packages"].get<std::vector<std::string>>();
        }
        languages[id] = lang;
    }
}

void parse_cache(const json& j, CacheConfig& cache) {
    cache.max_size_bytes = j.value("max_size_bytes", cache.max_size_bytes);
    cache.default_ttl_ms = j.value("default_ttl_ms", cache.default_ttl_ms);
    cache.sweep_interval_ms = j.value("sweep_interval_ms", cache.sweep_interval_ms);
    if (j.contains("preload")) {
        cache.preload = j["preload"].get<std::vector<std::string>>();
    }
}

void parse_metrics(const json& j, MetricsConfig& metrics) {
    metrics.flush_interval_ms = j.value("flush_interval_ms", metrics.flush_interval_ms);
    metrics.max_buffer = j.value("max_buffer", metrics.max_buffer);
    metrics.max_retained = j.value("max_retained", metrics.max_retained);
}

void parse_security(const json& j, SecurityConfig& security) {
    // Lists replace the defaults wholesale
    if (j.contains("blocked_modules")) {
        security.blocked_modules = parse_string_set(j["blocked_modules"], "security.blocked_modules");
    }
    if (j.contains("blocked_builtins")) {
        security.blocked_builtins = parse_string_set(j["blocked_builtins"], "security.blocked_builtins");
    }
    if (j.contains("blocked_sql_statements")) {
        security.blocked_sql_statements =
            parse_string_set(j["blocked_sql_statements"], "security.blocked_sql_statements");
    }
    security.static_analysis = j.value("static_analysis", security.static_analysis);
}

void parse_logging(const json& j, LoggerConfig& logging) {
    if (j.contains("level")) {
        logging.min_level = string_to_level(j["level"].get<std::string>());
    }
    logging.enable_json = j.value("json", logging.enable_json);
    logging.enable_console = j.value("console", logging.enable_console);
    logging.enable_code_preview = j.value("code_preview", logging.enable_code_preview);
    if (j.contains("file")) {
        logging.enable_file = true;
        logging.log_file_path = expand_environment_variables(j["file"].get<std::string>());
    }
}

} // namespace

SandboxConfig parse_sandbox_config_from_string(const std::string& json_string) {
    SandboxConfig config;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Configuration root must be a JSON object");
        }

        if (j.contains("limits")) {
            parse_limits(j["limits"], config.limits);
        }
        if (j.contains("languages")) {
            parse_languages(j["languages"], config.languages);
        }
        if (j.contains("cache")) {
            parse_cache(j["cache"], config.cache);
        }
        if (!j.contains("cache") || !j["cache"].contains("preload")) {
            // Default preload list follows languages that were disabled
            auto& preload = config.cache.preload;
            preload.erase(std::remove_if(preload.begin(), preload.end(),
                                         [&config](const std::string& id) { return !config.is_supported(id); }),
                          preload.end());
        }
        if (j.contains("metrics")) {
            parse_metrics(j["metrics"], config.metrics);
        }
        if (j.contains("security")) {
            parse_security(j["security"], config.security);
        }
        if (j.contains("python")) {
            config.python.interpreter = expand_environment_variables(
                j["python"].value("interpreter", config.python.interpreter)
            );
        }
        if (j.contains("logging")) {
            parse_logging(j["logging"], config.logging);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError("JSON parse error: " + std::string(e.what()));
    } catch (const json::type_error& e) {
        throw ConfigParseError("JSON type error: " + std::string(e.what()));
    }

    validate_sandbox_config(config);
    return config;
}

SandboxConfig parse_sandbox_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    SandboxConfig config = parse_sandbox_config_from_string(buffer.str());

    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace liverun
