/**
 * @file engine_factory.cpp
 * @brief Implementation of EngineFactory
 */

#include "engine_factory.hpp"
#include "engines/json_engine.hpp"
#include "engines/markdown_engine.hpp"
#include "engines/python_engine.hpp"
#include "engines/regex_engine.hpp"
#include "engines/sql_engine.hpp"
#include "engines/web_engine.hpp"
#include "engines/yaml_engine.hpp"

namespace liverun {

EngineFactory::EngineFactory(const SandboxConfig& config, bool register_builtin_engines)
    : config_(config) {
    if (register_builtin_engines) {
        register_builtins();
    }
}

void EngineFactory::register_builtins() {
    // Only languages present in the configuration are served
    auto configured = [this](const char* language) {
        return config_.is_supported(language);
    };

    if (configured(Language::PYTHON)) {
        const LanguageConfig& lang = config_.language(Language::PYTHON);
        PythonEngineOptions options;
        options.interpreter = config_.python.interpreter;
        options.memory_limit_bytes = lang.memory_limit_bytes;
        options.default_packages = lang.default_packages;
        registry_[Language::PYTHON] = [options]() {
            return std::make_unique<PythonEngine>(options);
        };
    }
    if (configured(Language::SQL)) {
        uint64_t memory_limit = config_.language(Language::SQL).memory_limit_bytes;
        registry_[Language::SQL] = [memory_limit]() {
            return std::make_unique<SqlEngine>(memory_limit);
        };
    }
    if (configured(Language::JSON)) {
        registry_[Language::JSON] = []() { return std::make_unique<JsonEngine>(); };
    }
    if (configured(Language::MARKDOWN)) {
        registry_[Language::MARKDOWN] = []() { return std::make_unique<MarkdownEngine>(); };
    }
    if (configured(Language::REGEX)) {
        registry_[Language::REGEX] = []() { return std::make_unique<RegexEngine>(); };
    }
    if (configured(Language::HTML)) {
        registry_[Language::HTML] = []() { return std::make_unique<WebEngine>(Language::HTML); };
    }
    if (configured(Language::CSS)) {
        registry_[Language::CSS] = []() { return std::make_unique<WebEngine>(Language::CSS); };
    }
    if (configured(Language::YAML)) {
        registry_[Language::YAML] = []() { return std::make_unique<YamlEngine>(); };
    }
}

std::unique_ptr<ILanguageEngine> EngineFactory::create_engine(const std::string& language) const {
    auto it = registry_.find(language);
    if (it == registry_.end()) {
        throw ConfigurationError("Unknown language: " + language +
                                ". Available languages: " +
                                [this]() {
                                    std::string languages;
                                    for (const auto& pair : registry_) {
                                        if (!languages.empty()) languages += ", ";
                                        languages += pair.first;
                                    }
                                    return languages;
                                }());
    }

    return it->second();
}

void EngineFactory::register_engine(const std::string& language, FactoryFunction factory_fn) {
    if (registry_.find(language) != registry_.end()) {
        throw ConfigurationError("Engine already registered for language: " + language);
    }
    registry_[language] = std::move(factory_fn);
}

bool EngineFactory::is_registered(const std::string& language) const {
    return registry_.find(language) != registry_.end();
}

std::vector<std::string> EngineFactory::list_languages() const {
    std::vector<std::string> languages;
    languages.reserve(registry_.size());
    for (const auto& pair : registry_) {
        languages.push_back(pair.first);
    }
    return languages;
}

} // namespace liverun
