/**
 * @file engine_factory.hpp
 * @brief Factory for creating language engines by language id
 *
 * The EngineFactory is the single place that knows which ILanguageEngine
 * serves which language. The loader asks it for a fresh engine whenever a
 * runtime has to be (re)bootstrapped.
 *
 * Design Pattern: Factory Method with Registry
 * - Each language registers a factory function
 * - Built-in engines are configured from SandboxConfig (memory limits, default packages)
 * - Tests register mock engines under their own language ids
 */

#ifndef LIVERUN_ENGINE_FACTORY_HPP
#define LIVERUN_ENGINE_FACTORY_HPP

#include "engine_interface.hpp"
#include "sandbox_config.hpp"
#include <map>
#include <string>
#include <memory>
#include <functional>

namespace liverun {

/**
 * @brief Built-in language identifiers
 */
namespace Language {
    constexpr const char* PYTHON = "python";
    constexpr const char* SQL = "sql";
    constexpr const char* JSON = "json";
    constexpr const char* MARKDOWN = "markdown";
    constexpr const char* REGEX = "regex";
    constexpr const char* HTML = "html";
    constexpr const char* CSS = "css";
    constexpr const char* YAML = "yaml";
}

/**
 * @brief Factory for creating engine instances
 *
 * Usage Example:
 *   @code
 *   EngineFactory factory(config);
 *   auto engine = factory.create_engine("sql");
 *   engine->initialize(config.security.build_policy());
 *   @endcode
 */
class EngineFactory {
public:
    /**
     * @brief Factory function type for creating engines
     */
    using FactoryFunction = std::function<std::unique_ptr<ILanguageEngine>()>;

    /**
     * @brief Constructor
     *
     * @param config Sandbox configuration used to parameterize built-in engines
     * @param register_builtins Register the built-in engines for every configured language
     */
    explicit EngineFactory(const SandboxConfig& config, bool register_builtins = true);

    /**
     * @brief Create an engine instance for a language
     *
     * @param language Language id (e.g., "python", "sql")
     * @return Unique pointer to an uninitialized engine
     *
     * @throws ConfigurationError If no engine serves the language
     */
    std::unique_ptr<ILanguageEngine> create_engine(const std::string& language) const;

    /**
     * @brief Register a custom engine
     *
     * @param language Language id (must be unique)
     * @param factory_fn Function that creates engine instances
     *
     * @throws ConfigurationError If the language is already registered
     */
    void register_engine(const std::string& language, FactoryFunction factory_fn);

    bool is_registered(const std::string& language) const;

    /**
     * @brief Registered language ids, sorted
     */
    std::vector<std::string> list_languages() const;

private:
    SandboxConfig config_;
    std::map<std::string, FactoryFunction> registry_;

    void register_builtins();
};

} // namespace liverun

#endif // LIVERUN_ENGINE_FACTORY_HPP
