/**
 * @file light_engine.hpp
 * @brief Base class for stateless engines that need no runtime bootstrap
 *
 * Light engines (JSON, Markdown, regex, HTML/CSS) do all their work in C++ on
 * the context thread. initialize() only records the policy; each execute() is
 * independent of every other.
 */

#ifndef LIVERUN_ENGINES_LIGHT_ENGINE_HPP
#define LIVERUN_ENGINES_LIGHT_ENGINE_HPP

#include "../engine_interface.hpp"
#include <string>
#include <memory>

namespace liverun {

class LightEngine : public ILanguageEngine {
public:
    LightEngine() : initialized_(false) {}

    void initialize(const SecurityPolicy& policy) override {
        policy_ = std::make_unique<SecurityPolicy>(policy);
        initialized_ = true;
    }

    /**
     * @brief Times render() and fills duration_ms
     */
    EngineOutput execute(const std::string& code, const ExecutionOptions& options) final;

    void dispose() noexcept override {
        initialized_ = false;
    }

    bool is_initialized() const override {
        return initialized_;
    }

    /**
     * @brief Escape text for inclusion in HTML
     */
    static std::string escape_html(const std::string& text);

    /**
     * @brief Trim ASCII whitespace from both ends
     */
    static std::string trim(const std::string& text);

protected:
    /**
     * @brief Language-specific work
     */
    virtual EngineOutput render(const std::string& code, const ExecutionOptions& options) = 0;

    const SecurityPolicy* policy() const { return policy_.get(); }

private:
    bool initialized_;
    std::unique_ptr<SecurityPolicy> policy_;
};

} // namespace liverun

#endif // LIVERUN_ENGINES_LIGHT_ENGINE_HPP
