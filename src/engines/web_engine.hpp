/**
 * @file web_engine.hpp
 * @brief HTML and CSS preview composition
 *
 * Nothing is rendered here. The engine wraps user markup or styles in a
 * complete document and returns it as a sandboxed iframe (srcdoc) artifact for
 * the client to display. The preview document carries a Content-Security-Policy
 * that forbids every network fetch, and the iframe is sandboxed without
 * allow-same-origin.
 */

#ifndef LIVERUN_ENGINES_WEB_ENGINE_HPP
#define LIVERUN_ENGINES_WEB_ENGINE_HPP

#include "light_engine.hpp"

namespace liverun {

class WebEngine : public LightEngine {
public:
    /**
     * @param language "html" or "css"
     * @throws ConfigurationError for any other language
     */
    explicit WebEngine(const std::string& language);

    EngineInfo get_info() const override;

    std::vector<std::string> validate_syntax(const std::string& code) override;

    /**
     * @brief Elements opened but never closed, in document order
     *
     * Void elements (br, img, input, ...) and self-closing tags are ignored.
     */
    static std::vector<std::string> find_unclosed_tags(const std::string& html);

    /**
     * @brief Empty if braces, comments and strings are balanced
     */
    static std::string check_css_balance(const std::string& css);

    /**
     * @brief Wrap a document in a sandboxed iframe element
     */
    static std::string to_iframe(const std::string& document);

protected:
    EngineOutput render(const std::string& code, const ExecutionOptions& options) override;

private:
    std::string language_;

    EngineOutput render_html(const std::string& code) const;
    EngineOutput render_css(const std::string& code) const;
};

} // namespace liverun

#endif // LIVERUN_ENGINES_WEB_ENGINE_HPP
