/**
 * @file markdown_engine.hpp
 * @brief Markdown rendering with document statistics
 */

#ifndef LIVERUN_ENGINES_MARKDOWN_ENGINE_HPP
#define LIVERUN_ENGINES_MARKDOWN_ENGINE_HPP

#include "light_engine.hpp"

namespace liverun {

/**
 * @brief Document statistics reported alongside the rendered HTML
 */
struct MarkdownStats {
    size_t lines = 0;
    size_t words = 0;
    size_t characters = 0;
    size_t headings = 0;     ///< ATX headings (# to ######)
    size_t links = 0;        ///< [text](url), images excluded
    size_t images = 0;       ///< ![alt](src)
    size_t code_blocks = 0;  ///< Closed ``` fences
};

/**
 * @brief Renders a practical Markdown subset to HTML
 *
 * Supported: ATX headings, fenced code, blockquotes, horizontal rules,
 * unordered and ordered lists, paragraphs, and inline images, links, bold,
 * italic and code spans. Raw HTML in the source is escaped, never passed
 * through.
 */
class MarkdownEngine : public LightEngine {
public:
    EngineInfo get_info() const override {
        return EngineInfo("Markdown Engine", "1.0.0", "markdown");
    }

    /**
     * @brief Convert Markdown to an HTML fragment
     */
    static std::string to_html(const std::string& markdown);

    static MarkdownStats analyze(const std::string& markdown);

    /**
     * @brief Apply inline formatting to one line of already escaped text
     */
    static std::string render_inline(const std::string& escaped);

protected:
    EngineOutput render(const std::string& code, const ExecutionOptions& options) override;
};

} // namespace liverun

#endif // LIVERUN_ENGINES_MARKDOWN_ENGINE_HPP
