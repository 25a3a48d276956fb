/**
 * @file regex_engine.hpp
 * @brief Regular expression tester
 *
 * Input format: pattern|||test string|||flags (flags optional).
 * Supported flags: g (all matches), i (case-insensitive). Patterns use
 * ECMAScript syntax.
 */

#ifndef LIVERUN_ENGINES_REGEX_ENGINE_HPP
#define LIVERUN_ENGINES_REGEX_ENGINE_HPP

#include "light_engine.hpp"
#include <regex>

namespace liverun {

/**
 * @brief One match of the pattern
 */
struct RegexMatch {
    std::string text;
    size_t position;
    std::vector<std::string> groups;
};

class RegexEngine : public LightEngine {
public:
    EngineInfo get_info() const override {
        return EngineInfo("Regex Engine", "1.0.0", "regex");
    }

    std::vector<std::string> validate_syntax(const std::string& code) override;

    /**
     * @brief Split input on the "|||" separator
     */
    static std::vector<std::string> split_input(const std::string& input);

    /**
     * @brief "Simple", "Moderate" or "Complex"
     */
    static std::string classify_complexity(const std::string& pattern);

protected:
    EngineOutput render(const std::string& code, const ExecutionOptions& options) override;

private:
    static std::regex compile(const std::string& pattern, const std::string& flags);
    static std::vector<RegexMatch> find_matches(const std::regex& re, const std::string& text, bool global);
    static std::string highlight(const std::string& text, const std::vector<RegexMatch>& matches);
};

} // namespace liverun

#endif // LIVERUN_ENGINES_REGEX_ENGINE_HPP
