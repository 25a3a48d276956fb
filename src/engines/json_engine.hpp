/**
 * @file json_engine.hpp
 * @brief JSON validation, pretty-printing and structure analysis
 */

#ifndef LIVERUN_ENGINES_JSON_ENGINE_HPP
#define LIVERUN_ENGINES_JSON_ENGINE_HPP

#include "light_engine.hpp"

namespace liverun {

class JsonEngine : public LightEngine {
public:
    EngineInfo get_info() const override {
        return EngineInfo("JSON Engine", "1.0.0", "json");
    }

    std::vector<std::string> validate_syntax(const std::string& code) override;

    /**
     * @brief Nesting depth (scalars are 0, "[]" and "{}" are 0, "[1]" is 1)
     */
    static int calculate_depth(const json& value);

protected:
    EngineOutput render(const std::string& code, const ExecutionOptions& options) override;

private:
    static std::string describe_parse_error(const std::string& text, const json::parse_error& e);
};

} // namespace liverun

#endif // LIVERUN_ENGINES_JSON_ENGINE_HPP
