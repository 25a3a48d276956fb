/**
 * @file yaml_engine.hpp
 * @brief YAML validation, JSON conversion and structure analysis
 *
 * Documents are parsed with yaml-cpp. Plain scalars resolve to null, boolean,
 * integer or float the way the YAML 1.2 core schema reads them; quoted and
 * !!str scalars stay strings. A stream with several documents converts to an
 * array of documents.
 */

#ifndef LIVERUN_ENGINES_YAML_ENGINE_HPP
#define LIVERUN_ENGINES_YAML_ENGINE_HPP

#include "light_engine.hpp"

namespace liverun {

class YamlEngine : public LightEngine {
public:
    /**
     * @brief Cap on converted nodes (aliases are expanded during conversion)
     */
    static constexpr size_t MAX_NODES = 100000;

    EngineInfo get_info() const override {
        return EngineInfo("YAML Engine", "1.0.0", "yaml");
    }

    std::vector<std::string> validate_syntax(const std::string& code) override;

    /**
     * @brief Convert YAML text to JSON
     *
     * @param documents Set to the number of documents in the stream
     * @throws std::runtime_error If the text does not parse (the message
     *         starts with "YAML Syntax Error") or expands past MAX_NODES
     */
    static json to_json(const std::string& text, size_t& documents);

    /**
     * @brief Keys of every mapping in the value, nested ones included
     */
    static size_t count_keys(const json& value);

protected:
    EngineOutput render(const std::string& code, const ExecutionOptions& options) override;
};

} // namespace liverun

#endif // LIVERUN_ENGINES_YAML_ENGINE_HPP
