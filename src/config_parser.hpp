#ifndef LIVERUN_CONFIG_PARSER_HPP
#define LIVERUN_CONFIG_PARSER_HPP

#include "sandbox_config.hpp"
#include <string>
#include <stdexcept>

namespace liverun {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses a sandbox configuration from a JSON file
 *
 * Missing sections keep their defaults. Relative log file paths are resolved
 * against the directory containing the config file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed and validated configuration
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 * @throws ConfigurationError if configuration is invalid
 */
SandboxConfig parse_sandbox_config_from_file(const std::string& file_path);

/**
 * @brief Parses a sandbox configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @return Parsed and validated configuration
 * @throws ConfigParseError if JSON is invalid
 * @throws ConfigurationError if configuration is invalid
 */
SandboxConfig parse_sandbox_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Absolute paths unchanged, relative ones joined to the config directory
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace liverun

#endif // LIVERUN_CONFIG_PARSER_HPP
