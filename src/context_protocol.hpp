/**
 * @file context_protocol.hpp
 * @brief Message protocol between the dispatcher and an execution context
 *
 * Commands flow in (execute, terminate, installDependencies), events flow out
 * (result, error, progress, dependenciesInstalled). Every event carries the id
 * of the command it answers.
 *
 * The same messages travel as typed structs inside the process and as one JSON
 * document per line across the pipe to an out-of-process runtime.
 */

#ifndef LIVERUN_CONTEXT_PROTOCOL_HPP
#define LIVERUN_CONTEXT_PROTOCOL_HPP

#include "engine_interface.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace liverun {

/**
 * @brief Execution context lifecycle states
 *
 * UNINITIALIZED -> LOADING_RUNTIME -> READY -> EXECUTING -> (READY | TERMINATED)
 * A failed bootstrap ends in FAILED. TERMINATED and FAILED are final.
 */
enum class ContextState {
    UNINITIALIZED,     ///< Created, runtime not loaded
    LOADING_RUNTIME,   ///< Bootstrapping runtime and applying the security policy
    READY,             ///< Idle, accepting commands
    EXECUTING,         ///< Running one command
    TERMINATED,        ///< Terminated externally; never reused
    FAILED             ///< Runtime bootstrap failed
};

/**
 * @brief Convert context state to string
 */
inline std::string state_to_string(ContextState state) {
    switch (state) {
        case ContextState::UNINITIALIZED: return "UNINITIALIZED";
        case ContextState::LOADING_RUNTIME: return "LOADING_RUNTIME";
        case ContextState::READY: return "READY";
        case ContextState::EXECUTING: return "EXECUTING";
        case ContextState::TERMINATED: return "TERMINATED";
        case ContextState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Inbound command types
 */
enum class CommandType {
    EXECUTE,
    TERMINATE,
    INSTALL_DEPENDENCIES
};

/**
 * @brief Outbound event types
 */
enum class EventType {
    RESULT,
    ERROR,
    PROGRESS,
    DEPENDENCIES_INSTALLED
};

std::string command_type_to_string(CommandType type);
std::string event_type_to_string(EventType type);

/**
 * @brief Command sent to a context
 */
struct ContextCommand {
    CommandType type;
    std::string id;
    std::string code;                       ///< execute only
    uint32_t timeout_ms;                    ///< execute only
    std::vector<std::string> dependencies;  ///< installDependencies only

    ContextCommand() : type(CommandType::EXECUTE), timeout_ms(0) {}

    static ContextCommand execute(const std::string& id, const std::string& code, uint32_t timeout_ms);
    static ContextCommand terminate(const std::string& id);
    static ContextCommand install_dependencies(const std::string& id,
                                               const std::vector<std::string>& deps);
};

/**
 * @brief Event emitted by a context
 */
struct ContextEvent {
    EventType type;
    std::string id;
    bool success;                       ///< result only
    std::string output;                 ///< result: captured stdout
    std::string error;                  ///< result (failed run) or error: message
    std::vector<Artifact> artifacts;    ///< result only
    double duration_ms;                 ///< result only
    uint64_t memory_bytes;              ///< result only, 0 if unknown
    nlohmann::json metadata;            ///< result only
    std::string text;                   ///< progress only
    std::vector<std::string> installed; ///< dependenciesInstalled only
    bool context_terminated;            ///< error raised because the context was terminated

    ContextEvent()
        : type(EventType::RESULT), success(false), duration_ms(0.0), memory_bytes(0),
          metadata(nlohmann::json::object()), context_terminated(false) {}

    static ContextEvent result(const std::string& id, const EngineOutput& output);
    static ContextEvent failure(const std::string& id, const std::string& message,
                                bool context_terminated = false);
    static ContextEvent progress(const std::string& id, const std::string& text);
    static ContextEvent dependencies_installed(const std::string& id,
                                               const std::vector<std::string>& installed);

    /**
     * @brief Whether this event completes the command with the same id
     */
    bool is_terminal() const { return type != EventType::PROGRESS; }
};

nlohmann::json to_json(const ContextCommand& command);
nlohmann::json to_json(const ContextEvent& event);

/**
 * @brief Decode a command document
 * @throws ProtocolError if the type is unknown or a field is malformed
 */
ContextCommand command_from_json(const nlohmann::json& j);

/**
 * @brief Decode an event document
 * @throws ProtocolError if the type is unknown or a field is malformed
 */
ContextEvent event_from_json(const nlohmann::json& j);

/**
 * @brief Encode a message as one newline-terminated JSON line
 */
std::string encode_line(const nlohmann::json& message);

/**
 * @brief Parse one line from the wire
 * @throws ProtocolError if the line is not a JSON object
 */
nlohmann::json decode_line(const std::string& line);

} // namespace liverun

#endif // LIVERUN_CONTEXT_PROTOCOL_HPP
