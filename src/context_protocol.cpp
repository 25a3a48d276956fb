/**
 * @file context_protocol.cpp
 * @brief Encoding and decoding of context protocol messages
 */

#include "context_protocol.hpp"

namespace liverun {

using json = nlohmann::json;

std::string command_type_to_string(CommandType type) {
    switch (type) {
        case CommandType::EXECUTE: return "execute";
        case CommandType::TERMINATE: return "terminate";
        case CommandType::INSTALL_DEPENDENCIES: return "installDependencies";
        default: return "unknown";
    }
}

std::string event_type_to_string(EventType type) {
    switch (type) {
        case EventType::RESULT: return "result";
        case EventType::ERROR: return "error";
        case EventType::PROGRESS: return "progress";
        case EventType::DEPENDENCIES_INSTALLED: return "dependenciesInstalled";
        default: return "unknown";
    }
}

// ============================================================================
// Factories
// ============================================================================

ContextCommand ContextCommand::execute(const std::string& id, const std::string& code,
                                       uint32_t timeout_ms) {
    ContextCommand command;
    command.type = CommandType::EXECUTE;
    command.id = id;
    command.code = code;
    command.timeout_ms = timeout_ms;
    return command;
}

ContextCommand ContextCommand::terminate(const std::string& id) {
    ContextCommand command;
    command.type = CommandType::TERMINATE;
    command.id = id;
    return command;
}

ContextCommand ContextCommand::install_dependencies(const std::string& id,
                                                    const std::vector<std::string>& deps) {
    ContextCommand command;
    command.type = CommandType::INSTALL_DEPENDENCIES;
    command.id = id;
    command.dependencies = deps;
    return command;
}

ContextEvent ContextEvent::result(const std::string& id, const EngineOutput& output) {
    ContextEvent event;
    event.type = EventType::RESULT;
    event.id = id;
    event.success = output.success;
    event.output = output.stdout_text;
    event.error = output.error;
    event.artifacts = output.artifacts;
    event.duration_ms = output.duration_ms;
    event.memory_bytes = output.memory_bytes;
    event.metadata = output.metadata.is_object() ? output.metadata : json::object();
    if (!output.stderr_text.empty()) {
        event.metadata["stderr"] = output.stderr_text;
    }
    return event;
}

ContextEvent ContextEvent::failure(const std::string& id, const std::string& message,
                                   bool context_terminated) {
    ContextEvent event;
    event.type = EventType::ERROR;
    event.id = id;
    event.error = message;
    event.context_terminated = context_terminated;
    return event;
}

ContextEvent ContextEvent::progress(const std::string& id, const std::string& text) {
    ContextEvent event;
    event.type = EventType::PROGRESS;
    event.id = id;
    event.text = text;
    return event;
}

ContextEvent ContextEvent::dependencies_installed(const std::string& id,
                                                  const std::vector<std::string>& installed) {
    ContextEvent event;
    event.type = EventType::DEPENDENCIES_INSTALLED;
    event.id = id;
    event.success = true;
    event.installed = installed;
    return event;
}

// ============================================================================
// JSON encoding
// ============================================================================

json to_json(const ContextCommand& command) {
    json j;
    j["type"] = command_type_to_string(command.type);
    j["id"] = command.id;
    switch (command.type) {
        case CommandType::EXECUTE:
            j["code"] = command.code;
            j["timeoutMs"] = command.timeout_ms;
            break;
        case CommandType::INSTALL_DEPENDENCIES:
            j["deps"] = command.dependencies;
            break;
        case CommandType::TERMINATE:
            break;
    }
    return j;
}

json to_json(const ContextEvent& event) {
    json j;
    j["type"] = event_type_to_string(event.type);
    j["id"] = event.id;
    switch (event.type) {
        case EventType::RESULT: {
            j["success"] = event.success;
            j["output"] = event.output;
            if (!event.success) {
                j["error"] = event.error;
            }
            json artifacts = json::array();
            for (const auto& artifact : event.artifacts) {
                artifacts.push_back({
                    {"kind", artifact.kind},
                    {"mimeType", artifact.mime_type},
                    {"data", artifact.data}
                });
            }
            j["artifacts"] = artifacts;
            j["durationMs"] = event.duration_ms;
            j["memoryBytes"] = event.memory_bytes;
            j["metadata"] = event.metadata;
            break;
        }
        case EventType::ERROR:
            j["message"] = event.error;
            if (event.context_terminated) {
                j["terminated"] = true;
            }
            break;
        case EventType::PROGRESS:
            j["text"] = event.text;
            break;
        case EventType::DEPENDENCIES_INSTALLED:
            j["installed"] = event.installed;
            break;
    }
    return j;
}

namespace {

std::string require_string(const json& j, const char* field) {
    if (!j.contains(field) || !j[field].is_string()) {
        throw ProtocolError(std::string("missing string field '") + field + "'");
    }
    return j[field].get<std::string>();
}

} // namespace

ContextCommand command_from_json(const json& j) {
    if (!j.is_object()) {
        throw ProtocolError("command must be a JSON object");
    }

    std::string type = require_string(j, "type");
    std::string id = require_string(j, "id");

    try {
        if (type == "execute") {
            uint32_t timeout = j.value("timeoutMs", 0u);
            return ContextCommand::execute(id, require_string(j, "code"), timeout);
        }
        if (type == "terminate") {
            return ContextCommand::terminate(id);
        }
        if (type == "installDependencies") {
            std::vector<std::string> deps;
            if (j.contains("deps")) {
                deps = j["deps"].get<std::vector<std::string>>();
            }
            return ContextCommand::install_dependencies(id, deps);
        }
    } catch (const json::exception& e) {
        throw ProtocolError("malformed " + type + " command: " + e.what());
    }

    throw ProtocolError("unknown command type '" + type + "'");
}

ContextEvent event_from_json(const json& j) {
    if (!j.is_object()) {
        throw ProtocolError("event must be a JSON object");
    }

    std::string type = require_string(j, "type");
    std::string id = require_string(j, "id");

    try {
        if (type == "result") {
            ContextEvent event;
            event.type = EventType::RESULT;
            event.id = id;
            event.success = j.value("success", false);
            event.output = j.value("output", std::string());
            event.error = j.value("error", std::string());
            event.duration_ms = j.value("durationMs", 0.0);
            event.memory_bytes = j.value("memoryBytes", static_cast<uint64_t>(0));
            if (j.contains("metadata") && j["metadata"].is_object()) {
                event.metadata = j["metadata"];
            }
            if (j.contains("artifacts")) {
                for (const auto& a : j["artifacts"]) {
                    event.artifacts.emplace_back(
                        a.value("kind", std::string("html")),
                        a.value("mimeType", std::string("text/html")),
                        a.value("data", std::string())
                    );
                }
            }
            return event;
        }
        if (type == "error") {
            return ContextEvent::failure(id, j.value("message", std::string("Unknown error")),
                                         j.value("terminated", false));
        }
        if (type == "progress") {
            return ContextEvent::progress(id, j.value("text", std::string()));
        }
        if (type == "dependenciesInstalled") {
            std::vector<std::string> installed;
            if (j.contains("installed")) {
                installed = j["installed"].get<std::vector<std::string>>();
            }
            return ContextEvent::dependencies_installed(id, installed);
        }
    } catch (const json::exception& e) {
        throw ProtocolError("malformed " + type + " event: " + e.what());
    }

    throw ProtocolError("unknown event type '" + type + "'");
}

std::string encode_line(const json& message) {
    // dump() escapes embedded newlines, so one message is always one line
    return message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

json decode_line(const std::string& line) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ProtocolError("invalid message line: " + line.substr(0, 120));
    }
    return j;
}

} // namespace liverun
