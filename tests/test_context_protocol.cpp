/**
 * @file test_context_protocol.cpp
 * @brief Unit tests for context protocol messages and request/result JSON
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/context_protocol.hpp"
#include "../src/execution_types.hpp"

using namespace liverun;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

// ============================================================================
// Command Tests
// ============================================================================

TEST_CASE("ContextCommand: Execute command JSON", "[protocol]") {
    auto command = ContextCommand::execute("exec_1", "print(1)", 5000);
    json j = to_json(command);

    REQUIRE(j["type"] == "execute");
    REQUIRE(j["id"] == "exec_1");
    REQUIRE(j["code"] == "print(1)");
    REQUIRE(j["timeoutMs"] == 5000);

    ContextCommand decoded = command_from_json(j);
    REQUIRE(decoded.type == CommandType::EXECUTE);
    REQUIRE(decoded.code == "print(1)");
    REQUIRE(decoded.timeout_ms == 5000);
}

TEST_CASE("ContextCommand: Dependency and terminate commands", "[protocol]") {
    json deps = to_json(ContextCommand::install_dependencies("d1", {"numpy", "scipy"}));
    REQUIRE(deps["type"] == "installDependencies");
    REQUIRE(deps["deps"].size() == 2);

    json term = to_json(ContextCommand::terminate("t1"));
    REQUIRE(term["type"] == "terminate");
    REQUIRE_FALSE(term.contains("code"));
    REQUIRE(command_from_json(term).type == CommandType::TERMINATE);
}

TEST_CASE("ContextCommand: Malformed commands are rejected", "[protocol]") {
    SECTION("Unknown type") {
        json j = {{"type", "reboot"}, {"id", "x"}};
        REQUIRE_THROWS_WITH(command_from_json(j), ContainsSubstring("unknown command type 'reboot'"));
    }

    SECTION("Missing type") {
        json j = {{"id", "x"}};
        REQUIRE_THROWS_WITH(command_from_json(j), ContainsSubstring("missing string field 'type'"));
    }

    SECTION("Execute without code") {
        json j = {{"type", "execute"}, {"id", "x"}};
        REQUIRE_THROWS_AS(command_from_json(j), ProtocolError);
    }

    SECTION("Not an object") {
        REQUIRE_THROWS_AS(command_from_json(json::array()), ProtocolError);
    }
}

// ============================================================================
// Event Tests
// ============================================================================

TEST_CASE("ContextEvent: Result event from engine output", "[protocol]") {
    EngineOutput output;
    output.success = true;
    output.stdout_text = "hello\n";
    output.stderr_text = "warning: deprecated";
    output.duration_ms = 12.5;
    output.memory_bytes = 2048;
    output.artifacts.emplace_back("image", "image/png", "data:image/png;base64,AAAA");
    output.metadata["hasPlots"] = true;

    ContextEvent event = ContextEvent::result("exec_7", output);
    REQUIRE(event.is_terminal());
    REQUIRE(event.metadata["stderr"] == "warning: deprecated");

    json j = to_json(event);
    REQUIRE(j["type"] == "result");
    REQUIRE(j["success"] == true);
    REQUIRE(j["output"] == "hello\n");
    REQUIRE_FALSE(j.contains("error"));
    REQUIRE(j["artifacts"][0]["mimeType"] == "image/png");
    REQUIRE(j["memoryBytes"] == 2048);

    ContextEvent decoded = event_from_json(j);
    REQUIRE(decoded.success);
    REQUIRE(decoded.artifacts.size() == 1);
    REQUIRE(decoded.artifacts[0].kind == "image");
    REQUIRE(decoded.duration_ms == 12.5);
    REQUIRE(decoded.metadata["hasPlots"] == true);
}

TEST_CASE("ContextEvent: Failed result carries the error", "[protocol]") {
    EngineOutput output;
    output.success = false;
    output.error = "NameError: name 'x' is not defined";

    json j = to_json(ContextEvent::result("e", output));
    REQUIRE(j["success"] == false);
    REQUIRE(j["error"] == "NameError: name 'x' is not defined");
}

TEST_CASE("ContextEvent: Error, progress and dependency events", "[protocol]") {
    ContextEvent terminated = ContextEvent::failure("e1", "Context terminated", true);
    json j = to_json(terminated);
    REQUIRE(j["type"] == "error");
    REQUIRE(j["message"] == "Context terminated");
    REQUIRE(j["terminated"] == true);
    REQUIRE(event_from_json(j).context_terminated);

    json plain = to_json(ContextEvent::failure("e2", "boom"));
    REQUIRE_FALSE(plain.contains("terminated"));

    ContextEvent progress = ContextEvent::progress("e3", "Loading numpy");
    REQUIRE_FALSE(progress.is_terminal());
    REQUIRE(to_json(progress)["text"] == "Loading numpy");

    json installed = to_json(ContextEvent::dependencies_installed("e4", {"numpy"}));
    REQUIRE(installed["type"] == "dependenciesInstalled");
    REQUIRE(event_from_json(installed).installed == std::vector<std::string>{"numpy"});
}

// ============================================================================
// Line Framing Tests
// ============================================================================

TEST_CASE("Protocol: One message per line", "[protocol]") {
    json message = to_json(ContextCommand::execute("x", "print('a')\nprint('b')", 100));
    std::string line = encode_line(message);

    REQUIRE(line.back() == '\n');
    REQUIRE(line.find('\n') == line.size() - 1);

    json decoded = decode_line(line.substr(0, line.size() - 1));
    REQUIRE(decoded["code"] == "print('a')\nprint('b')");
}

TEST_CASE("Protocol: Invalid lines are rejected", "[protocol]") {
    REQUIRE_THROWS_WITH(decode_line("not json"), ContainsSubstring("invalid message line: not json"));
    REQUIRE_THROWS_AS(decode_line("[1, 2]"), ProtocolError);
}

// ============================================================================
// Request / Result JSON Tests
// ============================================================================

TEST_CASE("request_from_json: Parses a full request", "[types]") {
    json j = {
        {"code", "print(1)"},
        {"language", "python"},
        {"sessionId", "s-42"},
        {"options", {{"timeoutMs", 2500}, {"dependencies", {"numpy", "numpy", "scipy"}}}}
    };

    ExecutionRequest request = request_from_json(j);
    REQUIRE(request.code == "print(1)");
    REQUIRE(request.language == "python");
    REQUIRE(request.session_id == "s-42");
    REQUIRE(request.options.timeout_ms == 2500);
    REQUIRE(request.options.dependencies.size() == 2);
}

TEST_CASE("request_from_json: Rejects malformed requests", "[types]") {
    SECTION("Missing code") {
        REQUIRE_THROWS_WITH(request_from_json(json{{"language", "python"}}),
                            StartsWith("Validation error: missing required string field: code"));
    }

    SECTION("Missing language") {
        REQUIRE_THROWS_AS(request_from_json(json{{"code", "1"}}), ValidationError);
    }

    SECTION("Negative timeout") {
        json j = {{"code", "1"}, {"language", "json"}, {"options", {{"timeoutMs", -5}}}};
        REQUIRE_THROWS_WITH(request_from_json(j), ContainsSubstring("must not be negative"));
    }

    SECTION("Mistyped field") {
        json j = {{"code", "1"}, {"language", "json"}, {"sessionId", 7}};
        REQUIRE_THROWS_AS(request_from_json(j), ValidationError);
    }
}

TEST_CASE("ExecutionResult: JSON shape", "[types]") {
    SECTION("Successful result omits error fields") {
        ExecutionResult result;
        result.execution_id = "exec_1";
        result.success = true;
        result.output = "42\n";
        result.execution_time_ms = 3.0;

        json j = to_json(result);
        REQUIRE(j["executionId"] == "exec_1");
        REQUIRE(j["output"] == "42\n");
        REQUIRE_FALSE(j.contains("errorRaw"));
        REQUIRE_FALSE(j.contains("errorKind"));
        REQUIRE_FALSE(j.contains("processedError"));
        REQUIRE(j["metadata"].is_object());
    }

    SECTION("Failed result carries kind and processed error") {
        ExecutionResult result;
        result.success = false;
        result.error_raw = "TimeoutError: Execution timed out after 100ms";
        result.error_kind = ErrorKind::TIMEOUT;

        ProcessedError processed;
        processed.error_type = "TimeoutError";
        processed.category = "timeout";
        processed.severity = Severity::MEDIUM;
        processed.can_retry = true;
        processed.retry_delay_ms = 5000;
        processed.suggestions.emplace_back(ErrorSuggestion::Type::DOCUMENTATION, "Docs", "Read",
                                           6, std::nullopt, std::string("https://docs.python.org/3/"));
        result.processed_error = processed;

        json j = to_json(result);
        REQUIRE(j["errorKind"] == "TimeoutError");
        REQUIRE(j["processedError"]["severity"] == "medium");
        REQUIRE(j["processedError"]["retryDelayMs"] == 5000);
        REQUIRE(j["processedError"]["suggestions"][0]["type"] == "documentation");
        REQUIRE(j["processedError"]["suggestions"][0]["link"] == "https://docs.python.org/3/");
        REQUIRE_FALSE(j["processedError"]["suggestions"][0].contains("code"));
    }
}

TEST_CASE("ErrorKind: Taxonomy names", "[types]") {
    REQUIRE(error_kind_to_string(ErrorKind::VALIDATION) == "ValidationError");
    REQUIRE(error_kind_to_string(ErrorKind::SECURITY_VIOLATION) == "SecurityViolation");
    REQUIRE(error_kind_to_string(ErrorKind::ENGINE_LOAD) == "EngineLoadError");
    REQUIRE(error_kind_to_string(ErrorKind::RUNTIME) == "RuntimeError");
}
