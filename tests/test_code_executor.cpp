/**
 * @file test_code_executor.cpp
 * @brief Unit tests for CodeExecutor using scripted engines
 *
 * Tests cover:
 * - Request validation
 * - Result normalization (output, artifacts, truncation, classification)
 * - Static security checks before dispatch
 * - Timeouts, termination and reload of discarded contexts
 * - Metrics and statistics
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/code_executor.hpp"
#include "mock_engines.hpp"
#include <chrono>
#include <future>
#include <thread>

using namespace liverun;
using namespace liverun::testing;
using Catch::Matchers::ContainsSubstring;

namespace {

const char* const kMock = "mock";

SandboxConfig executor_config() {
    SandboxConfig config;
    config.languages[kMock] = LanguageConfig(5000, 0);
    config.languages["broken"] = LanguageConfig(5000, 0);
    config.cache.preload = {};
    config.cache.sweep_interval_ms = 0;
    config.metrics.flush_interval_ms = 0;
    config.limits.termination_grace_ms = 50;
    config.logging.enable_console = false;
    return config;
}

/**
 * @brief Executor wired to mock engines for "mock", "python" and "broken"
 */
struct Fixture {
    std::shared_ptr<MockCounters> counters = std::make_shared<MockCounters>();
    SandboxConfig config;
    std::unique_ptr<CodeExecutor> executor;

    explicit Fixture(SandboxConfig config_ = executor_config()) : config(std::move(config_)) {
        auto factory = std::make_unique<EngineFactory>(config, false);
        register_mock(*factory, kMock, counters);
        register_mock(*factory, Language::PYTHON, counters);
        register_mock(*factory, "broken", counters, 0, true);
        executor = std::make_unique<CodeExecutor>(config, std::move(factory));
    }

    ExecutionResult run(const std::string& code, uint32_t timeout_ms = 0,
                        const std::string& language = kMock) {
        ExecutionRequest request(code, language, "session_1");
        request.options.timeout_ms = timeout_ms;
        return executor->execute(request);
    }

    // Wait until the given number of executions are in flight
    bool wait_for_active(size_t count) {
        for (int i = 0; i < 200; ++i) {
            if (executor->active_execution_ids().size() == count) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }
};

size_t execution_metric_count(MetricsCollector& metrics) {
    metrics.flush();
    size_t count = 0;
    for (const auto& metric : metrics.get_metrics()) {
        if (metric.metric_type == MetricType::EXECUTION) count++;
    }
    return count;
}

} // namespace

// ============================================================================
// Validation Tests
// ============================================================================

TEST_CASE("CodeExecutor: Request validation", "[executor]") {
    Fixture fx;

    SECTION("Blank code") {
        REQUIRE_THROWS_AS(fx.run("   \n"), ValidationError);
    }

    SECTION("Unsupported language lists the supported ones") {
        REQUIRE_THROWS_WITH(fx.run("x", 0, "cobol"), ContainsSubstring("Unsupported language: cobol"));
        REQUIRE_THROWS_WITH(fx.run("x", 0, "cobol"), ContainsSubstring("mock"));
    }

    SECTION("Configured language without an engine") {
        REQUIRE_THROWS_AS(fx.run("SELECT 1", 0, Language::SQL), ValidationError);
    }

    SECTION("Code too long") {
        REQUIRE_THROWS_AS(fx.run(std::string(fx.config.limits.max_code_length + 1, 'x')), ValidationError);
    }

    SECTION("Timeout above the maximum") {
        REQUIRE_THROWS_WITH(fx.run("x", fx.config.limits.max_timeout_ms + 1),
                            ContainsSubstring("Timeout must be between 1 and"));
    }

    // Rejected requests never reach an engine or the metrics
    REQUIRE(fx.counters->created == 0);
    REQUIRE(execution_metric_count(fx.executor->metrics()) == 0);
}

TEST_CASE("CodeExecutor: Supported languages", "[executor]") {
    Fixture fx;
    REQUIRE(fx.executor->supported_languages() == std::vector<std::string>{"broken", "mock", "python"});
}

TEST_CASE("CodeExecutor: Invalid configuration is rejected", "[executor]") {
    SandboxConfig config = executor_config();
    config.limits.max_timeout_ms = 0;
    REQUIRE_THROWS_AS(Fixture(config), ConfigurationError);
}

// ============================================================================
// Execution Tests
// ============================================================================

TEST_CASE("CodeExecutor: Successful execution", "[executor]") {
    Fixture fx;
    ExecutionResult result = fx.run("print:Hello, World!\n");

    REQUIRE(result.success);
    REQUIRE(result.output == std::string("Hello, World!\n"));
    REQUIRE_FALSE(result.error_raw.has_value());
    REQUIRE(result.error_kind == ErrorKind::NONE);
    REQUIRE(result.execution_time_ms >= 0.0);
    REQUIRE_FALSE(result.processed_error.has_value());
    REQUIRE_THAT(result.execution_id, Catch::Matchers::StartsWith("exec_"));
    REQUIRE(result.metadata["mock"] == true);
}

TEST_CASE("CodeExecutor: Sequential runs do not share output", "[executor]") {
    Fixture fx;
    ExecutionResult first = fx.run("print:A");
    ExecutionResult second = fx.run("print:B");

    REQUIRE(first.output == std::string("A"));
    REQUIRE(second.output == std::string("B"));
    REQUIRE(first.execution_id != second.execution_id);
}

TEST_CASE("CodeExecutor: Failed execution is classified", "[executor]") {
    Fixture fx;

    SECTION("User-code error") {
        ExecutionResult result = fx.run("fail:NameError: name 'x' is not defined");
        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(result.output.has_value());
        REQUIRE(result.error_raw == std::string("NameError: name 'x' is not defined"));
        REQUIRE(result.error_kind == ErrorKind::RUNTIME);
        REQUIRE(result.processed_error.has_value());
        REQUIRE(result.processed_error->error_type == "NameError");
        REQUIRE(result.processed_error->category == "runtime");
        REQUIRE_FALSE(result.processed_error->suggestions.empty());
    }

    SECTION("Engine fault keeps the context") {
        ExecutionResult result = fx.run("throw:broken pipe");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_raw == std::string("Execution failed: broken pipe"));
        REQUIRE(fx.run("print:again").success);
        REQUIRE(fx.executor->loader().load_count(kMock) == 1);
    }

    SECTION("Engine load failure is returned, not thrown") {
        ExecutionResult result = fx.run("print:x", 0, "broken");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_kind == ErrorKind::ENGINE_LOAD);
        REQUIRE_THAT(*result.error_raw, ContainsSubstring("failed to start"));
    }

    SECTION("Unsupported dependencies") {
        ExecutionRequest request("print:x", kMock);
        request.options.dependencies = {"numpy"};
        ExecutionResult result = fx.executor->execute(request);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_kind == ErrorKind::ENGINE_LOAD);
        REQUIRE_THAT(*result.error_raw, ContainsSubstring("Dependency installation failed"));
    }
}

TEST_CASE("CodeExecutor: Output shaping", "[executor]") {
    SandboxConfig config = executor_config();
    config.limits.max_output_size = 10;
    Fixture fx(config);

    SECTION("Long output is truncated") {
        ExecutionResult result = fx.run("long:25");
        REQUIRE(result.success);
        REQUIRE(result.output == std::string("xxxxxxxxxx\n... (output truncated)"));
        REQUIRE(result.metadata["truncated"] == true);
    }

    SECTION("Artifacts become one visual payload") {
        ExecutionResult result = fx.run("plot");
        REQUIRE(result.success);
        REQUIRE(result.artifacts.size() == 1);
        REQUIRE(result.visual_artifact ==
                std::string("<img src=\"data:image/png;base64,iVBORw0KGgo=\" alt=\"Plot 1\" />"));
    }
}

// ============================================================================
// Security Tests
// ============================================================================

TEST_CASE("CodeExecutor: Static security checks", "[executor][security]") {
    Fixture fx;

    SECTION("Deny-listed import never reaches the engine") {
        ExecutionResult result = fx.run("import os\nprint('x')", 0, Language::PYTHON);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_kind == ErrorKind::SECURITY_VIOLATION);
        REQUIRE_THAT(*result.error_raw, ContainsSubstring("'os'"));
        REQUIRE_THAT(*result.error_raw, ContainsSubstring("not allowed"));
        REQUIRE_THAT(*result.error_raw, ContainsSubstring("(line 1)"));
        REQUIRE(result.metadata["violations"] == 1);
        REQUIRE(result.processed_error->category == "security");
        REQUIRE(fx.counters->executions == 0);
    }

    SECTION("Static analysis can be turned off") {
        SandboxConfig config = executor_config();
        config.security.static_analysis = false;
        Fixture relaxed(config);
        ExecutionResult result = relaxed.run("import os", 0, Language::PYTHON);
        REQUIRE(result.success);
        REQUIRE(relaxed.counters->executions == 1);
    }

    SECTION("Validation reports findings and syntax problems") {
        CodeValidation validation = fx.executor->validate_code("import socket\na syntax error", Language::PYTHON);
        REQUIRE_FALSE(validation.valid);
        REQUIRE(validation.problems.size() == 2);
        REQUIRE_THAT(validation.problems[0], ContainsSubstring("Line 1: Module 'socket'"));
        REQUIRE(validation.problems[1] == "SyntaxError: invalid syntax");

        REQUIRE(fx.executor->validate_code("fine", kMock).valid);
        REQUIRE_THROWS_AS(fx.executor->validate_code("", kMock), ValidationError);
    }
}

// ============================================================================
// Timeout and Termination Tests
// ============================================================================

TEST_CASE("CodeExecutor: Timeouts", "[executor]") {
    Fixture fx;
    fx.run("print:warm");
    REQUIRE(fx.executor->loader().load_count(kMock) == 1);

    auto start = std::chrono::steady_clock::now();
    ExecutionResult result = fx.run("sleep:5000", 100);
    auto waited = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_kind == ErrorKind::TIMEOUT);
    REQUIRE(result.error_raw == std::string("Execution timed out after 100ms"));
    REQUIRE(waited < std::chrono::milliseconds(1000));
    REQUIRE(result.processed_error->category == "timeout");

    // The timed-out context is discarded and exactly one reload follows
    REQUIRE_FALSE(fx.executor->loader().is_loaded(kMock));
    REQUIRE(fx.run("print:after").output == std::string("after"));
    REQUIRE(fx.executor->loader().load_count(kMock) == 2);
}

TEST_CASE("CodeExecutor: Slow bootstrap does not eat the timeout", "[executor]") {
    auto counters = std::make_shared<MockCounters>();
    SandboxConfig config = executor_config();
    auto factory = std::make_unique<EngineFactory>(config, false);
    register_mock(*factory, kMock, counters, 600);
    CodeExecutor executor(config, std::move(factory));

    for (int i = 0; i < 3; ++i) {
        ExecutionRequest request("print:ok", kMock, "session_1");
        request.options.timeout_ms = 200;
        ExecutionResult result = executor.execute(request);
        REQUIRE(result.success);
        REQUIRE(result.output == std::string("ok"));
    }

    REQUIRE(executor.loader().load_count(kMock) == 1);
    REQUIRE(counters->executions == 3);
    REQUIRE(counters->interrupts == 0);
}

TEST_CASE("CodeExecutor: Engine load wait is bounded", "[executor]") {
    auto counters = std::make_shared<MockCounters>();
    SandboxConfig config = executor_config();
    config.limits.engine_load_timeout_ms = 100;
    auto factory = std::make_unique<EngineFactory>(config, false);
    register_mock(*factory, kMock, counters, 500);
    CodeExecutor executor(config, std::move(factory));

    ExecutionRequest request("print:late", kMock, "session_1");
    ExecutionResult first = executor.execute(request);
    REQUIRE_FALSE(first.success);
    REQUIRE(first.error_kind == ErrorKind::ENGINE_LOAD);
    REQUIRE_THAT(first.error_raw.value_or(""), ContainsSubstring("did not load within 100ms"));

    // The bootstrap kept going and its context serves the next request
    std::this_thread::sleep_for(std::chrono::milliseconds(700));
    REQUIRE(executor.loader().is_loaded(kMock));
    ExecutionResult second = executor.execute(request);
    REQUIRE(second.success);
    REQUIRE(second.output == std::string("late"));
    REQUIRE(executor.loader().load_count(kMock) == 1);
}

TEST_CASE("CodeExecutor: Timeout while queued keeps the context", "[executor]") {
    Fixture fx;
    auto running = std::async(std::launch::async, [&fx]() { return fx.run("sleep:600", 5000); });
    REQUIRE(fx.wait_for_active(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    ExecutionResult queued = fx.run("print:B", 100);
    REQUIRE_FALSE(queued.success);
    REQUIRE(queued.error_kind == ErrorKind::TIMEOUT);

    // The command that was running finishes on the same context
    ExecutionResult first = running.get();
    REQUIRE(first.success);
    REQUIRE(first.output == std::string("slept"));
    REQUIRE(fx.counters->interrupts == 0);
    REQUIRE(fx.executor->loader().load_count(kMock) == 1);
    REQUIRE(fx.run("print:C").output == std::string("C"));
}

TEST_CASE("CodeExecutor: Reload after eviction", "[executor]") {
    Fixture fx;
    fx.run("print:one");
    fx.executor->loader().invalidate(kMock);

    fx.run("print:two");
    fx.run("print:three");
    REQUIRE(fx.executor->loader().load_count(kMock) == 2);
}

TEST_CASE("CodeExecutor: Terminating an execution", "[executor]") {
    Fixture fx;

    SECTION("Unknown id") {
        REQUIRE_FALSE(fx.executor->terminate_execution("exec_missing"));
    }

    SECTION("Running execution ends as terminated") {
        auto running = std::async(std::launch::async, [&fx]() { return fx.run("sleep:5000", 10000); });
        REQUIRE(fx.wait_for_active(1));

        std::string id = fx.executor->active_execution_ids()[0];
        REQUIRE(fx.executor->terminate_execution(id));

        ExecutionResult result = running.get();
        REQUIRE_FALSE(result.success);
        REQUIRE(result.execution_id == id);
        REQUIRE(result.error_kind == ErrorKind::UNKNOWN);
        REQUIRE(result.error_raw == std::string("Execution terminated"));
        REQUIRE(fx.executor->active_execution_ids().empty());
    }

    SECTION("Request queued behind it moves to a fresh context") {
        auto running = std::async(std::launch::async, [&fx]() { return fx.run("sleep:5000", 10000); });
        REQUIRE(fx.wait_for_active(1));
        std::string id = fx.executor->active_execution_ids()[0];

        auto queued = std::async(std::launch::async, [&fx]() { return fx.run("print:B", 10000); });
        REQUIRE(fx.wait_for_active(2));

        REQUIRE(fx.executor->terminate_execution(id));

        REQUIRE_FALSE(running.get().success);
        ExecutionResult result = queued.get();
        REQUIRE(result.success);
        REQUIRE(result.output == std::string("B"));
        REQUIRE(fx.executor->loader().load_count(kMock) == 2);
    }
}

// ============================================================================
// Statistics Tests
// ============================================================================

TEST_CASE("CodeExecutor: Metrics and statistics", "[executor]") {
    Fixture fx;
    fx.run("print:a");
    fx.run("fail:ValueError: bad");
    fx.run("import os", 0, Language::PYTHON);

    REQUIRE(execution_metric_count(fx.executor->metrics()) == 3);

    ExecutionStats stats = fx.executor->get_execution_stats();
    REQUIRE(stats.active_executions == 0);
    REQUIRE(stats.performance.total_executions == 3);
    REQUIRE(stats.performance.violation_rate > 0.0);
    REQUIRE(stats.loaded_engines == std::vector<std::string>{"mock"});
    REQUIRE(stats.loader.loads == 1);
    REQUIRE(stats.errors.total_errors == 2);

    auto j = to_json(stats);
    REQUIRE(j["loadedEngines"] == nlohmann::json::array({"mock"}));
    REQUIRE(j["performanceStats"]["totalExecutions"] == 3);
    REQUIRE(j["errors"]["totalErrors"] == 2);
}
