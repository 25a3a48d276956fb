/**
 * @file test_execution_context.cpp
 * @brief Unit tests for IsolatedExecutionContext
 *
 * Tests cover:
 * - Lifecycle state transitions
 * - FIFO command processing on the worker thread
 * - Termination of running and queued commands
 * - Validation, dependency and progress plumbing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/execution_context.hpp"
#include "mock_engines.hpp"
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace liverun;
using namespace liverun::testing;
using Catch::Matchers::ContainsSubstring;

namespace {

std::unique_ptr<IsolatedExecutionContext> make_context(std::shared_ptr<MockCounters> counters,
                                                       size_t init_delay_ms = 0,
                                                       bool fail_init = false) {
    return std::make_unique<IsolatedExecutionContext>(
        std::make_unique<MockEngine>("mock", counters, init_delay_ms, fail_init),
        SecurityPolicy::defaults());
}

} // namespace

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_CASE("IsolatedExecutionContext: Construction", "[context]") {
    auto counters = std::make_shared<MockCounters>();

    SECTION("Null engine is rejected") {
        REQUIRE_THROWS_AS(IsolatedExecutionContext(nullptr, SecurityPolicy::defaults()),
                          std::invalid_argument);
    }

    SECTION("Starts uninitialized with engine metadata") {
        auto context = make_context(counters);
        REQUIRE(context->get_state() == ContextState::UNINITIALIZED);
        REQUIRE_FALSE(context->is_usable());
        REQUIRE(context->language() == "mock");
        REQUIRE(context->get_info().name == "Mock Engine");
    }
}

TEST_CASE("IsolatedExecutionContext: Initialization", "[context]") {
    auto counters = std::make_shared<MockCounters>();

    SECTION("Successful bootstrap") {
        auto context = make_context(counters, 20);
        context->initialize();

        REQUIRE(context->get_state() == ContextState::READY);
        REQUIRE(context->is_usable());
        REQUIRE(context->load_time_ms() >= 20.0);
        REQUIRE(counters->initializations == 1);
    }

    SECTION("Policy is applied once") {
        auto context = make_context(counters);
        context->initialize();
        REQUIRE_THROWS_AS(context->initialize(), std::runtime_error);
        REQUIRE(counters->initializations == 1);
    }

    SECTION("Failed bootstrap ends in FAILED") {
        auto context = make_context(counters, 0, true);
        REQUIRE_THROWS_AS(context->initialize(), EngineLoadError);
        REQUIRE(context->get_state() == ContextState::FAILED);

        auto reply = context->post(ContextCommand::execute("e1", "x", 1000));
        ContextEvent event = reply.get();
        REQUIRE(event.type == EventType::ERROR);
        REQUIRE_THAT(event.error, ContainsSubstring("not ready"));
        REQUIRE_FALSE(event.context_terminated);
    }

    SECTION("Commands before initialize are refused") {
        auto context = make_context(counters);
        ContextEvent event = context->post(ContextCommand::execute("e1", "x", 1000)).get();
        REQUIRE(event.type == EventType::ERROR);
        REQUIRE_THAT(event.error, ContainsSubstring("UNINITIALIZED"));
    }
}

// ============================================================================
// Execution Tests
// ============================================================================

TEST_CASE("IsolatedExecutionContext: Execute commands", "[context]") {
    auto counters = std::make_shared<MockCounters>();
    auto context = make_context(counters);
    context->initialize();

    SECTION("Result event for a successful run") {
        ContextEvent event = context->post(ContextCommand::execute("e1", "print:hi", 1000)).get();
        REQUIRE(event.type == EventType::RESULT);
        REQUIRE(event.id == "e1");
        REQUIRE(event.success);
        REQUIRE(event.output == "hi");
        REQUIRE(event.metadata["mock"] == true);
        REQUIRE(context->get_state() == ContextState::READY);
    }

    SECTION("User-code failure is a failed result") {
        ContextEvent event = context->post(ContextCommand::execute("e2", "fail:bad input", 1000)).get();
        REQUIRE(event.type == EventType::RESULT);
        REQUIRE_FALSE(event.success);
        REQUIRE(event.error == "bad input");
        REQUIRE(context->get_stats().failed_commands == 1);
    }

    SECTION("Engine fault is an error event and the context stays usable") {
        ContextEvent event = context->post(ContextCommand::execute("e3", "throw:broken", 1000)).get();
        REQUIRE(event.type == EventType::ERROR);
        REQUIRE(event.error == "Execution failed: broken");
        REQUIRE_FALSE(event.context_terminated);
        REQUIRE(context->is_usable());

        REQUIRE(context->post(ContextCommand::execute("e4", "ok", 1000)).get().success);
    }

    SECTION("Commands run one at a time in FIFO order") {
        std::vector<std::future<ContextEvent>> replies;
        replies.push_back(context->post(ContextCommand::execute("a", "sleep:50", 1000)));
        replies.push_back(context->post(ContextCommand::execute("b", "print:second", 1000)));
        replies.push_back(context->post(ContextCommand::execute("c", "print:third", 1000)));

        REQUIRE(context->has_command("c"));

        REQUIRE(replies[0].get().output == "slept");
        REQUIRE(replies[1].get().output == "second");
        REQUIRE(replies[2].get().output == "third");
        REQUIRE(counters->executions == 3);
        REQUIRE(context->get_stats().commands_processed == 3);
        REQUIRE(context->pending() == 0);
        REQUIRE_FALSE(context->has_command("c"));
    }
}

TEST_CASE("IsolatedExecutionContext: Validation and dependencies", "[context]") {
    auto counters = std::make_shared<MockCounters>();
    auto context = make_context(counters);
    context->initialize();

    SECTION("Clean code validates") {
        ContextEvent event = context->validate("v1", "fine").get();
        REQUIRE(event.success);
        REQUIRE(event.metadata["problems"].empty());
        REQUIRE(counters->executions == 0);
    }

    SECTION("Problems are listed") {
        ContextEvent event = context->validate("v2", "a syntax error here").get();
        REQUIRE_FALSE(event.success);
        REQUIRE(event.error == "SyntaxError: invalid syntax");
        REQUIRE(event.metadata["problems"].size() == 1);
    }

    SECTION("Engines without packages refuse dependencies") {
        ContextEvent event = context->post(ContextCommand::install_dependencies("d1", {"numpy"})).get();
        REQUIRE(event.type == EventType::ERROR);
        REQUIRE_THAT(event.error, ContainsSubstring("does not support dependencies"));
    }
}

// ============================================================================
// Termination Tests
// ============================================================================

TEST_CASE("IsolatedExecutionContext: Termination", "[context]") {
    auto counters = std::make_shared<MockCounters>();
    auto context = make_context(counters);
    context->initialize();

    SECTION("Running and queued commands fail with a terminated error") {
        auto running = context->post(ContextCommand::execute("r", "sleep:5000", 10000));
        auto queued = context->post(ContextCommand::execute("q", "print:never", 10000));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        auto start = std::chrono::steady_clock::now();
        context->terminate();

        ContextEvent first = running.get();
        ContextEvent second = queued.get();
        auto waited = std::chrono::steady_clock::now() - start;

        REQUIRE(waited < std::chrono::milliseconds(1000));
        REQUIRE(first.type == EventType::ERROR);
        REQUIRE(first.context_terminated);
        REQUIRE(second.context_terminated);
        REQUIRE(counters->interrupts == 1);
        REQUIRE(context->get_state() == ContextState::TERMINATED);
        REQUIRE_FALSE(context->is_usable());
    }

    SECTION("Terminated contexts never run again") {
        context->terminate();
        ContextEvent event = context->post(ContextCommand::execute("late", "print:x", 1000)).get();
        REQUIRE(event.context_terminated);
        REQUIRE(counters->executions == 0);
    }

    SECTION("Terminate is idempotent") {
        context->terminate();
        context->terminate();
        REQUIRE(context->get_state() == ContextState::TERMINATED);
        REQUIRE(counters->disposals == 1);
    }

    SECTION("Terminate command") {
        ContextEvent event = context->post(ContextCommand::terminate("t")).get();
        REQUIRE(event.type == EventType::ERROR);
        REQUIRE(event.context_terminated);
        REQUIRE(context->get_state() == ContextState::TERMINATED);
    }
}

TEST_CASE("IsolatedExecutionContext: Withdrawing a queued command", "[context]") {
    auto counters = std::make_shared<MockCounters>();
    auto context = make_context(counters);
    context->initialize();

    auto running = context->post(ContextCommand::execute("r", "sleep:200", 10000));
    auto queued = context->post(ContextCommand::execute("q", "print:never", 10000));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    REQUIRE(context->is_running("r"));
    REQUIRE_FALSE(context->is_running("q"));
    REQUIRE(context->has_command("q"));

    SECTION("Only queued commands can be withdrawn") {
        REQUIRE_FALSE(context->cancel_queued("r"));
        REQUIRE(context->cancel_queued("q"));
        REQUIRE_FALSE(context->cancel_queued("q"));

        ContextEvent withdrawn = queued.get();
        REQUIRE(withdrawn.type == EventType::ERROR);
        REQUIRE_FALSE(withdrawn.context_terminated);
        REQUIRE_THAT(withdrawn.error, ContainsSubstring("cancelled before it started"));
        REQUIRE_FALSE(context->has_command("q"));

        ContextEvent first = running.get();
        REQUIRE(first.success);
        REQUIRE(first.output == "slept");
        REQUIRE(counters->executions == 1);
        REQUIRE(context->is_usable());
    }

    SECTION("Finished commands are neither running nor queued") {
        running.get();
        queued.get();
        REQUIRE_FALSE(context->is_running("r"));
        REQUIRE_FALSE(context->cancel_queued("q"));
    }
}

TEST_CASE("IsolatedExecutionContext: Progress listener", "[context]") {
    auto counters = std::make_shared<MockCounters>();
    auto context = make_context(counters);
    context->initialize();

    std::vector<std::string> seen;
    std::mutex seen_mutex;
    context->set_progress_listener([&](const ContextEvent& event) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.push_back(event.id + ":" + event.text);
    });

    ContextEvent event = context->post(ContextCommand::execute("p1", "progress:Loading numpy", 1000)).get();
    REQUIRE(event.success);
    REQUIRE(event.output == "done");

    std::lock_guard<std::mutex> lock(seen_mutex);
    REQUIRE(seen == std::vector<std::string>{"p1:Loading numpy"});
}
