/**
 * @file test_error_classifier.cpp
 * @brief Unit tests for ErrorClassifier
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/error_classifier.hpp"

using namespace liverun;
using Catch::Matchers::ContainsSubstring;

namespace {

bool sorted_by_priority(const std::vector<ErrorSuggestion>& suggestions) {
    for (size_t i = 1; i < suggestions.size(); ++i) {
        if (suggestions[i - 1].priority < suggestions[i].priority) {
            return false;
        }
    }
    return true;
}

} // namespace

// ============================================================================
// Parsing and Categorization Tests
// ============================================================================

TEST_CASE("ErrorClassifier: Python traceback", "[classifier]") {
    ErrorClassifier classifier;
    ProcessedError report = classifier.classify(
        "Traceback (most recent call last):\n"
        "  File \"<code>\", line 2, in <module>\n"
        "NameError: name 'x' is not defined\n",
        ErrorContext("python", "exec_1", "y = 1\nprint(x)"));

    REQUIRE(report.error_type == "NameError");
    REQUIRE(report.message == "name 'x' is not defined");
    REQUIRE(report.stack_trace.size() == 2);
    REQUIRE(report.stack_trace[0] == "Traceback (most recent call last):");
    REQUIRE(report.category == "runtime");
    REQUIRE(report.severity == Severity::LOW);
    REQUIRE(report.can_retry);
    REQUIRE(report.retry_delay_ms == 1000u);
    REQUIRE_THAT(report.user_message, ContainsSubstring("ran into an issue"));

    REQUIRE(report.suggestions.size() == 4);
    REQUIRE(report.suggestions[0].title == "Define the variable");
    REQUIRE(report.suggestions[0].code.has_value());
    REQUIRE(report.suggestions.back().title == "Trace the failing line");
    REQUIRE(sorted_by_priority(report.suggestions));
}

TEST_CASE("ErrorClassifier: Categories and severities", "[classifier]") {
    ErrorClassifier classifier;

    SECTION("Security violation") {
        ProcessedError report = classifier.classify(
            "SecurityError: Module 'subprocess' is not allowed for security reasons (line 1)",
            ErrorContext("python", "e"));
        REQUIRE(report.error_type == "SecurityError");
        REQUIRE(report.category == "security");
        REQUIRE(report.severity == Severity::CRITICAL);
        REQUIRE_FALSE(report.can_retry);
        REQUIRE_FALSE(report.retry_delay_ms.has_value());
        REQUIRE(report.suggestions[0].title == "Use allowed operations");
        REQUIRE(report.suggestions[1].title == "Inline your data");
        REQUIRE(report.suggestions[1].type == ErrorSuggestion::Type::EXAMPLE);
        REQUIRE(report.suggestions[1].priority == 7);
        REQUIRE(report.suggestions[1].code.has_value());
        REQUIRE_THAT(*report.suggestions[1].code, ContainsSubstring("for name, age in rows:"));
    }

    SECTION("Timeout") {
        ProcessedError report = classifier.classify(
            "TimeoutError: Execution timed out after 300ms", ErrorContext("python", "e"));
        REQUIRE(report.category == "timeout");
        REQUIRE(report.severity == Severity::MEDIUM);
        REQUIRE(report.can_retry);
        REQUIRE(report.retry_delay_ms == 5000u);
        REQUIRE(report.suggestions[0].title == "Look for infinite loops");
    }

    SECTION("Syntax") {
        ProcessedError report = classifier.classify("SyntaxError: invalid syntax", ErrorContext("python", "e"));
        REQUIRE(report.category == "syntax");
        REQUIRE_FALSE(report.can_retry);
        REQUIRE_THAT(report.user_message, ContainsSubstring("syntax error in your python code"));
        REQUIRE(report.suggestions.size() == 3);
    }

    SECTION("Memory") {
        ProcessedError report = classifier.classify("MemoryError", ErrorContext("python", "e"));
        REQUIRE(report.error_type == "MemoryError");
        REQUIRE(report.message == "MemoryError");
        REQUIRE(report.category == "memory");
        REQUIRE(report.severity == Severity::HIGH);
        REQUIRE_FALSE(report.can_retry);
    }

    SECTION("Validation") {
        ProcessedError report = classifier.classify(
            "Validation error: missing required string field: code", ErrorContext("python", "e"));
        REQUIRE(report.category == "validation");
        REQUIRE_FALSE(report.can_retry);
        REQUIRE(report.suggestions.size() == 1);
        REQUIRE(report.suggestions[0].title == "Check the request");
    }

    SECTION("SQLite message matches a language pattern") {
        ProcessedError report = classifier.classify("no such table: users", ErrorContext("sql", "e"));
        REQUIRE(report.error_type == "UnknownError");
        REQUIRE(report.message == "no such table: users");
        REQUIRE(report.category == "language_specific");
        REQUIRE(report.suggestions.size() == 3);
        REQUIRE(report.suggestions[0].title == "Create the table first");
    }

    SECTION("Warnings are low severity") {
        ProcessedError report = classifier.classify(
            "DeprecationWarning: old api", ErrorContext("python", "e"));
        REQUIRE(report.error_type == "DeprecationWarning");
        REQUIRE(report.severity == Severity::LOW);
    }

    SECTION("Unknown errors fall back to language documentation") {
        ProcessedError report = classifier.classify("something odd happened", ErrorContext("python", "e"));
        REQUIRE(report.category == "unknown");
        REQUIRE(report.suggestions.size() == 1);
        REQUIRE(report.suggestions[0].type == ErrorSuggestion::Type::DOCUMENTATION);
        REQUIRE(report.suggestions[0].link == std::string("https://docs.python.org/3/"));
    }

    SECTION("Empty input") {
        ProcessedError report = classifier.classify("", ErrorContext("json", "e"));
        REQUIRE(report.error_type == "UnknownError");
        REQUIRE(report.message == "Unknown error");
        REQUIRE(report.suggestions.empty());
    }
}

// ============================================================================
// Suggestion Tests
// ============================================================================

TEST_CASE("ErrorClassifier: Contextual help", "[classifier]") {
    ErrorClassifier classifier;

    SECTION("Python 2 print and missing indentation") {
        auto hints = classifier.generate_contextual_help("if ready:\nprint 'go'", "python");
        REQUIRE(hints.size() == 2);
        REQUIRE(hints[0].title == "Indentation required");
        REQUIRE(hints[1].title == "Python 3 print syntax");
    }

    SECTION("Single-quoted JSON") {
        auto hints = classifier.generate_contextual_help("{'a': 1}", "json");
        REQUIRE(hints.size() == 1);
        REQUIRE(hints[0].title == "Use double quotes");
    }

    SECTION("JSON parse errors are not read as SQL") {
        ProcessedError report = classifier.classify(
            "JSON Syntax Error at line 1, column 2: unexpected end of input", ErrorContext("json", "e", "{"));
        REQUIRE(report.suggestions[0].title == "Check quotes and commas");
    }

    SECTION("Tab-indented YAML") {
        auto hints = classifier.generate_contextual_help("server:\n\thost: localhost", "yaml");
        REQUIRE(hints.size() == 1);
        REQUIRE(hints[0].title == "Replace tabs with spaces");
    }

    SECTION("YAML parse errors get indentation fixes") {
        ProcessedError report = classifier.classify(
            "YAML Syntax Error at line 2, column 5: illegal map value",
            ErrorContext("yaml", "e", "a: b: c\n"));
        REQUIRE(report.category == "syntax");
        REQUIRE_FALSE(report.can_retry);
        bool has_indentation_fix = false;
        for (const auto& suggestion : report.suggestions) {
            has_indentation_fix = has_indentation_fix || suggestion.title == "Check the indentation";
            REQUIRE(suggestion.title != "Check SQL syntax");
        }
        REQUIRE(has_indentation_fix);
        REQUIRE(sorted_by_priority(report.suggestions));
    }

    SECTION("Clean code gets no hints") {
        REQUIRE(classifier.generate_contextual_help("print('ok')", "python").empty());
    }

    SECTION("Suggestions are capped and keep the category remediation") {
        ProcessedError report = classifier.classify(
            "NameError: name 'go' is not defined",
            ErrorContext("python", "e", "if ready:\nprint 'go'"));

        REQUIRE(report.suggestions.size() == ErrorClassifier::kMaxSuggestions);
        REQUIRE(report.suggestions[0].title == "Indentation required");
        REQUIRE(report.suggestions.back().title == "Trace the failing line");
        REQUIRE(sorted_by_priority(report.suggestions));
    }
}

TEST_CASE("ErrorClassifier: Retry strategy", "[classifier]") {
    ProcessedError error;

    SECTION("Timeouts retry twice with a long delay") {
        error.category = "timeout";
        error.can_retry = true;
        RetryStrategy strategy = ErrorClassifier::get_retry_strategy(error);
        REQUIRE(strategy.should_retry);
        REQUIRE(strategy.max_retries == 2);
        REQUIRE(strategy.delay_ms == 5000);
    }

    SECTION("Network errors retry more often") {
        error.category = "network";
        error.can_retry = true;
        RetryStrategy strategy = ErrorClassifier::get_retry_strategy(error);
        REQUIRE(strategy.max_retries == 5);
        REQUIRE(strategy.delay_ms == 2000);
        REQUIRE(strategy.backoff_multiplier == Catch::Approx(1.5));
    }

    SECTION("Deterministic failures never retry") {
        error.category = "syntax";
        error.can_retry = true;
        REQUIRE_FALSE(ErrorClassifier::get_retry_strategy(error).should_retry);
    }

    SECTION("JSON shape") {
        error.category = "runtime";
        error.can_retry = true;
        auto j = to_json(ErrorClassifier::get_retry_strategy(error));
        REQUIRE(j["shouldRetry"] == true);
        REQUIRE(j["maxRetries"] == 3);
        REQUIRE(j["delay"] == 1000);
    }
}

// ============================================================================
// Analytics Tests
// ============================================================================

TEST_CASE("ErrorClassifier: Analytics", "[classifier]") {
    ErrorClassifier classifier;

    SECTION("Counts by category, type, language and severity") {
        classifier.track(classifier.classify("SyntaxError: invalid syntax", ErrorContext("python", "a")), "python");
        classifier.track(classifier.classify("no such table: t", ErrorContext("sql", "b")), "sql");
        classifier.track(classifier.classify("TimeoutError: Execution timed out after 5ms",
                                             ErrorContext("python", "c")), "python");

        ErrorAnalytics analytics = classifier.get_error_analytics();
        REQUIRE(analytics.total_errors == 3);
        REQUIRE(analytics.errors_by_category["syntax"] == 1);
        REQUIRE(analytics.errors_by_type["SyntaxError"] == 1);
        REQUIRE(analytics.errors_by_language["python"] == 2);
        REQUIRE(analytics.errors_by_severity["medium"] == 1);
        REQUIRE(analytics.retryable_errors == 2);
        REQUIRE(analytics.average_suggestions > 0.0);

        classifier.reset_analytics();
        REQUIRE(classifier.get_error_analytics().total_errors == 0);
    }

    SECTION("Only the most recent errors are kept") {
        ProcessedError report = classifier.classify("KeyError: 'k'", ErrorContext("python", "e"));
        for (size_t i = 0; i < ErrorClassifier::kMaxTrackedErrors + 5; ++i) {
            classifier.track(report, "python");
        }
        REQUIRE(classifier.get_error_analytics().total_errors == ErrorClassifier::kMaxTrackedErrors);
    }
}
