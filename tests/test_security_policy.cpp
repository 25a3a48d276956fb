/**
 * @file test_security_policy.cpp
 * @brief Unit tests for SecurityPolicy and CodeAnalyzer
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/security_policy.hpp"

using namespace liverun;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// SecurityPolicy Tests
// ============================================================================

TEST_CASE("SecurityPolicy: Default deny-lists", "[security]") {
    SecurityPolicy policy = SecurityPolicy::defaults();

    SECTION("Process, network and filesystem modules are blocked") {
        REQUIRE(policy.is_module_blocked("os"));
        REQUIRE(policy.is_module_blocked("subprocess"));
        REQUIRE(policy.is_module_blocked("socket"));
        REQUIRE(policy.is_module_blocked("pathlib"));
        REQUIRE(policy.is_module_blocked("pickle"));
    }

    SECTION("Teaching modules stay available") {
        REQUIRE_FALSE(policy.is_module_blocked("math"));
        REQUIRE_FALSE(policy.is_module_blocked("numpy"));
        REQUIRE_FALSE(policy.is_module_blocked("collections"));
    }

    SECTION("Dangerous builtins are blocked") {
        for (const char* name : {"eval", "exec", "compile", "open", "input", "__import__", "breakpoint"}) {
            REQUIRE(policy.is_builtin_blocked(name));
        }
        REQUIRE_FALSE(policy.is_builtin_blocked("print"));
    }

    SECTION("SQL statements are matched case-insensitively") {
        REQUIRE(policy.is_sql_statement_blocked("ATTACH"));
        REQUIRE(policy.is_sql_statement_blocked("pragma"));
        REQUIRE_FALSE(policy.is_sql_statement_blocked("SELECT"));
    }
}

TEST_CASE("SecurityPolicy: Submodules inherit their parent's block", "[security]") {
    SecurityPolicy policy = SecurityPolicy::defaults();

    REQUIRE(policy.is_module_blocked("os.path"));
    REQUIRE(policy.is_module_blocked("urllib.request"));
    REQUIRE_FALSE(policy.is_module_blocked("osmium"));
}

TEST_CASE("SecurityPolicy: Violation messages", "[security]") {
    REQUIRE(SecurityPolicy::module_violation("os") == "Module 'os' is not allowed for security reasons");
    REQUIRE(SecurityPolicy::function_violation("eval") == "Function 'eval' is not allowed for security reasons");
    REQUIRE(SecurityPolicy::statement_violation("attach") == "Statement 'ATTACH' is not allowed for security reasons");
}

TEST_CASE("SecurityPolicy: Custom deny-lists", "[security]") {
    SecurityPolicy policy({"random"}, {"print"}, {"drop"});

    REQUIRE(policy.is_module_blocked("random"));
    REQUIRE_FALSE(policy.is_module_blocked("os"));
    REQUIRE(policy.is_builtin_blocked("print"));
    REQUIRE(policy.is_sql_statement_blocked("DROP"));

    auto j = policy.to_json();
    REQUIRE(j["blocked_modules"].size() == 1);
    REQUIRE(j["blocked_builtins"][0] == "print");
}

// ============================================================================
// CodeAnalyzer Tests
// ============================================================================

TEST_CASE("CodeAnalyzer: Blocked imports in Python", "[security][analyzer]") {
    CodeAnalyzer analyzer(SecurityPolicy::defaults());

    SECTION("Plain import") {
        auto findings = analyzer.analyze("import os\nprint(1)", "python");
        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].rule == "blocked_import");
        REQUIRE(findings[0].subject == "os");
        REQUIRE(findings[0].line == 1);
        REQUIRE_THAT(findings[0].message, ContainsSubstring("not allowed"));
    }

    SECTION("From import of a submodule") {
        auto findings = analyzer.analyze("x = 1\nfrom os.path import join", "python");
        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].subject == "os.path");
        REQUIRE(findings[0].line == 2);
    }

    SECTION("Several modules on one line") {
        auto findings = analyzer.analyze("import math, socket as s; import subprocess", "python");
        REQUIRE(findings.size() == 2);
        REQUIRE(findings[0].subject == "socket");
        REQUIRE(findings[1].subject == "subprocess");
    }

    SECTION("Comments are ignored") {
        auto findings = analyzer.analyze("# import os\nimport math", "python");
        REQUIRE(findings.empty());
    }
}

TEST_CASE("CodeAnalyzer: Introspection escapes", "[security][analyzer]") {
    CodeAnalyzer analyzer(SecurityPolicy::defaults());

    auto findings = analyzer.analyze("print(().__class__.__bases__[0].__subclasses__())", "python");
    REQUIRE_FALSE(findings.empty());
    REQUIRE(findings[0].rule == "introspection_escape");
    REQUIRE(findings[0].subject == "__subclasses__");

    REQUIRE_FALSE(analyzer.analyze("f = lambda: 0\nprint(f.__globals__)", "python").empty());
    REQUIRE(analyzer.analyze("values = [1, 2, 3]\nprint(sum(values))", "python").empty());
}

TEST_CASE("CodeAnalyzer: Blocked SQL statements", "[security][analyzer]") {
    CodeAnalyzer analyzer(SecurityPolicy::defaults());

    SECTION("ATTACH is reported with its line") {
        auto findings = analyzer.analyze("SELECT 1;\nATTACH DATABASE 'x.db' AS x;", "sql");
        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].subject == "ATTACH");
        REQUIRE(findings[0].line == 2);
    }

    SECTION("Keywords inside string literals and comments are ignored") {
        auto findings = analyzer.analyze("SELECT 'pragma' AS word; -- attach later", "sql");
        REQUIRE(findings.empty());
    }
}

TEST_CASE("CodeAnalyzer: Languages without rules", "[security][analyzer]") {
    CodeAnalyzer analyzer(SecurityPolicy::defaults());

    REQUIRE(analyzer.analyze("{\"import os\": true}", "json").empty());
    REQUIRE(analyzer.analyze("# import os", "markdown").empty());
}
