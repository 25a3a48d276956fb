/**
 * @file test_yaml_engine.cpp
 * @brief Unit tests for the YAML engine
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/engines/yaml_engine.hpp"
#include <sstream>

using namespace liverun;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

json convert(const std::string& text) {
    size_t documents = 0;
    return YamlEngine::to_json(text, documents);
}

} // namespace

// ============================================================================
// Analysis Tests
// ============================================================================

TEST_CASE("YamlEngine: Valid documents", "[yaml_engine]") {
    YamlEngine engine;
    engine.initialize(SecurityPolicy::defaults());

    SECTION("Mapping analysis") {
        EngineOutput out = engine.execute(
            "name: LiveRun\n"
            "version: 1.2\n"
            "enabled: true\n"
            "ports:\n"
            "  - 8080\n"
            "  - 8443\n"
            "# deployment owner\n"
            "owner:\n"
            "  team: core\n",
            ExecutionOptions());

        REQUIRE(out.success);
        REQUIRE_THAT(out.stdout_text, StartsWith("YAML is valid!\n\nJSON equivalent:\n"));
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("\"ports\": [\n    8080,\n    8443\n  ]"));
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("- Lines: 9"));
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("- Type: object"));
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("- Keys: 6"));
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("- Has comments: Yes"));
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("- Has arrays: Yes"));

        REQUIRE(out.metadata["type"] == "object");
        REQUIRE(out.metadata["lines"] == 9);
        REQUIRE(out.metadata["keys"] == 6);
        REQUIRE(out.metadata["documents"] == 1);
        REQUIRE(out.metadata["hasComments"] == true);
        REQUIRE(out.metadata["hasArrays"] == true);

        REQUIRE(out.artifacts.size() == 1);
        REQUIRE(out.artifacts[0].kind == "html");
        REQUIRE_THAT(out.artifacts[0].data, ContainsSubstring("language-yaml"));
    }

    SECTION("Hash marks inside values are not comments") {
        EngineOutput out = engine.execute("motto: 'use # sparingly'\nurl: http://host/page#top", ExecutionOptions());
        REQUIRE(out.success);
        REQUIRE(out.metadata["hasComments"] == false);
        REQUIRE(out.metadata["hasArrays"] == false);
    }

    SECTION("Several documents form a stream") {
        EngineOutput out = engine.execute("a: 1\n---\nb: [2, 3]\n", ExecutionOptions());
        REQUIRE(out.success);
        REQUIRE(out.metadata["type"] == "stream");
        REQUIRE(out.metadata["documents"] == 2);
        REQUIRE(out.metadata["keys"] == 2);
        REQUIRE(out.metadata["hasArrays"] == true);
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("- Documents: 2"));
    }

    SECTION("Empty input is not an error") {
        EngineOutput out = engine.execute("  \n\t\n", ExecutionOptions());
        REQUIRE(out.success);
        REQUIRE(out.stdout_text == "No YAML content provided");
        REQUIRE(out.artifacts.empty());
    }
}

TEST_CASE("YamlEngine: Scalar resolution", "[yaml_engine]") {
    json value = convert(
        "quoted: '42'\n"
        "integer: 42\n"
        "negative: -7\n"
        "hex: 0x1F\n"
        "octal: 0o17\n"
        "float: -3.5e2\n"
        "tilde: ~\n"
        "empty:\n"
        "flag: false\n"
        "tagged: !!str true\n"
        "word: yes\n"
        "infinity: .inf\n"
        "huge: 123456789012345678901234567890\n");

    REQUIRE(value["quoted"] == "42");
    REQUIRE(value["integer"] == 42);
    REQUIRE(value["negative"] == -7);
    REQUIRE(value["hex"] == 31);
    REQUIRE(value["octal"] == 15);
    REQUIRE(value["float"].get<double>() == Catch::Approx(-350.0));
    REQUIRE(value["tilde"].is_null());
    REQUIRE(value["empty"].is_null());
    REQUIRE(value["flag"] == false);
    REQUIRE(value["tagged"] == "true");
    REQUIRE(value["word"] == "yes");
    REQUIRE(value["infinity"] == ".inf");
    REQUIRE(value["huge"].is_number_float());
}

TEST_CASE("YamlEngine: Anchors and aliases", "[yaml_engine]") {
    SECTION("Aliases are expanded") {
        json value = convert("base: &base {x: 1, y: [a, b]}\ncopy: *base\n");
        REQUIRE(value["copy"] == value["base"]);
        REQUIRE(value["copy"]["y"][1] == "b");
    }

    SECTION("Expansion past the node cap is refused") {
        std::ostringstream bomb;
        bomb << "a: &a [x, x, x, x, x, x, x, x, x, x]\n";
        const char* names[] = {"a", "b", "c", "d", "e"};
        for (int level = 1; level < 5; ++level) {
            bomb << names[level] << ": &" << names[level] << " [";
            for (int i = 0; i < 10; ++i) {
                bomb << (i ? ", " : "") << "*" << names[level - 1];
            }
            bomb << "]\n";
        }

        YamlEngine engine;
        engine.initialize(SecurityPolicy::defaults());
        EngineOutput out = engine.execute(bomb.str(), ExecutionOptions());
        REQUIRE_FALSE(out.success);
        REQUIRE_THAT(out.error, ContainsSubstring("expands to more than 100000 nodes"));
    }
}

// ============================================================================
// Error Tests
// ============================================================================

TEST_CASE("YamlEngine: Syntax errors", "[yaml_engine]") {
    YamlEngine engine;
    engine.initialize(SecurityPolicy::defaults());

    EngineOutput out = engine.execute("items: [1, 2\nnext: 3", ExecutionOptions());
    REQUIRE_FALSE(out.success);
    REQUIRE_THAT(out.error, StartsWith("YAML Syntax Error at line "));
    REQUIRE(out.stdout_text.empty());

    auto problems = engine.validate_syntax("items: [1, 2\nnext: 3");
    REQUIRE(problems.size() == 1);
    REQUIRE(problems[0] == out.error);

    REQUIRE(engine.validate_syntax("a: 1\nb:\n  - c").empty());
    REQUIRE(engine.validate_syntax("").empty());
}

TEST_CASE("YamlEngine: Key counting", "[yaml_engine]") {
    REQUIRE(YamlEngine::count_keys(json::parse(R"({"a": {"b": 1}, "c": [{"d": 1}, {"e": 2}]})")) == 5);
    REQUIRE(YamlEngine::count_keys(json::parse("[1, 2]")) == 0);
    REQUIRE(YamlEngine::count_keys(json("text")) == 0);
}

TEST_CASE("YamlEngine: Info", "[yaml_engine]") {
    YamlEngine engine;
    EngineInfo info = engine.get_info();
    REQUIRE(info.name == "YAML Engine");
    REQUIRE(info.language == "yaml");
    REQUIRE_FALSE(info.heavy_runtime);
}
