/**
 * @file test_light_engines.cpp
 * @brief Unit tests for the JSON, regex, Markdown and HTML/CSS engines
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/engines/json_engine.hpp"
#include "../src/engines/regex_engine.hpp"
#include "../src/engines/markdown_engine.hpp"
#include "../src/engines/web_engine.hpp"

using namespace liverun;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

template <typename Engine>
Engine& ready(Engine& engine) {
    engine.initialize(SecurityPolicy::defaults());
    return engine;
}

} // namespace

// ============================================================================
// LightEngine Tests
// ============================================================================

TEST_CASE("LightEngine: Lifecycle", "[light_engine]") {
    JsonEngine engine;
    REQUIRE_FALSE(engine.is_initialized());
    REQUIRE_THROWS_WITH(engine.execute("{}", ExecutionOptions()),
                        ContainsSubstring("json engine not initialized"));

    ready(engine);
    REQUIRE(engine.is_initialized());
    REQUIRE_FALSE(engine.get_info().heavy_runtime);

    engine.dispose();
    REQUIRE_FALSE(engine.is_initialized());
}

TEST_CASE("LightEngine: Helpers", "[light_engine]") {
    REQUIRE(LightEngine::escape_html("<a href=\"x\">&'</a>") ==
            "&lt;a href=&quot;x&quot;&gt;&amp;&#39;&lt;/a&gt;");
    REQUIRE(LightEngine::trim("\n\t  value \r\n") == "value");
    REQUIRE(LightEngine::trim("   ").empty());
}

// ============================================================================
// JsonEngine Tests
// ============================================================================

TEST_CASE("JsonEngine: Valid documents", "[json_engine]") {
    JsonEngine engine;
    ready(engine);

    SECTION("Object analysis") {
        EngineOutput out = engine.execute(R"({"a": {"b": [1, 2]}, "c": true})", ExecutionOptions());

        REQUIRE(out.success);
        REQUIRE_THAT(out.stdout_text, StartsWith("JSON is valid!\n\nFormatted JSON:\n"));
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("- Type: object"));
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("- Max depth: 3"));
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("- Object keys: 2"));
        REQUIRE(out.metadata["type"] == "object");
        REQUIRE(out.metadata["depth"] == 3);
        REQUIRE(out.metadata["keys"] == 2);
        REQUIRE_FALSE(out.metadata.contains("arrayLength"));
        REQUIRE(out.artifacts.size() == 1);
        REQUIRE(out.artifacts[0].kind == "html");
        REQUIRE(out.duration_ms >= 0.0);
    }

    SECTION("Array analysis") {
        EngineOutput out = engine.execute("[1, 2, 3]", ExecutionOptions());
        REQUIRE(out.success);
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("- Array length: 3"));
        REQUIRE(out.metadata["arrayLength"] == 3);
        REQUIRE(out.metadata["depth"] == 1);
    }

    SECTION("Empty input is not an error") {
        EngineOutput out = engine.execute("   \n", ExecutionOptions());
        REQUIRE(out.success);
        REQUIRE(out.stdout_text == "No JSON content provided");
        REQUIRE(out.artifacts.empty());
    }
}

TEST_CASE("JsonEngine: Syntax errors", "[json_engine]") {
    JsonEngine engine;
    ready(engine);

    EngineOutput out = engine.execute("{\n  \"a\": 1,\n}", ExecutionOptions());
    REQUIRE_FALSE(out.success);
    REQUIRE_THAT(out.error, StartsWith("JSON Syntax Error at line "));
    REQUIRE(out.artifacts.empty());

    auto problems = engine.validate_syntax("{'a': 1}");
    REQUIRE(problems.size() == 1);
    REQUIRE_THAT(problems[0], StartsWith("JSON Syntax Error"));
    REQUIRE(engine.validate_syntax("{\"a\": 1}").empty());
}

TEST_CASE("JsonEngine: Depth calculation", "[json_engine]") {
    REQUIRE(JsonEngine::calculate_depth(json(5)) == 0);
    REQUIRE(JsonEngine::calculate_depth(json::array()) == 0);
    REQUIRE(JsonEngine::calculate_depth(json::parse("[1]")) == 1);
    REQUIRE(JsonEngine::calculate_depth(json::parse("[[[]]]")) == 2);
}

// ============================================================================
// RegexEngine Tests
// ============================================================================

TEST_CASE("RegexEngine: Global matching", "[regex_engine]") {
    RegexEngine engine;
    ready(engine);

    EngineOutput out = engine.execute("\\d+|||abc 123 def 45|||g", ExecutionOptions());

    REQUIRE(out.success);
    REQUIRE_THAT(out.stdout_text, StartsWith("Regex Test Results:\nPattern: \\d+\nFlags: g\n"));
    REQUIRE_THAT(out.stdout_text, ContainsSubstring("Matches Found: 2"));
    REQUIRE_THAT(out.stdout_text, ContainsSubstring("1. \"123\" at position 4"));
    REQUIRE_THAT(out.stdout_text, ContainsSubstring("2. \"45\" at position 12"));
    REQUIRE(out.metadata["matchCount"] == 2);
    REQUIRE(out.metadata["complexity"] == "Moderate");
    REQUIRE(out.metadata["hasGroups"] == false);
    REQUIRE(out.metadata["testStringLength"] == 14);
    REQUIRE_THAT(out.artifacts[0].data, ContainsSubstring("<span class=\"regex-match\" data-match=\"2\">45</span>"));
}

TEST_CASE("RegexEngine: Flags and groups", "[regex_engine]") {
    RegexEngine engine;
    ready(engine);

    SECTION("Without g only the first match is reported") {
        EngineOutput out = engine.execute("o|||foo boo", ExecutionOptions());
        REQUIRE(out.metadata["matchCount"] == 1);
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("Flags: none"));
    }

    SECTION("Case-insensitive") {
        EngineOutput out = engine.execute("HELLO|||say hello|||i", ExecutionOptions());
        REQUIRE(out.metadata["matchCount"] == 1);
    }

    SECTION("Capture groups are listed") {
        EngineOutput out = engine.execute("(\\w+)@(\\w+)|||mail ann@example now|||g", ExecutionOptions());
        REQUIRE(out.metadata["hasGroups"] == true);
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("(groups: ann, example)"));
    }

    SECTION("No matches") {
        EngineOutput out = engine.execute("z|||abc|||g", ExecutionOptions());
        REQUIRE(out.success);
        REQUIRE_THAT(out.stdout_text, ContainsSubstring("No matches found."));
    }
}

TEST_CASE("RegexEngine: Invalid input", "[regex_engine]") {
    RegexEngine engine;
    ready(engine);

    SECTION("Missing separator") {
        EngineOutput out = engine.execute("\\d+", ExecutionOptions());
        REQUIRE_FALSE(out.success);
        REQUIRE_THAT(out.error, StartsWith("Invalid format. Use: pattern|||testString|||flags (optional)"));
    }

    SECTION("Bad pattern") {
        EngineOutput out = engine.execute("(abc|||abc", ExecutionOptions());
        REQUIRE_FALSE(out.success);
        REQUIRE_THAT(out.error, StartsWith("Invalid regex pattern: "));
    }

    SECTION("Unsupported flag") {
        EngineOutput out = engine.execute("a|||a|||gx", ExecutionOptions());
        REQUIRE(out.error == "Invalid regex flags: unsupported flag 'x'");
    }

    SECTION("validate_syntax reports the same problems") {
        REQUIRE(engine.validate_syntax("a|||a|||x").size() == 1);
        REQUIRE(engine.validate_syntax("[a-z]+|||abc").empty());
    }
}

TEST_CASE("RegexEngine: Helpers", "[regex_engine]") {
    auto parts = RegexEngine::split_input("a|||b c|||gi");
    REQUIRE(parts == std::vector<std::string>{"a", "b c", "gi"});
    REQUIRE(RegexEngine::split_input("only").size() == 1);

    REQUIRE(RegexEngine::classify_complexity("abc") == "Simple");
    REQUIRE(RegexEngine::classify_complexity("a+") == "Moderate");
    REQUIRE(RegexEngine::classify_complexity("(\\d+)-[a-z]") == "Complex");
}

// ============================================================================
// MarkdownEngine Tests
// ============================================================================

TEST_CASE("MarkdownEngine: Document statistics", "[markdown_engine]") {
    MarkdownEngine engine;
    ready(engine);

    std::string doc =
        "# Title\n"
        "\n"
        "Some **bold** text with a [link](https://example.com).\n"
        "\n"
        "![logo](logo.png)\n"
        "\n"
        "```python\n"
        "# not a heading\n"
        "```";

    EngineOutput out = engine.execute(doc, ExecutionOptions());

    REQUIRE(out.success);
    REQUIRE_THAT(out.stdout_text, StartsWith("Markdown processed successfully!\n\nMarkdown Analysis:\n"));
    REQUIRE(out.metadata["lines"] == 9);
    REQUIRE(out.metadata["headings"] == 1);
    REQUIRE(out.metadata["links"] == 1);
    REQUIRE(out.metadata["images"] == 1);
    REQUIRE(out.metadata["codeBlocks"] == 1);
    REQUIRE(out.artifacts.size() == 1);
    REQUIRE_THAT(out.artifacts[0].data, ContainsSubstring("<h1>Title</h1>"));
    REQUIRE_THAT(out.artifacts[0].data, ContainsSubstring("<strong>bold</strong>"));
    REQUIRE_THAT(out.artifacts[0].data, ContainsSubstring("<pre><code class=\"language-python\">"));
}

TEST_CASE("MarkdownEngine: HTML conversion", "[markdown_engine]") {
    SECTION("Block elements") {
        std::string html = MarkdownEngine::to_html("## Sub\n- one\n- two\n\n1. first\n\n> quoted\n\n---");
        REQUIRE_THAT(html, ContainsSubstring("<h2>Sub</h2>"));
        REQUIRE_THAT(html, ContainsSubstring("<ul>\n<li>one</li>\n<li>two</li>\n</ul>"));
        REQUIRE_THAT(html, ContainsSubstring("<ol>\n<li>first</li>\n</ol>"));
        REQUIRE_THAT(html, ContainsSubstring("<blockquote>quoted</blockquote>"));
        REQUIRE_THAT(html, ContainsSubstring("<hr>"));
    }

    SECTION("Raw HTML is escaped") {
        std::string html = MarkdownEngine::to_html("<script>alert(1)</script>");
        REQUIRE_THAT(html, ContainsSubstring("&lt;script&gt;"));
        REQUIRE(html.find("<script>") == std::string::npos);
    }

    SECTION("Script URLs are neutralized") {
        std::string html = MarkdownEngine::to_html("[click](javascript:alert)");
        REQUIRE_THAT(html, ContainsSubstring("href=\"#\""));
    }

    SECTION("Code spans are opaque") {
        REQUIRE(MarkdownEngine::render_inline("`**x**` and *y*") == "<code>**x**</code> and <em>y</em>");
    }
}

TEST_CASE("MarkdownEngine: Empty input", "[markdown_engine]") {
    MarkdownEngine engine;
    ready(engine);
    EngineOutput out = engine.execute("", ExecutionOptions());
    REQUIRE(out.success);
    REQUIRE(out.stdout_text == "No Markdown content provided");
}

// ============================================================================
// WebEngine Tests
// ============================================================================

TEST_CASE("WebEngine: Language binding", "[web_engine]") {
    REQUIRE(WebEngine("html").get_info().language == "html");
    REQUIRE(WebEngine("css").get_info().name == "CSS Preview Engine");
    REQUIRE_THROWS_AS(WebEngine("python"), ConfigurationError);
}

TEST_CASE("WebEngine: HTML preview", "[web_engine]") {
    WebEngine engine("html");
    ready(engine);

    SECTION("Fragment is wrapped in a sandboxed document") {
        EngineOutput out = engine.execute("<h1>Hi</h1><button onclick=\"go()\">Go</button>", ExecutionOptions());

        REQUIRE(out.success);
        REQUIRE(out.stdout_text == "HTML rendered successfully");
        REQUIRE(out.artifacts.size() == 1);
        REQUIRE_THAT(out.artifacts[0].data, StartsWith("<iframe class=\"liverun-preview\" sandbox=\"allow-scripts\""));
        REQUIRE_THAT(out.artifacts[0].data, ContainsSubstring("Content-Security-Policy"));
        REQUIRE(out.artifacts[0].data.find("allow-same-origin") == std::string::npos);
        REQUIRE(out.metadata["hasInteractivity"] == true);
        REQUIRE(out.metadata["isCompleteDocument"] == false);
        REQUIRE_FALSE(out.metadata.contains("unclosedTags"));
    }

    SECTION("Complete documents are kept") {
        EngineOutput out = engine.execute("<!DOCTYPE html><html><head></head><body>x</body></html>",
                                          ExecutionOptions());
        REQUIRE(out.metadata["isCompleteDocument"] == true);
        REQUIRE(out.metadata["hasInteractivity"] == false);
    }

    SECTION("Unclosed elements are reported but still rendered") {
        EngineOutput out = engine.execute("<div><p>Hi</p>", ExecutionOptions());
        REQUIRE(out.success);
        REQUIRE(out.metadata["unclosedTags"] == json::array({"div"}));
        REQUIRE(engine.validate_syntax("<div><p>Hi</p>") ==
                std::vector<std::string>{"Unclosed <div> element"});
    }
}

TEST_CASE("WebEngine: Tag balance", "[web_engine]") {
    REQUIRE(WebEngine::find_unclosed_tags("<br><img src=x><input/><hr>").empty());
    REQUIRE(WebEngine::find_unclosed_tags("<script>if (a<b) {}</script>").empty());
    REQUIRE(WebEngine::find_unclosed_tags("<!-- <div> --><p></P>").empty());
    REQUIRE(WebEngine::find_unclosed_tags("<ul><li>a</ul>") == std::vector<std::string>{"li"});
}

TEST_CASE("WebEngine: CSS preview", "[web_engine]") {
    WebEngine engine("css");
    ready(engine);

    SECTION("Feature detection") {
        EngineOutput out = engine.execute(
            ".box { display: flex; animation: spin 1s; }\n"
            "@media (max-width: 600px) { .box { --gap: 4px; } }",
            ExecutionOptions());

        REQUIRE(out.success);
        REQUIRE(out.stdout_text == "CSS applied successfully to preview elements");
        REQUIRE(out.metadata["hasAnimations"] == true);
        REQUIRE(out.metadata["hasFlexbox"] == true);
        REQUIRE(out.metadata["hasMediaQueries"] == true);
        REQUIRE(out.metadata["hasCustomProperties"] == true);
        REQUIRE(out.metadata["cssFeatures"]["flexbox"] == true);
    }

    SECTION("Unclosed block") {
        EngineOutput out = engine.execute(".a { color: red;", ExecutionOptions());
        REQUIRE_FALSE(out.success);
        REQUIRE(out.error == "CSS Syntax Error: 1 unclosed '{'");
    }

    SECTION("Stray closing brace") {
        EngineOutput out = engine.execute(".a { }\n}", ExecutionOptions());
        REQUIRE(out.error == "CSS Syntax Error: unexpected '}' on line 2");
    }

    SECTION("Braces in strings and comments do not count") {
        REQUIRE(WebEngine::check_css_balance("a::after { content: '}'; } /* { */").empty());
        REQUIRE(WebEngine::check_css_balance("/* open").rfind("unterminated comment", 0) == 0);
    }
}
