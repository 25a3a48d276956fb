#include "json_engine.hpp"
#include <algorithm>
#include <sstream>

namespace liverun {

namespace {

std::string type_name(const json& value) {
    if (value.is_array()) return "array";
    if (value.is_object()) return "object";
    if (value.is_string()) return "string";
    if (value.is_boolean()) return "boolean";
    if (value.is_number()) return "number";
    return "null";
}

} // namespace

int JsonEngine::calculate_depth(const json& value) {
    if (!value.is_structured()) {
        return 0;
    }
    int max_child = -1;
    for (const auto& child : value) {
        max_child = std::max(max_child, calculate_depth(child));
    }
    return max_child < 0 ? 0 : max_child + 1;
}

std::string JsonEngine::describe_parse_error(const std::string& text, const json::parse_error& e) {
    // e.byte is 1-based and points just past the offending character
    size_t position = e.byte > 0 ? std::min<size_t>(e.byte - 1, text.size()) : 0;
    size_t line = 1;
    size_t column = 1;
    for (size_t i = 0; i < position; ++i) {
        if (text[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }

    std::ostringstream oss;
    oss << "JSON Syntax Error at line " << line << ", column " << column << ": " << e.what();
    return oss.str();
}

std::vector<std::string> JsonEngine::validate_syntax(const std::string& code) {
    std::string text = trim(code);
    if (text.empty()) {
        return {};
    }
    try {
        (void)json::parse(text);
    } catch (const json::parse_error& e) {
        return {describe_parse_error(text, e)};
    }
    return {};
}

EngineOutput JsonEngine::render(const std::string& code, const ExecutionOptions& options) {
    (void)options;
    EngineOutput output;
    std::string text = trim(code);

    if (text.empty()) {
        output.stdout_text = "No JSON content provided";
        return output;
    }

    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::parse_error& e) {
        output.success = false;
        output.error = describe_parse_error(text, e);
        return output;
    }

    std::string formatted = parsed.dump(2, ' ', false, json::error_handler_t::replace);
    std::string type = type_name(parsed);
    int depth = calculate_depth(parsed);
    size_t keys = parsed.is_object() ? parsed.size() : 0;

    std::ostringstream summary;
    summary << "JSON Analysis:\n";
    summary << "- Type: " << type << "\n";
    summary << "- Max depth: " << depth << "\n";
    if (parsed.is_array()) {
        summary << "- Array length: " << parsed.size() << "\n";
    } else if (keys > 0) {
        summary << "- Object keys: " << keys << "\n";
    }

    output.stdout_text = "JSON is valid!\n\nFormatted JSON:\n" + formatted + "\n\n" + summary.str();

    std::ostringstream html;
    html << "<div class=\"json-visualization\">"
         << "<h4>Valid JSON</h4>"
         << "<p>Type: " << type << " | Depth: " << depth;
    if (parsed.is_array()) {
        html << " | Length: " << parsed.size();
    } else {
        html << " | Keys: " << keys;
    }
    html << "</p>"
         << "<pre><code class=\"language-json\">" << escape_html(formatted) << "</code></pre>"
         << "</div>";
    output.artifacts.emplace_back("html", "text/html", html.str());

    output.metadata["type"] = type;
    output.metadata["size"] = text.size();
    output.metadata["formattedSize"] = formatted.size();
    output.metadata["depth"] = depth;
    output.metadata["keys"] = keys;
    if (parsed.is_array()) {
        output.metadata["arrayLength"] = parsed.size();
    }

    return output;
}

} // namespace liverun
