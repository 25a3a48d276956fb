#include "yaml_engine.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace liverun {

namespace {

const std::string kCoreTagPrefix = "tag:yaml.org,2002:";

std::string type_name(const json& value) {
    if (value.is_array()) return "array";
    if (value.is_object()) return "object";
    if (value.is_string()) return "string";
    if (value.is_boolean()) return "boolean";
    if (value.is_number()) return "number";
    return "null";
}

bool parse_integer(const std::string& text, int base, json& out) {
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, base);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') {
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

// Plain scalars are read the way the YAML 1.2 core schema reads them
json resolve_plain(const std::string& text) {
    static const std::regex decimal(R"(^[-+]?[0-9]+$)");
    static const std::regex hexadecimal(R"(^0x[0-9a-fA-F]+$)");
    static const std::regex octal(R"(^0o[0-7]+$)");
    static const std::regex floating(R"(^[-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?$)");

    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return nullptr;
    }
    if (text == "true" || text == "True" || text == "TRUE") {
        return true;
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return false;
    }

    json number;
    if (std::regex_match(text, decimal) && parse_integer(text, 10, number)) {
        return number;
    }
    if (std::regex_match(text, hexadecimal) && parse_integer(text.substr(2), 16, number)) {
        return number;
    }
    if (std::regex_match(text, octal) && parse_integer(text.substr(2), 8, number)) {
        return number;
    }
    if (std::regex_match(text, floating)) {
        return std::strtod(text.c_str(), nullptr);
    }
    // .inf and .nan have no JSON form and stay strings
    return text;
}

json convert_scalar(const YAML::Node& node) {
    const std::string& tag = node.Tag();
    if (tag == "?") {
        return resolve_plain(node.Scalar());
    }
    if (tag == kCoreTagPrefix + "int" || tag == kCoreTagPrefix + "float" ||
        tag == kCoreTagPrefix + "bool" || tag == kCoreTagPrefix + "null") {
        return resolve_plain(node.Scalar());
    }
    // Quoted, !!str and application tags
    return node.Scalar();
}

std::string convert_key(const YAML::Node& key) {
    switch (key.Type()) {
        case YAML::NodeType::Scalar:
            return key.Scalar();
        case YAML::NodeType::Sequence:
        case YAML::NodeType::Map:
            return YAML::Dump(key);
        default:
            return "null";
    }
}

json convert(const YAML::Node& node, size_t& converted) {
    if (++converted > YamlEngine::MAX_NODES) {
        throw std::runtime_error("YAML document expands to more than " +
                                 std::to_string(YamlEngine::MAX_NODES) + " nodes");
    }

    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return convert_scalar(node);
        case YAML::NodeType::Sequence: {
            json array = json::array();
            for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
                array.push_back(convert(*it, converted));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            json object = json::object();
            for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
                object[convert_key(it->first)] = convert(it->second, converted);
            }
            return object;
        }
        default:
            return nullptr;
    }
}

bool has_comments(const std::string& text) {
    bool quoted_single = false;
    bool quoted_double = false;
    char previous = '\n';
    for (char c : text) {
        if (c == '\n') {
            quoted_single = quoted_double = false;
        } else if (c == '\'' && !quoted_double) {
            quoted_single = !quoted_single;
        } else if (c == '"' && !quoted_single) {
            quoted_double = !quoted_double;
        } else if (c == '#' && !quoted_single && !quoted_double &&
                   (previous == '\n' || previous == ' ' || previous == '\t')) {
            return true;
        }
        previous = c;
    }
    return false;
}

bool has_arrays(const json& value) {
    if (value.is_array()) {
        return true;
    }
    if (value.is_object()) {
        for (const auto& child : value) {
            if (has_arrays(child)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

json YamlEngine::to_json(const std::string& text, size_t& documents) {
    std::vector<YAML::Node> nodes;
    try {
        nodes = YAML::LoadAll(text);
    } catch (const YAML::Exception& e) {
        std::ostringstream oss;
        oss << "YAML Syntax Error";
        if (!e.mark.is_null()) {
            oss << " at line " << e.mark.line + 1 << ", column " << e.mark.column + 1;
        }
        oss << ": " << e.msg;
        throw std::runtime_error(oss.str());
    }

    documents = nodes.size();
    size_t converted = 0;
    if (nodes.size() == 1) {
        return convert(nodes[0], converted);
    }
    if (nodes.empty()) {
        return nullptr;
    }
    json stream = json::array();
    for (const auto& node : nodes) {
        stream.push_back(convert(node, converted));
    }
    return stream;
}

size_t YamlEngine::count_keys(const json& value) {
    size_t count = 0;
    if (value.is_object()) {
        count += value.size();
    }
    if (value.is_structured()) {
        for (const auto& child : value) {
            count += count_keys(child);
        }
    }
    return count;
}

std::vector<std::string> YamlEngine::validate_syntax(const std::string& code) {
    std::string text = trim(code);
    if (text.empty()) {
        return {};
    }
    try {
        size_t documents = 0;
        (void)to_json(text, documents);
    } catch (const std::runtime_error& e) {
        return {e.what()};
    }
    return {};
}

EngineOutput YamlEngine::render(const std::string& code, const ExecutionOptions& options) {
    (void)options;
    EngineOutput output;
    std::string text = trim(code);

    if (text.empty()) {
        output.stdout_text = "No YAML content provided";
        return output;
    }

    json parsed;
    size_t documents = 0;
    try {
        parsed = to_json(text, documents);
    } catch (const std::runtime_error& e) {
        output.success = false;
        output.error = e.what();
        return output;
    }

    std::string equivalent = parsed.dump(2, ' ', false, json::error_handler_t::replace);
    std::string type = documents > 1 ? "stream" : type_name(parsed);
    size_t lines = static_cast<size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
    size_t keys = count_keys(parsed);
    bool comments = has_comments(text);
    bool arrays = false;
    if (documents > 1) {
        for (const auto& document : parsed) {
            arrays = arrays || has_arrays(document);
        }
    } else {
        arrays = has_arrays(parsed);
    }

    std::ostringstream summary;
    summary << "YAML Analysis:\n";
    summary << "- Lines: " << lines << "\n";
    summary << "- Type: " << type << "\n";
    if (documents > 1) {
        summary << "- Documents: " << documents << "\n";
    }
    summary << "- Keys: " << keys << "\n";
    summary << "- Has comments: " << (comments ? "Yes" : "No") << "\n";
    summary << "- Has arrays: " << (arrays ? "Yes" : "No") << "\n";

    output.stdout_text = "YAML is valid!\n\nJSON equivalent:\n" + equivalent + "\n\n" + summary.str();

    std::ostringstream html;
    html << "<div class=\"yaml-visualization\">"
         << "<h4>Valid YAML</h4>"
         << "<p>Lines: " << lines << " | Keys: " << keys
         << " | Comments: " << (comments ? "Yes" : "No")
         << " | Arrays: " << (arrays ? "Yes" : "No") << "</p>"
         << "<h5>Original YAML</h5>"
         << "<pre><code class=\"language-yaml\">" << escape_html(text) << "</code></pre>"
         << "<h5>JSON Equivalent</h5>"
         << "<pre><code class=\"language-json\">" << escape_html(equivalent) << "</code></pre>"
         << "</div>";
    output.artifacts.emplace_back("html", "text/html", html.str());

    output.metadata["lines"] = lines;
    output.metadata["keys"] = keys;
    output.metadata["type"] = type;
    output.metadata["documents"] = documents;
    output.metadata["hasComments"] = comments;
    output.metadata["hasArrays"] = arrays;

    return output;
}

} // namespace liverun
