/**
 * @file security_policy.cpp
 * @brief Implementation of SecurityPolicy and CodeAnalyzer
 */

#include "security_policy.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace liverun {

namespace {

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r");
    return value.substr(start, end - start + 1);
}

// Strip a trailing "# comment" that is not inside a quoted string
std::string strip_python_comment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::vector<std::string> split(const std::string& value, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string part;
    while (std::getline(ss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

const std::vector<std::string>& introspection_attributes() {
    static const std::vector<std::string> attributes = {
        "__subclasses__", "__globals__", "__builtins__", "__code__",
        "__closure__", "__loader__", "__import__"
    };
    return attributes;
}

// Frame and bound-method attributes, matched only as ".name" to avoid hitting identifiers
const std::vector<std::string>& frame_attributes() {
    static const std::vector<std::string> attributes = {
        "__self__", "f_back", "f_globals", "f_locals", "f_builtins",
        "tb_frame", "gi_frame", "cr_frame", "_getframe"
    };
    return attributes;
}

} // namespace

// ============================================================================
// SecurityPolicy
// ============================================================================

SecurityPolicy::SecurityPolicy(
    std::set<std::string> blocked_modules,
    std::set<std::string> blocked_builtins,
    std::set<std::string> blocked_sql_statements
)
    : blocked_modules_(std::move(blocked_modules)),
      blocked_builtins_(std::move(blocked_builtins)) {
    for (const auto& keyword : blocked_sql_statements) {
        blocked_sql_statements_.insert(to_upper(keyword));
    }
}

SecurityPolicy SecurityPolicy::defaults() {
    return SecurityPolicy(
        {
            // process and interpreter internals
            "os", "sys", "subprocess", "signal", "ctypes", "multiprocessing", "pty",
            "resource", "importlib", "builtins", "__builtin__", "__builtins__",
            // networking
            "socket", "ssl", "urllib", "requests", "http", "ftplib", "smtplib",
            "telnetlib", "webbrowser", "asyncio",
            // filesystem and raw I/O
            "io", "pathlib", "tempfile", "shutil", "glob", "fileinput",
            // code serialization
            "pickle", "marshal", "shelve"
        },
        {"eval", "exec", "compile", "open", "input", "__import__", "breakpoint"},
        {"ATTACH", "DETACH", "PRAGMA", "VACUUM", "LOAD_EXTENSION"}
    );
}

bool SecurityPolicy::is_module_blocked(const std::string& module_name) const {
    if (blocked_modules_.count(module_name) > 0) {
        return true;
    }
    size_t dot = module_name.find('.');
    if (dot != std::string::npos) {
        return blocked_modules_.count(module_name.substr(0, dot)) > 0;
    }
    return false;
}

bool SecurityPolicy::is_builtin_blocked(const std::string& name) const {
    return blocked_builtins_.count(name) > 0;
}

bool SecurityPolicy::is_sql_statement_blocked(const std::string& keyword) const {
    return blocked_sql_statements_.count(to_upper(keyword)) > 0;
}

nlohmann::json SecurityPolicy::to_json() const {
    nlohmann::json j;
    j["blocked_modules"] = blocked_modules_;
    j["blocked_builtins"] = blocked_builtins_;
    j["blocked_sql_statements"] = blocked_sql_statements_;
    return j;
}

std::string SecurityPolicy::module_violation(const std::string& module_name) {
    return "Module '" + module_name + "' is not allowed for security reasons";
}

std::string SecurityPolicy::function_violation(const std::string& function_name) {
    return "Function '" + function_name + "' is not allowed for security reasons";
}

std::string SecurityPolicy::statement_violation(const std::string& keyword) {
    return "Statement '" + to_upper(keyword) + "' is not allowed for security reasons";
}

std::string SecurityPolicy::attribute_violation(const std::string& attribute) {
    return "Access to '" + attribute + "' is not allowed for security reasons";
}

// ============================================================================
// CodeAnalyzer
// ============================================================================

CodeAnalyzer::CodeAnalyzer(const SecurityPolicy& policy)
    : policy_(policy) {}

std::vector<SecurityFinding> CodeAnalyzer::analyze(
    const std::string& code,
    const std::string& language
) const {
    std::vector<SecurityFinding> findings;
    if (language == "python") {
        analyze_python(code, findings);
    } else if (language == "sql") {
        analyze_sql(code, findings);
    }
    return findings;
}

void CodeAnalyzer::analyze_python(
    const std::string& code,
    std::vector<SecurityFinding>& findings
) const {
    static const std::regex import_re(R"(^import\s+(.+)$)");
    static const std::regex from_re(R"(^from\s+([\w\.]+)\s+import\b.*$)");

    std::istringstream stream(code);
    std::string raw_line;
    size_t line_no = 0;

    while (std::getline(stream, raw_line)) {
        ++line_no;
        std::string line = strip_python_comment(raw_line);

        for (const auto& attribute : introspection_attributes()) {
            if (line.find(attribute) != std::string::npos) {
                findings.emplace_back("introspection_escape", attribute,
                                      SecurityPolicy::attribute_violation(attribute), line_no);
            }
        }
        for (const auto& attribute : frame_attributes()) {
            if (line.find("." + attribute) != std::string::npos) {
                findings.emplace_back("introspection_escape", attribute,
                                      SecurityPolicy::attribute_violation(attribute), line_no);
            }
        }

        // "import a; import b" puts several statements on one line
        for (const auto& raw_statement : split(line, ';')) {
            std::string statement = trim(raw_statement);
            std::smatch match;

            if (std::regex_match(statement, match, import_re)) {
                for (const auto& clause : split(match[1].str(), ',')) {
                    std::string name = trim(clause);
                    size_t space = name.find_first_of(" \t");
                    if (space != std::string::npos) {
                        name = name.substr(0, space);  // drop "as alias"
                    }
                    if (!name.empty() && policy_.is_module_blocked(name)) {
                        findings.emplace_back("blocked_import", name,
                                              SecurityPolicy::module_violation(name), line_no);
                    }
                }
            } else if (std::regex_match(statement, match, from_re)) {
                std::string name = match[1].str();
                if (!name.empty() && name[0] != '.' && policy_.is_module_blocked(name)) {
                    findings.emplace_back("blocked_import", name,
                                          SecurityPolicy::module_violation(name), line_no);
                }
            }
        }
    }
}

void CodeAnalyzer::analyze_sql(
    const std::string& code,
    std::vector<SecurityFinding>& findings
) const {
    static const std::regex word_re(R"([A-Za-z_]+)");

    std::istringstream stream(code);
    std::string raw_line;
    size_t line_no = 0;
    bool in_string = false;

    while (std::getline(stream, raw_line)) {
        ++line_no;

        // Blank out string literals and "--" comments so only keywords remain
        std::string line;
        for (size_t i = 0; i < raw_line.size(); ++i) {
            char c = raw_line[i];
            if (in_string) {
                if (c == '\'') {
                    in_string = false;
                }
                line += ' ';
            } else if (c == '\'') {
                in_string = true;
                line += ' ';
            } else if (c == '-' && i + 1 < raw_line.size() && raw_line[i + 1] == '-') {
                break;
            } else {
                line += c;
            }
        }

        for (auto it = std::sregex_iterator(line.begin(), line.end(), word_re);
             it != std::sregex_iterator(); ++it) {
            std::string word = it->str();
            if (policy_.is_sql_statement_blocked(word)) {
                findings.emplace_back("blocked_statement", to_upper(word),
                                      SecurityPolicy::statement_violation(word), line_no);
            }
        }
    }
}

} // namespace liverun
