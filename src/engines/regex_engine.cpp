#include "regex_engine.hpp"
#include <algorithm>
#include <set>
#include <sstream>

namespace liverun {

namespace {

const char* kSeparator = "|||";
const char* kFormatHelp =
    "Invalid format. Use: pattern|||testString|||flags (optional)\n"
    "Example: \\d+|||Hello 123 World|||g";

} // namespace

std::vector<std::string> RegexEngine::split_input(const std::string& input) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos;
    while ((pos = input.find(kSeparator, start)) != std::string::npos) {
        parts.push_back(input.substr(start, pos - start));
        start = pos + 3;
    }
    parts.push_back(input.substr(start));
    return parts;
}

std::string RegexEngine::classify_complexity(const std::string& pattern) {
    bool quantifiers = pattern.find_first_of("*+?{") != std::string::npos;
    bool groups = pattern.find_first_of("()") != std::string::npos;
    bool classes = pattern.find_first_of("[]\\") != std::string::npos;

    if (quantifiers && groups && classes) {
        return "Complex";
    }
    if (quantifiers || groups || classes) {
        return "Moderate";
    }
    return "Simple";
}

std::regex RegexEngine::compile(const std::string& pattern, const std::string& flags) {
    auto syntax = std::regex::ECMAScript;
    std::set<char> seen;

    for (char flag : flags) {
        if (!seen.insert(flag).second) {
            throw std::regex_error(std::regex_constants::error_badbrace);
        }
        switch (flag) {
            case 'g':
                break;
            case 'i':
                syntax |= std::regex::icase;
                break;
            default:
                throw std::invalid_argument(std::string("unsupported flag '") + flag + "'");
        }
    }

    return std::regex(pattern, syntax);
}

std::vector<RegexMatch> RegexEngine::find_matches(const std::regex& re, const std::string& text, bool global) {
    std::vector<RegexMatch> matches;

    auto to_match = [](const std::smatch& m) {
        RegexMatch match;
        match.text = m.str(0);
        match.position = static_cast<size_t>(m.position(0));
        for (size_t i = 1; i < m.size(); ++i) {
            match.groups.push_back(m[i].matched ? m.str(i) : "");
        }
        return match;
    };

    if (global) {
        // sregex_iterator steps past zero-length matches on its own
        for (auto it = std::sregex_iterator(text.begin(), text.end(), re);
             it != std::sregex_iterator(); ++it) {
            matches.push_back(to_match(*it));
        }
    } else {
        std::smatch m;
        if (std::regex_search(text, m, re)) {
            matches.push_back(to_match(m));
        }
    }

    return matches;
}

std::string RegexEngine::highlight(const std::string& text, const std::vector<RegexMatch>& matches) {
    std::ostringstream html;
    size_t cursor = 0;
    size_t number = 0;

    for (const auto& match : matches) {
        if (match.position < cursor) {
            continue;
        }
        ++number;
        html << escape_html(text.substr(cursor, match.position - cursor));
        html << "<span class=\"regex-match\" data-match=\"" << number << "\">"
             << escape_html(match.text) << "</span>";
        cursor = match.position + match.text.size();
    }
    html << escape_html(text.substr(std::min(cursor, text.size())));
    return html.str();
}

std::vector<std::string> RegexEngine::validate_syntax(const std::string& code) {
    std::string input = trim(code);
    if (input.empty()) {
        return {};
    }

    auto parts = split_input(input);
    if (parts.size() < 2) {
        return {kFormatHelp};
    }

    try {
        compile(parts[0], parts.size() > 2 ? parts[2] : "");
    } catch (const std::regex_error& e) {
        return {std::string("Invalid regex pattern: ") + e.what()};
    } catch (const std::invalid_argument& e) {
        return {std::string("Invalid regex flags: ") + e.what()};
    }
    return {};
}

EngineOutput RegexEngine::render(const std::string& code, const ExecutionOptions& options) {
    (void)options;
    EngineOutput output;
    std::string input = trim(code);

    if (input.empty()) {
        output.stdout_text = "No regex pattern provided";
        return output;
    }

    auto parts = split_input(input);
    if (parts.size() < 2) {
        output.success = false;
        output.error = kFormatHelp;
        return output;
    }

    const std::string& pattern = parts[0];
    const std::string& test_string = parts[1];
    std::string flags = parts.size() > 2 ? parts[2] : "";

    std::regex re;
    try {
        re = compile(pattern, flags);
    } catch (const std::regex_error& e) {
        output.success = false;
        output.error = std::string("Invalid regex pattern: ") + e.what();
        return output;
    } catch (const std::invalid_argument& e) {
        output.success = false;
        output.error = std::string("Invalid regex flags: ") + e.what();
        return output;
    }

    std::vector<RegexMatch> matches;
    try {
        matches = find_matches(re, test_string, flags.find('g') != std::string::npos);
    } catch (const std::regex_error& e) {
        // error_complexity / error_stack on pathological backtracking
        output.success = false;
        output.error = std::string("Regex evaluation failed: ") + e.what();
        return output;
    }

    bool has_groups = std::any_of(matches.begin(), matches.end(),
                                  [](const RegexMatch& m) { return !m.groups.empty(); });
    std::string complexity = classify_complexity(pattern);

    std::ostringstream out;
    out << "Regex Test Results:\n";
    out << "Pattern: " << pattern << "\n";
    out << "Flags: " << (flags.empty() ? "none" : flags) << "\n";
    out << "Test String: " << test_string << "\n";
    out << "Matches Found: " << matches.size() << "\n\n";

    if (!matches.empty()) {
        out << "Matches:\n";
        for (size_t i = 0; i < matches.size(); ++i) {
            out << (i + 1) << ". \"" << matches[i].text << "\" at position " << matches[i].position;
            if (!matches[i].groups.empty()) {
                out << " (groups: ";
                for (size_t g = 0; g < matches[i].groups.size(); ++g) {
                    if (g > 0) out << ", ";
                    out << matches[i].groups[g];
                }
                out << ")";
            }
            out << "\n";
        }
    } else {
        out << "No matches found.\n";
    }
    output.stdout_text = out.str();

    std::ostringstream html;
    html << "<div class=\"regex-visualization\">"
         << "<p>Pattern: <code>" << escape_html(pattern) << "</code> | Flags: <code>"
         << (flags.empty() ? "none" : escape_html(flags)) << "</code> | Matches: " << matches.size()
         << " | Complexity: " << complexity << "</p>"
         << "<div class=\"regex-test-string\">" << highlight(test_string, matches) << "</div>"
         << "</div>";
    output.artifacts.emplace_back("html", "text/html", html.str());

    output.metadata["pattern"] = pattern;
    output.metadata["flags"] = flags;
    output.metadata["matchCount"] = matches.size();
    output.metadata["testStringLength"] = test_string.size();
    output.metadata["hasGroups"] = has_groups;
    output.metadata["complexity"] = complexity;

    return output;
}

} // namespace liverun
