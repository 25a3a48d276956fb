#include "web_engine.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace liverun {

namespace {

const char* kContentSecurityPolicy =
    "<meta http-equiv=\"Content-Security-Policy\" content=\"default-src 'none'; "
    "script-src 'unsafe-inline'; style-src 'unsafe-inline'; img-src data:; font-src data:\">";

const std::set<std::string> kVoidElements = {
    "area", "base", "br", "col", "embed", "hr", "img", "input",
    "link", "meta", "param", "source", "track", "wbr", "!doctype"
};

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

const char* kHtmlPreviewHead =
    "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n"
    "<meta charset=\"UTF-8\">\n"
    "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n";

const char* kHtmlPreviewStyle =
    "<style>\n"
    "body { font-family: 'Segoe UI', Tahoma, Geneva, Verdana, sans-serif; margin: 20px;"
    " line-height: 1.6; background-color: #0f172a; color: #e2e8f0; }\n"
    "h1, h2, h3, h4, h5, h6 { color: #f1f5f9; margin-top: 0; }\n"
    "a { color: #60a5fa; }\n"
    "</style>\n";

const char* kCssPreviewBody =
    "<div class=\"container\">\n"
    "<h1>CSS Preview</h1>\n"
    "<p>This paragraph and the elements below pick up your styles.</p>\n"
    "<div class=\"box\">Box</div>\n"
    "<div class=\"card\"><h3>Card</h3><p>Card content</p></div>\n"
    "<button class=\"btn\">Button</button>\n"
    "<ul><li>First item</li><li>Second item</li></ul>\n"
    "<a href=\"#\">Link</a>\n"
    "</div>\n";

} // namespace

WebEngine::WebEngine(const std::string& language) : language_(language) {
    if (language_ != "html" && language_ != "css") {
        throw ConfigurationError("WebEngine does not serve language '" + language + "'");
    }
}

EngineInfo WebEngine::get_info() const {
    return EngineInfo(language_ == "html" ? "HTML Preview Engine" : "CSS Preview Engine",
                      "1.0.0", language_);
}

std::vector<std::string> WebEngine::find_unclosed_tags(const std::string& html) {
    std::vector<std::string> open;
    size_t pos = 0;

    while ((pos = html.find('<', pos)) != std::string::npos) {
        if (html.compare(pos, 4, "<!--") == 0) {
            size_t end = html.find("-->", pos + 4);
            if (end == std::string::npos) break;
            pos = end + 3;
            continue;
        }

        size_t end = html.find('>', pos);
        if (end == std::string::npos) break;
        std::string tag = html.substr(pos + 1, end - pos - 1);
        pos = end + 1;

        bool closing = !tag.empty() && tag[0] == '/';
        bool self_closing = !tag.empty() && tag.back() == '/';
        size_t name_start = closing ? 1 : 0;
        size_t name_end = tag.find_first_of(" \t\r\n/", name_start);
        std::string name = to_lower(tag.substr(name_start, name_end == std::string::npos
                                                               ? std::string::npos
                                                               : name_end - name_start));
        if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '!')) {
            continue;
        }

        if (closing) {
            auto it = std::find(open.rbegin(), open.rend(), name);
            if (it != open.rend()) {
                open.erase(std::next(it).base());
            }
            continue;
        }
        if (self_closing || kVoidElements.count(name) > 0) {
            continue;
        }
        open.push_back(name);

        // Raw text elements: skip to their end tag
        if (name == "script" || name == "style") {
            size_t close = to_lower(html).find("</" + name, pos);
            if (close == std::string::npos) break;
            pos = close;
        }
    }
    return open;
}

std::string WebEngine::check_css_balance(const std::string& css) {
    int depth = 0;
    size_t line = 1;
    char quote = 0;

    for (size_t i = 0; i < css.size(); ++i) {
        char c = css[i];
        if (c == '\n') ++line;

        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '/' && i + 1 < css.size() && css[i + 1] == '*') {
            size_t end = css.find("*/", i + 2);
            if (end == std::string::npos) {
                return "unterminated comment starting on line " + std::to_string(line);
            }
            line += static_cast<size_t>(std::count(css.begin() + i, css.begin() + end, '\n'));
            i = end + 1;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth < 0) {
                return "unexpected '}' on line " + std::to_string(line);
            }
        }
    }

    if (quote) {
        return "unterminated string";
    }
    if (depth > 0) {
        return std::to_string(depth) + " unclosed '{'";
    }
    return "";
}

std::string WebEngine::to_iframe(const std::string& document) {
    return "<iframe class=\"liverun-preview\" sandbox=\"allow-scripts\" "
           "referrerpolicy=\"no-referrer\" style=\"width: 100%; min-height: 300px; border: 0;\" "
           "srcdoc=\"" + escape_html(document) + "\"></iframe>";
}

std::vector<std::string> WebEngine::validate_syntax(const std::string& code) {
    std::vector<std::string> problems;
    if (language_ == "css") {
        std::string problem = check_css_balance(code);
        if (!problem.empty()) {
            problems.push_back("CSS Syntax Error: " + problem);
        }
    } else {
        for (const auto& tag : find_unclosed_tags(code)) {
            problems.push_back("Unclosed <" + tag + "> element");
        }
    }
    return problems;
}

EngineOutput WebEngine::render(const std::string& code, const ExecutionOptions& options) {
    (void)options;
    std::string text = trim(code);
    if (text.empty()) {
        EngineOutput output;
        output.stdout_text = language_ == "html" ? "No HTML content provided" : "No CSS content provided";
        return output;
    }
    return language_ == "html" ? render_html(text) : render_css(text);
}

EngineOutput WebEngine::render_html(const std::string& code) const {
    EngineOutput output;
    std::string lower = to_lower(code);
    bool complete = contains(lower, "<!doctype") || contains(lower, "<html");

    std::string document;
    if (complete) {
        // Inject the CSP right after <head> (or at the top if there is none)
        document = code;
        size_t head = lower.find("<head");
        size_t insert_at = head == std::string::npos ? std::string::npos : lower.find('>', head);
        if (insert_at != std::string::npos) {
            document.insert(insert_at + 1, kContentSecurityPolicy);
        } else {
            document = std::string(kContentSecurityPolicy) + document;
        }
    } else {
        std::ostringstream doc;
        doc << kHtmlPreviewHead << kContentSecurityPolicy << "\n"
            << "<title>HTML Live Preview</title>\n" << kHtmlPreviewStyle
            << "</head>\n<body>\n" << code << "\n</body>\n</html>\n";
        document = doc.str();
    }

    bool interactive = contains(lower, "<script") || contains(lower, "onclick") ||
                       contains(lower, "<button") || contains(lower, "<form") ||
                       contains(code, "addEventListener");

    std::vector<std::string> unclosed = find_unclosed_tags(code);

    output.stdout_text = "HTML rendered successfully";
    output.artifacts.emplace_back("html", "text/html", to_iframe(document));
    output.metadata["hasInteractivity"] = interactive;
    output.metadata["isCompleteDocument"] = complete;
    output.metadata["documentSize"] = document.size();
    if (!unclosed.empty()) {
        output.metadata["unclosedTags"] = unclosed;
    }
    return output;
}

EngineOutput WebEngine::render_css(const std::string& code) const {
    EngineOutput output;

    std::string problem = check_css_balance(code);
    if (!problem.empty()) {
        output.success = false;
        output.error = "CSS Syntax Error: " + problem;
        return output;
    }

    // A stray </style> would end the style element early
    std::string styles = code;
    for (size_t pos = 0; (pos = to_lower(styles).find("</style", pos)) != std::string::npos;) {
        styles.replace(pos, 2, "<\\/");
        pos += 3;
    }

    std::ostringstream doc;
    doc << kHtmlPreviewHead << kContentSecurityPolicy << "\n"
        << "<title>CSS Live Preview</title>\n" << kHtmlPreviewStyle
        << "<style>\n" << styles << "\n</style>\n"
        << "</head>\n<body>\n" << kCssPreviewBody << "</body>\n</html>\n";

    bool animations = contains(code, "@keyframes") || contains(code, "animation") ||
                      contains(code, "transition");
    bool flexbox = contains(code, "flex") || contains(code, "grid");
    bool media_queries = contains(code, "@media");
    bool custom_properties = contains(code, "--") || contains(code, "var(");

    output.stdout_text = "CSS applied successfully to preview elements";
    output.artifacts.emplace_back("html", "text/html", to_iframe(doc.str()));
    output.metadata["hasInteractivity"] = animations;
    output.metadata["hasAnimations"] = animations;
    output.metadata["hasFlexbox"] = flexbox;
    output.metadata["hasMediaQueries"] = media_queries;
    output.metadata["hasCustomProperties"] = custom_properties;
    output.metadata["cssFeatures"] = {
        {"animations", animations},
        {"flexbox", flexbox},
        {"mediaQueries", media_queries},
        {"customProperties", custom_properties}
    };
    return output;
}

} // namespace liverun
