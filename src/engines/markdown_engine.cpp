#include "markdown_engine.hpp"
#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

namespace liverun {

namespace {

const std::regex kHeading(R"(^(#{1,6})\s+(.*)$)");
const std::regex kHeadingMarker(R"(^#{1,6}\s)");
const std::regex kBullet(R"(^\s*[-*+]\s+(.*)$)");
const std::regex kOrdered(R"(^\s*\d+\.\s+(.*)$)");
const std::regex kQuote(R"(^>\s?(.*)$)");
const std::regex kImage(R"(!\[([^\]]*)\]\(([^)\s]+)\))");
const std::regex kLink(R"(\[([^\]]+)\]\(([^)\s]+)\))");
const std::regex kStrongStar(R"(\*\*(.+?)\*\*)");
const std::regex kStrongUnderscore(R"(__(.+?)__)");
const std::regex kEmStar(R"(\*([^*]+)\*)");
const std::regex kEmUnderscore(R"(\b_([^_]+)_\b)");

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    if (!text.empty() && text.back() == '\n') {
        lines.push_back("");
    }
    return lines;
}

bool is_fence(const std::string& line) {
    return LightEngine::trim(line).rfind("```", 0) == 0;
}

bool is_rule(const std::string& line) {
    std::string t = LightEngine::trim(line);
    return t == "---" || t == "***" || t == "___";
}

/// URLs are already HTML-escaped; refuse script schemes
std::string safe_url(const std::string& url) {
    std::string lower;
    for (char c : url) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower.rfind("javascript:", 0) == 0 || lower.rfind("vbscript:", 0) == 0) {
        return "#";
    }
    return url;
}

template <typename Fn>
std::string replace_each(const std::string& text, const std::regex& re, Fn fn) {
    std::string out;
    auto last = text.cbegin();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re);
         it != std::sregex_iterator(); ++it) {
        out.append(last, (*it)[0].first);
        out += fn(*it);
        last = (*it)[0].second;
    }
    out.append(last, text.cend());
    return out;
}

std::string format_span(const std::string& text) {
    std::string html = replace_each(text, kImage, [](const std::smatch& m) {
        return "<img src=\"" + safe_url(m.str(2)) + "\" alt=\"" + m.str(1) +
               "\" style=\"max-width: 100%; height: auto;\" />";
    });
    html = replace_each(html, kLink, [](const std::smatch& m) {
        return "<a href=\"" + safe_url(m.str(2)) + "\" target=\"_blank\" rel=\"noopener noreferrer\">" +
               m.str(1) + "</a>";
    });
    html = std::regex_replace(html, kStrongStar, "<strong>$1</strong>");
    html = std::regex_replace(html, kStrongUnderscore, "<strong>$1</strong>");
    html = std::regex_replace(html, kEmStar, "<em>$1</em>");
    html = std::regex_replace(html, kEmUnderscore, "<em>$1</em>");
    return html;
}

} // namespace

std::string MarkdownEngine::render_inline(const std::string& escaped) {
    // Code spans are opaque to the other inline rules
    std::string out;
    size_t pos = 0;
    while (pos < escaped.size()) {
        size_t open = escaped.find('`', pos);
        size_t close = open == std::string::npos ? std::string::npos : escaped.find('`', open + 1);
        if (close == std::string::npos) {
            out += format_span(escaped.substr(pos));
            break;
        }
        out += format_span(escaped.substr(pos, open - pos));
        out += "<code>" + escaped.substr(open + 1, close - open - 1) + "</code>";
        pos = close + 1;
    }
    return out;
}

std::string MarkdownEngine::to_html(const std::string& markdown) {
    std::ostringstream html;
    std::vector<std::string> paragraph;
    std::string list_tag;
    bool in_code = false;
    std::string code_language;
    std::ostringstream code;

    auto flush_paragraph = [&]() {
        if (paragraph.empty()) return;
        html << "<p>";
        for (size_t i = 0; i < paragraph.size(); ++i) {
            if (i > 0) html << "\n";
            html << render_inline(escape_html(paragraph[i]));
        }
        html << "</p>\n";
        paragraph.clear();
    };
    auto close_list = [&]() {
        if (list_tag.empty()) return;
        html << "</" << list_tag << ">\n";
        list_tag.clear();
    };
    auto open_list = [&](const std::string& tag) {
        if (list_tag == tag) return;
        close_list();
        html << "<" << tag << ">\n";
        list_tag = tag;
    };
    auto emit_code = [&]() {
        html << "<pre><code";
        if (!code_language.empty()) {
            html << " class=\"language-" << escape_html(code_language) << "\"";
        }
        html << ">" << escape_html(code.str()) << "</code></pre>\n";
        code.str("");
        code.clear();
    };

    for (const auto& line : split_lines(markdown)) {
        if (in_code) {
            if (is_fence(line)) {
                emit_code();
                in_code = false;
            } else {
                code << line << "\n";
            }
            continue;
        }

        std::smatch m;
        if (is_fence(line)) {
            flush_paragraph();
            close_list();
            in_code = true;
            code_language = trim(trim(line).substr(3));
        } else if (trim(line).empty()) {
            flush_paragraph();
            close_list();
        } else if (std::regex_match(line, m, kHeading)) {
            flush_paragraph();
            close_list();
            size_t level = m.str(1).size();
            html << "<h" << level << ">" << render_inline(escape_html(trim(m.str(2))))
                 << "</h" << level << ">\n";
        } else if (is_rule(line)) {
            flush_paragraph();
            close_list();
            html << "<hr>\n";
        } else if (std::regex_match(line, m, kQuote)) {
            flush_paragraph();
            close_list();
            html << "<blockquote>" << render_inline(escape_html(m.str(1))) << "</blockquote>\n";
        } else if (std::regex_match(line, m, kBullet)) {
            flush_paragraph();
            open_list("ul");
            html << "<li>" << render_inline(escape_html(m.str(1))) << "</li>\n";
        } else if (std::regex_match(line, m, kOrdered)) {
            flush_paragraph();
            open_list("ol");
            html << "<li>" << render_inline(escape_html(m.str(1))) << "</li>\n";
        } else {
            close_list();
            paragraph.push_back(line);
        }
    }

    if (in_code) {
        emit_code();
    }
    flush_paragraph();
    close_list();
    return html.str();
}

MarkdownStats MarkdownEngine::analyze(const std::string& markdown) {
    MarkdownStats stats;
    stats.characters = markdown.size();

    std::istringstream words(markdown);
    std::string word;
    while (words >> word) {
        ++stats.words;
    }

    bool in_code = false;
    std::vector<std::string> lines = split_lines(markdown);
    stats.lines = lines.size();
    for (const auto& line : lines) {
        if (is_fence(line)) {
            if (in_code) {
                ++stats.code_blocks;
            }
            in_code = !in_code;
            continue;
        }
        if (in_code) {
            continue;
        }
        if (std::regex_search(line, kHeadingMarker)) {
            ++stats.headings;
        }
        for (auto it = std::sregex_iterator(line.begin(), line.end(), kLink);
             it != std::sregex_iterator(); ++it) {
            auto start = (*it)[0].first;
            if (start != line.begin() && *(start - 1) == '!') {
                ++stats.images;
            } else {
                ++stats.links;
            }
        }
    }
    return stats;
}

EngineOutput MarkdownEngine::render(const std::string& code, const ExecutionOptions& options) {
    (void)options;
    EngineOutput output;
    std::string text = trim(code);

    if (text.empty()) {
        output.stdout_text = "No Markdown content provided";
        return output;
    }

    std::string body = to_html(text);
    MarkdownStats stats = analyze(text);

    std::ostringstream summary;
    summary << "Markdown Analysis:\n"
            << "- Lines: " << stats.lines << "\n"
            << "- Words: " << stats.words << "\n"
            << "- Characters: " << stats.characters << "\n"
            << "- Headings: " << stats.headings << "\n"
            << "- Links: " << stats.links << "\n"
            << "- Images: " << stats.images << "\n"
            << "- Code blocks: " << stats.code_blocks << "\n";
    output.stdout_text = "Markdown processed successfully!\n\n" + summary.str();

    std::ostringstream html;
    html << "<div class=\"markdown-visualization\">"
         << "<p>Lines: " << stats.lines << " | Words: " << stats.words
         << " | Headings: " << stats.headings << " | Links: " << stats.links
         << " | Images: " << stats.images << " | Code blocks: " << stats.code_blocks << "</p>"
         << "<div class=\"markdown-preview\">" << body << "</div>"
         << "</div>";
    output.artifacts.emplace_back("html", "text/html", html.str());

    output.metadata["lines"] = stats.lines;
    output.metadata["words"] = stats.words;
    output.metadata["characters"] = stats.characters;
    output.metadata["headings"] = stats.headings;
    output.metadata["links"] = stats.links;
    output.metadata["images"] = stats.images;
    output.metadata["codeBlocks"] = stats.code_blocks;

    return output;
}

} // namespace liverun
