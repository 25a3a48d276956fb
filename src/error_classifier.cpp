/**
 * @file error_classifier.cpp
 * @brief Implementation of ErrorClassifier
 */

#include "error_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace liverun {

using json = nlohmann::json;

namespace {

using Type = ErrorSuggestion::Type;

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string rtrim(const std::string& line) {
    size_t end = line.find_last_not_of(" \t\r");
    return end == std::string::npos ? "" : line.substr(0, end + 1);
}

std::string trim(const std::string& line) {
    size_t start = line.find_first_not_of(" \t\r");
    return start == std::string::npos ? "" : rtrim(line.substr(start));
}

void sort_by_priority(std::vector<ErrorSuggestion>& suggestions) {
    std::stable_sort(suggestions.begin(), suggestions.end(),
                     [](const ErrorSuggestion& a, const ErrorSuggestion& b) {
                         return a.priority > b.priority;
                     });
}

// "NameError: message" or a bare "KeyboardInterrupt"-style token on its own line
const std::regex kTypeLine(R"(^\s*(?:[A-Za-z_][A-Za-z0-9_]*\.)*([A-Za-z_][A-Za-z0-9_]*(?:Error|Exception|Warning))(?::\s*(.*))?$)");
const std::regex kTypeAnywhere(R"(\b([A-Za-z_][A-Za-z0-9_]*(?:Error|Exception|Warning))\b)");

} // anonymous namespace

json to_json(const RetryStrategy& strategy) {
    return json{
        {"shouldRetry", strategy.should_retry},
        {"maxRetries", strategy.max_retries},
        {"delay", strategy.delay_ms},
        {"backoffMultiplier", strategy.backoff_multiplier}
    };
}

json to_json(const ErrorAnalytics& analytics) {
    return json{
        {"totalErrors", analytics.total_errors},
        {"errorsByCategory", analytics.errors_by_category},
        {"errorsByType", analytics.errors_by_type},
        {"errorsByLanguage", analytics.errors_by_language},
        {"errorsBySeverity", analytics.errors_by_severity},
        {"retryableErrors", analytics.retryable_errors},
        {"averageSuggestions", analytics.average_suggestions}
    };
}

ErrorClassifier::ErrorClassifier() {
    initialize_patterns();
    initialize_solutions();
}

void ErrorClassifier::initialize_patterns() {
    const auto icase = std::regex::ECMAScript | std::regex::icase;

    language_patterns_["python"] = {
        std::regex(R"(NameError: name '.*' is not defined)", icase),
        std::regex(R"(TypeError: .* takes .* positional argument.* but .* (was|were) given)", icase),
        std::regex(R"(IndentationError: expected an indented block)", icase),
        std::regex(R"(AttributeError: .* object has no attribute .*)", icase),
        std::regex(R"(IndexError: list index out of range)", icase),
        std::regex(R"(KeyError: .*)", icase),
        std::regex(R"(ValueError: .*)", icase),
        std::regex(R"(ZeroDivisionError: .*)", icase),
        std::regex(R"((ImportError|ModuleNotFoundError): No module named .*)", icase),
        std::regex(R"(RecursionError: maximum recursion depth exceeded)", icase)
    };

    language_patterns_["sql"] = {
        std::regex(R"(no such table: .*)", icase),
        std::regex(R"(no such column: .*)", icase),
        std::regex(R"(ambiguous column name: .*)", icase),
        std::regex(R"(table .* already exists)", icase),
        std::regex(R"(NOT NULL constraint failed: .*)", icase),
        std::regex(R"(UNIQUE constraint failed: .*)", icase)
    };

    language_patterns_["json"] = {
        std::regex(R"(JSON Syntax Error)", icase)
    };

    language_patterns_["yaml"] = {
        std::regex(R"(YAML Syntax Error)", icase)
    };

    language_patterns_["regex"] = {
        std::regex(R"(Invalid regex (pattern|flags))", icase),
        std::regex(R"(Invalid format\. Use: pattern)", icase)
    };

    language_patterns_["css"] = {
        std::regex(R"(CSS Syntax Error)", icase)
    };
}

void ErrorClassifier::initialize_solutions() {
    const auto icase = std::regex::ECMAScript | std::regex::icase;

    solutions_.push_back({std::regex("not allowed for security reasons", icase), {
        ErrorSuggestion(Type::ALTERNATIVE, "Use allowed operations",
            "File, network, process and dynamic-evaluation features are disabled in the playground. "
            "Work with data defined in your code instead.", 9),
        ErrorSuggestion(Type::EXAMPLE, "Inline your data",
            "Build the data you need directly in the program", 7,
            std::string("rows = [(\"Ada\", 36), (\"Alan\", 41)]\nfor name, age in rows:\n    print(name, age)"))
    }});

    solutions_.push_back({std::regex("timed out after", icase), {
        ErrorSuggestion(Type::FIX, "Look for infinite loops",
            "Make sure every loop has a condition that eventually becomes false", 9,
            std::string("count = 0\nwhile count < 10:\n    count += 1\nprint(count)")),
        ErrorSuggestion(Type::FIX, "Reduce the amount of work",
            "Process a smaller input or use a more efficient algorithm", 8)
    }});

    solutions_.push_back({std::regex(R"(NameError: name .* is not defined)", icase), {
        ErrorSuggestion(Type::FIX, "Define the variable",
            "Make sure to define the variable before using it. Variables do not carry over between runs.", 9,
            std::string("variable_name = \"value\"\nprint(variable_name)")),
        ErrorSuggestion(Type::FIX, "Check spelling",
            "Verify the name is spelled exactly as it was defined, including case", 8),
        ErrorSuggestion(Type::FIX, "Import the module",
            "If using a function from a module, import it first", 7,
            std::string("import math\nprint(math.sqrt(16))"))
    }});

    solutions_.push_back({std::regex(R"(IndentationError)", icase), {
        ErrorSuggestion(Type::FIX, "Add indentation",
            "Python requires indented blocks after colons (:)", 10,
            std::string("condition = True\nif condition:\n    print(\"Hello\")")),
        ErrorSuggestion(Type::FIX, "Use consistent indentation",
            "Use either spaces or tabs consistently (4 spaces recommended)", 9)
    }});

    solutions_.push_back({std::regex(R"((ModuleNotFoundError|ImportError): No module named)", icase), {
        ErrorSuggestion(Type::FIX, "Use an available package",
            "Only preinstalled packages can be imported; nothing is downloaded", 9),
        ErrorSuggestion(Type::DOCUMENTATION, "Python standard library",
            "Check whether the standard library already covers what you need", 6,
            std::nullopt, std::string("https://docs.python.org/3/library/"))
    }});

    solutions_.push_back({std::regex(R"(ZeroDivisionError)", icase), {
        ErrorSuggestion(Type::FIX, "Check the divisor",
            "Guard divisions against a zero divisor", 9,
            std::string("divisor = 0\nresult = 10 / divisor if divisor != 0 else None\nprint(result)"))
    }});

    solutions_.push_back({std::regex(R"(IndexError: list index out of range)", icase), {
        ErrorSuggestion(Type::FIX, "Check the list length",
            "Valid indexes run from 0 to len(items) - 1", 9,
            std::string("items = [1, 2, 3]\nif len(items) > 3:\n    print(items[3])\nelse:\n    print(\"Index 3 is out of range\")"))
    }});

    solutions_.push_back({std::regex(R"(KeyError)", icase), {
        ErrorSuggestion(Type::FIX, "Use dict.get with a default",
            "Look up keys that may be missing with get()", 9,
            std::string("data = {\"a\": 1}\nprint(data.get(\"b\", 0))"))
    }});

    solutions_.push_back({std::regex(R"(AttributeError)", icase), {
        ErrorSuggestion(Type::FIX, "Check available attributes",
            "List what the object actually provides", 8,
            std::string("value = \"text\"\nprint([name for name in dir(value) if not name.startswith(\"_\")])"))
    }});

    solutions_.push_back({std::regex(R"(SyntaxError)", icase), {
        ErrorSuggestion(Type::FIX, "Check brackets and quotes",
            "Every opening bracket or quote needs a matching closing one", 9),
        ErrorSuggestion(Type::FIX, "Check the line above",
            "Python often reports a syntax error one line after the actual mistake", 8)
    }});

    solutions_.push_back({std::regex(R"(no such table)", icase), {
        ErrorSuggestion(Type::FIX, "Create the table first",
            "Make sure to create the table before querying it", 9,
            std::string("CREATE TABLE table_name (\n  id INTEGER PRIMARY KEY,\n  name TEXT\n);\nSELECT * FROM table_name;")),
        ErrorSuggestion(Type::FIX, "Check table name spelling",
            "Verify the table name is spelled correctly", 8),
        ErrorSuggestion(Type::EXAMPLE, "View available tables",
            "See what tables are available in the database", 7,
            std::string("SELECT name FROM sqlite_master WHERE type = 'table';"))
    }});

    solutions_.push_back({std::regex(R"(no such column)", icase), {
        ErrorSuggestion(Type::FIX, "Check column names",
            "Select only columns that the table defines", 9,
            std::string("CREATE TABLE users (id INTEGER, name TEXT);\nSELECT id, name FROM users;"))
    }});

    solutions_.push_back({std::regex(R"(UNIQUE constraint failed)", icase), {
        ErrorSuggestion(Type::ALTERNATIVE, "Skip duplicates",
            "Use INSERT OR IGNORE when a row may already exist", 8,
            std::string("CREATE TABLE tags (name TEXT UNIQUE);\nINSERT OR IGNORE INTO tags VALUES ('sql');\nINSERT OR IGNORE INTO tags VALUES ('sql');"))
    }});

    solutions_.push_back({std::regex(R"(JSON Syntax Error)", icase), {
        ErrorSuggestion(Type::FIX, "Check quotes and commas",
            "Keys and strings need double quotes; items are separated by commas", 9,
            std::string("{\n  \"name\": \"Ada\",\n  \"tags\": [\"math\", \"code\"]\n}")),
        ErrorSuggestion(Type::FIX, "Remove trailing commas",
            "JSON does not allow a comma after the last item", 8)
    }});

    solutions_.push_back({std::regex(R"(YAML Syntax Error)", icase), {
        ErrorSuggestion(Type::FIX, "Check the indentation",
            "Nested items need consistent indentation with spaces, never tabs", 9,
            std::string("server:\n  host: localhost\n  ports:\n    - 8080\n    - 8443")),
        ErrorSuggestion(Type::FIX, "Quote special values",
            "Values containing ': ' or starting with '{', '[' or '*' need quotes", 7,
            std::string("title: \"Note: read me\""))
    }});

    solutions_.push_back({std::regex(R"(Invalid format\. Use: pattern)", icase), {
        ErrorSuggestion(Type::EXAMPLE, "Regex input format",
            "Separate the pattern, test string and flags with |||", 9,
            std::string("hello|||Hello world, hello regex|||gi"))
    }});

    solutions_.push_back({std::regex(R"(Invalid regex)", icase), {
        ErrorSuggestion(Type::FIX, "Escape special characters",
            "Characters such as . * + ? ( ) [ ] need a backslash to match literally", 9,
            std::string("\\d+\\.\\d+|||Pi is 3.14|||g")),
        ErrorSuggestion(Type::FIX, "Use supported flags",
            "Only the g and i flags are supported", 8)
    }});

    solutions_.push_back({std::regex(R"(CSS Syntax Error)", icase), {
        ErrorSuggestion(Type::FIX, "Balance braces",
            "Every rule needs an opening and a closing brace", 9,
            std::string("p {\n  color: red;\n}"))
    }});

    // Also matches every engine "... Syntax Error" message; must stay last
    solutions_.push_back({std::regex(R"(syntax error|incomplete input|unrecognized token)", icase), {
        ErrorSuggestion(Type::FIX, "Check SQL syntax",
            "Review your SQL syntax for typos or missing keywords", 9),
        ErrorSuggestion(Type::FIX, "Add missing semicolon",
            "Make sure to end SQL statements with a semicolon", 8,
            std::string("SELECT 1;")),
        ErrorSuggestion(Type::DOCUMENTATION, "SQL Reference",
            "Check SQL syntax documentation", 6,
            std::nullopt, std::string("https://www.sqlite.org/lang.html"))
    }});
}

// ============================================================================
// Classification
// ============================================================================

std::string ErrorClassifier::categorize(const std::string& raw_error, const std::string& language) const {
    const std::string message = to_lower(raw_error);

    if (message.find("validation error") != std::string::npos) {
        return "validation";
    }
    if (contains_any(message, {"security", "violation", "malicious", "blocked", "not allowed"})) {
        return "security";
    }
    if (contains_any(message, {"network", "fetch", "connection", "socket", "cors"})) {
        return "network";
    }
    if (contains_any(message, {"timeout", "timed out"})) {
        return "timeout";
    }
    if (contains_any(message, {"memory", "heap", "stack overflow"})) {
        return "memory";
    }
    if (contains_any(message, {"syntax", "unexpected token", "indentationerror", "incomplete input",
                               "unrecognized token", "unexpected eof"})) {
        return "syntax";
    }
    if (contains_any(message, {"reference", "type", "not defined", "not a function"})) {
        return "runtime";
    }

    auto patterns = language_patterns_.find(language);
    if (patterns != language_patterns_.end()) {
        for (const auto& pattern : patterns->second) {
            if (std::regex_search(raw_error, pattern)) {
                return "language_specific";
            }
        }
    }

    return "unknown";
}

Severity ErrorClassifier::determine_severity(const std::string& raw_error, const std::string& error_type) {
    const std::string message = to_lower(raw_error);

    if (error_type.size() > 7 && error_type.compare(error_type.size() - 7, 7, "Warning") == 0) {
        return Severity::LOW;
    }
    if (contains_any(message, {"security", "malicious", "violation", "not allowed", "critical"})) {
        return Severity::CRITICAL;
    }
    if (contains_any(message, {"memory", "stack overflow", "recursion", "crash", "engine load failed"})) {
        return Severity::HIGH;
    }
    if (contains_any(message, {"timeout", "timed out", "network", "reference", "type"})) {
        return Severity::MEDIUM;
    }
    return Severity::LOW;
}

ProcessedError ErrorClassifier::classify(const std::string& raw_error, const ErrorContext& context) const {
    ProcessedError report;

    std::vector<std::string> lines;
    {
        std::istringstream stream(raw_error);
        std::string line;
        while (std::getline(stream, line)) {
            if (!trim(line).empty()) {
                lines.push_back(rtrim(line));
            }
        }
    }

    // Error type: first line shaped like "<Word>Error: message"
    size_t message_line = lines.size();
    for (size_t i = 0; i < lines.size(); ++i) {
        std::smatch match;
        if (std::regex_match(lines[i], match, kTypeLine)) {
            report.error_type = match[1].str();
            report.message = trim(match[2].str());
            if (report.message.empty()) {
                report.message = trim(lines[i]);
            }
            message_line = i;
            break;
        }
    }

    if (message_line == lines.size()) {
        std::smatch match;
        report.error_type = std::regex_search(raw_error, match, kTypeAnywhere)
            ? match[1].str() : "UnknownError";
        if (!lines.empty()) {
            message_line = 0;
            report.message = trim(lines[0]);
        } else {
            report.message = "Unknown error";
        }
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        if (i != message_line) {
            report.stack_trace.push_back(lines[i]);
        }
    }

    report.category = categorize(raw_error, context.language);
    report.severity = determine_severity(raw_error, report.error_type);
    report.user_message = user_message(report.category, context.language);

    static const std::vector<std::string> kNonRetryable = {"syntax", "security", "memory", "validation"};
    report.can_retry = std::find(kNonRetryable.begin(), kNonRetryable.end(), report.category) ==
                       kNonRetryable.end();
    if (report.can_retry) {
        if (report.category == "timeout") {
            report.retry_delay_ms = 5000;
        } else if (report.category == "network") {
            report.retry_delay_ms = 2000;
        } else {
            report.retry_delay_ms = 1000;
        }
    }

    // Suggestions: the first matching rule plus contextual hints, then one
    // generic remediation for the category
    std::vector<ErrorSuggestion> specific;
    for (const auto& rule : solutions_) {
        if (std::regex_search(raw_error, rule.pattern)) {
            specific = rule.suggestions;
            break;
        }
    }
    std::vector<ErrorSuggestion> contextual = generate_contextual_help(context.code, context.language);
    specific.insert(specific.end(), contextual.begin(), contextual.end());

    std::vector<ErrorSuggestion> generic = category_suggestions(report.category);
    if (specific.empty() && generic.empty()) {
        generic = general_suggestions(context.language);
    }

    sort_by_priority(specific);
    if (specific.size() + generic.size() > kMaxSuggestions) {
        specific.resize(kMaxSuggestions - std::min(generic.size(), kMaxSuggestions));
    }
    report.suggestions = specific;
    report.suggestions.insert(report.suggestions.end(), generic.begin(), generic.end());
    sort_by_priority(report.suggestions);

    return report;
}

std::vector<ErrorSuggestion> ErrorClassifier::generate_contextual_help(const std::string& code,
                                                                       const std::string& language) const {
    std::vector<ErrorSuggestion> suggestions;

    if (language == "python") {
        if (code.find("print ") != std::string::npos && code.find("print(") == std::string::npos) {
            suggestions.emplace_back(Type::FIX, "Python 3 print syntax",
                "Use print() function instead of print statement", 9,
                std::string("print(\"Hello World\")"));
        }

        std::vector<std::string> lines;
        std::istringstream stream(code);
        std::string line;
        while (std::getline(stream, line)) {
            lines.push_back(rtrim(line));
        }
        for (size_t i = 0; i + 1 < lines.size(); ++i) {
            if (lines[i].empty() || lines[i].back() != ':') {
                continue;
            }
            const std::string& next = lines[i + 1];
            if (!trim(next).empty() && next[0] != ' ' && next[0] != '\t') {
                suggestions.emplace_back(Type::FIX, "Indentation required",
                    "Python requires indented blocks after colons", 10,
                    std::string("condition = True\nif condition:\n    print(\"Indented block\")"));
                break;
            }
        }
    } else if (language == "json") {
        if (code.find('\'') != std::string::npos && code.find('"') == std::string::npos) {
            suggestions.emplace_back(Type::FIX, "Use double quotes",
                "JSON strings and keys must use double quotes", 8,
                std::string("{\"message\": \"hello\"}"));
        }
    } else if (language == "yaml") {
        if (code.find('\t') != std::string::npos) {
            suggestions.emplace_back(Type::FIX, "Replace tabs with spaces",
                "YAML indentation must use spaces", 9);
        }
    }

    sort_by_priority(suggestions);
    return suggestions;
}

std::string ErrorClassifier::user_message(const std::string& category, const std::string& language) {
    if (category == "syntax") {
        return "There's a syntax error in your " + language +
               " code. Check for typos, missing brackets, or incorrect punctuation.";
    }
    if (category == "runtime") {
        return "Your code ran into an issue while executing. This usually means a variable or "
               "function wasn't found or used incorrectly.";
    }
    if (category == "security") {
        return "Your code was blocked for security reasons. Some operations aren't allowed in "
               "this environment for safety.";
    }
    if (category == "timeout") {
        return "Your code took too long to execute and was stopped. Try optimizing your code or "
               "reducing complexity.";
    }
    if (category == "memory") {
        return "Your code used too much memory. Try processing smaller amounts of data or "
               "optimizing memory usage.";
    }
    if (category == "network") {
        return "There was a network-related issue. Network requests aren't allowed in this environment.";
    }
    if (category == "validation") {
        return "The request could not be run. Check that code is present and the language is supported.";
    }
    return "Something went wrong while running your code. Check the suggestions below for help "
           "fixing the issue.";
}

std::vector<ErrorSuggestion> ErrorClassifier::category_suggestions(const std::string& category) {
    if (category == "syntax") {
        return {ErrorSuggestion(Type::FIX, "Review the syntax",
            "Check for typos, missing brackets, quotes or punctuation near the reported line", 5)};
    }
    if (category == "runtime") {
        return {ErrorSuggestion(Type::FIX, "Trace the failing line",
            "Print intermediate values just before the failing line to see what they hold", 5)};
    }
    if (category == "security") {
        return {ErrorSuggestion(Type::ALTERNATIVE, "Stay within the sandbox",
            "Remove file, network, process or dynamic-evaluation operations", 5)};
    }
    if (category == "timeout") {
        return {ErrorSuggestion(Type::FIX, "Optimize long-running code",
            "Break the work into smaller parts or reduce the input size", 5)};
    }
    if (category == "memory") {
        return {ErrorSuggestion(Type::FIX, "Process less data at once",
            "Work on smaller slices of data and release large objects you no longer need", 5)};
    }
    if (category == "network") {
        return {ErrorSuggestion(Type::ALTERNATIVE, "Use inline data",
            "Network access is disabled; embed the data in your code", 5)};
    }
    if (category == "validation") {
        return {ErrorSuggestion(Type::FIX, "Check the request",
            "Provide non-empty code, a supported language and a timeout within the limit", 5)};
    }
    return {};
}

std::vector<ErrorSuggestion> ErrorClassifier::general_suggestions(const std::string& language) {
    if (language == "python") {
        return {ErrorSuggestion(Type::DOCUMENTATION, "Python Documentation",
            "Check the official Python documentation", 5,
            std::nullopt, std::string("https://docs.python.org/3/"))};
    }
    if (language == "sql") {
        return {ErrorSuggestion(Type::DOCUMENTATION, "SQLite Documentation",
            "Check the SQLite documentation", 5,
            std::nullopt, std::string("https://www.sqlite.org/docs.html"))};
    }
    if (language == "regex") {
        return {ErrorSuggestion(Type::DOCUMENTATION, "Regular Expressions Guide",
            "Check the ECMAScript regular expression syntax", 5,
            std::nullopt, std::string("https://developer.mozilla.org/en-US/docs/Web/JavaScript/Guide/Regular_expressions"))};
    }
    return {};
}

// ============================================================================
// Retry and analytics
// ============================================================================

RetryStrategy ErrorClassifier::get_retry_strategy(const ProcessedError& error) {
    RetryStrategy strategy;
    strategy.should_retry = error.can_retry;

    if (error.category == "network") {
        strategy.max_retries = 5;
        strategy.delay_ms = 2000;
    } else if (error.category == "timeout") {
        strategy.max_retries = 2;
        strategy.delay_ms = 5000;
    } else if (error.category == "memory" || error.category == "syntax" ||
               error.category == "security" || error.category == "validation") {
        strategy.should_retry = false;
    }
    return strategy;
}

void ErrorClassifier::track(const ProcessedError& error, const std::string& language) {
    TrackedError tracked{error.category, error.error_type, language, error.severity,
                         error.can_retry, error.suggestions.size()};

    std::lock_guard<std::mutex> lock(mutex_);
    tracked_.push_back(tracked);
    while (tracked_.size() > kMaxTrackedErrors) {
        tracked_.pop_front();
    }
}

ErrorAnalytics ErrorClassifier::get_error_analytics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ErrorAnalytics analytics;
    analytics.total_errors = tracked_.size();
    size_t total_suggestions = 0;
    for (const auto& error : tracked_) {
        analytics.errors_by_category[error.category]++;
        analytics.errors_by_type[error.error_type]++;
        analytics.errors_by_language[error.language]++;
        analytics.errors_by_severity[severity_to_string(error.severity)]++;
        if (error.can_retry) {
            analytics.retryable_errors++;
        }
        total_suggestions += error.suggestion_count;
    }
    if (!tracked_.empty()) {
        analytics.average_suggestions =
            static_cast<double>(total_suggestions) / static_cast<double>(tracked_.size());
    }
    return analytics;
}

void ErrorClassifier::reset_analytics() {
    std::lock_guard<std::mutex> lock(mutex_);
    tracked_.clear();
}

} // namespace liverun
