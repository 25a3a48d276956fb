#include "sql_engine.hpp"
#include "light_engine.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <strings.h>

namespace liverun {

namespace {

const std::regex kTableReference(
    R"(\b(?:FROM|JOIN|INTO|UPDATE|TABLE)\s+(?:IF\s+(?:NOT\s+)?EXISTS\s+)?([A-Z_][A-Z0-9_]*))");

const std::vector<std::string> kChangeStatements = {
    "INSERT", "UPDATE", "DELETE", "CREATE", "DROP", "ALTER"
};

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool is_syntax_problem(const std::string& message) {
    return message.find("syntax error") != std::string::npos ||
           message.find("incomplete input") != std::string::npos ||
           message.find("unrecognized token") != std::string::npos;
}

} // namespace

SqlEngine::SqlEngine(uint64_t memory_limit_bytes)
    : db_(nullptr),
      initialized_(false),
      memory_limit_bytes_(memory_limit_bytes),
      interrupted_(false),
      deadline_hit_(false) {}

SqlEngine::~SqlEngine() {
    dispose();
}

sqlite3* SqlEngine::open_connection(std::string& error) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(":memory:", &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        error = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        return nullptr;
    }

    sqlite3_db_config(db, SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION, 0, nullptr);
    sqlite3_limit(db, SQLITE_LIMIT_ATTACHED, 0);
    sqlite3_set_authorizer(db, &SqlEngine::authorize, this);
    sqlite3_progress_handler(db, 1000, &SqlEngine::on_progress, this);
    return db;
}

void SqlEngine::replace_connection(sqlite3* fresh) {
    sqlite3* old = nullptr;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        old = db_;
        db_ = fresh;
    }
    if (old) {
        sqlite3_close_v2(old);
    }
}

void SqlEngine::initialize(const SecurityPolicy& policy) {
    if (initialized_) {
        return;
    }

    policy_ = std::make_unique<SecurityPolicy>(policy);

    std::string error;
    sqlite3* db = open_connection(error);
    if (!db) {
        throw EngineLoadError("SQLite could not open an in-memory database: " + error);
    }
    replace_connection(db);

    if (memory_limit_bytes_ > 0) {
        sqlite3_hard_heap_limit64(static_cast<sqlite3_int64>(memory_limit_bytes_));
    }
    initialized_ = true;
}

int SqlEngine::authorize(void* self, int action, const char* arg1, const char* arg2,
                         const char* database, const char* trigger) {
    (void)arg1;
    (void)database;
    (void)trigger;
    auto* engine = static_cast<SqlEngine*>(self);

    std::string keyword;
    switch (action) {
        case SQLITE_ATTACH: keyword = "ATTACH"; break;
        case SQLITE_DETACH: keyword = "DETACH"; break;
        case SQLITE_PRAGMA: keyword = "PRAGMA"; break;
        case SQLITE_FUNCTION:
            if (arg2 && strcasecmp(arg2, "load_extension") == 0) {
                keyword = "LOAD_EXTENSION";
            }
            break;
        default:
            break;
    }

    if (!keyword.empty() && engine->policy_ && engine->policy_->is_sql_statement_blocked(keyword)) {
        engine->denied_ = keyword;
        return SQLITE_DENY;
    }
    return SQLITE_OK;
}

int SqlEngine::on_progress(void* self) {
    auto* engine = static_cast<SqlEngine*>(self);
    if (engine->interrupted_) {
        return 1;
    }
    if (std::chrono::steady_clock::now() > engine->deadline_) {
        engine->deadline_hit_ = true;
        return 1;
    }
    return 0;
}

std::string SqlEngine::describe_failure(uint32_t timeout_ms) const {
    if (!denied_.empty()) {
        return SecurityPolicy::statement_violation(denied_);
    }
    if (deadline_hit_) {
        return "SQL execution timed out after " + std::to_string(timeout_ms) + "ms";
    }
    if (interrupted_) {
        return "SQL execution interrupted";
    }
    return sqlite3_errmsg(db_);
}

EngineOutput SqlEngine::execute(const std::string& code, const ExecutionOptions& options) {
    if (!initialized_) {
        throw ExecutionError("sql engine not initialized");
    }

    auto start = std::chrono::steady_clock::now();
    EngineOutput output;
    std::string sql = LightEngine::trim(code);

    auto finish = [&]() {
        output.duration_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start
        ).count();
        return output;
    };

    if (sql.empty()) {
        output.stdout_text = "No SQL query provided";
        return finish();
    }

    std::string error;
    sqlite3* fresh = open_connection(error);
    if (!fresh) {
        throw ExecutionError("could not open a fresh database: " + error);
    }
    replace_connection(fresh);

    interrupted_ = false;
    deadline_hit_ = false;
    denied_.clear();
    deadline_ = start + std::chrono::milliseconds(options.timeout_ms);
    sqlite3_memory_highwater(1);

    std::vector<SqlResultSet> results;
    size_t statements = 0;
    size_t rows_returned = 0;
    const char* tail = sql.c_str();
    const char* end = tail + sql.size();

    while (tail < end && error.empty()) {
        sqlite3_stmt* stmt = nullptr;
        const char* next = nullptr;
        int rc = sqlite3_prepare_v2(db_, tail, static_cast<int>(end - tail), &stmt, &next);
        if (rc != SQLITE_OK) {
            error = describe_failure(options.timeout_ms);
            break;
        }
        tail = next;
        if (!stmt) {
            continue;  // trailing whitespace or comment
        }
        ++statements;

        std::string keyword = detect_query_type(sqlite3_sql(stmt));
        if (policy_->is_sql_statement_blocked(keyword)) {
            sqlite3_finalize(stmt);
            error = SecurityPolicy::statement_violation(keyword);
            break;
        }

        SqlResultSet set;
        int columns = sqlite3_column_count(stmt);
        for (int i = 0; i < columns; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            set.columns.push_back(name ? name : "");
        }

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            ++set.total_rows;
            if (set.rows.size() >= kMaxKeptRows) {
                continue;
            }
            std::vector<std::string> row;
            std::vector<bool> nulls;
            for (int i = 0; i < columns; ++i) {
                switch (sqlite3_column_type(stmt, i)) {
                    case SQLITE_NULL:
                        row.push_back("NULL");
                        nulls.push_back(true);
                        break;
                    case SQLITE_BLOB:
                        row.push_back("<blob " + std::to_string(sqlite3_column_bytes(stmt, i)) + " bytes>");
                        nulls.push_back(false);
                        break;
                    default: {
                        const unsigned char* text = sqlite3_column_text(stmt, i);
                        row.push_back(text ? reinterpret_cast<const char*>(text) : "");
                        nulls.push_back(false);
                    }
                }
            }
            set.rows.push_back(std::move(row));
            set.nulls.push_back(std::move(nulls));
        }

        if (rc != SQLITE_DONE) {
            error = describe_failure(options.timeout_ms);
        }
        sqlite3_finalize(stmt);

        if (columns > 0) {
            rows_returned += set.total_rows;
            results.push_back(std::move(set));
        }
    }

    output.memory_bytes = static_cast<uint64_t>(sqlite3_memory_highwater(0));
    output.metadata["queryType"] = detect_query_type(sql);
    output.metadata["statementCount"] = statements;
    output.metadata["rowsReturned"] = rows_returned;
    output.metadata["rowsAffected"] = sqlite3_total_changes(db_);
    output.metadata["tablesInvolved"] = extract_table_names(sql);

    if (!error.empty()) {
        output.success = false;
        output.error = error;
        if (!results.empty()) {
            output.stdout_text = format_results(results, sql);
        }
        return finish();
    }

    output.stdout_text = format_results(results, sql);
    for (size_t i = 0; i < results.size(); ++i) {
        output.artifacts.emplace_back("table", "text/html", render_table(results[i], i + 1));
    }
    return finish();
}

std::vector<std::string> SqlEngine::validate_syntax(const std::string& code) {
    if (!initialized_) {
        throw ExecutionError("sql engine not initialized");
    }

    std::vector<std::string> problems;
    std::vector<std::string> statements = split_statements(code);
    denied_.clear();
    interrupted_ = false;
    deadline_hit_ = false;
    deadline_ = std::chrono::steady_clock::now() + std::chrono::seconds(5);

    for (size_t i = 0; i < statements.size(); ++i) {
        std::string keyword = detect_query_type(statements[i]);
        if (policy_->is_sql_statement_blocked(keyword)) {
            problems.push_back(SecurityPolicy::statement_violation(keyword));
            continue;
        }

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, statements[i].c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            std::string message = sqlite3_errmsg(db_);
            if (!denied_.empty()) {
                problems.push_back(SecurityPolicy::statement_violation(denied_));
                denied_.clear();
            } else if (is_syntax_problem(message)) {
                problems.push_back("Statement " + std::to_string(i + 1) + ": " + message);
            }
        }
        sqlite3_finalize(stmt);
    }
    return problems;
}

void SqlEngine::interrupt() noexcept {
    std::lock_guard<std::mutex> lock(db_mutex_);
    interrupted_ = true;
    if (db_) {
        sqlite3_interrupt(db_);
    }
}

void SqlEngine::dispose() noexcept {
    replace_connection(nullptr);
    initialized_ = false;
}

std::string SqlEngine::detect_query_type(const std::string& sql) {
    size_t i = 0;
    while (i < sql.size()) {
        if (std::isspace(static_cast<unsigned char>(sql[i]))) {
            ++i;
        } else if (sql.compare(i, 2, "--") == 0) {
            size_t eol = sql.find('\n', i);
            i = eol == std::string::npos ? sql.size() : eol + 1;
        } else if (sql.compare(i, 2, "/*") == 0) {
            size_t close = sql.find("*/", i + 2);
            i = close == std::string::npos ? sql.size() : close + 2;
        } else {
            break;
        }
    }

    size_t start = i;
    while (i < sql.size() && (std::isalpha(static_cast<unsigned char>(sql[i])) || sql[i] == '_')) {
        ++i;
    }
    return start == i ? "UNKNOWN" : to_upper(sql.substr(start, i - start));
}

std::vector<std::string> SqlEngine::extract_table_names(const std::string& sql) {
    std::vector<std::string> tables;
    std::string upper = to_upper(sql);
    for (auto it = std::sregex_iterator(upper.begin(), upper.end(), kTableReference);
         it != std::sregex_iterator(); ++it) {
        std::string name = (*it)[1].str();
        if (std::find(tables.begin(), tables.end(), name) == tables.end()) {
            tables.push_back(name);
        }
    }
    return tables;
}

std::vector<std::string> SqlEngine::split_statements(const std::string& sql) {
    std::vector<std::string> statements;
    std::string current;
    for (char c : sql) {
        current += c;
        if (c == ';' && sqlite3_complete(current.c_str())) {
            std::string statement = LightEngine::trim(current);
            if (statement != ";") {
                statements.push_back(statement);
            }
            current.clear();
        }
    }
    std::string rest = LightEngine::trim(current);
    if (!rest.empty()) {
        statements.push_back(rest);
    }
    return statements;
}

std::string SqlEngine::format_results(const std::vector<SqlResultSet>& results, const std::string& sql) {
    if (results.empty()) {
        std::string type = detect_query_type(sql);
        if (std::find(kChangeStatements.begin(), kChangeStatements.end(), type) != kChangeStatements.end()) {
            return type + " statement executed successfully.";
        }
        return "Query executed successfully. No results returned.";
    }

    std::ostringstream out;
    for (size_t index = 0; index < results.size(); ++index) {
        const SqlResultSet& result = results[index];
        out << "Query " << (index + 1) << " Results:\n";
        out << "Columns: ";
        for (size_t c = 0; c < result.columns.size(); ++c) {
            if (c > 0) out << ", ";
            out << result.columns[c];
        }
        out << "\nRows: " << result.total_rows << "\n\n";

        size_t shown = std::min<size_t>(5, result.rows.size());
        for (size_t r = 0; r < shown; ++r) {
            out << "Row " << (r + 1) << ": ";
            for (size_t c = 0; c < result.rows[r].size(); ++c) {
                if (c > 0) out << " | ";
                out << result.rows[r][c];
            }
            out << "\n";
        }
        if (result.total_rows > shown) {
            out << "... and " << (result.total_rows - shown) << " more rows\n";
        }
        out << "\n";
    }

    return LightEngine::trim(out.str());
}

std::string SqlEngine::render_table(const SqlResultSet& result, size_t index) {
    std::ostringstream html;
    html << "<div class=\"sql-result-table\">"
         << "<h4>Query " << index << " Results (" << result.total_rows << " rows)</h4>"
         << "<table><thead><tr>";
    for (const auto& column : result.columns) {
        html << "<th>" << LightEngine::escape_html(column) << "</th>";
    }
    html << "</tr></thead><tbody>";
    for (size_t r = 0; r < result.rows.size(); ++r) {
        html << "<tr>";
        for (size_t c = 0; c < result.rows[r].size(); ++c) {
            if (result.nulls[r][c]) {
                html << "<td><em>NULL</em></td>";
            } else {
                html << "<td>" << LightEngine::escape_html(result.rows[r][c]) << "</td>";
            }
        }
        html << "</tr>";
    }
    html << "</tbody></table>";
    if (result.total_rows > result.rows.size()) {
        html << "<p>Showing first " << result.rows.size() << " of " << result.total_rows << " rows</p>";
    }
    html << "</div>";
    return html.str();
}

} // namespace liverun
