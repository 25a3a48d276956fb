/**
 * @file sql_engine.hpp
 * @brief SQL over an embedded in-memory SQLite database
 *
 * initialize() proves the library works and installs the policy. Every
 * execute() runs on a fresh in-memory connection, so one snippet never sees
 * tables created by another. Policy enforcement happens twice: the leading
 * keyword of every prepared statement is checked against the blocked
 * statements, and an authorizer refuses ATTACH, DETACH, PRAGMA and
 * load_extension() wherever they appear.
 */

#ifndef LIVERUN_ENGINES_SQL_ENGINE_HPP
#define LIVERUN_ENGINES_SQL_ENGINE_HPP

#include "../engine_interface.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace liverun {

/**
 * @brief Rows produced by one statement
 */
struct SqlResultSet {
    std::vector<std::string> columns;
    size_t total_rows = 0;                        ///< Rows produced, including ones not kept
    std::vector<std::vector<std::string>> rows;   ///< Cell text of the first kMaxKeptRows rows
    std::vector<std::vector<bool>> nulls;         ///< Parallel to rows
};

class SqlEngine : public ILanguageEngine {
public:
    /**
     * @param memory_limit_bytes Hard cap for SQLite's heap, process-wide (0 = unlimited)
     */
    explicit SqlEngine(uint64_t memory_limit_bytes = 0);
    ~SqlEngine() override;

    SqlEngine(const SqlEngine&) = delete;
    SqlEngine& operator=(const SqlEngine&) = delete;

    void initialize(const SecurityPolicy& policy) override;

    EngineInfo get_info() const override {
        return EngineInfo("SQLite Engine", "1.0.0", "sql", true, 2 * 1024 * 1024);
    }

    EngineOutput execute(const std::string& code, const ExecutionOptions& options) override;

    /**
     * @brief Report syntax errors only (unknown tables are not errors here)
     */
    std::vector<std::string> validate_syntax(const std::string& code) override;

    /**
     * @brief Abort the running statement (thread-safe)
     */
    void interrupt() noexcept override;

    void dispose() noexcept override;

    bool is_initialized() const override {
        return initialized_;
    }

    /**
     * @brief Upper-cased first keyword of the script ("SELECT", "CREATE", ...)
     */
    static std::string detect_query_type(const std::string& sql);

    /**
     * @brief Table names following FROM, JOIN, INTO, UPDATE or TABLE (upper-cased, unique)
     */
    static std::vector<std::string> extract_table_names(const std::string& sql);

    /**
     * @brief Split a script into complete statements
     */
    static std::vector<std::string> split_statements(const std::string& sql);

    static std::string format_results(const std::vector<SqlResultSet>& results, const std::string& sql);
    static std::string render_table(const SqlResultSet& result, size_t index);

    static constexpr size_t kMaxKeptRows = 1000;

private:
    sqlite3* db_;
    std::mutex db_mutex_;                      ///< Guards db_ against interrupt() while swapping connections
    bool initialized_;
    uint64_t memory_limit_bytes_;
    std::unique_ptr<SecurityPolicy> policy_;

    std::atomic<bool> interrupted_;
    std::string denied_;                       ///< Statement refused by the authorizer during this call
    std::chrono::steady_clock::time_point deadline_;
    bool deadline_hit_;

    sqlite3* open_connection(std::string& error);
    void replace_connection(sqlite3* fresh);
    std::string describe_failure(uint32_t timeout_ms) const;

    static int authorize(void* self, int action, const char* arg1, const char* arg2,
                         const char* database, const char* trigger);
    static int on_progress(void* self);
};

} // namespace liverun

#endif // LIVERUN_ENGINES_SQL_ENGINE_HPP
