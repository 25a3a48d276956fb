/**
 * @file security_policy.hpp
 * @brief Capability policy handed to engines before user code runs
 *
 * The SecurityPolicy is a declarative deny-list: modules user code may not
 * import, builtins that are rebound to always-failing stubs, and SQL
 * statements that are refused. Engines receive it once at bootstrap and
 * enforce it inside their runtime. The CodeAnalyzer applies the same policy
 * statically so obvious violations never reach a runtime at all.
 */

#ifndef LIVERUN_SECURITY_POLICY_HPP
#define LIVERUN_SECURITY_POLICY_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <set>
#include <vector>
#include <cstddef>

namespace liverun {

/**
 * @brief Deny-list capability object
 */
class SecurityPolicy {
public:
    /**
     * @brief Build a policy from explicit deny-lists
     */
    SecurityPolicy(
        std::set<std::string> blocked_modules,
        std::set<std::string> blocked_builtins,
        std::set<std::string> blocked_sql_statements
    );

    /**
     * @brief Default policy for the playground
     *
     * Blocks process/OS access, networking, filesystem, subprocess spawning,
     * serialization of code objects and dynamic evaluation.
     */
    static SecurityPolicy defaults();

    /**
     * @brief Check a (possibly dotted) module name against the deny-list
     *
     * "os.path" is blocked because "os" is.
     */
    bool is_module_blocked(const std::string& module_name) const;

    bool is_builtin_blocked(const std::string& name) const;

    /**
     * @brief Check a SQL statement keyword (case-insensitive)
     */
    bool is_sql_statement_blocked(const std::string& keyword) const;

    const std::set<std::string>& blocked_modules() const { return blocked_modules_; }
    const std::set<std::string>& blocked_builtins() const { return blocked_builtins_; }
    const std::set<std::string>& blocked_sql_statements() const { return blocked_sql_statements_; }

    /**
     * @brief Serialize for runtimes that live outside this process
     */
    nlohmann::json to_json() const;

    static std::string module_violation(const std::string& module_name);
    static std::string function_violation(const std::string& function_name);
    static std::string statement_violation(const std::string& keyword);
    static std::string attribute_violation(const std::string& attribute);

private:
    std::set<std::string> blocked_modules_;
    std::set<std::string> blocked_builtins_;
    std::set<std::string> blocked_sql_statements_;  ///< Stored upper-case
};

/**
 * @brief One static finding
 */
struct SecurityFinding {
    std::string rule;        ///< "blocked_import", "introspection_escape", "blocked_statement"
    std::string subject;     ///< Offending module, attribute or statement
    std::string message;     ///< User-facing message ("... is not allowed for security reasons")
    size_t line;             ///< 1-based line number

    SecurityFinding() : line(0) {}
    SecurityFinding(const std::string& rule_, const std::string& subject_,
                    const std::string& message_, size_t line_)
        : rule(rule_), subject(subject_), message(message_), line(line_) {}
};

/**
 * @brief Static pre-dispatch scanner
 *
 * Catches deny-listed imports and introspection escapes in Python and
 * blocked statements in SQL. Runtime enforcement stays authoritative; this
 * only short-circuits the obvious cases without touching an engine.
 */
class CodeAnalyzer {
public:
    explicit CodeAnalyzer(const SecurityPolicy& policy);

    /**
     * @brief Scan code for policy violations
     *
     * @param code Source code
     * @param language Language id; languages without rules yield no findings
     * @return Findings in source order
     */
    std::vector<SecurityFinding> analyze(const std::string& code, const std::string& language) const;

private:
    SecurityPolicy policy_;

    void analyze_python(const std::string& code, std::vector<SecurityFinding>& findings) const;
    void analyze_sql(const std::string& code, std::vector<SecurityFinding>& findings) const;
};

} // namespace liverun

#endif // LIVERUN_SECURITY_POLICY_HPP
