/**
 * @file error_classifier.hpp
 * @brief Turns raw interpreter errors into actionable, user-facing reports
 *
 * The ErrorClassifier extracts the error type, message and stack trace from a
 * raw error string, assigns a category and severity from keyword heuristics,
 * decides whether a retry makes sense, and ranks remediation suggestions.
 * Classification is pure; analytics over classified errors are tracked
 * separately and capped at the last 100 errors.
 */

#ifndef LIVERUN_ERROR_CLASSIFIER_HPP
#define LIVERUN_ERROR_CLASSIFIER_HPP

#include "execution_types.hpp"
#include <nlohmann/json.hpp>
#include <deque>
#include <map>
#include <mutex>
#include <regex>
#include <string>
#include <vector>

namespace liverun {

/**
 * @brief What the classifier knows about the failed run
 */
struct ErrorContext {
    std::string language;
    std::string execution_id;
    std::string code;             ///< Source, used for contextual help (may be empty)

    ErrorContext() = default;
    ErrorContext(const std::string& language_, const std::string& execution_id_,
                 const std::string& code_ = "")
        : language(language_), execution_id(execution_id_), code(code_) {}
};

/**
 * @brief How a caller should retry a failed run
 */
struct RetryStrategy {
    bool should_retry;
    int max_retries;
    uint32_t delay_ms;
    double backoff_multiplier;

    RetryStrategy() : should_retry(false), max_retries(3), delay_ms(1000), backoff_multiplier(1.5) {}
};

/**
 * @brief Aggregates over tracked errors
 */
struct ErrorAnalytics {
    size_t total_errors;
    std::map<std::string, size_t> errors_by_category;
    std::map<std::string, size_t> errors_by_type;
    std::map<std::string, size_t> errors_by_language;
    std::map<std::string, size_t> errors_by_severity;
    size_t retryable_errors;
    double average_suggestions;

    ErrorAnalytics() : total_errors(0), retryable_errors(0), average_suggestions(0.0) {}
};

nlohmann::json to_json(const RetryStrategy& strategy);
nlohmann::json to_json(const ErrorAnalytics& analytics);

/**
 * @brief Error classifier and suggestion engine
 *
 * Usage Example:
 *   @code
 *   ErrorClassifier classifier;
 *   ProcessedError report = classifier.classify(
 *       "NameError: name 'x' is not defined", ErrorContext("python", "exec_1", code));
 *   classifier.track(report, "python");
 *   @endcode
 */
class ErrorClassifier {
public:
    /**
     * @brief Maximum number of tracked errors kept for analytics
     */
    static constexpr size_t kMaxTrackedErrors = 100;

    /**
     * @brief Maximum number of suggestions attached to a report
     */
    static constexpr size_t kMaxSuggestions = 5;

    ErrorClassifier();

    /**
     * @brief Classify a raw error
     *
     * @param raw_error Error text as produced by the engine or dispatcher
     * @param context Language, execution id and source
     * @return Structured report with suggestions sorted by priority, descending
     */
    ProcessedError classify(const std::string& raw_error, const ErrorContext& context) const;

    /**
     * @brief Static hints for code that commonly fails
     *
     * @return Suggestions sorted by priority, descending
     */
    std::vector<ErrorSuggestion> generate_contextual_help(const std::string& code,
                                                          const std::string& language) const;

    /**
     * @brief Retry policy for a classified error
     */
    static RetryStrategy get_retry_strategy(const ProcessedError& error);

    /**
     * @brief Record a classified error for analytics
     */
    void track(const ProcessedError& error, const std::string& language);

    ErrorAnalytics get_error_analytics() const;

    void reset_analytics();

    /**
     * @brief Category of a raw error ("security", "timeout", ... or "unknown")
     */
    std::string categorize(const std::string& raw_error, const std::string& language) const;

private:
    struct SolutionRule {
        std::regex pattern;
        std::vector<ErrorSuggestion> suggestions;
    };

    struct TrackedError {
        std::string category;
        std::string error_type;
        std::string language;
        Severity severity;
        bool can_retry;
        size_t suggestion_count;
    };

    std::vector<SolutionRule> solutions_;
    std::map<std::string, std::vector<std::regex>> language_patterns_;

    mutable std::mutex mutex_;
    std::deque<TrackedError> tracked_;

    void initialize_patterns();
    void initialize_solutions();

    static Severity determine_severity(const std::string& raw_error, const std::string& error_type);
    static std::string user_message(const std::string& category, const std::string& language);
    static std::vector<ErrorSuggestion> category_suggestions(const std::string& category);
    static std::vector<ErrorSuggestion> general_suggestions(const std::string& language);
};

} // namespace liverun

#endif // LIVERUN_ERROR_CLASSIFIER_HPP
