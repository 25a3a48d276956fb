/**
 * @file metrics_collector.hpp
 * @brief Per-execution metrics with buffered, bounded retention
 *
 * Metrics are appended to a small buffer that is drained into a bounded ring
 * by a single flush thread (periodically, or early once the buffer grows past
 * max_buffer). Recording never waits for a flush. Statistics and exports read
 * the flushed ring.
 */

#ifndef LIVERUN_METRICS_COLLECTOR_HPP
#define LIVERUN_METRICS_COLLECTOR_HPP

#include "logger.hpp"
#include "sandbox_config.hpp"
#include <nlohmann/json.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace liverun {

enum class MetricType { EXECUTION, MEMORY, ERROR };

std::string metric_type_to_string(MetricType type);

/**
 * @brief One append-only sample
 */
struct ExecutionMetric {
    std::string metric_id;
    std::string execution_id;
    std::string language;
    MetricType metric_type;
    double value;
    std::string unit;              ///< "ms", "bytes", "count"
    int64_t timestamp_ms;          ///< Milliseconds since the Unix epoch
    nlohmann::json metadata;

    ExecutionMetric()
        : metric_type(MetricType::EXECUTION), value(0.0), timestamp_ms(0),
          metadata(nlohmann::json::object()) {}
};

/**
 * @brief Tracking record of one execution
 */
struct ExecutionPerformance {
    std::string execution_id;
    std::string language;
    int64_t start_time_ms;
    int64_t end_time_ms;
    double duration_ms;
    size_t code_size;
    size_t output_size;
    uint64_t memory_bytes;
    bool success;
    std::string error_type;
    size_t violations;

    ExecutionPerformance()
        : start_time_ms(0), end_time_ms(0), duration_ms(0.0), code_size(0), output_size(0),
          memory_bytes(0), success(false), violations(0) {}
};

struct LanguageStats {
    size_t executions;
    double average_time_ms;
    double success_rate;
    double average_memory_bytes;

    LanguageStats() : executions(0), average_time_ms(0.0), success_rate(0.0), average_memory_bytes(0.0) {}
};

/**
 * @brief Hourly bucket
 */
struct TimeSeriesPoint {
    int64_t timestamp_ms;          ///< Start of the hour
    size_t executions;
    double average_time_ms;
    double memory_usage;

    TimeSeriesPoint() : timestamp_ms(0), executions(0), average_time_ms(0.0), memory_usage(0.0) {}
};

/**
 * @brief Aggregate statistics over retained execution metrics
 */
struct PerformanceStats {
    size_t total_executions;
    double success_rate;
    double average_execution_time_ms;
    double median_execution_time_ms;
    double average_memory_usage;
    double peak_memory_usage;
    double error_rate;
    double violation_rate;
    std::map<std::string, LanguageStats> language_stats;
    std::vector<TimeSeriesPoint> time_series;

    PerformanceStats()
        : total_executions(0), success_rate(0.0), average_execution_time_ms(0.0),
          median_execution_time_ms(0.0), average_memory_usage(0.0), peak_memory_usage(0.0),
          error_rate(0.0), violation_rate(0.0) {}
};

/**
 * @brief Snapshot over the last five minutes
 */
struct RealTimeMetrics {
    size_t active_executions;
    size_t recent_executions;
    double recent_execution_time_ms;
    double recent_success_rate;      ///< 1.0 when nothing ran recently

    RealTimeMetrics()
        : active_executions(0), recent_executions(0), recent_execution_time_ms(0.0),
          recent_success_rate(1.0) {}
};

nlohmann::json to_json(const ExecutionMetric& metric);
nlohmann::json to_json(const PerformanceStats& stats);
nlohmann::json to_json(const RealTimeMetrics& metrics);

/**
 * @brief Metrics collector
 *
 * Usage Example:
 *   @code
 *   MetricsCollector metrics(config.metrics);
 *   metrics.start();
 *
 *   metrics.start_execution("exec_1", "python", code.size());
 *   ...
 *   metrics.end_execution("exec_1", true, output.size(), "", elapsed_ms, memory);
 *
 *   std::string csv = metrics.export_metrics("csv");
 *   @endcode
 */
class MetricsCollector {
public:
    /**
     * @brief Time source in milliseconds since the epoch (replaceable in tests)
     */
    using TimeSource = std::function<int64_t()>;

    explicit MetricsCollector(const MetricsConfig& config, Logger* logger = nullptr,
                              TimeSource now = TimeSource());

    /**
     * @brief Destructor - stops the flush thread and flushes what is buffered
     */
    ~MetricsCollector();

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    /**
     * @brief Start the periodic flush thread (no-op if flush_interval_ms is 0)
     */
    void start();

    void stop();

    /**
     * @brief Begin tracking an execution
     */
    void start_execution(const std::string& execution_id, const std::string& language, size_t code_size);

    /**
     * @brief Finish tracking an execution and record its metric
     *
     * Records exactly one execution metric (unit "ms"), plus a memory metric
     * when memory_bytes is known and an error metric when the run failed.
     *
     * @param duration_ms Measured duration; negative uses the tracked start time
     * @return The completed record, or empty if the id was never started
     */
    std::optional<ExecutionPerformance> end_execution(
        const std::string& execution_id,
        bool success,
        size_t output_size,
        const std::string& error_type = "",
        double duration_ms = -1.0,
        uint64_t memory_bytes = 0,
        size_t violations = 0
    );

    /**
     * @brief Append a custom metric (id and timestamp filled in when empty)
     */
    void record_metric(ExecutionMetric metric);

    /**
     * @brief Move buffered metrics into the retained ring
     */
    void flush();

    /**
     * @brief Statistics over retained metrics, optionally within [start_ms, end_ms]
     */
    PerformanceStats get_performance_stats(std::optional<std::pair<int64_t, int64_t>> time_range = std::nullopt) const;

    RealTimeMetrics get_real_time_metrics() const;

    /**
     * @brief Retained (flushed) metrics, oldest first
     */
    std::vector<ExecutionMetric> get_metrics() const;

    size_t buffered_count() const;
    size_t active_executions() const;

    /**
     * @brief Export retained metrics
     *
     * @param format "json" (metrics, stats, exportTime) or "csv"
     * @throws ValidationError for other formats
     */
    std::string export_metrics(const std::string& format = "json") const;

    /**
     * @brief Write retained metrics to a Parquet file
     * @throws SandboxError if Arrow is not linked or the file cannot be written
     */
    void export_parquet(const std::string& filepath) const;

    void clear();

private:
    MetricsConfig config_;
    Logger* logger_;
    TimeSource now_;

    mutable std::mutex buffer_mutex_;
    std::vector<ExecutionMetric> buffer_;
    std::map<std::string, ExecutionPerformance> active_;
    uint64_t metric_counter_;

    mutable std::mutex metrics_mutex_;
    std::deque<ExecutionMetric> metrics_;

    std::thread flusher_;
    std::mutex flusher_mutex_;
    std::condition_variable flusher_cv_;
    bool flusher_running_;
    bool flusher_stop_;
    bool flush_requested_;

    void flusher_loop();
    std::string next_metric_id(int64_t now_ms);
};

} // namespace liverun

#endif // LIVERUN_METRICS_COLLECTOR_HPP
