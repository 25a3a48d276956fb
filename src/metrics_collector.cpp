/**
 * @file metrics_collector.cpp
 * @brief Implementation of MetricsCollector
 */

#include "metrics_collector.hpp"
#include "io/metrics_parquet.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>

namespace liverun {

using json = nlohmann::json;

namespace {

const int64_t kHourMs = 60 * 60 * 1000;
const int64_t kRealTimeWindowMs = 5 * 60 * 1000;

int64_t system_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool is_execution_sample(const ExecutionMetric& metric) {
    return metric.metric_type == MetricType::EXECUTION && metric.unit == "ms";
}

bool metadata_flag(const ExecutionMetric& metric, const char* key) {
    auto it = metric.metadata.find(key);
    return it != metric.metadata.end() && it->is_boolean() && it->get<bool>();
}

double metadata_number(const ExecutionMetric& metric, const char* key) {
    auto it = metric.metadata.find(key);
    return it != metric.metadata.end() && it->is_number() ? it->get<double>() : 0.0;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

} // anonymous namespace

std::string metric_type_to_string(MetricType type) {
    switch (type) {
        case MetricType::EXECUTION: return "execution";
        case MetricType::MEMORY: return "memory";
        case MetricType::ERROR: return "error";
        default: return "unknown";
    }
}

json to_json(const ExecutionMetric& metric) {
    return json{
        {"id", metric.metric_id},
        {"timestamp", metric.timestamp_ms},
        {"executionId", metric.execution_id},
        {"language", metric.language},
        {"metricType", metric_type_to_string(metric.metric_type)},
        {"value", metric.value},
        {"unit", metric.unit},
        {"metadata", metric.metadata}
    };
}

json to_json(const PerformanceStats& stats) {
    json languages = json::object();
    for (const auto& pair : stats.language_stats) {
        languages[pair.first] = {
            {"executions", pair.second.executions},
            {"averageTime", pair.second.average_time_ms},
            {"successRate", pair.second.success_rate},
            {"averageMemory", pair.second.average_memory_bytes}
        };
    }

    json series = json::array();
    for (const auto& point : stats.time_series) {
        series.push_back({
            {"timestamp", point.timestamp_ms},
            {"executions", point.executions},
            {"averageTime", point.average_time_ms},
            {"memoryUsage", point.memory_usage}
        });
    }

    return json{
        {"totalExecutions", stats.total_executions},
        {"successRate", stats.success_rate},
        {"averageExecutionTime", stats.average_execution_time_ms},
        {"medianExecutionTime", stats.median_execution_time_ms},
        {"averageMemoryUsage", stats.average_memory_usage},
        {"peakMemoryUsage", stats.peak_memory_usage},
        {"errorRate", stats.error_rate},
        {"violationRate", stats.violation_rate},
        {"languageStats", languages},
        {"timeSeriesData", series}
    };
}

json to_json(const RealTimeMetrics& metrics) {
    return json{
        {"activeExecutions", metrics.active_executions},
        {"recentExecutions", metrics.recent_executions},
        {"recentExecutionTime", metrics.recent_execution_time_ms},
        {"recentSuccessRate", metrics.recent_success_rate}
    };
}

// ============================================================================
// MetricsCollector
// ============================================================================

MetricsCollector::MetricsCollector(const MetricsConfig& config, Logger* logger, TimeSource now)
    : config_(config),
      logger_(logger ? logger : &Logger::get_instance()),
      now_(now ? std::move(now) : TimeSource(system_now_ms)),
      metric_counter_(0),
      flusher_running_(false),
      flusher_stop_(false),
      flush_requested_(false) {}

MetricsCollector::~MetricsCollector() {
    stop();
    flush();
}

void MetricsCollector::start() {
    if (config_.flush_interval_ms == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(flusher_mutex_);
    if (flusher_running_) {
        return;
    }
    flusher_running_ = true;
    flusher_stop_ = false;
    flusher_ = std::thread(&MetricsCollector::flusher_loop, this);
}

void MetricsCollector::stop() {
    {
        std::lock_guard<std::mutex> lock(flusher_mutex_);
        if (!flusher_running_) {
            return;
        }
        flusher_stop_ = true;
    }
    flusher_cv_.notify_all();
    flusher_.join();

    std::lock_guard<std::mutex> lock(flusher_mutex_);
    flusher_running_ = false;
}

void MetricsCollector::flusher_loop() {
    const auto interval = std::chrono::milliseconds(config_.flush_interval_ms);
    std::unique_lock<std::mutex> lock(flusher_mutex_);
    while (!flusher_stop_) {
        flusher_cv_.wait_for(lock, interval, [this]() { return flusher_stop_ || flush_requested_; });
        flush_requested_ = false;
        lock.unlock();
        flush();
        lock.lock();
    }
}

std::string MetricsCollector::next_metric_id(int64_t now_ms) {
    return "metric_" + std::to_string(now_ms) + "_" + std::to_string(++metric_counter_);
}

void MetricsCollector::start_execution(const std::string& execution_id, const std::string& language,
                                       size_t code_size) {
    ExecutionPerformance record;
    record.execution_id = execution_id;
    record.language = language;
    record.start_time_ms = now_();
    record.code_size = code_size;

    std::lock_guard<std::mutex> lock(buffer_mutex_);
    active_[execution_id] = record;
}

std::optional<ExecutionPerformance> MetricsCollector::end_execution(
    const std::string& execution_id,
    bool success,
    size_t output_size,
    const std::string& error_type,
    double duration_ms,
    uint64_t memory_bytes,
    size_t violations
) {
    ExecutionPerformance record;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        auto it = active_.find(execution_id);
        if (it == active_.end()) {
            return std::nullopt;
        }
        record = it->second;
        active_.erase(it);
    }

    record.end_time_ms = now_();
    record.duration_ms = duration_ms >= 0.0
        ? duration_ms
        : static_cast<double>(record.end_time_ms - record.start_time_ms);
    record.output_size = output_size;
    record.memory_bytes = memory_bytes;
    record.success = success;
    record.error_type = error_type;
    record.violations = violations;

    ExecutionMetric execution;
    execution.execution_id = execution_id;
    execution.language = record.language;
    execution.metric_type = MetricType::EXECUTION;
    execution.value = record.duration_ms;
    execution.unit = "ms";
    execution.metadata = {
        {"language", record.language},
        {"success", success},
        {"memoryUsed", memory_bytes},
        {"codeSize", record.code_size},
        {"outputSize", output_size},
        {"violations", violations}
    };
    if (!error_type.empty()) {
        execution.metadata["errorType"] = error_type;
    }
    record_metric(std::move(execution));

    if (memory_bytes > 0) {
        ExecutionMetric memory;
        memory.execution_id = execution_id;
        memory.language = record.language;
        memory.metric_type = MetricType::MEMORY;
        memory.value = static_cast<double>(memory_bytes);
        memory.unit = "bytes";
        record_metric(std::move(memory));
    }

    if (!success) {
        ExecutionMetric error;
        error.execution_id = execution_id;
        error.language = record.language;
        error.metric_type = MetricType::ERROR;
        error.value = 1.0;
        error.unit = "count";
        error.metadata = {{"errorType", error_type.empty() ? "UnknownError" : error_type}};
        record_metric(std::move(error));
    }

    return record;
}

void MetricsCollector::record_metric(ExecutionMetric metric) {
    bool over_budget = false;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        int64_t now_ms = now_();
        if (metric.timestamp_ms == 0) {
            metric.timestamp_ms = now_ms;
        }
        if (metric.metric_id.empty()) {
            metric.metric_id = next_metric_id(now_ms);
        }
        buffer_.push_back(std::move(metric));
        over_budget = buffer_.size() > config_.max_buffer;
    }

    if (!over_budget) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(flusher_mutex_);
        if (flusher_running_) {
            flush_requested_ = true;
            flusher_cv_.notify_one();
            return;
        }
    }
    flush();
}

void MetricsCollector::flush() {
    std::vector<ExecutionMetric> pending;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        pending.swap(buffer_);
    }
    if (pending.empty()) {
        return;
    }

    size_t retained = 0;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        for (auto& metric : pending) {
            metrics_.push_back(std::move(metric));
        }
        while (metrics_.size() > config_.max_retained) {
            metrics_.pop_front();
        }
        retained = metrics_.size();
    }
    logger_->log_metrics_flush(pending.size(), retained);
}

PerformanceStats MetricsCollector::get_performance_stats(
    std::optional<std::pair<int64_t, int64_t>> time_range) const {

    std::vector<ExecutionMetric> relevant;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        for (const auto& metric : metrics_) {
            if (time_range && (metric.timestamp_ms < time_range->first ||
                               metric.timestamp_ms > time_range->second)) {
                continue;
            }
            relevant.push_back(metric);
        }
    }

    PerformanceStats stats;
    std::vector<const ExecutionMetric*> executions;
    std::vector<double> memory_values;
    for (const auto& metric : relevant) {
        if (is_execution_sample(metric)) {
            executions.push_back(&metric);
        } else if (metric.metric_type == MetricType::MEMORY) {
            memory_values.push_back(metric.value);
        }
    }

    stats.total_executions = executions.size();
    if (executions.empty()) {
        return stats;
    }

    std::vector<double> times;
    size_t successful = 0;
    size_t violating = 0;
    for (const auto* metric : executions) {
        times.push_back(metric->value);
        if (metadata_flag(*metric, "success")) successful++;
        if (metadata_number(*metric, "violations") > 0) violating++;
    }

    const double total = static_cast<double>(executions.size());
    stats.success_rate = static_cast<double>(successful) / total;
    stats.error_rate = static_cast<double>(executions.size() - successful) / total;
    stats.violation_rate = static_cast<double>(violating) / total;
    stats.average_execution_time_ms = mean(times);

    std::vector<double> sorted_times = times;
    std::sort(sorted_times.begin(), sorted_times.end());
    stats.median_execution_time_ms = sorted_times[sorted_times.size() / 2];

    stats.average_memory_usage = mean(memory_values);
    stats.peak_memory_usage = memory_values.empty()
        ? 0.0 : *std::max_element(memory_values.begin(), memory_values.end());

    // Per-language and hourly breakdowns
    std::map<std::string, std::vector<const ExecutionMetric*>> by_language;
    std::map<int64_t, std::vector<const ExecutionMetric*>> by_hour;
    for (const auto* metric : executions) {
        by_language[metric->language.empty() ? "unknown" : metric->language].push_back(metric);
        by_hour[(metric->timestamp_ms / kHourMs) * kHourMs].push_back(metric);
    }

    for (const auto& pair : by_language) {
        std::vector<double> lang_times;
        std::vector<double> lang_memory;
        size_t lang_successful = 0;
        for (const auto* metric : pair.second) {
            lang_times.push_back(metric->value);
            double memory = metadata_number(*metric, "memoryUsed");
            if (memory > 0) lang_memory.push_back(memory);
            if (metadata_flag(*metric, "success")) lang_successful++;
        }
        LanguageStats lang;
        lang.executions = pair.second.size();
        lang.average_time_ms = mean(lang_times);
        lang.success_rate = static_cast<double>(lang_successful) / static_cast<double>(lang.executions);
        lang.average_memory_bytes = mean(lang_memory);
        stats.language_stats[pair.first] = lang;
    }

    for (const auto& pair : by_hour) {
        std::vector<double> hour_times;
        std::vector<double> hour_memory;
        for (const auto* metric : pair.second) {
            hour_times.push_back(metric->value);
            double memory = metadata_number(*metric, "memoryUsed");
            if (memory > 0) hour_memory.push_back(memory);
        }
        TimeSeriesPoint point;
        point.timestamp_ms = pair.first;
        point.executions = pair.second.size();
        point.average_time_ms = mean(hour_times);
        point.memory_usage = mean(hour_memory);
        stats.time_series.push_back(point);
    }

    return stats;
}

RealTimeMetrics MetricsCollector::get_real_time_metrics() const {
    RealTimeMetrics realtime;
    realtime.active_executions = active_executions();

    const int64_t window_start = now_() - kRealTimeWindowMs;
    std::vector<double> times;
    size_t successful = 0;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        for (const auto& metric : metrics_) {
            if (metric.timestamp_ms < window_start || !is_execution_sample(metric)) {
                continue;
            }
            times.push_back(metric.value);
            if (metadata_flag(metric, "success")) successful++;
        }
    }

    realtime.recent_executions = times.size();
    if (!times.empty()) {
        realtime.recent_execution_time_ms = mean(times);
        realtime.recent_success_rate = static_cast<double>(successful) / static_cast<double>(times.size());
    }
    return realtime;
}

std::vector<ExecutionMetric> MetricsCollector::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return std::vector<ExecutionMetric>(metrics_.begin(), metrics_.end());
}

size_t MetricsCollector::buffered_count() const {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return buffer_.size();
}

size_t MetricsCollector::active_executions() const {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return active_.size();
}

std::string MetricsCollector::export_metrics(const std::string& format) const {
    std::vector<ExecutionMetric> metrics = get_metrics();

    if (format == "csv") {
        std::ostringstream oss;
        oss << "id,timestamp,executionId,language,metricType,value,unit";
        for (const auto& metric : metrics) {
            oss << "\n" << metric.metric_id << "," << metric.timestamp_ms << ","
                << metric.execution_id << "," << metric.language << ","
                << metric_type_to_string(metric.metric_type) << ","
                << json(metric.value).dump() << "," << metric.unit;
        }
        return oss.str();
    }

    if (format == "json") {
        json metric_array = json::array();
        for (const auto& metric : metrics) {
            metric_array.push_back(to_json(metric));
        }
        json document = {
            {"metrics", metric_array},
            {"stats", to_json(get_performance_stats())},
            {"exportTime", now_()}
        };
        return document.dump(2);
    }

    throw ValidationError("Unsupported export format: " + format + ". Use json or csv");
}

void MetricsCollector::export_parquet(const std::string& filepath) const {
    MetricsParquetWriter::write_metrics(get_metrics(), filepath);
}

void MetricsCollector::clear() {
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        buffer_.clear();
        active_.clear();
    }
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.clear();
}

} // namespace liverun
