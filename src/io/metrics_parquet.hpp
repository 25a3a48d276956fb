#ifndef LIVERUN_IO_METRICS_PARQUET_HPP
#define LIVERUN_IO_METRICS_PARQUET_HPP

#include "../metrics_collector.hpp"
#include <string>
#include <vector>

namespace liverun {

class MetricsParquetWriter {
public:
    /**
     * Write execution metrics to a Parquet file.
     *
     * Output schema:
     *   - id: utf8
     *   - timestamp: int64 (milliseconds since the epoch)
     *   - execution_id: utf8
     *   - language: utf8
     *   - metric_type: utf8 (execution, memory, error)
     *   - value: float64
     *   - unit: utf8
     *   - metadata: utf8 (JSON document)
     *
     * @param metrics Metrics to write (may be empty)
     * @param filepath Path to output Parquet file
     * @throws SandboxError if Arrow is not linked or the file cannot be written
     */
    static void write_metrics(const std::vector<ExecutionMetric>& metrics, const std::string& filepath);
};

} // namespace liverun

#endif // LIVERUN_IO_METRICS_PARQUET_HPP
