#include "metrics_parquet.hpp"

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace liverun {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw SandboxError("Failed to " + what + ": " + status.ToString());
    }
}

} // anonymous namespace

void MetricsParquetWriter::write_metrics(const std::vector<ExecutionMetric>& metrics,
                                         const std::string& filepath) {
    auto schema = arrow::schema({
        arrow::field("id", arrow::utf8()),
        arrow::field("timestamp", arrow::int64()),
        arrow::field("execution_id", arrow::utf8()),
        arrow::field("language", arrow::utf8()),
        arrow::field("metric_type", arrow::utf8()),
        arrow::field("value", arrow::float64()),
        arrow::field("unit", arrow::utf8()),
        arrow::field("metadata", arrow::utf8())
    });

    arrow::StringBuilder id_builder;
    arrow::Int64Builder timestamp_builder;
    arrow::StringBuilder execution_id_builder;
    arrow::StringBuilder language_builder;
    arrow::StringBuilder metric_type_builder;
    arrow::DoubleBuilder value_builder;
    arrow::StringBuilder unit_builder;
    arrow::StringBuilder metadata_builder;

    check(timestamp_builder.Reserve(metrics.size()), "reserve memory for timestamp column");
    check(value_builder.Reserve(metrics.size()), "reserve memory for value column");

    for (const auto& metric : metrics) {
        check(id_builder.Append(metric.metric_id), "append id");
        check(timestamp_builder.Append(metric.timestamp_ms), "append timestamp");
        check(execution_id_builder.Append(metric.execution_id), "append execution_id");
        check(language_builder.Append(metric.language), "append language");
        check(metric_type_builder.Append(metric_type_to_string(metric.metric_type)), "append metric_type");
        check(value_builder.Append(metric.value), "append value");
        check(unit_builder.Append(metric.unit), "append unit");
        check(metadata_builder.Append(metric.metadata.dump()), "append metadata");
    }

    std::vector<std::shared_ptr<arrow::Array>> columns(8);
    check(id_builder.Finish(&columns[0]), "finish id array");
    check(timestamp_builder.Finish(&columns[1]), "finish timestamp array");
    check(execution_id_builder.Finish(&columns[2]), "finish execution_id array");
    check(language_builder.Finish(&columns[3]), "finish language array");
    check(metric_type_builder.Finish(&columns[4]), "finish metric_type array");
    check(value_builder.Finish(&columns[5]), "finish value array");
    check(unit_builder.Finish(&columns[6]), "finish unit array");
    check(metadata_builder.Finish(&columns[7]), "finish metadata array");

    auto table = arrow::Table::Make(schema, columns);

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw SandboxError("Cannot open Parquet file for writing: " + filepath + " - " +
                           outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 64 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void MetricsParquetWriter::write_metrics(const std::vector<ExecutionMetric>& /* metrics */,
                                         const std::string& /* filepath */) {
    throw SandboxError("Parquet support not available (Arrow library not linked)");
}

#endif // HAVE_ARROW

} // namespace liverun
