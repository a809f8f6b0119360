#include "tabrescue/ingest.h"

#include "tabrescue/dialect.h"
#include "tabrescue/encoding.h"
#include "tabrescue/fallback.h"
#include "tabrescue/normalizer.h"

#include <spdlog/spdlog.h>

namespace tabrescue {

Ingestor::Ingestor(IngestOptions options)
    : options_(std::move(options)), strategy_factory_(&make_default_strategies) {
  options_.validate();
}

IngestResult Ingestor::read_file(const std::string& path) const {
  SPDLOG_DEBUG("Reading {}", path);
  RawBytes bytes = load_file(path);
  return read_buffer(bytes, path);
}

IngestResult Ingestor::read_buffer(const RawBytes& bytes, const std::string& source_name) const {
  IngestResult result;
  IngestReport& report = result.report;
  report.source = source_name;

  DecodedText decoded = decode(bytes, options_);
  report.encoding = encoding_to_string(decoded.encoding);
  report.wide_detected = decoded.wide_detected;
  report.replaced_sequences = decoded.replaced_sequences;
  report.nulls_stripped = decoded.nulls_stripped;

  auto sample = sample_lines(decoded.text, options_.sample_lines);
  if (options_.delimiter) {
    report.delimiter = *options_.delimiter;
    report.delimiter_inferred = false;
    report.modal_delimiter_count = modal_count(sample, report.delimiter);
  } else {
    auto inference = DelimiterInferencer(options_.candidates).infer(sample);
    report.delimiter = inference.delimiter;
    report.delimiter_inferred = true;
    report.modal_delimiter_count = inference.modal_count;
  }

  FallbackOrchestrator orchestrator(strategy_factory_(options_));
  FallbackOutcome outcome =
      orchestrator.run(decoded.text, report.delimiter, report.modal_delimiter_count);
  report.strategy_used = outcome.strategy;
  report.attempts = std::move(outcome.attempts);
  report.quote_repaired_lines = outcome.repaired_lines;
  report.blank_rows_skipped = outcome.blank_lines_skipped;

  NormalizeResult normalized = WidthNormalizer::from_options(options_).normalize(outcome.records);
  const NormalizeStats& stats = normalized.stats;
  report.expected_columns = stats.expected_columns;
  report.merge_column_index = stats.merge_column_index;
  report.merge_column_name = stats.merge_column_name;
  report.header_padded = stats.header_padded;
  report.header_truncated = stats.header_truncated;
  report.long_rows = stats.long_rows;
  report.short_rows = stats.short_rows;
  report.anomalies = stats.anomalies;
  report.suppressed_anomalies = stats.suppressed_anomalies;

  result.table = std::move(normalized.table);
  report.body_rows = result.table.num_rows();

  SPDLOG_DEBUG("Ingested {}: {} rows x {} columns", source_name, report.body_rows,
               report.expected_columns);
  return result;
}

IngestResult ingest_file(const std::string& path, const IngestOptions& options) {
  return Ingestor(options).read_file(path);
}

} // namespace tabrescue
