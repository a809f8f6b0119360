/**
 * @file ingest.h
 * @brief Pipeline entry point.
 *
 * decode -> infer delimiter -> fallback tokenization -> width normalization
 *
 * @example
 * @code
 * tabrescue::IngestOptions options;
 * options.expected_columns = 12;
 * options.merge_column = "notes";
 *
 * tabrescue::Ingestor ingestor(options);
 * auto result = ingestor.read_file("messy.csv");
 * tabrescue::log_report(result.report);
 * for (const auto& row : result.table.rows()) {
 *     // row.size() == 12
 * }
 * @endcode
 */

#ifndef TABRESCUE_INGEST_H
#define TABRESCUE_INGEST_H

#include "io_util.h"
#include "options.h"
#include "report.h"
#include "table.h"
#include "tokenizer.h"

#include <memory>
#include <string>
#include <vector>

namespace tabrescue {

struct IngestResult {
  Table table;
  IngestReport report;
};

class Ingestor {
public:
  /// @throws std::invalid_argument if the options are inconsistent
  explicit Ingestor(IngestOptions options = IngestOptions());

  /**
   * @brief Replace the tokenizer strategies tried by the fallback chain.
   * @param factory Called once per ingestion with the current options.
   */
  using StrategyFactory =
      std::vector<std::unique_ptr<Tokenizer>> (*)(const IngestOptions& options);
  void set_strategy_factory(StrategyFactory factory) { strategy_factory_ = factory; }

  /**
   * @throws IoError, DecodeError, IngestExhaustedError
   */
  IngestResult read_file(const std::string& path) const;

  /**
   * @param source_name Recorded in the report as the source.
   * @throws DecodeError, IngestExhaustedError
   */
  IngestResult read_buffer(const RawBytes& bytes, const std::string& source_name = "<buffer>") const;

  const IngestOptions& options() const { return options_; }

private:
  IngestOptions options_;
  StrategyFactory strategy_factory_;
};

/// One-shot form of Ingestor(options).read_file(path).
IngestResult ingest_file(const std::string& path, const IngestOptions& options = IngestOptions());

} // namespace tabrescue

#endif // TABRESCUE_INGEST_H
