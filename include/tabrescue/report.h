/**
 * @file report.h
 * @brief Ingestion report and its text renderings.
 *
 * The report is metadata only: it never holds table rows. Library code
 * returns it; callers decide whether to log it (log_report) or print it
 * (format_report).
 */

#ifndef TABRESCUE_REPORT_H
#define TABRESCUE_REPORT_H

#include "error.h"

#include <cstddef>
#include <string>
#include <vector>

namespace tabrescue {

/**
 * @brief What the pipeline did to produce a table.
 */
struct IngestReport {
  std::string source; ///< File path or buffer name

  // Decoding
  std::string encoding; ///< Encoding actually used (e.g., "UTF-8")
  bool wide_detected = false;
  size_t replaced_sequences = 0;
  size_t nulls_stripped = 0;

  // Delimiter
  char delimiter = ',';
  bool delimiter_inferred = false;
  size_t modal_delimiter_count = 0; ///< Modal per-line count in the sampled head

  // Width normalization
  size_t expected_columns = 0;
  size_t merge_column_index = 0;
  std::string merge_column_name;
  size_t header_padded = 0;    ///< Placeholder names added to the header
  size_t header_truncated = 0; ///< Header names dropped
  size_t body_rows = 0;
  size_t long_rows = 0;  ///< Rows whose overflow was merged
  size_t short_rows = 0; ///< Rows padded with empty fields

  // Tokenization
  StrategyKind strategy_used = StrategyKind::STRICT_QUOTE;
  std::vector<ParseAttempt> attempts; ///< Every attempt, the successful one last
  size_t quote_repaired_lines = 0;
  size_t blank_rows_skipped = 0; ///< Nonzero only with skip_empty_rows

  // Per-row width anomalies, capped
  std::vector<ParseError> anomalies;
  size_t suppressed_anomalies = 0;
};

/// Printable form of a delimiter: "\t" for tab, the character otherwise.
std::string delimiter_to_string(char delimiter);

/**
 * @brief Message carried by IngestExhaustedError.
 *
 * @code
 * Could not parse delimited text without skipping lines.
 * Delimiter guess: ','; head mode delimiter count: 3
 * Errors:
 *  - strict-quote: UNCLOSED_QUOTE at line 2, column 3: ...
 * @endcode
 */
std::string format_exhausted_message(char delimiter, size_t modal_delimiter_count,
                                     const std::vector<ParseAttempt>& attempts);

/// Multi-line human-readable report.
std::string format_report(const IngestReport& report);

/// Log the summary lines at info level and anomalies at debug level.
void log_report(const IngestReport& report);

} // namespace tabrescue

#endif // TABRESCUE_REPORT_H
