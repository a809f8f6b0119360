#include "tabrescue/report.h"

#include <spdlog/spdlog.h>

#include <sstream>

namespace tabrescue {

std::string delimiter_to_string(char delimiter) {
  switch (delimiter) {
  case '\t':
    return "\\t";
  case '\0':
    return "\\0";
  default:
    return std::string(1, delimiter);
  }
}

std::string format_exhausted_message(char delimiter, size_t modal_delimiter_count,
                                     const std::vector<ParseAttempt>& attempts) {
  std::ostringstream ss;
  ss << "Could not parse delimited text without skipping lines.\n";
  ss << "Delimiter guess: '" << delimiter_to_string(delimiter)
     << "'; head mode delimiter count: " << modal_delimiter_count << "\n";
  ss << "Errors:";
  for (const auto& attempt : attempts) {
    ss << "\n - " << attempt.to_string();
  }
  return ss.str();
}

std::string format_report(const IngestReport& report) {
  std::ostringstream ss;
  const size_t k = report.expected_columns;

  ss << "Source: " << report.source << "\n";
  ss << "Encoding: " << report.encoding;
  if (report.wide_detected) {
    ss << " (wide encoding detected)";
  }
  ss << "\n";
  if (report.replaced_sequences > 0 || report.nulls_stripped > 0) {
    ss << "Replaced invalid sequences: " << report.replaced_sequences
       << "; null bytes stripped: " << report.nulls_stripped << "\n";
  }

  ss << "Loaded " << report.body_rows << " rows with exactly " << k << " columns. Delimiter='"
     << delimiter_to_string(report.delimiter) << "'"
     << (report.delimiter_inferred ? " (inferred)" : "") << "\n";
  ss << "Head mode delimiter count: " << report.modal_delimiter_count << "\n";
  ss << "Rows with >" << k << " fields (merged, nothing dropped): " << report.long_rows << "\n";
  ss << "Rows with <" << k << " fields (padded): " << report.short_rows << "\n";
  ss << "Merge column: " << report.merge_column_name << " (index " << report.merge_column_index
     << ")\n";
  if (report.blank_rows_skipped > 0) {
    ss << "Blank lines skipped: " << report.blank_rows_skipped << "\n";
  }
  if (report.header_padded > 0) {
    ss << "Header padded with " << report.header_padded << " placeholder names\n";
  }
  if (report.header_truncated > 0) {
    ss << "Header truncated by " << report.header_truncated << " names\n";
  }

  ss << "Strategy: " << strategy_to_string(report.strategy_used) << "\n";
  if (report.quote_repaired_lines > 0) {
    ss << "Quote-repaired lines: " << report.quote_repaired_lines << "\n";
  }
  if (report.attempts.size() > 1) {
    ss << "Attempts:\n";
    for (const auto& attempt : report.attempts) {
      ss << " - " << attempt.to_string() << "\n";
    }
  }

  if (!report.anomalies.empty()) {
    ss << "Width anomalies:\n";
    for (const auto& anomaly : report.anomalies) {
      ss << "  " << anomaly.to_string() << "\n";
    }
    if (report.suppressed_anomalies > 0) {
      ss << "  ... and " << report.suppressed_anomalies << " more\n";
    }
  }
  return ss.str();
}

void log_report(const IngestReport& report) {
  const size_t k = report.expected_columns;
  spdlog::info("Loaded {} rows with exactly {} columns. Delimiter='{}'", report.body_rows, k,
               delimiter_to_string(report.delimiter));
  spdlog::info("Rows with >{} fields (merged, nothing dropped): {}", k, report.long_rows);
  spdlog::info("Rows with <{} fields (padded): {}", k, report.short_rows);
  if (report.blank_rows_skipped > 0) {
    spdlog::info("Blank lines skipped: {}", report.blank_rows_skipped);
  }
  spdlog::info("Encoding: {}; strategy: {}", report.encoding,
               strategy_to_string(report.strategy_used));
  for (const auto& attempt : report.attempts) {
    if (!attempt.success) {
      spdlog::info("Fallback: {}", attempt.to_string());
    }
  }
  for (const auto& anomaly : report.anomalies) {
    spdlog::debug("{}", anomaly.to_string());
  }
}

} // namespace tabrescue
