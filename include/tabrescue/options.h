#pragma once

#include "error.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tabrescue {

// Ingestion options. Every field has a usable default; the ingestor calls
// validate() before touching the input.
struct IngestOptions {
  // Output shape
  size_t expected_columns = 106;           // 0 = take the width from the header
  std::optional<std::string> merge_column; // Overflow target (default: last column)
  std::string merge_separator = ",";
  bool has_header = true;
  bool skip_empty_rows = false;            // Drop empty lines instead of padding them

  // Delimiter inference (nullopt = infer from the sample)
  std::optional<char> delimiter;
  std::vector<char> candidates = {',', ';', '|', '\t'};
  size_t sample_lines = 200;

  // Decoding (nullopt = try `encodings` in order)
  std::optional<std::string> encoding;
  std::vector<std::string> encodings = {"utf-8-sig", "utf-8", "cp1252", "latin1"};
  size_t wide_sniff_bytes = 200;
  double wide_null_ratio = 0.10;

  // Tokenizer grammar
  char quote = '"';
  char escape = '\\';
  size_t max_field_size = DEFAULT_MAX_FIELD_SIZE;

  // Diagnostics
  size_t max_anomalies = ErrorCollector::DEFAULT_MAX_ERRORS;

  /// @throws std::invalid_argument describing the first inconsistent option
  void validate() const;
};

} // namespace tabrescue
