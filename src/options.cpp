#include "tabrescue/options.h"

#include <algorithm>
#include <stdexcept>

namespace tabrescue {

void IngestOptions::validate() const {
  if (candidates.empty() && !delimiter) {
    throw std::invalid_argument("At least one delimiter candidate is required");
  }
  auto bad_delimiter = [this](char d) {
    return d == quote || d == '\n' || d == '\r' || d == '\0' || (escape != '\0' && d == escape);
  };
  if (delimiter && bad_delimiter(*delimiter)) {
    throw std::invalid_argument(
        "Delimiter cannot be a newline, a null byte, the quote or the escape character");
  }
  if (std::any_of(candidates.begin(), candidates.end(), bad_delimiter)) {
    throw std::invalid_argument(
        "Delimiter candidates cannot be newlines, null bytes, the quote or the escape character");
  }
  if (quote == '\n' || quote == '\r' || quote == '\0') {
    throw std::invalid_argument("Quote character cannot be a newline or a null byte");
  }
  if (escape == quote) {
    throw std::invalid_argument("Escape and quote character cannot be the same");
  }
  if (sample_lines == 0) {
    throw std::invalid_argument("sample_lines must be at least 1");
  }
  if (max_field_size == 0) {
    throw std::invalid_argument("max_field_size must be at least 1");
  }
  if (wide_sniff_bytes < 2) {
    throw std::invalid_argument("wide_sniff_bytes must be at least 2");
  }
  if (wide_null_ratio < 0.0 || wide_null_ratio >= 1.0) {
    throw std::invalid_argument("wide_null_ratio must be in [0, 1)");
  }
  if (!encoding && encodings.empty()) {
    throw std::invalid_argument("At least one encoding is required");
  }
}

} // namespace tabrescue
