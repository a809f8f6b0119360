/**
 * @file normalizer.h
 * @brief Forces tokenized records into a table of fixed width.
 *
 * No row is ever dropped and no field content is discarded from body rows:
 * - exact rows pass through;
 * - long rows keep their first expected-1 fields and merge every remaining
 *   field (trailing empty ones trimmed) into the merge target column;
 * - short rows are right-padded with empty fields.
 *
 * The header is the only thing that may be truncated. A short header is
 * padded with placeholder names (__placeholder_0, __placeholder_1, ...).
 */

#ifndef TABRESCUE_NORMALIZER_H
#define TABRESCUE_NORMALIZER_H

#include "error.h"
#include "options.h"
#include "table.h"

#include <optional>
#include <string>
#include <vector>

namespace tabrescue {

/// Counts and per-row diagnostics produced while normalizing.
struct NormalizeStats {
  size_t expected_columns = 0;
  size_t merge_column_index = 0;
  std::string merge_column_name;
  size_t header_padded = 0;
  size_t header_truncated = 0;
  size_t long_rows = 0;
  size_t short_rows = 0;
  std::vector<ParseError> anomalies; ///< INCONSISTENT_FIELD_COUNT warnings, capped
  size_t suppressed_anomalies = 0;
};

struct NormalizeResult {
  Table table;
  NormalizeStats stats;
};

/// Name used for the i-th synthesized header column.
std::string placeholder_name(size_t i);

/**
 * @brief Collapse a long row to `expected` fields.
 *
 * Fields from index expected-1 on, with trailing empty ones trimmed, are
 * joined with `separator`. When `target` is the last column the joined value
 * becomes that column. Otherwise it is appended to the target's value and the
 * last column is left empty.
 *
 * @pre row.size() > expected, target < expected
 */
Row merge_overflow(const Row& row, size_t expected, size_t target, const std::string& separator);

class WidthNormalizer {
public:
  /**
   * @param expected_columns 0 = width of the header, or the modal record width
   *                         when there is no header.
   * @param merge_column     Target column name; the last column when unset or
   *                         not present in the header.
   */
  WidthNormalizer(size_t expected_columns, std::optional<std::string> merge_column = std::nullopt,
                  std::string merge_separator = ",", bool has_header = true,
                  size_t max_anomalies = ErrorCollector::DEFAULT_MAX_ERRORS);

  static WidthNormalizer from_options(const IngestOptions& options);

  /// Build the table from tokenized records (the first is the header when has_header).
  NormalizeResult normalize(const std::vector<Record>& records) const;

  /// Re-normalize an existing table. The identity on already normalized tables.
  NormalizeResult normalize(const Table& table) const;

private:
  NormalizeResult build(Row header, bool header_from_input,
                        const std::vector<const Row*>& body,
                        const std::vector<size_t>& lines) const;

  size_t expected_columns_;
  std::optional<std::string> merge_column_;
  std::string merge_separator_;
  bool has_header_;
  size_t max_anomalies_;
};

/// Free-function form: `records` with the first record as header.
NormalizeResult normalize_width(const std::vector<Record>& records, size_t expected_columns,
                                const std::optional<std::string>& merge_column = std::nullopt);

} // namespace tabrescue

#endif // TABRESCUE_NORMALIZER_H
