#ifndef TABRESCUE_TABLE_H
#define TABRESCUE_TABLE_H

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace tabrescue {

/// A field sequence.
using Row = std::vector<std::string>;

/// A tokenized record: its fields plus the 1-based line where it starts.
struct Record {
  Row fields;
  size_t line = 0;

  Record() = default;
  Record(Row f, size_t l) : fields(std::move(f)), line(l) {}
};

/**
 * @brief Rectangular table: a header and body rows of identical width.
 *
 * Only the width normalizer builds tables from tokenized records, which is
 * what guarantees every row has exactly num_columns() fields.
 */
class Table {
public:
  Table() = default;
  Table(Row header, std::vector<Row> rows) : header_(std::move(header)), rows_(std::move(rows)) {}

  const Row& header() const { return header_; }
  const std::vector<Row>& rows() const { return rows_; }
  const Row& row(size_t i) const { return rows_.at(i); }

  size_t num_rows() const { return rows_.size(); }
  size_t num_columns() const { return header_.size(); }

  bool operator==(const Table& other) const {
    return header_ == other.header_ && rows_ == other.rows_;
  }
  bool operator!=(const Table& other) const { return !(*this == other); }

private:
  Row header_;
  std::vector<Row> rows_;
};

} // namespace tabrescue

#endif // TABRESCUE_TABLE_H
