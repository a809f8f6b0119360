#include "tabrescue/normalizer.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>

namespace tabrescue {

namespace {

size_t modal_width(const std::vector<const Row*>& body) {
  std::unordered_map<size_t, size_t> freq;
  for (const Row* row : body) {
    freq[row->size()]++;
  }
  size_t modal = 0;
  size_t modal_freq = 0;
  for (const Row* row : body) {
    size_t f = freq[row->size()];
    if (f > modal_freq) {
      modal_freq = f;
      modal = row->size();
    }
  }
  return modal;
}

} // namespace

std::string placeholder_name(size_t i) { return "__placeholder_" + std::to_string(i); }

Row merge_overflow(const Row& row, size_t expected, size_t target, const std::string& separator) {
  const size_t last = expected - 1;
  Row out(row.begin(), row.begin() + static_cast<std::ptrdiff_t>(last));

  size_t end = row.size();
  while (end > last && row[end - 1].empty()) {
    --end;
  }
  std::string joined;
  for (size_t i = last; i < end; ++i) {
    if (i > last) {
      joined += separator;
    }
    joined += row[i];
  }

  if (target == last) {
    out.push_back(std::move(joined));
    return out;
  }

  out.emplace_back();
  std::string& value = out[target];
  if (!joined.empty()) {
    value = value.empty() ? joined : value + separator + joined;
  }
  return out;
}

WidthNormalizer::WidthNormalizer(size_t expected_columns, std::optional<std::string> merge_column,
                                 std::string merge_separator, bool has_header,
                                 size_t max_anomalies)
    : expected_columns_(expected_columns), merge_column_(std::move(merge_column)),
      merge_separator_(std::move(merge_separator)), has_header_(has_header),
      max_anomalies_(max_anomalies) {}

WidthNormalizer WidthNormalizer::from_options(const IngestOptions& options) {
  return WidthNormalizer(options.expected_columns, options.merge_column, options.merge_separator,
                         options.has_header, options.max_anomalies);
}

NormalizeResult WidthNormalizer::normalize(const std::vector<Record>& records) const {
  std::vector<const Row*> body;
  std::vector<size_t> lines;
  size_t first = (has_header_ && !records.empty()) ? 1 : 0;
  body.reserve(records.size());
  lines.reserve(records.size());
  for (size_t i = first; i < records.size(); ++i) {
    body.push_back(&records[i].fields);
    lines.push_back(records[i].line);
  }

  if (records.empty()) {
    SPDLOG_WARN("No records to normalize; producing an empty table");
  }
  Row header = first == 1 ? records.front().fields : Row{};
  return build(std::move(header), first == 1, body, lines);
}

NormalizeResult WidthNormalizer::normalize(const Table& table) const {
  std::vector<const Row*> body;
  std::vector<size_t> lines;
  body.reserve(table.num_rows());
  lines.reserve(table.num_rows());
  // Table rows follow the header line.
  for (size_t i = 0; i < table.num_rows(); ++i) {
    body.push_back(&table.rows()[i]);
    lines.push_back(i + 2);
  }
  return build(table.header(), true, body, lines);
}

NormalizeResult WidthNormalizer::build(Row header, bool header_from_input,
                                       const std::vector<const Row*>& body,
                                       const std::vector<size_t>& lines) const {
  NormalizeResult result;
  NormalizeStats& stats = result.stats;

  size_t k = expected_columns_;
  if (k == 0) {
    k = header_from_input ? header.size() : modal_width(body);
    if (k == 0) {
      for (const Row* row : body) {
        k = std::max(k, row->size());
      }
    }
    SPDLOG_DEBUG("Expected column count taken from the input: {}", k);
  }
  stats.expected_columns = k;

  // Header: pad with placeholders or truncate.
  if (header.size() < k) {
    size_t missing = k - header.size();
    for (size_t i = 0; i < missing; ++i) {
      header.push_back(placeholder_name(i));
    }
    stats.header_padded = missing;
  } else if (header.size() > k) {
    stats.header_truncated = header.size() - k;
    SPDLOG_WARN("Header has {} names, truncating to {}", header.size(), k);
    header.resize(k);
  }

  // Merge target, resolved once against the final header.
  size_t target = k > 0 ? k - 1 : 0;
  if (merge_column_) {
    bool found = false;
    for (size_t i = 0; i < header.size(); ++i) {
      if (header[i] == *merge_column_) {
        target = i;
        found = true;
        break;
      }
    }
    if (!found) {
      SPDLOG_WARN("Merge column '{}' not in header; merging into the last column", *merge_column_);
    }
  }
  stats.merge_column_index = target;
  stats.merge_column_name = k > 0 ? header[target] : std::string();

  ErrorCollector anomalies(max_anomalies_);
  std::vector<Row> rows;
  rows.reserve(body.size());

  for (size_t r = 0; r < body.size(); ++r) {
    const Row& row = *body[r];
    if (row.size() == k) {
      rows.push_back(row);
      continue;
    }

    if (row.size() > k) {
      rows.push_back(merge_overflow(row, k, target, merge_separator_));
      ++stats.long_rows;
      anomalies.add_error(ErrorCode::INCONSISTENT_FIELD_COUNT, ErrorSeverity::WARNING, lines[r], 0,
                          0,
                          "Row has " + std::to_string(row.size()) + " fields, expected " +
                              std::to_string(k) + "; overflow merged into '" +
                              stats.merge_column_name + "'");
    } else {
      Row padded = row;
      padded.resize(k);
      rows.push_back(std::move(padded));
      ++stats.short_rows;
      anomalies.add_error(ErrorCode::INCONSISTENT_FIELD_COUNT, ErrorSeverity::WARNING, lines[r], 0,
                          0,
                          "Row has " + std::to_string(row.size()) + " fields, expected " +
                              std::to_string(k) + "; padded");
    }
  }

  stats.anomalies = anomalies.errors();
  stats.suppressed_anomalies = anomalies.suppressed_count();
  SPDLOG_DEBUG("Normalized {} rows to {} columns ({} long, {} short)", rows.size(), k,
               stats.long_rows, stats.short_rows);

  result.table = Table(std::move(header), std::move(rows));
  return result;
}

NormalizeResult normalize_width(const std::vector<Record>& records, size_t expected_columns,
                                const std::optional<std::string>& merge_column) {
  return WidthNormalizer(expected_columns, merge_column).normalize(records);
}

} // namespace tabrescue
