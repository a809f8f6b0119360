#include "tabrescue/tokenizer.h"

#include <algorithm>

namespace tabrescue {

namespace {

// Strip one enclosing quote pair and collapse doubled quotes inside it.
std::string unwrap_field(std::string_view raw, char quote) {
  if (raw.size() < 2 || raw.front() != quote || raw.back() != quote) {
    return std::string(raw);
  }
  std::string_view inner = raw.substr(1, raw.size() - 2);
  std::string out;
  out.reserve(inner.size());
  for (size_t i = 0; i < inner.size(); ++i) {
    out += inner[i];
    if (inner[i] == quote && i + 1 < inner.size() && inner[i + 1] == quote) {
      ++i;
    }
  }
  return out;
}

} // namespace

QuoteBlindTokenizer::QuoteBlindTokenizer(Grammar grammar) : grammar_(grammar) {}

TokenizeResult QuoteBlindTokenizer::tokenize(std::string_view text, char delimiter) const {
  const char quote = grammar_.quote;
  std::vector<Record> records;
  size_t blank_lines = 0;

  size_t line_no = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t end = text.find_first_of("\r\n", pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    const size_t line_start = pos;
    std::string_view line = text.substr(pos, end - pos);
    ++line_no;

    pos = end;
    if (pos < text.size() && text[pos] == '\r') {
      ++pos;
    }
    if (pos < text.size() && text[pos] == '\n') {
      ++pos;
    }

    if (line.empty()) {
      if (grammar_.skip_empty_rows) {
        ++blank_lines;
      } else {
        records.emplace_back(Row{}, line_no);
      }
      continue;
    }

    size_t quotes = static_cast<size_t>(std::count(line.begin(), line.end(), quote));
    if (quotes % 2 != 0) {
      size_t last = line.rfind(quote);
      return TokenizeResult::failure(
          ParseError(ErrorCode::UNCLOSED_QUOTE, ErrorSeverity::RECOVERABLE, line_no, last + 1,
                     line_start + last, "Odd number of quote characters on line"));
    }

    Row fields;
    bool even = true;
    size_t field_start = 0;
    for (size_t i = 0; i <= line.size(); ++i) {
      if (i < line.size() && line[i] == quote) {
        even = !even;
        continue;
      }
      if (i == line.size() || (line[i] == delimiter && even)) {
        std::string field = unwrap_field(line.substr(field_start, i - field_start), quote);
        if (field.size() > grammar_.max_field_size) {
          return TokenizeResult::failure(
              ParseError(ErrorCode::FIELD_TOO_LARGE, ErrorSeverity::RECOVERABLE, line_no,
                         field_start + 1, line_start + field_start,
                         "Field exceeds maximum size of " +
                             std::to_string(grammar_.max_field_size) + " bytes"));
        }
        fields.push_back(std::move(field));
        field_start = i + 1;
      }
    }
    records.emplace_back(std::move(fields), line_no);
  }

  auto result = TokenizeResult::success(std::move(records));
  result.blank_lines_skipped = blank_lines;
  return result;
}

} // namespace tabrescue
