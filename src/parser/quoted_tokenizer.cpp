#include "tabrescue/tokenizer.h"

namespace tabrescue {

namespace {

enum class State {
  FIELD_START, // Nothing consumed for the current field yet
  UNQUOTED,    // Inside an unquoted field
  IN_QUOTED,   // Inside a quoted field
  QUOTE_END    // Just after the closing quote of a quoted field
};

} // namespace

QuotedTokenizer::QuotedTokenizer(Grammar grammar, bool use_escape)
    : grammar_(grammar), use_escape_(use_escape) {}

TokenizeResult QuotedTokenizer::tokenize(std::string_view text, char delimiter) const {
  const char quote = grammar_.quote;
  const char escape = grammar_.escape;
  const bool escaping = use_escape_ && escape != '\0';
  const size_t n = text.size();

  std::vector<Record> records;
  Row fields;
  std::string field;
  field.reserve(64);

  State state = State::FIELD_START;
  bool record_started = false;
  size_t blank_lines = 0;

  size_t line = 1;
  size_t line_start = 0;
  size_t record_line = 1;

  // Where the currently open quoted field started, for UNCLOSED_QUOTE.
  size_t quote_line = 0;
  size_t quote_column = 0;
  size_t quote_offset = 0;

  // A line break inside a field still advances the line counter.
  auto note_newline = [&](size_t pos) {
    if (text[pos] == '\n' || (text[pos] == '\r' && (pos + 1 >= n || text[pos + 1] != '\n'))) {
      ++line;
      line_start = pos + 1;
    }
  };

  auto end_field = [&]() -> bool {
    if (field.size() > grammar_.max_field_size) {
      return false;
    }
    fields.push_back(std::move(field));
    field.clear();
    return true;
  };

  auto end_record = [&]() {
    records.emplace_back(std::move(fields), record_line);
    fields.clear();
    record_started = false;
  };

  // Consume LF, CR or CRLF at i; returns the next position.
  auto skip_newline = [&](size_t i) {
    i += (text[i] == '\r' && i + 1 < n && text[i + 1] == '\n') ? 2 : 1;
    ++line;
    line_start = i;
    record_line = line;
    return i;
  };

  auto too_large = [&](size_t pos) {
    return TokenizeResult::failure(ParseError(
        ErrorCode::FIELD_TOO_LARGE, ErrorSeverity::RECOVERABLE, line, pos - line_start + 1, pos,
        "Field exceeds maximum size of " + std::to_string(grammar_.max_field_size) + " bytes"));
  };

  size_t i = 0;
  while (i < n) {
    const char c = text[i];
    const bool is_newline = c == '\n' || c == '\r';

    switch (state) {
    case State::IN_QUOTED:
      if (escaping && c == escape && i + 1 < n) {
        field += text[i + 1];
        note_newline(i + 1);
        i += 2;
      } else if (c == quote) {
        if (i + 1 < n && text[i + 1] == quote) {
          field += quote;
          i += 2;
        } else {
          state = State::QUOTE_END;
          ++i;
        }
      } else {
        field += c;
        note_newline(i);
        ++i;
      }
      break;

    case State::QUOTE_END:
      if (c == delimiter) {
        if (!end_field())
          return too_large(i);
        state = State::FIELD_START;
        ++i;
      } else if (is_newline) {
        if (!end_field())
          return too_large(i);
        end_record();
        state = State::FIELD_START;
        i = skip_newline(i);
      } else {
        // Text after a closing quote continues the field: "abc"def reads as abcdef
        field += c;
        state = State::UNQUOTED;
        ++i;
      }
      break;

    case State::FIELD_START:
    case State::UNQUOTED:
      if (escaping && c == escape) {
        if (i + 1 < n) {
          field += text[i + 1];
          note_newline(i + 1);
          i += 2;
        } else {
          // Escape as the last byte of the input is kept literally
          field += c;
          ++i;
        }
        state = State::UNQUOTED;
        record_started = true;
      } else if (c == quote && state == State::UNQUOTED) {
        // A quote inside an unquoted field (5"6) is literal text.
        field += c;
        ++i;
      } else if (c == quote) {
        quote_line = line;
        quote_column = i - line_start + 1;
        quote_offset = i;
        state = State::IN_QUOTED;
        record_started = true;
        ++i;
      } else if (c == delimiter) {
        if (!end_field())
          return too_large(i);
        state = State::FIELD_START;
        record_started = true;
        ++i;
      } else if (is_newline) {
        if (!record_started) {
          if (grammar_.skip_empty_rows) {
            ++blank_lines;
          } else {
            records.emplace_back(Row{}, record_line);
          }
        } else {
          if (!end_field())
            return too_large(i);
          end_record();
        }
        state = State::FIELD_START;
        i = skip_newline(i);
      } else {
        field += c;
        state = State::UNQUOTED;
        record_started = true;
        ++i;
      }
      break;
    }
  }

  if (state == State::IN_QUOTED) {
    return TokenizeResult::failure(ParseError(ErrorCode::UNCLOSED_QUOTE, ErrorSeverity::RECOVERABLE,
                                              quote_line, quote_column, quote_offset,
                                              "Quoted field not closed before end of input"));
  }
  if (record_started) {
    if (!end_field())
      return too_large(n);
    end_record();
  }

  auto result = TokenizeResult::success(std::move(records));
  result.blank_lines_skipped = blank_lines;
  return result;
}

} // namespace tabrescue
