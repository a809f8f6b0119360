/**
 * @file tokenizer.h
 * @brief Row tokenizer strategies.
 *
 * A strategy turns decoded text into records for a given delimiter, or
 * reports the first problem it hit as a ParseError value. Strategies never
 * throw for malformed input; the fallback orchestrator decides what a
 * failure means.
 *
 * Rules shared by every strategy:
 * - A record ends at LF, CRLF or CR outside a quoted field.
 * - An empty line is a record with no fields, or is skipped and counted when
 *   skip_empty_rows is set.
 * - A field longer than max_field_size fails the strategy (FIELD_TOO_LARGE).
 */

#ifndef TABRESCUE_TOKENIZER_H
#define TABRESCUE_TOKENIZER_H

#include "error.h"
#include "options.h"
#include "table.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tabrescue {

/// Grammar settings shared by the strategies.
struct Grammar {
  char quote = '"';
  char escape = '\\'; ///< '\0' disables escape handling
  size_t max_field_size = DEFAULT_MAX_FIELD_SIZE;
  bool skip_empty_rows = false;

  static Grammar from_options(const IngestOptions& options) {
    Grammar g;
    g.quote = options.quote;
    g.escape = options.escape;
    g.max_field_size = options.max_field_size;
    g.skip_empty_rows = options.skip_empty_rows;
    return g;
  }
};

/// Records, or the error that stopped a strategy.
struct TokenizeResult {
  std::vector<Record> records;
  ParseError error;
  bool ok = true;
  size_t repaired_lines = 0;      ///< Lines rewritten by the quote repair pass
  size_t blank_lines_skipped = 0; ///< Empty lines dropped under skip_empty_rows

  static TokenizeResult success(std::vector<Record>&& records, size_t repaired_lines = 0) {
    TokenizeResult r;
    r.records = std::move(records);
    r.repaired_lines = repaired_lines;
    return r;
  }
  static TokenizeResult failure(ParseError err) {
    TokenizeResult r;
    r.error = std::move(err);
    r.ok = false;
    return r;
  }

  explicit operator bool() const { return ok; }
};

/**
 * @brief A tokenization strategy.
 */
class Tokenizer {
public:
  virtual ~Tokenizer() = default;

  virtual StrategyKind kind() const = 0;

  /// Split `text` into records. Never throws for malformed input.
  virtual TokenizeResult tokenize(std::string_view text, char delimiter) const = 0;

  const char* name() const { return strategy_to_string(kind()); }
};

/**
 * @brief Quote-aware grammar, RFC 4180 style.
 *
 * Doubled quotes inside a quoted field stand for one literal quote, and a
 * delimiter or line break inside a quoted field is literal. With escape
 * handling enabled the escape character additionally makes the next
 * character literal, inside or outside quotes.
 *
 * Stray quotes are read leniently: a quote inside an unquoted field is a
 * literal character, and text following a closing quote is appended to the
 * field ("abc"def reads as abcdef). The only grammar failure is
 * UNCLOSED_QUOTE (end of input inside a quoted field).
 */
class QuotedTokenizer : public Tokenizer {
public:
  QuotedTokenizer(Grammar grammar, bool use_escape);

  StrategyKind kind() const override {
    return use_escape_ ? StrategyKind::ESCAPED_QUOTE : StrategyKind::STRICT_QUOTE;
  }
  TokenizeResult tokenize(std::string_view text, char delimiter) const override;

private:
  Grammar grammar_;
  bool use_escape_;
};

/**
 * @brief Per-line split that only honors quote parity.
 *
 * Each physical line is one record. A delimiter splits only where the number
 * of quotes before it on the line is even. A line with an odd number of
 * quotes fails with UNCLOSED_QUOTE. A field wrapped in a pair of quotes is
 * unwrapped and its doubled quotes are collapsed.
 */
class QuoteBlindTokenizer : public Tokenizer {
public:
  explicit QuoteBlindTokenizer(Grammar grammar);

  StrategyKind kind() const override { return StrategyKind::QUOTE_BLIND; }
  TokenizeResult tokenize(std::string_view text, char delimiter) const override;

private:
  Grammar grammar_;
};

/**
 * @brief Quote repair pass followed by the quote-blind split.
 *
 * The repair is lossy: curly quotes are straightened, and on a line with an
 * odd number of quote characters every quote becomes two apostrophes (two
 * double quotes when the quote character is the apostrophe).
 */
class QuoteRepairTokenizer : public Tokenizer {
public:
  explicit QuoteRepairTokenizer(Grammar grammar);

  StrategyKind kind() const override { return StrategyKind::QUOTE_REPAIRED; }
  TokenizeResult tokenize(std::string_view text, char delimiter) const override;

private:
  Grammar grammar_;
  QuoteBlindTokenizer split_;
};

/**
 * @brief Rewrite quotes so every line has balanced quote parity.
 *
 * U+201C and U+201D become '"', U+2018 and U+2019 become '\''. Line breaks
 * are preserved, so line numbers do not move.
 *
 * @param[out] repaired_lines Lines whose quotes were replaced for parity.
 */
std::string repair_quotes(std::string_view text, char quote, size_t& repaired_lines);

/// The four strategies in fallback order.
std::vector<std::unique_ptr<Tokenizer>> make_default_strategies(const IngestOptions& options);

} // namespace tabrescue

#endif // TABRESCUE_TOKENIZER_H
