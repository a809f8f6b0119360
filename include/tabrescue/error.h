#ifndef TABRESCUE_ERROR_H
#define TABRESCUE_ERROR_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @file error.h
 * @brief Error taxonomy for the tabrescue ingestion pipeline.
 *
 * Three kinds of failure exist:
 * - Fatal conditions raised as exceptions (IoError, DecodeError,
 *   IngestExhaustedError).
 * - ParseError values returned by a tokenizer strategy. They are recovered
 *   by the fallback orchestrator and only reach the caller embedded in an
 *   IngestExhaustedError.
 * - Width anomalies (long or short rows). These are WARNING-severity
 *   diagnostics collected by an ErrorCollector, never failures.
 *
 * @see ErrorCollector for collecting width anomalies
 * @see IngestExhaustedError for the aggregate failure
 */

namespace tabrescue {

/**
 * @brief Error codes carried by ParseError.
 *
 * Tokenizer strategies fail with UNCLOSED_QUOTE or FIELD_TOO_LARGE; the width
 * normalizer reports INCONSISTENT_FIELD_COUNT warnings.
 */
enum class ErrorCode {
  NONE = 0, ///< No error

  UNCLOSED_QUOTE,           ///< Quoted field (or quote parity on a line) not closed
  INCONSISTENT_FIELD_COUNT, ///< Row width differs from the expected column count
  FIELD_TOO_LARGE           ///< Field exceeds maximum size limit
};

/**
 * @brief Default limit for individual field size (16 MB).
 *
 * A field larger than this fails the tokenizer strategy that produced it with
 * FIELD_TOO_LARGE.
 */
constexpr size_t DEFAULT_MAX_FIELD_SIZE = 16 * 1024 * 1024; // 16 MB

/**
 * @brief Severity levels for diagnostics.
 *
 * @note The enum values use a naming pattern that avoids conflicts with
 * Windows macros (e.g., ERROR is defined in WinGDI.h).
 */
enum class ErrorSeverity {
  WARNING,    ///< Reported, data kept (e.g., a padded or merged row)
  RECOVERABLE ///< A strategy failed; the next one is tried
};

/**
 * @brief Detailed information about a single diagnostic.
 *
 * @example
 * @code
 * ParseError error(ErrorCode::UNCLOSED_QUOTE, ErrorSeverity::RECOVERABLE,
 *                  10, 5, 1024, "Unclosed quote at end of input");
 * std::cout << error.to_string() << std::endl;
 * // Output: [ERROR] UNCLOSED_QUOTE at line 10, column 5 (byte 1024): Unclosed quote ...
 * @endcode
 */
struct ParseError {
  ErrorCode code = ErrorCode::NONE;
  ErrorSeverity severity = ErrorSeverity::RECOVERABLE;

  // Location information
  size_t line = 0;        ///< Line number (1-indexed), 0 if unknown
  size_t column = 0;      ///< Column number (1-indexed), 0 if unknown
  size_t byte_offset = 0; ///< Byte offset into the decoded text

  std::string message; ///< Human-readable error description

  ParseError() = default;

  ParseError(ErrorCode c, ErrorSeverity s, size_t l, size_t col, size_t offset,
             const std::string& msg)
      : code(c), severity(s), line(l), column(col), byte_offset(offset), message(msg) {}

  /// Formatted string with severity, code, location and message.
  std::string to_string() const;
};

/**
 * @brief Collects diagnostics up to a limit.
 *
 * Used by the width normalizer to record which rows were padded or merged.
 * Once max_errors is reached further diagnostics are counted but not stored,
 * so a badly ragged file cannot exhaust memory through its report.
 *
 * @note Not thread-safe; one collector per ingestion.
 */
class ErrorCollector {
public:
  /** @brief Default maximum number of diagnostics to keep. */
  static constexpr size_t DEFAULT_MAX_ERRORS = 10000;

  explicit ErrorCollector(size_t max_errors = DEFAULT_MAX_ERRORS)
      : max_errors_(max_errors), suppressed_count_(0) {}

  /**
   * @brief Add a diagnostic, or count it as suppressed once the limit is hit.
   */
  void add_error(const ParseError& error) {
    if (errors_.size() >= max_errors_) {
      ++suppressed_count_;
      return;
    }
    errors_.push_back(error);
  }

  void add_error(ErrorCode code, ErrorSeverity severity, size_t line, size_t column, size_t offset,
                 const std::string& message) {
    add_error(ParseError(code, severity, line, column, offset, message));
  }

  const std::vector<ParseError>& errors() const { return errors_; }

  /// Number of diagnostics dropped after the limit was reached.
  size_t suppressed_count() const { return suppressed_count_; }

private:
  size_t max_errors_;
  std::vector<ParseError> errors_;
  size_t suppressed_count_;
};

/**
 * @brief Tokenizer strategies, in the order the fallback chain tries them.
 */
enum class StrategyKind : uint8_t {
  STRICT_QUOTE = 0,  ///< RFC 4180 style, doubled quotes only
  ESCAPED_QUOTE = 1, ///< Doubled quotes plus an escape character
  QUOTE_BLIND = 2,   ///< Per-line split tracking quote parity
  QUOTE_REPAIRED = 3 ///< Quote repair pass, then the quote-blind split
};

/// Short stable name of a strategy (e.g., "strict-quote").
const char* strategy_to_string(StrategyKind kind);

/**
 * @brief Outcome of one tokenization strategy run by the fallback orchestrator.
 */
struct ParseAttempt {
  StrategyKind strategy = StrategyKind::STRICT_QUOTE;
  bool success = false;
  ParseError error; ///< Meaningful only when success is false

  std::string to_string() const;
};

/**
 * @brief Thrown when the input file cannot be opened or read.
 */
class IoError : public std::runtime_error {
public:
  explicit IoError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Thrown when no encoding in the configured list produced text.
 *
 * This is the only stage-local fatal condition: downstream stages have no
 * input without decoded text.
 */
class DecodeError : public std::runtime_error {
public:
  DecodeError(const std::string& message, std::vector<std::string> tried)
      : std::runtime_error(message), tried_(std::move(tried)) {}

  /// Encoding names attempted, in order.
  const std::vector<std::string>& tried() const { return tried_; }

private:
  std::vector<std::string> tried_;
};

/**
 * @brief Thrown when every tokenization strategy failed.
 *
 * what() carries the formatted audit trail; the structured pieces are
 * available through the accessors.
 *
 * @example
 * @code
 * try {
 *     auto result = tabrescue::ingest_file("messy.csv", options);
 * } catch (const tabrescue::IngestExhaustedError& e) {
 *     std::cerr << e.what() << std::endl;
 *     for (const auto& attempt : e.attempts()) {
 *         std::cerr << "  " << attempt.to_string() << std::endl;
 *     }
 * }
 * @endcode
 */
class IngestExhaustedError : public std::runtime_error {
public:
  IngestExhaustedError(const std::string& message, char delimiter, size_t modal_delimiter_count,
                       std::vector<ParseAttempt> attempts)
      : std::runtime_error(message), delimiter_(delimiter),
        modal_delimiter_count_(modal_delimiter_count), attempts_(std::move(attempts)) {}

  char delimiter() const { return delimiter_; }

  /// Modal per-line count of the delimiter in the sampled head of the text.
  size_t modal_delimiter_count() const { return modal_delimiter_count_; }

  /// Every failed attempt, in strategy order.
  const std::vector<ParseAttempt>& attempts() const { return attempts_; }

private:
  char delimiter_;
  size_t modal_delimiter_count_;
  std::vector<ParseAttempt> attempts_;
};

/**
 * @brief Convert an ErrorCode to its string representation.
 * @return C-string name of the error code (e.g., "UNCLOSED_QUOTE")
 */
const char* error_code_to_string(ErrorCode code);

/**
 * @brief Convert an ErrorSeverity to its string representation.
 * @return C-string name of the severity ("ERROR" or "WARNING")
 */
const char* error_severity_to_string(ErrorSeverity severity);

} // namespace tabrescue

#endif // TABRESCUE_ERROR_H
