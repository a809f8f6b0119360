/**
 * @file dialect.h
 * @brief Delimiter inference from a bounded sample of lines.
 *
 * Each candidate delimiter is scored by how regularly it occurs per line:
 * the modal (most frequent) per-line count and the variance of the per-line
 * counts around that mode. The best candidate has the highest modal count,
 * then the lowest variance, then comes first in the candidate list.
 *
 * @example
 * @code
 * auto sample = tabrescue::sample_lines(text, 200);
 * tabrescue::DelimiterInferencer inferencer({',', ';', '|', '\t'});
 * auto result = inferencer.infer(sample);
 * std::cout << "Delimiter: " << result.delimiter << std::endl;
 * @endcode
 */

#ifndef TABRESCUE_DIALECT_H
#define TABRESCUE_DIALECT_H

#include <cstddef>
#include <string_view>
#include <vector>

namespace tabrescue {

/// Candidate set used when none is configured.
inline const std::vector<char> DEFAULT_DELIMITER_CANDIDATES = {',', ';', '|', '\t'};

/**
 * @brief Score of one delimiter over the sample. Immutable once built.
 */
struct DelimiterCandidate {
  char delimiter = ',';
  size_t modal_count = 0;     ///< Most frequent per-line count (first seen wins ties)
  double variance = 0.0;      ///< Mean squared deviation from modal_count
  size_t total_count = 0;     ///< Occurrences over the whole sample
  size_t order = 0;           ///< Position in the candidate list

  /// True if the delimiter occurs anywhere in the sample.
  bool observed() const { return total_count > 0; }

  /// Ranking: `a < b` means a is the better candidate.
  bool operator<(const DelimiterCandidate& other) const {
    if (modal_count != other.modal_count) {
      return modal_count > other.modal_count;
    }
    if (variance != other.variance) {
      return variance < other.variance;
    }
    return order < other.order;
  }
};

/// Result of delimiter inference.
struct DelimiterInference {
  char delimiter = ',';      ///< Selected delimiter (comma if nothing observed)
  bool observed = false;     ///< False when the comma default was used
  size_t modal_count = 0;    ///< Modal per-line count of the selected delimiter
  size_t lines_sampled = 0;

  /// Observed candidates, best first.
  std::vector<DelimiterCandidate> candidates;
};

/**
 * @brief The first `max_lines` non-blank physical lines of `text`.
 *
 * Lines end at LF, CRLF or CR. Lines made only of spaces and tabs count as
 * blank. The returned views point into `text`.
 */
std::vector<std::string_view> sample_lines(std::string_view text, size_t max_lines);

/// Modal per-line count of `delimiter` over the sample (0 for an empty sample).
size_t modal_count(const std::vector<std::string_view>& sample, char delimiter);

/// Score one candidate over the sample.
DelimiterCandidate score_candidate(const std::vector<std::string_view>& sample, char delimiter,
                                   size_t order = 0);

/// Comparator used for the ranking: true if `a` should be preferred over `b`.
inline bool better_candidate(const DelimiterCandidate& a, const DelimiterCandidate& b) {
  return a < b;
}

/**
 * @brief Chooses a delimiter among a fixed candidate list.
 */
class DelimiterInferencer {
public:
  explicit DelimiterInferencer(std::vector<char> candidates = DEFAULT_DELIMITER_CANDIDATES);

  /// Score every candidate and select the best observed one.
  DelimiterInference infer(const std::vector<std::string_view>& sample) const;

  const std::vector<char>& candidates() const { return candidates_; }

private:
  std::vector<char> candidates_;
};

/// Convenience form of DelimiterInferencer::infer returning only the delimiter.
char infer_delimiter(const std::vector<std::string_view>& sample,
                     const std::vector<char>& candidates = DEFAULT_DELIMITER_CANDIDATES);

} // namespace tabrescue

#endif // TABRESCUE_DIALECT_H
