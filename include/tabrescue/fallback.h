#ifndef TABRESCUE_FALLBACK_H
#define TABRESCUE_FALLBACK_H

#include "error.h"
#include "table.h"
#include "tokenizer.h"

#include <memory>
#include <string_view>
#include <vector>

namespace tabrescue {

/// Records produced by the first strategy that succeeded.
struct FallbackOutcome {
  std::vector<Record> records;
  StrategyKind strategy = StrategyKind::STRICT_QUOTE;
  std::vector<ParseAttempt> attempts; ///< Failed attempts, then the successful one
  size_t repaired_lines = 0;
  size_t blank_lines_skipped = 0;
};

/**
 * @brief Runs tokenizer strategies in order until one succeeds.
 *
 * States: ATTEMPTING(k) runs strategy k. Success moves to SUCCEEDED; failure
 * records the attempt and moves to ATTEMPTING(k+1), or to EXHAUSTED_FAILED
 * after the last strategy. EXHAUSTED_FAILED throws; no partial table is ever
 * returned.
 */
class FallbackOrchestrator {
public:
  enum class State { ATTEMPTING, SUCCEEDED, EXHAUSTED_FAILED };

  /// @throws std::invalid_argument if `strategies` is empty
  explicit FallbackOrchestrator(std::vector<std::unique_ptr<Tokenizer>> strategies);

  /**
   * @brief Tokenize `text` with the first strategy that succeeds.
   *
   * @param modal_delimiter_count Carried into the failure for diagnostics.
   * @throws IngestExhaustedError when every strategy failed.
   */
  FallbackOutcome run(std::string_view text, char delimiter, size_t modal_delimiter_count) const;

  size_t num_strategies() const { return strategies_.size(); }

private:
  std::vector<std::unique_ptr<Tokenizer>> strategies_;
};

} // namespace tabrescue

#endif // TABRESCUE_FALLBACK_H
