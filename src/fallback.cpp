#include "tabrescue/fallback.h"

#include "tabrescue/report.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace tabrescue {

FallbackOrchestrator::FallbackOrchestrator(std::vector<std::unique_ptr<Tokenizer>> strategies)
    : strategies_(std::move(strategies)) {
  if (strategies_.empty()) {
    throw std::invalid_argument("Fallback chain needs at least one tokenizer strategy");
  }
}

FallbackOutcome FallbackOrchestrator::run(std::string_view text, char delimiter,
                                          size_t modal_delimiter_count) const {
  FallbackOutcome outcome;
  State state = State::ATTEMPTING;
  size_t k = 0;

  while (state == State::ATTEMPTING) {
    const Tokenizer& strategy = *strategies_[k];
    SPDLOG_DEBUG("Tokenizing with {} (delimiter '{}')", strategy.name(),
                 delimiter_to_string(delimiter));
    TokenizeResult result = strategy.tokenize(text, delimiter);

    ParseAttempt attempt;
    attempt.strategy = strategy.kind();
    attempt.success = result.ok;
    if (result) {
      outcome.records = std::move(result.records);
      outcome.strategy = strategy.kind();
      outcome.repaired_lines = result.repaired_lines;
      outcome.blank_lines_skipped = result.blank_lines_skipped;
      outcome.attempts.push_back(attempt);
      state = State::SUCCEEDED;
      break;
    }

    attempt.error = result.error;
    outcome.attempts.push_back(attempt);
    SPDLOG_WARN("Strategy {} failed: {}", strategy.name(), result.error.to_string());

    if (++k == strategies_.size()) {
      state = State::EXHAUSTED_FAILED;
    }
  }

  if (state == State::EXHAUSTED_FAILED) {
    throw IngestExhaustedError(
        format_exhausted_message(delimiter, modal_delimiter_count, outcome.attempts), delimiter,
        modal_delimiter_count, outcome.attempts);
  }

  SPDLOG_DEBUG("Strategy {} produced {} records", strategy_to_string(outcome.strategy),
               outcome.records.size());
  return outcome;
}

} // namespace tabrescue
