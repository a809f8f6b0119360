#include "tabrescue/dialect.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>

namespace tabrescue {

namespace {

bool is_blank(std::string_view line) {
  return std::all_of(line.begin(), line.end(), [](char c) { return c == ' ' || c == '\t'; });
}

std::vector<size_t> per_line_counts(const std::vector<std::string_view>& sample, char delimiter) {
  std::vector<size_t> counts;
  counts.reserve(sample.size());
  for (auto line : sample) {
    counts.push_back(static_cast<size_t>(std::count(line.begin(), line.end(), delimiter)));
  }
  return counts;
}

// Most frequent value; among equally frequent values the one seen first wins.
size_t mode_of(const std::vector<size_t>& counts) {
  std::unordered_map<size_t, size_t> count_freq;
  for (size_t c : counts) {
    count_freq[c]++;
  }

  size_t modal = 0;
  size_t modal_freq = 0;
  for (size_t c : counts) {
    size_t freq = count_freq[c];
    if (freq > modal_freq) {
      modal_freq = freq;
      modal = c;
    }
  }
  return modal;
}

} // namespace

std::vector<std::string_view> sample_lines(std::string_view text, size_t max_lines) {
  std::vector<std::string_view> lines;
  size_t pos = 0;
  while (pos < text.size() && lines.size() < max_lines) {
    size_t end = text.find_first_of("\r\n", pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(pos, end - pos);
    if (!is_blank(line)) {
      lines.push_back(line);
    }

    pos = end;
    if (pos < text.size() && text[pos] == '\r') {
      ++pos;
    }
    if (pos < text.size() && text[pos] == '\n') {
      ++pos;
    }
  }
  return lines;
}

size_t modal_count(const std::vector<std::string_view>& sample, char delimiter) {
  return mode_of(per_line_counts(sample, delimiter));
}

DelimiterCandidate score_candidate(const std::vector<std::string_view>& sample, char delimiter,
                                   size_t order) {
  DelimiterCandidate candidate;
  candidate.delimiter = delimiter;
  candidate.order = order;

  auto counts = per_line_counts(sample, delimiter);
  if (counts.empty()) {
    return candidate;
  }

  candidate.modal_count = mode_of(counts);
  double sum_sq = 0.0;
  for (size_t c : counts) {
    candidate.total_count += c;
    double diff = static_cast<double>(c) - static_cast<double>(candidate.modal_count);
    sum_sq += diff * diff;
  }
  candidate.variance = sum_sq / static_cast<double>(counts.size());
  return candidate;
}

DelimiterInferencer::DelimiterInferencer(std::vector<char> candidates)
    : candidates_(std::move(candidates)) {}

DelimiterInference DelimiterInferencer::infer(const std::vector<std::string_view>& sample) const {
  DelimiterInference result;
  result.lines_sampled = sample.size();

  for (size_t i = 0; i < candidates_.size(); ++i) {
    auto candidate = score_candidate(sample, candidates_[i], i);
    if (candidate.observed()) {
      result.candidates.push_back(candidate);
    }
  }
  std::stable_sort(result.candidates.begin(), result.candidates.end(), better_candidate);

  if (result.candidates.empty()) {
    SPDLOG_DEBUG("No candidate delimiter in {} sampled lines; using ','", sample.size());
    result.delimiter = ',';
    result.modal_count = modal_count(sample, ',');
    return result;
  }

  const auto& best = result.candidates.front();
  result.delimiter = best.delimiter;
  result.observed = true;
  result.modal_count = best.modal_count;
  SPDLOG_DEBUG("Inferred delimiter '{}' (modal count {}, variance {:.3f}) from {} lines",
               best.delimiter, best.modal_count, best.variance, sample.size());
  return result;
}

char infer_delimiter(const std::vector<std::string_view>& sample,
                     const std::vector<char>& candidates) {
  return DelimiterInferencer(candidates).infer(sample).delimiter;
}

} // namespace tabrescue
