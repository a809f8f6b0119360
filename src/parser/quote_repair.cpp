#include "tabrescue/tokenizer.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tabrescue {

namespace {

// UTF-8 encodings of the curly quotes: E2 80 98/99 (single), E2 80 9C/9D (double).
bool is_curly_quote(std::string_view text, size_t i, char& replacement) {
  if (i + 2 >= text.size() || static_cast<unsigned char>(text[i]) != 0xE2 ||
      static_cast<unsigned char>(text[i + 1]) != 0x80) {
    return false;
  }
  switch (static_cast<unsigned char>(text[i + 2])) {
  case 0x98:
  case 0x99:
    replacement = '\'';
    return true;
  case 0x9C:
  case 0x9D:
    replacement = '"';
    return true;
  default:
    return false;
  }
}

void repair_line(std::string& line, char quote, size_t& repaired_lines) {
  size_t quotes = static_cast<size_t>(std::count(line.begin(), line.end(), quote));
  if (quotes % 2 == 0) {
    return;
  }
  const char* replacement = quote == '\'' ? "\"\"" : "''";
  std::string fixed;
  fixed.reserve(line.size() + quotes);
  for (char c : line) {
    if (c == quote) {
      fixed += replacement;
    } else {
      fixed += c;
    }
  }
  line = std::move(fixed);
  ++repaired_lines;
}

} // namespace

std::string repair_quotes(std::string_view text, char quote, size_t& repaired_lines) {
  repaired_lines = 0;
  std::string out;
  out.reserve(text.size());

  std::string line;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    char straight = 0;
    if (c == '\n' || c == '\r') {
      repair_line(line, quote, repaired_lines);
      out += line;
      out += c;
      line.clear();
    } else if (is_curly_quote(text, i, straight)) {
      line += straight;
      i += 2;
    } else {
      line += c;
    }
  }
  repair_line(line, quote, repaired_lines);
  out += line;
  return out;
}

QuoteRepairTokenizer::QuoteRepairTokenizer(Grammar grammar) : grammar_(grammar), split_(grammar) {}

TokenizeResult QuoteRepairTokenizer::tokenize(std::string_view text, char delimiter) const {
  size_t repaired = 0;
  std::string fixed = repair_quotes(text, grammar_.quote, repaired);
  SPDLOG_DEBUG("Quote repair rewrote {} lines", repaired);

  auto result = split_.tokenize(fixed, delimiter);
  result.repaired_lines = repaired;
  return result;
}

std::vector<std::unique_ptr<Tokenizer>> make_default_strategies(const IngestOptions& options) {
  Grammar grammar = Grammar::from_options(options);
  std::vector<std::unique_ptr<Tokenizer>> strategies;
  strategies.push_back(std::make_unique<QuotedTokenizer>(grammar, false));
  strategies.push_back(std::make_unique<QuotedTokenizer>(grammar, true));
  strategies.push_back(std::make_unique<QuoteBlindTokenizer>(grammar));
  strategies.push_back(std::make_unique<QuoteRepairTokenizer>(grammar));
  return strategies;
}

} // namespace tabrescue
