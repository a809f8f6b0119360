#include "tabrescue/tabrescue.h"

#include <benchmark/benchmark.h>
#include <spdlog/spdlog.h>

#include <string>

namespace {

// Synthetic input: `rows` data rows of `cols` fields, every `ragged_every`-th
// row carrying two extra fields. With `unclosed_quote` the second data row
// opens a quoted field that never closes and no other field is quoted.
std::string make_input(size_t rows, size_t cols, size_t ragged_every, bool unclosed_quote,
                       char delim) {
  std::string out;
  for (size_t c = 0; c < cols; ++c) {
    if (c > 0)
      out += delim;
    out += "col" + std::to_string(c);
  }
  out += '\n';
  for (size_t r = 0; r < rows; ++r) {
    size_t width = (ragged_every && r % ragged_every == 0) ? cols + 2 : cols;
    for (size_t c = 0; c < width; ++c) {
      if (c > 0)
        out += delim;
      if (unclosed_quote && r == 1 && c == 1) {
        out += "\"5 in";
      } else if (!unclosed_quote && c == 2) {
        out += "\"quoted" + std::string(1, delim) + "value\"";
      } else {
        out += "v" + std::to_string(r * cols + c);
      }
    }
    out += '\n';
  }
  return out;
}

tabrescue::RawBytes to_bytes(const std::string& s) { return tabrescue::RawBytes(s.begin(), s.end()); }

} // namespace

static void BM_IngestClean(benchmark::State& state) {
  spdlog::set_level(spdlog::level::err);
  auto bytes = to_bytes(make_input(static_cast<size_t>(state.range(0)), 20, 0, false, ','));
  tabrescue::IngestOptions options;
  options.expected_columns = 20;
  tabrescue::Ingestor ingestor(options);

  for (auto _ : state) {
    auto result = ingestor.read_buffer(bytes);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(static_cast<int64_t>(bytes.size() * state.iterations()));
}
BENCHMARK(BM_IngestClean)->RangeMultiplier(10)->Range(100, 100000)->Unit(benchmark::kMillisecond);

static void BM_IngestRagged(benchmark::State& state) {
  spdlog::set_level(spdlog::level::err);
  auto bytes = to_bytes(make_input(static_cast<size_t>(state.range(0)), 20, 7, false, ';'));
  tabrescue::IngestOptions options;
  options.expected_columns = 20;
  tabrescue::Ingestor ingestor(options);

  for (auto _ : state) {
    auto result = ingestor.read_buffer(bytes);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(static_cast<int64_t>(bytes.size() * state.iterations()));
}
BENCHMARK(BM_IngestRagged)->RangeMultiplier(10)->Range(100, 100000)->Unit(benchmark::kMillisecond);

// Worst case for the fallback chain: every strategy runs before quote repair succeeds.
static void BM_IngestQuoteRepair(benchmark::State& state) {
  spdlog::set_level(spdlog::level::err);
  auto bytes = to_bytes(make_input(static_cast<size_t>(state.range(0)), 20, 0, true, ','));
  tabrescue::IngestOptions options;
  options.expected_columns = 20;
  tabrescue::Ingestor ingestor(options);

  for (auto _ : state) {
    auto result = ingestor.read_buffer(bytes);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(static_cast<int64_t>(bytes.size() * state.iterations()));
}
BENCHMARK(BM_IngestQuoteRepair)
    ->RangeMultiplier(10)
    ->Range(100, 100000)
    ->Unit(benchmark::kMillisecond);

static void BM_DecodeUtf16(benchmark::State& state) {
  std::string utf8 = make_input(static_cast<size_t>(state.range(0)), 10, 0, false, '\t');
  tabrescue::RawBytes bytes = {0xFF, 0xFE};
  for (char c : utf8) {
    bytes.push_back(static_cast<uint8_t>(c));
    bytes.push_back(0);
  }
  tabrescue::IngestOptions options;

  for (auto _ : state) {
    auto decoded = tabrescue::decode(bytes, options);
    benchmark::DoNotOptimize(decoded);
  }
  state.SetBytesProcessed(static_cast<int64_t>(bytes.size() * state.iterations()));
}
BENCHMARK(BM_DecodeUtf16)->RangeMultiplier(10)->Range(100, 100000)->Unit(benchmark::kMillisecond);

static void BM_InferDelimiter(benchmark::State& state) {
  std::string text = make_input(1000, 30, 5, false, '|');
  auto sample = tabrescue::sample_lines(text, static_cast<size_t>(state.range(0)));
  tabrescue::DelimiterInferencer inferencer;

  for (auto _ : state) {
    auto result = inferencer.infer(sample);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_InferDelimiter)->Arg(50)->Arg(200)->Arg(1000);

BENCHMARK_MAIN();
