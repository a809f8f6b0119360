/**
 * @file fuzz_ingest.cpp
 * @brief LibFuzzer target for the whole ingestion pipeline.
 *
 * Any input either fails with one of the documented exceptions or yields a
 * table in which every row has exactly the expected width and no data row
 * was lost. Anything else aborts.
 */

#include "tabrescue/tabrescue.h"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <cstdlib>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  // 64KB limit: large enough for multi-record inputs, small enough for fast iterations
  constexpr size_t MAX_INPUT_SIZE = 64 * 1024;
  if (size > MAX_INPUT_SIZE)
    size = MAX_INPUT_SIZE;

  static bool quiet = [] {
    spdlog::set_level(spdlog::level::off);
    return true;
  }();
  (void)quiet;

  tabrescue::RawBytes bytes(data, data + size);
  tabrescue::IngestOptions options;
  options.expected_columns = 4;
  options.max_field_size = 4096;

  try {
    auto result = tabrescue::Ingestor(options).read_buffer(bytes, "<fuzz>");
    const auto& table = result.table;
    if (table.num_columns() != options.expected_columns)
      std::abort();
    for (const auto& row : table.rows()) {
      if (row.size() != options.expected_columns)
        std::abort();
    }
    if (result.report.body_rows != table.num_rows())
      std::abort();
    if (result.report.long_rows + result.report.short_rows > table.num_rows())
      std::abort();
  } catch (const tabrescue::IngestExhaustedError& e) {
    if (e.attempts().size() != 4)
      std::abort();
  }
  return 0;
}
