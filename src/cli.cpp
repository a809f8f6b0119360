/**
 * tabrescue - Load messy delimited text into a fixed-width table without
 * dropping rows.
 */

#include "tabrescue/tabrescue.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace std;

constexpr const char* VERSION = "0.1.0";

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_INGEST_FAILED = 2;

// Upper bounds for numeric options
constexpr size_t MAX_COLUMNS = 100000;
constexpr size_t MAX_SAMPLE_LINES = 10000000;
constexpr size_t MAX_FIELD_BYTES = size_t{1} << 30;

void printUsage(const char* prog) {
  cerr << "tabrescue - Resilient delimited-text ingestion\n\n";
  cerr << "Usage: " << prog << " [options] <file|->\n\n";
  cerr << "Arguments:\n";
  cerr << "  file          Path to the input file, or '-' to read from stdin.\n";
  cerr << "\nOptions:\n";
  cerr << "  -c <cols>     Expected column count (default: 106, 0 = header width)\n";
  cerr << "  -m <column>   Column that receives overflow fields (default: last)\n";
  cerr << "  -d <delim>    Field delimiter (disables inference)\n";
  cerr << "                Values: comma, tab, semicolon, pipe, or single character\n";
  cerr << "  -e <enc>      Decode with this encoding only\n";
  cerr << "                Values: utf-8, utf-8-sig, utf-16le, utf-16be, utf-32le,\n";
  cerr << "                        utf-32be, latin1, cp1252\n";
  cerr << "  -n <lines>    Lines sampled for delimiter inference (default: 200)\n";
  cerr << "  -f <bytes>    Maximum field size (default: 16MB)\n";
  cerr << "  -o <file>     Write the normalized table to file ('-' for stdout)\n";
  cerr << "  -H            No header row in input\n";
  cerr << "  -b            Skip blank lines instead of keeping them as padded rows\n";
  cerr << "  -q            Quiet: no report, errors only\n";
  cerr << "  -v            Verbose: debug logging\n";
  cerr << "  -l <file>     Write the log to file instead of stderr\n";
  cerr << "  -h            Show this help message\n";
  cerr << "  -V            Show version information\n";
  cerr << "\nExit status: 0 on success, 1 on usage error, 2 if the input could not\n";
  cerr << "be read, decoded or parsed.\n";
}

void printVersion() { cout << "tabrescue version " << VERSION << "\n"; }

// Parse delimiter string (handles keywords like "tab", "comma", etc.)
bool parseDelimiter(const string& delimiter_str, char& out) {
  if (delimiter_str == "comma" || delimiter_str == ",") {
    out = ',';
  } else if (delimiter_str == "tab" || delimiter_str == "\\t") {
    out = '\t';
  } else if (delimiter_str == "semicolon" || delimiter_str == ";") {
    out = ';';
  } else if (delimiter_str == "pipe" || delimiter_str == "|") {
    out = '|';
  } else if (delimiter_str.length() == 1) {
    out = delimiter_str[0];
  } else {
    return false;
  }
  return true;
}

// Parse a non-negative decimal no larger than max_value
bool parseCount(const char* arg, size_t max_value, size_t& out) {
  if (!isdigit(static_cast<unsigned char>(*arg))) {
    return false;
  }
  char* endptr;
  errno = 0;
  unsigned long long val = strtoull(arg, &endptr, 10);
  if (*endptr != '\0' || errno == ERANGE || val > max_value) {
    return false;
  }
  out = static_cast<size_t>(val);
  return true;
}

int main(int argc, char* argv[]) {
  tabrescue::IngestOptions options;
  string output_path;
  string log_path;
  bool quiet = false;
  bool verbose = false;

  int c;
  while ((c = getopt(argc, argv, "c:m:d:e:n:f:o:Hbqvl:hV")) != -1) {
    switch (c) {
    case 'c':
      if (!parseCount(optarg, MAX_COLUMNS, options.expected_columns)) {
        cerr << "Error: Invalid column count '" << optarg << "' (0 to " << MAX_COLUMNS << ")\n";
        return EXIT_USAGE;
      }
      break;
    case 'm':
      options.merge_column = string(optarg);
      break;
    case 'd': {
      char delim;
      if (!parseDelimiter(optarg, delim)) {
        cerr << "Error: Delimiter must be a single character or one of comma, tab, "
                "semicolon, pipe\n";
        return EXIT_USAGE;
      }
      options.delimiter = delim;
      break;
    }
    case 'e':
      if (tabrescue::parse_encoding_name(optarg) == tabrescue::CharEncoding::UNKNOWN) {
        cerr << "Error: Unknown encoding '" << optarg << "'\n";
        return EXIT_USAGE;
      }
      options.encoding = string(optarg);
      break;
    case 'n':
      if (!parseCount(optarg, MAX_SAMPLE_LINES, options.sample_lines) ||
          options.sample_lines == 0) {
        cerr << "Error: Invalid sample size '" << optarg << "'\n";
        return EXIT_USAGE;
      }
      break;
    case 'f':
      if (!parseCount(optarg, MAX_FIELD_BYTES, options.max_field_size) ||
          options.max_field_size == 0) {
        cerr << "Error: Invalid maximum field size '" << optarg << "'\n";
        return EXIT_USAGE;
      }
      break;
    case 'o':
      output_path = optarg;
      break;
    case 'H':
      options.has_header = false;
      break;
    case 'b':
      options.skip_empty_rows = true;
      break;
    case 'q':
      quiet = true;
      break;
    case 'v':
      verbose = true;
      break;
    case 'l':
      log_path = optarg;
      break;
    case 'h':
      printUsage(argv[0]);
      return EXIT_OK;
    case 'V':
      printVersion();
      return EXIT_OK;
    default:
      printUsage(argv[0]);
      return EXIT_USAGE;
    }
  }

  if (optind != argc - 1) {
    cerr << "Error: Exactly one input file (or '-') is required\n";
    printUsage(argv[0]);
    return EXIT_USAGE;
  }
  const string input = argv[optind];

  if (!log_path.empty()) {
    try {
      auto log = spdlog::basic_logger_mt("tabrescue", log_path, true);
      spdlog::set_default_logger(log);
    } catch (const spdlog::spdlog_ex& e) {
      cerr << "Error: Could not open log file '" << log_path << "': " << e.what() << "\n";
      return EXIT_USAGE;
    }
  }
  spdlog::set_level(verbose ? spdlog::level::debug
                            : quiet ? spdlog::level::err
                                    : spdlog::level::warn);

  tabrescue::IngestResult result;
  try {
    tabrescue::Ingestor ingestor(options);
    if (input == "-") {
      result = ingestor.read_buffer(tabrescue::read_stdin(), "<stdin>");
    } else {
      result = ingestor.read_file(input);
    }
  } catch (const std::invalid_argument& e) {
    cerr << "Error: " << e.what() << "\n";
    return EXIT_USAGE;
  } catch (const tabrescue::IngestExhaustedError& e) {
    cerr << e.what() << "\n";
    return EXIT_INGEST_FAILED;
  } catch (const tabrescue::DecodeError& e) {
    cerr << "Error: " << e.what() << "\n";
    return EXIT_INGEST_FAILED;
  } catch (const tabrescue::IoError& e) {
    cerr << "Error: " << e.what() << "\n";
    return EXIT_INGEST_FAILED;
  }

  // The report goes to stderr when stdout carries the table.
  const bool table_on_stdout = output_path == "-";
  if (!quiet) {
    (table_on_stdout ? cerr : cout) << tabrescue::format_report(result.report);
  }
  if (!log_path.empty()) {
    tabrescue::log_report(result.report);
  }

  if (table_on_stdout) {
    tabrescue::write_table(result.table, cout, result.report.delimiter);
  } else if (!output_path.empty()) {
    ofstream out(output_path, ios::binary);
    if (!out) {
      cerr << "Error: Could not open output file '" << output_path << "': " << strerror(errno)
           << "\n";
      return EXIT_INGEST_FAILED;
    }
    tabrescue::write_table(result.table, out, result.report.delimiter);
    out.close();
    if (!out) {
      cerr << "Error: Could not write output file '" << output_path << "'\n";
      return EXIT_INGEST_FAILED;
    }
  }

  std::cout.flush();
  std::cerr.flush();
  spdlog::shutdown();
  return EXIT_OK;
}
