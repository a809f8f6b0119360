/**
 * @file cli_test.cpp
 * @brief Tests for the tabrescue command-line front end.
 *
 * Runs the built binary through popen and checks exit codes, the report,
 * and the table written with -o.
 */

#include "test_util.h"

#include <array>
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <sys/wait.h>

#ifndef TABRESCUE_CLI_PATH
#define TABRESCUE_CLI_PATH "./tabrescue"
#endif

using test_util::TempCsvFile;
using test_util::TempOutputFile;

// Helper class to run CLI commands and capture output
class CliRunner {
public:
  struct Result {
    int exit_code;
    std::string output; // stdout
    std::string error;  // stderr
  };

  static Result run(const std::string& args) {
    TempOutputFile err_file(".err");
    std::string cmd = std::string(TABRESCUE_CLI_PATH) + " " + args + " 2>" + err_file.path();

    Result result;
    std::array<char, 4096> buffer;

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"), pclose);
    if (!pipe) {
      result.exit_code = -1;
      return result;
    }

    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
      result.output += buffer.data();
    }

    int status = pclose(pipe.release());
    if (WIFEXITED(status)) {
      result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      result.exit_code = 128 + WTERMSIG(status);
    } else {
      result.exit_code = -1;
    }

    result.error = readFile(err_file.path());
    return result;
  }

  // Run with file content piped to stdin
  static Result runWithFileStdin(const std::string& args, const std::string& filepath) {
    return run(args + " < " + filepath);
  }

  static std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }
};

class CliTest : public ::testing::Test {};

// =============================================================================
// Usage and version
// =============================================================================

TEST_F(CliTest, NoArgumentsIsUsageError) {
  auto result = CliRunner::run("");
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.error.find("Usage:"), std::string::npos);
}

TEST_F(CliTest, HelpExitsZero) {
  auto result = CliRunner::run("-h");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.error.find("Usage:"), std::string::npos);
  EXPECT_NE(result.error.find("-c <cols>"), std::string::npos);
}

TEST_F(CliTest, VersionGoesToStdout) {
  auto result = CliRunner::run("-V");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.output.find("tabrescue version"), std::string::npos);
}

TEST_F(CliTest, UnknownOptionIsUsageError) {
  auto result = CliRunner::run("-Z file.csv");
  EXPECT_EQ(result.exit_code, 1);
}

TEST_F(CliTest, TwoInputsIsUsageError) {
  TempCsvFile a("x,y\n1,2\n");
  TempCsvFile b("x,y\n1,2\n");
  auto result = CliRunner::run("-c 2 " + a.path() + " " + b.path());
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.error.find("Exactly one input"), std::string::npos);
}

// =============================================================================
// Numeric options
// =============================================================================

TEST_F(CliTest, ColumnCountMustBeNumeric) {
  TempCsvFile csv("a,b\n1,2\n");
  EXPECT_EQ(CliRunner::run("-c abc " + csv.path()).exit_code, 1);
  EXPECT_EQ(CliRunner::run("-c 3x " + csv.path()).exit_code, 1);
  EXPECT_EQ(CliRunner::run("-c -3 " + csv.path()).exit_code, 1);
  EXPECT_EQ(CliRunner::run("-c ' 3' " + csv.path()).exit_code, 1);
}

TEST_F(CliTest, ColumnCountOutOfRangeIsRejected) {
  TempCsvFile csv("a,b\n1,2\n");
  // Overflows a 64-bit integer
  auto overflow = CliRunner::run("-c 99999999999999999999 " + csv.path());
  EXPECT_EQ(overflow.exit_code, 1);
  EXPECT_NE(overflow.error.find("Invalid column count"), std::string::npos);

  // Fits an integer but no sane table is this wide
  auto huge = CliRunner::run("-c 5000000000 " + csv.path());
  EXPECT_EQ(huge.exit_code, 1);
  EXPECT_NE(huge.error.find("Invalid column count"), std::string::npos);

  EXPECT_EQ(CliRunner::run("-c 100001 " + csv.path()).exit_code, 1);
  EXPECT_EQ(CliRunner::run("-q -c 100000 " + csv.path()).exit_code, 0);
}

TEST_F(CliTest, SampleSizeMustBePositive) {
  TempCsvFile csv("a,b\n1,2\n");
  EXPECT_EQ(CliRunner::run("-n 0 -c 2 " + csv.path()).exit_code, 1);
  EXPECT_EQ(CliRunner::run("-n 99999999999999999999 -c 2 " + csv.path()).exit_code, 1);
  EXPECT_EQ(CliRunner::run("-n 5 -c 2 " + csv.path()).exit_code, 0);
}

TEST_F(CliTest, FieldSizeMustBePositive) {
  TempCsvFile csv("a,b\n1,2\n");
  EXPECT_EQ(CliRunner::run("-f 0 -c 2 " + csv.path()).exit_code, 1);
  EXPECT_EQ(CliRunner::run("-f 99999999999999999999 -c 2 " + csv.path()).exit_code, 1);
}

// =============================================================================
// Delimiter and encoding options
// =============================================================================

TEST_F(CliTest, InvalidDelimiterIsUsageError) {
  TempCsvFile csv("a,b\n1,2\n");
  auto result = CliRunner::run("-d colon " + csv.path());
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.error.find("Delimiter must be"), std::string::npos);
}

TEST_F(CliTest, DelimiterKeyword) {
  TempCsvFile tsv("a\tb\n1,5\t2\n", ".tsv");
  auto result = CliRunner::run("-c 2 -d tab " + tsv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.output.find("Delimiter='\\t'"), std::string::npos);
  EXPECT_EQ(result.output.find("(inferred)"), std::string::npos);
}

TEST_F(CliTest, InferredDelimiterIsReported) {
  TempCsvFile csv("a;b;c\n1;2;3\n4;5;6\n");
  auto result = CliRunner::run("-c 3 " + csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.output.find("Delimiter=';' (inferred)"), std::string::npos);
}

TEST_F(CliTest, UnknownEncodingIsUsageError) {
  TempCsvFile csv("a,b\n1,2\n");
  auto result = CliRunner::run("-e ebcdic " + csv.path());
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.error.find("Unknown encoding"), std::string::npos);
}

TEST_F(CliTest, ExplicitEncoding) {
  TempCsvFile csv("name,city\nJos\xE9,Paris\n");
  auto result = CliRunner::run("-c 2 -e latin1 " + csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.output.find("Encoding: Latin-1"), std::string::npos);
}

// =============================================================================
// Ingestion
// =============================================================================

TEST_F(CliTest, ReportOnStdout) {
  TempCsvFile csv("a,b,c\n1,2,3\n4,5,6\n");
  auto result = CliRunner::run("-c 3 " + csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.output.find("Loaded 2 rows with exactly 3 columns"), std::string::npos);
  EXPECT_NE(result.output.find("Strategy: strict-quote"), std::string::npos);
}

TEST_F(CliTest, QuietSuppressesReport) {
  TempCsvFile csv("a,b,c\n1,2,3\n");
  auto result = CliRunner::run("-q -c 3 " + csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_TRUE(result.output.empty());
}

TEST_F(CliTest, TableOnStdoutMovesReportToStderr) {
  TempCsvFile csv("a,b,c\n1,2,3,4\n5\n");
  auto result = CliRunner::run("-c 3 -o - " + csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.output, "a,b,c\n1,2,\"3,4\"\n5,,\n");
  EXPECT_NE(result.error.find("Loaded 2 rows"), std::string::npos);
}

TEST_F(CliTest, WritesTableToFile) {
  TempCsvFile csv("id|note\n1|fine\n2|a|b\n");
  TempOutputFile out;
  auto result = CliRunner::run("-c 2 -o " + out.path() + " " + csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(CliRunner::readFile(out.path()), "id|note\n1|fine\n2|a,b\n");
}

TEST_F(CliTest, HeaderWidthWhenColumnCountIsZero) {
  TempCsvFile csv("a,b\n1,2,3\n");
  auto result = CliRunner::run("-c 0 -o - " + csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.output, "a,b\n1,\"2,3\"\n");
}

TEST_F(CliTest, MergeColumnOption) {
  TempCsvFile csv("id,note,tail\n1,x,y,z\n");
  auto result = CliRunner::run("-c 3 -m note -o - " + csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.output, "id,note,tail\n1,\"x,z\",y\n");
}

TEST_F(CliTest, BlankLinesKeptByDefault) {
  TempCsvFile csv("a,b\n1,2\n\n3,4\n");
  auto result = CliRunner::run("-c 2 -o - " + csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.output, "a,b\n1,2\n,\n3,4\n");
  EXPECT_NE(result.error.find("Loaded 3 rows"), std::string::npos);
}

TEST_F(CliTest, SkipBlankLinesOption) {
  TempCsvFile csv("a,b\n1,2\n\n3,4\n");
  auto result = CliRunner::run("-b -c 2 " + csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.output.find("Loaded 2 rows"), std::string::npos);
  EXPECT_NE(result.output.find("Blank lines skipped: 1"), std::string::npos);
}

TEST_F(CliTest, NoHeaderOption) {
  TempCsvFile csv("1,2\n3,4\n");
  auto result = CliRunner::run("-H -c 2 " + csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.output.find("Loaded 2 rows"), std::string::npos);
}

TEST_F(CliTest, ReadsStdin) {
  TempCsvFile csv("a,b\n1,2\n");
  auto result = CliRunner::runWithFileStdin("-c 2 -", csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.output.find("Source: <stdin>"), std::string::npos);
}

TEST_F(CliTest, LogFileOption) {
  TempCsvFile csv("a,b\n1,2\n");
  TempOutputFile log(".log");
  auto result = CliRunner::run("-v -c 2 -l " + log.path() + " " + csv.path());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(CliRunner::readFile(log.path()).find("Loaded 1 rows with exactly 2 columns"),
            std::string::npos);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(CliTest, MissingFileFails) {
  auto result = CliRunner::run("-c 2 /nonexistent/tabrescue_input.csv");
  EXPECT_EQ(result.exit_code, 2);
  EXPECT_NE(result.error.find("Error:"), std::string::npos);
}

TEST_F(CliTest, ExhaustedStrategiesFail) {
  TempCsvFile csv("a,b\n1,abcdefghij\n");
  auto result = CliRunner::run("-c 2 -f 4 " + csv.path());
  EXPECT_EQ(result.exit_code, 2);
  EXPECT_NE(result.error.find("Could not parse delimited text without skipping lines"),
            std::string::npos);
  EXPECT_NE(result.error.find("FIELD_TOO_LARGE"), std::string::npos);
}

TEST_F(CliTest, UnwritableOutputFails) {
  TempCsvFile csv("a,b\n1,2\n");
  auto result = CliRunner::run("-q -c 2 -o /nonexistent/dir/out.csv " + csv.path());
  EXPECT_EQ(result.exit_code, 2);
  EXPECT_NE(result.error.find("Could not open output file"), std::string::npos);
}
