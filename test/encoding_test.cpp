#include "tabrescue/encoding.h"
#include "tabrescue/error.h"

#include "test_util.h"

#include <gtest/gtest.h>

using namespace tabrescue;
using test_util::bytes;

namespace {

const std::string REPLACEMENT = "\xEF\xBF\xBD";

DecodedText decode_default(const std::string& raw) {
  IngestOptions options;
  return decode(bytes(raw), options);
}

bool has_null(const std::string& s) { return s.find('\0') != std::string::npos; }

// ASCII text as BOM-less UTF-16.
std::string widen(const std::string& ascii, bool big_endian) {
  std::string out;
  for (char c : ascii) {
    if (big_endian)
      out += '\0';
    out += c;
    if (!big_endian)
      out += '\0';
  }
  return out;
}

std::string repeat(const std::string& s, size_t n) {
  std::string out;
  for (size_t i = 0; i < n; ++i)
    out += s;
  return out;
}

} // namespace

// ============================================================================
// WIDE ENCODING DETECTION
// ============================================================================

TEST(EncodingDetectionTest, Utf16LeBom) {
  std::string raw("\xFF\xFE"
                  "a\0,\0b\0",
                  8);
  auto result = detect_wide_encoding(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
  EXPECT_EQ(result.encoding, CharEncoding::UTF16_LE);
  EXPECT_EQ(result.bom_length, 2u);
  EXPECT_TRUE(result.from_bom);
  EXPECT_TRUE(result.is_wide());
}

TEST(EncodingDetectionTest, Utf16BeBom) {
  std::string raw("\xFE\xFF\0a\0b", 6);
  auto result = detect_wide_encoding(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
  EXPECT_EQ(result.encoding, CharEncoding::UTF16_BE);
  EXPECT_EQ(result.bom_length, 2u);
}

TEST(EncodingDetectionTest, Utf32BomCheckedBeforeUtf16) {
  std::string raw("\xFF\xFE\0\0a\0\0\0", 8);
  auto result = detect_wide_encoding(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
  EXPECT_EQ(result.encoding, CharEncoding::UTF32_LE);
  EXPECT_EQ(result.bom_length, 4u);
}

TEST(EncodingDetectionTest, NullRatioWithoutBomLittleEndian) {
  std::string raw = widen(repeat("a,b\n", 30), false);
  auto result = detect_wide_encoding(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
  EXPECT_EQ(result.encoding, CharEncoding::UTF16_LE);
  EXPECT_FALSE(result.from_bom);
  EXPECT_EQ(result.bom_length, 0u);
}

TEST(EncodingDetectionTest, NullRatioWithoutBomBigEndian) {
  std::string raw = widen(repeat("abc\n", 30), true);
  auto result = detect_wide_encoding(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
  EXPECT_EQ(result.encoding, CharEncoding::UTF16_BE);
}

TEST(EncodingDetectionTest, ShortInputWithStrayNullsIsNotWide) {
  std::string raw("id,v\n1,\0\n2,\0\n\0", 14);
  auto result = detect_wide_encoding(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
  EXPECT_FALSE(result.is_wide());
}

TEST(EncodingDetectionTest, SniffWindowIsConfigurable) {
  std::string raw("a\0,\0b\0\n\0", 8);
  auto result =
      detect_wide_encoding(reinterpret_cast<const uint8_t*>(raw.data()), raw.size(), 8, 0.10);
  EXPECT_EQ(result.encoding, CharEncoding::UTF16_LE);
}

TEST(EncodingDetectionTest, PlainAsciiIsNotWide) {
  std::string raw = "id,name\n1,alice\n";
  auto result = detect_wide_encoding(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
  EXPECT_FALSE(result.is_wide());
}

TEST(EncodingDetectionTest, TooShortToSniff) {
  std::string raw("\0", 1);
  auto result = detect_wide_encoding(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
  EXPECT_FALSE(result.is_wide());
}

TEST(EncodingDetectionTest, OnlyLeadingBytesAreSniffed) {
  // Nulls far past the sniff window do not make the data wide.
  std::string raw(300, 'x');
  raw += std::string(100, '\0');
  auto result = detect_wide_encoding(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
  EXPECT_FALSE(result.is_wide());
}

// ============================================================================
// ENCODING NAMES
// ============================================================================

TEST(EncodingNameTest, ParseVariants) {
  EXPECT_EQ(parse_encoding_name("utf-8"), CharEncoding::UTF8);
  EXPECT_EQ(parse_encoding_name("UTF8"), CharEncoding::UTF8);
  EXPECT_EQ(parse_encoding_name("utf-8-sig"), CharEncoding::UTF8_SIG);
  EXPECT_EQ(parse_encoding_name("utf_16_le"), CharEncoding::UTF16_LE);
  EXPECT_EQ(parse_encoding_name("UTF-16BE"), CharEncoding::UTF16_BE);
  EXPECT_EQ(parse_encoding_name("utf-32le"), CharEncoding::UTF32_LE);
  EXPECT_EQ(parse_encoding_name("latin1"), CharEncoding::LATIN1);
  EXPECT_EQ(parse_encoding_name("ISO-8859-1"), CharEncoding::LATIN1);
  EXPECT_EQ(parse_encoding_name("cp1252"), CharEncoding::WINDOWS_1252);
  EXPECT_EQ(parse_encoding_name("windows-1252"), CharEncoding::WINDOWS_1252);
  EXPECT_EQ(parse_encoding_name("ebcdic"), CharEncoding::UNKNOWN);
}

TEST(EncodingNameTest, ToString) {
  EXPECT_STREQ(encoding_to_string(CharEncoding::UTF8), "UTF-8");
  EXPECT_STREQ(encoding_to_string(CharEncoding::UTF16_LE), "UTF-16LE");
  EXPECT_STREQ(encoding_to_string(CharEncoding::WINDOWS_1252), "Windows-1252");
}

// ============================================================================
// DECODING
// ============================================================================

TEST(DecodeTest, Utf16LeBomDecodesWithoutNulls) {
  std::string raw("\xFF\xFE"
                  "a\0,\0b\0\n\0",
                  10);
  auto decoded = decode_default(raw);
  EXPECT_EQ(decoded.text, "a,b\n");
  EXPECT_EQ(decoded.encoding, CharEncoding::UTF16_LE);
  EXPECT_TRUE(decoded.wide_detected);
  EXPECT_FALSE(has_null(decoded.text));
}

TEST(DecodeTest, Utf16BeBomDecodesWithoutNulls) {
  std::string raw("\xFE\xFF\0x\0;\0y", 8);
  auto decoded = decode_default(raw);
  EXPECT_EQ(decoded.text, "x;y");
  EXPECT_EQ(decoded.encoding, CharEncoding::UTF16_BE);
  EXPECT_FALSE(has_null(decoded.text));
}

TEST(DecodeTest, BomlessUtf16ByNullRatio) {
  auto decoded = decode_default(widen(repeat("a,b\n", 30), false));
  EXPECT_EQ(decoded.text, repeat("a,b\n", 30));
  EXPECT_TRUE(decoded.wide_detected);
  EXPECT_FALSE(has_null(decoded.text));
}

TEST(DecodeTest, ShortNarrowInputKeepsRowsAndDropsNulls) {
  auto decoded = decode_default(std::string("id,v\n1,\0\n2,\0\n\0", 14));
  EXPECT_FALSE(decoded.wide_detected);
  EXPECT_EQ(decoded.text, "id,v\n1,\n2,\n");
  EXPECT_EQ(decoded.nulls_stripped, 3u);
}

TEST(DecodeTest, Utf32LeBom) {
  std::string raw("\xFF\xFE\0\0h\0\0\0i\0\0\0", 12);
  auto decoded = decode_default(raw);
  EXPECT_EQ(decoded.text, "hi");
  EXPECT_EQ(decoded.encoding, CharEncoding::UTF32_LE);
}

TEST(DecodeTest, Utf16NonAsciiCharacters) {
  // "é" is U+00E9
  std::string raw("\xFF\xFE\xE9\0", 4);
  auto decoded = decode_default(raw);
  EXPECT_EQ(decoded.text, "\xC3\xA9");
}

TEST(DecodeTest, BrokenWideDataFallsBackToNarrowPath) {
  // BOM followed by an unpaired high surrogate.
  std::string raw("\xFF\xFE\x00\xD8"
                  "a\0",
                  6);
  auto decoded = decode_default(raw);
  EXPECT_TRUE(decoded.wide_detected);
  EXPECT_EQ(decoded.encoding, CharEncoding::UTF8_SIG);
  EXPECT_FALSE(has_null(decoded.text));
  EXPECT_NE(decoded.text.find('a'), std::string::npos);
  EXPECT_GT(decoded.replaced_sequences, 0u);
}

TEST(DecodeTest, Utf8BomStripped) {
  auto decoded = decode_default("\xEF\xBB\xBFid,name\n");
  EXPECT_EQ(decoded.text, "id,name\n");
  EXPECT_EQ(decoded.encoding, CharEncoding::UTF8_SIG);
  EXPECT_EQ(decoded.replaced_sequences, 0u);
}

TEST(DecodeTest, ValidUtf8Unchanged) {
  std::string text = "name,city\nJos\xC3\xA9,M\xC3\xBCnchen\n";
  auto decoded = decode_default(text);
  EXPECT_EQ(decoded.text, text);
  EXPECT_EQ(decoded.replaced_sequences, 0u);
}

TEST(DecodeTest, InvalidByteReplacedNotTruncated) {
  auto decoded = decode_default("a\xFF"
                                "b,c\n");
  EXPECT_EQ(decoded.text, "a" + REPLACEMENT + "b,c\n");
  EXPECT_EQ(decoded.replaced_sequences, 1u);
}

TEST(DecodeTest, TruncatedSequenceReplacedOnce) {
  // E2 82 is the start of a three-byte sequence cut short by 'b'.
  auto decoded = decode_default("a\xE2\x82"
                                "b");
  EXPECT_EQ(decoded.text, "a" + REPLACEMENT + "b");
  EXPECT_EQ(decoded.replaced_sequences, 1u);
}

TEST(DecodeTest, NullBytesStrippedOnNarrowPath) {
  std::string raw("name,value\nalpha,1\nbeta,2", 25);
  raw.insert(raw.begin() + 13, '\0');
  auto decoded = decode_default(raw);
  EXPECT_FALSE(decoded.wide_detected);
  EXPECT_EQ(decoded.text, "name,value\nalpha,1\nbeta,2");
  EXPECT_EQ(decoded.nulls_stripped, 1u);
}

TEST(DecodeTest, ExplicitLatin1) {
  IngestOptions options;
  options.encoding = "latin1";
  auto decoded = decode(bytes("caf\xE9"), options);
  EXPECT_EQ(decoded.text, "caf\xC3\xA9");
  EXPECT_EQ(decoded.encoding, CharEncoding::LATIN1);
}

TEST(DecodeTest, ExplicitCp1252SmartQuotes) {
  IngestOptions options;
  options.encoding = "cp1252";
  auto decoded = decode(bytes("\x93hi\x94 \x80"), options);
  EXPECT_EQ(decoded.text, "\xE2\x80\x9Chi\xE2\x80\x9D \xE2\x82\xAC");
}

TEST(DecodeTest, Cp1252UndefinedByteReplaced) {
  IngestOptions options;
  options.encoding = "cp1252";
  auto decoded = decode(bytes("a\x81z"), options);
  EXPECT_EQ(decoded.text, "a" + REPLACEMENT + "z");
  EXPECT_EQ(decoded.replaced_sequences, 1u);
}

TEST(DecodeTest, ExplicitEncodingSkipsWideDetection) {
  IngestOptions options;
  options.encoding = "latin1";
  std::string raw("\xFF\xFE"
                  "a\0",
                  4);
  auto decoded = decode(bytes(raw), options);
  EXPECT_FALSE(decoded.wide_detected);
  EXPECT_EQ(decoded.encoding, CharEncoding::LATIN1);
  EXPECT_EQ(decoded.text, "\xC3\xBF\xC3\xBE"
                          "a");
}

TEST(DecodeTest, UnknownNamesSkipped) {
  IngestOptions options;
  options.encodings = {"klingon", "latin1"};
  auto decoded = decode(bytes("ok"), options);
  EXPECT_EQ(decoded.encoding, CharEncoding::LATIN1);
  EXPECT_EQ(decoded.text, "ok");
}

TEST(DecodeTest, NoUsableEncodingThrows) {
  IngestOptions options;
  options.encodings = {"klingon", "ebcdic"};
  try {
    decode(bytes("ok"), options);
    FAIL() << "Expected DecodeError";
  } catch (const DecodeError& e) {
    ASSERT_EQ(e.tried().size(), 2u);
    EXPECT_EQ(e.tried()[0], "klingon");
    EXPECT_EQ(e.tried()[1], "ebcdic");
    EXPECT_NE(std::string(e.what()).find("klingon"), std::string::npos);
  }
}

TEST(DecodeTest, EmptyInput) {
  auto decoded = decode_default("");
  EXPECT_TRUE(decoded.text.empty());
  EXPECT_FALSE(decoded.wide_detected);
}

TEST(DecodeAsTest, Utf16OddTrailingByteReplaced) {
  std::string raw("a\0b", 3);
  std::string out;
  size_t replaced = 0;
  ASSERT_TRUE(decode_as(reinterpret_cast<const uint8_t*>(raw.data()), raw.size(),
                        CharEncoding::UTF16_LE, out, replaced));
  EXPECT_EQ(out, "a" + REPLACEMENT);
  EXPECT_EQ(replaced, 1u);
}

TEST(DecodeAsTest, UnknownEncodingFails) {
  std::string out;
  size_t replaced = 0;
  const uint8_t data[] = {'x'};
  EXPECT_FALSE(decode_as(data, 1, CharEncoding::UNKNOWN, out, replaced));
}

TEST(StripNullsTest, CountsRemoved) {
  std::string s("a\0b\0\0c", 6);
  EXPECT_EQ(strip_nulls(s), 3u);
  EXPECT_EQ(s, "abc");
}
