/**
 * @file encoding.h
 * @brief Byte decoding: encoding detection and transcoding to clean UTF-8.
 *
 * The decoder turns raw file bytes into text the tokenizers can rely on:
 * valid UTF-8 (invalid sequences replaced by U+FFFD) with no null bytes.
 *
 * Detection order:
 * 1. Wide-character BOM (UTF-32 LE/BE, then UTF-16 LE/BE).
 * 2. Null-byte ratio of the leading bytes: above the threshold the data is
 *    treated as BOM-less UTF-16, byte order chosen by null positions.
 * 3. Wide decoding is strict. If it fails, the narrow path runs instead.
 * 4. Narrow path: the configured encoding list is tried in order; the first
 *    encoding that decodes is used, replacing invalid input.
 *
 * Transcoding uses simdutf.
 */

#pragma once

#include "io_util.h"
#include "options.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tabrescue {

/// Character encodings the decoder can read.
enum class CharEncoding : uint8_t {
  UTF8 = 0,
  UTF8_SIG = 1, // UTF-8, leading BOM stripped if present
  UTF16_LE = 2,
  UTF16_BE = 3,
  UTF32_LE = 4,
  UTF32_BE = 5,
  LATIN1 = 6,
  WINDOWS_1252 = 7,
  UNKNOWN = 255
};

/// Result of wide-encoding detection.
struct EncodingResult {
  CharEncoding encoding = CharEncoding::UTF8;
  size_t bom_length = 0;
  bool from_bom = false;

  /// True if the bytes look like a UTF-16 or UTF-32 encoding.
  bool is_wide() const {
    return encoding == CharEncoding::UTF16_LE || encoding == CharEncoding::UTF16_BE ||
           encoding == CharEncoding::UTF32_LE || encoding == CharEncoding::UTF32_BE;
  }
};

/// Clean decoded text plus what it took to produce it.
struct DecodedText {
  std::string text;                          // UTF-8, no null bytes
  CharEncoding encoding = CharEncoding::UTF8; // Encoding actually used
  bool wide_detected = false;                 // BOM or null-ratio said UTF-16/32
  size_t replaced_sequences = 0;              // Invalid sequences replaced by U+FFFD
  size_t nulls_stripped = 0;
};

/// Get the string name of an encoding (e.g., "UTF-8", "UTF-16LE").
const char* encoding_to_string(CharEncoding enc);

/// Parse an encoding name string to CharEncoding.
/// Accepts various forms: "utf-8", "UTF8", "utf-8-sig", "utf-16le",
/// "latin1", "iso-8859-1", "windows-1252", "cp1252", etc.
/// Returns CharEncoding::UNKNOWN for unrecognized names.
CharEncoding parse_encoding_name(std::string_view name);

/// Detect a wide encoding from a BOM or from the null-byte ratio of the first
/// `sniff_bytes` bytes. The ratio is only consulted when at least
/// `sniff_bytes` bytes are available. Returns UTF8 when the data does not look wide.
EncodingResult detect_wide_encoding(const uint8_t* data, size_t size, size_t sniff_bytes = 200,
                                    double null_ratio = 0.10);

/// Decode with exactly one encoding, replacing invalid input with U+FFFD.
/// Null bytes are kept. Returns false only for UNKNOWN encodings.
bool decode_as(const uint8_t* data, size_t size, CharEncoding enc, std::string& out,
               size_t& replaced);

/// Remove every null byte from `text`, returning how many were removed.
size_t strip_nulls(std::string& text);

/**
 * @brief Decode raw bytes into clean text.
 *
 * @param raw     Unmodified file content.
 * @param options Encoding list, explicit encoding and wide-detection settings.
 * @return DecodedText with no null bytes and no invalid UTF-8.
 * @throws DecodeError if no encoding in the list could be used.
 */
DecodedText decode(const RawBytes& raw, const IngestOptions& options);

} // namespace tabrescue
