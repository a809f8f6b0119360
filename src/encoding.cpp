/**
 * @file encoding.cpp
 * @brief Byte decoder implementation.
 *
 * Uses simdutf for validation and UTF-16/UTF-32/Latin-1 conversion. Custom
 * handling for Windows-1252 (0x80-0x9F range) which simdutf doesn't support.
 */

#include "tabrescue/encoding.h"

#include "tabrescue/error.h"

#include <simdutf.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <string>
#include <vector>

namespace tabrescue {

namespace {

constexpr const char REPLACEMENT_CHAR[] = "\xEF\xBF\xBD"; // U+FFFD

// Windows-1252 lookup table for bytes 0x80-0x9F.
// These map to Unicode code points that differ from Latin-1.
// Entries of 0 indicate undefined bytes (mapped to U+FFFD replacement char).
const uint32_t windows1252_to_unicode[32] = {
    0x20AC, // 0x80 -> Euro sign
    0,      // 0x81 -> undefined
    0x201A, // 0x82 -> Single low-9 quotation mark
    0x0192, // 0x83 -> Latin small letter f with hook
    0x201E, // 0x84 -> Double low-9 quotation mark
    0x2026, // 0x85 -> Horizontal ellipsis
    0x2020, // 0x86 -> Dagger
    0x2021, // 0x87 -> Double dagger
    0x02C6, // 0x88 -> Modifier letter circumflex accent
    0x2030, // 0x89 -> Per mille sign
    0x0160, // 0x8A -> Latin capital letter S with caron
    0x2039, // 0x8B -> Single left-pointing angle quotation mark
    0x0152, // 0x8C -> Latin capital ligature OE
    0,      // 0x8D -> undefined
    0x017D, // 0x8E -> Latin capital letter Z with caron
    0,      // 0x8F -> undefined
    0,      // 0x90 -> undefined
    0x2018, // 0x91 -> Left single quotation mark
    0x2019, // 0x92 -> Right single quotation mark
    0x201C, // 0x93 -> Left double quotation mark
    0x201D, // 0x94 -> Right double quotation mark
    0x2022, // 0x95 -> Bullet
    0x2013, // 0x96 -> En dash
    0x2014, // 0x97 -> Em dash
    0x02DC, // 0x98 -> Small tilde
    0x2122, // 0x99 -> Trade mark sign
    0x0161, // 0x9A -> Latin small letter s with caron
    0x203A, // 0x9B -> Single right-pointing angle quotation mark
    0x0153, // 0x9C -> Latin small ligature oe
    0,      // 0x9D -> undefined
    0x017E, // 0x9E -> Latin small letter z with caron
    0x0178, // 0x9F -> Latin capital letter Y with diaeresis
};

// Append a Unicode code point as UTF-8.
void append_utf8(uint32_t cp, std::string& out) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Bytes covered by one replacement: the lead byte plus the continuation bytes
// that belong to its (truncated) sequence.
size_t invalid_sequence_length(const uint8_t* p, size_t remaining) {
  size_t expected = 1;
  if (p[0] >= 0xC2 && p[0] <= 0xDF)
    expected = 2;
  else if (p[0] >= 0xE0 && p[0] <= 0xEF)
    expected = 3;
  else if (p[0] >= 0xF0 && p[0] <= 0xF4)
    expected = 4;

  size_t len = 1;
  while (len < expected && len < remaining && (p[len] & 0xC0) == 0x80) {
    ++len;
  }
  return len;
}

size_t append_utf8_replacing(const uint8_t* src, size_t size, std::string& out) {
  size_t replaced = 0;
  size_t pos = 0;
  out.reserve(out.size() + size);

  while (pos < size) {
    const char* chunk = reinterpret_cast<const char*>(src + pos);
    simdutf::result res = simdutf::validate_utf8_with_errors(chunk, size - pos);
    if (res.error == simdutf::error_code::SUCCESS) {
      out.append(chunk, size - pos);
      break;
    }
    out.append(chunk, res.count);
    out.append(REPLACEMENT_CHAR);
    ++replaced;
    size_t bad = pos + res.count;
    pos = bad + invalid_sequence_length(src + bad, size - bad);
  }
  return replaced;
}

size_t append_windows1252(const uint8_t* src, size_t size, std::string& out) {
  size_t replaced = 0;
  out.reserve(out.size() + size + size / 2);

  for (size_t i = 0; i < size; ++i) {
    uint8_t byte = src[i];
    if (byte < 0x80) {
      out += static_cast<char>(byte);
    } else if (byte <= 0x9F) {
      uint32_t cp = windows1252_to_unicode[byte - 0x80];
      if (cp == 0) {
        cp = 0xFFFD;
        ++replaced;
      }
      append_utf8(cp, out);
    } else {
      // 0xA0-0xFF: same as Latin-1 (Unicode code point == byte value)
      append_utf8(static_cast<uint32_t>(byte), out);
    }
  }
  return replaced;
}

void append_latin1(const uint8_t* src, size_t size, std::string& out) {
  const char* in = reinterpret_cast<const char*>(src);
  size_t utf8_len = simdutf::utf8_length_from_latin1(in, size);
  size_t offset = out.size();
  out.resize(offset + utf8_len);
  size_t written = simdutf::convert_latin1_to_utf8(in, size, out.data() + offset);
  out.resize(offset + written);
}

// Transcode UTF-16 code units. In strict mode the first invalid unit (an
// unpaired surrogate or a truncated trailing byte) fails the whole decode;
// otherwise it is replaced and decoding resumes after it.
bool append_utf16(const uint8_t* src, size_t size, bool big_endian, bool strict, std::string& out,
                  size_t& replaced) {
  if (size % 2 != 0 && strict) {
    return false;
  }

  // Copy into aligned char16_t buffer to avoid UB from misaligned reinterpret_cast.
  size_t units = size / 2;
  std::vector<char16_t> aligned16(units);
  if (units > 0) {
    std::memcpy(aligned16.data(), src, units * sizeof(char16_t));
  }

  const char16_t* in = aligned16.data();
  size_t remaining = units;
  std::vector<char> buf;

  while (remaining > 0) {
    buf.resize(remaining * 3);
    simdutf::result res = big_endian
                              ? simdutf::convert_utf16be_to_utf8_with_errors(in, remaining,
                                                                             buf.data())
                              : simdutf::convert_utf16le_to_utf8_with_errors(in, remaining,
                                                                             buf.data());
    if (res.error == simdutf::error_code::SUCCESS) {
      out.append(buf.data(), res.count);
      break;
    }
    if (strict) {
      return false;
    }

    // Everything before the error position is valid.
    size_t valid_units = res.count;
    size_t written = big_endian
                         ? simdutf::convert_valid_utf16be_to_utf8(in, valid_units, buf.data())
                         : simdutf::convert_valid_utf16le_to_utf8(in, valid_units, buf.data());
    out.append(buf.data(), written);
    out.append(REPLACEMENT_CHAR);
    ++replaced;
    in += valid_units + 1;
    remaining -= valid_units + 1;
  }

  if (size % 2 != 0) {
    out.append(REPLACEMENT_CHAR);
    ++replaced;
  }
  return true;
}

bool append_utf32(const uint8_t* src, size_t size, bool big_endian, bool strict, std::string& out,
                  size_t& replaced) {
  if (size % 4 != 0 && strict) {
    return false;
  }

  // Assemble code points explicitly so host byte order does not matter.
  size_t units = size / 4;
  std::vector<char32_t> aligned32(units);
  for (size_t i = 0; i < units; ++i) {
    const uint8_t* p = src + i * 4;
    uint32_t cp = big_endian ? (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
                                   (uint32_t(p[2]) << 8) | uint32_t(p[3])
                             : (uint32_t(p[3]) << 24) | (uint32_t(p[2]) << 16) |
                                   (uint32_t(p[1]) << 8) | uint32_t(p[0]);
    aligned32[i] = static_cast<char32_t>(cp);
  }

  const char32_t* in = aligned32.data();
  size_t remaining = units;
  std::vector<char> buf;

  while (remaining > 0) {
    buf.resize(remaining * 4);
    simdutf::result res = simdutf::convert_utf32_to_utf8_with_errors(in, remaining, buf.data());
    if (res.error == simdutf::error_code::SUCCESS) {
      out.append(buf.data(), res.count);
      break;
    }
    if (strict) {
      return false;
    }
    size_t valid_units = res.count;
    size_t written = simdutf::convert_valid_utf32_to_utf8(in, valid_units, buf.data());
    out.append(buf.data(), written);
    out.append(REPLACEMENT_CHAR);
    ++replaced;
    in += valid_units + 1;
    remaining -= valid_units + 1;
  }

  if (size % 4 != 0) {
    out.append(REPLACEMENT_CHAR);
    ++replaced;
  }
  return true;
}

bool transcode_wide(const uint8_t* src, size_t size, CharEncoding enc, bool strict,
                    std::string& out, size_t& replaced) {
  switch (enc) {
  case CharEncoding::UTF16_LE:
    return append_utf16(src, size, false, strict, out, replaced);
  case CharEncoding::UTF16_BE:
    return append_utf16(src, size, true, strict, out, replaced);
  case CharEncoding::UTF32_LE:
    return append_utf32(src, size, false, strict, out, replaced);
  case CharEncoding::UTF32_BE:
    return append_utf32(src, size, true, strict, out, replaced);
  default:
    return false;
  }
}

} // namespace

const char* encoding_to_string(CharEncoding enc) {
  switch (enc) {
  case CharEncoding::UTF8:
    return "UTF-8";
  case CharEncoding::UTF8_SIG:
    return "UTF-8-SIG";
  case CharEncoding::UTF16_LE:
    return "UTF-16LE";
  case CharEncoding::UTF16_BE:
    return "UTF-16BE";
  case CharEncoding::UTF32_LE:
    return "UTF-32LE";
  case CharEncoding::UTF32_BE:
    return "UTF-32BE";
  case CharEncoding::LATIN1:
    return "Latin-1";
  case CharEncoding::WINDOWS_1252:
    return "Windows-1252";
  case CharEncoding::UNKNOWN:
    return "Unknown";
  }
  return "Unknown";
}

CharEncoding parse_encoding_name(std::string_view name) {
  // Normalize: lowercase, remove hyphens and underscores
  std::string normalized;
  normalized.reserve(name.size());
  for (char c : name) {
    if (c != '-' && c != '_') {
      normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }

  if (normalized == "utf8")
    return CharEncoding::UTF8;
  if (normalized == "utf8sig")
    return CharEncoding::UTF8_SIG;
  if (normalized == "utf16le" || normalized == "utf16")
    return CharEncoding::UTF16_LE;
  if (normalized == "utf16be")
    return CharEncoding::UTF16_BE;
  if (normalized == "utf32le" || normalized == "utf32")
    return CharEncoding::UTF32_LE;
  if (normalized == "utf32be")
    return CharEncoding::UTF32_BE;
  if (normalized == "latin1" || normalized == "iso88591")
    return CharEncoding::LATIN1;
  if (normalized == "windows1252" || normalized == "cp1252" || normalized == "win1252")
    return CharEncoding::WINDOWS_1252;

  return CharEncoding::UNKNOWN;
}

EncodingResult detect_wide_encoding(const uint8_t* data, size_t size, size_t sniff_bytes,
                                    double null_ratio) {
  EncodingResult result;

  // Check UTF-32 BOMs first (4 bytes) before UTF-16 (2 bytes)
  if (size >= 4) {
    if (data[0] == 0xFF && data[1] == 0xFE && data[2] == 0x00 && data[3] == 0x00) {
      result.encoding = CharEncoding::UTF32_LE;
      result.bom_length = 4;
      result.from_bom = true;
      return result;
    }
    if (data[0] == 0x00 && data[1] == 0x00 && data[2] == 0xFE && data[3] == 0xFF) {
      result.encoding = CharEncoding::UTF32_BE;
      result.bom_length = 4;
      result.from_bom = true;
      return result;
    }
  }

  if (size >= 2) {
    if (data[0] == 0xFF && data[1] == 0xFE) {
      result.encoding = CharEncoding::UTF16_LE;
      result.bom_length = 2;
      result.from_bom = true;
      return result;
    }
    if (data[0] == 0xFE && data[1] == 0xFF) {
      result.encoding = CharEncoding::UTF16_BE;
      result.bom_length = 2;
      result.from_bom = true;
      return result;
    }
  }

  // No BOM found: text in UTF-16 carries a null in most ASCII code units.
  // Inputs shorter than the sniff window are too small to judge; stray nulls
  // in them are stripped later instead.
  if (size < sniff_bytes || sniff_bytes < 2) {
    return result;
  }
  const size_t check_bytes = sniff_bytes;

  size_t null_even = 0; // Nulls at even positions (UTF-16BE pattern)
  size_t null_odd = 0;  // Nulls at odd positions (UTF-16LE pattern)
  for (size_t i = 0; i < check_bytes; ++i) {
    if (data[i] == 0) {
      if (i % 2 == 0)
        null_even++;
      else
        null_odd++;
    }
  }

  double ratio = static_cast<double>(null_even + null_odd) / static_cast<double>(check_bytes);
  if (ratio > null_ratio) {
    result.encoding = null_even > null_odd ? CharEncoding::UTF16_BE : CharEncoding::UTF16_LE;
  }
  return result;
}

bool decode_as(const uint8_t* data, size_t size, CharEncoding enc, std::string& out,
               size_t& replaced) {
  out.clear();
  replaced = 0;

  switch (enc) {
  case CharEncoding::UTF8:
    replaced = append_utf8_replacing(data, size, out);
    return true;

  case CharEncoding::UTF8_SIG: {
    size_t skip = (size >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) ? 3 : 0;
    replaced = append_utf8_replacing(data + skip, size - skip, out);
    return true;
  }

  case CharEncoding::UTF16_LE:
  case CharEncoding::UTF16_BE: {
    // A BOM overrides the byte order implied by the name.
    bool big_endian = enc == CharEncoding::UTF16_BE;
    size_t skip = 0;
    if (size >= 2 && data[0] == 0xFF && data[1] == 0xFE) {
      big_endian = false;
      skip = 2;
    } else if (size >= 2 && data[0] == 0xFE && data[1] == 0xFF) {
      big_endian = true;
      skip = 2;
    }
    return append_utf16(data + skip, size - skip, big_endian, false, out, replaced);
  }

  case CharEncoding::UTF32_LE:
  case CharEncoding::UTF32_BE: {
    auto wide = detect_wide_encoding(data, size);
    size_t skip = 0;
    bool big_endian = enc == CharEncoding::UTF32_BE;
    if (wide.from_bom && (wide.encoding == CharEncoding::UTF32_LE ||
                          wide.encoding == CharEncoding::UTF32_BE)) {
      big_endian = wide.encoding == CharEncoding::UTF32_BE;
      skip = 4;
    }
    return append_utf32(data + skip, size - skip, big_endian, false, out, replaced);
  }

  case CharEncoding::LATIN1:
    append_latin1(data, size, out);
    return true;

  case CharEncoding::WINDOWS_1252:
    replaced = append_windows1252(data, size, out);
    return true;

  case CharEncoding::UNKNOWN:
    return false;
  }
  return false;
}

size_t strip_nulls(std::string& text) {
  size_t before = text.size();
  text.erase(std::remove(text.begin(), text.end(), '\0'), text.end());
  return before - text.size();
}

DecodedText decode(const RawBytes& raw, const IngestOptions& options) {
  DecodedText result;
  const uint8_t* data = raw.data();
  size_t size = raw.size();

  // An explicit encoding skips inference entirely.
  if (!options.encoding) {
    auto wide = detect_wide_encoding(data, size, options.wide_sniff_bytes, options.wide_null_ratio);
    if (wide.is_wide()) {
      result.wide_detected = true;
      std::string text;
      size_t replaced = 0;
      if (transcode_wide(data + wide.bom_length, size - wide.bom_length, wide.encoding, true, text,
                         replaced)) {
        result.text = std::move(text);
        result.encoding = wide.encoding;
        result.nulls_stripped = strip_nulls(result.text);
        SPDLOG_DEBUG("Decoded {} bytes as {} ({})", size, encoding_to_string(wide.encoding),
                     wide.from_bom ? "BOM" : "null-byte ratio");
        return result;
      }
      SPDLOG_WARN("{} decoding failed; falling back to narrow encodings",
                  encoding_to_string(wide.encoding));
    }
  }

  std::vector<std::string> names =
      options.encoding ? std::vector<std::string>{*options.encoding} : options.encodings;

  for (const auto& name : names) {
    CharEncoding enc = parse_encoding_name(name);
    std::string text;
    size_t replaced = 0;
    if (!decode_as(data, size, enc, text, replaced)) {
      SPDLOG_WARN("Skipping unsupported encoding '{}'", name);
      continue;
    }
    result.text = std::move(text);
    result.encoding = enc;
    result.replaced_sequences = replaced;
    result.nulls_stripped = strip_nulls(result.text);
    SPDLOG_DEBUG("Decoded {} bytes as {} ({} replaced, {} nulls stripped)", size,
                 encoding_to_string(enc), replaced, result.nulls_stripped);
    return result;
  }

  std::string message = "Could not decode input with encodings (";
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0)
      message += ", ";
    message += names[i];
  }
  message += "): no supported encoding";
  throw DecodeError(message, names);
}

} // namespace tabrescue
