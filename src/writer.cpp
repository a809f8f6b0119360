#include "tabrescue/writer.h"

namespace tabrescue {

bool needs_quote(std::string_view field, char delim) {
  for (char c : field) {
    if (c == '\n' || c == '\r' || c == '"' || c == delim) {
      return true;
    }
  }
  return false;
}

void append_field(std::string& buf, std::string_view field, char delim) {
  bool should_quote = needs_quote(field, delim);
  if (should_quote) {
    buf.push_back('"');
  }
  buf.reserve(buf.size() + field.size());
  for (char c : field) {
    if (c == '"') {
      buf.push_back('"');
    }
    buf.push_back(c);
  }
  if (should_quote) {
    buf.push_back('"');
  }
}

namespace {

void write_row(const Row& row, std::string& buf, char delim) {
  for (size_t i = 0; i < row.size(); ++i) {
    if (i > 0) {
      buf.push_back(delim);
    }
    append_field(buf, row[i], delim);
  }
  // A single empty field would otherwise produce a blank line.
  if (row.size() == 1 && row[0].empty()) {
    buf.append("\"\"");
  }
  buf.push_back('\n');
}

} // namespace

void write_table(const Table& table, std::ostream& out, char delim) {
  std::string buf;
  buf.reserve(1 << 16);

  write_row(table.header(), buf, delim);
  for (const auto& row : table.rows()) {
    write_row(row, buf, delim);
    if (buf.size() >= (1 << 16)) {
      out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
      buf.clear();
    }
  }
  out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
}

} // namespace tabrescue
