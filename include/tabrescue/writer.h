#ifndef TABRESCUE_WRITER_H
#define TABRESCUE_WRITER_H

#include "table.h"

#include <ostream>
#include <string>
#include <string_view>

namespace tabrescue {

/// True if the field must be quoted: it holds the delimiter, a quote or a line break.
bool needs_quote(std::string_view field, char delim);

/// Append one field to `buf`, quoted and with doubled quotes when needed.
void append_field(std::string& buf, std::string_view field, char delim);

/**
 * @brief Write the header and rows as delimited text, one line per row.
 *
 * Lines end with '\n'. Reading the output back with the same delimiter gives
 * the same table.
 */
void write_table(const Table& table, std::ostream& out, char delim = ',');

} // namespace tabrescue

#endif // TABRESCUE_WRITER_H
