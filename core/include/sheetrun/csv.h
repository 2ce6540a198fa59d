#pragma once
#include <string>
#include <vector>

namespace sheetrun::csv {

using Row = std::vector<std::string>;

// RFC 4180 reader: quoted fields, doubled quotes, CRLF or LF line ends.
// An unterminated quote runs to end of input.
std::vector<Row> parse(const std::string& text);

// Quotes a field only when it contains a comma, quote, CR or LF.
std::string format_row(const Row& row);

bool row_is_blank(const Row& row);

} // namespace sheetrun::csv
