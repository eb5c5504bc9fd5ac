#pragma once
#include "sheet_table/cell.hpp"

#include <optional>
#include <string_view>

namespace st {

// True for "T:..", "T(..)", "N:..", "N(..)".
bool has_type_marker(std::string_view s) noexcept;

// Evaluate a boundary/empty literal:
//   T:text, T(text) -> text        N:num, N(num) -> double
//   "12"            -> int64       "1.5"         -> double
//   anything else   -> text (unchanged)
// Throws ScanError(MalformedAddress) for an unparsable N: literal.
Cell parse_literal(std::string_view s);

// Full-string numeric parse (fast_float); nullopt unless every byte is used.
std::optional<double> parse_number(std::string_view s) noexcept;

// Integral double -> int64, midnight Timestamp -> Date; others unchanged.
Cell trim_cell(const Cell& c);
void trim_row(Row& row);

}
