#pragma once
#include "sheet_table/boundary.hpp"
#include "sheet_table/grid_source.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace st {

// Spreadsheet column letters -> zero-based index ("A" -> 0, "$AA" -> 26).
// Case-insensitive, 1..3 letters; nullopt for anything else.
std::optional<std::size_t> column_index(std::string_view letters) noexcept;

// Zero-based index -> column letters (0 -> "A", 16383 -> "XFD").
std::string column_letter(std::size_t col);

// Row and column parts of a combined address, still unresolved.
struct AddressParts {
  std::string row;  // "12"
  std::string col;  // "B" or "2" (R1C1 form)
};

// "R12C2" / "B12" / "$B$12" -> parts. Throws ScanError(MalformedAddress).
AddressParts decompose_address(std::string_view s);

// "A1:B3" or "A1" -> region (exclusive high bounds). Throws MalformedAddress.
MergeRegion parse_range(std::string_view s);

// Start positions must resolve to an index; "" -> 0.
std::size_t resolve_start_row(std::string_view spec);
std::size_t resolve_start_col(std::string_view spec);

// Stop boundaries: "" -> Unbounded, digits -> StopIndex (1-based input),
// typed/decimal literals -> double or text; columns also accept letters.
Boundary resolve_stop_row(std::string_view spec);
Boundary resolve_stop_col(std::string_view spec);

}
