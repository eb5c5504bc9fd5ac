#pragma once
#include "sheet_table/boundary.hpp"
#include "sheet_table/cell.hpp"

#include <cstddef>
#include <string>

namespace st {

struct ScanConfig {
  std::size_t start_row = 0;
  std::size_t start_col = 0;
  Boundary stop_row = Unbounded{};
  Boundary stop_col = Unbounded{};
  std::size_t header_rows = 1;
  Cell empty = std::string{};   // substitute for empty cells
  bool repeat = false;          // fill blanks from the previous row
  bool trim = true;             // 3.0 -> 3, midnight timestamp -> date

  // Throws ScanError(InvalidConfig).
  void validate() const;
};

}
