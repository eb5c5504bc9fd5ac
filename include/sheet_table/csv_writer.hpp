#pragma once
#include "sheet_table/cell.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace st {

// Delimited text output with minimal quoting and '\n' line ends.
class CsvWriter {
public:
  explicit CsvWriter(std::ostream& out, char delimiter = ',');

  void write_row(const std::vector<std::string>& fields);
  // Cells are rendered with to_text(); `raw` keeps "3.0".
  void write_cells(const Row& cells, bool raw = false);

  std::uint64_t rows_written() const noexcept { return rows_; }

private:
  void write_field(std::string_view s);

  std::ostream& out_;
  char delim_;
  std::uint64_t rows_{0};
};

// No-break space (U+00A0) -> ' '.
std::string replace_nbsp(std::string s);

}
