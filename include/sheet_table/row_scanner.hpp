#pragma once
#include "sheet_table/grid_source.hpp"
#include "sheet_table/scan_config.hpp"

#include <cstddef>
#include <cstdint>

namespace st {

// Pulls data rows after the header and normalizes them: empty substitution,
// stop test, width fit, repeat-fill, trim. Forward-only; once next() returns
// false it keeps returning false.
class RowScanner {
public:
  // `width` is the field count; rows are fitted to it.
  RowScanner(GridSource& src, const ScanConfig& cfg, std::size_t width);

  bool next(Row& out);

  bool finished() const noexcept { return done_; }
  // Absolute sheet index of the row last returned by next().
  std::size_t row_index() const noexcept { return absrow_; }
  std::uint64_t rows() const noexcept { return rows_; }

private:
  GridSource& src_;
  const ScanConfig& cfg_;
  std::size_t width_;
  std::size_t absrow_;
  std::size_t next_absrow_;
  std::uint64_t rows_{0};
  bool done_{false};
  bool has_prev_{false};
  Row raw_;
  Row prev_;
};

}
