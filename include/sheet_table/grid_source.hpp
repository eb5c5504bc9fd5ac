#pragma once
#include "sheet_table/cell.hpp"

#include <cstddef>
#include <vector>

namespace st {

// Rectangle of merged cells; high bounds exclusive. Only the top-left
// (anchor) cell carries a value in the grid.
struct MergeRegion {
  std::size_t row_lo = 0;
  std::size_t row_hi = 0;
  std::size_t col_lo = 0;
  std::size_t col_hi = 0;

  bool contains(std::size_t row, std::size_t col) const noexcept {
    return row_lo <= row && row < row_hi && col_lo <= col && col < col_hi;
  }
};

// Forward-only cell source bound to one sheet.
class GridSource {
public:
  virtual ~GridSource() = default;

  // Restart delivery at absolute (row, col); later rows are sliced from col.
  virtual void seek(std::size_t row, std::size_t col) = 0;

  // Next row from the cursor. Returns false once the sheet is exhausted.
  virtual bool next_row(Row& out) = 0;

  virtual const std::vector<MergeRegion>& merges() const = 0;
};

// Region covering (row, col), or nullptr.
const MergeRegion* find_merge(const std::vector<MergeRegion>& merges,
                              std::size_t row, std::size_t col) noexcept;

// Decoded sheet held in memory. Rows are reported padded to the sheet width
// (widest row), the way a workbook reports its used range.
class MemoryGrid : public GridSource {
public:
  MemoryGrid() = default;
  explicit MemoryGrid(std::vector<Row> rows, std::vector<MergeRegion> merges = {});

  void add_row(Row row);
  void add_merge(const MergeRegion& m) { merges_.push_back(m); }

  std::size_t height() const noexcept { return rows_.size(); }
  std::size_t width() const noexcept { return width_; }
  const Cell& cell(std::size_t row, std::size_t col) const noexcept;

  void seek(std::size_t row, std::size_t col) override;
  bool next_row(Row& out) override;
  const std::vector<MergeRegion>& merges() const override { return merges_; }

private:
  std::vector<Row> rows_;
  std::vector<MergeRegion> merges_;
  std::size_t width_{0};
  std::size_t cursor_row_{0};
  std::size_t cursor_col_{0};
};

}
