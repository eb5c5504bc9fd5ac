#include "sheet_table/grid_source.hpp"
#include <algorithm>
#include <utility>

namespace st {

const MergeRegion* find_merge(const std::vector<MergeRegion>& merges,
                              std::size_t row, std::size_t col) noexcept {
  for (const auto& m : merges) if (m.contains(row, col)) return &m;
  return nullptr;
}

MemoryGrid::MemoryGrid(std::vector<Row> rows, std::vector<MergeRegion> merges)
  : rows_(std::move(rows)), merges_(std::move(merges)) {
  for (const auto& r : rows_) width_ = std::max(width_, r.size());
}

void MemoryGrid::add_row(Row row) {
  width_ = std::max(width_, row.size());
  rows_.push_back(std::move(row));
}

const Cell& MemoryGrid::cell(std::size_t row, std::size_t col) const noexcept {
  static const Cell empty{};
  if (row >= rows_.size() || col >= rows_[row].size()) return empty;
  return rows_[row][col];
}

void MemoryGrid::seek(std::size_t row, std::size_t col) {
  cursor_row_ = row;
  cursor_col_ = col;
}

bool MemoryGrid::next_row(Row& out) {
  if (cursor_row_ >= rows_.size()) return false;
  const Row& src = rows_[cursor_row_++];
  out.clear();
  if (cursor_col_ >= width_) return true;  // start column right of the used range
  if (cursor_col_ < src.size()) out.assign(src.begin() + cursor_col_, src.end());
  out.resize(width_ - cursor_col_);
  return true;
}

}
