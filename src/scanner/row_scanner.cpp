#include "sheet_table/row_scanner.hpp"
#include "sheet_table/value_normalizer.hpp"

namespace st {

RowScanner::RowScanner(GridSource& src, const ScanConfig& cfg, std::size_t width)
  : src_(src), cfg_(cfg), width_(width),
    absrow_(cfg.start_row + cfg.header_rows),
    next_absrow_(cfg.start_row + cfg.header_rows) {}

bool RowScanner::next(Row& out) {
  if (done_) return false;
  if (!src_.next_row(raw_)) { done_ = true; return false; }
  absrow_ = next_absrow_++;
  if (raw_.empty()) { done_ = true; return false; }

  for (auto& c : raw_) if (is_empty(c)) c = cfg_.empty;

  if (row_stops(cfg_.stop_row, absrow_, raw_)) { done_ = true; return false; }

  raw_.resize(width_, cfg_.empty);

  // Only cells still blank after substitution take the previous value.
  if (cfg_.repeat && has_prev_) {
    for (std::size_t i = 0; i < width_; ++i) if (is_blank(raw_[i])) raw_[i] = prev_[i];
  }
  if (cfg_.trim) trim_row(raw_);
  if (cfg_.repeat) { prev_ = raw_; has_prev_ = true; }

  out = raw_;
  ++rows_;
  return true;
}

}
