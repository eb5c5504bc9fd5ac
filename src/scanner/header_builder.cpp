#include "sheet_table/header_builder.hpp"
#include "sheet_table/address.hpp"
#include <algorithm>
#include <string>
#include <unordered_set>

namespace st {

// Text one header cell contributes to its column name; "" for none.
static std::string header_fragment(const Cell& v) {
  if (is_blank(v)) return std::string();
  std::string text = to_text(v, /*raw=*/true);
  if (text.size() >= 2 && text.compare(text.size() - 2, 2, ".0") == 0) text.resize(text.size() - 2);
  return text;
}

std::vector<std::string> build_fieldnames(GridSource& src, const ScanConfig& cfg) {
  // Rows an exhausted source cannot deliver stay empty.
  std::vector<Row> rows(cfg.header_rows);
  for (auto& r : rows) if (!src.next_row(r)) break;

  std::size_t ncols = 0;
  for (const auto& r : rows) ncols = std::max(ncols, r.size());

  const auto& merges = src.merges();
  std::vector<std::string> names;
  names.reserve(ncols);

  for (std::size_t col = 0; col < ncols; ++col) {
    const std::size_t abscol = cfg.start_col + col;
    std::string joined;
    for (std::size_t r = 0; r < rows.size(); ++r) {
      const std::size_t absrow = cfg.start_row + r;
      const Cell* v = nullptr;
      if (const MergeRegion* m = find_merge(merges, absrow, abscol)) {
        // Anchor text counts on the anchor row only, for every merged column.
        if (m->row_lo == absrow && m->col_lo >= cfg.start_col) {
          const std::size_t anchor = m->col_lo - cfg.start_col;
          if (anchor < rows[r].size()) v = &rows[r][anchor];
        }
      } else if (col < rows[r].size()) {
        v = &rows[r][col];
      }
      if (!v) continue;
      std::string frag = header_fragment(*v);
      if (frag.empty()) continue;
      if (!joined.empty()) joined += '_';
      joined += frag;
    }
    joined.erase(std::remove_if(joined.begin(), joined.end(),
                                [](char c){ return c == '\n' || c == '\r'; }),
                 joined.end());

    if (col_stops(cfg.stop_col, abscol, joined)) break;
    names.push_back(joined.empty() ? column_letter(abscol) : std::move(joined));
  }

  make_unique_names(names);
  return names;
}

void make_unique_names(std::vector<std::string>& names) {
  std::unordered_set<std::string> seen;
  seen.reserve(names.size() * 2);
  for (auto& name : names) {
    if (seen.count(name)) {
      for (std::size_t n = 1;; ++n) {
        std::string alt = name + "_" + std::to_string(n);
        if (!seen.count(alt)) { name = std::move(alt); break; }
      }
    }
    seen.insert(name);
  }
}

}
