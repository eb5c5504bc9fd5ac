#pragma once
#include "sheet_table/grid_source.hpp"
#include "sheet_table/scan_config.hpp"

#include <string>
#include <vector>

namespace st {

// Reads cfg.header_rows rows from `src` (cursor must sit at the table's
// start) and returns unique field names. Vertically stacked header cells
// are joined with '_'; a merged cell contributes its anchor value only on
// the anchor row. The stop column and everything right of it are dropped.
std::vector<std::string> build_fieldnames(GridSource& src, const ScanConfig& cfg);

// Appends "_1", "_2", ... to names that repeat an earlier name.
void make_unique_names(std::vector<std::string>& names);

}
