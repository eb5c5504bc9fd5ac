#pragma once
#include "sheet_table/grid_source.hpp"
#include "sheet_table/parse_policy.hpp"
#include "sheet_table/path_utils.hpp"
#include "sheet_table/token_csv_fsm.hpp"
#include "sheet_table/token_jsonl_simdjson.hpp"

#include <string>

namespace st {

struct LoadOptions {
  ParsePolicy policy;
  CsvConfig csv;
  JsonlConfig jsonl;
};

// Decode a whole sheet dump up front. Throws std::runtime_error with the
// file name and line number on I/O or format errors.
MemoryGrid load_csv_sheet(const std::string& path, const LoadOptions& opts = {});
MemoryGrid load_jsonl_sheet(const std::string& path, const LoadOptions& opts = {});

// Resolve `spec` (see locate_sheet) and load it by detected format.
MemoryGrid load_sheet(const SheetSpec& spec, const LoadOptions& opts = {});

}
