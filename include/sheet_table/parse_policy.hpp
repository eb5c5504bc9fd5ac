#pragma once
#include "sheet_table/cell.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace st {

// A simple bool policy
struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"TRUE", "True", "true"};
  std::vector<std::string> false_tokens = {"FALSE", "False", "false"};
  bool case_sensitive = true;
};

// Decides the cell type of a text field from a sheet dump.
struct ParsePolicy {
  bool infer_numbers = true;   // fast_float full-string parse -> double
  bool infer_dates   = true;   // ISO-8601 -> Timestamp
  bool infer_bools   = true;   // BoolPolicy tokens -> bool
  BoolPolicy bool_policy;

  // `quoted` fields are always text; an empty unquoted field is Empty.
  Cell type_cell(std::string_view s, bool quoted) const;

  bool parse_bool(std::string_view s, bool& out) const;
};

}
