#pragma once
#include "sheet_table/cell.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <variant>

namespace st {

struct Unbounded {};

// Absolute zero-based row or column index; the boundary itself is excluded.
struct StopIndex {
  std::size_t index = 0;
};

// Called with the first cell of a row, or with a column's joined header name.
using CellPredicate = std::function<bool(const Cell&)>;
// Called with a whole data row. Row boundaries only.
using RowPredicate = std::function<bool(const Row&)>;

// double / std::string are boundary literals compared against cell values.
using Boundary = std::variant<Unbounded, StopIndex, double, std::string,
                              CellPredicate, RowPredicate>;

// Row stop test for the data row at absolute index `row`.
// Throws ScanError(UnresolvableBoundary) if a predicate throws.
bool row_stops(const Boundary& b, std::size_t row, const Row& values);

// Column stop test for the header column at absolute index `col` whose
// joined header text is `name`.
bool col_stops(const Boundary& b, std::size_t col, const std::string& name);

// "unbounded", "index 12", "text 'END'", ... for logs.
std::string describe(const Boundary& b);

}
