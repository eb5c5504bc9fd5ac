#include "sheet_table/boundary.hpp"
#include "sheet_table/scan_error.hpp"
#include "sheet_table/value_normalizer.hpp"
#include <exception>
#include <string>

namespace st {

// Predicates are caller code; any exception they raise aborts the scan.
template <class Pred, class Arg>
static bool call_predicate(const Pred& pred, const Arg& arg, const char* axis, std::size_t at) {
  if (!pred)
    throw ScanError(ErrorKind::UnresolvableBoundary,
                    std::string("empty ") + axis + " predicate");
  try {
    return pred(arg);
  } catch (const ScanError&) {
    throw;
  } catch (const std::exception& e) {
    throw ScanError(ErrorKind::UnresolvableBoundary,
                    std::string(axis) + " " + std::to_string(at + 1) + ": predicate failed: " + e.what());
  }
}

bool row_stops(const Boundary& b, std::size_t row, const Row& values) {
  if (std::holds_alternative<Unbounded>(b)) return false;
  if (const StopIndex* si = std::get_if<StopIndex>(&b)) return row == si->index;
  if (const RowPredicate* rp = std::get_if<RowPredicate>(&b))
    return call_predicate(*rp, values, "row", row);

  const Cell first = values.empty() ? Cell{} : values.front();
  if (const double* d = std::get_if<double>(&b)) return same_value(first, Cell{*d});
  if (const std::string* s = std::get_if<std::string>(&b)) {
    const std::string* v = std::get_if<std::string>(&first);
    return v && *v == *s;
  }
  if (const CellPredicate* cp = std::get_if<CellPredicate>(&b))
    return call_predicate(*cp, first, "row", row);
  return false;
}

bool col_stops(const Boundary& b, std::size_t col, const std::string& name) {
  if (std::holds_alternative<Unbounded>(b)) return false;
  if (const StopIndex* si = std::get_if<StopIndex>(&b)) return col == si->index;
  if (const std::string* s = std::get_if<std::string>(&b)) return name == *s;
  if (const double* d = std::get_if<double>(&b)) {
    // header names are text; "2020" matches N:2020
    auto v = parse_number(name);
    return v && *v == *d;
  }
  if (const CellPredicate* cp = std::get_if<CellPredicate>(&b))
    return call_predicate(*cp, Cell{name}, "column", col);
  throw ScanError(ErrorKind::InvalidConfig, "a row predicate cannot stop columns");
}

std::string describe(const Boundary& b) {
  if (std::holds_alternative<Unbounded>(b)) return "unbounded";
  if (const StopIndex* si = std::get_if<StopIndex>(&b)) return "index " + std::to_string(si->index);
  if (const double* d = std::get_if<double>(&b)) return "number " + to_text(Cell{*d}, true);
  if (const std::string* s = std::get_if<std::string>(&b)) return "text '" + *s + "'";
  if (std::holds_alternative<CellPredicate>(b)) return "cell predicate";
  return "row predicate";
}

}
