#include "sheet_table/scan_config.hpp"
#include "sheet_table/scan_error.hpp"
#include <string>

namespace st {

std::string_view to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::MalformedAddress:     return "MalformedAddress";
    case ErrorKind::InvalidConfig:        return "InvalidConfig";
    case ErrorKind::UnresolvableBoundary: return "UnresolvableBoundary";
    case ErrorKind::ShapeMismatch:        return "ShapeMismatch";
  }
  return "ScanError";
}

void ScanConfig::validate() const {
  if (header_rows < 1)
    throw ScanError(ErrorKind::InvalidConfig, "header rows must be at least 1");
  if (const StopIndex* si = std::get_if<StopIndex>(&stop_row); si && si->index < start_row)
    throw ScanError(ErrorKind::InvalidConfig,
                    "stop row " + std::to_string(si->index + 1) + " precedes start row " + std::to_string(start_row + 1));
  if (const StopIndex* si = std::get_if<StopIndex>(&stop_col); si && si->index < start_col)
    throw ScanError(ErrorKind::InvalidConfig,
                    "stop column " + std::to_string(si->index + 1) + " precedes start column " + std::to_string(start_col + 1));
  if (std::holds_alternative<RowPredicate>(stop_col))
    throw ScanError(ErrorKind::InvalidConfig, "a row predicate cannot stop columns");
}

}
