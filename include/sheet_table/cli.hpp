#pragma once
#include "sheet_table/scan_config.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace st {

constexpr const char* kVersion = "1.0.0";

struct CliOptions {
  std::string sheetspec;               // path!sheet
  std::optional<std::string> start;    // combined address, e.g. "B3"
  std::optional<std::string> stop;
  std::optional<std::string> start_row;
  std::optional<std::string> stop_row;
  std::optional<std::string> start_col;
  std::optional<std::string> stop_col;
  std::optional<std::string> empty;
  std::string header_rows = "1";
  bool header = false;
  bool repeat = false;
  bool raw = false;
  bool verbose = false;
  bool help = false;
  bool version = false;
  char delimiter = ',';
};

// Throws std::invalid_argument for unknown options or missing values.
CliOptions parse_cli(int argc, const char* const* argv);

// Combined address first, separate row/col options override it.
// Throws ScanError(MalformedAddress / InvalidConfig).
ScanConfig build_scan_config(const CliOptions& cli);

void print_usage(std::ostream& os);

// Whole command: load, scan, write. Returns the process exit code
// (0 ok, 1 load failure, 2 usage/config error, 3 scan failure).
int run_cli(const CliOptions& cli, std::ostream& out, std::ostream& err);

}
