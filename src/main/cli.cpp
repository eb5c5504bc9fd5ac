#include "sheet_table/cli.hpp"
#include "sheet_table/address.hpp"
#include "sheet_table/csv_writer.hpp"
#include "sheet_table/scan_error.hpp"
#include "sheet_table/sheet_loader.hpp"
#include "sheet_table/table_reader.hpp"
#include "sheet_table/value_normalizer.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace st {

CliOptions parse_cli(int argc, const char* const* argv) {
  CliOptions c;
  bool have_spec = false;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    // "--name=V", "--name V" or "-x V"
    auto eat = [&](const char* name, const char* shortname, std::optional<std::string>* out) {
      const std::string pfx = std::string(name) + "=";
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(pfx.size()); return true; }
      if (a == name || (shortname && a == shortname)) {
        if (i + 1 >= argc) throw std::invalid_argument("option " + a + " needs a value");
        *out = std::string(argv[++i]);
        return true;
      }
      return false;
    };

    std::optional<std::string> v;
    if (eat("--start", "-s", &c.start)) continue;
    if (eat("--stop", "-S", &c.stop)) continue;
    if (eat("--start-row", "-r", &c.start_row)) continue;
    if (eat("--stop-row", "-R", &c.stop_row)) continue;
    if (eat("--start-col", "-c", &c.start_col)) continue;
    if (eat("--stop-col", "-C", &c.stop_col)) continue;
    if (eat("--empty", nullptr, &c.empty)) continue;
    if (eat("--header-rows", nullptr, &v)) { c.header_rows = *v; continue; }
    if (eat("--delimiter", "-d", &v)) {
      if (v->size() != 1) throw std::invalid_argument("delimiter must be one character");
      c.delimiter = (*v)[0];
      continue;
    }
    if (a == "--header")        { c.header  = true; continue; }
    if (a == "--repeat")        { c.repeat  = true; continue; }
    if (a == "--raw")           { c.raw     = true; continue; }
    if (a == "-v" || a == "--verbose") { c.verbose = true; continue; }
    if (a == "-h" || a == "--help")    { c.help    = true; continue; }
    if (a == "--version")       { c.version = true; continue; }
    if (a.size() > 1 && a[0] == '-') throw std::invalid_argument("unknown option " + a);
    if (have_spec) throw std::invalid_argument("unexpected argument " + a);
    c.sheetspec = a;
    have_spec = true;
  }
  return c;
}

ScanConfig build_scan_config(const CliOptions& cli) {
  std::string sr, sc, er, ec;
  if (cli.start) { auto p = decompose_address(*cli.start); sr = p.row; sc = p.col; }
  if (cli.stop)  { auto p = decompose_address(*cli.stop);  er = p.row; ec = p.col; }
  if (cli.start_row) sr = *cli.start_row;
  if (cli.stop_row)  er = *cli.stop_row;
  if (cli.start_col) sc = *cli.start_col;
  if (cli.stop_col)  ec = *cli.stop_col;

  ScanConfig cfg;
  cfg.start_row = resolve_start_row(sr.empty() ? "1" : sr);
  cfg.start_col = resolve_start_col(sc.empty() ? "A" : sc);
  cfg.stop_row  = resolve_stop_row(er);
  cfg.stop_col  = resolve_stop_col(ec);

  const Cell hr = parse_literal(cli.header_rows);
  const std::int64_t* n = std::get_if<std::int64_t>(&hr);
  if (!n || *n < 1)
    throw ScanError(ErrorKind::InvalidConfig, "header rows must be a positive integer, got '" + cli.header_rows + "'");
  cfg.header_rows = static_cast<std::size_t>(*n);

  if (cli.empty) cfg.empty = parse_literal(*cli.empty);
  cfg.repeat = cli.repeat;
  cfg.trim = !cli.raw;
  cfg.validate();
  return cfg;
}

void print_usage(std::ostream& os) {
  os <<
    "Usage: sheet-table [options] SHEETSPEC\n"
    "\n"
    "  SHEETSPEC             path/to/workbook!sheet or path/to/workbook (first sheet)\n"
    "                        a workbook is a .csv/.jsonl sheet dump or a directory of them\n"
    "\n"
    "  -s, --start ADDRESS   start row and column e.g. 'A1', 'R1C1' [default: A1]\n"
    "  -S, --stop ADDRESS    stop row and column e.g. 'Z99', 'R99C26'\n"
    "  -r, --start-row ROW   start row of table\n"
    "  -R, --stop-row ROW    stop row of table or value of its first cell\n"
    "  -c, --start-col COL   start column of table\n"
    "  -C, --stop-col COL    stop column of table or value of its header\n"
    "      --header          output with header\n"
    "      --header-rows N   rows to read as field names [default: 1]\n"
    "      --empty VALUE     value for empty cells\n"
    "      --repeat          repeat previous value if blank\n"
    "      --raw             keep redundant zeros e.g. 1.0 stays 1.0\n"
    "  -d, --delimiter C     output delimiter [default: ,]\n"
    "  -v, --verbose         progress on stderr\n"
    "      --version         show version and exit\n"
    "\n"
    "Notations for ROW/COL/VALUE:\n"
    "  A, $A, BZ            column letters\n"
    "  T:... or T(...)      text\n"
    "  N:... or N(...)      number\n"
    "  1, 2, ...            row/column number\n"
    "  1.0, 1.5, ...        number (sheets store floats only)\n";
}

int run_cli(const CliOptions& cli, std::ostream& out, std::ostream& err) {
  namespace ch = std::chrono;
  if (cli.sheetspec.empty()) {
    err << "[sheet-table] missing SHEETSPEC\n";
    print_usage(err);
    return 2;
  }

  ScanConfig cfg;
  try {
    cfg = build_scan_config(cli);
  } catch (const ScanError& e) {
    err << "[sheet-table] " << e.what() << "\n";
    return 2;
  }

  const auto t0 = ch::steady_clock::now();
  const SheetSpec spec = parse_sheet_spec(cli.sheetspec);
  MemoryGrid grid;
  try {
    grid = load_sheet(spec);
  } catch (const std::exception& e) {
    err << "[sheet-table] load failed: " << e.what() << "\n";
    return 1;
  }
  if (cli.verbose) {
    err << "[scan] loaded " << cli.sheetspec << ": " << grid.height() << "x" << grid.width()
        << " cells, " << grid.merges().size() << " merges\n";
  }

  try {
    TableReader table(grid, std::move(cfg));
    if (cli.verbose) {
      const ScanConfig& used = table.config();
      err << "[scan] header rows: " << used.header_rows
          << ", stop row: " << describe(used.stop_row)
          << ", stop col: " << describe(used.stop_col) << "\n";
    }
    CsvWriter writer(out, cli.delimiter);
    if (cli.header) writer.write_row(table.fieldnames());
    table.for_each([&](const Record& r){
      writer.write_cells(record_values(r), cli.raw);
      return true;
    });
    out.flush();

    if (cli.verbose) {
      const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
      err << "[scan] ok: " << cli.sheetspec << " fields=" << table.fieldnames().size()
          << " rows=" << table.rows() << " wall_ms=" << wall_ms << "\n";
    }
  } catch (const ScanError& e) {
    err << "[sheet-table] scan failed: " << e.what() << "\n";
    return (e.kind() == ErrorKind::MalformedAddress || e.kind() == ErrorKind::InvalidConfig) ? 2 : 3;
  }
  return 0;
}

}
