#include "sheet_table/cli.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;
static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

struct Run { int code; std::string out; std::string err; };

static Run run(std::vector<const char*> args) {
  args.insert(args.begin(), "sheet-table");
  std::ostringstream out, err;
  Run r;
  r.code = st::run_cli(st::parse_cli(static_cast<int>(args.size()), args.data()), out, err);
  r.out = out.str();
  r.err = err.str();
  return r;
}

int main(){
  if (!fs::exists("tests/data/utf8.csv")) { std::cerr << "[ERR] missing tests/data/utf8.csv\n"; return 2; }

  {
    Run r = run({"tests/data/utf8.csv", "--header"});
    const std::string want =
      "Name,Age,Joined,Active,Note\n"
      "Al,30,2021-04-01,TRUE,\"likes \"\"quotes\"\"\"\n"
      "Bo,,2021-04-02 08:30:00,FALSE,\n"
      "\xC3\x87" "elik,41.5,2020-12-31,TRUE,\"multi\nline\"\n"
      "Dee,28,,FALSE,plain\n";
    expect(r.code == 0, "utf8 exit code: " + r.err);
    expect(r.out == want, "utf8 output:\n" + r.out);
  }
  {
    // the stop row is located by its first cell; the stop column by header text
    Run r = run({"tests/data/sales.csv", "-r", "3", "-R", "Total", "-C", "Notes", "--header"});
    expect(r.code == 0, "sales exit code: " + r.err);
    expect(r.out == "Region,Units,Price\nNorth,10,2.5\n,12,3\nSouth,7,4\n", "sales output:\n" + r.out);
  }
  {
    Run r = run({"tests/data/sales.csv", "--start=B3", "--stop-row=7", "--empty=N:0"});
    expect(r.code == 0, "numeric empty exit code: " + r.err);
    expect(r.out == "10,2.5,0\n12,3,restock\n7,4,0\n", "numeric empty output:\n" + r.out);
  }
  {
    Run r = run({"tests/data/sales.csv", "--start", "R3C1", "--stop", "R5C2", "--header", "-d", "\t"});
    expect(r.code == 0 && r.out == "Region\nNorth\n", "R1C1 addresses:\n" + r.out);
  }
  {
    Run r = run({"tests/data/sales.csv", "--stop-col", "T:Price", "-s", "A3", "-R", "T:Total"});
    expect(r.code == 0 && r.out == "North,10\n,12\nSouth,7\n", "text stop column:\n" + r.out);
  }
  {
    Run r = run({"tests/data/sales.csv", "--start", "A3", "--verbose"});
    expect(r.code == 0, "verbose exit code");
    expect(r.err.find("[scan] ok:") != std::string::npos, "verbose summary on stderr");
    expect(r.err.find("[scan] header rows: 1, stop row: unbounded, stop col: unbounded") != std::string::npos,
           "verbose scan settings: " + r.err);
    expect(r.out.find("Total,29,,") != std::string::npos, "unbounded scan reads past totals");
  }
  {
    Run r = run({"tests/data/sales.csv", "--start", "1A"});
    expect(r.code == 2 && r.out.empty(), "malformed address");
    expect(r.err.find("[sheet-table]") != std::string::npos, "error on stderr");
  }
  {
    Run r = run({});
    expect(r.code == 2, "missing sheetspec");
  }
  {
    Run r = run({"tests/data/does_not_exist.csv"});
    expect(r.code == 1, "missing file");
  }
  {
    bool threw = false;
    try { (void)run({"tests/data/sales.csv", "--bogus"}); } catch (const std::invalid_argument&) { threw = true; }
    expect(threw, "unknown option");
  }

  if (failures) { std::cerr << "[FAIL] end_to_end_csv: " << failures << " failures\n"; return 1; }
  std::cout << "[PASS] end_to_end_csv\n";
  return 0;
}
