#include "sheet_table/cli.hpp"
#include "sheet_table/sheet_loader.hpp"
#include "sheet_table/table_reader.hpp"
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
  if (!fs::exists("tests/data/quarterly.jsonl")) { std::cerr << "[ERR] missing tests/data/quarterly.jsonl\n"; return 2; }

  {
    // a title merged across the sheet names every column
    Run r = run({"tests/data/quarterly.jsonl", "--header", "--stop-row", "3"});
    expect(r.code == 0, "title exit code: " + r.err);
    expect(r.out ==
           "Sales report,Sales report_1,Sales report_2,Sales report_3,Sales report_4\n"
           ",,,,\n", "title header:\n" + r.out);
  }
  {
    Run r = run({"tests/data/quarterly.jsonl", "-s", "A3", "--header-rows=2", "-R", "Total", "-C", "2024_H1"});
    expect(r.code == 0, "two header rows exit code: " + r.err);
    expect(r.out == "North,10,12.5\nSouth,8,\n", "stop column on joined name:\n" + r.out);
  }
  {
    // the stop value is matched against the table's own first column
    Run r = run({"tests/data/quarterly.jsonl", "-s", "B4", "-R", "18.0", "--header"});
    expect(r.code == 0 && r.out == "H1,H2,H1_1,H2_1\n10,12.5,11,14\n8,,9,7\n",
           "header below the merge:\n" + r.out);
    r = run({"tests/data/quarterly.jsonl", "-s", "B4", "-R", "Total"});
    expect(r.code == 0 && r.out == "10,12.5,11,14\n8,,9,7\n18,12.5,20,21\n",
           "text stop outside the table:\n" + r.out);
  }
  {
    Run r = run({"tests/data/workbook!Accounts", "-C", "Balance", "--raw"});
    expect(r.code == 0, "accounts exit code: " + r.err);
    expect(r.out == "A-1,2020-01-05 00:00:00\nA-2,2020-02-10 09:30:00\nA-3,2021-03-01\n",
           "raw keeps midnight timestamps:\n" + r.out);
  }
  {
    Run r = run({"tests/data/bad_line.jsonl"});
    expect(r.code == 1 && r.err.find("bad_line.jsonl:2") != std::string::npos, "strict load error");
  }
  {
    // named records straight from a loaded sheet
    st::MemoryGrid g = st::load_sheet(st::parse_sheet_spec("tests/data/quarterly.jsonl"));
    st::ScanConfig cfg;
    cfg.start_row = 2;
    cfg.header_rows = 2;
    cfg.stop_row = std::string("Total");
    st::TableReader table(g, cfg, st::RecordShape::Named);
    std::vector<std::string> regions;
    double h2_2024 = 0;
    table.for_each([&](const st::Record& rec){
      const auto& r = std::get<st::NamedRecord>(rec);
      regions.push_back(st::to_text(r.get("Region")));
      h2_2024 += static_cast<double>(std::get<std::int64_t>(r.get("_2024_H2")));
      return true;
    });
    expect(regions == std::vector<std::string>{"North", "South"}, "named regions");
    expect(h2_2024 == 21.0, "named sum");
    expect(table.rows() == 2, "named rows");
  }

  if (failures) { std::cerr << "[FAIL] end_to_end_jsonl: " << failures << " failures\n"; return 1; }
  std::cout << "[PASS] end_to_end_jsonl\n";
  return 0;
}
