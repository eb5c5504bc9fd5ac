#include "sheet_table/row_scanner.hpp"
#include "sheet_table/scan_error.hpp"
#include "sheet_table/table_reader.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

static int failures = 0;
static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static st::Cell T(const char* s) { return std::string(s); }
static st::Cell I(std::int64_t v) { return v; }
static const st::Cell E{};

static st::MemoryGrid grid(std::vector<st::Row> rows, std::vector<st::MergeRegion> merges = {}) {
  return st::MemoryGrid(std::move(rows), std::move(merges));
}

// All records of a scan, as positional rows.
static std::vector<st::Row> scan(st::MemoryGrid& g, const st::ScanConfig& cfg) {
  st::TableReader table(g, cfg);
  std::vector<st::Row> out;
  st::Record rec;
  while (table.next(rec)) out.push_back(st::record_values(rec));
  return out;
}

template <class F>
static void expect_error(F&& f, st::ErrorKind kind, const std::string& what) {
  try { f(); }
  catch (const st::ScanError& e) { expect(e.kind() == kind, what + ": wrong kind: " + e.what()); return; }
  expect(false, what + ": no ScanError");
}

int main(){
  {
    // empty substitute and trim
    st::MemoryGrid g = grid({{T("Name"), T("Age")}, {T("Al"), 30.0}, {T("Bo"), E}});
    st::ScanConfig cfg;
    st::TableReader table(g, cfg);
    expect(table.fieldnames() == std::vector<std::string>{"Name", "Age"}, "fields");
    st::Record rec;
    expect(table.next(rec), "first record");
    const auto& m1 = std::get<st::FieldMap>(rec);
    expect(m1.at("Name") == T("Al") && m1.at("Age") == I(30), "Al,30");
    expect(table.next(rec), "second record");
    const auto& m2 = std::get<st::FieldMap>(rec);
    expect(m2.at("Name") == T("Bo") && m2.at("Age") == T(""), "Bo,''");
    expect(!table.next(rec), "exhausted");
    expect(!table.next(rec), "stays exhausted");
    expect(table.rows() == 2, "row count");
  }
  {
    // row stop on the first cell; the stop row is not yielded
    st::MemoryGrid g = grid({{T("k"), T("v")}, {T("a"), 1.0}, {T("END"), 5.0}, {T("b"), 2.0}});
    st::ScanConfig cfg;
    cfg.stop_row = std::string("END");
    auto rows = scan(g, cfg);
    expect(rows.size() == 1 && rows[0][0] == T("a"), "stop literal");

    cfg.stop_row = st::CellPredicate([](const st::Cell& c){ return c == st::Cell{std::string("END")}; });
    expect(scan(g, cfg).size() == 1, "stop cell predicate");

    cfg.stop_row = st::RowPredicate([](const st::Row& r){ return r.size() > 1 && r[1] == st::Cell{2.0}; });
    expect(scan(g, cfg).size() == 2, "stop row predicate sees the whole row");

    cfg.stop_row = 5.0;
    expect(scan(g, cfg).size() == 3, "numeric literal compares first cell only");
  }
  {
    st::MemoryGrid g = grid({{T("n")}, {1.0}, {99.0}, {2.0}});
    st::ScanConfig cfg;
    cfg.stop_row = 99.0;
    auto rows = scan(g, cfg);
    expect(rows.size() == 1 && rows[0][0] == I(1), "numeric stop literal");
    cfg.stop_row = std::string("99");
    expect(scan(g, cfg).size() == 3, "text literal never equals a number");
  }
  {
    // stop index is absolute and exclusive
    st::MemoryGrid g = grid({{T("title")}, {T("h")}, {T("r2")}, {T("r3")}, {T("r4")}});
    st::ScanConfig cfg;
    cfg.start_row = 1;
    cfg.stop_row = st::StopIndex{4};
    auto rows = scan(g, cfg);
    expect(rows.size() == 2 && rows[1][0] == T("r3"), "stop index");
  }
  {
    // repeat-fill carries the previous row's value
    st::MemoryGrid g = grid({{T("Name"), T("Val")}, {T("X"), 1.0}, {T(""), 2.0}, {E, 3.0}});
    st::ScanConfig cfg;
    cfg.repeat = true;
    auto rows = scan(g, cfg);
    expect(rows.size() == 3, "repeat rows");
    for (std::size_t i = 0; i < rows.size(); ++i) {
      expect(rows[i][0] == T("X"), "repeat name row " + std::to_string(i));
      expect(rows[i][1] == I(static_cast<std::int64_t>(i + 1)), "repeat value row " + std::to_string(i));
    }
  }
  {
    // a non-blank empty substitute is kept; blank text is still filled
    st::MemoryGrid g = grid({{T("a"), T("b")}, {E, 1.0}, {T(""), E}, {T("z"), E}});
    st::ScanConfig cfg;
    cfg.repeat = true;
    cfg.empty = std::string("-");
    auto rows = scan(g, cfg);
    expect(rows.size() == 3, "repeat/empty rows");
    expect(rows[0][0] == T("-") && rows[0][1] == I(1), "first row untouched by repeat");
    expect(rows[1][0] == T("-") && rows[1][1] == T("-"), "substituted cells are not refilled");
    expect(rows[2][0] == T("z") && rows[2][1] == T("-"), "third row keeps substitute");
  }
  {
    st::MemoryGrid g = grid({{T("Name"), T("Val")}, {T("X"), 1.0}, {E, 2.0}});
    st::ScanConfig cfg;
    cfg.repeat = true;
    cfg.empty = std::string("N/A");
    auto rows = scan(g, cfg);
    expect(rows.size() == 2 && rows[1][0] == T("N/A") && rows[1][1] == I(2), "repeat with N/A substitute");
  }
  {
    // padding cells follow the same rule as source cells
    st::MemoryGrid g = grid({{T("a"), T("b")}, {T("x"), T("y")}});
    g.add_row(st::Row{T("w")});
    st::ScanConfig cfg;
    cfg.repeat = true;
    auto rows = scan(g, cfg);
    expect(rows.size() == 2 && rows[1][1] == T("y"), "blank padding is filled");
    cfg.empty = std::string("-");
    rows = scan(g, cfg);
    expect(rows.size() == 2 && rows[1][1] == T("-"), "substituted padding is kept");
  }
  {
    // trim off keeps floats and timestamps
    st::MemoryGrid g = grid({{T("n"), T("t")}, {30.0, st::Timestamp{86400000}}});
    st::ScanConfig cfg;
    cfg.trim = false;
    auto rows = scan(g, cfg);
    expect(rows.size() == 1 && rows[0][0] == st::Cell{30.0}, "raw float");
    expect(std::holds_alternative<st::Timestamp>(rows[0][1]), "raw timestamp");
    cfg.trim = true;
    rows = scan(g, cfg);
    expect(std::holds_alternative<st::Date>(rows[0][1]), "trimmed timestamp");
  }
  {
    // rows are fitted to the field count
    st::MemoryGrid g = grid({{T("a"), T("b"), T("STOP"), T("c")}, {1.0, 2.0, 3.0, 4.0}, {5.0}});
    st::ScanConfig cfg;
    cfg.stop_col = std::string("STOP");
    auto rows = scan(g, cfg);
    expect(rows.size() == 2 && rows[0].size() == 2 && rows[1].size() == 2, "fit to fields");
    expect(rows[1][1] == T(""), "padding uses empty substitute");
  }
  {
    // zero-cell rows end the table
    st::MemoryGrid g = grid({{T("a")}, {1.0}});
    st::ScanConfig cfg;
    cfg.start_col = 3;
    st::TableReader table(g, cfg);
    st::Record rec;
    expect(table.fieldnames().empty() && !table.next(rec), "start right of used range");
  }
  {
    // predicate failures surface as UnresolvableBoundary
    st::MemoryGrid g = grid({{T("a")}, {1.0}});
    st::ScanConfig cfg;
    cfg.stop_row = st::RowPredicate([](const st::Row&) -> bool { throw std::runtime_error("bad row"); });
    expect_error([&]{ scan(g, cfg); }, st::ErrorKind::UnresolvableBoundary, "throwing row predicate");
  }
  {
    // RowScanner directly
    st::MemoryGrid g = grid({{T("h")}, {T("x")}, {T("y")}});
    st::ScanConfig cfg;
    g.seek(1, 0);
    st::RowScanner rs(g, cfg, 1);
    st::Row r;
    expect(rs.next(r) && rs.row_index() == 1, "row index 1");
    expect(rs.next(r) && rs.row_index() == 2, "row index 2");
    expect(!rs.next(r) && rs.finished(), "finished");
  }
  {
    // configuration invariants
    st::MemoryGrid g = grid({{T("a")}});
    st::ScanConfig cfg;
    cfg.header_rows = 0;
    expect_error([&]{ st::TableReader t(g, cfg); }, st::ErrorKind::InvalidConfig, "zero header rows");
    cfg = st::ScanConfig{};
    cfg.start_row = 5;
    cfg.stop_row = st::StopIndex{2};
    expect_error([&]{ st::TableReader t(g, cfg); }, st::ErrorKind::InvalidConfig, "stop row before start");
    cfg = st::ScanConfig{};
    cfg.start_col = 2;
    cfg.stop_col = st::StopIndex{1};
    expect_error([&]{ st::TableReader t(g, cfg); }, st::ErrorKind::InvalidConfig, "stop col before start");
    cfg = st::ScanConfig{};
    cfg.stop_col = st::RowPredicate([](const st::Row&){ return false; });
    expect_error([&]{ st::TableReader t(g, cfg); }, st::ErrorKind::InvalidConfig, "row predicate on columns");
  }

  if (failures) { std::cerr << "[FAIL] row_scanner: " << failures << " failures\n"; return 1; }
  std::cout << "[PASS] row_scanner\n";
  return 0;
}
