#include "sheet_table/cli.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Each tests/data/fixtures/NAME.args holds one argument per line; NAME.expected
// is the exact stdout and the optional NAME.code the exit code (default 0).

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static std::vector<std::string> read_args(const fs::path& p) {
  std::vector<std::string> out;
  std::ifstream in(p);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

static std::string show_snippet(std::string_view s, size_t max = 240) {
  std::string out;
  for (char c : s) {
    if (c == '\n') out += "\\n";
    else if (c == '\t') out += "\\t";
    else out.push_back(c);
    if (out.size() >= max) { out += "..."; break; }
  }
  return out;
}

int main(int argc, char** argv){
  const fs::path dir = (argc > 1) ? fs::path(argv[1]) : fs::path("tests/data/fixtures");
  if (!fs::exists(dir)) { std::cerr << "[ERR] missing: " << dir << "\n"; return 2; }

  std::vector<fs::path> cases;
  for (auto& e : fs::directory_iterator(dir)) {
    if (e.is_regular_file() && e.path().extension() == ".args") cases.push_back(e.path());
  }
  std::sort(cases.begin(), cases.end());
  if (cases.empty()) { std::cerr << "[ERR] no fixtures in " << dir << "\n"; return 2; }

  int failed = 0;
  for (const auto& args_path : cases) {
    const std::string name = args_path.stem().string();
    fs::path expected_path = args_path; expected_path.replace_extension(".expected");
    fs::path code_path = args_path; code_path.replace_extension(".code");

    std::vector<std::string> args = read_args(args_path);
    std::vector<const char*> argv_vec{"sheet-table"};
    for (const auto& a : args) argv_vec.push_back(a.c_str());

    int want_code = 0;
    if (fs::exists(code_path)) want_code = std::stoi(slurp(code_path));
    const std::string want_out = fs::exists(expected_path) ? slurp(expected_path) : std::string();

    std::ostringstream out, err;
    int code = 2;
    try {
      code = st::run_cli(st::parse_cli(static_cast<int>(argv_vec.size()), argv_vec.data()), out, err);
    } catch (const std::invalid_argument& e) {
      err << e.what() << "\n";
    }

    if (code != want_code || out.str() != want_out) {
      ++failed;
      std::cerr << "[FAIL] " << name << ": exit " << code << " (want " << want_code << ")\n"
                << "  got:  " << show_snippet(out.str()) << "\n"
                << "  want: " << show_snippet(want_out) << "\n";
      if (!err.str().empty()) std::cerr << "  stderr: " << show_snippet(err.str()) << "\n";
    } else {
      std::cout << "[OK] " << name << "\n";
    }
  }

  if (failed) { std::cerr << "[FAIL] fixtures: " << failed << " of " << cases.size() << "\n"; return 1; }
  std::cout << "[PASS] fixtures: " << cases.size() << "\n";
  return 0;
}
