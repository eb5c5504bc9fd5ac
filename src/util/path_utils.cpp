#include "sheet_table/path_utils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

namespace st {

namespace fs = std::filesystem;

FileFormat detect_format(std::string_view path) {
  auto ext = fs::path(std::string(path)).extension().string();
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (ext == ".csv") return FileFormat::CSV;
  if (ext == ".jsonl" || ext == ".ndjson") return FileFormat::JSONL;
  return FileFormat::Unknown;
}

SheetSpec parse_sheet_spec(std::string_view arg) {
  SheetSpec s;
  auto bang = arg.find('!');
  s.path = std::string(arg.substr(0, bang));
  if (bang != std::string_view::npos) s.sheet = std::string(arg.substr(bang + 1));
  return s;
}

std::vector<fs::path> list_sheets(const fs::path& dir) {
  std::vector<fs::path> out;
  std::error_code ec;
  for (auto& e : fs::directory_iterator(dir, ec)) {
    if (!e.is_regular_file()) continue;
    if (detect_format(e.path().string()) == FileFormat::Unknown) continue;
    out.push_back(e.path());
  }
  if (ec) throw std::runtime_error(dir.string() + ": " + ec.message());
  std::sort(out.begin(), out.end(),
            [](const fs::path& a, const fs::path& b){ return a.filename() < b.filename(); });
  return out;
}

fs::path locate_sheet(const SheetSpec& spec) {
  const fs::path p(spec.path);
  std::error_code ec;
  if (fs::is_directory(p, ec)) {
    auto sheets = list_sheets(p);
    if (sheets.empty()) throw std::runtime_error(spec.path + ": workbook has no sheets");
    if (spec.sheet.empty()) return sheets.front();
    for (const auto& s : sheets) if (s.stem().string() == spec.sheet) return s;
    throw std::runtime_error(spec.path + ": no sheet named '" + spec.sheet + "'");
  }
  if (!fs::is_regular_file(p, ec)) throw std::runtime_error(spec.path + ": no such workbook");
  if (detect_format(spec.path) == FileFormat::Unknown)
    throw std::runtime_error(spec.path + ": unsupported sheet format");
  if (!spec.sheet.empty() && p.stem().string() != spec.sheet)
    throw std::runtime_error(spec.path + ": no sheet named '" + spec.sheet + "'");
  return p;
}

}
