#include "sheet_table/sheet_loader.hpp"
#include "sheet_table/chunk_reader.hpp"
#include <stdexcept>
#include <string>

namespace st {

static std::runtime_error load_error(const std::string& path, std::uint64_t line, const std::string& msg) {
  return std::runtime_error(path + ":" + std::to_string(line) + ": " + msg);
}

MemoryGrid load_csv_sheet(const std::string& path, const LoadOptions& opts) {
  MemoryGrid grid;
  ChunkReader reader(path);
  CsvFsm csv(opts.csv);
  std::string err;
  std::uint64_t err_line = 0;

  bool ok = reader.for_each_line([&](std::string_view line){
    bool complete = false;
    if (!csv.feed(line, &complete)) { err = csv.error(); err_line = reader.line_no(); return false; }
    if (!complete) return true;
    Row row;
    row.reserve(csv.fields().size());
    for (const auto& f : csv.fields()) row.push_back(opts.policy.type_cell(f.text, f.quoted));
    grid.add_row(std::move(row));
    return true;
  });
  if (!ok) throw std::runtime_error(reader.error());
  if (!err.empty()) throw load_error(path, err_line, err);
  if (!csv.finish()) throw load_error(path, reader.line_no(), csv.error());
  return grid;
}

MemoryGrid load_jsonl_sheet(const std::string& path, const LoadOptions& opts) {
  MemoryGrid grid;
  ChunkReader reader(path);
  JsonlSheetTokenizer tok(opts.jsonl);
  std::string err;
  std::uint64_t err_line = 0;

  bool ok = reader.for_each_line([&](std::string_view line){
    JsonlSheetTokenizer::LineKind kind;
    if (!tok.feed_line(line, &kind)) { err = tok.error(); err_line = reader.line_no(); return false; }
    if (kind == JsonlSheetTokenizer::LineKind::Row) grid.add_row(tok.row());
    else if (kind == JsonlSheetTokenizer::LineKind::Merge) grid.add_merge(tok.merge());
    return true;
  });
  if (!ok) throw std::runtime_error(reader.error());
  if (!err.empty()) throw load_error(path, err_line, err);
  return grid;
}

MemoryGrid load_sheet(const SheetSpec& spec, const LoadOptions& opts) {
  const std::string file = locate_sheet(spec).string();
  switch (detect_format(file)) {
    case FileFormat::CSV:   return load_csv_sheet(file, opts);
    case FileFormat::JSONL: return load_jsonl_sheet(file, opts);
    case FileFormat::Unknown: break;
  }
  throw std::runtime_error(file + ": unsupported sheet format");
}

}
