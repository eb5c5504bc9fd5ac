#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace st {

enum class FileFormat { CSV, JSONL, Unknown };

// Guess format from extension (.csv | .jsonl | .ndjson), case-insensitive.
FileFormat detect_format(std::string_view path);

// "path/to/book!Sheet" -> {path, sheet}; no '!' -> empty sheet (leftmost).
struct SheetSpec {
  std::string path;
  std::string sheet;
};
SheetSpec parse_sheet_spec(std::string_view arg);

// Sheet dump files of a workbook directory, sorted by file name.
std::vector<std::filesystem::path> list_sheets(const std::filesystem::path& dir);

// File holding the requested sheet. A directory is searched by file stem
// (empty name -> first sheet); a single file is a one-sheet workbook named
// by its stem. Throws std::runtime_error when nothing matches.
std::filesystem::path locate_sheet(const SheetSpec& spec);

}
