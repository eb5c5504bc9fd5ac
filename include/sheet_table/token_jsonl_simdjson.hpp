#pragma once
#include "sheet_table/cell.hpp"
#include "sheet_table/grid_source.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace st {

struct JsonlConfig {
  bool   strict = true;                      // reject lines that are neither row nor merge
  size_t cap_nested_value_bytes = 32 * 1024; // cap for nested arrays/objects kept as text
};

// Decodes one sheet-dump line: a JSON array is a row, {"merge": ...} a
// merge region. Blank lines are ignored.
class JsonlSheetTokenizer {
public:
  enum class LineKind { Row, Merge, Skip };

  explicit JsonlSheetTokenizer(const JsonlConfig& cfg);
  ~JsonlSheetTokenizer();

  JsonlSheetTokenizer(const JsonlSheetTokenizer&) = delete;
  JsonlSheetTokenizer& operator=(const JsonlSheetTokenizer&) = delete;

  // Returns false on a malformed line; see error(). On success `*kind`
  // says which of row()/merge() was filled.
  bool feed_line(std::string_view line, LineKind* kind);

  const Row& row() const;
  const MergeRegion& merge() const;
  const std::string& error() const { return err_; }

private:
  struct Impl; Impl* p_;
  std::string err_;
};

}
