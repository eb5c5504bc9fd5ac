#pragma once
#include "sheet_table/grid_source.hpp"
#include "sheet_table/record.hpp"
#include "sheet_table/scan_config.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace st {

// One scan session over a sheet: header first (in the constructor), then
// records pulled one at a time. The source must not be advanced elsewhere
// while the reader is alive.
class TableReader {
public:
  using RecordCallback = std::function<bool(const Record&)>;

  // Throws ScanError for invalid configuration or record shape.
  TableReader(GridSource& src, ScanConfig cfg, RecordShape shape = RecordShape::Map);
  ~TableReader();

  TableReader(const TableReader&) = delete;
  TableReader& operator=(const TableReader&) = delete;

  const std::vector<std::string>& fieldnames() const;

  // False once the table ends (stop condition or exhausted sheet).
  bool next(Record& out);

  // Drives next() until the table ends or `cb` returns false.
  void for_each(const RecordCallback& cb);

  const ScanConfig& config() const;
  std::uint64_t rows() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
