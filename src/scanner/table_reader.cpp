#include "sheet_table/table_reader.hpp"
#include "sheet_table/header_builder.hpp"
#include "sheet_table/row_scanner.hpp"
#include <memory>
#include <utility>

namespace st {

// Header rows are consumed here; the scanner continues right after them.
static FieldNames read_header(GridSource& src, const ScanConfig& cfg) {
  cfg.validate();
  src.seek(cfg.start_row, cfg.start_col);
  return build_fieldnames(src, cfg);
}

struct TableReader::Impl {
  ScanConfig cfg;
  std::shared_ptr<const FieldNames> names;
  std::unique_ptr<RecordBuilder> builder;
  RowScanner scanner;
  Row row;

  Impl(GridSource& src, ScanConfig c, RecordShape shape)
    : cfg(std::move(c)),
      names(std::make_shared<const FieldNames>(read_header(src, cfg))),
      builder(make_record_builder(shape, names)),
      scanner(src, cfg, names->size()) {}
};

TableReader::TableReader(GridSource& src, ScanConfig cfg, RecordShape shape)
  : p_(new Impl(src, std::move(cfg), shape)) {}

TableReader::~TableReader() { delete p_; }

const std::vector<std::string>& TableReader::fieldnames() const { return *p_->names; }
const ScanConfig& TableReader::config() const { return p_->cfg; }
std::uint64_t TableReader::rows() const noexcept { return p_->scanner.rows(); }

bool TableReader::next(Record& out) {
  if (!p_->scanner.next(p_->row)) return false;
  out = p_->builder->build(std::move(p_->row));
  return true;
}

void TableReader::for_each(const RecordCallback& cb) {
  Record rec;
  while (next(rec)) {
    if (!cb(rec)) break;
  }
}

}
