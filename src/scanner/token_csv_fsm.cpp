#include "sheet_table/token_csv_fsm.hpp"
#include <string_view>
#include <vector>

namespace st {

struct CsvFsm::Impl {
  enum class Mode { FieldStart, Unquoted, Quoted, QuoteSeen };

  CsvConfig cfg;
  std::vector<CsvField> fields;
  std::string cur;
  bool cur_quoted{false};
  bool pending{false};  // inside a quoted field that spans lines
  Mode mode{Mode::FieldStart};

  void push_field() {
    fields.push_back(CsvField{std::move(cur), cur_quoted});
    cur.clear();
    cur_quoted = false;
    mode = Mode::FieldStart;
  }

  // false on malformed quoting
  bool parse_line(std::string_view line) {
    if (pending) {
      cur.push_back('\n');
    } else {
      fields.clear();
      cur.clear();
      cur_quoted = false;
      mode = Mode::FieldStart;
    }
    for (char c : line) {
      switch (mode) {
        case Mode::FieldStart:
          if (c == cfg.quote) { mode = Mode::Quoted; cur_quoted = true; }
          else if (c == cfg.delimiter) push_field();
          else { cur.push_back(c); mode = Mode::Unquoted; }
          break;
        case Mode::Unquoted:
          if (c == cfg.delimiter) push_field();
          else cur.push_back(c);            // stray quotes are kept literally
          break;
        case Mode::Quoted:
          if (c == cfg.quote) mode = Mode::QuoteSeen;
          else cur.push_back(c);
          break;
        case Mode::QuoteSeen:
          if (c == cfg.quote) { cur.push_back(c); mode = Mode::Quoted; }  // escaped quote
          else if (c == cfg.delimiter) push_field();
          else return false;
          break;
      }
    }
    pending = (mode == Mode::Quoted);
    if (!pending) push_field();
    return true;
  }
};

CsvFsm::CsvFsm(const CsvConfig& cfg)
  : p_(new Impl{cfg}), records_(0) {}

CsvFsm::~CsvFsm() { delete p_; }

const std::vector<CsvField>& CsvFsm::fields() const { return p_->fields; }

bool CsvFsm::feed(std::string_view line, bool* complete) {
  *complete = false;
  if (!p_->parse_line(line)) {
    err_ = "CSV parse error (character after closing quote)";
    p_->pending = false;
    return false;
  }
  if (p_->pending) return true;
  *complete = true;
  ++records_;
  return true;
}

bool CsvFsm::finish() {
  if (p_->pending) { err_ = "CSV parse error (unterminated quoted field)"; return false; }
  return true;
}

}
