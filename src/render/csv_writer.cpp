#include "sheet_table/csv_writer.hpp"
#include <string>

namespace st {

std::string replace_nbsp(std::string s) {
  std::string::size_type pos = 0;
  while ((pos = s.find("\xC2\xA0", pos)) != std::string::npos) {
    s.replace(pos, 2, " ");
    ++pos;
  }
  return s;
}

CsvWriter::CsvWriter(std::ostream& out, char delimiter)
  : out_(out), delim_(delimiter) {}

void CsvWriter::write_field(std::string_view s) {
  const bool quote = s.find_first_of(std::string{delim_, '"', '\n', '\r'}) != std::string_view::npos;
  if (!quote) { out_ << s; return; }
  out_ << '"';
  for (char c : s) {
    if (c == '"') out_ << '"';
    out_ << c;
  }
  out_ << '"';
}

void CsvWriter::write_row(const std::vector<std::string>& fields) {
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i) out_ << delim_;
    write_field(replace_nbsp(fields[i]));
  }
  out_ << '\n';
  ++rows_;
}

void CsvWriter::write_cells(const Row& cells, bool raw) {
  std::vector<std::string> fields;
  fields.reserve(cells.size());
  for (const auto& c : cells) fields.push_back(to_text(c, raw));
  write_row(fields);
}

}
