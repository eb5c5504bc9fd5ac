#include "sheet_table/address.hpp"
#include "sheet_table/scan_error.hpp"
#include "sheet_table/value_normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace st {

static bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
static bool is_digit(char c) { return c >= '0' && c <= '9'; }

static std::size_t span_of(std::string_view s, std::size_t i, bool (*pred)(char)) {
  std::size_t j = i;
  while (j < s.size() && pred(s[j])) ++j;
  return j;
}

std::optional<std::size_t> column_index(std::string_view letters) noexcept {
  if (!letters.empty() && letters.front() == '$') letters.remove_prefix(1);
  if (letters.empty() || letters.size() > 3) return std::nullopt;
  std::size_t v = 0;
  for (char c : letters) {
    if (!is_alpha(c)) return std::nullopt;
    v = v * 26 + static_cast<std::size_t>(std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
  }
  return v - 1;
}

std::string column_letter(std::size_t col) {
  std::string out;
  std::size_t n = col + 1;
  while (n > 0) {
    const std::size_t rem = (n - 1) % 26;
    out.push_back(static_cast<char>('A' + rem));
    n = (n - 1) / 26;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

AddressParts decompose_address(std::string_view s) {
  // R1C1 notation
  if (s.size() >= 4 && (s[0] == 'R' || s[0] == 'r')) {
    std::size_t r_end = span_of(s, 1, is_digit);
    if (r_end > 1 && r_end < s.size() && (s[r_end] == 'C' || s[r_end] == 'c')) {
      std::size_t c_end = span_of(s, r_end + 1, is_digit);
      if (c_end > r_end + 1 && c_end == s.size())
        return {std::string(s.substr(1, r_end - 1)), std::string(s.substr(r_end + 1))};
    }
  }
  // A1 notation, '$' allowed before either part
  std::size_t i = (!s.empty() && s[0] == '$') ? 1 : 0;
  std::size_t col_end = span_of(s, i, is_alpha);
  if (col_end > i) {
    std::size_t j = (col_end < s.size() && s[col_end] == '$') ? col_end + 1 : col_end;
    std::size_t row_end = span_of(s, j, is_digit);
    if (row_end > j && row_end == s.size())
      return {std::string(s.substr(j)), std::string(s.substr(i, col_end - i))};
  }
  throw ScanError(ErrorKind::MalformedAddress, "illegal cell address '" + std::string(s) + "'");
}

// 1-based row/column number text -> zero-based index.
static std::size_t ordinal_index(std::string_view digits, std::string_view what) {
  Cell v = parse_literal(digits);
  const std::int64_t* n = std::get_if<std::int64_t>(&v);
  if (!n || *n < 1)
    throw ScanError(ErrorKind::MalformedAddress,
                    std::string(what) + " numbers start at 1, got '" + std::string(digits) + "'");
  return static_cast<std::size_t>(*n - 1);
}

static std::size_t cell_col(const AddressParts& p) {
  if (!p.col.empty() && is_digit(p.col[0])) return ordinal_index(p.col, "column");
  if (auto c = column_index(p.col)) return *c;
  throw ScanError(ErrorKind::MalformedAddress, "illegal column '" + p.col + "'");
}

MergeRegion parse_range(std::string_view s) {
  const auto colon = s.find(':');
  const AddressParts a = decompose_address(s.substr(0, colon));
  const AddressParts b = colon == std::string_view::npos ? a : decompose_address(s.substr(colon + 1));
  const std::size_t r1 = ordinal_index(a.row, "row"), r2 = ordinal_index(b.row, "row");
  const std::size_t c1 = cell_col(a), c2 = cell_col(b);
  MergeRegion m;
  m.row_lo = std::min(r1, r2); m.row_hi = std::max(r1, r2) + 1;
  m.col_lo = std::min(c1, c2); m.col_hi = std::max(c1, c2) + 1;
  return m;
}

std::size_t resolve_start_row(std::string_view spec) {
  if (spec.empty()) return 0;
  return ordinal_index(spec, "row");
}

std::size_t resolve_start_col(std::string_view spec) {
  if (spec.empty()) return 0;
  if (is_digit(spec[0])) return ordinal_index(spec, "column");
  if (auto c = column_index(spec)) return *c;
  throw ScanError(ErrorKind::MalformedAddress, "illegal start column '" + std::string(spec) + "'");
}

static Boundary literal_boundary(const Cell& v) {
  if (const double* d = std::get_if<double>(&v)) return *d;
  if (const std::string* s = std::get_if<std::string>(&v)) return *s;
  return Unbounded{};
}

Boundary resolve_stop_row(std::string_view spec) {
  if (spec.empty()) return Unbounded{};
  if (has_type_marker(spec)) return literal_boundary(parse_literal(spec));
  Cell v = parse_literal(spec);
  if (std::holds_alternative<std::int64_t>(v)) return StopIndex{ordinal_index(spec, "row")};
  return literal_boundary(v);
}

Boundary resolve_stop_col(std::string_view spec) {
  if (spec.empty()) return Unbounded{};
  if (has_type_marker(spec)) return literal_boundary(parse_literal(spec));
  Cell v = parse_literal(spec);
  if (std::holds_alternative<std::int64_t>(v)) return StopIndex{ordinal_index(spec, "column")};
  if (const std::string* s = std::get_if<std::string>(&v)) {
    if (auto c = column_index(*s)) return StopIndex{*c};
  }
  return literal_boundary(v);
}

}
