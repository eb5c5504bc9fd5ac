#include "sheet_table/value_normalizer.hpp"
#include "sheet_table/date_parse.hpp"
#include "sheet_table/scan_error.hpp"
#include <charconv>
#include <cmath>
#include <string>
#include <fast_float/fast_float.h>

namespace st {

static bool all_digits(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) if (c < '0' || c > '9') return false;
  return true;
}

// Strips "X:" or "X(...)" for marker letter `m`; false if not marked.
static bool strip_marker(std::string_view s, char m, std::string_view& body) {
  if (s.size() >= 2 && s[0] == m && s[1] == ':') { body = s.substr(2); return true; }
  if (s.size() >= 3 && s[0] == m && s[1] == '(' && s.back() == ')') {
    body = s.substr(2, s.size() - 3);
    return true;
  }
  return false;
}

bool has_type_marker(std::string_view s) noexcept {
  std::string_view body;
  return strip_marker(s, 'T', body) || strip_marker(s, 'N', body);
}

std::optional<double> parse_number(std::string_view s) noexcept {
  if (s.empty()) return std::nullopt;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  if (*first == '+') {  // fast_float rejects a leading '+'
    ++first;
    if (first == last || *first == '-') return std::nullopt;
  }
  double out;
  auto [ptr, ec] = fast_float::from_chars(first, last, out);
  if (ec != std::errc() || ptr != last || !std::isfinite(out)) return std::nullopt;
  return out;
}

Cell parse_literal(std::string_view s) {
  std::string_view body;
  if (strip_marker(s, 'T', body)) return std::string(body);
  if (strip_marker(s, 'N', body)) {
    if (auto v = parse_number(body)) return *v;
    throw ScanError(ErrorKind::MalformedAddress,
                    "invalid numeric literal '" + std::string(s) + "'");
  }
  if (all_digits(s)) {
    std::int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec == std::errc() && ptr == s.data() + s.size()) return v;
    return std::string(s);  // out of int64 range: keep as text
  }
  const auto dot = s.find('.');
  if (dot != std::string_view::npos && s.find('.', dot + 1) == std::string_view::npos) {
    std::string digits(s.substr(0, dot));
    digits.append(s.substr(dot + 1));
    if (all_digits(digits)) {
      if (auto v = parse_number(s)) return *v;
    }
  }
  return std::string(s);
}

Cell trim_cell(const Cell& c) {
  if (const double* d = std::get_if<double>(&c)) {
    // 2^63 bounds the int64 range exactly.
    if (std::isfinite(*d) && std::trunc(*d) == *d &&
        *d >= -9223372036854775808.0 && *d < 9223372036854775808.0)
      return static_cast<std::int64_t>(*d);
    return c;
  }
  if (const Timestamp* t = std::get_if<Timestamp>(&c)) {
    if (t->ms % kMillisPerDay == 0)
      return Date{static_cast<std::int32_t>(t->ms / kMillisPerDay)};
    return c;
  }
  return c;
}

void trim_row(Row& row) {
  for (auto& c : row) {
    if (std::holds_alternative<double>(c) || std::holds_alternative<Timestamp>(c))
      c = trim_cell(c);
  }
}

}
