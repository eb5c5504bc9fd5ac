#include "sheet_table/parse_policy.hpp"
#include "sheet_table/date_parse.hpp"
#include "sheet_table/value_normalizer.hpp"
#include <cctype>
#include <string>
#include <string_view>

namespace st {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

bool ParsePolicy::parse_bool(std::string_view s, bool& out) const {
  for (const auto& t : bool_policy.true_tokens) {
    if (bool_policy.case_sensitive ? (s == t) : ieq(s, t)) { out = true; return true; }
  }
  for (const auto& f : bool_policy.false_tokens) {
    if (bool_policy.case_sensitive ? (s == f) : ieq(s, f)) { out = false; return true; }
  }
  return false;
}

Cell ParsePolicy::type_cell(std::string_view s, bool quoted) const {
  if (quoted) return std::string(s);
  if (s.empty()) return Cell{};

  // Cheap first-byte gate before the numeric/date attempts.
  const unsigned char c0 = static_cast<unsigned char>(s.front());
  const bool numeric_start = std::isdigit(c0) || c0 == '-' || c0 == '+' || c0 == '.';

  if (infer_dates && numeric_start && s.size() >= 10 && s[4] == '-') {
    if (auto ms = parse_iso8601_ms(s)) return Timestamp{*ms};
  }
  if (infer_numbers && numeric_start) {
    if (auto v = parse_number(s)) return *v;
  }
  if (infer_bools) {
    bool b;
    if (parse_bool(s, b)) return b;
  }
  return std::string(s);
}

}
