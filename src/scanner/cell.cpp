#include "sheet_table/cell.hpp"
#include "sheet_table/date_parse.hpp"
#include <charconv>
#include <string>

namespace st {

bool is_blank(const Cell& c) noexcept {
  if (is_empty(c)) return true;
  const std::string* s = std::get_if<std::string>(&c);
  return s && s->empty();
}

static bool as_number(const Cell& c, double& out) noexcept {
  if (const double* d = std::get_if<double>(&c)) { out = *d; return true; }
  if (const std::int64_t* i = std::get_if<std::int64_t>(&c)) { out = static_cast<double>(*i); return true; }
  return false;
}

bool same_value(const Cell& a, const Cell& b) noexcept {
  double x, y;
  if (as_number(a, x) && as_number(b, y)) return x == y;
  return a == b;
}

static std::string float_text(double d, bool raw) {
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
  if (ec != std::errc()) return std::string();
  std::string out(buf, ptr);
  if (raw && out.find_first_of(".eEn") == std::string::npos) out += ".0";
  return out;
}

std::string to_text(const Cell& c, bool raw) {
  switch (c.index()) {
    case 0: return std::string();
    case 1: return std::get<bool>(c) ? "TRUE" : "FALSE";
    case 2: return std::to_string(std::get<std::int64_t>(c));
    case 3: return float_text(std::get<double>(c), raw);
    case 4: return std::get<std::string>(c);
    case 5: return format_date(std::get<Date>(c).days);
    case 6: return format_timestamp(std::get<Timestamp>(c).ms);
  }
  return std::string();
}

}
