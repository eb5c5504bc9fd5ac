#include "sheet_table/date_parse.hpp"
#include <algorithm>
#include <cstdio>
#include <string_view>

// NOTE: Small ISO-8601 subset; offsets are accepted but not applied, cells
// from a sheet carry no zone.

namespace st {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

static unsigned days_in_month(int y, unsigned m) {
  static constexpr unsigned dm[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (m == 2 && ((y % 4 == 0 && y % 100 != 0) || y % 400 == 0)) return 29;
  return dm[m - 1];
}

// Howard Hinnant's civil calendar algorithms.
std::int64_t days_from_civil(int y, unsigned m, unsigned d) noexcept {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, int& y, unsigned& m, unsigned& d) noexcept {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
  const unsigned doy = doe - (365*yoe + yoe/4 - yoe/100);
  const unsigned mp = (5*doy + 2)/153;
  d = doy - (153*mp + 2)/5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400) + (m <= 2);
}

static bool parse_ymd(std::string_view s, int& Y, int& M, int& D) {
  if (s.size() < 10) return false;
  if (!(parse_int(s.substr(0,4), Y) && s[4]=='-' && parse_int(s.substr(5,2), M) && s[7]=='-' && parse_int(s.substr(8,2), D)))
    return false;
  return M >= 1 && M <= 12 && D >= 1 && static_cast<unsigned>(D) <= days_in_month(Y, M);
}

std::optional<std::int32_t> parse_iso_date(std::string_view s) {
  int Y, M, D;
  if (s.size() != 10 || !parse_ymd(s, Y, M, D)) return std::nullopt;
  return static_cast<std::int32_t>(days_from_civil(Y, M, D));
}

std::optional<std::int64_t> parse_iso8601_ms(std::string_view s) {
  // Expected forms:
  // YYYY-MM-DD
  // YYYY-MM-DD[T ]HH:MM:SS
  // YYYY-MM-DD[T ]HH:MM:SS.mmm
  // All optionally suffixed with 'Z' or an offset
  int Y,M,D,h=0,m=0,sec=0,ms=0;
  if (!parse_ymd(s, Y, M, D)) return std::nullopt;

  size_t i = 10;
  if (i < s.size() && (s[i]=='T' || s[i]==' ')) {
    ++i;
    if (i+8 > s.size()) return std::nullopt;
    if (!(parse_int(s.substr(i,2), h) && s[i+2]==':' && parse_int(s.substr(i+3,2), m) && s[i+5]==':' && parse_int(s.substr(i+6,2), sec)))
      return std::nullopt;
    if (h > 23 || m > 59 || sec > 59) return std::nullopt;
    i += 8;
    if (i < s.size() && s[i]=='.') {
      size_t j=i+1, k=j;
      while (k < s.size() && is_digit(s[k])) ++k;
      if (k == j) return std::nullopt;
      int frac=0; if (!parse_int(s.substr(j, std::min<size_t>(k-j, 3)), frac)) return std::nullopt;
      if ((k-j)==1) ms = frac*100;
      else if ((k-j)==2) ms = frac*10;
      else ms = frac; // digits past milliseconds are dropped
      i = k;
    }
  }

  if (i < s.size()) {
    std::string_view zone = s.substr(i);
    bool ok = zone == "Z";
    if (!ok && zone.size() == 6 && (zone[0]=='+' || zone[0]=='-') && zone[3]==':') {
      int zh, zm;
      ok = parse_int(zone.substr(1,2), zh) && parse_int(zone.substr(4,2), zm);
    }
    if (!ok) return std::nullopt;
  }

  const std::int64_t days = days_from_civil(Y, M, D);
  return days * kMillisPerDay + ((h * 60 + m) * 60 + sec) * std::int64_t{1000} + ms;
}

std::string format_date(std::int32_t days) {
  int y; unsigned m, d;
  civil_from_days(days, y, m, d);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
  return buf;
}

std::string format_timestamp(std::int64_t ms) {
  std::int64_t days = ms / kMillisPerDay;
  std::int64_t rem = ms % kMillisPerDay;
  if (rem < 0) { rem += kMillisPerDay; --days; }
  const int msec = static_cast<int>(rem % 1000);
  const int total_s = static_cast<int>(rem / 1000);
  char buf[48];
  int n = std::snprintf(buf, sizeof(buf), "%s %02d:%02d:%02d",
                        format_date(static_cast<std::int32_t>(days)).c_str(),
                        total_s / 3600, (total_s / 60) % 60, total_s % 60);
  std::string out(buf, n > 0 ? static_cast<size_t>(n) : 0);
  if (msec) {
    std::snprintf(buf, sizeof(buf), ".%03d", msec);
    out += buf;
  }
  return out;
}

}
