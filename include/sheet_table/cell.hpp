#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace st {

// Calendar date, days since 1970-01-01.
struct Date {
  std::int32_t days = 0;
};

// Zone-naive date and time, milliseconds since 1970-01-01T00:00:00.
struct Timestamp {
  std::int64_t ms = 0;
};

inline bool operator==(Date a, Date b) noexcept { return a.days == b.days; }
inline bool operator!=(Date a, Date b) noexcept { return a.days != b.days; }
inline bool operator==(Timestamp a, Timestamp b) noexcept { return a.ms == b.ms; }
inline bool operator!=(Timestamp a, Timestamp b) noexcept { return a.ms != b.ms; }

// One decoded cell. Grid sources deliver numbers as double (spreadsheets
// store floats only); int64 shows up after trimming or literal evaluation.
using Cell = std::variant<std::monostate, bool, std::int64_t, double,
                          std::string, Date, Timestamp>;

using Row = std::vector<Cell>;

inline bool is_empty(const Cell& c) noexcept {
  return std::holds_alternative<std::monostate>(c);
}

// Empty cell or empty text.
bool is_blank(const Cell& c) noexcept;

// Equality with int64/double compared numerically; other kinds must match.
bool same_value(const Cell& a, const Cell& b) noexcept;

// Render a cell as text. Floats use the shortest round-trip form; with
// `raw` an integral float keeps its ".0" (3.0 -> "3.0").
// Date -> "YYYY-MM-DD", Timestamp -> "YYYY-MM-DD HH:MM:SS[.mmm]",
// bool -> "TRUE"/"FALSE", empty -> "".
std::string to_text(const Cell& c, bool raw = false);

}
