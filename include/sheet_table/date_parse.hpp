#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace st {

// Parse of a limited ISO-8601 subset: YYYY-MM-DD[(T| )HH:MM:SS[.fff]]
// optionally followed by 'Z' or a +hh:mm/-hh:mm offset (offsets are ignored,
// values are zone-naive). Returns epoch millis on success.
std::optional<std::int64_t> parse_iso8601_ms(std::string_view s);

// Date-only form YYYY-MM-DD -> days since epoch.
std::optional<std::int32_t> parse_iso_date(std::string_view s);

std::int64_t days_from_civil(int y, unsigned m, unsigned d) noexcept;
void civil_from_days(std::int64_t days, int& y, unsigned& m, unsigned& d) noexcept;

std::string format_date(std::int32_t days);        // "2000-12-31"
std::string format_timestamp(std::int64_t ms);     // "2000-12-31 13:45:00[.250]"

constexpr std::int64_t kMillisPerDay = 86400000;

}
