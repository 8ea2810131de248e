#ifndef LEDGERFLOW_DATE_UTILS_HPP
#define LEDGERFLOW_DATE_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ledgerflow {
namespace dates {

// Calendar dates are handled as whole days since 1970-01-01 (proleptic Gregorian).
using DayNumber = int64_t;

using Clock = std::chrono::system_clock;

DayNumber days_from_civil(int year, unsigned month, unsigned day);

// Accepts "YYYY-MM-DD", optionally followed by a time part ("T10:30:00Z",
// " 10:30:00"), which is truncated. Returns nullopt for anything else,
// including out-of-range months and days.
std::optional<DayNumber> parse_iso_date(const std::string& text);

std::string format_iso_date(DayNumber days);

// Current calendar date in UTC
DayNumber today();

} // namespace dates
} // namespace ledgerflow

#endif // LEDGERFLOW_DATE_UTILS_HPP
