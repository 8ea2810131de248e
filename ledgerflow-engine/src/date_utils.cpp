#include "date_utils.hpp"
#include <cctype>
#include <cstdio>

namespace ledgerflow {
namespace dates {

namespace {

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool read_digits(const std::string& text, size_t pos, size_t count, int& value) {
    if (pos + count > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    return true;
}

} // anonymous namespace

DayNumber days_from_civil(int year, unsigned month, unsigned day) {
    // Howard Hinnant's days_from_civil
    year -= month <= 2 ? 1 : 0;
    const int era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<DayNumber>(era) * 146097 + static_cast<DayNumber>(doe) - 719468;
}

std::optional<DayNumber> parse_iso_date(const std::string& text) {
    int year = 0;
    int month = 0;
    int day = 0;

    if (!read_digits(text, 0, 4, year) || text.size() < 10 ||
        text[4] != '-' || !read_digits(text, 5, 2, month) ||
        text[7] != '-' || !read_digits(text, 8, 2, day)) {
        return std::nullopt;
    }
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }

    return days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

std::string format_iso_date(DayNumber days) {
    // Howard Hinnant's civil_from_days
    days += 719468;
    const DayNumber era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned day = doy - (153 * mp + 2) / 5 + 1;
    const unsigned month = mp < 10 ? mp + 3 : mp - 9;
    const long long year = static_cast<long long>(yoe) + era * 400 + (month <= 2 ? 1 : 0);

    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", year, month, day);
    return buffer;
}

DayNumber today() {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        Clock::now().time_since_epoch()).count();
    DayNumber days = seconds / 86400;
    if (seconds < 0 && seconds % 86400 != 0) {
        --days;
    }
    return days;
}

} // namespace dates
} // namespace ledgerflow
