// ==============================================================================
// calendar.cpp - Календарная дата
// ==============================================================================

#include "zhc/calendar.hpp"

#include "zhc/platform.hpp"

#include <cctype>
#include <cstdio>

namespace zhc {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

bool parse_digits(std::string_view text, int& out) {
    if (text.empty()) {
        return false;
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

}  // anonymous namespace

std::optional<CalendarDate> CalendarDate::parse(std::string_view text) {
    // Строго YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_digits(text.substr(0, 4), year) || !parse_digits(text.substr(5, 2), month) ||
        !parse_digits(text.substr(8, 2), day)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12) {
        return std::nullopt;
    }
    if (day < 1 || static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }

    return CalendarDate{year, static_cast<unsigned>(month), static_cast<unsigned>(day)};
}

std::optional<CalendarDate> CalendarDate::from_timestamp(std::uint64_t seconds) {
    auto tm = platform::local_time(seconds);
    if (!tm) {
        return std::nullopt;
    }
    return CalendarDate{tm->tm_year + 1900, static_cast<unsigned>(tm->tm_mon + 1),
                        static_cast<unsigned>(tm->tm_mday)};
}

std::string CalendarDate::to_string() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    return buf;
}

// Алгоритм days_from_civil (Howard Hinnant)
std::int64_t CalendarDate::days_since_epoch() const {
    std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t m = static_cast<std::int64_t>(month);
    const std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::int64_t days_between(const CalendarDate& from, const CalendarDate& to) {
    return to.days_since_epoch() - from.days_since_epoch();
}

}  // namespace zhc
