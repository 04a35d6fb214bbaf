// ==============================================================================
// zhc/calendar.hpp - Календарная дата
// ==============================================================================
//
// Назначение:
// - CalendarDate: дата без времени (год, месяц, день) с полным порядком
// - Разбор и форматирование "YYYY-MM-DD"
// - Преобразование UNIX timestamp -> локальная дата
//
// ==============================================================================

#ifndef ZHC_CALENDAR_HPP
#define ZHC_CALENDAR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace zhc {

/// Календарная дата (григорианский календарь)
struct CalendarDate {
    int year = 1970;
    unsigned month = 1;  // 1..12
    unsigned day = 1;    // 1..31

    /// Разобрать "YYYY-MM-DD"
    /// @return std::nullopt если формат неверен или дата не существует
    static std::optional<CalendarDate> parse(std::string_view text);

    /// Локальная дата для UNIX timestamp
    /// @return std::nullopt если timestamp не преобразуется
    static std::optional<CalendarDate> from_timestamp(std::uint64_t seconds);

    /// "YYYY-MM-DD"
    std::string to_string() const;

    /// Номер дня от 1970-01-01 (может быть отрицательным)
    std::int64_t days_since_epoch() const;
};

inline bool operator==(const CalendarDate& a, const CalendarDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

inline bool operator!=(const CalendarDate& a, const CalendarDate& b) {
    return !(a == b);
}

inline bool operator<(const CalendarDate& a, const CalendarDate& b) {
    return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}

inline bool operator<=(const CalendarDate& a, const CalendarDate& b) {
    return !(b < a);
}

inline bool operator>(const CalendarDate& a, const CalendarDate& b) {
    return b < a;
}

inline bool operator>=(const CalendarDate& a, const CalendarDate& b) {
    return !(a < b);
}

/// Количество дней от from до to (to - from)
std::int64_t days_between(const CalendarDate& from, const CalendarDate& to);

}  // namespace zhc

#endif  // ZHC_CALENDAR_HPP
