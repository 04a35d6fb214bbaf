// ==============================================================================
// entry.cpp - Запись истории zsh: разбор и кодирование
// ==============================================================================

#include "zhc/entry.hpp"

#include "zhc/platform.hpp"

#include <charconv>
#include <ctime>
#include <regex>

namespace zhc::history {

namespace {

// Заголовок записи. Тело команды регуляркой не разбирается: берётся
// суффикс после совпадения, поэтому ':' и ';' внутри команды не мешают,
// а длинные многострочные команды не нагружают движок std::regex.
const std::regex& header_regex() {
    static const std::regex re(R"(: (\d{10}):(\d+);)", std::regex::ECMAScript);
    return re;
}

bool parse_u64(std::string_view digits, std::uint64_t& out) {
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

/// Ширина поля timestamp в формате записи
constexpr std::size_t TIMESTAMP_WIDTH = 10;

/// Дописать число, дополнив его слева нулями до width цифр
void append_padded(std::string& out, std::uint64_t value, std::size_t width) {
    std::string digits = std::to_string(value);
    if (digits.size() < width) {
        out.append(width - digits.size(), '0');
    }
    out += digits;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// HistoryEntry
// ----------------------------------------------------------------------------

std::optional<CalendarDate> HistoryEntry::local_date() const {
    return CalendarDate::from_timestamp(timestamp_);
}

std::string HistoryEntry::describe() const {
    std::string when = std::to_string(timestamp_);

    if (auto tm = platform::local_time(timestamp_)) {
        char buf[64];
        std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S %z", &*tm);
        if (len > 0) {
            when.assign(buf, len);
        }
    }

    return "Command executed at '" + when + "' for '" + std::to_string(elapsed_) +
           "s': " + command_;
}

// ----------------------------------------------------------------------------
// EntryParseError
// ----------------------------------------------------------------------------

std::string EntryParseError::format() const {
    switch (kind) {
    case EntryParseErrorKind::NoMatch:
        return "Failed to parse '" + text +
               "' as a history entry. Make sure this is a valid entry from a Zsh history file.";
    case EntryParseErrorKind::InvalidInteger:
        return "Failed to parse integer: number too large to fit in target type (" + text + ").";
    }
    return "Failed to parse '" + text + "'";
}

// ----------------------------------------------------------------------------
// Разбор / кодирование
// ----------------------------------------------------------------------------

EntryParseResult parse_entry(std::string_view record) {
    EntryParseResult result;

    std::cmatch match;
    const char* begin = record.data();
    const char* end = record.data() + record.size();
    if (!std::regex_search(begin, end, match, header_regex(),
                           std::regex_constants::match_continuous)) {
        result.error = EntryParseError{EntryParseErrorKind::NoMatch, std::string(record)};
        return result;
    }

    std::string_view ts_digits(match[1].first, static_cast<std::size_t>(match[1].length()));
    std::string_view elapsed_digits(match[2].first, static_cast<std::size_t>(match[2].length()));

    std::uint64_t timestamp = 0;
    if (!parse_u64(ts_digits, timestamp)) {
        result.error = EntryParseError{EntryParseErrorKind::InvalidInteger, std::string(ts_digits)};
        return result;
    }

    std::uint64_t elapsed = 0;
    if (!parse_u64(elapsed_digits, elapsed)) {
        result.error =
            EntryParseError{EntryParseErrorKind::InvalidInteger, std::string(elapsed_digits)};
        return result;
    }

    result.entry = HistoryEntry(std::string(match.suffix().first, match.suffix().second),
                                timestamp, elapsed, elapsed_digits.size());
    result.ok = true;
    return result;
}

std::string to_history_line(const HistoryEntry& entry) {
    std::string line;
    line.reserve(entry.command().size() + 24);
    line += ": ";
    append_padded(line, entry.timestamp(), TIMESTAMP_WIDTH);
    line += ':';
    append_padded(line, entry.elapsed(), entry.elapsed_width());
    line += ';';
    line += entry.command();
    return line;
}

}  // namespace zhc::history
