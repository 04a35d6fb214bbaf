// ==============================================================================
// zhc/entry.hpp - Запись истории zsh
// ==============================================================================
//
// Назначение:
// - HistoryEntry: одна выполненная команда (timestamp, длительность, текст)
// - Разбор логической записи ": <ts>:<elapsed>;<command>"
// - Обратное кодирование в строку файла истории
//
// Формат записи (zsh EXTENDED_HISTORY):
//   : 1731884069:0;sleep 2
//
// ==============================================================================

#ifndef ZHC_ENTRY_HPP
#define ZHC_ENTRY_HPP

#include <zhc/calendar.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace zhc::history {

// ----------------------------------------------------------------------------
// HistoryEntry
// ----------------------------------------------------------------------------

/// Одна команда из файла истории
///
/// Равенство определяется только текстом команды: записи с одинаковой
/// командой, но разными timestamp/elapsed считаются одной и той же записью.
class HistoryEntry {
public:
    HistoryEntry() = default;
    HistoryEntry(std::string command, std::uint64_t timestamp, std::uint64_t elapsed,
                 std::size_t elapsed_width = 0)
        : command_(std::move(command)),
          timestamp_(timestamp),
          elapsed_(elapsed),
          elapsed_width_(elapsed_width) {}

    /// Текст команды (включая '\n' и '\' многострочных команд)
    const std::string& command() const { return command_; }

    /// UNIX timestamp начала выполнения
    std::uint64_t timestamp() const { return timestamp_; }

    /// Длительность выполнения в секундах
    std::uint64_t elapsed() const { return elapsed_; }

    /// Число цифр поля elapsed в исходной записи (0 если запись создана в коде)
    /// Ведущие нули сохраняются при обратном кодировании.
    std::size_t elapsed_width() const { return elapsed_width_; }

    /// Локальная календарная дата timestamp
    /// @return std::nullopt если timestamp не преобразуется в дату
    std::optional<CalendarDate> local_date() const;

    /// Человекочитаемое описание записи:
    /// "Command executed at '<время>' for '<n>s': <команда>"
    std::string describe() const;

private:
    std::string command_;
    std::uint64_t timestamp_ = 0;
    std::uint64_t elapsed_ = 0;
    std::size_t elapsed_width_ = 0;
};

inline bool operator==(const HistoryEntry& a, const HistoryEntry& b) {
    return a.command() == b.command();
}

inline bool operator!=(const HistoryEntry& a, const HistoryEntry& b) {
    return !(a == b);
}

// ----------------------------------------------------------------------------
// Разбор записи
// ----------------------------------------------------------------------------

/// Типы ошибок разбора записи
enum class EntryParseErrorKind {
    NoMatch,        // Запись не соответствует формату
    InvalidInteger  // timestamp или elapsed не помещается в uint64
};

/// Ошибка разбора записи
struct EntryParseError {
    EntryParseErrorKind kind = EntryParseErrorKind::NoMatch;

    /// NoMatch: исходный текст записи; InvalidInteger: цифры поля
    std::string text;

    /// Форматировать ошибку для вывода
    std::string format() const;
};

/// Результат разбора записи
struct EntryParseResult {
    bool ok = false;
    HistoryEntry entry;
    EntryParseError error;

    explicit operator bool() const { return ok; }
};

/// Разобрать одну логическую запись
///
/// Формат: ": " <10 цифр> ":" <цифры> ";" <команда>
/// Команда: всё после первого ';' за полем elapsed, включая переводы
/// строк и любые ':'/';' внутри.
EntryParseResult parse_entry(std::string_view record);

/// Закодировать запись в строку файла истории (без завершающего '\n')
/// ": {timestamp}:{elapsed};{command}"
///
/// timestamp дополняется нулями до 10 цифр, elapsed до elapsed_width(),
/// так что to_history_line(parse_entry(r).entry) == r для любой
/// корректной записи r.
std::string to_history_line(const HistoryEntry& entry);

}  // namespace zhc::history

// Хэш по тексту команды (согласован с operator==)
namespace std {
template <>
struct hash<zhc::history::HistoryEntry> {
    size_t operator()(const zhc::history::HistoryEntry& entry) const noexcept {
        return hash<string>{}(entry.command());
    }
};
}  // namespace std

#endif  // ZHC_ENTRY_HPP
