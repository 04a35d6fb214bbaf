// ==============================================================================
// zhc/zsh_line.hpp - Декодер строк истории zsh
// ==============================================================================
//
// Назначение:
// - Снятие метафикации zsh (маркер 0x83 + байт XOR 0x20)
// - Склейка строк-продолжений (завершающий '\') в логические записи
// - Ленивое однопроходное чтение логических записей из потока
//
// Формат метафикации: https://www.zsh.org/mla/users/2011/msg00154.html
//
// ==============================================================================

#ifndef ZHC_ZSH_LINE_HPP
#define ZHC_ZSH_LINE_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zhc::io {

// ----------------------------------------------------------------------------
// Метафикация
// ----------------------------------------------------------------------------

/// Байт-маркер метафикации zsh
constexpr unsigned char META_MARKER = 0x83;

/// Маска, которой zsh "прячет" следующий за маркером байт
constexpr unsigned char META_MASK = 0x20;

/// Последний байт диапазона, который zsh метафицирует (Marker)
/// Метафицируются 0x00 и байты META_MARKER..META_LAST.
constexpr unsigned char META_LAST = 0xa2;

/// Байт требует метафикации при записи
bool needs_meta(unsigned char byte);

/// Снять метафикацию с физической строки (in-place, O(n))
///
/// Последовательность <0x83, b> заменяется одним байтом b ^ 0x20.
/// Маркер в самом конце строки остаётся как есть.
void unmetafy(std::string& line);

/// Обратная операция к unmetafy: байт b, требующий метафикации,
/// записывается как <0x83, b ^ 0x20>
std::string metafy(std::string_view text);

/// Строка продолжается на следующей физической строке:
/// после отбрасывания хвостовых пробелов она оканчивается на '\'
bool is_continued(std::string_view line);

// ----------------------------------------------------------------------------
// LineDecodeError
// ----------------------------------------------------------------------------

/// Ошибка чтения/декодирования физической строки
struct LineDecodeError {
    /// Номер физической строки (1-based)
    std::uint64_t line = 0;

    /// Причина
    std::string cause;

    /// "Error when reading line <n>: <cause>."
    std::string format() const;
};

// ----------------------------------------------------------------------------
// ZshLineReader
// ----------------------------------------------------------------------------

/// Однопроходный читатель логических записей истории
///
/// Использование:
/// @code
///   std::ifstream in(path, std::ios::binary);
///   ZshLineReader reader(in);
///   std::string record;
///   while (reader.next(record)) {
///       // обработка записи
///   }
///   if (reader.last_error()) {
///       // файл повреждён
///   }
/// @endcode
class ZshLineReader {
public:
    /// Поток должен быть открыт в binary-режиме и жить дольше читателя
    explicit ZshLineReader(std::istream& in);

    /// Получить следующую логическую запись
    ///
    /// @param out[out] Запись (физические строки, склеенные через '\n')
    /// @return false если записи закончились или произошла ошибка
    ///         (см. last_error())
    bool next(std::string& out);

    /// Ошибка, остановившая чтение (если была)
    const std::optional<LineDecodeError>& last_error() const { return error_; }

    /// Количество прочитанных физических строк
    std::uint64_t line_number() const { return line_; }

private:
    /// Прочитать и декодировать одну физическую строку
    bool read_physical_line(std::string& out);

    std::istream& in_;
    std::uint64_t line_ = 0;
    bool done_ = false;
    std::optional<LineDecodeError> error_;
};

// ----------------------------------------------------------------------------
// Чтение целиком
// ----------------------------------------------------------------------------

/// Результат чтения всех логических записей
struct RecordsResult {
    bool ok = false;
    std::vector<std::string> records;
    LineDecodeError error;

    explicit operator bool() const { return ok; }
};

/// Прочитать все логические записи из потока
RecordsResult read_logical_records(std::istream& in);

}  // namespace zhc::io

#endif  // ZHC_ZSH_LINE_HPP
