// ==============================================================================
// zhc/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностические сообщения с префиксами ([+], [!], [x], [*], [~])
// - Цветной вывод (ANSI escape codes) при выводе в TTY
// - JSON вывод (RapidJSON)
// - Таблицы и рамки (Unicode box-drawing)
//
// Байты первичны: вывод идёт через fwrite, без std::endl.
//
// ==============================================================================

#ifndef ZHC_OUTPUT_HPP
#define ZHC_OUTPUT_HPP

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace zhc::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,    // Успех, даты
    Yellow,   // Предупреждения, числа
    Red,      // Ошибки
    Cyan,     // Отладка, имена файлов
    Magenta,  // Заголовки
    Blue,     // Рамки
    Dim       // Второстепенный текст
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить informational stderr
    int verbose = 0;     // -v: уровень подробности (0..2+)
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Записать зелёную строку в stdout
    void green_line(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать pretty JSON (отступ 2 пробела) + newline в stdout
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    /// Сбросить буферы
    void flush();

    /// Получить текущую конфигурацию
    const OutputConfig& config() const { return config_; }

    /// Использовать ли цвет для stdout
    bool stdout_colored() const;

private:
    /// Записать префикс сообщения (цветной при TTY) и само сообщение
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    /// Записать с цветом
    void write_colored(Stream s, std::string_view message, Color color);

    /// Получить FILE* для потока
    FILE* get_file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц (Unicode box-drawing)
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    /// Добавить заголовки
    void set_headers(const std::vector<std::string>& headers);

    /// Добавить строку данных
    void add_row(const std::vector<std::string>& cells);

    /// Скруглённые углы (╭╮╰╯ вместо ┌┐└┘)
    void set_rounded(bool rounded) { rounded_ = rounded; }

    /// Вывести таблицу в строку
    std::string to_string() const;

    /// Получить количество строк (без заголовка)
    size_t row_count() const { return rows_.size(); }

private:
    /// Форматировать горизонтальную линию ('T' верх, 'M' разделитель, 'B' низ)
    std::string format_line(char position, const std::vector<size_t>& widths) const;

    /// Форматировать строку данных
    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<size_t>& widths) const;

    /// Вычислить ширину столбцов (по видимой ширине)
    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    bool rounded_ = false;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Видимая ширина строки в терминале
/// ANSI escape-последовательности не учитываются, UTF-8 считается по
/// символам, emoji (>= U+1F300) занимают две колонки
size_t display_width(std::string_view text);

/// Рамка со скруглёнными углами шириной width колонок
/// Каждая строка дополняется пробелами до ширины рамки
std::string format_box(const std::vector<std::string>& lines, size_t width, bool colored);

/// Обернуть текст в ANSI цвет (если colored)
std::string paint(std::string_view text, Color color, bool colored);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace zhc::output

#endif  // ZHC_OUTPUT_HPP
