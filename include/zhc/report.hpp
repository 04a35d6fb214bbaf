// ==============================================================================
// zhc/report.hpp - Отчёт анализатора
// ==============================================================================
//
// Назначение:
// - Текстовый отчёт: рамка со статистикой + таблица "Top N Most Used"
//
// JSON отчёт строится через HistoryAnalysis::to_rapidjson.
//
// ==============================================================================

#ifndef ZHC_REPORT_HPP
#define ZHC_REPORT_HPP

#include <zhc/analyze.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace zhc::analyze {

/// Ширина рамки со статистикой
constexpr std::size_t REPORT_BOX_WIDTH = 90;

/// Максимальная длина имени файла в заголовке
constexpr std::size_t REPORT_FILENAME_MAX = 60;

/// Максимальная длина ячейки таблицы (байты, без суффикса)
constexpr std::size_t REPORT_CELL_MAX = 40;

/// Текстовый отчёт
/// @param colored  ANSI цвета (только для TTY)
std::string render_report(const HistoryAnalysis& analysis, bool colored);

// ----------------------------------------------------------------------------
// Вспомогательные функции (открыты для тестов)
// ----------------------------------------------------------------------------

/// "..." + конец текста, если текст длиннее max символов
std::string truncate_left(std::string_view text, std::size_t max);

/// Ячейка рейтинга: переводы строк заменены пробелами, текст обрезан
/// до max байт (по границе символа UTF-8) с "...", затем " (N times)"
std::string format_ranked_cell(std::string_view text, std::size_t max, std::size_t count);

/// Значок места: медали для 1-3, иначе номер
std::string rank_icon(std::size_t rank);

/// "1 day", "N days"
std::string humanize_days(std::int64_t days);

}  // namespace zhc::analyze

#endif  // ZHC_REPORT_HPP
