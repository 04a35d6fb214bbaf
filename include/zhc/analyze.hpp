// ==============================================================================
// zhc/analyze.hpp - Статистика по истории
// ==============================================================================
//
// Назначение:
// - HistoryAnalyzer: частотный анализ (топ команд, топ исполняемых файлов,
//   диапазон дат, количество дубликатов) поверх History только на чтение
// - HistoryAnalysis: итоговая структура для вывода (текст/JSON)
//
// Порядок в рейтингах детерминирован: по убыванию частоты, при равенстве
// по возрастанию текста (побайтовое сравнение).
//
// ==============================================================================

#ifndef ZHC_ANALYZE_HPP
#define ZHC_ANALYZE_HPP

#include <zhc/calendar.hpp>
#include <zhc/history.hpp>

#include <rapidjson/document.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace zhc::analyze {

/// Рейтинг: (ключ, количество вхождений)
using Ranking = std::vector<std::pair<std::string, std::size_t>>;

/// Диапазон дат (min, max)
using DateRange = std::pair<CalendarDate, CalendarDate>;

// ----------------------------------------------------------------------------
// HistoryAnalysis
// ----------------------------------------------------------------------------

/// Результат анализа одного файла истории
struct HistoryAnalysis {
    /// Путь к файлу (UTF-8)
    std::string filename;

    /// Количество команд
    std::size_t size = 0;

    /// Диапазон локальных дат; нет, если ни один timestamp не преобразуется
    std::optional<DateRange> date_range;

    /// Количество различных команд, встречающихся более одного раза
    std::size_t duplicate_count = 0;

    /// Запрошенный размер рейтингов
    std::size_t top_n = 0;

    Ranking top_n_commands;
    Ranking top_n_executables;

    /// Доля дубликатов в процентах (0 для пустой истории)
    double duplicate_percentage() const;

    /// Сериализация в RapidJSON
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;
};

// ----------------------------------------------------------------------------
// HistoryAnalyzer
// ----------------------------------------------------------------------------

class HistoryAnalyzer {
public:
    /// History должна жить дольше анализатора
    explicit HistoryAnalyzer(const history::History& history) : history_(history) {}

    /// Полный анализ
    HistoryAnalysis analyze(std::size_t top_n) const;

    /// N самых частых команд
    /// n == 0 или пустая история -> пустой результат
    Ranking top_n_commands(std::size_t n) const;

    /// N самых частых исполняемых файлов (первое слово команды)
    Ranking top_n_executables(std::size_t n) const;

    /// (min, max) локальных дат по всем записям (полный проход)
    std::optional<DateRange> date_range() const;

    /// Количество различных команд, встречающихся более одного раза
    std::size_t duplicate_count() const { return history_.duplicate_commands_count(); }

private:
    const history::History& history_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Исполняемый файл команды: первое слово, разделённое пробельными символами
/// @return срез command; std::nullopt для пустой команды или команды только из пробелов
std::optional<std::string_view> executable_of(std::string_view command);

}  // namespace zhc::analyze

#endif  // ZHC_ANALYZE_HPP
