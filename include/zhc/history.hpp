// ==============================================================================
// zhc/history.hpp - Файл истории zsh в памяти
// ==============================================================================
//
// Назначение:
// - History: упорядоченный список записей одного файла + путь к нему
// - Разрушающие преобразования (дубликаты, диапазон дат, фильтр слов)
// - Кодирование и запись обратно на диск с резервной копией
//
// Порядок записей = порядок в файле. Любое удаление сохраняет
// относительный порядок оставшихся записей.
//
// ==============================================================================

#ifndef ZHC_HISTORY_HPP
#define ZHC_HISTORY_HPP

#include <zhc/calendar.hpp>
#include <zhc/entry.hpp>

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zhc::history {

// ----------------------------------------------------------------------------
// HistoryError
// ----------------------------------------------------------------------------

/// Типы ошибок уровня файла
enum class HistoryErrorKind {
    Io,          // Открытие/чтение/запись/rename
    LineDecode,  // Строка не является UTF-8 после снятия метафикации
    Backup       // Резервная копия не создана
};

/// Ошибка уровня файла (всегда фатальна для текущего запуска)
struct HistoryError {
    HistoryErrorKind kind = HistoryErrorKind::Io;

    /// Путь (для Io/Backup) или номер строки (для LineDecode)
    std::string subject;

    /// Причина
    std::string message;

    /// Форматировать ошибку для вывода
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Filter - фильтр по словам
// ----------------------------------------------------------------------------

/// Совпадение команды с любым из слов (подстрока)
class Filter {
public:
    Filter(std::vector<std::string> words, bool ignore_case);

    /// Команда содержит хотя бы одно из слов
    bool matches(const std::string& command) const;

    bool empty() const { return words_.empty(); }

private:
    std::vector<std::string> words_;
    bool ignore_case_;
};

// ----------------------------------------------------------------------------
// History
// ----------------------------------------------------------------------------

struct HistoryResult;
struct WriteResult;

/// История одного файла
class History {
public:
    History() = default;
    History(std::filesystem::path path, std::vector<HistoryEntry> entries);

    // -------------------------------------------------------------------------
    // Загрузка
    // -------------------------------------------------------------------------

    /// Загрузить файл истории
    ///
    /// Ведущий "~" в пути раскрывается. Записи, не прошедшие разбор,
    /// пропускаются (см. skipped()); ошибки чтения и UTF-8 фатальны.
    static HistoryResult load(const std::filesystem::path& path);

    /// Разобрать историю из потока (путь используется только для записи)
    static HistoryResult from_stream(std::istream& in, const std::filesystem::path& path);

    // -------------------------------------------------------------------------
    // Преобразования (возвращают количество удалённых записей)
    // -------------------------------------------------------------------------

    /// Оставить для каждой команды только последнее вхождение
    std::size_t remove_duplicates();

    /// Удалить записи, локальная дата которых лежит в [start, end]
    /// Записи с непреобразуемым timestamp сохраняются. Требуется start <= end.
    std::size_t remove_in_date_range(const CalendarDate& start, const CalendarDate& end);

    /// Удалить записи, команда которых содержит любое из слов
    std::size_t remove_matching(const std::vector<std::string>& words, bool ignore_case);

    // -------------------------------------------------------------------------
    // Чтение
    // -------------------------------------------------------------------------

    /// Количество различных команд, встречающихся более одного раза
    std::size_t duplicate_commands_count() const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<HistoryEntry>& entries() const { return entries_; }
    const std::filesystem::path& path() const { return path_; }

    /// Количество записей, пропущенных при загрузке
    std::size_t skipped() const { return skipped_; }

    // -------------------------------------------------------------------------
    // Запись
    // -------------------------------------------------------------------------

    /// Содержимое файла: строки записей (метафицированные, как их пишет zsh), каждая с '\n'
    std::string encode() const;

    /// Перезаписать файл, при backup=true предварительно сохранив копию
    ///
    /// Копия полностью записывается и синхронизируется до того, как
    /// оригинал будет заменён. Новое содержимое пишется во временный файл
    /// рядом с оригиналом и атомарно переименовывается поверх него, так что
    /// при любой ошибке оригинал остаётся нетронутым.
    WriteResult write(bool backup) const;

private:
    std::filesystem::path path_;
    std::vector<HistoryEntry> entries_;
    std::size_t skipped_ = 0;
};

/// Результат загрузки истории
struct HistoryResult {
    bool ok = false;
    std::unique_ptr<History> history;
    HistoryError error;

    explicit operator bool() const { return ok; }
};

/// Результат записи истории
struct WriteResult {
    bool ok = false;
    std::optional<std::filesystem::path> backup_path;
    HistoryError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Разделитель между исходным путём и меткой времени в имени backup
constexpr const char* BACKUP_SEPARATOR = ".";

/// Путь резервной копии: "<path>.<YYYY-MM-DD-HHhMMmSSsNNNms>"
std::filesystem::path backup_path_for(const std::filesystem::path& path,
                                      const std::string& local_timestamp);

}  // namespace zhc::history

#endif  // ZHC_HISTORY_HPP
