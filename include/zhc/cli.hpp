// ==============================================================================
// zhc/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2, формат в стиле clap)
//
// ==============================================================================

#ifndef ZHC_CLI_HPP
#define ZHC_CLI_HPP

#include <zhc/calendar.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace zhc::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;                              // -v (repeatable)
    bool quiet = false;                           // -q
    std::optional<std::filesystem::path> config;  // --config
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// clean - удаление дубликатов, слов и диапазона дат
struct CleanCommand {
    std::optional<std::filesystem::path> histfile;  // [HISTFILE]
    bool no_backup = false;                         // --no-backup
    bool keep_duplicates = false;                   // --keep-duplicates
    std::optional<CalendarDate> from;               // --from
    std::optional<CalendarDate> to;                 // --to
    std::vector<std::string> filters;               // -f, --filter
    bool ignore_case = false;                       // -i, --ignore-case
    bool dry_run = false;                           // -n, --dry-run
};

/// analyze - статистика
struct AnalyzeCommand {
    std::optional<std::filesystem::path> histfile;  // [HISTFILE]
    std::optional<std::size_t> top;                 // -t, --top
    bool json = false;                              // -j, --json
};

/// parse - разбор одной строки истории
struct ParseCommand {
    std::string line;
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

using Command =
    std::variant<CleanCommand, AnalyzeCommand, ParseCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Генерировать текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Генерировать текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Версия программы
constexpr const char* VERSION = "0.1.0";

/// Описание программы
constexpr const char* ABOUT = "Clean and analyze your zsh history";

/// Размер рейтингов analyze по умолчанию
constexpr std::size_t DEFAULT_TOP_N = 10;

/// Файл истории по умолчанию
constexpr const char* DEFAULT_HISTFILE = "~/.zsh_history";

}  // namespace zhc::cli

#endif  // ZHC_CLI_HPP
