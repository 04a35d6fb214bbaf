// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: тексты --help и ошибок воспроизводят формат clap,
// коды выхода: 0 успех, 2 ошибка использования.
//
// ==============================================================================

#include "zhc/cli.hpp"

#include "zhc/platform.hpp"

#include <charconv>
#include <cstring>
#include <system_error>

namespace zhc::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

bool is_known_command(const std::string& name) {
    return name == "clean" || name == "analyze" || name == "parse" || name == "help";
}

std::string usage_line(const std::optional<std::string>& command) {
    if (command == "clean") {
        return "Usage: zhc clean [OPTIONS] [HISTFILE]";
    }
    if (command == "analyze") {
        return "Usage: zhc analyze [OPTIONS] [HISTFILE]";
    }
    if (command == "parse") {
        return "Usage: zhc parse <LINE>";
    }
    return "Usage: zhc [OPTIONS] <COMMAND>";
}

/// Ошибка использования в формате clap: error + Usage + подсказка
CliDiagnostic usage_error(const std::string& message,
                          const std::optional<std::string>& command = std::nullopt) {
    CliDiagnostic diagnostic;
    diagnostic.exit_code = 2;
    diagnostic.stderr_message = "error: " + message + "\n\n" + usage_line(command) +
                                "\n\n"
                                "For more information, try '--help'.\n";
    return diagnostic;
}

// Совпадение аргумента с опцией, включая форму --long=value
struct OptionMatch {
    bool matched = false;
    std::optional<std::string> inline_value;
};

OptionMatch match_option(const char* arg, const char* short_name, const char* long_name) {
    OptionMatch m;
    if ((short_name != nullptr && str_eq(arg, short_name)) || str_eq(arg, long_name)) {
        m.matched = true;
        return m;
    }
    std::string prefix = std::string(long_name) + "=";
    if (starts_with(arg, prefix.c_str())) {
        m.matched = true;
        m.inline_value = std::string(arg + prefix.size());
    }
    return m;
}

/// Значение опции: из --long=value или следующего аргумента
std::optional<std::string> take_value(const OptionMatch& m, int argc, char** argv, int& i) {
    if (m.inline_value) {
        return m.inline_value;
    }
    if (i + 1 < argc) {
        ++i;
        return std::string(argv[i]);
    }
    return std::nullopt;
}

std::string missing_value(const char* option) {
    return std::string("a value is required for '") + option + "' but none was supplied";
}

std::string invalid_value(const std::string& value, const char* option, const char* cause) {
    return "invalid value '" + value + "' for '" + option + "': " + cause;
}

enum class Consumed { No, Yes, Error };

/// Глобальные опции допустимы как до, так и после подкоманды
Consumed parse_global(const char* arg, int argc, char** argv, int& i, ParseResult& result,
                      const std::optional<std::string>& command) {
    if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        result.global.quiet = true;
        return Consumed::Yes;
    }
    if (str_eq(arg, "--verbose")) {
        result.global.verbose++;
        return Consumed::Yes;
    }
    // -v, -vv, -vvv
    if (arg[0] == '-' && arg[1] == 'v') {
        const char* p = arg + 1;
        while (*p == 'v') {
            ++p;
        }
        if (*p == '\0') {
            result.global.verbose += static_cast<int>(p - arg - 1);
            return Consumed::Yes;
        }
    }

    OptionMatch m = match_option(arg, nullptr, "--config");
    if (m.matched) {
        auto value = take_value(m, argc, argv, i);
        if (!value) {
            result.diagnostic = usage_error(missing_value("--config <CONFIG>"), command);
            return Consumed::Error;
        }
        result.global.config = platform::path_from_utf8(*value);
        return Consumed::Yes;
    }
    return Consumed::No;
}

std::optional<CalendarDate> parse_date_option(const std::string& value, const char* option,
                                              ParseResult& result) {
    auto date = CalendarDate::parse(value);
    if (!date) {
        result.diagnostic = usage_error(
            invalid_value(value, option, "expected a valid date in the YYYY-MM-DD format"),
            "clean");
    }
    return date;
}

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

void parse_clean(int argc, char** argv, int start, ParseResult& result) {
    const std::optional<std::string> name = "clean";
    CleanCommand cmd;
    bool positional_only = false;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];

        if (positional_only || arg[0] != '-' || str_eq(arg, "-")) {
            if (cmd.histfile) {
                result.diagnostic = usage_error(
                    std::string("unexpected argument '") + arg + "' found", name);
                return;
            }
            cmd.histfile = platform::path_from_utf8(arg);
            continue;
        }
        if (str_eq(arg, "--")) {
            positional_only = true;
            continue;
        }
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{name};
            return;
        }

        Consumed global = parse_global(arg, argc, argv, i, result, name);
        if (global == Consumed::Error) {
            return;
        }
        if (global == Consumed::Yes) {
            continue;
        }

        if (str_eq(arg, "--no-backup")) {
            cmd.no_backup = true;
        } else if (str_eq(arg, "--keep-duplicates")) {
            cmd.keep_duplicates = true;
        } else if (str_eq(arg, "-i") || str_eq(arg, "--ignore-case")) {
            cmd.ignore_case = true;
        } else if (str_eq(arg, "-n") || str_eq(arg, "--dry-run")) {
            cmd.dry_run = true;
        } else if (auto m = match_option(arg, "-f", "--filter"); m.matched) {
            auto value = take_value(m, argc, argv, i);
            if (!value) {
                result.diagnostic = usage_error(missing_value("--filter <WORD>"), name);
                return;
            }
            cmd.filters.push_back(*value);
        } else if (auto m = match_option(arg, nullptr, "--from"); m.matched) {
            auto value = take_value(m, argc, argv, i);
            if (!value) {
                result.diagnostic = usage_error(missing_value("--from <DATE>"), name);
                return;
            }
            cmd.from = parse_date_option(*value, "--from <DATE>", result);
            if (!cmd.from) {
                return;
            }
        } else if (auto m = match_option(arg, nullptr, "--to"); m.matched) {
            auto value = take_value(m, argc, argv, i);
            if (!value) {
                result.diagnostic = usage_error(missing_value("--to <DATE>"), name);
                return;
            }
            cmd.to = parse_date_option(*value, "--to <DATE>", result);
            if (!cmd.to) {
                return;
            }
        } else {
            result.diagnostic =
                usage_error(std::string("unexpected argument '") + arg + "' found", name);
            return;
        }
    }

    // --from и --to задаются только вместе
    if (cmd.from.has_value() != cmd.to.has_value()) {
        const char* missing = cmd.from ? "--to <DATE>" : "--from <DATE>";
        result.diagnostic = usage_error(
            std::string("the following required arguments were not provided:\n  ") + missing,
            name);
        return;
    }
    if (cmd.from && *cmd.to < *cmd.from) {
        result.diagnostic = usage_error(
            invalid_value(cmd.to->to_string(), "--to <DATE>",
                          "the end of the range is earlier than its start"),
            name);
        return;
    }

    result.ok = true;
    result.command = std::move(cmd);
}

void parse_analyze(int argc, char** argv, int start, ParseResult& result) {
    const std::optional<std::string> name = "analyze";
    AnalyzeCommand cmd;
    bool positional_only = false;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];

        if (positional_only || arg[0] != '-' || str_eq(arg, "-")) {
            if (cmd.histfile) {
                result.diagnostic = usage_error(
                    std::string("unexpected argument '") + arg + "' found", name);
                return;
            }
            cmd.histfile = platform::path_from_utf8(arg);
            continue;
        }
        if (str_eq(arg, "--")) {
            positional_only = true;
            continue;
        }
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{name};
            return;
        }

        Consumed global = parse_global(arg, argc, argv, i, result, name);
        if (global == Consumed::Error) {
            return;
        }
        if (global == Consumed::Yes) {
            continue;
        }

        if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (auto m = match_option(arg, "-t", "--top"); m.matched) {
            auto value = take_value(m, argc, argv, i);
            if (!value) {
                result.diagnostic = usage_error(missing_value("--top <N>"), name);
                return;
            }
            if (value->empty()) {
                result.diagnostic = usage_error(
                    invalid_value(*value, "--top <N>", "cannot parse integer from empty string"),
                    name);
                return;
            }
            std::size_t top = 0;
            const char* first = value->data();
            const char* last = first + value->size();
            auto [ptr, ec] = std::from_chars(first, last, top);
            if (ec == std::errc::result_out_of_range) {
                result.diagnostic = usage_error(
                    invalid_value(*value, "--top <N>", "number too large to fit in target type"),
                    name);
                return;
            }
            if (ec != std::errc() || ptr != last) {
                result.diagnostic = usage_error(
                    invalid_value(*value, "--top <N>", "invalid digit found in string"), name);
                return;
            }
            cmd.top = top;
        } else {
            result.diagnostic =
                usage_error(std::string("unexpected argument '") + arg + "' found", name);
            return;
        }
    }

    result.ok = true;
    result.command = std::move(cmd);
}

void parse_parse(int argc, char** argv, int start, ParseResult& result) {
    const std::optional<std::string> name = "parse";
    std::optional<std::string> line;
    bool positional_only = false;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];

        // Строка истории начинается с ':' и никогда не похожа на опцию
        if (positional_only || arg[0] != '-' || str_eq(arg, "-")) {
            if (line) {
                result.diagnostic = usage_error(
                    std::string("unexpected argument '") + arg + "' found", name);
                return;
            }
            line = arg;
            continue;
        }
        if (str_eq(arg, "--")) {
            positional_only = true;
            continue;
        }
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{name};
            return;
        }

        Consumed global = parse_global(arg, argc, argv, i, result, name);
        if (global == Consumed::Error) {
            return;
        }
        if (global == Consumed::No) {
            result.diagnostic =
                usage_error(std::string("unexpected argument '") + arg + "' found", name);
            return;
        }
    }

    if (!line) {
        result.diagnostic = usage_error(
            "the following required arguments were not provided:\n  <LINE>", name);
        return;
    }

    result.ok = true;
    result.command = ParseCommand{*line};
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("zhc ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (command == "clean") {
        return "Remove duplicates, filtered words or a date range from the history\n"
               "\n"
               "Usage: zhc clean [OPTIONS] [HISTFILE]\n"
               "\n"
               "Arguments:\n"
               "  [HISTFILE]  The zsh history file [default: ~/.zsh_history]\n"
               "\n"
               "Options:\n"
               "      --no-backup        Do not back up the history before writing it\n"
               "      --keep-duplicates  Keep duplicate commands\n"
               "      --from <DATE>      Remove commands from this date (YYYY-MM-DD)\n"
               "      --to <DATE>        Remove commands up to this date (YYYY-MM-DD)\n"
               "  -f, --filter <WORD>    Remove commands containing this word\n"
               "  -i, --ignore-case      Ignore case when matching filter words\n"
               "  -n, --dry-run          Report what would be removed without writing\n"
               "  -h, --help             Print help\n";
    }
    if (command == "analyze") {
        return "Print statistics about the history\n"
               "\n"
               "Usage: zhc analyze [OPTIONS] [HISTFILE]\n"
               "\n"
               "Arguments:\n"
               "  [HISTFILE]  The zsh history file [default: ~/.zsh_history]\n"
               "\n"
               "Options:\n"
               "  -t, --top <N>  Number of most used commands to show [default: 10]\n"
               "  -j, --json     Output as JSON\n"
               "  -h, --help     Print help\n";
    }
    if (command == "parse") {
        return "Parse a single history line and print the entry\n"
               "\n"
               "Usage: zhc parse <LINE>\n"
               "\n"
               "Arguments:\n"
               "  <LINE>  A line from a zsh history file\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    }

    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: zhc [OPTIONS] <COMMAND>\n"
           "\n"
           "Commands:\n"
           "  clean    Remove duplicates, filtered words or a date range from the history\n"
           "  analyze  Print statistics about the history\n"
           "  parse    Parse a single history line and print the entry\n"
           "  help     Print this message or the help of the given subcommand(s)\n"
           "\n"
           "Options:\n"
           "      --config <CONFIG>  Load defaults from a YAML file\n"
           "  -v...                  Print verbose output\n"
           "  -q                     Suppress informational output\n"
           "  -h, --help             Print help\n"
           "  -V, --version          Print version\n"
           "\n"
           "Examples:\n"
           "\n"
           "    Remove duplicates and every command containing 'password':\n"
           "        zhc clean -f password\n"
           "\n"
           "    Show the 20 most used commands:\n"
           "        zhc analyze --top 20\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        }
        if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        }
        if (arg[0] != '-') {
            cmd_idx = i;
            break;
        }

        Consumed global = parse_global(arg, argc, argv, i, result, std::nullopt);
        if (global == Consumed::Error) {
            return result;
        }
        if (global == Consumed::No) {
            result.diagnostic = usage_error(std::string("unexpected argument '") + arg + "' found");
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "clean")) {
        parse_clean(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "analyze")) {
        parse_analyze(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "parse")) {
        parse_parse(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "help")) {
        if (cmd_idx + 1 < argc) {
            std::string target = argv[cmd_idx + 1];
            if (!is_known_command(target)) {
                result.diagnostic = usage_error("unrecognized subcommand '" + target + "'");
                return result;
            }
            result.command = HelpCommand{target == "help" ? std::nullopt
                                                          : std::optional<std::string>(target)};
        } else {
            result.command = HelpCommand{};
        }
        result.ok = true;
    } else {
        result.diagnostic = usage_error(std::string("unrecognized subcommand '") + cmd + "'");
    }

    return result;
}

}  // namespace zhc::cli
