// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка конфигурации (config)
// 4. Dispatch команды
// 5. Возврат exit code
//
// ==============================================================================

#include "zhc/analyze.hpp"
#include "zhc/cli.hpp"
#include "zhc/config.hpp"
#include "zhc/entry.hpp"
#include "zhc/history.hpp"
#include "zhc/output.hpp"
#include "zhc/platform.hpp"
#include "zhc/report.hpp"

#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

using namespace zhc;

// ----------------------------------------------------------------------------
// Конфигурация
// ----------------------------------------------------------------------------

/// Загрузить конфигурацию: --config или файл по умолчанию (если есть)
/// @return false при ошибке (уже выведена)
bool load_settings(const cli::GlobalOptions& global, output::Writer& writer,
                   config::Config& out) {
    std::optional<std::filesystem::path> path = global.config;
    if (!path) {
        path = config::default_config_path();
    }
    if (!path) {
        writer.trace("No configuration file found");
        return true;
    }

    writer.debug("Loading configuration from '" + platform::path_to_utf8(*path) + "'");
    config::ConfigResult loaded = config::load_config(*path);
    if (!loaded) {
        writer.error(loaded.error.format());
        return false;
    }
    out = std::move(loaded.config);
    return true;
}

std::filesystem::path resolve_histfile(const std::optional<std::filesystem::path>& from_cli,
                                       const config::Config& cfg) {
    if (from_cli) {
        return *from_cli;
    }
    if (cfg.history_file) {
        return *cfg.history_file;
    }
    return platform::path_from_utf8(cli::DEFAULT_HISTFILE);
}

std::string format_percent(std::size_t part, std::size_t whole) {
    double value = whole == 0 ? 0.0 : static_cast<double>(part) / static_cast<double>(whole) * 100.0;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

/// Загрузить историю с отчётом о пропущенных записях
std::unique_ptr<history::History> load_history(const std::filesystem::path& path,
                                               output::Writer& writer) {
    writer.debug("Reading the history from '" + platform::path_to_utf8(path) + "'");

    history::HistoryResult loaded = history::History::load(path);
    if (!loaded) {
        writer.error(loaded.error.format());
        return nullptr;
    }

    if (loaded.history->skipped() > 0) {
        writer.debug("Skipped " + std::to_string(loaded.history->skipped()) +
                     " malformed entries");
    }
    writer.info("Loaded " + std::to_string(loaded.history->size()) + " entries from '" +
                platform::path_to_utf8(loaded.history->path()) + "'");
    return std::move(loaded.history);
}

// ----------------------------------------------------------------------------
// Выполнение команд
// ----------------------------------------------------------------------------

int run_clean(const cli::CleanCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    const bool backup = !cmd.no_backup && cfg.backup.value_or(true);
    const bool keep_duplicates = cmd.keep_duplicates || cfg.keep_duplicates.value_or(false);
    const bool ignore_case = cmd.ignore_case || cfg.ignore_case.value_or(false);

    std::vector<std::string> filters = cfg.filters;
    filters.insert(filters.end(), cmd.filters.begin(), cmd.filters.end());

    auto history = load_history(resolve_histfile(cmd.histfile, cfg), writer);
    if (!history) {
        return 1;
    }

    std::size_t removed_total = 0;

    if (!keep_duplicates) {
        const std::size_t before = history->size();
        const std::size_t removed = history->remove_duplicates();
        removed_total += removed;
        writer.info(std::to_string(history->size()) + " entries after removing duplicates (" +
                    format_percent(removed, before) + "% of duplicates).");
    }

    if (cmd.from && cmd.to) {
        const std::size_t removed = history->remove_in_date_range(*cmd.from, *cmd.to);
        removed_total += removed;
        writer.info("Removed " + std::to_string(removed) + " entries between " +
                    cmd.from->to_string() + " and " + cmd.to->to_string() + ".");
    }

    if (!filters.empty()) {
        for (const auto& word : filters) {
            writer.trace("Filter word: '" + word + "'");
        }
        const std::size_t removed = history->remove_matching(filters, ignore_case);
        removed_total += removed;
        writer.info("Removed " + std::to_string(removed) + " entries matching the filters.");
    }

    if (removed_total == 0) {
        writer.info("Nothing to clean.");
        return 0;
    }

    if (cmd.dry_run) {
        writer.info("Dry run: " + std::to_string(removed_total) +
                    " entries would be removed, the history was not written.");
        return 0;
    }

    if (!backup) {
        writer.warn("Writing the history without a backup");
    }

    history::WriteResult written = history->write(backup);
    if (!written) {
        writer.error(written.error.format());
        return 1;
    }

    if (written.backup_path) {
        writer.info("Backed up the history to '" + platform::path_to_utf8(*written.backup_path) +
                    "'");
    }
    writer.info("Wrote " + std::to_string(history->size()) + " entries to '" +
                platform::path_to_utf8(history->path()) + "'");
    return 0;
}

int run_analyze(const cli::AnalyzeCommand& cmd, const config::Config& cfg,
                output::Writer& writer) {
    const std::size_t top_n = cmd.top.value_or(cfg.top_n.value_or(cli::DEFAULT_TOP_N));

    auto history = load_history(resolve_histfile(cmd.histfile, cfg), writer);
    if (!history) {
        return 1;
    }

    analyze::HistoryAnalyzer analyzer(*history);
    analyze::HistoryAnalysis analysis = analyzer.analyze(top_n);

    if (cmd.json) {
        rapidjson::Document doc;
        analysis.to_rapidjson(doc, doc.GetAllocator());
        writer.write_json_pretty(doc);
        return 0;
    }

    writer.write(output::Stream::Stdout, analyze::render_report(analysis, writer.stdout_colored()));
    return 0;
}

int run_parse(const cli::ParseCommand& cmd, output::Writer& writer) {
    history::EntryParseResult parsed = history::parse_entry(cmd.line);
    if (!parsed) {
        writer.error(parsed.error.format());
        return 1;
    }
    writer.green_line(parsed.entry.describe());
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга выводятся без префикса [x], напрямую в stderr
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ParseCommand>) {
                return run_parse(cmd, writer);
            } else {
                config::Config cfg;
                if (!load_settings(parse_result.global, writer, cfg)) {
                    return 1;
                }
                if constexpr (std::is_same_v<T, cli::CleanCommand>) {
                    return run_clean(cmd, cfg, writer);
                } else {
                    return run_analyze(cmd, cfg, writer);
                }
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Перехват исключений на границе app: формат "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
