// ==============================================================================
// report.cpp - Отчёт анализатора
// ==============================================================================

#include "zhc/report.hpp"

#include "zhc/output.hpp"

#include <algorithm>
#include <cstdio>
#include <vector>

namespace zhc::analyze {

using output::Color;
using output::paint;

namespace {

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xc0) == 0x80;
}

/// Количество символов UTF-8
std::size_t char_count(std::string_view text) {
    std::size_t count = 0;
    for (char c : text) {
        if (!is_continuation_byte(c)) {
            ++count;
        }
    }
    return count;
}

std::string format_percentage(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f%%", value);
    return buf;
}

}  // anonymous namespace

// ============================================================================
// Вспомогательные функции
// ============================================================================

std::string truncate_left(std::string_view text, std::size_t max) {
    std::size_t total = char_count(text);
    if (total <= max) {
        return std::string(text);
    }

    // Оставляем последние (max - 3) символов
    std::size_t keep = max > 3 ? max - 3 : 0;
    std::size_t skip = total - keep;
    std::size_t pos = 0;
    while (pos < text.size() && skip > 0) {
        ++pos;
        while (pos < text.size() && is_continuation_byte(text[pos])) {
            ++pos;
        }
        --skip;
    }
    return "..." + std::string(text.substr(pos));
}

std::string format_ranked_cell(std::string_view text, std::size_t max, std::size_t count) {
    std::string flat;
    flat.reserve(text.size());
    for (char c : text) {
        flat.push_back((c == '\n' || c == '\r') ? ' ' : c);
    }

    if (flat.size() > max) {
        std::size_t cut = max;
        while (cut > 0 && is_continuation_byte(flat[cut])) {
            --cut;
        }
        flat.resize(cut);
        flat += "...";
    }

    return flat + " (" + std::to_string(count) + " times)";
}

std::string rank_icon(std::size_t rank) {
    switch (rank) {
    case 1:
        return "\xf0\x9f\xa5\x87";  // 🥇
    case 2:
        return "\xf0\x9f\xa5\x88";  // 🥈
    case 3:
        return "\xf0\x9f\xa5\x89";  // 🥉
    default:
        return std::to_string(rank);
    }
}

std::string humanize_days(std::int64_t days) {
    if (days == 1 || days == -1) {
        return std::to_string(days) + " day";
    }
    return std::to_string(days) + " days";
}

// ============================================================================
// Текстовый отчёт
// ============================================================================

std::string render_report(const HistoryAnalysis& analysis, bool colored) {
    std::vector<std::string> lines;

    lines.push_back(paint("History Analysis for ", Color::Magenta, colored) +
                    paint(truncate_left(analysis.filename, REPORT_FILENAME_MAX), Color::Cyan,
                          colored));
    lines.emplace_back();

    if (analysis.date_range) {
        const auto& [from, to] = *analysis.date_range;
        lines.push_back("Date range: " + paint(from.to_string(), Color::Green, colored) + " to " +
                        paint(to.to_string(), Color::Green, colored) + " " +
                        paint("(" + humanize_days(days_between(from, to)) + ")", Color::Dim,
                              colored));
    } else {
        lines.push_back("Date range: " + paint("n/a", Color::Dim, colored));
    }

    lines.push_back("Total Commands: " +
                    paint(std::to_string(analysis.size), Color::Yellow, colored));
    lines.push_back("Duplicate Commands: " +
                    paint(std::to_string(analysis.duplicate_count), Color::Yellow, colored) + " " +
                    paint("(" + format_percentage(analysis.duplicate_percentage()) + ")",
                          Color::Dim, colored));

    std::string report = output::format_box(lines, REPORT_BOX_WIDTH, colored);
    report += '\n';
    report += paint("Top " + std::to_string(analysis.top_n) + " Most Used:", Color::Magenta,
                    colored);
    report += '\n';

    output::Table table;
    table.set_rounded(true);
    table.set_headers({"", "Commands", "Executables"});

    std::size_t rows = std::max(analysis.top_n_commands.size(), analysis.top_n_executables.size());
    for (std::size_t i = 0; i < rows; ++i) {
        std::string command;
        if (i < analysis.top_n_commands.size()) {
            const auto& [text, count] = analysis.top_n_commands[i];
            command = format_ranked_cell(text, REPORT_CELL_MAX, count);
        }
        std::string executable;
        if (i < analysis.top_n_executables.size()) {
            const auto& [text, count] = analysis.top_n_executables[i];
            executable = format_ranked_cell(text, REPORT_CELL_MAX, count);
        }
        table.add_row({rank_icon(i + 1), command, executable});
    }

    report += table.to_string();
    return report;
}

}  // namespace zhc::analyze
