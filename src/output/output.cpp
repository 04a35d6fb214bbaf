// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr
// Байты первичны, избегаем std::endl
//
// ==============================================================================

#include "zhc/output.hpp"

#include "zhc/platform.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace zhc::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";
constexpr const char* ANSI_BLUE = "\x1b[34m";
constexpr const char* ANSI_DIM = "\x1b[2m";

// Unicode box-drawing characters (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

// Скруглённые углы
constexpr const char* BOX_RTL = "\xe2\x95\xad";  // ╭ U+256D
constexpr const char* BOX_RTR = "\xe2\x95\xae";  // ╮ U+256E
constexpr const char* BOX_RBR = "\xe2\x95\xaf";  // ╯ U+256F
constexpr const char* BOX_RBL = "\xe2\x95\xb0";  // ╰ U+2570

std::string repeat(const char* s, size_t count) {
    std::string result;
    for (size_t i = 0; i < count; ++i) {
        result += s;
    }
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки всегда печатаются, даже при -q
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~] ", Color::Magenta, message);
}

void Writer::green_line(std::string_view message) {
    write_colored(Stream::Stdout, message, Color::Green);
    write(Stream::Stdout, "\n");
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    if (supports_color(s)) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

bool Writer::stdout_colored() const {
    return supports_color(Stream::Stdout);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

std::string Table::format_line(char position, const std::vector<size_t>& widths) const {
    const char* left = BOX_LT;
    const char* middle = BOX_CROSS;
    const char* right = BOX_RT;
    if (position == 'T') {
        left = rounded_ ? BOX_RTL : BOX_TL;
        middle = BOX_TT;
        right = rounded_ ? BOX_RTR : BOX_TR;
    } else if (position == 'B') {
        left = rounded_ ? BOX_RBL : BOX_BL;
        middle = BOX_BT;
        right = rounded_ ? BOX_RBR : BOX_BR;
    }

    std::string line = left;
    for (size_t i = 0; i < widths.size(); ++i) {
        // padding (1 space each side) + content width
        line += repeat(BOX_H, widths[i] + 2);
        if (i + 1 < widths.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells,
                              const std::vector<size_t>& widths) const {
    std::string line = BOX_V;

    for (size_t i = 0; i < widths.size(); ++i) {
        line += ' ';

        const std::string empty;
        const std::string& cell = (i < cells.size()) ? cells[i] : empty;
        line += cell;

        size_t width = display_width(cell);
        if (width < widths[i]) {
            line.append(widths[i] - width, ' ');
        }

        line += ' ';
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    std::vector<size_t> widths = column_widths();
    if (widths.empty()) {
        return {};
    }

    std::string result = format_line('T', widths);
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_, widths);
        result += '\n';
        result += format_line('M', widths);
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row, widths);
        result += '\n';
    }

    result += format_line('B', widths);
    result += '\n';
    return result;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

size_t display_width(std::string_view text) {
    size_t width = 0;
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);

        // ESC [ ... <final byte 0x40..0x7E>
        if (c == 0x1b && i + 1 < text.size() && text[i + 1] == '[') {
            i += 2;
            while (i < text.size()) {
                auto f = static_cast<unsigned char>(text[i]);
                ++i;
                if (f >= 0x40 && f <= 0x7e) {
                    break;
                }
            }
            continue;
        }

        size_t len = 1;
        std::uint32_t cp = c;
        if (c >= 0xf0) {
            len = 4;
            cp = c & 0x07;
        } else if (c >= 0xe0) {
            len = 3;
            cp = c & 0x0f;
        } else if (c >= 0xc0) {
            len = 2;
            cp = c & 0x1f;
        }
        for (size_t k = 1; k < len && i + k < text.size(); ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3f);
        }
        i += len;

        // Variation selector не занимает места
        if (cp == 0xfe0f) {
            continue;
        }
        width += (cp >= 0x1f300) ? 2 : 1;
    }
    return width;
}

std::string format_box(const std::vector<std::string>& lines, size_t width, bool colored) {
    const size_t inner = width > 2 ? width - 2 : 0;

    std::string result = paint(std::string(BOX_RTL) + repeat(BOX_H, inner) + BOX_RTR,
                               Color::Blue, colored);
    result += '\n';

    for (const auto& line : lines) {
        // "│ " + content + padding + " │"
        size_t visible = display_width(line);
        size_t padding = width > visible + 4 ? width - visible - 4 : 0;
        result += paint(BOX_V, Color::Blue, colored);
        result += ' ';
        result += line;
        result.append(padding, ' ');
        result += ' ';
        result += paint(BOX_V, Color::Blue, colored);
        result += '\n';
    }

    result += paint(std::string(BOX_RBL) + repeat(BOX_H, inner) + BOX_RBR, Color::Blue, colored);
    result += '\n';
    return result;
}

std::string paint(std::string_view text, Color color, bool colored) {
    if (!colored || color == Color::Default) {
        return std::string(text);
    }
    return ansi_color_code(color) + std::string(text) + ANSI_RESET;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Blue:
        return ANSI_BLUE;
    case Color::Dim:
        return ANSI_DIM;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace zhc::output
