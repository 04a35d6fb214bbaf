// ==============================================================================
// zsh_line.cpp - Декодер строк истории zsh
// ==============================================================================

#include "zhc/zsh_line.hpp"

#include "zhc/platform.hpp"

namespace zhc::io {

// ----------------------------------------------------------------------------
// Метафикация
// ----------------------------------------------------------------------------

void unmetafy(std::string& line) {
    // Два курсора по одному буферу: dst никогда не обгоняет src
    std::size_t src = 0;
    std::size_t dst = 0;
    const std::size_t n = line.size();

    while (src < n) {
        auto byte = static_cast<unsigned char>(line[src]);
        if (byte == META_MARKER && src + 1 < n) {
            line[dst] = static_cast<char>(static_cast<unsigned char>(line[src + 1]) ^ META_MASK);
            src += 2;
        } else {
            line[dst] = line[src];
            src += 1;
        }
        ++dst;
    }
    line.resize(dst);
}

bool needs_meta(unsigned char byte) {
    return byte == 0 || (byte >= META_MARKER && byte <= META_LAST);
}

std::string metafy(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        auto byte = static_cast<unsigned char>(c);
        if (needs_meta(byte)) {
            out += static_cast<char>(META_MARKER);
            out += static_cast<char>(byte ^ META_MASK);
        } else {
            out += c;
        }
    }
    return out;
}

bool is_continued(std::string_view line) {
    std::size_t end = line.find_last_not_of(" \t\r\v\f");
    if (end == std::string_view::npos) {
        return false;
    }
    return line[end] == '\\';
}

// ----------------------------------------------------------------------------
// LineDecodeError
// ----------------------------------------------------------------------------

std::string LineDecodeError::format() const {
    return "Error when reading line " + std::to_string(line) + ": " + cause + ".";
}

// ----------------------------------------------------------------------------
// ZshLineReader
// ----------------------------------------------------------------------------

ZshLineReader::ZshLineReader(std::istream& in) : in_(in) {}

bool ZshLineReader::read_physical_line(std::string& out) {
    if (!std::getline(in_, out)) {
        if (in_.bad()) {
            error_ = LineDecodeError{line_ + 1, "failed to read from the stream"};
        }
        return false;
    }
    ++line_;

    if (!out.empty() && out.back() == '\r') {
        out.pop_back();
    }

    // Метафикация снимается до проверки UTF-8: часть последовательностей
    // становится корректным текстом только после декодирования
    unmetafy(out);

    if (!platform::is_valid_utf8(out)) {
        error_ = LineDecodeError{line_, "stream did not contain valid UTF-8"};
        return false;
    }
    return true;
}

bool ZshLineReader::next(std::string& out) {
    if (done_) {
        return false;
    }

    std::string record;
    std::string line;
    bool have_lines = false;

    while (read_physical_line(line)) {
        if (have_lines) {
            record.push_back('\n');
        }
        record += line;
        have_lines = true;

        if (!is_continued(line)) {
            out = std::move(record);
            return true;
        }
    }

    done_ = true;
    if (error_) {
        return false;
    }

    // Незавершённая запись в конце файла сохраняется
    if (have_lines) {
        out = std::move(record);
        return true;
    }
    return false;
}

// ----------------------------------------------------------------------------
// Чтение целиком
// ----------------------------------------------------------------------------

RecordsResult read_logical_records(std::istream& in) {
    RecordsResult result;

    ZshLineReader reader(in);
    std::string record;
    while (reader.next(record)) {
        result.records.push_back(std::move(record));
        record.clear();
    }

    if (reader.last_error()) {
        result.error = *reader.last_error();
        result.records.clear();
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace zhc::io
