// ==============================================================================
// history.cpp - Файл истории zsh в памяти
// ==============================================================================

#include "zhc/history.hpp"

#include "zhc/platform.hpp"
#include "zhc/zsh_line.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <unordered_map>

namespace zhc::history {

namespace fs = std::filesystem;

namespace {

std::string to_lower_ascii(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

HistoryError io_error(const fs::path& path, std::string message) {
    return HistoryError{HistoryErrorKind::Io, platform::path_to_utf8(path), std::move(message)};
}

}  // anonymous namespace

// ============================================================================
// HistoryError
// ============================================================================

std::string HistoryError::format() const {
    switch (kind) {
    case HistoryErrorKind::Io:
        return "Error when handling the file '" + subject + "': " + message + ".";
    case HistoryErrorKind::LineDecode:
        return "Error when reading line " + subject + ": " + message + ".";
    case HistoryErrorKind::Backup:
        return "Error when backing up the history to '" + subject + "': " + message + ".";
    }
    return message;
}

// ============================================================================
// Filter
// ============================================================================

Filter::Filter(std::vector<std::string> words, bool ignore_case) : ignore_case_(ignore_case) {
    for (auto& word : words) {
        // Пустое слово совпало бы с любой командой
        if (word.empty()) {
            continue;
        }
        words_.push_back(ignore_case_ ? to_lower_ascii(word) : std::move(word));
    }
}

bool Filter::matches(const std::string& command) const {
    if (words_.empty()) {
        return false;
    }

    if (ignore_case_) {
        std::string lowered = to_lower_ascii(command);
        return std::any_of(words_.begin(), words_.end(), [&](const std::string& word) {
            return lowered.find(word) != std::string::npos;
        });
    }

    return std::any_of(words_.begin(), words_.end(), [&](const std::string& word) {
        return command.find(word) != std::string::npos;
    });
}

// ============================================================================
// History: загрузка
// ============================================================================

History::History(fs::path path, std::vector<HistoryEntry> entries)
    : path_(std::move(path)), entries_(std::move(entries)) {}

HistoryResult History::load(const fs::path& path) {
    HistoryResult result;
    fs::path expanded = platform::expand_tilde(path);

    std::error_code ec;
    if (fs::is_directory(expanded, ec)) {
        result.error = io_error(expanded, "Is a directory");
        return result;
    }

    std::ifstream in(expanded, std::ios::binary);
    if (!in.is_open()) {
        result.error = io_error(expanded, std::strerror(errno));
        return result;
    }

    return from_stream(in, expanded);
}

HistoryResult History::from_stream(std::istream& in, const fs::path& path) {
    HistoryResult result;

    io::RecordsResult records = io::read_logical_records(in);
    if (!records) {
        result.error = HistoryError{HistoryErrorKind::LineDecode,
                                    std::to_string(records.error.line), records.error.cause};
        return result;
    }

    auto history = std::make_unique<History>();
    history->path_ = path;
    history->entries_.reserve(records.records.size());

    // Ошибки отдельных записей не прерывают загрузку файла
    for (const auto& record : records.records) {
        EntryParseResult parsed = parse_entry(record);
        if (parsed) {
            history->entries_.push_back(std::move(parsed.entry));
        } else {
            ++history->skipped_;
        }
    }

    result.history = std::move(history);
    result.ok = true;
    return result;
}

// ============================================================================
// History: преобразования
// ============================================================================

std::size_t History::remove_duplicates() {
    const std::size_t before = entries_.size();

    // Проход 1: индекс последнего вхождения каждой команды
    std::vector<bool> keep(entries_.size(), false);
    {
        std::unordered_map<std::string_view, std::size_t> last_index;
        last_index.reserve(entries_.size());
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            last_index[entries_[i].command()] = i;
        }

        // Проход 2: остаются только последние вхождения
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            keep[i] = last_index[entries_[i].command()] == i;
        }
    }

    std::vector<HistoryEntry> kept;
    kept.reserve(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (keep[i]) {
            kept.push_back(std::move(entries_[i]));
        }
    }
    entries_ = std::move(kept);

    return before - entries_.size();
}

std::size_t History::remove_in_date_range(const CalendarDate& start, const CalendarDate& end) {
    const std::size_t before = entries_.size();

    auto in_range = [&](const HistoryEntry& entry) {
        auto date = entry.local_date();
        // Непреобразуемые timestamp никогда не удаляются
        return date.has_value() && start <= *date && *date <= end;
    };
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(), in_range), entries_.end());

    return before - entries_.size();
}

std::size_t History::remove_matching(const std::vector<std::string>& words, bool ignore_case) {
    Filter filter(words, ignore_case);
    if (filter.empty()) {
        return 0;
    }

    const std::size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const HistoryEntry& entry) {
                                      return filter.matches(entry.command());
                                  }),
                   entries_.end());
    return before - entries_.size();
}

std::size_t History::duplicate_commands_count() const {
    std::unordered_map<std::string_view, std::size_t> counts;
    counts.reserve(entries_.size());
    for (const auto& entry : entries_) {
        ++counts[entry.command()];
    }

    return static_cast<std::size_t>(std::count_if(
        counts.begin(), counts.end(), [](const auto& item) { return item.second > 1; }));
}

// ============================================================================
// History: запись
// ============================================================================

std::string History::encode() const {
    std::string content;
    for (const auto& entry : entries_) {
        content += io::metafy(to_history_line(entry));
        content += '\n';
    }
    return content;
}

WriteResult History::write(bool backup) const {
    WriteResult result;
    std::error_code ec;

    // Символическая ссылка (dotfiles) заменяется содержимым цели, а не самой ссылкой
    fs::path target = path_;
    if (fs::is_symlink(path_, ec)) {
        fs::path resolved = fs::canonical(path_, ec);
        if (ec) {
            result.error = io_error(path_, ec.message());
            return result;
        }
        target = resolved;
    }

    // 1. Резервная копия: полностью записана и синхронизирована до перезаписи
    if (backup) {
        fs::path backup_file = backup_path_for(path_, platform::local_timestamp_millis());
        fs::copy_file(target, backup_file, fs::copy_options::none, ec);
        if (ec) {
            result.error = HistoryError{HistoryErrorKind::Backup,
                                        platform::path_to_utf8(backup_file), ec.message()};
            return result;
        }
        if (!platform::sync_file(backup_file)) {
            result.error = HistoryError{HistoryErrorKind::Backup,
                                        platform::path_to_utf8(backup_file),
                                        "failed to flush the backup to disk"};
            return result;
        }
        result.backup_path = backup_file;
    }

    // 2. Новое содержимое во временный файл рядом с оригиналом
    fs::path dir = target.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    fs::path tmp;
    try {
        tmp = platform::make_temp_file(dir, "." + platform::path_to_utf8(target.filename()));
    } catch (const std::runtime_error& e) {
        result.error = io_error(target, e.what());
        return result;
    }

    auto fail = [&](const std::string& message) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        result.error = io_error(target, message);
        return result;
    };

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return fail(std::strerror(errno));
        }
        std::string content = encode();
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            return fail("failed to write the history");
        }
    }

    if (!platform::sync_file(tmp)) {
        return fail("failed to flush the history to disk");
    }

    // Права доступа оригинала переносятся на новый файл
    if (fs::exists(target, ec)) {
        fs::perms perms = fs::status(target, ec).permissions();
        if (ec) {
            return fail(ec.message());
        }
        fs::permissions(tmp, perms, ec);
        if (ec) {
            return fail(ec.message());
        }
    }

    // 3. Атомарная замена
    fs::rename(tmp, target, ec);
    if (ec) {
        return fail(ec.message());
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Вспомогательные функции
// ============================================================================

fs::path backup_path_for(const fs::path& path, const std::string& local_timestamp) {
    return platform::path_from_utf8(platform::path_to_utf8(path) + BACKUP_SEPARATOR +
                                    local_timestamp);
}

}  // namespace zhc::history
