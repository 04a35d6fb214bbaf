// ==============================================================================
// analyze.cpp - Статистика по истории
// ==============================================================================

#include "zhc/analyze.hpp"

#include "zhc/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string_view>
#include <unordered_map>

namespace zhc::analyze {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), is_space);
}

/// Отсортировать счётчики (частота по убыванию, ключ по возрастанию) и взять n
Ranking rank(const std::unordered_map<std::string_view, std::size_t>& counts, std::size_t n) {
    std::vector<std::pair<std::string_view, std::size_t>> items(counts.begin(), counts.end());
    std::sort(items.begin(), items.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });
    if (items.size() > n) {
        items.resize(n);
    }

    Ranking result;
    result.reserve(items.size());
    for (const auto& [key, count] : items) {
        result.emplace_back(std::string(key), count);
    }
    return result;
}

rapidjson::Value ranking_to_json(const Ranking& ranking, const char* key_name,
                                 rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (const auto& [key, count] : ranking) {
        rapidjson::Value item(rapidjson::kObjectType);
        rapidjson::Value k;
        k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
        item.AddMember(rapidjson::StringRef(key_name), k, alloc);
        item.AddMember("count", static_cast<std::uint64_t>(count), alloc);
        arr.PushBack(item, alloc);
    }
    return arr;
}

}  // anonymous namespace

// ============================================================================
// HistoryAnalysis
// ============================================================================

double HistoryAnalysis::duplicate_percentage() const {
    if (size == 0) {
        return 0.0;
    }
    return static_cast<double>(duplicate_count) / static_cast<double>(size) * 100.0;
}

void HistoryAnalysis::to_rapidjson(rapidjson::Value& out,
                                   rapidjson::Document::AllocatorType& alloc) const {
    out.SetObject();

    rapidjson::Value name;
    name.SetString(filename.c_str(), static_cast<rapidjson::SizeType>(filename.size()), alloc);
    out.AddMember("filename", name, alloc);
    out.AddMember("size", static_cast<std::uint64_t>(size), alloc);

    if (date_range) {
        rapidjson::Value range(rapidjson::kObjectType);
        std::string from = date_range->first.to_string();
        std::string to = date_range->second.to_string();
        rapidjson::Value from_v;
        from_v.SetString(from.c_str(), static_cast<rapidjson::SizeType>(from.size()), alloc);
        rapidjson::Value to_v;
        to_v.SetString(to.c_str(), static_cast<rapidjson::SizeType>(to.size()), alloc);
        range.AddMember("from", from_v, alloc);
        range.AddMember("to", to_v, alloc);
        range.AddMember("days",
                        static_cast<std::int64_t>(days_between(date_range->first, date_range->second)),
                        alloc);
        out.AddMember("date_range", range, alloc);
    } else {
        out.AddMember("date_range", rapidjson::Value(rapidjson::kNullType), alloc);
    }

    out.AddMember("duplicate_count", static_cast<std::uint64_t>(duplicate_count), alloc);
    out.AddMember("duplicate_percentage", duplicate_percentage(), alloc);
    out.AddMember("top_n", static_cast<std::uint64_t>(top_n), alloc);
    out.AddMember("top_commands", ranking_to_json(top_n_commands, "command", alloc), alloc);
    out.AddMember("top_executables", ranking_to_json(top_n_executables, "executable", alloc),
                  alloc);
}

// ============================================================================
// HistoryAnalyzer
// ============================================================================

HistoryAnalysis HistoryAnalyzer::analyze(std::size_t top_n) const {
    HistoryAnalysis analysis;
    analysis.filename = platform::path_to_utf8(history_.path());
    analysis.size = history_.size();
    analysis.date_range = date_range();
    analysis.duplicate_count = duplicate_count();
    analysis.top_n = top_n;
    analysis.top_n_commands = top_n_commands(top_n);
    analysis.top_n_executables = top_n_executables(top_n);
    return analysis;
}

Ranking HistoryAnalyzer::top_n_commands(std::size_t n) const {
    if (n == 0 || history_.empty()) {
        return {};
    }

    std::unordered_map<std::string_view, std::size_t> counts;
    for (const auto& entry : history_.entries()) {
        if (!is_blank(entry.command())) {
            ++counts[entry.command()];
        }
    }
    return rank(counts, n);
}

Ranking HistoryAnalyzer::top_n_executables(std::size_t n) const {
    if (n == 0 || history_.empty()) {
        return {};
    }

    std::unordered_map<std::string_view, std::size_t> counts;
    for (const auto& entry : history_.entries()) {
        if (auto word = executable_of(entry.command())) {
            ++counts[*word];
        }
    }
    return rank(counts, n);
}

std::optional<DateRange> HistoryAnalyzer::date_range() const {
    std::optional<DateRange> range;

    // Порядок файла совпадает с порядком добавления, а не возрастания timestamp
    for (const auto& entry : history_.entries()) {
        auto date = entry.local_date();
        if (!date) {
            continue;
        }
        if (!range) {
            range = DateRange{*date, *date};
        } else {
            range->first = std::min(range->first, *date);
            range->second = std::max(range->second, *date);
        }
    }
    return range;
}

// ============================================================================
// Вспомогательные функции
// ============================================================================

std::optional<std::string_view> executable_of(std::string_view command) {
    auto begin = std::find_if_not(command.begin(), command.end(), is_space);
    if (begin == command.end()) {
        return std::nullopt;
    }
    auto end = std::find_if(begin, command.end(), is_space);
    return command.substr(static_cast<std::size_t>(begin - command.begin()),
                          static_cast<std::size_t>(end - begin));
}

}  // namespace zhc::analyze
