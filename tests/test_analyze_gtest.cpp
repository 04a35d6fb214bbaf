// ==============================================================================
// test_analyze_gtest.cpp - Тесты частотного анализатора и отчёта (GoogleTest)
// ==============================================================================

#include "zhc/analyze.hpp"
#include "zhc/report.hpp"

#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>
#include <string_view>

namespace zhc::analyze::test {

using history::History;
using history::HistoryEntry;

namespace {

History make_history(std::initializer_list<const char*> commands) {
    std::vector<HistoryEntry> entries;
    std::uint64_t ts = 1700000000;
    for (const char* command : commands) {
        entries.emplace_back(command, ts++, 0);
    }
    return History("/tmp/.zsh_history", std::move(entries));
}

}  // namespace

class AnalyzeTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Даты в тестах считаются в UTC
#ifdef _WIN32
        _putenv_s("TZ", "UTC");
        _tzset();
#else
        setenv("TZ", "UTC", 1);
        tzset();
#endif
    }
};

// ==============================================================================
// Рейтинги
// ==============================================================================

TEST_F(AnalyzeTest, TopCommands_TieBrokenByText) {
    History history = make_history({"ls", "pwd", "ls", "pwd", "ls", "pwd", "cd"});
    HistoryAnalyzer analyzer(history);

    Ranking top = analyzer.top_n_commands(2);

    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0], (std::pair<std::string, std::size_t>{"ls", 3}));
    EXPECT_EQ(top[1], (std::pair<std::string, std::size_t>{"pwd", 3}));
}

TEST_F(AnalyzeTest, TopCommands_FewerThanRequested) {
    History history = make_history({"ls", "ls", "git status"});
    HistoryAnalyzer analyzer(history);

    Ranking top = analyzer.top_n_commands(10);

    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].first, "ls");
    EXPECT_EQ(top[0].second, 2u);
    EXPECT_EQ(top[1].first, "git status");
}

TEST_F(AnalyzeTest, TopCommands_ZeroOrEmpty) {
    History empty = make_history({});
    History some = make_history({"ls"});

    EXPECT_TRUE(HistoryAnalyzer(empty).top_n_commands(5).empty());
    EXPECT_TRUE(HistoryAnalyzer(some).top_n_commands(0).empty());
    EXPECT_TRUE(HistoryAnalyzer(some).top_n_executables(0).empty());
}

TEST_F(AnalyzeTest, TopCommands_BlankCommandsIgnored) {
    History history = make_history({"", "  ", "ls"});
    HistoryAnalyzer analyzer(history);

    Ranking top = analyzer.top_n_commands(5);

    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].first, "ls");
}

TEST_F(AnalyzeTest, TopExecutables_FirstWord) {
    History history = make_history({"git status", "git log", "  ls -la", "git\tdiff", "ls"});
    HistoryAnalyzer analyzer(history);

    Ranking top = analyzer.top_n_executables(5);

    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0], (std::pair<std::string, std::size_t>{"git", 3}));
    EXPECT_EQ(top[1], (std::pair<std::string, std::size_t>{"ls", 2}));
}

TEST(ExecutableTest, ExecutableOf) {
    EXPECT_EQ(executable_of("git commit -m x"), std::optional<std::string_view>("git"));
    EXPECT_EQ(executable_of("\n  vim file"), std::optional<std::string_view>("vim"));
    EXPECT_FALSE(executable_of("").has_value());
    EXPECT_FALSE(executable_of(" \t ").has_value());
}

// ==============================================================================
// Диапазон дат и дубликаты
// ==============================================================================

TEST_F(AnalyzeTest, DateRange_MinAndMaxRegardlessOfOrder) {
    History history("/tmp/h", {HistoryEntry("a", 1711454400, 0),    // 2024-03-26
                               HistoryEntry("b", 1577880000, 0),    // 2020-01-01
                               HistoryEntry("c", 1677412800, 0)});  // 2023-02-26
    HistoryAnalyzer analyzer(history);

    auto range = analyzer.date_range();

    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->first.to_string(), "2020-01-01");
    EXPECT_EQ(range->second.to_string(), "2024-03-26");
}

TEST_F(AnalyzeTest, DateRange_IgnoresUnconvertibleTimestamps) {
    // Arrange
    History history("/tmp/h", {HistoryEntry("a", UINT64_MAX, 0),
                               HistoryEntry("b", 1677412800, 0),    // 2023-02-26
                               HistoryEntry("c", 1711454400, 0)});  // 2024-03-26
    HistoryAnalyzer analyzer(history);

    // Act
    auto range = analyzer.date_range();

    // Assert
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->first.to_string(), "2023-02-26");
    EXPECT_EQ(range->second.to_string(), "2024-03-26");
}

TEST_F(AnalyzeTest, DateRange_OnlyUnconvertibleTimestamps) {
    History history("/tmp/h", {HistoryEntry("a", UINT64_MAX, 0)});
    EXPECT_FALSE(HistoryAnalyzer(history).date_range().has_value());
}

TEST_F(AnalyzeTest, DateRange_EmptyHistory) {
    History history = make_history({});
    EXPECT_FALSE(HistoryAnalyzer(history).date_range().has_value());
}

TEST_F(AnalyzeTest, Analyze_CollectsEverything) {
    History history = make_history({"ls", "ls", "pwd", "git st", "git st"});
    HistoryAnalyzer analyzer(history);

    HistoryAnalysis analysis = analyzer.analyze(3);

    EXPECT_EQ(analysis.filename, "/tmp/.zsh_history");
    EXPECT_EQ(analysis.size, 5u);
    EXPECT_EQ(analysis.duplicate_count, 2u);
    EXPECT_DOUBLE_EQ(analysis.duplicate_percentage(), 40.0);
    EXPECT_EQ(analysis.top_n, 3u);
    ASSERT_EQ(analysis.top_n_commands.size(), 3u);
    EXPECT_EQ(analysis.top_n_commands[0].first, "git st");
    EXPECT_EQ(analysis.top_n_executables[0].first, "git");
    ASSERT_TRUE(analysis.date_range.has_value());
    EXPECT_EQ(analysis.date_range->first, analysis.date_range->second);
}

TEST_F(AnalyzeTest, Analyze_EmptyHistory_ZeroPercentage) {
    History history = make_history({});
    HistoryAnalysis analysis = HistoryAnalyzer(history).analyze(10);

    EXPECT_EQ(analysis.size, 0u);
    EXPECT_DOUBLE_EQ(analysis.duplicate_percentage(), 0.0);
    EXPECT_FALSE(analysis.date_range.has_value());
}

// ==============================================================================
// JSON
// ==============================================================================

TEST_F(AnalyzeTest, ToRapidJson_Fields) {
    History history = make_history({"ls", "ls", "pwd"});
    HistoryAnalysis analysis = HistoryAnalyzer(history).analyze(5);

    rapidjson::Document doc;
    analysis.to_rapidjson(doc, doc.GetAllocator());

    ASSERT_TRUE(doc.IsObject());
    EXPECT_STREQ(doc["filename"].GetString(), "/tmp/.zsh_history");
    EXPECT_EQ(doc["size"].GetUint64(), 3u);
    EXPECT_EQ(doc["duplicate_count"].GetUint64(), 1u);
    EXPECT_EQ(doc["top_n"].GetUint64(), 5u);
    ASSERT_TRUE(doc["date_range"].IsObject());
    EXPECT_STREQ(doc["date_range"]["from"].GetString(), "2023-11-14");
    EXPECT_EQ(doc["date_range"]["days"].GetInt64(), 0);

    const auto& commands = doc["top_commands"];
    ASSERT_TRUE(commands.IsArray());
    ASSERT_EQ(commands.Size(), 2u);
    EXPECT_STREQ(commands[0]["command"].GetString(), "ls");
    EXPECT_EQ(commands[0]["count"].GetUint64(), 2u);

    const auto& executables = doc["top_executables"];
    ASSERT_TRUE(executables.IsArray());
    EXPECT_STREQ(executables[0]["executable"].GetString(), "ls");
}

TEST_F(AnalyzeTest, ToRapidJson_NoDateRange_Null) {
    History history = make_history({});
    HistoryAnalysis analysis = HistoryAnalyzer(history).analyze(5);

    rapidjson::Document doc;
    analysis.to_rapidjson(doc, doc.GetAllocator());

    EXPECT_TRUE(doc["date_range"].IsNull());
    EXPECT_EQ(doc["top_commands"].Size(), 0u);
}

// ==============================================================================
// Текстовый отчёт
// ==============================================================================

TEST(ReportTest, TruncateLeft) {
    EXPECT_EQ(truncate_left("short", 60), "short");
    EXPECT_EQ(truncate_left("abcdefghij", 8), "...fghij");
}

TEST(ReportTest, FormatRankedCell_ShortText) {
    EXPECT_EQ(format_ranked_cell("ls", 40, 3), "ls (3 times)");
}

TEST(ReportTest, FormatRankedCell_LongTextTruncated) {
    std::string text(50, 'x');
    std::string cell = format_ranked_cell(text, 40, 7);

    EXPECT_EQ(cell, std::string(40, 'x') + "... (7 times)");
}

TEST(ReportTest, FormatRankedCell_NewlinesFlattened) {
    EXPECT_EQ(format_ranked_cell("echo a \\\nb", 40, 1), "echo a \\ b (1 times)");
}

TEST(ReportTest, FormatRankedCell_Utf8BoundaryRespected) {
    // "é" = 2 байта; обрезка на 3 байтах не должна разрывать символ
    std::string cell = format_ranked_cell("\xc3\xa9\xc3\xa9\xc3\xa9", 3, 1);
    EXPECT_EQ(cell, "\xc3\xa9... (1 times)");
}

TEST(ReportTest, RankIcon) {
    EXPECT_EQ(rank_icon(1), "\xf0\x9f\xa5\x87");
    EXPECT_EQ(rank_icon(3), "\xf0\x9f\xa5\x89");
    EXPECT_EQ(rank_icon(4), "4");
}

TEST(ReportTest, HumanizeDays) {
    EXPECT_EQ(humanize_days(0), "0 days");
    EXPECT_EQ(humanize_days(1), "1 day");
    EXPECT_EQ(humanize_days(451), "451 days");
}

TEST_F(AnalyzeTest, RenderReport_Uncolored) {
    History history = make_history({"ls", "ls", "pwd"});
    HistoryAnalysis analysis = HistoryAnalyzer(history).analyze(10);

    std::string report = render_report(analysis, false);

    EXPECT_NE(report.find("History Analysis for /tmp/.zsh_history"), std::string::npos);
    EXPECT_NE(report.find("Date range: 2023-11-14 to 2023-11-14 (0 days)"), std::string::npos);
    EXPECT_NE(report.find("Total Commands: 3"), std::string::npos);
    EXPECT_NE(report.find("Duplicate Commands: 1 (33.33%)"), std::string::npos);
    EXPECT_NE(report.find("Top 10 Most Used:"), std::string::npos);
    EXPECT_NE(report.find("ls (2 times)"), std::string::npos);
    EXPECT_NE(report.find("pwd (1 times)"), std::string::npos);
    EXPECT_EQ(report.find("\x1b["), std::string::npos);
}

TEST_F(AnalyzeTest, RenderReport_EmptyHistory) {
    History history = make_history({});
    HistoryAnalysis analysis = HistoryAnalyzer(history).analyze(10);

    std::string report = render_report(analysis, false);

    EXPECT_NE(report.find("Date range: n/a"), std::string::npos);
    EXPECT_NE(report.find("Duplicate Commands: 0 (0.00%)"), std::string::npos);
}

}  // namespace zhc::analyze::test
