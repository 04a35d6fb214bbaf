// ==============================================================================
// test_zsh_line_gtest.cpp - Тесты декодера строк истории (GoogleTest)
// ==============================================================================

#include "zhc/zsh_line.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace zhc::io::test {

// ==============================================================================
// Метафикация
// ==============================================================================

TEST(ZshLineTest, Unmetafy_PlainText_Unchanged) {
    std::string line = ": 1700000000:0;ls -la";
    unmetafy(line);
    EXPECT_EQ(line, ": 1700000000:0;ls -la");
}

TEST(ZshLineTest, Unmetafy_MarkerPair_DecodesByte) {
    // 0x83 0xA2 -> 0xA2 ^ 0x20 = 0x82
    std::string line = "a\x83\xa2z";
    unmetafy(line);
    ASSERT_EQ(line.size(), 3u);
    EXPECT_EQ(static_cast<unsigned char>(line[1]), 0x82);
    EXPECT_EQ(line[2], 'z');
}

TEST(ZshLineTest, Unmetafy_MultiByteCharacter_RestoresUtf8) {
    // "—" (E2 80 94): zsh записывает байт 0x94 как 0x83 0xB4
    std::string line = "\xe2\x80\x83\xb4";
    unmetafy(line);
    EXPECT_EQ(line, "\xe2\x80\x94");
}

TEST(ZshLineTest, Unmetafy_TrailingMarker_KeptVerbatim) {
    std::string line = "abc\x83";
    unmetafy(line);
    EXPECT_EQ(line, "abc\x83");
}

TEST(ZshLineTest, Metafy_PlainText_Unchanged) {
    EXPECT_EQ(metafy(": 1700000000:0;ls -la"), ": 1700000000:0;ls -la");
}

TEST(ZshLineTest, Metafy_MetaRangeBytes_Encoded) {
    // "ё" (D1 91): 0x91 лежит в диапазоне 0x83..0xA2
    EXPECT_EQ(metafy("\xd1\x91"), "\xd1\x83\xb1");
    EXPECT_EQ(metafy(std::string("a\0b", 3)), "a\x83\x20" "b");
    EXPECT_EQ(metafy("\x83"), "\x83\xa3");
    EXPECT_EQ(metafy("\xa2"), "\x83\x82");
    // Граничные байты вне диапазона не трогаются
    EXPECT_EQ(metafy("\x82\xa3"), "\x82\xa3");
}

TEST(ZshLineTest, Metafy_InverseOfUnmetafy) {
    const std::string on_disk = "echo \xd1\x83\xb1 \xe2\x80\x83\xb4";

    std::string decoded = on_disk;
    unmetafy(decoded);

    EXPECT_EQ(decoded, "echo \xd1\x91 \xe2\x80\x94");
    EXPECT_EQ(metafy(decoded), on_disk);
}

TEST(ZshLineTest, IsContinued_TrailingBackslash) {
    EXPECT_TRUE(is_continued("echo foo \\"));
    EXPECT_TRUE(is_continued("echo foo \\   "));
    EXPECT_FALSE(is_continued("echo foo"));
    EXPECT_FALSE(is_continued(""));
    EXPECT_FALSE(is_continued("   "));
}

// ==============================================================================
// ZshLineReader
// ==============================================================================

TEST(ZshLineTest, Reader_SingleLineRecords) {
    std::istringstream in(": 1:0;ls\n: 2:0;pwd\n");
    RecordsResult result = read_logical_records(in);

    ASSERT_TRUE(result);
    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.records[0], ": 1:0;ls");
    EXPECT_EQ(result.records[1], ": 2:0;pwd");
}

TEST(ZshLineTest, Reader_ContinuationLines_JoinedWithNewline) {
    std::istringstream in(": 1700000000:0;echo a \\\nb \\\nc\n: 1700000001:0;ls\n");
    RecordsResult result = read_logical_records(in);

    ASSERT_TRUE(result);
    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.records[0], ": 1700000000:0;echo a \\\nb \\\nc");
    EXPECT_EQ(result.records[1], ": 1700000001:0;ls");
}

TEST(ZshLineTest, Reader_PartialTrailingRecord_Retained) {
    std::istringstream in(": 1700000000:0;ls\n: 1700000001:0;echo \\\n");
    RecordsResult result = read_logical_records(in);

    ASSERT_TRUE(result);
    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.records[1], ": 1700000001:0;echo \\");
}

TEST(ZshLineTest, Reader_NoTrailingNewline) {
    std::istringstream in(": 1700000000:0;ls");
    RecordsResult result = read_logical_records(in);

    ASSERT_TRUE(result);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0], ": 1700000000:0;ls");
}

TEST(ZshLineTest, Reader_CrLf_Stripped) {
    std::istringstream in(": 1700000000:0;ls\r\n");
    RecordsResult result = read_logical_records(in);

    ASSERT_TRUE(result);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0], ": 1700000000:0;ls");
}

TEST(ZshLineTest, Reader_EmptyStream_NoRecords) {
    std::istringstream in("");
    RecordsResult result = read_logical_records(in);

    ASSERT_TRUE(result);
    EXPECT_TRUE(result.records.empty());
}

TEST(ZshLineTest, Reader_InvalidUtf8_ReportsLineNumber) {
    std::istringstream in(": 1700000000:0;ls\n: 1700000001:0;\xff\xfe\n: 1700000002:0;pwd\n");
    RecordsResult result = read_logical_records(in);

    EXPECT_FALSE(result);
    EXPECT_TRUE(result.records.empty());
    EXPECT_EQ(result.error.line, 2u);
    EXPECT_EQ(result.error.format(), "Error when reading line 2: stream did not contain valid UTF-8.");
}

TEST(ZshLineTest, Reader_StreamingApi_CountsPhysicalLines) {
    std::istringstream in(": 1:0;a \\\nb\n: 2:0;c\n");
    ZshLineReader reader(in);

    std::string record;
    ASSERT_TRUE(reader.next(record));
    EXPECT_EQ(reader.line_number(), 2u);
    ASSERT_TRUE(reader.next(record));
    EXPECT_EQ(record, ": 2:0;c");
    EXPECT_FALSE(reader.next(record));
    EXPECT_FALSE(reader.last_error().has_value());
}

}  // namespace zhc::io::test
