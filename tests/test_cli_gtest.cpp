// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include "zhc/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace zhc::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

ParseResult parse_args(Args&& args) {
    return parse(args.argc(), args.argv());
}

// ==============================================================================
// --help / --version
// ==============================================================================

TEST(CliTest, Parse_NoArguments_HelpOnStderr) {
    // Arrange
    Args args{"zhc"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: zhc [OPTIONS] <COMMAND>"),
              std::string::npos);
}

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    ParseResult result = parse_args(Args{"zhc", "--help"});

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    ParseResult result = parse_args(Args{"zhc", "-V"});

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
    EXPECT_EQ(render_version(), "zhc 0.1.0\n");
}

TEST(CliTest, Parse_HelpSubcommand_TargetsCommand) {
    ParseResult result = parse_args(Args{"zhc", "help", "clean"});

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("clean"));
}

TEST(CliTest, Parse_CommandHelpFlag) {
    ParseResult result = parse_args(Args{"zhc", "analyze", "-h"});

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command,
              std::optional<std::string>("analyze"));
}

TEST(CliTest, RenderHelp_ListsCommands) {
    std::string help = render_help();

    EXPECT_NE(help.find("clean"), std::string::npos);
    EXPECT_NE(help.find("analyze"), std::string::npos);
    EXPECT_NE(help.find("parse"), std::string::npos);
    EXPECT_NE(help.find("--config <CONFIG>"), std::string::npos);
    EXPECT_NE(render_help("clean").find("--dry-run"), std::string::npos);
    EXPECT_NE(render_help("analyze").find("--top <N>"), std::string::npos);
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_GlobalOptions) {
    ParseResult result =
        parse_args(Args{"zhc", "-vv", "-q", "--config", "/tmp/zhc.yml", "analyze"});

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.verbose, 2);
    EXPECT_TRUE(result.global.quiet);
    ASSERT_TRUE(result.global.config.has_value());
    EXPECT_EQ(result.global.config->string(), "/tmp/zhc.yml");
}

TEST(CliTest, Parse_GlobalOptionsAfterCommand) {
    ParseResult result = parse_args(Args{"zhc", "clean", "-v", "-v", "--config=/tmp/c.yml"});

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.verbose, 2);
    ASSERT_TRUE(result.global.config.has_value());
}

TEST(CliTest, Parse_UnknownSubcommand_ExitCode2) {
    ParseResult result = parse_args(Args{"zhc", "frobnicate"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: unrecognized subcommand 'frobnicate'\n\n"
              "Usage: zhc [OPTIONS] <COMMAND>\n\n"
              "For more information, try '--help'.\n");
}

// ==============================================================================
// clean
// ==============================================================================

TEST(CliTest, Parse_Clean_Defaults) {
    ParseResult result = parse_args(Args{"zhc", "clean"});

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<CleanCommand>(result.command));
    const auto& cmd = std::get<CleanCommand>(result.command);
    EXPECT_FALSE(cmd.histfile.has_value());
    EXPECT_FALSE(cmd.no_backup);
    EXPECT_FALSE(cmd.keep_duplicates);
    EXPECT_FALSE(cmd.from.has_value());
    EXPECT_TRUE(cmd.filters.empty());
    EXPECT_FALSE(cmd.dry_run);
}

TEST(CliTest, Parse_Clean_AllOptions) {
    ParseResult result = parse_args(Args{"zhc", "clean", "--no-backup", "--keep-duplicates",
                                         "--from", "2024-01-01", "--to=2024-02-01", "-f",
                                         "password", "--filter=token", "-i", "-n",
                                         "/tmp/history"});

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<CleanCommand>(result.command);
    EXPECT_EQ(cmd.histfile->string(), "/tmp/history");
    EXPECT_TRUE(cmd.no_backup);
    EXPECT_TRUE(cmd.keep_duplicates);
    EXPECT_EQ(cmd.from->to_string(), "2024-01-01");
    EXPECT_EQ(cmd.to->to_string(), "2024-02-01");
    EXPECT_EQ(cmd.filters, (std::vector<std::string>{"password", "token"}));
    EXPECT_TRUE(cmd.ignore_case);
    EXPECT_TRUE(cmd.dry_run);
}

TEST(CliTest, Parse_Clean_FromWithoutTo_ExitCode2) {
    ParseResult result = parse_args(Args{"zhc", "clean", "--from", "2024-01-01"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("--to <DATE>"), std::string::npos);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: zhc clean [OPTIONS] [HISTFILE]"),
              std::string::npos);
}

TEST(CliTest, Parse_Clean_InvalidDate_ExitCode2) {
    ParseResult result =
        parse_args(Args{"zhc", "clean", "--from", "2024-02-30", "--to", "2024-03-01"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind("error: invalid value '2024-02-30'", 0), 0u);
}

TEST(CliTest, Parse_Clean_ReversedRange_ExitCode2) {
    ParseResult result =
        parse_args(Args{"zhc", "clean", "--from", "2024-03-01", "--to", "2024-02-01"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

TEST(CliTest, Parse_Clean_MissingFilterValue_ExitCode2) {
    ParseResult result = parse_args(Args{"zhc", "clean", "-f"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("a value is required for '--filter <WORD>'"),
              std::string::npos);
}

TEST(CliTest, Parse_Clean_UnknownOption_ExitCode2) {
    ParseResult result = parse_args(Args{"zhc", "clean", "--frobnicate"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind("error: unexpected argument '--frobnicate'", 0),
              0u);
}

TEST(CliTest, Parse_Clean_TwoHistfiles_ExitCode2) {
    ParseResult result = parse_args(Args{"zhc", "clean", "a", "b"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

// ==============================================================================
// analyze
// ==============================================================================

TEST(CliTest, Parse_Analyze_Options) {
    ParseResult result = parse_args(Args{"zhc", "analyze", "-t", "5", "--json", "hist"});

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<AnalyzeCommand>(result.command);
    EXPECT_EQ(cmd.top, std::optional<std::size_t>(5));
    EXPECT_TRUE(cmd.json);
    EXPECT_EQ(cmd.histfile->string(), "hist");
}

TEST(CliTest, Parse_Analyze_DefaultTopUnset) {
    ParseResult result = parse_args(Args{"zhc", "analyze"});

    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(std::get<AnalyzeCommand>(result.command).top.has_value());
}

TEST(CliTest, Parse_Analyze_InvalidTop_ExitCode2) {
    ParseResult result = parse_args(Args{"zhc", "analyze", "--top", "ten"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("invalid digit found in string"),
              std::string::npos);
}

TEST(CliTest, Parse_Analyze_NegativeTop_ExitCode2) {
    ParseResult result = parse_args(Args{"zhc", "analyze", "--top=-1"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

// ==============================================================================
// parse
// ==============================================================================

TEST(CliTest, Parse_ParseCommand_Line) {
    ParseResult result = parse_args(Args{"zhc", "parse", ": 1731884069:0;sleep 2"});

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<ParseCommand>(result.command));
    EXPECT_EQ(std::get<ParseCommand>(result.command).line, ": 1731884069:0;sleep 2");
}

TEST(CliTest, Parse_ParseCommand_AfterDoubleDash) {
    ParseResult result = parse_args(Args{"zhc", "parse", "--", "-not-an-option"});

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<ParseCommand>(result.command).line, "-not-an-option");
}

TEST(CliTest, Parse_ParseCommand_MissingLine_ExitCode2) {
    ParseResult result = parse_args(Args{"zhc", "parse"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("<LINE>"), std::string::npos);
}

}  // namespace zhc::cli::test
