// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include <ntreg/cli.hpp>

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ntreg::cli::test {

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

// ==============================================================================
// help / version
// ==============================================================================

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    // Arrange
    Args args{"ntreg", "--help"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_TRUE(result.ok);
    auto* help = std::get_if<HelpCommand>(&result.command);
    ASSERT_NE(help, nullptr);
    EXPECT_FALSE(help->command.has_value());
}

TEST(CliTest, Parse_SubcommandHelp_CarriesName) {
    Args args{"ntreg", "values", "-h"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    auto* help = std::get_if<HelpCommand>(&result.command);
    ASSERT_NE(help, nullptr);
    EXPECT_EQ(help->command, std::optional<std::string>("values"));
}

TEST(CliTest, Parse_HelpCommand_WithName) {
    Args args{"ntreg", "help", "set"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    auto* help = std::get_if<HelpCommand>(&result.command);
    ASSERT_NE(help, nullptr);
    EXPECT_EQ(help->command, std::optional<std::string>("set"));
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"ntreg", "-V"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
    EXPECT_EQ(render_version(), "ntreg 0.3.0\n");
}

TEST(CliTest, Parse_NoArgs_FailsWithHelp) {
    Args args{"ntreg"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: ntreg"), std::string::npos);
}

TEST(CliTest, RenderHelp_SetMentionsDataOptions) {
    std::string help = render_help(std::string("set"));

    EXPECT_NE(help.find("--dword <N>"), std::string::npos);
    EXPECT_NE(help.find("<NAME>"), std::string::npos);
    EXPECT_EQ(render_help(std::string("keys")).find("--dword"), std::string::npos);
}

// ==============================================================================
// Подкоманды
// ==============================================================================

TEST(CliTest, Parse_Keys_WithGlobalOptionsAfter) {
    // Arrange
    Args args{"ntreg", "keys", "\\Registry\\Machine\\Software", "--store", "store.yml",
              "--json", "-q", "--no-banner"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    auto* cmd = std::get_if<KeysCommand>(&result.command);
    ASSERT_NE(cmd, nullptr);
    EXPECT_EQ(cmd->path, "\\Registry\\Machine\\Software");
    ASSERT_TRUE(result.global.store.has_value());
    EXPECT_EQ(result.global.store->filename().string(), "store.yml");
    EXPECT_TRUE(result.global.json);
    EXPECT_TRUE(result.global.quiet);
    EXPECT_TRUE(result.global.no_banner);
}

TEST(CliTest, Parse_Tree_VerboseAndOutput) {
    Args args{"ntreg", "-vv", "-o", "out.txt", "--full", "tree", "\\Registry\\User"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    EXPECT_TRUE(std::holds_alternative<TreeCommand>(result.command));
    EXPECT_EQ(result.global.verbose, 2);
    EXPECT_TRUE(result.global.full);
    ASSERT_TRUE(result.global.output.has_value());
}

TEST(CliTest, Parse_SetDword_Hex) {
    Args args{"ntreg", "set", "\\Registry\\Machine\\Software\\Test", "Count", "--dword", "0x539"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    auto* cmd = std::get_if<SetCommand>(&result.command);
    ASSERT_NE(cmd, nullptr);
    EXPECT_EQ(cmd->name, "Count");
    ASSERT_TRUE(std::holds_alternative<std::uint32_t>(cmd->data));
    EXPECT_EQ(std::get<std::uint32_t>(cmd->data), 1337u);
}

TEST(CliTest, Parse_SetBinary) {
    Args args{"ntreg", "set", "\\A", "Blob", "--binary", "deadbeef"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    auto* cmd = std::get_if<SetCommand>(&result.command);
    ASSERT_NE(cmd, nullptr);
    ASSERT_TRUE(std::holds_alternative<std::vector<std::uint8_t>>(cmd->data));
    EXPECT_EQ(std::get<std::vector<std::uint8_t>>(cmd->data),
              (std::vector<std::uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}));
}

TEST(CliTest, Parse_DeleteValue_EmptyName) {
    Args args{"ntreg", "delete-value", "\\A", ""};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    auto* cmd = std::get_if<DeleteValueCommand>(&result.command);
    ASSERT_NE(cmd, nullptr);
    EXPECT_EQ(cmd->name, "");
}

// ==============================================================================
// Ошибки использования (exit code 2)
// ==============================================================================

TEST(CliTest, Parse_UnknownSubcommand_Fails) {
    Args args{"ntreg", "frobnicate"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unrecognized subcommand 'frobnicate'"),
              std::string::npos);
    EXPECT_NE(result.diagnostic.stderr_message.find("For more information, try '--help'."),
              std::string::npos);
}

TEST(CliTest, Parse_MissingPath_Fails) {
    Args args{"ntreg", "values"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("<PATH>"), std::string::npos);
}

TEST(CliTest, Parse_ExtraPositional_Fails) {
    Args args{"ntreg", "keys", "\\A", "\\B"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '\\B'"),
              std::string::npos);
}

TEST(CliTest, Parse_SetWithoutData_Fails) {
    Args args{"ntreg", "set", "\\A", "X"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("exactly one of"), std::string::npos);
}

TEST(CliTest, Parse_SetTwoData_Fails) {
    Args args{"ntreg", "set", "\\A", "X", "--dword", "1", "--string", "a"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
}

TEST(CliTest, Parse_DwordOverflow_Fails) {
    Args args{"ntreg", "set", "\\A", "X", "--dword", "4294967296"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("invalid value '4294967296'"),
              std::string::npos);
}

TEST(CliTest, Parse_SignedOrPaddedNumber_Fails) {
    for (const char* text : {" -1", "-1", "+5", " 5", "\t7", "0x-1", "0x 1", "0x", ""}) {
        // Arrange
        Args args{"ntreg", "set", "\\A", "X", "--qword", text};

        // Act
        ParseResult result = parse(args.argc(), args.argv());

        // Assert
        EXPECT_FALSE(result.ok) << "'" << text << "'";
        EXPECT_EQ(result.diagnostic.exit_code, 2) << "'" << text << "'";
    }
}

TEST(CliTest, Parse_HexQword_Accepted) {
    Args args{"ntreg", "set", "\\A", "X", "--qword", "0xFFFFFFFFFFFFFFFF"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto* set = std::get_if<SetCommand>(&result.command);
    ASSERT_NE(set, nullptr);
    EXPECT_EQ(std::get<std::uint64_t>(set->data), 0xFFFFFFFFFFFFFFFFULL);
}

TEST(CliTest, Parse_DataOptionOutsideSet_Fails) {
    Args args{"ntreg", "keys", "\\A", "--qword", "5"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("only valid for 'set'"), std::string::npos);
}

TEST(CliTest, Parse_JsonAndJsonl_Conflict) {
    Args args{"ntreg", "values", "\\A", "--json", "--jsonl"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("cannot be used with"), std::string::npos);
}

TEST(CliTest, Parse_StoreWithoutValue_Fails) {
    Args args{"ntreg", "keys", "\\A", "--store"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("a value is required for '--store <FILE>'"),
              std::string::npos);
}

TEST(CliTest, Parse_UnknownOption_Fails) {
    Args args{"ntreg", "keys", "\\A", "--bogus"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '--bogus'"),
              std::string::npos);
}

}  // namespace ntreg::cli::test
