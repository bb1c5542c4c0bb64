// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================
//
// Тесты: TST-CLI-001..TST-CLI-006
//
// ==============================================================================

#include "pathaction/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace pathaction::cli::test {

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

const RunCommand& run_command(const ParseResult& result) {
    return std::get<RunCommand>(result.command);
}

// ==============================================================================
// TST-CLI-001: --help и --version
// ==============================================================================

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    // Arrange
    Args args{"pathaction", "--help"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command));
}

TEST(CliTest, Parse_HelpShort_WinsOverMissingPath) {
    Args args{"pathaction", "-h"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command));
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"pathaction", "-V"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(parse({"--version"}).command));
}

TEST(CliTest, RenderVersion_ExactFormat) {
    EXPECT_EQ(render_version(), "pathaction 0.1.0\n");
}

TEST(CliTest, RenderHelp_ListsOptions) {
    const std::string help = render_help();

    EXPECT_NE(help.find("Usage: pathaction [OPTIONS] <PATH>..."), std::string::npos);
    for (const char* flag : {"--tag", "--confirm-before", "--confirm-after", "--list",
                             "--allow-dir", "--dry-run", "--verbose", "--quiet"}) {
        EXPECT_NE(help.find(flag), std::string::npos) << flag;
    }
}

// ==============================================================================
// TST-CLI-002: пути
// ==============================================================================

TEST(CliTest, Parse_Paths_KeptInOrder) {
    // Arrange
    Args args{"pathaction", "a.py", "sub/b.sh", "-"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok);
    const RunCommand& cmd = run_command(result);
    ASSERT_EQ(cmd.paths.size(), 3u);
    EXPECT_EQ(cmd.paths[0], std::filesystem::path("a.py"));
    EXPECT_EQ(cmd.paths[1], std::filesystem::path("sub/b.sh"));
    EXPECT_EQ(cmd.paths[2], std::filesystem::path("-"));
    EXPECT_FALSE(cmd.tag.has_value());
    EXPECT_FALSE(cmd.dry_run);
}

TEST(CliTest, Parse_DoubleDash_EndsOptions) {
    ParseResult result = parse({"-v", "--", "-n", "--list"});

    ASSERT_TRUE(result.ok);
    const RunCommand& cmd = run_command(result);
    EXPECT_EQ(cmd.paths, (std::vector<std::filesystem::path>{"-n", "--list"}));
    EXPECT_FALSE(cmd.dry_run);
    EXPECT_FALSE(cmd.list);
    EXPECT_EQ(result.global.verbose, 1);
}

TEST(CliTest, Parse_NoPaths_IsUsageError) {
    // Act
    ParseResult result = parse({"-v"});

    // Assert
    EXPECT_FALSE(result);
    EXPECT_EQ(result.diagnostic.exit_code, EXIT_USAGE);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: the following required arguments were not provided:\n"
              "  <PATH>...\n"
              "\n"
              "Usage: pathaction [OPTIONS] <PATH>...\n"
              "\n"
              "For more information, try '--help'.\n");
}

// ==============================================================================
// TST-CLI-003: тег
// ==============================================================================

TEST(CliTest, Parse_Tag_AllForms) {
    for (const auto& args : std::vector<std::vector<std::string>>{
             {"-t", "main", "x.py"},
             {"-tmain", "x.py"},
             {"--tag", "main", "x.py"},
             {"--tag=main", "x.py"},
             {"x.py", "-t", "main"},
         }) {
        ParseResult result = parse(args);
        ASSERT_TRUE(result.ok) << args[0];
        EXPECT_EQ(run_command(result).tag, std::string("main")) << args[0];
        EXPECT_EQ(run_command(result).paths.size(), 1u) << args[0];
    }
}

TEST(CliTest, Parse_Tag_LastOneWins) {
    ParseResult result = parse({"-t", "a", "--tag", "b", "x.py"});

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(run_command(result).tag, std::string("b"));
}

TEST(CliTest, Parse_Tag_MissingValue) {
    ParseResult result = parse({"x.py", "--tag"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, EXIT_USAGE);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind(
                  "error: a value is required for '--tag <TAG>' but none was supplied", 0),
              0u);
    EXPECT_FALSE(parse({"x.py", "-t"}).ok);
}

TEST(CliTest, Parse_Tag_EmptyRejected) {
    ParseResult result = parse({"--tag=", "x.py"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind("error: the tag must not be empty", 0),
              0u);
}

// ==============================================================================
// TST-CLI-004: флаги
// ==============================================================================

TEST(CliTest, Parse_LongFlags) {
    // Act
    ParseResult result = parse({"--confirm-before", "--confirm-after", "--list", "--allow-dir",
                                "--dry-run", "--verbose", "--quiet", "x.py"});

    // Assert
    ASSERT_TRUE(result.ok);
    const RunCommand& cmd = run_command(result);
    EXPECT_TRUE(cmd.confirm_before);
    EXPECT_TRUE(cmd.confirm_after);
    EXPECT_TRUE(cmd.list);
    EXPECT_TRUE(cmd.allow_dir);
    EXPECT_TRUE(cmd.dry_run);
    EXPECT_EQ(result.global.verbose, 1);
    EXPECT_TRUE(result.global.quiet);
}

TEST(CliTest, Parse_ShortFlagsBundled) {
    ParseResult result = parse({"-vvbn", "-la", "-d", "-q", "x.py"});

    ASSERT_TRUE(result.ok);
    const RunCommand& cmd = run_command(result);
    EXPECT_EQ(result.global.verbose, 2);
    EXPECT_TRUE(cmd.confirm_before);
    EXPECT_TRUE(cmd.dry_run);
    EXPECT_TRUE(cmd.list);
    EXPECT_TRUE(cmd.confirm_after);
    EXPECT_TRUE(cmd.allow_dir);
    EXPECT_TRUE(result.global.quiet);
}

TEST(CliTest, Parse_BundleEndingWithTag) {
    ParseResult result = parse({"-vtdeploy", "x.py"});

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.verbose, 1);
    EXPECT_EQ(run_command(result).tag, std::string("deploy"));
}

// ==============================================================================
// TST-CLI-005: неизвестные аргументы
// ==============================================================================

TEST(CliTest, Parse_UnknownLongOption) {
    ParseResult result = parse({"--frobnicate", "x.py"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, EXIT_USAGE);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind(
                  "error: unexpected argument '--frobnicate' found", 0),
              0u);
}

TEST(CliTest, Parse_UnknownShortOption) {
    ParseResult result = parse({"-vz", "x.py"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind("error: unexpected argument '-z' found", 0),
              0u);
}

// ==============================================================================
// TST-CLI-006: render_usage_error
// ==============================================================================

TEST(CliTest, RenderUsageError_Format) {
    EXPECT_EQ(render_usage_error("error: boom"),
              "error: boom\n\nUsage: pathaction [OPTIONS] <PATH>...\n\n"
              "For more information, try '--help'.\n");
}

}  // namespace pathaction::cli::test
