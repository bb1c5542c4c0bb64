// ==============================================================================
// test_template_gtest.cpp - Тесты шаблонов и фильтров (GoogleTest)
// ==============================================================================
//
// Тесты: TST-TMPL-001..TST-TMPL-009
//
// ==============================================================================

#include "pathaction/error.hpp"
#include "pathaction/template.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <unistd.h>

namespace pathaction::tmpl::test {

// ==============================================================================
// Test Fixture: фиксированный контекст и временная директория
// ==============================================================================

class TemplateTest : public ::testing::Test {
protected:
    Context ctx_;
    std::filesystem::path test_dir_;

    void SetUp() override {
        ctx_.file = "/tmp/a b.sh";
        ctx_.cwd = "/work";
        ctx_.env = {
            {"HOME", "/home/tester"},
            {"USER", "tester"},
            {"PATH", "/nonexistent:/bin:/usr/bin"},
        };

        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("pathaction_tmpl_") + test_info->name() + "_" +
                     std::to_string(getpid()));
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        const auto path = test_dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    /// Отрендерить и вернуть вид ошибки (или nullopt, если ошибки нет)
    std::optional<ErrorKind> render_error(const std::string& source) {
        try {
            render(source, ctx_);
        } catch (const Exception& e) {
            return e.error().kind;
        }
        return std::nullopt;
    }
};

// ==============================================================================
// TST-TMPL-001: переменные
// ==============================================================================

TEST_F(TemplateTest, TST_TMPL_001_Variables) {
    EXPECT_EQ(render("{{ file }}", ctx_), "/tmp/a b.sh");
    EXPECT_EQ(render("{{cwd}}", ctx_), "/work");
    EXPECT_EQ(render("{{ pathsep }}", ctx_), "/");
    EXPECT_EQ(render("{{ env.HOME }}/{{ env['USER'] }}", ctx_), "/home/tester/tester");
}

TEST_F(TemplateTest, TST_TMPL_001_PlainTextUnchanged) {
    EXPECT_EQ(render("echo {x} } {", ctx_), "echo {x} } {");
    EXPECT_EQ(render("", ctx_), "");
    EXPECT_FALSE(has_template("echo {x}"));
    EXPECT_TRUE(has_template("{{ cwd }}/src/*.py"));
}

TEST_F(TemplateTest, TST_TMPL_001_LiteralsAndConcatenation) {
    EXPECT_EQ(render("{{ 'a' ~ \"b\" ~ 42 }}", ctx_), "ab42");
    EXPECT_EQ(render("{{ ['python3', file] }}", ctx_), "['python3', '/tmp/a b.sh']");
    EXPECT_EQ(render("{{ [\"it's\"] }}", ctx_), "[\"it's\"]");
}

// ==============================================================================
// TST-TMPL-002: комментарии и обрезка пробелов
// ==============================================================================

TEST_F(TemplateTest, TST_TMPL_002_CommentsRemoved) {
    EXPECT_EQ(render("a {# comment #}b", ctx_), "a b");
}

TEST_F(TemplateTest, TST_TMPL_002_WhitespaceControl) {
    EXPECT_EQ(render("a   {{- 'x' -}}   b", ctx_), "axb");
    EXPECT_EQ(render("a\n{{- 'x' }}\nb", ctx_), "ax\nb");
}

// ==============================================================================
// TST-TMPL-003: чистые фильтры
// ==============================================================================

TEST_F(TemplateTest, TST_TMPL_003_QuoteFilter) {
    EXPECT_EQ(render("bash {{ file|quote }}", ctx_), "bash '/tmp/a b.sh'");
    EXPECT_EQ(render("{{ ['a b', 'c']|quote }}", ctx_), "[\"'a b'\", 'c']");
}

TEST_F(TemplateTest, TST_TMPL_003_BasenameDirname) {
    EXPECT_EQ(render("{{ file | basename }}", ctx_), "a b.sh");
    EXPECT_EQ(render("{{ file | dirname }}", ctx_), "/tmp");
    EXPECT_EQ(render("{{ 'x.py' | dirname }}", ctx_), "");
    EXPECT_EQ(render("{{ '/a/b/' | basename }}", ctx_), "");
}

TEST_F(TemplateTest, TST_TMPL_003_Joinpath) {
    EXPECT_EQ(render("{{ ['/a', 'b', 'c.py']|joinpath }}", ctx_), "/a/b/c.py");
    EXPECT_EQ(render("{{ '/a'|joinpath('b', '/c') }}", ctx_), "/c");
    EXPECT_EQ(render("{{ file|dirname|joinpath('build') }}", ctx_), "/tmp/build");
}

TEST_F(TemplateTest, TST_TMPL_003_JoincmdSplitcmd) {
    EXPECT_EQ(render("{{ ['python3', file]|joincmd }}", ctx_), "python3 '/tmp/a b.sh'");
    EXPECT_EQ(render("{{ 'a b \"c d\"'|splitcmd }}", ctx_), "['a', 'b', 'c d']");
    EXPECT_EQ(render("{{ ('x y z'|splitcmd)[1] }}", ctx_), "y");
    EXPECT_EQ(render("{{ ('x y z'|splitcmd)[-1] }}", ctx_), "z");
}

TEST_F(TemplateTest, TST_TMPL_003_FilterTablesAreSeparate) {
    EXPECT_NE(pure_filters().find("quote"), pure_filters().end());
    EXPECT_EQ(pure_filters().find("which"), pure_filters().end());
    EXPECT_NE(filesystem_filters().find("which"), filesystem_filters().end());
    EXPECT_NE(filesystem_filters().find("realpath"), filesystem_filters().end());
    EXPECT_EQ(pure_filters().size() + filesystem_filters().size(), 14u);
    EXPECT_EQ(find_filter("upper"), nullptr);
}

// ==============================================================================
// TST-TMPL-004: фильтры путей и окружения
// ==============================================================================

TEST_F(TemplateTest, TST_TMPL_004_Abspath) {
    EXPECT_EQ(render("{{ 'sub/../x.py'|abspath }}", ctx_), "/work/x.py");
    EXPECT_EQ(render("{{ '/etc/'|abspath }}", ctx_), "/etc");
}

TEST_F(TemplateTest, TST_TMPL_004_Expanduser) {
    EXPECT_EQ(render("{{ '~/x'|expanduser }}", ctx_), "/home/tester/x");
    EXPECT_EQ(render("{{ '~'|expanduser }}", ctx_), "/home/tester");
    EXPECT_EQ(render("{{ 'a/~'|expanduser }}", ctx_), "a/~");
    EXPECT_EQ(render("{{ '~pathaction_no_such_user/x'|expanduser }}", ctx_),
              "~pathaction_no_such_user/x");
}

TEST_F(TemplateTest, TST_TMPL_004_Expandvars) {
    EXPECT_EQ(render("{{ '$HOME/x ${USER} $NOPE'|expandvars }}", ctx_),
              "/home/tester/x tester $NOPE");
}

TEST_F(TemplateTest, TST_TMPL_004_Realpath_ResolvesSymlinks) {
    // Arrange
    const auto real = write_file("real.txt", "data");
    const auto link = test_dir_ / "link.txt";
    std::filesystem::create_symlink(real, link);
    ctx_.cwd = test_dir_;

    // Act
    const std::string resolved = render("{{ 'link.txt'|realpath }}", ctx_);

    // Assert
    EXPECT_EQ(resolved,
              platform::path_to_utf8(std::filesystem::canonical(real)));
}

// ==============================================================================
// TST-TMPL-005: which
// ==============================================================================

TEST_F(TemplateTest, TST_TMPL_005_Which_FindsExecutable) {
    const std::string found = render("{{ 'sh'|which }}", ctx_);
    EXPECT_EQ(std::filesystem::path(found).filename(), "sh");
    EXPECT_TRUE(platform::is_executable(found));
}

TEST_F(TemplateTest, TST_TMPL_005_Which_MissingIsCommandNotFound) {
    const auto kind = render_error("{{ 'pathaction-no-such-command'|which }}");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, ErrorKind::CommandNotFound);
    EXPECT_TRUE(is_template_failure(*kind));
}

TEST_F(TemplateTest, TST_TMPL_005_Which_UsesPathFromContext) {
    ctx_.env["PATH"] = "/nonexistent";
    EXPECT_EQ(render_error("{{ 'sh'|which }}"), ErrorKind::CommandNotFound);
}

// ==============================================================================
// TST-TMPL-006: shebang
// ==============================================================================

TEST_F(TemplateTest, TST_TMPL_006_Shebang_Variants) {
    // Arrange
    write_file("script.py", "#!/usr/bin/env python3 -u\nprint('hello')\n");
    ctx_.cwd = test_dir_;

    // Act & Assert
    EXPECT_EQ(render("{{ 'script.py'|shebang }}", ctx_), "/usr/bin/env python3 -u");
    EXPECT_EQ(render("{{ 'script.py'|shebang_list }}", ctx_),
              "['/usr/bin/env', 'python3', '-u']");
    EXPECT_EQ(render("{{ 'script.py'|shebang_quote }}", ctx_), "/usr/bin/env python3 -u");
}

TEST_F(TemplateTest, TST_TMPL_006_Shebang_QuoteEscapesArguments) {
    write_file("odd.sh", "#!/bin/my shell 'a b'\n");
    ctx_.cwd = test_dir_;

    EXPECT_EQ(render("{{ 'odd.sh'|shebang_quote }}", ctx_), "/bin/my shell 'a b'");
}

TEST_F(TemplateTest, TST_TMPL_006_Shebang_MissingIsTemplateError) {
    // Arrange
    const auto plain = write_file("plain.txt", "no shebang here\n");

    // Act & Assert
    EXPECT_THROW(read_shebang(plain), Exception);
    EXPECT_THROW(read_shebang(test_dir_ / "missing.py"), Exception);
    ctx_.cwd = test_dir_;
    EXPECT_EQ(render_error("{{ 'plain.txt'|shebang }}"), ErrorKind::Template);
}

// ==============================================================================
// TST-TMPL-007: ошибки шаблонов
// ==============================================================================

TEST_F(TemplateTest, TST_TMPL_007_UndefinedVariable) {
    EXPECT_EQ(render_error("{{ filename }}"), ErrorKind::Template);
}

TEST_F(TemplateTest, TST_TMPL_007_UnknownFilter) {
    EXPECT_EQ(render_error("{{ file|upper }}"), ErrorKind::Template);
}

TEST_F(TemplateTest, TST_TMPL_007_MissingEnvKey) {
    EXPECT_EQ(render_error("{{ env.PATHACTION_NO_SUCH_VARIABLE }}"), ErrorKind::Template);
}

TEST_F(TemplateTest, TST_TMPL_007_IndexOutOfRange) {
    EXPECT_EQ(render_error("{{ ('a b'|splitcmd)[2] }}"), ErrorKind::Template);
}

TEST_F(TemplateTest, TST_TMPL_007_StatementsNotSupported) {
    EXPECT_EQ(render_error("{% if file %}x{% endif %}"), ErrorKind::Template);
}

TEST_F(TemplateTest, TST_TMPL_007_SyntaxErrors) {
    EXPECT_EQ(render_error("{{ file "), ErrorKind::Template);
    EXPECT_EQ(render_error("{{ }}"), ErrorKind::Template);
    EXPECT_EQ(render_error("{{ 'abc }}"), ErrorKind::Template);
    EXPECT_EQ(render_error("{{ file file }}"), ErrorKind::Template);
}

TEST_F(TemplateTest, TST_TMPL_007_WrongFilterInput) {
    EXPECT_EQ(render_error("{{ file|joincmd }}"), ErrorKind::Template);
    EXPECT_EQ(render_error("{{ file|basename('x') }}"), ErrorKind::Template);
    EXPECT_EQ(render_error("{{ 'a \"b'|splitcmd }}"), ErrorKind::Template);
}

// ==============================================================================
// TST-TMPL-008: контекст из ExecutionContext
// ==============================================================================

TEST_F(TemplateTest, TST_TMPL_008_BuildFromExecutionContext) {
    // Arrange
    ExecutionContext exec_ctx;
    exec_ctx.target = "/src/main.py";
    exec_ctx.cwd = "/src";
    exec_ctx.env = {{"HOME", "/root"}};

    // Act
    const Context built = build(exec_ctx);
    const Context moved = with_cwd(built, "/other");

    // Assert
    EXPECT_EQ(built.file, "/src/main.py");
    EXPECT_EQ(built.cwd, std::filesystem::path("/src"));
    EXPECT_EQ(built.pathsep, "/");
    EXPECT_EQ(moved.cwd, std::filesystem::path("/other"));
    EXPECT_EQ(moved.file, built.file);
}

// ==============================================================================
// TST-TMPL-009: идемпотентность
// ==============================================================================

TEST_F(TemplateTest, TST_TMPL_009_RenderingIsIdempotent) {
    const std::string source = "{{ ['python3', file]|joincmd }} {{ env.HOME }} {{ 'sh'|which }}";
    EXPECT_EQ(render(source, ctx_), render(source, ctx_));
}

}  // namespace pathaction::tmpl::test
