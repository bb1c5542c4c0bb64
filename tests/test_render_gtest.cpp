// ==============================================================================
// test_render_gtest.cpp - Тесты рендеринга команд правила (GoogleTest)
// ==============================================================================
//
// Тесты: TST-RENDER-001..TST-RENDER-005
//
// ==============================================================================

#include "pathaction/render.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace pathaction::exec::test {

using Words = std::vector<std::string>;

// ==============================================================================
// Test Fixture: контекст запуска и пустое правило
// ==============================================================================

class RenderTest : public ::testing::Test {
protected:
    ExecutionContext ctx_;
    rule::Rule rule_;

    void SetUp() override {
        ctx_.target = "/tmp/a b.sh";
        ctx_.cwd = "/work";
        ctx_.env = {{"HOME", "/home/tester"}, {"PATH", "/bin:/usr/bin"}};

        rule_.path_match = {"*"};
        rule_.source = "/proj/.pathaction.yaml";
    }
};

// ==============================================================================
// TST-RENDER-001: shell-режим
// ==============================================================================

TEST_F(RenderTest, TST_RENDER_001_ShellLineQuoted) {
    // Arrange
    rule_.shell = true;
    rule_.commands = {std::string("bash {{ file|quote }}")};

    // Act
    const RenderResult result = render(rule_, ctx_);

    // Assert
    ASSERT_TRUE(result) << result.error.format();
    ASSERT_EQ(result.rendered.commands.size(), 1u);
    const RenderedCommand& cmd = result.rendered.commands[0];
    EXPECT_TRUE(cmd.shell);
    EXPECT_EQ(cmd.line, "bash '/tmp/a b.sh'");
    EXPECT_TRUE(cmd.argv.empty());
    EXPECT_EQ(cmd.display(), "bash '/tmp/a b.sh'");
    EXPECT_TRUE(result.rendered.shell);
}

TEST_F(RenderTest, TST_RENDER_001_ShellListIsJoined) {
    rule_.shell = true;
    rule_.commands = {Words{"echo", "{{ file }}"}};

    const RenderResult result = render(rule_, ctx_);

    ASSERT_TRUE(result) << result.error.format();
    const RenderedCommand& cmd = result.rendered.commands[0];
    EXPECT_EQ(cmd.argv, (Words{"echo", "/tmp/a b.sh"}));
    EXPECT_EQ(cmd.line, "echo '/tmp/a b.sh'");
}

// ==============================================================================
// TST-RENDER-002: argv-режим
// ==============================================================================

TEST_F(RenderTest, TST_RENDER_002_ListTokensRenderedSeparately) {
    // Arrange
    ctx_.target = "/tmp/x.py";
    rule_.commands = {Words{"python", "{{ file }}"}};

    // Act
    const RenderResult result = render(rule_, ctx_);

    // Assert
    ASSERT_TRUE(result) << result.error.format();
    const RenderedCommand& cmd = result.rendered.commands[0];
    EXPECT_FALSE(cmd.shell);
    EXPECT_EQ(cmd.argv, (Words{"python", "/tmp/x.py"}));
    EXPECT_EQ(cmd.display(), "python /tmp/x.py");
}

TEST_F(RenderTest, TST_RENDER_002_StringIsSplit) {
    // Пробел в пути без quote разбивает аргумент, с quote - нет
    rule_.commands = {std::string("sh {{ file }}"), std::string("sh {{ file|quote }}")};

    const RenderResult result = render(rule_, ctx_);

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.rendered.commands[0].argv, (Words{"sh", "/tmp/a", "b.sh"}));
    EXPECT_EQ(result.rendered.commands[1].argv, (Words{"sh", "/tmp/a b.sh"}));
}

TEST_F(RenderTest, TST_RENDER_002_EmptyCommandIsTemplateError) {
    rule_.commands = {std::string("true"), std::string("{{ '' }}")};

    const RenderResult result = render(rule_, ctx_);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::Template);
    EXPECT_EQ(result.error.path, "/proj/.pathaction.yaml");
}

TEST_F(RenderTest, TST_RENDER_002_UnbalancedQuotesIsTemplateError) {
    rule_.commands = {std::string("echo \"{{ file }}")};

    const RenderResult result = render(rule_, ctx_);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::Template);
}

// ==============================================================================
// TST-RENDER-003: рабочая директория
// ==============================================================================

TEST_F(RenderTest, TST_RENDER_003_DefaultCwdIsInvocationDirectory) {
    rule_.commands = {std::string("pwd")};

    const RenderResult result = render(rule_, ctx_);

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.rendered.cwd, std::filesystem::path("/work"));
}

TEST_F(RenderTest, TST_RENDER_003_CwdTemplate) {
    // Arrange
    rule_.cwd = "{{ file|dirname }}";
    rule_.commands = {Words{"echo", "{{ cwd }}"}};

    // Act
    const RenderResult result = render(rule_, ctx_);

    // Assert: команды видят итоговую рабочую директорию
    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.rendered.cwd, std::filesystem::path("/tmp"));
    EXPECT_EQ(result.rendered.commands[0].argv, (Words{"echo", "/tmp"}));
}

TEST_F(RenderTest, TST_RENDER_003_RelativeCwdFromInvocationDirectory) {
    rule_.cwd = "{{ cwd }}/build/../out";
    rule_.commands = {std::string("pwd")};

    const RenderResult result = render(rule_, ctx_);

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.rendered.cwd, std::filesystem::path("/work/out"));

    rule_.cwd = "sub";
    EXPECT_EQ(render(rule_, ctx_).rendered.cwd, std::filesystem::path("/work/sub"));
}

// ==============================================================================
// TST-RENDER-004: перенаправление вывода
// ==============================================================================

TEST_F(RenderTest, TST_RENDER_004_RedirectPaths) {
    // Arrange
    rule_.cwd = "/tmp";
    rule_.commands = {std::string("true")};
    rule_.stdout_path = "{{ file|basename }}.log";
    rule_.stderr_path = "/var/log/{{ 'err' }}.log";

    // Act
    const RenderResult result = render(rule_, ctx_);

    // Assert: относительный путь берётся от рабочей директории правила
    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.rendered.stdout_path, std::filesystem::path("/tmp/a b.sh.log"));
    EXPECT_EQ(result.rendered.stderr_path, std::filesystem::path("/var/log/err.log"));
}

TEST_F(RenderTest, TST_RENDER_004_NoRedirectByDefault) {
    rule_.commands = {std::string("true")};

    const RenderResult result = render(rule_, ctx_);

    ASSERT_TRUE(result);
    EXPECT_FALSE(result.rendered.stdout_path.has_value());
    EXPECT_FALSE(result.rendered.stderr_path.has_value());
}

// ==============================================================================
// TST-RENDER-005: ошибки и повторяемость
// ==============================================================================

TEST_F(RenderTest, TST_RENDER_005_ErrorInAnyCommandFailsRule) {
    rule_.commands = {std::string("true"), std::string("{{ nope }}")};

    const RenderResult result = render(rule_, ctx_);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::Template);
    EXPECT_TRUE(result.rendered.commands.empty());
}

TEST_F(RenderTest, TST_RENDER_005_WhichFailureIsCommandNotFound) {
    rule_.commands = {Words{"{{ 'pathaction-no-such-command'|which }}", "{{ file }}"}};

    const RenderResult result = render(rule_, ctx_);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::CommandNotFound);
    EXPECT_TRUE(is_template_failure(result.error.kind));
}

TEST_F(RenderTest, TST_RENDER_005_CwdErrorFailsRule) {
    rule_.cwd = "{{ env.PATHACTION_NO_SUCH_VARIABLE }}";
    rule_.commands = {std::string("true")};

    EXPECT_FALSE(render(rule_, ctx_));
}

TEST_F(RenderTest, TST_RENDER_005_SameInputSameOutput) {
    // Arrange
    rule_.cwd = "{{ file|dirname }}";
    rule_.commands = {std::string("sh {{ file|quote }}"), Words{"echo", "{{ env.HOME }}"}};
    rule_.stdout_path = "out.log";

    // Act
    const RenderResult first = render(rule_, ctx_);
    const RenderResult second = render(rule_, ctx_);

    // Assert
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.rendered.commands, second.rendered.commands);
    EXPECT_EQ(first.rendered.cwd, second.rendered.cwd);
    EXPECT_EQ(first.rendered.stdout_path, second.rendered.stdout_path);
}

}  // namespace pathaction::exec::test
