// ==============================================================================
// test_prompt_gtest.cpp - Тесты вопросов пользователю (GoogleTest)
// ==============================================================================
//
// Ответы подаются через pipe() вместо терминала.
//
// Тесты: TST-PROMPT-001..TST-PROMPT-003
//
// ==============================================================================

#include "pathaction/output.hpp"
#include "pathaction/platform.hpp"
#include "pathaction/prompt.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>

namespace pathaction::cli::test {

// ==============================================================================
// Test Fixture: pipe вместо stdin
// ==============================================================================

class PromptTest : public ::testing::Test {
protected:
    int read_fd_ = -1;
    int write_fd_ = -1;
    output::OutputConfig config_;
    std::unique_ptr<output::Writer> writer_;

    void SetUp() override {
        int fds[2];
        ASSERT_EQ(::pipe(fds), 0);
        read_fd_ = fds[0];
        write_fd_ = fds[1];

        config_.quiet = true;
        writer_ = std::make_unique<output::Writer>(config_);
        platform::clear_interrupt();
    }

    void TearDown() override {
        close_writer();
        if (read_fd_ >= 0) {
            ::close(read_fd_);
        }
        platform::clear_interrupt();
    }

    /// Записать ответ; close_after - закрыть pipe (EOF после данных)
    void feed(const std::string& text, bool close_after = true) {
        ASSERT_EQ(::write(write_fd_, text.data(), text.size()),
                  static_cast<ssize_t>(text.size()));
        if (close_after) {
            close_writer();
        }
    }

    void close_writer() {
        if (write_fd_ >= 0) {
            ::close(write_fd_);
            write_fd_ = -1;
        }
    }
};

// ==============================================================================
// TST-PROMPT-001: read_answer
// ==============================================================================

TEST_F(PromptTest, TST_PROMPT_001_ReadsOneLine) {
    feed("hello\nworld\n");

    EXPECT_EQ(read_answer(read_fd_, std::nullopt), std::string("hello"));
    EXPECT_EQ(read_answer(read_fd_, std::nullopt), std::string("world"));
    EXPECT_FALSE(read_answer(read_fd_, std::nullopt).has_value());
}

TEST_F(PromptTest, TST_PROMPT_001_PartialLineAtEof) {
    feed("abc");

    EXPECT_EQ(read_answer(read_fd_, std::nullopt), std::string("abc"));
}

TEST_F(PromptTest, TST_PROMPT_001_EofWithoutInput) {
    close_writer();

    EXPECT_FALSE(read_answer(read_fd_, std::nullopt).has_value());
}

TEST_F(PromptTest, TST_PROMPT_001_Timeout) {
    // Arrange: pipe открыт, данных нет
    const auto start = std::chrono::steady_clock::now();

    // Act
    const auto answer = read_answer(read_fd_, 0.15);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    // Assert
    EXPECT_FALSE(answer.has_value());
    EXPECT_GE(elapsed, std::chrono::milliseconds(100));
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST_F(PromptTest, TST_PROMPT_001_Interrupted) {
    platform::request_interrupt();

    EXPECT_FALSE(read_answer(read_fd_, std::nullopt).has_value());
}

// ==============================================================================
// TST-PROMPT-002: ask_question
// ==============================================================================

TEST_F(PromptTest, TST_PROMPT_002_RepeatsUntilValidAnswer) {
    // Arrange
    feed("maybe\n\n  y \n");

    // Act
    const auto answer = ask_question(*writer_, "Continue? [y,n] ", {"y", "n"}, std::nullopt,
                                     read_fd_);

    // Assert
    EXPECT_EQ(answer, std::string("y"));
}

TEST_F(PromptTest, TST_PROMPT_002_EofGivesNoAnswer) {
    feed("maybe\n");

    const auto answer = ask_question(*writer_, "Continue? [y,n] ", {"y", "n"}, std::nullopt,
                                     read_fd_);

    EXPECT_FALSE(answer.has_value());
}

TEST_F(PromptTest, TST_PROMPT_002_TimeoutGivesNoAnswer) {
    const auto answer = ask_question(*writer_, "Run again? [a,n] ", {"a", "n"}, 0.1, read_fd_);

    EXPECT_FALSE(answer.has_value());
}

// ==============================================================================
// TST-PROMPT-003: TerminalConfirmer
// ==============================================================================

TEST_F(PromptTest, TST_PROMPT_003_ConfirmerAnswers) {
    // Arrange
    exec::RenderedCommand cmd;
    cmd.argv = {"sleep", "100"};
    TerminalConfirmer confirmer(*writer_, read_fd_);
    feed("x\nn\ny\n");

    // Act & Assert
    EXPECT_FALSE(confirmer.confirm_continue(cmd, std::chrono::seconds(120)));
    EXPECT_TRUE(confirmer.confirm_continue(cmd, std::chrono::seconds(240)));
}

TEST_F(PromptTest, TST_PROMPT_003_ConfirmerKeepsWaitingWithoutAnswer) {
    exec::RenderedCommand cmd;
    cmd.shell = true;
    cmd.line = "make all";
    TerminalConfirmer confirmer(*writer_, read_fd_);
    close_writer();

    EXPECT_TRUE(confirmer.confirm_continue(cmd, std::chrono::seconds(120)));
}

}  // namespace pathaction::cli::test
