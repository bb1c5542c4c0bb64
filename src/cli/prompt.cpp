// ==============================================================================
// prompt.cpp - Вопросы пользователю в терминале
// ==============================================================================

#include "pathaction/prompt.hpp"

#include "pathaction/output.hpp"
#include "pathaction/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <poll.h>
#include <unistd.h>

namespace pathaction::cli {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

}  // anonymous namespace

std::optional<std::string> read_answer(int fd, std::optional<double> timeout) {
    using Clock = std::chrono::steady_clock;
    const auto deadline =
        timeout ? Clock::now() + std::chrono::duration_cast<Clock::duration>(
                                     std::chrono::duration<double>(*timeout))
                : Clock::time_point::max();

    std::string line;
    for (;;) {
        if (platform::interrupt_requested()) {
            return std::nullopt;
        }

        // Короткий интервал poll, чтобы вовремя заметить SIGINT
        int wait_ms = 100;
        if (timeout) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now());
            if (left.count() <= 0) {
                return std::nullopt;
            }
            wait_ms = static_cast<int>(std::min<long long>(left.count(), wait_ms));
        }

        pollfd pfd{fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::nullopt;
        }
        if (ready == 0) {
            continue;
        }

        char c = 0;
        const ssize_t n = ::read(fd, &c, 1);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            // EOF: незавершённая строка тоже считается ответом
            if (line.empty()) {
                return std::nullopt;
            }
            return line;
        }
        if (c == '\n') {
            return line;
        }
        line.push_back(c);
    }
}

std::optional<std::string> ask_question(output::Writer& writer, std::string_view question,
                                        const std::vector<std::string>& answers,
                                        std::optional<double> timeout, int fd) {
    for (;;) {
        writer.prompt(question);
        const auto answer = read_answer(fd, timeout);
        if (!answer) {
            writer.write_line(output::Stream::Stdout, "");
            return std::nullopt;
        }
        const std::string value = trim(*answer);
        if (std::find(answers.begin(), answers.end(), value) != answers.end()) {
            return value;
        }
    }
}

bool TerminalConfirmer::confirm_continue(const exec::RenderedCommand& command,
                                         std::chrono::steady_clock::duration elapsed) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    writer_.warn("the command is still running after " + std::to_string(secs) +
                 " seconds: " + output::escape_newlines(command.display()));

    const auto answer =
        ask_question(writer_, "Do you want to keep waiting? [y,n] ", {"y", "n"}, std::nullopt, fd_);
    return !answer || *answer == "y";
}

}  // namespace pathaction::cli
