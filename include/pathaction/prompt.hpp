// ==============================================================================
// pathaction/prompt.hpp - Вопросы пользователю в терминале
// ==============================================================================
//
// Назначение:
// - ask_question: вопрос с фиксированным набором ответов (и опциональным timeout)
// - TerminalConfirmer: exec::Confirmer для долгих команд
//
// Ответ читается напрямую из файлового дескриптора (по умолчанию stdin),
// чтобы timeout работал через poll() и тесты могли подставить pipe.
//
// ==============================================================================

#ifndef PATHACTION_PROMPT_HPP
#define PATHACTION_PROMPT_HPP

#include "pathaction/process.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pathaction::output {
class Writer;
}

namespace pathaction::cli {

/// Прочитать одну строку из fd (без '\n').
/// @return nullopt при EOF, timeout или прерывании (SIGINT)
std::optional<std::string> read_answer(int fd, std::optional<double> timeout);

/// Задавать вопрос, пока ответ не окажется среди answers.
/// Ответ сравнивается после обрезки пробелов.
/// @return nullopt при EOF, timeout или прерывании
std::optional<std::string> ask_question(output::Writer& writer, std::string_view question,
                                        const std::vector<std::string>& answers,
                                        std::optional<double> timeout = std::nullopt,
                                        int fd = 0);

/// Подтверждение продолжения долгой команды через терминал
class TerminalConfirmer : public exec::Confirmer {
public:
    explicit TerminalConfirmer(output::Writer& writer, int fd = 0) : writer_(writer), fd_(fd) {}

    /// "y" - ждать дальше, "n" - остановить. Без ответа (EOF) команда продолжает работать.
    bool confirm_continue(const exec::RenderedCommand& command,
                          std::chrono::steady_clock::duration elapsed) override;

private:
    output::Writer& writer_;
    int fd_;
};

}  // namespace pathaction::cli

#endif  // PATHACTION_PROMPT_HPP
