// ==============================================================================
// pathaction/process.hpp - Последовательный запуск команд
// ==============================================================================
//
// Назначение:
// - Запуск команд строго по очереди (fork/execve), один дочерний процесс за раз
// - shell-режим: {shell, "-c", line}; иначе argv[0] ищется в $PATH контекста
// - timeout: SIGKILL и запись как timeout
// - Подтверждение долгой команды через Confirmer
// - Остановка на первой неуспешной команде
//
// Состояния команды:
//
//   Running -> Completed
//   Running -> TimedOut
//   Running -> AwaitingConfirmation -> Resumed -> Running
//                                   -> Declined -> Failed
//   Running -> Interrupted (SIGINT/SIGTERM)
//
// ==============================================================================

#ifndef PATHACTION_PROCESS_HPP
#define PATHACTION_PROCESS_HPP

#include "pathaction/error.hpp"
#include "pathaction/platform.hpp"
#include "pathaction/render.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pathaction::output {
class Writer;
}

namespace pathaction::exec {

// ----------------------------------------------------------------------------
// Коды завершения
// ----------------------------------------------------------------------------

/// Программа не найдена (как в sh)
constexpr int EXIT_COMMAND_NOT_FOUND = 127;

/// Команда прервана по timeout (как в timeout(1))
constexpr int EXIT_TIMED_OUT = 124;

/// Прервано SIGINT
constexpr int EXIT_INTERRUPTED = 130;

// ----------------------------------------------------------------------------
// Состояния
// ----------------------------------------------------------------------------

enum class State {
    Running,
    Completed,
    TimedOut,
    AwaitingConfirmation,
    Resumed,
    Declined,
    Failed,
    Interrupted
};

std::string to_string(State state);

// ----------------------------------------------------------------------------
// Подтверждение
// ----------------------------------------------------------------------------

/// Внешний участник, который решает, ждать ли дальше долгую команду
class Confirmer {
public:
    virtual ~Confirmer() = default;

    /// Команда работает дольше confirm_after_timeout.
    /// @return true - ждать дальше, false - остановить команду
    virtual bool confirm_continue(const RenderedCommand& command,
                                  std::chrono::steady_clock::duration elapsed) = 0;
};

// ----------------------------------------------------------------------------
// Параметры и результаты
// ----------------------------------------------------------------------------

struct RunOptions {
    std::filesystem::path cwd;
    std::string shell_path = "/bin/sh";
    std::optional<double> timeout;        // секунды
    std::optional<double> confirm_after;  // секунды
    std::optional<std::filesystem::path> stdout_path;
    std::optional<std::filesystem::path> stderr_path;
    platform::Environment env;

    Confirmer* confirmer = nullptr;    // nullptr - без подтверждений
    output::Writer* writer = nullptr;  // nullptr - без вывода "[RUN] ..."

    /// Наблюдатель переходов состояний (для отладки и тестов)
    std::function<void(std::size_t index, State state)> on_state;

    /// Интервал опроса дочернего процесса
    std::chrono::milliseconds poll_interval{10};
};

/// Результат одной команды
struct CommandResult {
    std::string display;            // команда для вывода
    std::vector<std::string> argv;  // фактический argv процесса (пусто, если не запускался)
    int exit_code = 0;
    std::chrono::steady_clock::duration duration{};
    bool timed_out = false;
    bool declined = false;
    bool interrupted = false;
    State state = State::Running;  // финальное состояние

    bool ok() const { return exit_code == 0 && !timed_out && !declined && !interrupted; }
};

/// Результат правила
struct ExecutionResult {
    std::vector<CommandResult> commands;
    bool success = false;
    std::optional<std::size_t> first_failure_index;
    bool interrupted = false;
    std::optional<Error> error;

    /// Код завершения для CLI: 0, код упавшей команды, 130 или 1
    int exit_code() const;
};

/// Запустить команды по очереди; команды после первой неудачной не запускаются
ExecutionResult run(const std::vector<RenderedCommand>& commands, const RunOptions& options);

}  // namespace pathaction::exec

#endif  // PATHACTION_PROCESS_HPP
