// ==============================================================================
// process.cpp - Последовательный запуск команд
// ==============================================================================
//
// fork/execve + опрос waitpid(WNOHANG). Один дочерний процесс за раз;
// timeout, подтверждение и прерывание проверяются между опросами.
//
// ==============================================================================

#include "pathaction/process.hpp"

#include "pathaction/output.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace pathaction::exec {

namespace {

using Clock = std::chrono::steady_clock;

/// Секунды -> Clock::duration; значения вне диапазона насыщаются до max()
Clock::duration seconds(double s) {
    const std::chrono::duration<double> limit = Clock::duration::max();
    if (!(s < limit.count())) {
        return Clock::duration::max();
    }
    if (s <= 0) {
        return Clock::duration::zero();
    }
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(s));
}

std::string format_seconds(double s) {
    std::string text = std::to_string(s);
    // "60.000000" -> "60", "0.500000" -> "0.5"
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

// ----------------------------------------------------------------------------
// Перенаправление stdout/stderr (общее для всех команд правила)
// ----------------------------------------------------------------------------

class Redirect {
public:
    Redirect() = default;
    ~Redirect() { close_all(); }

    Redirect(const Redirect&) = delete;
    Redirect& operator=(const Redirect&) = delete;

    void open(const RunOptions& options) {
        if (options.stdout_path) {
            out_ = open_file(*options.stdout_path);
        }
        if (options.stderr_path) {
            if (options.stdout_path && same_file(*options.stdout_path, *options.stderr_path)) {
                err_ = out_;
            } else {
                err_ = open_file(*options.stderr_path);
            }
        }
    }

    int out() const { return out_; }
    int err() const { return err_; }

private:
    static int open_file(const std::filesystem::path& path) {
        const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw Exception(ErrorKind::Execution,
                            std::string("cannot open the output file: ") + std::strerror(errno),
                            platform::path_to_utf8(path));
        }
        return fd;
    }

    static bool same_file(const std::filesystem::path& a, const std::filesystem::path& b) {
        std::error_code ec;
        if (std::filesystem::exists(a, ec) && std::filesystem::equivalent(a, b, ec) && !ec) {
            return true;
        }
        const auto ca = std::filesystem::weakly_canonical(a, ec);
        const auto cb = std::filesystem::weakly_canonical(b, ec);
        return ca == cb;
    }

    void close_all() {
        if (err_ >= 0 && err_ != out_) {
            ::close(err_);
        }
        if (out_ >= 0) {
            ::close(out_);
        }
        out_ = -1;
        err_ = -1;
    }

    int out_ = -1;
    int err_ = -1;
};

// ----------------------------------------------------------------------------
// Дочерний процесс
// ----------------------------------------------------------------------------

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

void kill_and_reap(pid_t pid) {
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

std::vector<char*> c_strings(std::vector<std::string>& items) {
    std::vector<char*> result;
    result.reserve(items.size() + 1);
    for (auto& item : items) {
        result.push_back(item.data());
    }
    result.push_back(nullptr);
    return result;
}

std::vector<std::string> env_strings(const platform::Environment& env) {
    std::vector<std::string> result;
    result.reserve(env.size());
    for (const auto& [key, value] : env) {
        result.push_back(key + "=" + value);
    }
    return result;
}

CommandResult run_one(const RenderedCommand& command, std::size_t index,
                      const RunOptions& options, const Redirect& redirect,
                      std::optional<Error>& error) {
    CommandResult result;
    result.display = command.display();

    auto notify = [&](State state) {
        result.state = state;
        if (options.on_state) {
            options.on_state(index, state);
        }
    };

    // argv процесса
    std::vector<std::string> argv;
    if (command.shell) {
        argv = {options.shell_path, "-c", command.line};
    } else {
        argv = command.argv;
    }
    if (argv.empty()) {
        result.exit_code = 1;
        error = Error{ErrorKind::Template, "the command is empty", {}};
        notify(State::Failed);
        return result;
    }

    // argv[0] (или интерпретатор) ищется в $PATH контекста
    std::string path_env;
    if (auto it = options.env.find("PATH"); it != options.env.end()) {
        path_env = it->second;
    }
    const auto found = platform::which(argv.front(), path_env, options.cwd);
    if (!found) {
        result.exit_code = EXIT_COMMAND_NOT_FOUND;
        error = Error{ErrorKind::CommandNotFound, "command not found: " + argv.front(), {}};
        notify(State::Failed);
        return result;
    }
    argv.front() = platform::path_to_utf8(*found);

    std::error_code ec;
    if (!std::filesystem::is_directory(options.cwd, ec)) {
        result.exit_code = 1;
        error = Error{ErrorKind::Execution, "the working directory does not exist",
                      platform::path_to_utf8(options.cwd)};
        notify(State::Failed);
        return result;
    }

    result.argv = argv;
    if (options.writer != nullptr) {
        if (options.timeout) {
            options.writer->labeled("[TIMEOUT] ", format_seconds(*options.timeout) + " seconds");
        }
        options.writer->labeled("[RUN] ", output::escape_newlines(result.display));
        options.writer->flush();
    }

    // Всё для execve готовится до fork
    std::vector<std::string> env = env_strings(options.env);
    std::vector<char*> c_argv = c_strings(argv);
    std::vector<char*> c_env = c_strings(env);
    const std::string cwd = platform::path_to_utf8(options.cwd);

    const auto start = Clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        result.exit_code = 1;
        error = Error{ErrorKind::Execution, std::string("fork() failed: ") + std::strerror(errno),
                      {}};
        notify(State::Failed);
        return result;
    }

    if (pid == 0) {
        // Дочерний процесс: только async-signal-safe вызовы
        if (chdir(cwd.c_str()) != 0) {
            _exit(EXIT_COMMAND_NOT_FOUND);
        }
        if (redirect.out() >= 0) {
            dup2(redirect.out(), STDOUT_FILENO);
        }
        if (redirect.err() >= 0) {
            dup2(redirect.err(), STDERR_FILENO);
        }
        execve(c_argv[0], c_argv.data(), c_env.data());
        _exit(EXIT_COMMAND_NOT_FOUND);
    }

    notify(State::Running);

    auto window_start = start;
    for (;;) {
        int status = 0;
        const pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            result.exit_code = decode_status(status);
            // Ctrl-C доходит и до дочернего процесса: это прерывание, а не обычный выход
            if (platform::interrupt_requested()) {
                result.interrupted = true;
                result.exit_code = EXIT_INTERRUPTED;
                notify(State::Interrupted);
            } else {
                notify(State::Completed);
            }
            break;
        }
        if (r < 0 && errno != EINTR) {
            result.exit_code = 1;
            error = Error{ErrorKind::Execution,
                          std::string("waitpid() failed: ") + std::strerror(errno), {}};
            notify(State::Failed);
            break;
        }

        const auto now = Clock::now();

        if (platform::interrupt_requested()) {
            kill_and_reap(pid);
            result.interrupted = true;
            result.exit_code = EXIT_INTERRUPTED;
            notify(State::Interrupted);
            break;
        }

        if (options.timeout && now - start >= seconds(*options.timeout)) {
            kill_and_reap(pid);
            result.timed_out = true;
            result.exit_code = EXIT_TIMED_OUT;
            error = Error{ErrorKind::Execution,
                          "the command timed out after " + format_seconds(*options.timeout) +
                              " seconds",
                          {}};
            notify(State::TimedOut);
            break;
        }

        if (options.confirm_after && options.confirmer != nullptr &&
            now - window_start >= seconds(*options.confirm_after)) {
            notify(State::AwaitingConfirmation);
            if (options.confirmer->confirm_continue(command, now - start)) {
                notify(State::Resumed);
                window_start = Clock::now();
                notify(State::Running);
                continue;
            }

            // Команда могла завершиться, пока ждали ответа
            if (waitpid(pid, &status, WNOHANG) == pid) {
                result.exit_code = decode_status(status);
                notify(State::Completed);
                break;
            }
            kill_and_reap(pid);
            result.declined = true;
            result.exit_code = 1;
            error = Error{ErrorKind::Execution, "the command was stopped by the user", {}};
            notify(State::Declined);
            notify(State::Failed);
            break;
        }

        std::this_thread::sleep_for(options.poll_interval);
    }

    result.duration = Clock::now() - start;
    return result;
}

}  // namespace

std::string to_string(State state) {
    switch (state) {
    case State::Running:
        return "running";
    case State::Completed:
        return "completed";
    case State::TimedOut:
        return "timed out";
    case State::AwaitingConfirmation:
        return "awaiting confirmation";
    case State::Resumed:
        return "resumed";
    case State::Declined:
        return "declined";
    case State::Failed:
        return "failed";
    case State::Interrupted:
        return "interrupted";
    }
    return "unknown";
}

int ExecutionResult::exit_code() const {
    if (success) {
        return 0;
    }
    if (interrupted) {
        return EXIT_INTERRUPTED;
    }
    if (first_failure_index && *first_failure_index < commands.size()) {
        const int code = commands[*first_failure_index].exit_code;
        return code != 0 ? code : 1;
    }
    return 1;
}

ExecutionResult run(const std::vector<RenderedCommand>& commands, const RunOptions& options) {
    ExecutionResult result;

    Redirect redirect;
    try {
        redirect.open(options);
    } catch (const Exception& e) {
        result.error = e.error();
        return result;
    }

    for (std::size_t i = 0; i < commands.size(); ++i) {
        std::optional<Error> error;
        CommandResult cr = run_one(commands[i], i, options, redirect, error);
        const bool ok = cr.ok();
        const int code = cr.exit_code;
        const bool interrupted = cr.interrupted;
        result.commands.push_back(std::move(cr));

        if (!ok) {
            result.first_failure_index = i;
            result.interrupted = interrupted;
            if (!error) {
                error = Error{ErrorKind::Execution,
                              interrupted ? std::string("interrupted")
                                          : "the command returned " + std::to_string(code),
                              {}};
            }
            result.error = std::move(error);
            return result;
        }
    }

    result.success = true;
    return result;
}

}  // namespace pathaction::exec
