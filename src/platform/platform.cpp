// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Платформенная специфика (unistd, pwd, signal) изолирована здесь.
//
// ==============================================================================

#include "pathaction/platform.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <pwd.h>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace pathaction::platform {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt_signal(int /*signo*/) {
    g_interrupted = 1;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

}  // namespace

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // Unix: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.string();
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdin() {
    return isatty(fileno(stdin)) != 0;
}

bool is_tty_stdout() {
    return isatty(fileno(stdout)) != 0;
}

bool is_tty_stderr() {
    return isatty(fileno(stderr)) != 0;
}

// ----------------------------------------------------------------------------
// Окружение и пользователь
// ----------------------------------------------------------------------------

Environment environment() {
    Environment env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        env.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
    }
    return env;
}

std::filesystem::path home_dir(const Environment& env) {
    auto it = env.find("HOME");
    if (it != env.end() && !it->second.empty()) {
        return std::filesystem::path(it->second);
    }

    const passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr) {
        return std::filesystem::path(pw->pw_dir);
    }
    return std::filesystem::path("/");
}

std::optional<std::filesystem::path> user_home(std::string_view user) {
    const std::string name(user);
    const passwd* pw = getpwnam(name.c_str());
    if (pw == nullptr || pw->pw_dir == nullptr) {
        return std::nullopt;
    }
    return std::filesystem::path(pw->pw_dir);
}

std::string login_shell() {
    const passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_shell != nullptr && pw->pw_shell[0] != '\0' &&
        is_executable(pw->pw_shell)) {
        return pw->pw_shell;
    }
    return "/bin/sh";
}

bool is_executable(const std::filesystem::path& p) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p, ec) || ec) {
        return false;
    }
    return access(p.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> which(std::string_view name, std::string_view path_env,
                                           const std::filesystem::path& cwd) {
    if (name.empty()) {
        return std::nullopt;
    }

    std::filesystem::path candidate(name);

    if (candidate.is_absolute()) {
        if (is_executable(candidate)) {
            return candidate;
        }
        return std::nullopt;
    }

    // Имя с '/' ("./x", "../x", "bin/x") - от рабочей директории команды, без $PATH
    if (name.find(PATH_SEPARATOR) != std::string_view::npos) {
        candidate = cwd / candidate;
        if (is_executable(candidate)) {
            return candidate.lexically_normal();
        }
        return std::nullopt;
    }

    std::size_t pos = 0;
    while (pos <= path_env.size()) {
        auto next = path_env.find(PATH_LIST_SEPARATOR, pos);
        if (next == std::string_view::npos) {
            next = path_env.size();
        }
        std::string_view dir = path_env.substr(pos, next - pos);
        pos = next + 1;

        if (dir.empty()) {
            continue;
        }
        // Относительная запись $PATH - от рабочей директории команды, как у execve после chdir
        std::filesystem::path full = std::filesystem::path(dir) / candidate;
        if (full.is_relative()) {
            full = (cwd / full).lexically_normal();
        }
        if (is_executable(full)) {
            return full;
        }
    }

    return std::nullopt;
}

std::string home_to_tilde(const std::filesystem::path& p, const std::filesystem::path& home) {
    std::string path_str = path_to_utf8(p);
    std::string home_str = path_to_utf8(home);
    while (home_str.size() > 1 && home_str.back() == PATH_SEPARATOR) {
        home_str.pop_back();
    }
    if (home_str.empty() || home_str == "/") {
        return path_str;
    }
    if (path_str == home_str) {
        return "~";
    }
    if (starts_with(path_str, home_str + PATH_SEPARATOR)) {
        return "~" + path_str.substr(home_str.size());
    }
    return path_str;
}

// ----------------------------------------------------------------------------
// Прерывание
// ----------------------------------------------------------------------------

void install_interrupt_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_interrupt_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

bool interrupt_requested() {
    return g_interrupted != 0;
}

void clear_interrupt() {
    g_interrupted = 0;
}

void request_interrupt() {
    g_interrupted = 1;
}

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

std::filesystem::path make_temp_file(std::string_view prefix) {
    std::string temp_dir = "/tmp";
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir != nullptr && tmpdir[0] != '\0') {
        temp_dir = tmpdir;
    }

    std::string tmpl = temp_dir + "/" + std::string(prefix) + "_XXXXXX";
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    int fd = mkstemp(tmpl_buf.data());
    if (fd == -1) {
        throw std::runtime_error("Failed to create temp file");
    }
    close(fd);

    return std::filesystem::path(tmpl_buf.data());
}

}  // namespace pathaction::platform
