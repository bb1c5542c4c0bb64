// ==============================================================================
// pathaction/cli.hpp - Парсинг командной строки
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// pathaction [OPTIONS] <PATH>...
//
// ==============================================================================

#ifndef PATHACTION_CLI_HPP
#define PATHACTION_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pathaction::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Основной режим: найти правило для каждого пути и выполнить его
struct RunCommand {
    std::vector<std::filesystem::path> paths;  // positional: <PATH>...
    std::optional<std::string> tag;            // -t, --tag
    bool confirm_before = false;               // -b, --confirm-before
    bool confirm_after = false;                // -a, --confirm-after
    bool list = false;                         // -l, --list
    bool allow_dir = false;                    // -d, --allow-dir
    bool dry_run = false;                      // -n, --dry-run
};

/// help - показать справку
struct HelpCommand {};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<RunCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

/// Код завершения при ошибке разбора аргументов
constexpr int EXIT_USAGE = 2;

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// То же для готового списка аргументов (без имени программы)
ParseResult parse(const std::vector<std::string>& args);

/// Текст --help
std::string render_help();

/// Текст --version
std::string render_version();

/// Сообщение об ошибке разбора: error + usage + подсказка
std::string render_usage_error(const std::string& error_msg);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* PROGRAM_NAME = "pathaction";

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Execute the command defined for a file by rule-set files";

}  // namespace pathaction::cli

#endif  // PATHACTION_CLI_HPP
