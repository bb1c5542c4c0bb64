// ==============================================================================
// pathaction/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - TTY detection
// - Окружение процесса, домашняя директория, login shell пользователя
// - Поиск исполняемых файлов (which)
// - Флаг прерывания (SIGINT/SIGTERM)
//
// Вся POSIX-специфика (unistd, pwd, signal) изолирована здесь и в exec/process.cpp.
//
// ==============================================================================

#ifndef PATHACTION_PLATFORM_HPP
#define PATHACTION_PLATFORM_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace pathaction::platform {

/// Снимок окружения процесса (имя -> значение)
using Environment = std::map<std::string, std::string>;

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str);

std::string path_to_utf8(const std::filesystem::path& p);

/// Разделитель компонентов пути
constexpr char PATH_SEPARATOR = '/';

/// Разделитель элементов в $PATH
constexpr char PATH_LIST_SEPARATOR = ':';

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdin();
bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Окружение и пользователь
// ----------------------------------------------------------------------------

/// Снимок текущего окружения (environ)
Environment environment();

/// Домашняя директория: $HOME из env, иначе запись passwd текущего пользователя
std::filesystem::path home_dir(const Environment& env);

/// Домашняя директория пользователя по имени (passwd)
std::optional<std::filesystem::path> user_home(std::string_view user);

/// Login shell текущего пользователя (passwd), "/bin/sh" если недоступен
std::string login_shell();

/// Обычный файл с правом на исполнение
bool is_executable(const std::filesystem::path& p);

/// Найти исполняемый файл
///
/// - абсолютное имя: проверяется как есть
/// - имя с '/' ("./x", "bin/x"): относительно cwd
/// - иначе: поиск по директориям path_env (формат $PATH),
///   относительные записи $PATH берутся от cwd
///
/// @return nullopt если файл не найден
std::optional<std::filesystem::path> which(std::string_view name, std::string_view path_env,
                                           const std::filesystem::path& cwd);

/// Заменить начало пути на "~", если путь лежит в home
std::string home_to_tilde(const std::filesystem::path& p, const std::filesystem::path& home);

// ----------------------------------------------------------------------------
// Прерывание (SIGINT/SIGTERM)
// ----------------------------------------------------------------------------

/// Установить обработчики SIGINT/SIGTERM, выставляющие флаг прерывания
void install_interrupt_handlers();

/// Был ли получен SIGINT/SIGTERM
bool interrupt_requested();

/// Сбросить флаг прерывания
void clear_interrupt();

/// Выставить флаг прерывания вручную (используется тестами)
void request_interrupt();

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

/// Создать пустой временный файл в $TMPDIR (или /tmp)
/// @throws std::runtime_error при ошибке mkstemp
std::filesystem::path make_temp_file(std::string_view prefix);

}  // namespace pathaction::platform

#endif  // PATHACTION_PLATFORM_HPP
