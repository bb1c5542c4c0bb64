// ==============================================================================
// pathaction/rule.hpp - Правила и rule-set файлы
// ==============================================================================
//
// Назначение:
// - Структуры данных: Rule, Options, RuleSet
// - Разбор rule-set файла (.pathaction.yaml / .pathaction.yml) через yaml-cpp
// - Каскадная загрузка от цели вверх до корня + запасной файл в ~/.config/pathaction
// - Слияние фрагментов: ближний фрагмент первым, опции по полям
// - Выбор первого подходящего правила (тег + шаблоны пути)
// - Отладочный дамп в JSON (RapidJSON)
//
// Формат файла:
//
//   options:
//     shell: /bin/bash
//     confirm_after_timeout: 120
//   actions:
//     - path_match: "*.py"
//       tags: main
//       command: ["python", "{{ file }}"]
//
// ==============================================================================

#ifndef PATHACTION_RULE_HPP
#define PATHACTION_RULE_HPP

#include "pathaction/context.hpp"
#include "pathaction/error.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace pathaction::rule {

// ============================================================================
// Константы
// ============================================================================

/// Имена rule-set файлов в порядке приоритета внутри одной директории
constexpr const char* RULESET_FILENAMES[] = {".pathaction.yaml", ".pathaction.yml"};

/// Запасной rule-set файл относительно home: ~/.config/pathaction/pathaction.yaml|yml
constexpr const char* HOME_CONFIG_DIR = ".config/pathaction";
constexpr const char* HOME_RULESET_FILENAMES[] = {"pathaction.yaml", "pathaction.yml"};

// ============================================================================
// Структуры данных
// ============================================================================

/// Одна команда: строка-шаблон или список токенов-шаблонов
using CommandSpec = std::variant<std::string, std::vector<std::string>>;

/// Правило (одна запись actions)
struct Rule {
    std::vector<std::string> path_match;
    std::vector<std::string> path_regex;
    std::vector<std::string> path_match_exclude;
    std::vector<std::string> path_regex_exclude;
    std::vector<std::string> tags;

    std::optional<bool> shell;          // nullopt - наследуется (по умолчанию false)
    std::optional<std::string> cwd;     // шаблон рабочей директории
    std::optional<double> timeout;      // секунды; nullopt - глобальный timeout
    std::string comment;
    std::vector<CommandSpec> commands;  // command или list_commands
    bool list_commands = false;         // команды заданы через list_commands

    std::optional<std::string> stdout_path;  // шаблон файла для stdout
    std::optional<std::string> stderr_path;  // шаблон файла для stderr

    std::filesystem::path source;  // rule-set файл, объявивший правило
};

/// Опции rule-set; неустановленные поля наследуются от дальних фрагментов
struct Options {
    std::optional<std::string> shell;             // путь к интерпретатору (шаблон до загрузки)
    std::optional<bool> verbose;
    std::optional<bool> debug;
    std::optional<double> confirm_after_timeout;  // секунды; <= 0 отключает
    std::optional<double> timeout;                // глобальный timeout команд; <= 0 - без него
    std::optional<bool> last;                     // корень каскада

    /// Уровень подробности: debug -> 2, verbose -> 1, иначе 0
    int verbosity() const;

    /// Интерпретатор для shell-режима: shell или login shell пользователя
    std::string effective_shell() const;

    /// confirm_after_timeout, если > 0
    std::optional<double> effective_confirm_after() const;

    /// timeout правила, иначе глобальный; nullopt если <= 0
    std::optional<double> effective_timeout(const Rule& rule) const;
};

/// Упорядоченные правила + объединённые опции
struct RuleSet {
    std::vector<Rule> rules;
    Options options;
    std::vector<std::filesystem::path> files;  // загруженные файлы, ближние первыми
};

// ============================================================================
// Результаты
// ============================================================================

/// Результат загрузки rule set
struct LoadResult {
    bool ok = false;
    RuleSet rule_set;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Результат поиска правила. ok && !rule - правило не найдено (не ошибка)
struct ResolveResult {
    bool ok = false;
    std::optional<Rule> rule;
    Error error;

    explicit operator bool() const { return ok; }
};

// ============================================================================
// Загрузка
// ============================================================================

/// Проверка, разрешена ли директория с rule-set файлом
using AccessCheck = std::function<bool(const std::filesystem::path& dir)>;

/// Опции загрузки
struct LoadOptions {
    AccessCheck access_check;                       // пусто - все директории разрешены
    std::optional<std::filesystem::path> home_dir;  // nullopt - platform::home_dir(env)
    std::optional<int> max_levels;                  // ограничение глубины подъёма
    bool include_home = true;                       // читать ~/.config/pathaction/...
    std::optional<platform::Environment> env;       // nullopt - окружение процесса
};

/// Разобрать YAML текст rule-set файла (без рендеринга опций).
/// @throws pathaction::Exception (Config)
RuleSet parse_string(std::string_view yaml, const std::filesystem::path& source);

/// Разобрать rule-set файл.
/// @throws pathaction::Exception (Config)
RuleSet parse_file(const std::filesystem::path& path);

/// Слить два фрагмента: правила closer идут первыми, опции closer перекрывают farther
RuleSet merge(const RuleSet& closer, const RuleSet& farther);

/// Найти rule-set файл в директории (.yaml раньше .yml)
std::optional<std::filesystem::path> find_ruleset_file(const std::filesystem::path& dir);

/// Директория, с которой начинается подъём: сама цель, если это директория, иначе её родитель
std::filesystem::path start_directory(const std::filesystem::path& target);

/// Найти все rule-set файлы для цели: ближние первыми, home последним.
/// Опция last и проверка доступа здесь не учитываются.
std::vector<std::filesystem::path> discover(const std::filesystem::path& target,
                                            const LoadOptions& options = {});

/// Загрузить и слить rule-set файлы для цели
///
/// - Подъём от директории цели (или самой цели, если это директория) до корня
/// - Неразрешённая директория с rule-set файлом прерывает всю загрузку (Access)
/// - Опция last останавливает подъём, запасной файл в home не читается
/// - Строковые опции рендерятся как шаблоны, cwd = директория файла
/// - Заданный shell должен быть исполняемым файлом
LoadResult load(const std::filesystem::path& target, const LoadOptions& options = {});

// ============================================================================
// Выбор правила
// ============================================================================

/// Проходит ли правило фильтр тегов
bool tag_matches(const Rule& rule, const std::optional<std::string>& tag);

/// Первое правило (в порядке rule set), у которого проходит тег и совпадает путь.
/// Шаблоны с "{{" рендерятся с cwd = директория rule-set файла правила.
ResolveResult resolve(const RuleSet& rule_set, const ExecutionContext& ctx);

/// То же для пути и тега с окружением текущего процесса
ResolveResult resolve(const RuleSet& rule_set, const std::filesystem::path& path,
                      const std::optional<std::string>& tag);

// ============================================================================
// JSON дамп
// ============================================================================

/// Правило в JSON (для debug)
rapidjson::Value to_json(const Rule& rule,
                         rapidjson::MemoryPoolAllocator<rapidjson::CrtAllocator>& alloc);

/// Rule set в JSON (для debug)
rapidjson::Value to_json(const RuleSet& rule_set,
                         rapidjson::MemoryPoolAllocator<rapidjson::CrtAllocator>& alloc);

}  // namespace pathaction::rule

#endif  // PATHACTION_RULE_HPP
