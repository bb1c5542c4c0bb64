// ==============================================================================
// pathaction/template.hpp - Шаблоны команд
// ==============================================================================
//
// Небольшое подмножество Jinja:
// - {{ expr }}, {# комментарий #}, {{- / -}} обрезка пробелов
// - {% ... %} не поддерживается (TemplateError)
// - Выражения: имена, строки, числа, списки [a, b], скобки, x.attr, x[i], x | f(args), a ~ b
//
// Переменные: file, cwd, env, pathsep.
// Фильтры: чистые строковые и фильтры, обращающиеся к файловой системе, в двух таблицах.
//
// Ошибки: pathaction::Exception с ErrorKind::Template (или CommandNotFound для which).
//
// ==============================================================================

#ifndef PATHACTION_TEMPLATE_HPP
#define PATHACTION_TEMPLATE_HPP

#include "pathaction/context.hpp"
#include "pathaction/platform.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pathaction::tmpl {

// ----------------------------------------------------------------------------
// Значения
// ----------------------------------------------------------------------------

/// Строка, список строк или словарь строк (env)
using Value = std::variant<std::string, std::vector<std::string>, platform::Environment>;

/// Строковое представление значения при подстановке.
/// Список и словарь печатаются литералом Python: ['a', 'b'], {'k': 'v'}
std::string to_display(const Value& value);

// ----------------------------------------------------------------------------
// Контекст рендеринга
// ----------------------------------------------------------------------------

struct Context {
    std::string file;           // абсолютный путь к цели
    std::filesystem::path cwd;  // значение переменной cwd и база для abspath/realpath
    platform::Environment env;  // переменная env, $PATH для which, $HOME для expanduser
    std::string pathsep = std::string(1, platform::PATH_SEPARATOR);
};

/// Построить контекст из контекста запуска (cwd = директория вызова)
Context build(const ExecutionContext& exec_ctx);

/// Копия контекста с другим значением cwd
Context with_cwd(const Context& ctx, const std::filesystem::path& cwd);

// ----------------------------------------------------------------------------
// Фильтры
// ----------------------------------------------------------------------------

/// Фильтр: входное значение, аргументы из скобок, контекст
using Filter =
    std::function<Value(const Value& input, const std::vector<Value>& args, const Context& ctx)>;

using FilterTable = std::map<std::string, Filter, std::less<>>;

/// Чистые строковые фильтры: quote, basename, dirname, joinpath, joincmd, splitcmd
const FilterTable& pure_filters();

/// Фильтры, зависящие от файловой системы или окружения:
/// realpath, abspath, expanduser, expandvars, shebang, shebang_list, shebang_quote, which
const FilterTable& filesystem_filters();

/// Найти фильтр по имени в обеих таблицах; nullptr если не найден
const Filter* find_filter(std::string_view name);

// ----------------------------------------------------------------------------
// Рендеринг
// ----------------------------------------------------------------------------

/// Отрендерить шаблон.
/// @throws pathaction::Exception (Template / CommandNotFound)
std::string render(std::string_view source, const Context& ctx);

/// Содержит ли строка подстановку ("{{")
bool has_template(std::string_view source);

/// Прочитать интерпретатор из строки "#!" файла.
/// @throws pathaction::Exception (Template), если файла нет или shebang отсутствует
std::string read_shebang(const std::filesystem::path& path);

}  // namespace pathaction::tmpl

#endif  // PATHACTION_TEMPLATE_HPP
