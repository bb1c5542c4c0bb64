// ==============================================================================
// filters.cpp - Фильтры шаблонов
// ==============================================================================
//
// Две таблицы:
// - pure_filters: функции только от значения
// - filesystem_filters: читают файлы, окружение, $PATH или зависят от cwd
//
// Семантика путей повторяет os.path (basename/dirname/join/expanduser/expandvars).
//
// ==============================================================================

#include "pathaction/template.hpp"

#include "pathaction/error.hpp"
#include "pathaction/shlex.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace pathaction::tmpl {

namespace {

[[noreturn]] void fail(const std::string& message) {
    throw Exception(ErrorKind::Template, message);
}

// ----------------------------------------------------------------------------
// Проверка типов и аргументов
// ----------------------------------------------------------------------------

const std::string& expect_string(const Value& v, const char* filter) {
    if (const auto* s = std::get_if<std::string>(&v)) {
        return *s;
    }
    fail(std::string(filter) + ": invalid type, expected a string");
}

const std::vector<std::string>& expect_list(const Value& v, const char* filter) {
    if (const auto* l = std::get_if<std::vector<std::string>>(&v)) {
        return *l;
    }
    fail(std::string(filter) + ": invalid type, expected a list of strings");
}

void expect_no_args(const std::vector<Value>& args, const char* filter) {
    if (!args.empty()) {
        fail(std::string(filter) + ": takes no arguments");
    }
}

std::vector<std::string> split_or_fail(const std::string& line, const char* filter) {
    try {
        return shlex::split(line);
    } catch (const std::invalid_argument& e) {
        fail(std::string(filter) + ": " + e.what());
    }
}

// ----------------------------------------------------------------------------
// os.path
// ----------------------------------------------------------------------------

std::string path_basename(const std::string& p) {
    const auto i = p.rfind(platform::PATH_SEPARATOR);
    return (i == std::string::npos) ? p : p.substr(i + 1);
}

std::string path_dirname(const std::string& p) {
    const auto i = p.rfind(platform::PATH_SEPARATOR);
    if (i == std::string::npos) {
        return "";
    }
    std::string head = p.substr(0, i + 1);
    // "/a/b/" -> "/a/b", но "//" остаётся "//"
    if (head.find_first_not_of(platform::PATH_SEPARATOR) != std::string::npos) {
        while (!head.empty() && head.back() == platform::PATH_SEPARATOR) {
            head.pop_back();
        }
    }
    return head;
}

std::string path_join(const std::vector<std::string>& parts) {
    std::string result;
    for (const auto& part : parts) {
        if (!part.empty() && part.front() == platform::PATH_SEPARATOR) {
            result = part;
        } else if (result.empty() || result.back() == platform::PATH_SEPARATOR) {
            result += part;
        } else {
            result += platform::PATH_SEPARATOR;
            result += part;
        }
    }
    return result;
}

std::string expand_user(const std::string& p, const platform::Environment& env) {
    if (p.empty() || p.front() != '~') {
        return p;
    }

    auto slash = p.find(platform::PATH_SEPARATOR, 1);
    if (slash == std::string::npos) {
        slash = p.size();
    }

    std::string home;
    if (slash == 1) {
        home = platform::path_to_utf8(platform::home_dir(env));
    } else {
        const auto user = platform::user_home(std::string_view(p).substr(1, slash - 1));
        if (!user) {
            return p;
        }
        home = platform::path_to_utf8(*user);
    }

    while (!home.empty() && home.back() == platform::PATH_SEPARATOR) {
        home.pop_back();
    }
    std::string result = home + p.substr(slash);
    return result.empty() ? std::string(1, platform::PATH_SEPARATOR) : result;
}

bool is_var_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/// $NAME и ${NAME}; неизвестные переменные остаются как есть
std::string expand_vars(const std::string& s, const platform::Environment& env) {
    std::string out;
    std::size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '$' || i + 1 >= s.size()) {
            out += s[i++];
            continue;
        }

        std::string name;
        std::size_t end = i + 1;
        if (s[end] == '{') {
            const auto close = s.find('}', end + 1);
            if (close == std::string::npos) {
                out += s[i++];
                continue;
            }
            name = s.substr(end + 1, close - end - 1);
            end = close + 1;
        } else {
            while (end < s.size() && is_var_char(s[end])) {
                ++end;
            }
            name = s.substr(i + 1, end - i - 1);
        }

        auto it = name.empty() ? env.end() : env.find(name);
        if (it == env.end()) {
            out += s.substr(i, end - i);
        } else {
            out += it->second;
        }
        i = end;
    }
    return out;
}

std::filesystem::path resolve_in(const std::string& p, const Context& ctx) {
    return absolute_path(platform::path_from_utf8(p), ctx.cwd);
}

// ----------------------------------------------------------------------------
// Чистые фильтры
// ----------------------------------------------------------------------------

Value filter_quote(const Value& input, const std::vector<Value>& args, const Context&) {
    expect_no_args(args, "quote");
    if (const auto* list = std::get_if<std::vector<std::string>>(&input)) {
        std::vector<std::string> quoted;
        quoted.reserve(list->size());
        for (const auto& item : *list) {
            quoted.push_back(shlex::quote(item));
        }
        return quoted;
    }
    return shlex::quote(expect_string(input, "quote"));
}

Value filter_basename(const Value& input, const std::vector<Value>& args, const Context&) {
    expect_no_args(args, "basename");
    return path_basename(expect_string(input, "basename"));
}

Value filter_dirname(const Value& input, const std::vector<Value>& args, const Context&) {
    expect_no_args(args, "dirname");
    return path_dirname(expect_string(input, "dirname"));
}

/// ['a', 'b'] | joinpath  или  'a' | joinpath('b', 'c')
Value filter_joinpath(const Value& input, const std::vector<Value>& args, const Context&) {
    std::vector<std::string> parts;
    if (const auto* list = std::get_if<std::vector<std::string>>(&input)) {
        parts = *list;
    } else {
        parts.push_back(expect_string(input, "joinpath"));
    }
    for (const auto& arg : args) {
        parts.push_back(expect_string(arg, "joinpath"));
    }
    if (parts.empty()) {
        fail("joinpath: nothing to join");
    }
    return path_join(parts);
}

Value filter_joincmd(const Value& input, const std::vector<Value>& args, const Context&) {
    expect_no_args(args, "joincmd");
    return shlex::join(expect_list(input, "joincmd"));
}

Value filter_splitcmd(const Value& input, const std::vector<Value>& args, const Context&) {
    expect_no_args(args, "splitcmd");
    return split_or_fail(expect_string(input, "splitcmd"), "splitcmd");
}

// ----------------------------------------------------------------------------
// Фильтры файловой системы и окружения
// ----------------------------------------------------------------------------

Value filter_abspath(const Value& input, const std::vector<Value>& args, const Context& ctx) {
    expect_no_args(args, "abspath");
    return platform::path_to_utf8(resolve_in(expect_string(input, "abspath"), ctx));
}

Value filter_realpath(const Value& input, const std::vector<Value>& args, const Context& ctx) {
    expect_no_args(args, "realpath");
    const auto abs = resolve_in(expect_string(input, "realpath"), ctx);
    std::error_code ec;
    const auto canonical = std::filesystem::weakly_canonical(abs, ec);
    if (ec) {
        return platform::path_to_utf8(abs);
    }
    return platform::path_to_utf8(absolute_path(canonical, ctx.cwd));
}

Value filter_expanduser(const Value& input, const std::vector<Value>& args, const Context& ctx) {
    expect_no_args(args, "expanduser");
    return expand_user(expect_string(input, "expanduser"), ctx.env);
}

Value filter_expandvars(const Value& input, const std::vector<Value>& args, const Context& ctx) {
    expect_no_args(args, "expandvars");
    return expand_vars(expect_string(input, "expandvars"), ctx.env);
}

Value filter_shebang(const Value& input, const std::vector<Value>& args, const Context& ctx) {
    expect_no_args(args, "shebang");
    return read_shebang(resolve_in(expect_string(input, "shebang"), ctx));
}

Value filter_shebang_list(const Value& input, const std::vector<Value>& args, const Context& ctx) {
    expect_no_args(args, "shebang_list");
    const auto line = read_shebang(resolve_in(expect_string(input, "shebang_list"), ctx));
    return split_or_fail(line, "shebang_list");
}

Value filter_shebang_quote(const Value& input, const std::vector<Value>& args,
                           const Context& ctx) {
    expect_no_args(args, "shebang_quote");
    const auto line = read_shebang(resolve_in(expect_string(input, "shebang_quote"), ctx));
    return shlex::join(split_or_fail(line, "shebang_quote"));
}

Value filter_which(const Value& input, const std::vector<Value>& args, const Context& ctx) {
    expect_no_args(args, "which");
    const std::string& name = expect_string(input, "which");

    std::string path_env;
    if (auto it = ctx.env.find("PATH"); it != ctx.env.end()) {
        path_env = it->second;
    }

    const auto found = platform::which(name, path_env, ctx.cwd);
    if (!found) {
        throw Exception(ErrorKind::CommandNotFound, "which: command not found: " + name);
    }
    return platform::path_to_utf8(*found);
}

}  // namespace

// ----------------------------------------------------------------------------
// Таблицы фильтров
// ----------------------------------------------------------------------------

const FilterTable& pure_filters() {
    static const FilterTable table = {
        {"quote", filter_quote},       {"basename", filter_basename},
        {"dirname", filter_dirname},   {"joinpath", filter_joinpath},
        {"joincmd", filter_joincmd},   {"splitcmd", filter_splitcmd},
    };
    return table;
}

const FilterTable& filesystem_filters() {
    static const FilterTable table = {
        {"realpath", filter_realpath},
        {"abspath", filter_abspath},
        {"expanduser", filter_expanduser},
        {"expandvars", filter_expandvars},
        {"shebang", filter_shebang},
        {"shebang_list", filter_shebang_list},
        {"shebang_quote", filter_shebang_quote},
        {"which", filter_which},
    };
    return table;
}

const Filter* find_filter(std::string_view name) {
    for (const FilterTable* table : {&pure_filters(), &filesystem_filters()}) {
        auto it = table->find(name);
        if (it != table->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

// ----------------------------------------------------------------------------
// Shebang
// ----------------------------------------------------------------------------

std::string read_shebang(const std::filesystem::path& path) {
    const std::string shown = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        throw Exception(ErrorKind::Template, "there is no shebang in the file '" + shown + "'");
    }

    std::ifstream file(path, std::ios::binary);
    std::string line;
    if (!file || !std::getline(file, line)) {
        throw Exception(ErrorKind::Template, "there is no shebang in the file '" + shown + "'");
    }

    std::size_t begin = 0;
    while (begin < line.size() && std::isspace(static_cast<unsigned char>(line[begin]))) {
        ++begin;
    }
    if (line.compare(begin, 2, "#!") != 0) {
        throw Exception(ErrorKind::Template, "there is no shebang in the file '" + shown + "'");
    }

    std::string interpreter = line.substr(begin + 2);
    while (!interpreter.empty() &&
           std::isspace(static_cast<unsigned char>(interpreter.back()))) {
        interpreter.pop_back();
    }
    return interpreter;
}

}  // namespace pathaction::tmpl
