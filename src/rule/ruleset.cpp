// ==============================================================================
// ruleset.cpp - Разбор, слияние и каскадная загрузка rule-set файлов
// ==============================================================================
//
// yaml-cpp для разбора; внутренние функции бросают pathaction::Exception,
// load() переводит исключения в LoadResult.
//
// ==============================================================================

#include "pathaction/rule.hpp"

#include "pathaction/pattern.hpp"
#include "pathaction/platform.hpp"
#include "pathaction/template.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <rapidjson/document.h>
#include <set>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace pathaction::rule {

namespace {

// ----------------------------------------------------------------------------
// Разрешённые ключи
// ----------------------------------------------------------------------------

const std::set<std::string> TOP_LEVEL_KEYS = {"options", "actions"};

const std::set<std::string> OPTION_KEYS = {"shell",   "shell_path", "verbose", "debug",
                                           "timeout", "last",       "confirm_after_timeout"};

const std::set<std::string> ACTION_KEYS = {
    "path_match", "path_regex", "path_match_exclude", "path_regex_exclude",
    "tags",       "shell",      "cwd",                "timeout",
    "comment",    "command",    "list_commands",      "stdout",
    "stderr"};

// ----------------------------------------------------------------------------
// Чтение значений
// ----------------------------------------------------------------------------

/// Контекст разбора: файл и текущий раздел для сообщений об ошибках
struct Reader {
    std::string source;

    [[noreturn]] void fail(const std::string& message) const {
        throw Exception(ErrorKind::Config, message, source);
    }

    void check_keys(const YAML::Node& map, const std::set<std::string>& allowed,
                    const std::string& where) const {
        for (const auto& kv : map) {
            const std::string key = kv.first.as<std::string>();
            if (allowed.find(key) == allowed.end()) {
                fail("unknown key '" + key + "' in " + where);
            }
        }
    }

    std::string read_string(const YAML::Node& node, const std::string& key) const {
        if (!node.IsScalar()) {
            fail("'" + key + "' must be a string");
        }
        return node.Scalar();
    }

    bool read_bool(const YAML::Node& node, const std::string& key) const {
        try {
            return node.as<bool>();
        } catch (const YAML::Exception&) {
            fail("'" + key + "' must be a boolean");
        }
    }

    double read_seconds(const YAML::Node& node, const std::string& key) const {
        double value = 0;
        try {
            value = node.as<double>();
        } catch (const YAML::Exception&) {
            fail("'" + key + "' must be a number of seconds");
        }
        // .inf и .nan yaml-cpp тоже читает как double
        if (!std::isfinite(value)) {
            fail("'" + key + "' must be a finite number of seconds");
        }
        return value;
    }

    /// Строка или список строк -> список строк
    std::vector<std::string> read_string_list(const YAML::Node& node,
                                              const std::string& key) const {
        std::vector<std::string> result;
        if (node.IsScalar()) {
            result.push_back(node.Scalar());
            return result;
        }
        if (node.IsSequence()) {
            for (const auto& item : node) {
                if (!item.IsScalar()) {
                    fail("'" + key + "' must be a string or a list of strings");
                }
                result.push_back(item.Scalar());
            }
            return result;
        }
        fail("'" + key + "' must be a string or a list of strings");
    }

    CommandSpec read_command(const YAML::Node& node, const std::string& key) const {
        if (node.IsScalar()) {
            return node.Scalar();
        }
        if (node.IsSequence()) {
            return read_string_list(node, key);
        }
        fail("'" + key + "' must be a string or a list of strings");
    }
};

// ----------------------------------------------------------------------------
// Разбор разделов
// ----------------------------------------------------------------------------

Options parse_options(const YAML::Node& node, const Reader& r) {
    Options opts;
    if (!node || node.IsNull()) {
        return opts;
    }
    if (!node.IsMap()) {
        r.fail("'options' must be a mapping");
    }
    r.check_keys(node, OPTION_KEYS, "options");

    if (node["shell"] && node["shell_path"]) {
        r.fail("'shell' and 'shell_path' cannot be both defined in options");
    }
    for (const char* key : {"shell", "shell_path"}) {
        if (node[key]) {
            opts.shell = r.read_string(node[key], key);
        }
    }
    if (node["verbose"]) {
        opts.verbose = r.read_bool(node["verbose"], "verbose");
    }
    if (node["debug"]) {
        opts.debug = r.read_bool(node["debug"], "debug");
    }
    if (node["last"]) {
        opts.last = r.read_bool(node["last"], "last");
    }
    if (node["timeout"]) {
        opts.timeout = r.read_seconds(node["timeout"], "timeout");
    }
    if (node["confirm_after_timeout"]) {
        opts.confirm_after_timeout =
            r.read_seconds(node["confirm_after_timeout"], "confirm_after_timeout");
    }
    return opts;
}

void check_regexes(const std::vector<std::string>& patterns, const Reader& r) {
    for (const auto& p : patterns) {
        // Шаблоны с подстановками проверяются после рендеринга
        if (tmpl::has_template(p)) {
            continue;
        }
        if (auto err = pattern::validate_regex(p)) {
            r.fail("the regular expression '" + p + "' is invalid: " + *err);
        }
    }
}

Rule parse_action(const YAML::Node& node, std::size_t index, const Reader& r,
                  const std::filesystem::path& source) {
    const std::string where = "actions[" + std::to_string(index) + "]";
    if (!node.IsMap()) {
        r.fail(where + " must be a mapping");
    }
    r.check_keys(node, ACTION_KEYS, where);

    Rule rule;
    rule.source = source;

    if (node["path_match"]) {
        rule.path_match = r.read_string_list(node["path_match"], "path_match");
    }
    if (node["path_regex"]) {
        rule.path_regex = r.read_string_list(node["path_regex"], "path_regex");
    }
    if (node["path_match_exclude"]) {
        rule.path_match_exclude =
            r.read_string_list(node["path_match_exclude"], "path_match_exclude");
    }
    if (node["path_regex_exclude"]) {
        rule.path_regex_exclude =
            r.read_string_list(node["path_regex_exclude"], "path_regex_exclude");
    }
    if (node["tags"]) {
        rule.tags = r.read_string_list(node["tags"], "tags");
    }
    if (node["shell"]) {
        rule.shell = r.read_bool(node["shell"], "shell");
    }
    if (node["cwd"]) {
        rule.cwd = r.read_string(node["cwd"], "cwd");
    }
    if (node["timeout"]) {
        rule.timeout = r.read_seconds(node["timeout"], "timeout");
    }
    if (node["comment"]) {
        rule.comment = r.read_string(node["comment"], "comment");
    }
    if (node["stdout"]) {
        rule.stdout_path = r.read_string(node["stdout"], "stdout");
    }
    if (node["stderr"]) {
        rule.stderr_path = r.read_string(node["stderr"], "stderr");
    }

    if (node["command"] && node["list_commands"]) {
        r.fail("the keys 'command' and 'list_commands' cannot be both defined in " + where);
    }
    if (node["command"]) {
        rule.commands.push_back(r.read_command(node["command"], "command"));
    } else if (node["list_commands"]) {
        const YAML::Node list = node["list_commands"];
        if (!list.IsSequence()) {
            r.fail("'list_commands' must be a list");
        }
        for (const auto& item : list) {
            rule.commands.push_back(r.read_command(item, "list_commands"));
        }
        rule.list_commands = true;
    }
    if (rule.commands.empty()) {
        r.fail("no command has been defined in " + where);
    }

    if (rule.path_match.empty() && rule.path_regex.empty()) {
        r.fail("no 'path_match' or 'path_regex' pattern has been defined in " + where);
    }

    check_regexes(rule.path_regex, r);
    check_regexes(rule.path_regex_exclude, r);

    return rule;
}

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

std::optional<std::filesystem::path> find_home_ruleset(const LoadOptions& options,
                                                       const platform::Environment& env) {
    const std::filesystem::path home =
        options.home_dir ? *options.home_dir : platform::home_dir(env);
    const std::filesystem::path dir = home / HOME_CONFIG_DIR;
    for (const char* name : HOME_RULESET_FILENAMES) {
        std::error_code ec;
        const auto candidate = dir / name;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

/// Отрендерить строковые опции фрагмента (cwd = директория файла)
void render_options(Options& opts, const std::filesystem::path& file,
                    const std::filesystem::path& target, const platform::Environment& env) {
    if (!opts.shell) {
        return;
    }
    tmpl::Context ctx;
    ctx.file = platform::path_to_utf8(target);
    ctx.cwd = file.parent_path();
    ctx.env = env;
    try {
        opts.shell = tmpl::render(*opts.shell, ctx);
    } catch (const Exception& e) {
        Error err = e.error();
        err.path = platform::path_to_utf8(file);
        throw Exception(err);
    }
}

RuleSet load_fragment(const std::filesystem::path& file, const std::filesystem::path& target,
                      const platform::Environment& env) {
    RuleSet fragment = parse_file(file);
    render_options(fragment.options, file, target, env);
    return fragment;
}

}  // namespace

// ----------------------------------------------------------------------------
// Options
// ----------------------------------------------------------------------------

int Options::verbosity() const {
    if (debug.value_or(false)) {
        return 2;
    }
    return verbose.value_or(false) ? 1 : 0;
}

std::string Options::effective_shell() const {
    if (shell && !shell->empty()) {
        return *shell;
    }
    return platform::login_shell();
}

std::optional<double> Options::effective_confirm_after() const {
    if (confirm_after_timeout && *confirm_after_timeout > 0) {
        return confirm_after_timeout;
    }
    return std::nullopt;
}

std::optional<double> Options::effective_timeout(const Rule& rule) const {
    const std::optional<double> t = rule.timeout ? rule.timeout : timeout;
    if (t && *t > 0) {
        return t;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Разбор
// ----------------------------------------------------------------------------

RuleSet parse_string(std::string_view yaml, const std::filesystem::path& source) {
    Reader r{platform::path_to_utf8(source)};

    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        r.fail(std::string("cannot load the YAML file: ") + e.what());
    }

    if (!root || root.IsNull()) {
        r.fail("the rule-set file is empty");
    }
    if (!root.IsMap()) {
        r.fail("the rule-set file must contain a mapping");
    }
    r.check_keys(root, TOP_LEVEL_KEYS, "the rule-set file");

    RuleSet rs;
    rs.files.push_back(source);
    rs.options = parse_options(root["options"], r);

    const YAML::Node actions = root["actions"];
    if (!actions || !actions.IsSequence()) {
        r.fail("'actions' must be a list");
    }
    std::size_t index = 0;
    for (const auto& action : actions) {
        rs.rules.push_back(parse_action(action, index++, r, source));
    }
    return rs;
}

RuleSet parse_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Exception(ErrorKind::Config, "cannot open the rule-set file",
                        platform::path_to_utf8(path));
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return parse_string(oss.str(), path);
}

// ----------------------------------------------------------------------------
// Слияние
// ----------------------------------------------------------------------------

RuleSet merge(const RuleSet& closer, const RuleSet& farther) {
    RuleSet merged;

    merged.rules = closer.rules;
    merged.rules.insert(merged.rules.end(), farther.rules.begin(), farther.rules.end());

    merged.files = closer.files;
    merged.files.insert(merged.files.end(), farther.files.begin(), farther.files.end());

    const Options& c = closer.options;
    const Options& f = farther.options;
    merged.options.shell = c.shell ? c.shell : f.shell;
    merged.options.verbose = c.verbose ? c.verbose : f.verbose;
    merged.options.debug = c.debug ? c.debug : f.debug;
    merged.options.confirm_after_timeout =
        c.confirm_after_timeout ? c.confirm_after_timeout : f.confirm_after_timeout;
    merged.options.timeout = c.timeout ? c.timeout : f.timeout;
    merged.options.last = c.last ? c.last : f.last;

    return merged;
}

// ----------------------------------------------------------------------------
// Поиск файлов
// ----------------------------------------------------------------------------

std::optional<std::filesystem::path> find_ruleset_file(const std::filesystem::path& dir) {
    for (const char* name : RULESET_FILENAMES) {
        std::error_code ec;
        const auto candidate = dir / name;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::filesystem::path start_directory(const std::filesystem::path& target) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::is_directory(target, ec) ? target
                                                                          : target.parent_path();
    auto canonical = std::filesystem::weakly_canonical(dir, ec);
    if (!ec) {
        dir = canonical;
    }
    return absolute_path(dir, std::filesystem::current_path());
}

std::vector<std::filesystem::path> discover(const std::filesystem::path& target,
                                            const LoadOptions& options) {
    std::vector<std::filesystem::path> files;

    std::filesystem::path dir = start_directory(target);
    int level = 0;
    for (;;) {
        if (options.max_levels && level >= *options.max_levels) {
            break;
        }
        if (auto file = find_ruleset_file(dir)) {
            files.push_back(*file);
        }
        ++level;

        const auto parent = dir.parent_path();
        if (parent == dir || parent.empty()) {
            break;
        }
        dir = parent;
    }

    if (options.include_home) {
        const platform::Environment env = options.env ? *options.env : platform::environment();
        if (auto home = find_home_ruleset(options, env)) {
            if (std::find(files.begin(), files.end(), *home) == files.end()) {
                files.push_back(*home);
            }
        }
    }
    return files;
}

LoadResult load(const std::filesystem::path& target, const LoadOptions& options) {
    LoadResult result;

    try {
        const platform::Environment env = options.env ? *options.env : platform::environment();
        const std::filesystem::path abs_target =
            absolute_path(target, std::filesystem::current_path());

        // Фрагменты от ближнего к дальнему
        std::vector<RuleSet> fragments;
        bool stopped_by_last = false;

        std::filesystem::path dir = start_directory(abs_target);
        int level = 0;
        for (;;) {
            if (options.max_levels && level >= *options.max_levels) {
                break;
            }
            ++level;

            if (auto file = find_ruleset_file(dir)) {
                if (options.access_check && !options.access_check(dir)) {
                    throw Exception(ErrorKind::Access,
                                    "the directory '" + platform::path_to_utf8(dir) +
                                        "' is not allowed; allow it or one of its parent "
                                        "directories with --allow-dir",
                                    platform::path_to_utf8(*file));
                }

                fragments.push_back(load_fragment(*file, abs_target, env));
                if (fragments.back().options.last.value_or(false)) {
                    stopped_by_last = true;
                    break;
                }
            }

            const auto parent = dir.parent_path();
            if (parent == dir || parent.empty()) {
                break;
            }
            dir = parent;
        }

        // Запасной файл пользователя: самый низкий приоритет, без проверки доступа
        if (options.include_home && !stopped_by_last) {
            if (auto home = find_home_ruleset(options, env)) {
                const bool already = std::any_of(
                    fragments.begin(), fragments.end(),
                    [&](const RuleSet& f) { return f.files.front() == *home; });
                if (!already) {
                    fragments.push_back(load_fragment(*home, abs_target, env));
                }
            }
        }

        RuleSet merged;
        if (!fragments.empty()) {
            merged = fragments.back();
            for (auto it = fragments.rbegin() + 1; it != fragments.rend(); ++it) {
                merged = merge(*it, merged);
            }
        }

        if (merged.options.shell && !platform::is_executable(*merged.options.shell)) {
            throw Exception(ErrorKind::Config, "the shell '" + *merged.options.shell +
                                                   "' does not exist or is not an executable");
        }

        result.rule_set = std::move(merged);
        result.ok = true;
    } catch (const Exception& e) {
        result.error = e.error();
    } catch (const YAML::Exception& e) {
        result.error = Error{ErrorKind::Config, e.what(), {}};
    } catch (const std::filesystem::filesystem_error& e) {
        result.error = Error{ErrorKind::Config, e.what(), platform::path_to_utf8(e.path1())};
    }

    return result;
}

// ----------------------------------------------------------------------------
// JSON дамп
// ----------------------------------------------------------------------------

namespace {

rapidjson::Value string_value(const std::string& s,
                              rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

rapidjson::Value string_array(const std::vector<std::string>& items,
                              rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (const auto& item : items) {
        arr.PushBack(string_value(item, alloc), alloc);
    }
    return arr;
}

void add_member(rapidjson::Value& obj, const char* name, rapidjson::Value value,
                rapidjson::Document::AllocatorType& alloc) {
    obj.AddMember(rapidjson::StringRef(name), value, alloc);
}

}  // namespace

rapidjson::Value to_json(const Rule& rule,
                         rapidjson::MemoryPoolAllocator<rapidjson::CrtAllocator>& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);

    add_member(obj, "source", string_value(platform::path_to_utf8(rule.source), alloc), alloc);

    const std::pair<const char*, const std::vector<std::string>*> lists[] = {
        {"path_match", &rule.path_match},
        {"path_regex", &rule.path_regex},
        {"path_match_exclude", &rule.path_match_exclude},
        {"path_regex_exclude", &rule.path_regex_exclude},
        {"tags", &rule.tags},
    };
    for (const auto& [name, items] : lists) {
        if (!items->empty()) {
            add_member(obj, name, string_array(*items, alloc), alloc);
        }
    }

    if (rule.shell) {
        add_member(obj, "shell", rapidjson::Value(*rule.shell), alloc);
    }
    if (rule.cwd) {
        add_member(obj, "cwd", string_value(*rule.cwd, alloc), alloc);
    }
    if (rule.timeout) {
        add_member(obj, "timeout", rapidjson::Value(*rule.timeout), alloc);
    }
    if (!rule.comment.empty()) {
        add_member(obj, "comment", string_value(rule.comment, alloc), alloc);
    }
    if (rule.stdout_path) {
        add_member(obj, "stdout", string_value(*rule.stdout_path, alloc), alloc);
    }
    if (rule.stderr_path) {
        add_member(obj, "stderr", string_value(*rule.stderr_path, alloc), alloc);
    }

    rapidjson::Value commands(rapidjson::kArrayType);
    for (const auto& spec : rule.commands) {
        if (const auto* line = std::get_if<std::string>(&spec)) {
            commands.PushBack(string_value(*line, alloc), alloc);
        } else {
            commands.PushBack(string_array(std::get<std::vector<std::string>>(spec), alloc),
                              alloc);
        }
    }
    if (rule.list_commands) {
        add_member(obj, "list_commands", std::move(commands), alloc);
    } else if (!commands.Empty()) {
        rapidjson::Value single(commands[0], alloc);
        add_member(obj, "command", std::move(single), alloc);
    }

    return obj;
}

rapidjson::Value to_json(const RuleSet& rule_set,
                         rapidjson::MemoryPoolAllocator<rapidjson::CrtAllocator>& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);

    rapidjson::Value files(rapidjson::kArrayType);
    for (const auto& f : rule_set.files) {
        files.PushBack(string_value(platform::path_to_utf8(f), alloc), alloc);
    }
    add_member(obj, "files", std::move(files), alloc);

    const Options& o = rule_set.options;
    rapidjson::Value options(rapidjson::kObjectType);
    add_member(options, "shell", string_value(o.effective_shell(), alloc), alloc);
    add_member(options, "verbose", rapidjson::Value(o.verbose.value_or(false)), alloc);
    add_member(options, "debug", rapidjson::Value(o.debug.value_or(false)), alloc);
    add_member(options, "confirm_after_timeout",
               rapidjson::Value(o.confirm_after_timeout.value_or(0.0)), alloc);
    if (o.timeout) {
        add_member(options, "timeout", rapidjson::Value(*o.timeout), alloc);
    }
    add_member(options, "last", rapidjson::Value(o.last.value_or(false)), alloc);
    add_member(obj, "options", std::move(options), alloc);

    rapidjson::Value actions(rapidjson::kArrayType);
    for (const auto& rule : rule_set.rules) {
        actions.PushBack(to_json(rule, alloc), alloc);
    }
    add_member(obj, "actions", std::move(actions), alloc);

    return obj;
}

}  // namespace pathaction::rule
