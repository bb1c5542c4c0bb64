// ==============================================================================
// main.cpp - Точка входа pathaction
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch: --help / --version / --allow-dir / --list / запуск
// 4. Возврат exit code
//
// Запуск для каждого пути: загрузка rule set (с проверкой разрешённых
// директорий), выбор правила, рендеринг, вывод сведений о действии,
// выполнение команд. Обработка останавливается на первом неуспешном пути.
//
// ==============================================================================

#include "pathaction/access.hpp"
#include "pathaction/cli.hpp"
#include "pathaction/context.hpp"
#include "pathaction/execute.hpp"
#include "pathaction/output.hpp"
#include "pathaction/platform.hpp"
#include "pathaction/prompt.hpp"
#include "pathaction/rule.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <optional>
#include <rapidjson/document.h>
#include <type_traits>
#include <variant>

namespace {

using namespace pathaction;

// ----------------------------------------------------------------------------
// Состояние одного вызова
// ----------------------------------------------------------------------------

struct Session {
    const cli::RunCommand& cmd;
    const cli::GlobalOptions& global;
    output::Writer& writer;
    const access::AllowedPaths& allowed;
    bool confirm_before_done = false;  // "y" уже получен, больше не спрашиваем
};

std::string tilde(const std::filesystem::path& p, const platform::Environment& env) {
    return platform::home_to_tilde(p, platform::home_dir(env));
}

void report(output::Writer& writer, const Error& error) {
    writer.error(error.format());
}

// ----------------------------------------------------------------------------
// --allow-dir
// ----------------------------------------------------------------------------

int run_allow_dir(const cli::RunCommand& cmd, output::Writer& writer) {
    const platform::Environment env = platform::environment();
    const std::filesystem::path permissions = access::default_permissions_file(env);

    access::AllowedPaths allowed;
    allowed.load_file(permissions);

    for (const auto& path : cmd.paths) {
        std::error_code ec;
        const auto dir = std::filesystem::weakly_canonical(
            absolute_path(path, std::filesystem::current_path()), ec);
        if (ec || !std::filesystem::is_directory(dir, ec)) {
            writer.error("The path you provided is not a directory: " +
                         platform::path_to_utf8(path));
            return 1;
        }
        allowed.add(dir, true);
        allowed.save_file(permissions);
        writer.write_line(output::Stream::Stdout,
                          "The directory has been permanently added to the allow list: " +
                              platform::path_to_utf8(dir));
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Загрузка rule set для цели
// ----------------------------------------------------------------------------

std::optional<rule::RuleSet> load_rule_set(Session& session, const ExecutionContext& ctx) {
    rule::LoadOptions options;
    options.env = ctx.env;
    options.access_check = [&session](const std::filesystem::path& dir) {
        return session.allowed.is_allowed(dir);
    };

    rule::LoadResult loaded = rule::load(ctx.target, options);
    if (!loaded) {
        report(session.writer, loaded.error);
        return std::nullopt;
    }

    if (loaded.rule_set.files.empty()) {
        session.writer.error("none of the pathaction YAML files were found in '" +
                             platform::path_to_utf8(rule::start_directory(ctx.target)) +
                             "', its parent directories or '~/" + rule::HOME_CONFIG_DIR + "'");
        return std::nullopt;
    }

    // verbose/debug из rule set добавляются к -v
    session.writer.set_verbose(
        std::max(session.global.verbose, loaded.rule_set.options.verbosity()));
    return std::move(loaded.rule_set);
}

// ----------------------------------------------------------------------------
// --list
// ----------------------------------------------------------------------------

int run_list(Session& session) {
    for (const auto& path : session.cmd.paths) {
        const ExecutionContext ctx = ExecutionContext::capture(path, session.cmd.tag);
        const auto rule_set = load_rule_set(session, ctx);
        if (!rule_set) {
            return 1;
        }
        for (const auto& file : rule_set->files) {
            session.writer.write_line(output::Stream::Stdout, platform::path_to_utf8(file));
        }
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Сведения о действии
// ----------------------------------------------------------------------------

void show_rule_info(Session& session, const ExecutionContext& ctx, const rule::RuleSet& rule_set,
                    const rule::Rule& rule, const exec::RenderedRule& rendered) {
    output::Writer& writer = session.writer;

    if (writer.config().verbose > 1) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& alloc = doc.GetAllocator();
        doc.AddMember("rule_set", rule::to_json(rule_set, alloc), alloc);
        doc.AddMember("rule", rule::to_json(rule, alloc), alloc);
        writer.trace("merged rule set and selected rule:");
        writer.write_json_pretty(doc);
    }

    if (writer.config().verbose > 0) {
        writer.debug("'" + ctx.tag.value_or("") + "' loaded from:");
        for (const auto& file : rule_set.files) {
            writer.debug("  " + tilde(file, ctx.env));
        }
        if (rendered.shell) {
            writer.labeled("[SHELL] ", rule_set.options.effective_shell());
        }
    }

    writer.labeled("[WORKING DIR] ", tilde(rendered.cwd, ctx.env));
    if (rule.list_commands) {
        writer.labeled("[COMMANDS] ", "List of commands:");
        for (const auto& command : rendered.commands) {
            writer.green_line_stderr("  " + output::escape_newlines(command.display()));
        }
    } else if (!rendered.commands.empty()) {
        writer.labeled("[COMMAND] ", output::escape_newlines(rendered.commands.front().display()));
    }
    if (!rule.comment.empty()) {
        writer.labeled("[COMMENT] ", rule.comment);
    }
}

// ----------------------------------------------------------------------------
// Один проход: загрузка, выбор, рендеринг, запуск
// ----------------------------------------------------------------------------

int run_once(Session& session, const ExecutionContext& ctx) {
    output::Writer& writer = session.writer;

    const auto rule_set = load_rule_set(session, ctx);
    if (!rule_set) {
        return 1;
    }

    const rule::ResolveResult resolved = rule::resolve(*rule_set, ctx);
    if (!resolved) {
        report(writer, resolved.error);
        return 1;
    }
    if (!resolved.rule) {
        std::string message = "the file '" + platform::path_to_utf8(ctx.target) +
                              "' does not match any pattern that is defined in one of the rule "
                              "set files";
        if (ctx.tag) {
            message += " for the tag '" + *ctx.tag + "'";
        }
        writer.error(message);
        return 1;
    }
    const rule::Rule& rule = *resolved.rule;

    const exec::RenderResult rendered = exec::render(rule, ctx);
    if (!rendered) {
        report(writer, rendered.error);
        return 1;
    }

    show_rule_info(session, ctx, *rule_set, rule, rendered.rendered);

    if (session.cmd.dry_run) {
        for (const auto& command : rendered.rendered.commands) {
            writer.write_line(output::Stream::Stdout, command.display());
        }
        return 0;
    }

    if (session.cmd.confirm_before && !session.confirm_before_done) {
        const auto answer =
            cli::ask_question(writer, "Do you want to execute the command? [y,n] ", {"y", "n"});
        if (!answer || *answer != "y") {
            return 1;
        }
        session.confirm_before_done = true;
    }
    writer.write_line(output::Stream::Stderr, "");

    exec::RunOptions options =
        exec::make_run_options(rule, rule_set->options, rendered.rendered, ctx);
    cli::TerminalConfirmer confirmer(writer);
    options.confirmer = platform::is_tty_stdin() ? &confirmer : nullptr;
    options.writer = &writer;
    if (writer.config().verbose > 1) {
        options.on_state = [&writer](std::size_t index, exec::State state) {
            writer.trace("command " + std::to_string(index) + ": " + exec::to_string(state));
        };
    }

    const exec::ExecutionResult result = exec::run(rendered.rendered.commands, options);

    writer.write_line(output::Stream::Stderr, "");
    if (result.success) {
        writer.labeled("[SUCCESS] ", "All commands were successful.");
        return 0;
    }

    if (result.first_failure_index) {
        const auto& failed = result.commands[*result.first_failure_index];
        writer.red_line("[FAILURE] " + output::escape_newlines(failed.display));
    }
    if (result.error) {
        report(writer, *result.error);
    }
    const int code = result.exit_code();
    writer.red_line("[EXIT-CODE] command returned " + std::to_string(code));
    return code;
}

// ----------------------------------------------------------------------------
// Запуск для пути (с повтором по --confirm-after)
// ----------------------------------------------------------------------------

int run_path(Session& session, const std::filesystem::path& path) {
    const ExecutionContext ctx = ExecutionContext::capture(path, session.cmd.tag);

    for (;;) {
        const int code = run_once(session, ctx);
        if (!session.cmd.confirm_after || platform::interrupt_requested()) {
            return code;
        }

        // Конфигурация перечитывается перед каждым повтором
        const auto answer =
            cli::ask_question(session.writer, "Run again? [a=again, n=no] ", {"a", "n"});
        if (!answer || *answer != "a") {
            return code;
        }
    }
}

int run_paths(const cli::RunCommand& cmd, const cli::GlobalOptions& global,
              output::Writer& writer) {
    platform::install_interrupt_handlers();

    const platform::Environment env = platform::environment();
    access::AllowedPaths allowed;
    allowed.load_file(access::default_permissions_file(env));

    Session session{cmd, global, writer, allowed};

    if (cmd.list) {
        return run_list(session);
    }

    bool first = true;
    for (const auto& path : cmd.paths) {
        if (!first) {
            writer.write_line(output::Stream::Stderr, "");
        }
        first = false;

        const int code = run_path(session, path);
        if (platform::interrupt_requested()) {
            return exec::EXIT_INTERRUPTED;
        }
        if (code != 0) {
            return code;
        }
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга выводятся без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                if (cmd.allow_dir) {
                    return run_allow_dir(cmd, writer);
                }
                return run_paths(cmd, parse_result.global, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Ошибки, не перехваченные на границах модулей (например, запись permissions.yml)
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
