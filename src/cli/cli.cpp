// ==============================================================================
// cli.cpp - Парсинг командной строки
// ==============================================================================
//
// Собственный разбор argv: короткие флаги можно объединять (-vv, -bn),
// значение тега передаётся как "-t TAG", "-tTAG", "--tag TAG" или "--tag=TAG".
// После "--" все аргументы считаются путями.
//
// ==============================================================================

#include "pathaction/cli.hpp"

#include "pathaction/platform.hpp"

#include <cstring>

namespace pathaction::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string usage_line() {
    return std::string("Usage: ") + PROGRAM_NAME + " [OPTIONS] <PATH>...\n";
}

ParseResult fail(ParseResult result, const std::string& message) {
    result.ok = false;
    result.diagnostic.exit_code = EXIT_USAGE;
    result.diagnostic.stderr_message = render_usage_error(message);
    return result;
}

ParseResult missing_tag_value(ParseResult result) {
    return fail(std::move(result),
                "error: a value is required for '--tag <TAG>' but none was supplied");
}

/// Длинный флаг без значения. @return false - флаг неизвестен
bool apply_long_flag(const char* arg, RunCommand& cmd, GlobalOptions& global) {
    if (str_eq(arg, "--confirm-before")) {
        cmd.confirm_before = true;
    } else if (str_eq(arg, "--confirm-after")) {
        cmd.confirm_after = true;
    } else if (str_eq(arg, "--list")) {
        cmd.list = true;
    } else if (str_eq(arg, "--allow-dir")) {
        cmd.allow_dir = true;
    } else if (str_eq(arg, "--dry-run")) {
        cmd.dry_run = true;
    } else if (str_eq(arg, "--verbose")) {
        global.verbose++;
    } else if (str_eq(arg, "--quiet")) {
        global.quiet = true;
    } else {
        return false;
    }
    return true;
}

/// Короткий флаг без значения. @return false - флаг неизвестен
bool apply_short_flag(char c, RunCommand& cmd, GlobalOptions& global) {
    switch (c) {
    case 'b':
        cmd.confirm_before = true;
        return true;
    case 'a':
        cmd.confirm_after = true;
        return true;
    case 'l':
        cmd.list = true;
        return true;
    case 'd':
        cmd.allow_dir = true;
        return true;
    case 'n':
        cmd.dry_run = true;
        return true;
    case 'v':
        global.verbose++;
        return true;
    case 'q':
        global.quiet = true;
        return true;
    default:
        return false;
    }
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(PROGRAM_NAME) + " " + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) + "\n"
           "\n" +
           usage_line() +
           "\n"
           "Arguments:\n"
           "  <PATH>...  Files (or directories) to run the matching action for\n"
           "\n"
           "Options:\n"
           "  -t, --tag <TAG>       Run the action with this tag (default: untagged actions)\n"
           "  -b, --confirm-before  Ask for confirmation before executing the action\n"
           "  -a, --confirm-after   Offer to run the action again after it finished\n"
           "  -l, --list            List the rule-set files that would be loaded\n"
           "  -d, --allow-dir       Permanently allow the directory to load rule-set files\n"
           "  -n, --dry-run         Show the rendered commands without executing them\n"
           "  -v, --verbose         Print verbose output (repeatable)\n"
           "  -q, --quiet           Suppress informational output\n"
           "  -h, --help            Print help\n"
           "  -V, --version         Print version\n"
           "\n"
           "Rule-set files:\n"
           "  .pathaction.yaml or .pathaction.yml in the directory of the file and in every\n"
           "  parent directory, then ~/.config/pathaction/pathaction.yaml. The closest file\n"
           "  wins. Directories must be allowed first with --allow-dir.\n";
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n" + usage_line() +
           "\n"
           "For more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(const std::vector<std::string>& args) {
    ParseResult result;
    RunCommand cmd;
    bool options_done = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const char* arg = args[i].c_str();

        if (options_done || arg[0] != '-' || str_eq(arg, "-")) {
            cmd.paths.push_back(platform::path_from_utf8(arg));
            continue;
        }

        if (str_eq(arg, "--")) {
            options_done = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "--tag")) {
            if (i + 1 >= args.size()) {
                return missing_tag_value(std::move(result));
            }
            cmd.tag = args[++i];
        } else if (starts_with(arg, "--tag=")) {
            cmd.tag = std::string(arg + 6);  // strlen("--tag=")
        } else if (starts_with(arg, "--")) {
            if (!apply_long_flag(arg, cmd, result.global)) {
                return fail(std::move(result),
                            std::string("error: unexpected argument '") + arg + "' found");
            }
        } else {
            // Группа коротких флагов: -vv, -bn, -tTAG
            for (const char* p = arg + 1; *p != '\0'; ++p) {
                if (*p == 'h') {
                    result.ok = true;
                    result.command = HelpCommand{};
                    return result;
                }
                if (*p == 'V') {
                    result.ok = true;
                    result.command = VersionCommand{};
                    return result;
                }
                if (*p == 't') {
                    if (p[1] != '\0') {
                        cmd.tag = std::string(p + 1);
                    } else if (i + 1 < args.size()) {
                        cmd.tag = args[++i];
                    } else {
                        return missing_tag_value(std::move(result));
                    }
                    break;
                }
                if (!apply_short_flag(*p, cmd, result.global)) {
                    return fail(std::move(result), std::string("error: unexpected argument '-") +
                                                       *p + "' found");
                }
            }
        }
    }

    if (cmd.tag && cmd.tag->empty()) {
        return fail(std::move(result), "error: the tag must not be empty");
    }

    if (cmd.paths.empty()) {
        return fail(std::move(result),
                    "error: the following required arguments were not provided:\n"
                    "  <PATH>...");
    }

    result.ok = true;
    result.command = std::move(cmd);
    return result;
}

ParseResult parse(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

}  // namespace pathaction::cli
