// ==============================================================================
// render.cpp - Рендеринг команд правила
// ==============================================================================

#include "pathaction/render.hpp"

#include "pathaction/shlex.hpp"
#include "pathaction/template.hpp"

#include <stdexcept>

namespace pathaction::exec {

namespace {

std::filesystem::path render_path(const std::string& source, const tmpl::Context& ctx) {
    const std::string rendered = tmpl::render(source, ctx);
    return absolute_path(platform::path_from_utf8(rendered), ctx.cwd);
}

RenderedCommand render_command(const rule::CommandSpec& spec, bool shell,
                               const tmpl::Context& ctx) {
    RenderedCommand cmd;
    cmd.shell = shell;

    if (const auto* line = std::get_if<std::string>(&spec)) {
        const std::string rendered = tmpl::render(*line, ctx);
        if (shell) {
            cmd.line = rendered;
            return cmd;
        }
        try {
            cmd.argv = shlex::split(rendered);
        } catch (const std::invalid_argument& e) {
            throw Exception(ErrorKind::Template,
                            "cannot split the command '" + rendered + "': " + e.what());
        }
    } else {
        for (const auto& token : std::get<std::vector<std::string>>(spec)) {
            cmd.argv.push_back(tmpl::render(token, ctx));
        }
        if (shell) {
            cmd.line = shlex::join(cmd.argv);
        }
    }

    if (!shell && cmd.argv.empty()) {
        throw Exception(ErrorKind::Template, "the command is empty");
    }
    return cmd;
}

}  // namespace

std::string RenderedCommand::display() const {
    return shell ? line : shlex::join(argv);
}

bool RenderedCommand::operator==(const RenderedCommand& other) const {
    return shell == other.shell && line == other.line && argv == other.argv;
}

RenderResult render(const rule::Rule& rule, const ExecutionContext& ctx) {
    RenderResult result;

    try {
        const tmpl::Context base = tmpl::build(ctx);

        // cwd правила не может ссылаться на самого себя: рендерится от директории вызова
        RenderedRule out;
        out.cwd = rule.cwd ? render_path(*rule.cwd, base) : ctx.cwd;
        out.shell = rule.shell.value_or(false);

        const tmpl::Context cmd_ctx = tmpl::with_cwd(base, out.cwd);
        for (const auto& spec : rule.commands) {
            out.commands.push_back(render_command(spec, out.shell, cmd_ctx));
        }

        if (rule.stdout_path) {
            out.stdout_path = render_path(*rule.stdout_path, cmd_ctx);
        }
        if (rule.stderr_path) {
            out.stderr_path = render_path(*rule.stderr_path, cmd_ctx);
        }

        result.rendered = std::move(out);
        result.ok = true;
    } catch (const Exception& e) {
        result.error = e.error();
        if (result.error.path.empty()) {
            result.error.path = platform::path_to_utf8(rule.source);
        }
    }

    return result;
}

}  // namespace pathaction::exec
