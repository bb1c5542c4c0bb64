// ==============================================================================
// execute.cpp - Рендеринг и запуск найденного правила
// ==============================================================================

#include "pathaction/execute.hpp"

#include "pathaction/output.hpp"

namespace pathaction::exec {

RunOptions make_run_options(const rule::Rule& rule, const rule::Options& options,
                            const RenderedRule& rendered, const ExecutionContext& ctx) {
    RunOptions run_options;
    run_options.cwd = rendered.cwd;
    run_options.shell_path = options.effective_shell();
    run_options.timeout = options.effective_timeout(rule);
    run_options.confirm_after = options.effective_confirm_after();
    run_options.stdout_path = rendered.stdout_path;
    run_options.stderr_path = rendered.stderr_path;
    run_options.env = ctx.env;
    return run_options;
}

ExecutionResult execute(const rule::Rule& rule, const rule::Options& options,
                        const ExecutionContext& ctx, Confirmer* confirmer,
                        output::Writer* writer) {
    const RenderResult rendered = render(rule, ctx);
    if (!rendered) {
        ExecutionResult result;
        result.error = rendered.error;
        return result;
    }

    RunOptions run_options = make_run_options(rule, options, rendered.rendered, ctx);
    run_options.confirmer = confirmer;
    run_options.writer = writer;

    if (writer != nullptr && rendered.rendered.shell) {
        writer->debug("shell: " + run_options.shell_path);
    }

    return run(rendered.rendered.commands, run_options);
}

ExecutionResult execute(const rule::Rule& rule, const ExecutionContext& ctx) {
    return execute(rule, rule::Options{}, ctx);
}

}  // namespace pathaction::exec
