// ==============================================================================
// pathaction/execute.hpp - Рендеринг и запуск найденного правила
// ==============================================================================

#ifndef PATHACTION_EXECUTE_HPP
#define PATHACTION_EXECUTE_HPP

#include "pathaction/context.hpp"
#include "pathaction/process.hpp"
#include "pathaction/render.hpp"
#include "pathaction/rule.hpp"

namespace pathaction::exec {

/// Параметры запуска из опций rule set и отрендеренного правила
RunOptions make_run_options(const rule::Rule& rule, const rule::Options& options,
                            const RenderedRule& rendered, const ExecutionContext& ctx);

/// Отрендерить правило и выполнить его команды по очереди.
/// Ошибка рендеринга возвращается в result.error, команды не запускаются.
ExecutionResult execute(const rule::Rule& rule, const rule::Options& options,
                        const ExecutionContext& ctx, Confirmer* confirmer = nullptr,
                        output::Writer* writer = nullptr);

/// То же с опциями по умолчанию (login shell, без timeout и подтверждений)
ExecutionResult execute(const rule::Rule& rule, const ExecutionContext& ctx);

}  // namespace pathaction::exec

#endif  // PATHACTION_EXECUTE_HPP
