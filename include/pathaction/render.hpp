// ==============================================================================
// pathaction/render.hpp - Рендеринг команд правила
// ==============================================================================
//
// Назначение:
// - Рендеринг cwd правила (один раз на вызов правила)
// - Рендеринг каждой команды: строка -> shell-строка или argv (shlex), список -> argv
// - Рендеринг путей перенаправления stdout/stderr
//
// Ошибка рендеринга любой части прерывает правило до запуска команд.
//
// ==============================================================================

#ifndef PATHACTION_RENDER_HPP
#define PATHACTION_RENDER_HPP

#include "pathaction/context.hpp"
#include "pathaction/error.hpp"
#include "pathaction/rule.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pathaction::exec {

/// Готовая к запуску команда
struct RenderedCommand {
    bool shell = false;             // запуск через интерпретатор с "-c"
    std::string line;               // командная строка для shell-режима
    std::vector<std::string> argv;  // аргументы (для shell-режима - только из списка токенов)

    /// Строка для вывода пользователю
    std::string display() const;

    bool operator==(const RenderedCommand& other) const;
    bool operator!=(const RenderedCommand& other) const { return !(*this == other); }
};

/// Все команды правила с общими параметрами запуска
struct RenderedRule {
    std::vector<RenderedCommand> commands;
    std::filesystem::path cwd;
    bool shell = false;
    std::optional<std::filesystem::path> stdout_path;
    std::optional<std::filesystem::path> stderr_path;
};

/// Результат рендеринга
struct RenderResult {
    bool ok = false;
    RenderedRule rendered;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Отрендерить правило в контексте запуска
///
/// - cwd: шаблон рендерится с cwd = директория вызова; относительный результат
///   берётся от директории вызова; отсутствие cwd - директория вызова
/// - команды рендерятся с cwd = итоговая рабочая директория
/// - shell=false: строка разбивается shlex на argv; пустой argv - TemplateError
RenderResult render(const rule::Rule& rule, const ExecutionContext& ctx);

}  // namespace pathaction::exec

#endif  // PATHACTION_RENDER_HPP
