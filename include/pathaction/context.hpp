// ==============================================================================
// pathaction/context.hpp - Контекст одного запуска
// ==============================================================================

#ifndef PATHACTION_CONTEXT_HPP
#define PATHACTION_CONTEXT_HPP

#include "pathaction/platform.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace pathaction {

/// Неизменяемые данные одного запуска: цель, тег, cwd и окружение на момент вызова
struct ExecutionContext {
    std::filesystem::path target;    // абсолютный путь к цели
    std::optional<std::string> tag;  // nullopt - только правила без тегов
    std::filesystem::path cwd;       // рабочая директория вызова
    platform::Environment env;       // снимок окружения

    /// Снять контекст текущего процесса (cwd, environ).
    /// Относительный target дополняется текущей директорией и нормализуется.
    static ExecutionContext capture(const std::filesystem::path& target,
                                    std::optional<std::string> tag);
};

/// Абсолютный нормализованный путь без завершающего '/' (как os.path.abspath)
std::filesystem::path absolute_path(const std::filesystem::path& p,
                                    const std::filesystem::path& base);

}  // namespace pathaction

#endif  // PATHACTION_CONTEXT_HPP
