// ==============================================================================
// context.cpp - Контекст одного запуска
// ==============================================================================

#include "pathaction/context.hpp"

#include <utility>

namespace pathaction {

std::filesystem::path absolute_path(const std::filesystem::path& p,
                                    const std::filesystem::path& base) {
    std::filesystem::path full = p.is_absolute() ? p : base / p;
    full = full.lexically_normal();

    // "/a/b/" -> "/a/b", корень остаётся "/"
    std::string s = platform::path_to_utf8(full);
    while (s.size() > 1 && s.back() == platform::PATH_SEPARATOR) {
        s.pop_back();
    }
    return platform::path_from_utf8(s);
}

ExecutionContext ExecutionContext::capture(const std::filesystem::path& target,
                                           std::optional<std::string> tag) {
    ExecutionContext ctx;
    ctx.cwd = std::filesystem::current_path();
    ctx.target = absolute_path(target, ctx.cwd);
    ctx.tag = std::move(tag);
    ctx.env = platform::environment();
    return ctx;
}

}  // namespace pathaction
