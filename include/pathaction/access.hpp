// ==============================================================================
// pathaction/access.hpp - Разрешённые директории
// ==============================================================================
//
// Rule-set файл исполняет произвольные команды, поэтому он читается только из
// директорий, явно разрешённых пользователем (или их поддиректорий).
//
// Файл разрешений (yaml-cpp):
//
//   permanently_allowed:
//     - /home/user/src
//
// Временные разрешения живут только в памяти.
//
// ==============================================================================

#ifndef PATHACTION_ACCESS_HPP
#define PATHACTION_ACCESS_HPP

#include "pathaction/platform.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace pathaction::access {

/// Файл разрешений относительно home
constexpr const char* PERMISSIONS_FILE = ".config/pathaction/permissions.yml";

/// ~/.config/pathaction/permissions.yml
std::filesystem::path default_permissions_file(const platform::Environment& env);

class AllowedPaths {
public:
    /// Добавить директорию (нормализуется); переносит её между временными и постоянными
    void add(const std::filesystem::path& path, bool permanent);

    /// Убрать директорию из обоих списков
    void remove(const std::filesystem::path& path);

    /// Очистить оба списка
    void reset();

    /// Все разрешённые директории
    std::set<std::filesystem::path> all() const;

    const std::set<std::filesystem::path>& permanent() const { return permanent_; }
    const std::set<std::filesystem::path>& temporary() const { return temporary_; }

    /// Путь совпадает с разрешённой директорией или лежит внутри неё
    bool is_allowed(const std::filesystem::path& path) const;

    /// Прочитать постоянные разрешения из YAML текста (заменяет текущие).
    /// @throws pathaction::Exception (Config)
    void load_string(std::string_view yaml);

    /// Прочитать файл разрешений.
    /// @return false если файла нет (список остаётся прежним)
    /// @throws pathaction::Exception (Config)
    bool load_file(const std::filesystem::path& path);

    /// Записать постоянные разрешения (создаёт родительские директории).
    /// @throws pathaction::Exception (Config)
    void save_file(const std::filesystem::path& path) const;

    /// Постоянные разрешения в YAML
    std::string dump() const;

private:
    std::set<std::filesystem::path> temporary_;
    std::set<std::filesystem::path> permanent_;
};

/// Нормализовать путь для сравнения (абсолютный, без symlink там, где путь существует)
std::filesystem::path normalize(const std::filesystem::path& path);

}  // namespace pathaction::access

#endif  // PATHACTION_ACCESS_HPP
