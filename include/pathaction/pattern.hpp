// ==============================================================================
// pathaction/pattern.hpp - Сопоставление пути с glob/regex шаблонами
// ==============================================================================
//
// Назначение:
// - glob (fnmatch, без escape, с учётом регистра, якорь на всю строку)
// - regex (search-семантика, без учёта регистра)
// - include/exclude внутри одного семейства шаблонов
// - Объединение семейств: (glob include && !glob exclude) || (regex include && !regex exclude)
//
// ==============================================================================

#ifndef PATHACTION_PATTERN_HPP
#define PATHACTION_PATTERN_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pathaction::pattern {

/// Семейство шаблонов
enum class Kind { Glob, Regex };

/// Шаблоны одного правила, уже отрендеренные
struct PatternSet {
    std::vector<std::string> glob_include;
    std::vector<std::string> glob_exclude;
    std::vector<std::string> regex_include;
    std::vector<std::string> regex_exclude;
};

/// Сопоставить путь с одним glob шаблоном (вся строка)
bool glob_match(std::string_view pattern, std::string_view path);

/// Найти regex шаблон в пути (подстрока, без учёта регистра).
/// Бросает std::regex_error для некорректного шаблона.
bool regex_search(const std::string& pattern, const std::string& path);

/// Проверить корректность regex шаблона.
/// Возвращает описание ошибки или nullopt, если шаблон корректен.
std::optional<std::string> validate_regex(const std::string& pattern);

/// Путь подходит под хотя бы один include шаблон и ни под один exclude.
/// Пустой include список не совпадает ни с чем.
bool matches(const std::string& path, const std::vector<std::string>& include,
             const std::vector<std::string>& exclude, Kind kind);

/// Совпадение через любое из двух семейств (exclude действует внутри своего семейства)
bool matches(const std::string& path, const PatternSet& patterns);

}  // namespace pathaction::pattern

#endif  // PATHACTION_PATTERN_HPP
