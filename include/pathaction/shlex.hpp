// ==============================================================================
// pathaction/shlex.hpp - Слова POSIX shell
// ==============================================================================
//
// Назначение:
// - quote: экранирование одного аргумента для /bin/sh
// - split: разбиение командной строки на аргументы с учётом кавычек
// - join: склейка аргументов в одну безопасную командную строку
//
// ==============================================================================

#ifndef PATHACTION_SHLEX_HPP
#define PATHACTION_SHLEX_HPP

#include <string>
#include <string_view>
#include <vector>

namespace pathaction::shlex {

/// Экранировать аргумент.
/// Строка только из [A-Za-z0-9@%+=:,./_-] остаётся как есть, пустая - "''",
/// остальное берётся в одинарные кавычки ('"'"' для одинарной кавычки внутри).
std::string quote(std::string_view word);

/// Разбить строку на аргументы (POSIX режим).
/// Бросает std::invalid_argument для незакрытой кавычки или '\' в конце строки.
std::vector<std::string> split(std::string_view line);

/// Экранировать каждый аргумент и склеить через пробел
std::string join(const std::vector<std::string>& words);

}  // namespace pathaction::shlex

#endif  // PATHACTION_SHLEX_HPP
