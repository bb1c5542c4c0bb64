// ==============================================================================
// pattern.cpp - Сопоставление пути с glob/regex шаблонами
// ==============================================================================

#include "pathaction/pattern.hpp"

#include <fnmatch.h>
#include <regex>

namespace pathaction::pattern {

namespace {

std::regex compile(const std::string& pattern) {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
}

bool any_match(const std::string& path, const std::vector<std::string>& patterns, Kind kind) {
    for (const auto& p : patterns) {
        const bool hit = (kind == Kind::Glob) ? glob_match(p, path) : regex_search(p, path);
        if (hit) {
            return true;
        }
    }
    return false;
}

}  // namespace

bool glob_match(std::string_view pattern, std::string_view path) {
    // fnmatch требует NUL-терминированные строки
    const std::string pat(pattern);
    const std::string str(path);
    // FNM_NOESCAPE: '\' - обычный символ; без FNM_PATHNAME '*' совпадает и с '/'
    return fnmatch(pat.c_str(), str.c_str(), FNM_NOESCAPE) == 0;
}

bool regex_search(const std::string& pattern, const std::string& path) {
    const std::regex re = compile(pattern);
    return std::regex_search(path, re);
}

std::optional<std::string> validate_regex(const std::string& pattern) {
    try {
        (void)compile(pattern);
    } catch (const std::regex_error& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

bool matches(const std::string& path, const std::vector<std::string>& include,
             const std::vector<std::string>& exclude, Kind kind) {
    if (include.empty()) {
        return false;
    }
    if (!any_match(path, include, kind)) {
        return false;
    }
    // exclude всегда побеждает внутри семейства
    return !any_match(path, exclude, kind);
}

bool matches(const std::string& path, const PatternSet& patterns) {
    if (matches(path, patterns.glob_include, patterns.glob_exclude, Kind::Glob)) {
        return true;
    }
    return matches(path, patterns.regex_include, patterns.regex_exclude, Kind::Regex);
}

}  // namespace pathaction::pattern
