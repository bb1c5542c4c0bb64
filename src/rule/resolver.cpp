// ==============================================================================
// resolver.cpp - Выбор первого подходящего правила
// ==============================================================================
//
// Порядок rule set = приоритет: ближние файлы первыми, внутри файла - порядок объявления.
// Первое совпадение прекращает поиск.
//
// ==============================================================================

#include "pathaction/rule.hpp"

#include "pathaction/pattern.hpp"
#include "pathaction/template.hpp"

#include <algorithm>
#include <regex>

namespace pathaction::rule {

namespace {

/// Отрендерить шаблоны с "{{"; остальные остаются как есть
std::vector<std::string> render_patterns(const std::vector<std::string>& patterns,
                                         const tmpl::Context& ctx, bool regex) {
    std::vector<std::string> rendered;
    rendered.reserve(patterns.size());
    for (const auto& p : patterns) {
        if (!tmpl::has_template(p)) {
            rendered.push_back(p);
            continue;
        }
        std::string out = tmpl::render(p, ctx);
        if (regex) {
            if (auto err = pattern::validate_regex(out)) {
                throw Exception(ErrorKind::Config,
                                "the regular expression '" + out + "' is invalid: " + *err);
            }
        }
        rendered.push_back(std::move(out));
    }
    return rendered;
}

pattern::PatternSet rule_patterns(const Rule& rule, const tmpl::Context& ctx) {
    pattern::PatternSet set;
    set.glob_include = render_patterns(rule.path_match, ctx, false);
    set.glob_exclude = render_patterns(rule.path_match_exclude, ctx, false);
    set.regex_include = render_patterns(rule.path_regex, ctx, true);
    set.regex_exclude = render_patterns(rule.path_regex_exclude, ctx, true);
    return set;
}

}  // namespace

bool tag_matches(const Rule& rule, const std::optional<std::string>& tag) {
    if (!tag) {
        return rule.tags.empty();
    }
    return std::find(rule.tags.begin(), rule.tags.end(), *tag) != rule.tags.end();
}

ResolveResult resolve(const RuleSet& rule_set, const ExecutionContext& ctx) {
    ResolveResult result;

    const tmpl::Context base = tmpl::build(ctx);
    const std::string path = platform::path_to_utf8(ctx.target);

    for (const auto& rule : rule_set.rules) {
        if (!tag_matches(rule, ctx.tag)) {
            continue;
        }

        try {
            // cwd шаблонов = директория rule-set файла, объявившего правило
            const tmpl::Context rule_ctx = tmpl::with_cwd(base, rule.source.parent_path());
            if (pattern::matches(path, rule_patterns(rule, rule_ctx))) {
                result.rule = rule;
                result.ok = true;
                return result;
            }
        } catch (const Exception& e) {
            result.error = e.error();
            if (result.error.path.empty()) {
                result.error.path = platform::path_to_utf8(rule.source);
            }
            return result;
        } catch (const std::regex_error& e) {
            result.error = Error{ErrorKind::Config, e.what(), platform::path_to_utf8(rule.source)};
            return result;
        }
    }

    // Нет совпадения - нормальный исход
    result.ok = true;
    return result;
}

ResolveResult resolve(const RuleSet& rule_set, const std::filesystem::path& path,
                      const std::optional<std::string>& tag) {
    return resolve(rule_set, ExecutionContext::capture(path, tag));
}

}  // namespace pathaction::rule
