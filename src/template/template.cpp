// ==============================================================================
// template.cpp - Шаблоны команд: лексер, разбор выражений, рендеринг
// ==============================================================================
//
// Выражение вычисляется сразу при разборе (рекурсивный спуск):
//   expr     := filtered ('~' filtered)*
//   filtered := postfix ('|' NAME ('(' args ')')?)*
//   postfix  := primary ('.' NAME | '[' expr ']')*
//   primary  := NAME | STRING | NUMBER | '[' list ']' | '(' expr ')'
//
// ==============================================================================

#include "pathaction/template.hpp"

#include "pathaction/error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <type_traits>
#include <utility>

namespace pathaction::tmpl {

namespace {

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

[[noreturn]] void fail(const std::string& message) {
    throw Exception(ErrorKind::Template, message);
}

// ----------------------------------------------------------------------------
// Представление значений
// ----------------------------------------------------------------------------

/// repr() строки в стиле Python
std::string py_repr(const std::string& s) {
    const bool has_single = s.find('\'') != std::string::npos;
    const bool has_double = s.find('"') != std::string::npos;
    const char q = (has_single && !has_double) ? '"' : '\'';

    std::string out(1, q);
    for (char c : s) {
        if (c == '\\') {
            out += "\\\\";
        } else if (c == q) {
            out += '\\';
            out += c;
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\t') {
            out += "\\t";
        } else if (c == '\r') {
            out += "\\r";
        } else {
            out += c;
        }
    }
    out += q;
    return out;
}

// ----------------------------------------------------------------------------
// Лексер выражений
// ----------------------------------------------------------------------------

enum class Tok {
    Name,
    String,
    Number,
    LBracket,
    RBracket,
    LParen,
    RParen,
    Comma,
    Dot,
    Pipe,
    Tilde,
    End
};

struct Token {
    Tok kind = Tok::End;
    std::string text;
};

std::vector<Token> tokenize(std::string_view expr) {
    std::vector<Token> tokens;
    std::size_t i = 0;

    while (i < expr.size()) {
        const char c = expr[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            std::size_t j = i;
            while (j < expr.size() &&
                   (std::isalnum(static_cast<unsigned char>(expr[j])) || expr[j] == '_')) {
                ++j;
            }
            tokens.push_back({Tok::Name, std::string(expr.substr(i, j - i))});
            i = j;
            continue;
        }

        const bool negative_number = c == '-' && i + 1 < expr.size() &&
                                     std::isdigit(static_cast<unsigned char>(expr[i + 1]));
        if (std::isdigit(static_cast<unsigned char>(c)) || negative_number) {
            std::size_t j = i + 1;
            while (j < expr.size() &&
                   (std::isdigit(static_cast<unsigned char>(expr[j])) || expr[j] == '.')) {
                ++j;
            }
            tokens.push_back({Tok::Number, std::string(expr.substr(i, j - i))});
            i = j;
            continue;
        }

        if (c == '\'' || c == '"') {
            std::string value;
            std::size_t j = i + 1;
            bool closed = false;
            while (j < expr.size()) {
                const char d = expr[j];
                if (d == '\\' && j + 1 < expr.size()) {
                    const char e = expr[j + 1];
                    switch (e) {
                    case 'n':
                        value += '\n';
                        break;
                    case 't':
                        value += '\t';
                        break;
                    case '\\':
                    case '\'':
                    case '"':
                        value += e;
                        break;
                    default:
                        value += d;
                        value += e;
                        break;
                    }
                    j += 2;
                    continue;
                }
                if (d == c) {
                    closed = true;
                    break;
                }
                value += d;
                ++j;
            }
            if (!closed) {
                fail("unterminated string literal in expression '" + std::string(expr) + "'");
            }
            tokens.push_back({Tok::String, std::move(value)});
            i = j + 1;
            continue;
        }

        Tok kind = Tok::End;
        switch (c) {
        case '[':
            kind = Tok::LBracket;
            break;
        case ']':
            kind = Tok::RBracket;
            break;
        case '(':
            kind = Tok::LParen;
            break;
        case ')':
            kind = Tok::RParen;
            break;
        case ',':
            kind = Tok::Comma;
            break;
        case '.':
            kind = Tok::Dot;
            break;
        case '|':
            kind = Tok::Pipe;
            break;
        case '~':
            kind = Tok::Tilde;
            break;
        default:
            fail("unexpected character '" + std::string(1, c) + "' in expression '" +
                 std::string(expr) + "'");
        }
        tokens.push_back({kind, std::string(1, c)});
        ++i;
    }

    tokens.push_back({Tok::End, ""});
    return tokens;
}

// ----------------------------------------------------------------------------
// Evaluator - разбор и вычисление выражения
// ----------------------------------------------------------------------------

class Evaluator {
public:
    Evaluator(std::string_view expr, const Context& ctx)
        : source_(expr), tokens_(tokenize(expr)), ctx_(ctx) {}

    Value evaluate() {
        if (peek().kind == Tok::End) {
            fail("empty expression");
        }
        Value v = parse_expr();
        if (peek().kind != Tok::End) {
            fail("unexpected '" + peek().text + "' in expression '" + source_ + "'");
        }
        return v;
    }

private:
    const Token& peek() const { return tokens_[pos_]; }

    Token next() { return tokens_[pos_++]; }

    void expect(Tok kind, const char* what) {
        if (peek().kind != kind) {
            fail(std::string("expected '") + what + "' in expression '" + source_ + "'");
        }
        ++pos_;
    }

    Value parse_expr() {
        Value left = parse_filtered();
        while (peek().kind == Tok::Tilde) {
            ++pos_;
            Value right = parse_filtered();
            left = to_display(left) + to_display(right);
        }
        return left;
    }

    Value parse_filtered() {
        Value value = parse_postfix();
        while (peek().kind == Tok::Pipe) {
            ++pos_;
            if (peek().kind != Tok::Name) {
                fail("expected a filter name after '|' in expression '" + source_ + "'");
            }
            const std::string name = next().text;

            std::vector<Value> args;
            if (peek().kind == Tok::LParen) {
                ++pos_;
                if (peek().kind != Tok::RParen) {
                    args.push_back(parse_expr());
                    while (peek().kind == Tok::Comma) {
                        ++pos_;
                        args.push_back(parse_expr());
                    }
                }
                expect(Tok::RParen, ")");
            }

            const Filter* filter = find_filter(name);
            if (filter == nullptr) {
                fail("no filter named '" + name + "'");
            }
            value = (*filter)(value, args, ctx_);
        }
        return value;
    }

    Value parse_postfix() {
        Value value = parse_primary();
        for (;;) {
            if (peek().kind == Tok::Dot) {
                ++pos_;
                if (peek().kind != Tok::Name) {
                    fail("expected an attribute name after '.' in expression '" + source_ + "'");
                }
                value = subscript(value, Value{next().text});
            } else if (peek().kind == Tok::LBracket) {
                ++pos_;
                Value key = parse_expr();
                expect(Tok::RBracket, "]");
                value = subscript(value, key);
            } else {
                return value;
            }
        }
    }

    Value parse_primary() {
        const Token tok = next();
        switch (tok.kind) {
        case Tok::Name:
            return lookup(tok.text);
        case Tok::String:
        case Tok::Number:
            return tok.text;
        case Tok::LParen: {
            Value v = parse_expr();
            expect(Tok::RParen, ")");
            return v;
        }
        case Tok::LBracket: {
            std::vector<std::string> items;
            if (peek().kind != Tok::RBracket) {
                items.push_back(as_item(parse_expr()));
                while (peek().kind == Tok::Comma) {
                    ++pos_;
                    if (peek().kind == Tok::RBracket) {
                        break;  // [a, b,]
                    }
                    items.push_back(as_item(parse_expr()));
                }
            }
            expect(Tok::RBracket, "]");
            return items;
        }
        default:
            break;
        }
        fail("unexpected '" + tok.text + "' in expression '" + source_ + "'");
    }

    Value lookup(const std::string& name) const {
        if (name == "file") {
            return ctx_.file;
        }
        if (name == "cwd") {
            return platform::path_to_utf8(ctx_.cwd);
        }
        if (name == "env") {
            return ctx_.env;
        }
        if (name == "pathsep") {
            return ctx_.pathsep;
        }
        fail("'" + name + "' is undefined");
    }

    static std::string as_item(const Value& v) {
        if (const auto* s = std::get_if<std::string>(&v)) {
            return *s;
        }
        fail("list literals may only contain strings");
    }

    static Value subscript(const Value& container, const Value& key) {
        if (const auto* map = std::get_if<platform::Environment>(&container)) {
            const auto* k = std::get_if<std::string>(&key);
            if (k == nullptr) {
                fail("mapping keys must be strings");
            }
            auto it = map->find(*k);
            if (it == map->end()) {
                fail("'" + *k + "' is undefined");
            }
            return it->second;
        }

        if (const auto* list = std::get_if<std::vector<std::string>>(&container)) {
            const auto* k = std::get_if<std::string>(&key);
            if (k == nullptr || k->empty()) {
                fail("list indices must be integers");
            }
            char* end = nullptr;
            const long idx = std::strtol(k->c_str(), &end, 10);
            if (end == nullptr || *end != '\0') {
                fail("list indices must be integers, not '" + *k + "'");
            }
            const long size = static_cast<long>(list->size());
            const long real = idx < 0 ? size + idx : idx;
            if (real < 0 || real >= size) {
                fail("list index " + *k + " out of range");
            }
            return (*list)[static_cast<std::size_t>(real)];
        }

        fail("a string value has no attributes or items");
    }

    std::string source_;
    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    const Context& ctx_;
};

void rstrip_whitespace(std::string& s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
}

std::size_t skip_whitespace(std::string_view s, std::size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
    return pos;
}

/// Найти закрывающий маркер, пропуская строковые литералы
std::size_t find_close(std::string_view source, std::size_t from, std::string_view close,
                       bool skip_strings) {
    char quote = '\0';
    for (std::size_t i = from; i < source.size(); ++i) {
        const char c = source[i];
        if (quote != '\0') {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (skip_strings && (c == '\'' || c == '"')) {
            quote = c;
            continue;
        }
        if (source.compare(i, close.size(), close) == 0) {
            return i;
        }
    }
    return std::string_view::npos;
}

}  // namespace

// ----------------------------------------------------------------------------
// Значения
// ----------------------------------------------------------------------------

std::string to_display(const Value& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                std::string out = "[";
                for (std::size_t i = 0; i < v.size(); ++i) {
                    if (i > 0) {
                        out += ", ";
                    }
                    out += py_repr(v[i]);
                }
                out += "]";
                return out;
            } else {
                std::string out = "{";
                bool first = true;
                for (const auto& [key, val] : v) {
                    if (!first) {
                        out += ", ";
                    }
                    first = false;
                    out += py_repr(key) + ": " + py_repr(val);
                }
                out += "}";
                return out;
            }
        },
        value);
}

// ----------------------------------------------------------------------------
// Контекст
// ----------------------------------------------------------------------------

Context build(const ExecutionContext& exec_ctx) {
    Context ctx;
    ctx.file = platform::path_to_utf8(exec_ctx.target);
    ctx.cwd = exec_ctx.cwd;
    ctx.env = exec_ctx.env;
    return ctx;
}

Context with_cwd(const Context& ctx, const std::filesystem::path& cwd) {
    Context copy = ctx;
    copy.cwd = cwd;
    return copy;
}

// ----------------------------------------------------------------------------
// Рендеринг
// ----------------------------------------------------------------------------

bool has_template(std::string_view source) {
    return source.find("{{") != std::string_view::npos;
}

std::string render(std::string_view source, const Context& ctx) {
    std::string out;
    std::size_t pos = 0;
    bool trim_next = false;

    while (pos < source.size()) {
        const std::size_t open = source.find('{', pos);
        const bool is_tag = open != std::string_view::npos && open + 1 < source.size() &&
                            (source[open + 1] == '{' || source[open + 1] == '#' ||
                             source[open + 1] == '%');

        if (!is_tag) {
            // Обычный текст до следующего '{' (или до конца)
            std::size_t end = (open == std::string_view::npos) ? source.size() : open + 1;
            if (trim_next) {
                pos = skip_whitespace(source, pos);
                trim_next = false;
                if (pos > end) {
                    end = pos;
                }
            }
            out.append(source.substr(pos, end - pos));
            pos = end;
            continue;
        }

        // Текст перед тегом
        std::size_t text_start = pos;
        if (trim_next) {
            text_start = std::min(skip_whitespace(source, pos), open);
            trim_next = false;
        }
        out.append(source.substr(text_start, open - text_start));

        const char kind = source[open + 1];
        if (kind == '%') {
            fail("'{% ... %}' statements are not supported");
        }

        std::size_t body = open + 2;
        if (body < source.size() && source[body] == '-') {
            rstrip_whitespace(out);
            ++body;
        }

        const std::string_view close = (kind == '{') ? "}}" : "#}";
        const std::size_t close_pos = find_close(source, body, close, kind == '{');
        if (close_pos == std::string_view::npos) {
            fail(std::string("unexpected end of template, expected '") + std::string(close) +
                 "'");
        }

        std::size_t body_end = close_pos;
        if (body_end > body && source[body_end - 1] == '-') {
            trim_next = true;
            --body_end;
        }

        if (kind == '{') {
            Evaluator eval(source.substr(body, body_end - body), ctx);
            out += to_display(eval.evaluate());
        }

        pos = close_pos + 2;
    }

    return out;
}

}  // namespace pathaction::tmpl
