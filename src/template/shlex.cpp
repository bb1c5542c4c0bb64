// ==============================================================================
// shlex.cpp - Слова POSIX shell
// ==============================================================================

#include "pathaction/shlex.hpp"

#include <stdexcept>

namespace pathaction::shlex {

namespace {

bool is_safe_char(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
    case '@':
    case '%':
    case '+':
    case '=':
    case ':':
    case ',':
    case '.':
    case '/':
    case '_':
    case '-':
        return true;
    default:
        return false;
    }
}

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

}  // namespace

std::string quote(std::string_view word) {
    if (word.empty()) {
        return "''";
    }

    bool safe = true;
    for (char c : word) {
        if (!is_safe_char(c)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return std::string(word);
    }

    std::string result = "'";
    for (char c : word) {
        if (c == '\'') {
            result += "'\"'\"'";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

std::vector<std::string> split(std::string_view line) {
    enum class State { Blank, Word, Single, Double };

    std::vector<std::string> words;
    std::string current;
    State state = State::Blank;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];

        switch (state) {
        case State::Blank:
        case State::Word:
            if (is_blank(c)) {
                if (state == State::Word) {
                    words.push_back(std::move(current));
                    current.clear();
                    state = State::Blank;
                }
            } else if (c == '\'') {
                state = State::Single;
            } else if (c == '"') {
                state = State::Double;
            } else if (c == '\\') {
                if (i + 1 >= line.size()) {
                    throw std::invalid_argument("no escaped character");
                }
                current += line[++i];
                state = State::Word;
            } else {
                current += c;
                state = State::Word;
            }
            break;

        case State::Single:
            if (c == '\'') {
                state = State::Word;
            } else {
                current += c;
            }
            break;

        case State::Double:
            if (c == '"') {
                state = State::Word;
            } else if (c == '\\') {
                if (i + 1 >= line.size()) {
                    throw std::invalid_argument("no closing quotation");
                }
                const char next = line[i + 1];
                // внутри "..." экранируются только '"' и '\'
                if (next == '"' || next == '\\') {
                    current += next;
                    ++i;
                } else {
                    current += c;
                }
            } else {
                current += c;
            }
            break;
        }
    }

    if (state == State::Single || state == State::Double) {
        throw std::invalid_argument("no closing quotation");
    }
    if (state == State::Word) {
        words.push_back(std::move(current));
    }
    return words;
}

std::string join(const std::vector<std::string>& words) {
    std::string result;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            result += ' ';
        }
        result += quote(words[i]);
    }
    return result;
}

}  // namespace pathaction::shlex
