// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// RapidJSON для отладочного дампа
// Только этот модуль пишет в stdout/stderr; байты первичны, без std::endl
//
// ==============================================================================

#include "pathaction/output.hpp"

#include "pathaction/platform.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace pathaction::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

std::string format_prefixed(std::string_view prefix, std::string_view message) {
    std::string result(prefix);
    result.append(message);
    result.append("\n");
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки всегда печатаются, даже при --quiet
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~] ", Color::Magenta, message);
}

void Writer::labeled(std::string_view label, std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed(label, Color::Green, message);
}

void Writer::green_line_stderr(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_colored(Stream::Stderr, message, Color::Green);
    write(Stream::Stderr, "\n");
}

void Writer::red_line(std::string_view message) {
    write_colored(Stream::Stderr, message, Color::Red);
    write(Stream::Stderr, "\n");
}

void Writer::prompt(std::string_view question) {
    write(Stream::Stdout, "\n");
    write_colored(Stream::Stdout, question, Color::Yellow);
    flush();
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    if (supports_color(s)) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message) {
    return format_prefixed("[+] ", message);
}

std::string format_error(std::string_view message) {
    return format_prefixed("[x] ", message);
}

std::string format_warning(std::string_view message) {
    return format_prefixed("[!] ", message);
}

std::string format_debug(std::string_view message) {
    return format_prefixed("[*] ", message);
}

std::string escape_newlines(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == '\n') {
            result += "\\n";
        } else {
            result += c;
        }
    }
    return result;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
        return "";
    }
    return "";
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    const char* term = std::getenv("TERM");
    if (term != nullptr && std::strcmp(term, "dumb") == 0) {
        return false;
    }
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace pathaction::output
