// ==============================================================================
// pathaction/output.hpp - Пользовательский вывод
// ==============================================================================
//
// RapidJSON для отладочного дампа (debug: true)
// Только этот модуль пишет в stdout/stderr
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами [+] [!] [x] [*] [~]
// - Метки действий: "[RUN] ", "[WORKING DIR] ", ...
// - Цветной вывод (ANSI escape codes) только для TTY
// - Pretty JSON для отладочного дампа
//
// ==============================================================================

#ifndef PATHACTION_OUTPUT_HPP
#define PATHACTION_OUTPUT_HPP

#include <cstdio>
#include <string>
#include <string_view>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace pathaction::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, метки
    Yellow,  // Вопросы, предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить informational stderr
    int verbose = 0;     // -v / verbose / debug: уровень подробности (0..2+)
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    /// "<label><message>" в stderr, метка зелёным: "[RUN] make"
    void labeled(std::string_view label, std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Зелёная строка в stderr (если не quiet)
    void green_line_stderr(std::string_view message);

    /// Красная строка в stderr
    void red_line(std::string_view message);

    /// Вопрос пользователю: жёлтым в stdout, без перевода строки
    void prompt(std::string_view question);

    // JSON
    // -------------------------------------------------------------------------

    /// Записать pretty JSON (с отступами) в stdout
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    /// Сбросить буферы
    void flush();

    /// Изменить уровень подробности (после загрузки rule set)
    void set_verbose(int verbose) { config_.verbose = verbose; }

    /// Получить текущую конфигурацию
    const OutputConfig& config() const { return config_; }

private:
    /// Записать с цветом
    void write_colored(Stream s, std::string_view message, Color color);

    /// Записать префикс с цветом и сообщение
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    /// Получить FILE* для потока
    FILE* get_file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Форматирует информационное сообщение: "[+] <message>\n"
std::string format_info(std::string_view message);

/// Форматирует сообщение об ошибке: "[x] <message>\n"
std::string format_error(std::string_view message);

/// Форматирует предупреждение: "[!] <message>\n"
std::string format_warning(std::string_view message);

/// Форматирует отладочное сообщение: "[*] <message>\n"
std::string format_debug(std::string_view message);

/// Заменяет переводы строк на "\n" для однострочного вывода команды
std::string escape_newlines(std::string_view text);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Получить ANSI reset code
std::string ansi_reset_code();

/// Проверить, поддерживает ли поток цвета (TTY и TERM != dumb)
bool supports_color(Stream s);

}  // namespace pathaction::output

#endif  // PATHACTION_OUTPUT_HPP
