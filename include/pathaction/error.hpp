// ==============================================================================
// pathaction/error.hpp - Ошибки pathaction
// ==============================================================================
//
// Назначение:
// - Виды ошибок (конфигурация, доступ, шаблоны, поиск команды, выполнение)
// - Error: структура ошибки для результатов {ok, ..., error}
// - Exception: внутреннее исключение, переводится в Error на границе API
//
// ==============================================================================

#ifndef PATHACTION_ERROR_HPP
#define PATHACTION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pathaction {

/// Вид ошибки
enum class ErrorKind {
    Config,           // некорректный rule-set файл или правило
    Access,           // директория rule-set файла не разрешена
    Template,         // неизвестная переменная/фильтр, ошибка фильтра
    CommandNotFound,  // фильтр which (или argv[0]) не найден в $PATH
    Execution         // ненулевой код, timeout, отказ в подтверждении
};

/// Преобразовать ErrorKind в строку ("config error", ...)
std::string to_string(ErrorKind kind);

/// CommandNotFound - частный случай ошибки шаблона
bool is_template_failure(ErrorKind kind);

/// Ошибка загрузки/рендеринга/выполнения
struct Error {
    ErrorKind kind = ErrorKind::Config;
    std::string message;
    std::string path;  // файл, к которому относится ошибка (может быть пустым)

    std::string format() const;
};

/// Исключение с Error внутри
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error);
    Exception(ErrorKind kind, const std::string& message, std::string path = {});

    const Error& error() const noexcept { return error_; }

private:
    Error error_;
};

}  // namespace pathaction

#endif  // PATHACTION_ERROR_HPP
