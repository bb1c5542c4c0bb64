// ==============================================================================
// error.cpp - Ошибки pathaction
// ==============================================================================

#include "pathaction/error.hpp"

#include <sstream>
#include <utility>

namespace pathaction {

std::string to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Config:
        return "config error";
    case ErrorKind::Access:
        return "access error";
    case ErrorKind::Template:
        return "template error";
    case ErrorKind::CommandNotFound:
        return "command not found";
    case ErrorKind::Execution:
        return "execution error";
    }
    return "error";
}

bool is_template_failure(ErrorKind kind) {
    return kind == ErrorKind::Template || kind == ErrorKind::CommandNotFound;
}

std::string Error::format() const {
    std::ostringstream oss;
    oss << to_string(kind);
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

Exception::Exception(Error error) : std::runtime_error(error.format()), error_(std::move(error)) {}

Exception::Exception(ErrorKind kind, const std::string& message, std::string path)
    : Exception(Error{kind, message, std::move(path)}) {}

}  // namespace pathaction
