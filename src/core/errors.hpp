#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    NotFound,    // install lookup failed (recoverable)
    Network,     // request/response failure
    Parse,       // malformed version payload
    Io,          // filesystem read/write/symlink failure
    Extraction   // tar exited non-zero
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:   return "not found";
        case ErrorKind::Network:    return "network error";
        case ErrorKind::Parse:      return "parse error";
        case ErrorKind::Io:         return "I/O error";
        case ErrorKind::Extraction: return "extraction error";
    }
    return "error";
}

class UpdateError : public std::runtime_error {
public:
    UpdateError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
