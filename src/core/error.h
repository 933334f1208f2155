#pragma once

#include <string>
#include <utility>

namespace spanwall::core {

enum class ErrorKind { None, Config, ImageIO };

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

inline bool fail(Error& error, ErrorKind kind, std::string message) {
    error.kind = kind;
    error.message = std::move(message);
    return false;
}

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Config:
            return "configuration error";
        case ErrorKind::ImageIO:
            return "image error";
        case ErrorKind::None:
            break;
    }
    return "error";
}

} // namespace spanwall::core
