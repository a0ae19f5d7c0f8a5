#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace motionlib {

enum class ErrorKind {
    NotFound,
    InvalidInput,
    IdentifierCollision,
    RenderFailure,
    StorageFailure,
};

struct Error {
    ErrorKind kind = ErrorKind::StorageFailure;
    std::string message;
};

template<typename T>
using Expected = std::expected<T, Error>;

inline auto Fail(const ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

// Outcome names used by the request layer and the CLI output
constexpr auto ErrorKindName(const ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::InvalidInput: return "bad_input";
        case ErrorKind::IdentifierCollision: return "conflict";
        case ErrorKind::RenderFailure: return "render_failure";
        case ErrorKind::StorageFailure: return "internal";
    }
    return "internal";
}

} // namespace motionlib
