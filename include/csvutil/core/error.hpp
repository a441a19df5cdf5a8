#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace csvutil {

/// Failure categories. Every one of them ends the current invocation.
enum class ErrorKind : std::uint8_t {
    MalformedSpec,
    UnknownFunction,
    NonNumericValue,
    FieldIndexOutOfRange,
    SourceUnavailable,
    InvalidOption,
};

/// Error with a category and a human-readable message.
struct Error {
    ErrorKind kind = ErrorKind::InvalidOption;
    std::string message;

    /// "<kind>: <message>"
    [[nodiscard]] auto format() const -> std::string;
};

/// Result type for fallible operations.
template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

/// Shorthand for `std::unexpected(Error{...})`.
[[nodiscard]] inline auto fail(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

}  // namespace csvutil
