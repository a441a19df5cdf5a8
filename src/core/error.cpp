#include <csvutil/core/error.hpp>

#include <fmt/format.h>

namespace csvutil {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::MalformedSpec:
            return "malformed spec";
        case ErrorKind::UnknownFunction:
            return "unknown function";
        case ErrorKind::NonNumericValue:
            return "non-numeric value";
        case ErrorKind::FieldIndexOutOfRange:
            return "field index out of range";
        case ErrorKind::SourceUnavailable:
            return "source unavailable";
        case ErrorKind::InvalidOption:
            return "invalid option";
    }
    return "error";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace csvutil
