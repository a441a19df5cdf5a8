#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace csvutil {

/// Parse the whole of `text` as a double ("1.5", "-2", "1e3", "inf").
[[nodiscard]] auto parse_number(const std::string& text) -> std::optional<double>;

/// Parse the whole of `text` as a signed 64-bit integer. A leading '+' is
/// accepted.
[[nodiscard]] auto parse_integer(std::string_view text) -> std::optional<std::int64_t>;

/// Shortest text that reads back as the same double ("30", "2.5", "1e+20").
[[nodiscard]] auto format_number(double value) -> std::string;

}  // namespace csvutil
