#pragma once

#include <csvutil/core/row.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace csvutil::io {

/// Join `row` with `delimiter`. No quoting is applied.
[[nodiscard]] auto join_row(const Row& row, std::string_view delimiter) -> std::string;

/// Write `row` joined by `delimiter`, followed by a newline.
void write_row(std::ostream& out, const Row& row, std::string_view delimiter);

}  // namespace csvutil::io
