#pragma once

#include <csvutil/core/error.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace csvutil {

/// One input line split into fields, index 0 leftmost.
using Row = std::vector<std::string>;

/// Zero-indexed field position.
using FieldIndex = std::size_t;

/// Bounds-checked field access. `row_number` is 1-based and only used for
/// the error message.
[[nodiscard]] auto field_at(const Row& row, FieldIndex index, std::size_t row_number)
    -> Result<const std::string*>;

}  // namespace csvutil
