#pragma once

#include <csvutil/core/error.hpp>
#include <csvutil/core/row.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace csvutil::ops {

/// Parse a comma-separated list of zero-indexed fields, e.g. "0,2,1".
[[nodiscard]] auto parse_field_list(std::string_view text) -> Result<std::vector<FieldIndex>>;

/// The listed fields of `row`, in list order. Fields may repeat.
[[nodiscard]] auto pick(const Row& row, const std::vector<FieldIndex>& fields,
                        std::size_t row_number) -> Result<Row>;

}  // namespace csvutil::ops
