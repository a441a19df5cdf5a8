#pragma once

#include <csvutil/core/error.hpp>
#include <csvutil/core/row.hpp>
#include <csvutil/merge/reduction.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace csvutil::merge {

/// A reduction bound to one field, e.g. "2:sum".
struct FieldFunction {
    FieldIndex field = 0;
    Reduction reduction = Reduction::First;

    auto operator==(const FieldFunction&) const -> bool = default;
};

/// Parse `<field>:<function>`, where field is a non-negative integer and
/// function a lowercase name known to resolve_reduction().
[[nodiscard]] auto parse_field_function(std::string_view spec) -> Result<FieldFunction>;

/// Parse every spec, stopping at the first failure.
[[nodiscard]] auto parse_field_functions(const std::vector<std::string>& specs)
    -> Result<std::vector<FieldFunction>>;

}  // namespace csvutil::merge
