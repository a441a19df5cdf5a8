#pragma once

#include <csvutil/core/error.hpp>
#include <csvutil/core/row.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace csvutil::ops {

/// How a sort field is compared.
enum class SortType : std::uint8_t {
    String,
    Int,
    Float,
};

struct SortKey {
    FieldIndex field = 0;
    SortType type = SortType::String;

    auto operator==(const SortKey&) const -> bool = default;
};

/// Parse `<field>` or `<field>:<type>` with type one of string, int, float.
[[nodiscard]] auto parse_sort_key(std::string_view spec) -> Result<SortKey>;

/// Stable-sort `rows` by each key in turn. The last key is applied last and
/// so takes precedence; earlier keys break its ties. `rows` is left
/// unchanged on failure.
[[nodiscard]] auto sort_rows(std::vector<Row>& rows, const std::vector<SortKey>& keys)
    -> Result<void>;

}  // namespace csvutil::ops
