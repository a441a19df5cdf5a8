#pragma once

#include <csvutil/core/error.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace csvutil::merge {

/// Aggregation applied to one field across the rows of a group.
enum class Reduction : std::uint8_t {
    Sum,
    Min,
    Max,
    Mean,
    Median,
    Stdev,
    First,
    Last,
    Ignore,
};

/// All reductions, in the order they are listed in help text.
inline constexpr std::array<Reduction, 9> kAllReductions = {
    Reduction::Sum,    Reduction::Min,   Reduction::Max,  Reduction::Mean,   Reduction::Median,
    Reduction::Stdev,  Reduction::First, Reduction::Last, Reduction::Ignore,
};

/// Look up a reduction by its lowercase name.
[[nodiscard]] auto resolve_reduction(std::string_view name) -> Result<Reduction>;

[[nodiscard]] auto reduction_name(Reduction reduction) noexcept -> std::string_view;

/// True when the reduction parses its inputs as numbers.
[[nodiscard]] auto is_numeric(Reduction reduction) noexcept -> bool;

/// Fold `values` with `reduction`.
///
/// Returns std::nullopt for Reduction::Ignore. Numeric reductions fail with
/// ErrorKind::NonNumericValue on the first value that is not a number.
/// Throws std::invalid_argument when `values` is empty.
[[nodiscard]] auto apply_reduction(Reduction reduction, std::span<const std::string> values)
    -> Result<std::optional<std::string>>;

}  // namespace csvutil::merge
