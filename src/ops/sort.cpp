#include <csvutil/core/number.hpp>
#include <csvutil/ops/sort.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <numeric>
#include <string>
#include <type_traits>
#include <variant>

namespace csvutil::ops {

namespace {

// One column of typed sort values, indexed by original row position.
using KeyColumn =
    std::variant<std::vector<std::string_view>, std::vector<std::int64_t>, std::vector<double>>;

auto type_name(SortType type) -> std::string_view {
    switch (type) {
        case SortType::String:
            return "string";
        case SortType::Int:
            return "int";
        case SortType::Float:
            return "float";
    }
    return "?";
}

auto non_numeric(const SortKey& key, const std::string& value, std::size_t row)
    -> std::unexpected<Error> {
    return fail(ErrorKind::NonNumericValue,
                fmt::format("sort key {}:{}: cannot interpret '{}' at row {} as {}", key.field,
                            type_name(key.type), value, row, type_name(key.type)));
}

auto build_key_column(const std::vector<Row>& rows, const SortKey& key) -> Result<KeyColumn> {
    switch (key.type) {
        case SortType::String: {
            std::vector<std::string_view> values;
            values.reserve(rows.size());
            for (std::size_t r = 0; r < rows.size(); ++r) {
                auto value = field_at(rows[r], key.field, r + 1);
                if (!value) {
                    return std::unexpected(std::move(value.error()));
                }
                values.emplace_back(**value);
            }
            return KeyColumn{std::move(values)};
        }
        case SortType::Int: {
            std::vector<std::int64_t> values;
            values.reserve(rows.size());
            for (std::size_t r = 0; r < rows.size(); ++r) {
                auto value = field_at(rows[r], key.field, r + 1);
                if (!value) {
                    return std::unexpected(std::move(value.error()));
                }
                auto parsed = parse_integer(**value);
                if (!parsed) {
                    return non_numeric(key, **value, r + 1);
                }
                values.push_back(*parsed);
            }
            return KeyColumn{std::move(values)};
        }
        case SortType::Float: {
            std::vector<double> values;
            values.reserve(rows.size());
            for (std::size_t r = 0; r < rows.size(); ++r) {
                auto value = field_at(rows[r], key.field, r + 1);
                if (!value) {
                    return std::unexpected(std::move(value.error()));
                }
                auto parsed = parse_number(**value);
                if (!parsed) {
                    return non_numeric(key, **value, r + 1);
                }
                values.push_back(*parsed);
            }
            return KeyColumn{std::move(values)};
        }
    }
    return fail(ErrorKind::InvalidOption, "unsupported sort type");
}

// NaN compares equal to NaN and greater than every number.
auto float_less(double a, double b) -> bool {
    if (std::isnan(a)) {
        return false;
    }
    if (std::isnan(b)) {
        return true;
    }
    return a < b;
}

}  // namespace

auto parse_sort_key(std::string_view spec) -> Result<SortKey> {
    const auto colon = spec.find(':');
    const auto field_text = spec.substr(0, colon);
    FieldIndex field = 0;
    auto [ptr, ec] = std::from_chars(field_text.data(), field_text.data() + field_text.size(), field);
    const bool digits_only = std::all_of(field_text.begin(), field_text.end(),
                                         [](char ch) { return ch >= '0' && ch <= '9'; });
    if (field_text.empty() || !digits_only || ec != std::errc{} ||
        ptr != field_text.data() + field_text.size()) {
        return fail(ErrorKind::MalformedSpec, fmt::format("unable to interpret field '{}'", spec));
    }
    if (colon == std::string_view::npos) {
        return SortKey{.field = field, .type = SortType::String};
    }

    const auto type_text = spec.substr(colon + 1);
    const bool lower_only = std::all_of(type_text.begin(), type_text.end(),
                                        [](char ch) { return ch >= 'a' && ch <= 'z'; });
    if (type_text.empty() || !lower_only) {
        return fail(ErrorKind::MalformedSpec, fmt::format("unable to interpret field '{}'", spec));
    }
    if (type_text == "string") {
        return SortKey{.field = field, .type = SortType::String};
    }
    if (type_text == "int") {
        return SortKey{.field = field, .type = SortType::Int};
    }
    if (type_text == "float") {
        return SortKey{.field = field, .type = SortType::Float};
    }
    return fail(ErrorKind::MalformedSpec,
                fmt::format("unknown type for field/type pair: {}", spec));
}

auto sort_rows(std::vector<Row>& rows, const std::vector<SortKey>& keys) -> Result<void> {
    // Typed keys are extracted up front so a bad value fails before any
    // row moves.
    std::vector<KeyColumn> columns;
    columns.reserve(keys.size());
    for (const auto& key : keys) {
        auto column = build_key_column(rows, key);
        if (!column) {
            return std::unexpected(std::move(column.error()));
        }
        columns.push_back(std::move(*column));
    }

    std::vector<std::size_t> order(rows.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    for (std::size_t k = 0; k < columns.size(); ++k) {
        spdlog::debug("sort: pass {} on field {} as {}", k + 1, keys[k].field,
                      type_name(keys[k].type));
        std::visit(
            [&](const auto& values) {
                using ValueType = typename std::decay_t<decltype(values)>::value_type;
                std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
                    if constexpr (std::is_same_v<ValueType, double>) {
                        return float_less(values[a], values[b]);
                    } else {
                        return values[a] < values[b];
                    }
                });
            },
            columns[k]);
    }

    std::vector<Row> sorted;
    sorted.reserve(rows.size());
    for (std::size_t index : order) {
        sorted.push_back(std::move(rows[index]));
    }
    rows = std::move(sorted);
    return {};
}

}  // namespace csvutil::ops
