#pragma once

#include <csvutil/core/error.hpp>
#include <csvutil/core/row.hpp>
#include <csvutil/merge/field_function.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace csvutil::merge {

/// Projects a row onto the fields that are not aggregated. Two rows belong
/// to the same group when their projections are equal.
class RowComparator {
   public:
    explicit RowComparator(const std::vector<FieldFunction>& bindings);

    /// Fields not being aggregated, in their original order.
    [[nodiscard]] auto project(const Row& row) const -> Row;

    [[nodiscard]] auto is_aggregated(FieldIndex field) const noexcept -> bool;

    /// Aggregated fields, ascending, without repeats.
    [[nodiscard]] auto aggregated() const noexcept -> const std::vector<FieldIndex>& {
        return aggregated_;
    }

   private:
    std::vector<FieldIndex> aggregated_;
};

/// Receives every merged row.
using RowSink = std::function<void(const Row&)>;

/// Merges runs of adjacent rows that agree on every non-aggregated field.
///
/// Only the group currently open is kept: a row is compared against the
/// previous group's key, never against earlier groups. When a row does not
/// match, the open group is flushed to the sink (key fields followed by one
/// result per binding, in binding order) and the row opens the next group.
/// Values are parsed only when their group is flushed, so a bad value
/// surfaces when its group closes.
class Merger {
   public:
    Merger(std::vector<FieldFunction> bindings, RowSink sink);

    /// Feed the next input row.
    [[nodiscard]] auto push(const Row& row) -> Result<void>;

    /// End of input: flush the open group, if any.
    [[nodiscard]] auto finish() -> Result<void>;

    [[nodiscard]] auto has_open_group() const noexcept -> bool { return state_.key.has_value(); }

    [[nodiscard]] auto rows_consumed() const noexcept -> std::size_t { return rows_consumed_; }

    [[nodiscard]] auto groups_emitted() const noexcept -> std::size_t { return groups_emitted_; }

    [[nodiscard]] auto comparator() const noexcept -> const RowComparator& { return comparator_; }

   private:
    struct GroupState {
        std::optional<Row> key;
        /// Raw values per aggregated field, in arrival order.
        robin_hood::unordered_flat_map<FieldIndex, std::vector<std::string>> values;
        std::size_t first_row = 0;
        std::size_t rows = 0;
    };

    auto start_group(const Row& row, Row key) -> Result<void>;
    auto extend_group(const Row& row) -> Result<void>;
    auto flush() -> Result<void>;

    std::vector<FieldFunction> bindings_;
    RowComparator comparator_;
    RowSink sink_;
    GroupState state_;
    std::size_t rows_consumed_ = 0;
    std::size_t groups_emitted_ = 0;
};

}  // namespace csvutil::merge
