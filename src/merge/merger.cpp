#include <csvutil/merge/merger.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace csvutil::merge {

RowComparator::RowComparator(const std::vector<FieldFunction>& bindings) {
    aggregated_.reserve(bindings.size());
    for (const auto& binding : bindings) {
        aggregated_.push_back(binding.field);
    }
    std::sort(aggregated_.begin(), aggregated_.end());
    aggregated_.erase(std::unique(aggregated_.begin(), aggregated_.end()), aggregated_.end());
}

auto RowComparator::is_aggregated(FieldIndex field) const noexcept -> bool {
    return std::binary_search(aggregated_.begin(), aggregated_.end(), field);
}

auto RowComparator::project(const Row& row) const -> Row {
    Row key;
    key.reserve(row.size());
    for (FieldIndex i = 0; i < row.size(); ++i) {
        if (!is_aggregated(i)) {
            key.push_back(row[i]);
        }
    }
    return key;
}

Merger::Merger(std::vector<FieldFunction> bindings, RowSink sink)
    : bindings_(std::move(bindings)), comparator_(bindings_), sink_(std::move(sink)) {}

auto Merger::push(const Row& row) -> Result<void> {
    ++rows_consumed_;
    Row key = comparator_.project(row);
    if (!state_.key) {
        return start_group(row, std::move(key));
    }
    if (key == *state_.key) {
        return extend_group(row);
    }
    if (auto flushed = flush(); !flushed) {
        return flushed;
    }
    return start_group(row, std::move(key));
}

auto Merger::finish() -> Result<void> {
    if (!state_.key) {
        return {};
    }
    return flush();
}

auto Merger::start_group(const Row& row, Row key) -> Result<void> {
    state_.values.clear();
    for (FieldIndex field : comparator_.aggregated()) {
        auto value = field_at(row, field, rows_consumed_);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        state_.values[field] = std::vector<std::string>{**value};
    }
    state_.key = std::move(key);
    state_.first_row = rows_consumed_;
    state_.rows = 1;
    return {};
}

auto Merger::extend_group(const Row& row) -> Result<void> {
    for (FieldIndex field : comparator_.aggregated()) {
        auto value = field_at(row, field, rows_consumed_);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        state_.values[field].push_back(**value);
    }
    ++state_.rows;
    return {};
}

auto Merger::flush() -> Result<void> {
    Row out = std::move(*state_.key);
    state_.key.reset();
    for (const auto& binding : bindings_) {
        const auto& values = state_.values[binding.field];
        auto result = apply_reduction(binding.reduction, values);
        if (!result) {
            return fail(result.error().kind,
                        fmt::format("field {} of group starting at row {}: {}", binding.field,
                                    state_.first_row, result.error().message));
        }
        if (result->has_value()) {
            out.push_back(std::move(**result));
        }
    }
    ++groups_emitted_;
    spdlog::debug("merge: group {} closed after {} row(s)", groups_emitted_, state_.rows);
    sink_(out);
    return {};
}

}  // namespace csvutil::merge
