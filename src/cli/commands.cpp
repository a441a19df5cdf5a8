#include <csvutil/cli/commands.hpp>
#include <csvutil/io/row_reader.hpp>
#include <csvutil/io/row_writer.hpp>
#include <csvutil/merge/field_function.hpp>
#include <csvutil/merge/merger.hpp>
#include <csvutil/ops/pick.hpp>
#include <csvutil/ops/sort.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace csvutil::cli {

namespace {

auto check_delimiter(const std::string& delimiter) -> Result<void> {
    if (delimiter.empty()) {
        return fail(ErrorKind::InvalidOption, "delimiter must not be empty");
    }
    return {};
}

auto parse_sort_keys(const std::vector<std::string>& specs) -> Result<std::vector<ops::SortKey>> {
    if (specs.empty()) {
        return fail(ErrorKind::MalformedSpec, "at least one sort field is required");
    }
    std::vector<ops::SortKey> keys;
    keys.reserve(specs.size());
    for (const auto& spec : specs) {
        auto key = ops::parse_sort_key(spec);
        if (!key) {
            return std::unexpected(std::move(key.error()));
        }
        keys.push_back(*key);
    }
    return keys;
}

auto pick_stream(const std::vector<FieldIndex>& fields, const std::string& delimiter,
                 std::istream& input, std::ostream& out) -> Result<void> {
    io::RowReader reader(input, delimiter);
    while (auto row = reader.next()) {
        auto picked = ops::pick(*row, fields, reader.rows_read());
        if (!picked) {
            return std::unexpected(std::move(picked.error()));
        }
        io::write_row(out, *picked, delimiter);
    }
    spdlog::debug("pick: {} row(s)", reader.rows_read());
    return {};
}

auto merge_stream(std::vector<merge::FieldFunction> bindings, const std::string& delimiter,
                  std::istream& input, std::ostream& out) -> Result<void> {
    io::RowReader reader(input, delimiter);
    merge::Merger merger(std::move(bindings),
                         [&](const Row& row) { io::write_row(out, row, delimiter); });
    while (auto row = reader.next()) {
        if (auto pushed = merger.push(*row); !pushed) {
            return pushed;
        }
    }
    if (auto finished = merger.finish(); !finished) {
        return finished;
    }
    spdlog::debug("merge: {} row(s) in, {} row(s) out", merger.rows_consumed(),
                  merger.groups_emitted());
    return {};
}

auto sort_stream(const std::vector<ops::SortKey>& keys, const std::string& delimiter,
                 std::istream& input, std::ostream& out) -> Result<void> {
    io::RowReader reader(input, delimiter);
    std::vector<Row> rows;
    while (auto row = reader.next()) {
        rows.push_back(std::move(*row));
    }
    if (auto sorted = ops::sort_rows(rows, keys); !sorted) {
        return sorted;
    }
    for (const auto& row : rows) {
        io::write_row(out, row, delimiter);
    }
    spdlog::debug("sort: {} row(s)", rows.size());
    return {};
}

}  // namespace

auto run_pick(const PickOptions& options, std::istream& input, std::ostream& out) -> Result<void> {
    auto fields = ops::parse_field_list(options.fields);
    if (!fields) {
        return std::unexpected(std::move(fields.error()));
    }
    if (auto checked = check_delimiter(options.delimiter); !checked) {
        return checked;
    }
    return pick_stream(*fields, options.delimiter, input, out);
}

auto run_pick(const PickOptions& options, std::ostream& out) -> Result<void> {
    auto fields = ops::parse_field_list(options.fields);
    if (!fields) {
        return std::unexpected(std::move(fields.error()));
    }
    if (auto checked = check_delimiter(options.delimiter); !checked) {
        return checked;
    }
    auto source = io::InputSource::open(options.input_path);
    if (!source) {
        return std::unexpected(std::move(source.error()));
    }
    return pick_stream(*fields, options.delimiter, source->stream(), out);
}

auto run_merge(const MergeOptions& options, std::istream& input, std::ostream& out)
    -> Result<void> {
    auto bindings = merge::parse_field_functions(options.field_functions);
    if (!bindings) {
        return std::unexpected(std::move(bindings.error()));
    }
    if (auto checked = check_delimiter(options.delimiter); !checked) {
        return checked;
    }
    return merge_stream(std::move(*bindings), options.delimiter, input, out);
}

auto run_merge(const MergeOptions& options, std::ostream& out) -> Result<void> {
    auto bindings = merge::parse_field_functions(options.field_functions);
    if (!bindings) {
        return std::unexpected(std::move(bindings.error()));
    }
    if (auto checked = check_delimiter(options.delimiter); !checked) {
        return checked;
    }
    auto source = io::InputSource::open(options.input_path);
    if (!source) {
        return std::unexpected(std::move(source.error()));
    }
    return merge_stream(std::move(*bindings), options.delimiter, source->stream(), out);
}

auto run_sort(const SortOptions& options, std::istream& input, std::ostream& out) -> Result<void> {
    auto keys = parse_sort_keys(options.keys);
    if (!keys) {
        return std::unexpected(std::move(keys.error()));
    }
    if (auto checked = check_delimiter(options.delimiter); !checked) {
        return checked;
    }
    return sort_stream(*keys, options.delimiter, input, out);
}

auto run_sort(const SortOptions& options, std::ostream& out) -> Result<void> {
    auto keys = parse_sort_keys(options.keys);
    if (!keys) {
        return std::unexpected(std::move(keys.error()));
    }
    if (auto checked = check_delimiter(options.delimiter); !checked) {
        return checked;
    }
    auto source = io::InputSource::open(options.input_path);
    if (!source) {
        return std::unexpected(std::move(source.error()));
    }
    return sort_stream(*keys, options.delimiter, source->stream(), out);
}

}  // namespace csvutil::cli
