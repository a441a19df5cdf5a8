#pragma once

#include <csvutil/core/error.hpp>

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace csvutil::cli {

/// Default field separator when neither --delimiter nor CSVUTIL_DELIMITER is
/// given.
inline constexpr const char* kDefaultDelimiter = ",";

/// Options for `csvutil pick`.
struct PickOptions {
    /// Input file. Empty means standard input.
    std::string input_path;
    std::string delimiter = kDefaultDelimiter;
    /// Comma-separated zero-indexed fields, e.g. "0,2".
    std::string fields;
};

/// Options for `csvutil merge`.
struct MergeOptions {
    std::string input_path;
    std::string delimiter = kDefaultDelimiter;
    /// `<field>:<function>` specs, in output order.
    std::vector<std::string> field_functions;
};

/// Options for `csvutil sort`.
struct SortOptions {
    std::string input_path;
    std::string delimiter = kDefaultDelimiter;
    /// `<field>[:<type>]` keys, applied in order.
    std::vector<std::string> keys;
};

/// Run an operation over `input`, writing rows to `out`. Specs and options
/// are validated before the first row is read.
[[nodiscard]] auto run_pick(const PickOptions& options, std::istream& input, std::ostream& out)
    -> Result<void>;
[[nodiscard]] auto run_merge(const MergeOptions& options, std::istream& input, std::ostream& out)
    -> Result<void>;
[[nodiscard]] auto run_sort(const SortOptions& options, std::istream& input, std::ostream& out)
    -> Result<void>;

/// Same, opening `options.input_path` (or standard input) first.
[[nodiscard]] auto run_pick(const PickOptions& options, std::ostream& out) -> Result<void>;
[[nodiscard]] auto run_merge(const MergeOptions& options, std::ostream& out) -> Result<void>;
[[nodiscard]] auto run_sort(const SortOptions& options, std::ostream& out) -> Result<void>;

}  // namespace csvutil::cli
