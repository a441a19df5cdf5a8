#include <csvutil/cli/commands.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#ifndef CSVUTIL_VERSION
#define CSVUTIL_VERSION "0.0.0"
#endif

namespace {

constexpr const char* kNoWarranty =
    "This is free software; see the source for copying conditions.  There is NO\n"
    "warranty; not even for MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.";

constexpr const char* kFieldFunctionHelp =
    "Specify a field:function merge operation when a field is not expected to be "
    "identical across rows. Functions are: sum, min, max, mean, median, stdev, first, "
    "last, ignore. E.g., \"-f 0:max\". The result is appended to the output as a new "
    "field. Multiple pairs can be specified.";

constexpr const char* kSortFieldsHelp =
    "Zero-indexed fields on which to sort. An optional type qualifier (int, float, "
    "string) may be specified. E.g., \"-f 3:float\" sorts on the fourth field, "
    "interpreting elements as floating point values. \"-f 3\" sorts on the fourth "
    "field as strings.";

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"Perform operations on a CSV file or input."};
    app.name("csvutil");
    app.set_version_flag("-v,--version", fmt::format("csvutil {}\n{}", CSVUTIL_VERSION, kNoWarranty));
    app.require_subcommand(0, 1);

    bool verbose = false;
    app.add_flag("--verbose", verbose, "Enable debug logging on stderr");

    // --delimiter takes precedence, then the CSVUTIL_DELIMITER environment
    // variable, then ",".
    std::string default_delimiter = csvutil::cli::kDefaultDelimiter;
    if (const char* env = std::getenv("CSVUTIL_DELIMITER"); env != nullptr && *env != '\0') {
        default_delimiter = env;
    }
    const std::string delimiter_help =
        fmt::format("CSV field delimiter.  Default: \"{}\".", default_delimiter);

    csvutil::cli::PickOptions pick;
    pick.delimiter = default_delimiter;
    auto* pick_cmd = app.add_subcommand("pick", "Pick a field or set of fields from each row.");
    pick_cmd->add_option("filename", pick.input_path, "CSV input file.  Default: stdin.");
    pick_cmd->add_option("-f,--fields", pick.fields, "comma-separated list of (zero-indexed) fields.")
        ->required();
    pick_cmd->add_option("-d,--delimiter", pick.delimiter, delimiter_help);

    csvutil::cli::MergeOptions merge;
    merge.delimiter = default_delimiter;
    auto* merge_cmd = app.add_subcommand("merge", "Merge similar sequential lines.");
    merge_cmd->add_option("filename", merge.input_path, "CSV input file.  Default: stdin.");
    merge_cmd->add_option("-f,--field_function", merge.field_functions, kFieldFunctionHelp);
    merge_cmd->add_option("-d,--delimiter", merge.delimiter, delimiter_help);

    csvutil::cli::SortOptions sort;
    sort.delimiter = default_delimiter;
    auto* sort_cmd = app.add_subcommand("sort", "Sort rows based on the specified fields.");
    sort_cmd->add_option("filename", sort.input_path, "CSV input file.  Default: stdin.");
    sort_cmd->add_option("-f,--fields", sort.keys, kSortFieldsHelp)->required();
    sort_cmd->add_option("-d,--delimiter", sort.delimiter, delimiter_help);

    if (argc < 2) {
        fmt::print("{}", app.help());
        return 0;
    }

    CLI11_PARSE(app, argc, argv);

    spdlog::set_default_logger(spdlog::stderr_color_mt("csvutil"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    csvutil::Result<void> result;
    if (pick_cmd->parsed()) {
        result = csvutil::cli::run_pick(pick, std::cout);
    } else if (merge_cmd->parsed()) {
        result = csvutil::cli::run_merge(merge, std::cout);
    } else if (sort_cmd->parsed()) {
        result = csvutil::cli::run_sort(sort, std::cout);
    } else {
        fmt::print("{}", app.help());
        return 0;
    }
    std::cout.flush();

    if (!result) {
        fmt::print(stderr, "csvutil error: {}\n", result.error().format());
        return 1;
    }
    return 0;
}
