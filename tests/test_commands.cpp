#include <csvutil/cli/commands.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <sstream>
#include <string>

using csvutil::ErrorKind;
using csvutil::cli::MergeOptions;
using csvutil::cli::PickOptions;
using csvutil::cli::SortOptions;

namespace {

auto data_path(const char* name) -> std::string {
    return (std::filesystem::path(CSVUTIL_SOURCE_DIR) / "tests" / "data" / name).string();
}

auto missing_path() -> std::string {
    return (std::filesystem::temp_directory_path() / "csvutil_missing_input.csv").string();
}

}  // namespace

TEST_CASE("run_merge streams merged rows", "[cli][merge]") {
    MergeOptions options;
    options.field_functions = {"2:sum"};
    std::istringstream input("a,1,10\na,1,20\nb,2,30\n");
    std::ostringstream out;

    auto result = csvutil::cli::run_merge(options, input, out);
    REQUIRE(result.has_value());
    REQUIRE(out.str() == "a,1,30\nb,2,30\n");
}

TEST_CASE("run_merge honours the delimiter for input and output", "[cli][merge]") {
    MergeOptions options;
    options.delimiter = ";";
    options.field_functions = {"1:max", "1:first"};
    std::istringstream input("k;3\nk;8\nk;1\n");
    std::ostringstream out;

    REQUIRE(csvutil::cli::run_merge(options, input, out).has_value());
    REQUIRE(out.str() == "k;8;3\n");
}

TEST_CASE("run_merge on empty input writes nothing", "[cli][merge]") {
    MergeOptions options;
    options.field_functions = {"0:sum"};
    std::istringstream input("");
    std::ostringstream out;

    REQUIRE(csvutil::cli::run_merge(options, input, out).has_value());
    REQUIRE(out.str().empty());
}

TEST_CASE("run_merge rejects bad specs before reading", "[cli][merge][errors]") {
    std::istringstream input("a,1\n");
    std::ostringstream out;

    SECTION("malformed") {
        MergeOptions options;
        options.field_functions = {"1:sum", "one:sum"};
        auto result = csvutil::cli::run_merge(options, input, out);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::MalformedSpec);
    }

    SECTION("unknown function") {
        MergeOptions options;
        options.field_functions = {"1:average"};
        auto result = csvutil::cli::run_merge(options, input, out);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::UnknownFunction);
    }

    SECTION("empty delimiter") {
        MergeOptions options;
        options.delimiter = "";
        auto result = csvutil::cli::run_merge(options, input, out);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::InvalidOption);
    }

    REQUIRE(out.str().empty());
    REQUIRE(input.tellg() == 0);
}

TEST_CASE("run_merge with an out-of-range field writes nothing", "[cli][merge][errors]") {
    MergeOptions options;
    options.field_functions = {"9:max"};
    std::istringstream input("a,1,10\nb,2,20\n");
    std::ostringstream out;

    auto result = csvutil::cli::run_merge(options, input, out);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::FieldIndexOutOfRange);
    REQUIRE(out.str().empty());
}

TEST_CASE("run_merge reads from a file", "[cli][merge]") {
    MergeOptions options;
    options.input_path = data_path("measurements.csv");
    options.field_functions = {"2:sum", "2:max"};
    std::ostringstream out;

    REQUIRE(csvutil::cli::run_merge(options, out).has_value());
    REQUIRE(out.str() == "host-a,cpu,30,20\nhost-a,mem,5,5\nhost-b,cpu,27,11\n");
}

TEST_CASE("run_merge validates specs before opening the file", "[cli][merge][errors]") {
    MergeOptions options;
    options.input_path = missing_path();
    std::ostringstream out;

    SECTION("bad spec wins over missing file") {
        options.field_functions = {"x:sum"};
        auto result = csvutil::cli::run_merge(options, out);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::MalformedSpec);
    }

    SECTION("missing file") {
        options.field_functions = {"1:sum"};
        auto result = csvutil::cli::run_merge(options, out);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::SourceUnavailable);
    }
}

TEST_CASE("run_pick", "[cli][pick]") {
    PickOptions options;
    options.fields = "2,0";
    std::istringstream input("a,b,c\nd,e,f\n");
    std::ostringstream out;

    REQUIRE(csvutil::cli::run_pick(options, input, out).has_value());
    REQUIRE(out.str() == "c,a\nf,d\n");
}

TEST_CASE("run_pick stops at the first short row", "[cli][pick][errors]") {
    PickOptions options;
    options.fields = "1";
    std::istringstream input("a,b\nc\nd,e\n");
    std::ostringstream out;

    auto result = csvutil::cli::run_pick(options, input, out);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::FieldIndexOutOfRange);
    REQUIRE(out.str() == "b\n");
}

TEST_CASE("run_pick reads from a file", "[cli][pick]") {
    PickOptions options;
    options.input_path = data_path("letters.ssv");
    options.delimiter = ";";
    options.fields = "1,0";
    std::ostringstream out;

    REQUIRE(csvutil::cli::run_pick(options, out).has_value());
    REQUIRE(out.str() == "2;b\n1;a\n3;c\n");
}

TEST_CASE("run_sort", "[cli][sort]") {
    SortOptions options;
    options.keys = {"1:int"};
    std::istringstream input("x,10\ny,9\nz,100\n");
    std::ostringstream out;

    REQUIRE(csvutil::cli::run_sort(options, input, out).has_value());
    REQUIRE(out.str() == "y,9\nx,10\nz,100\n");
}

TEST_CASE("run_sort writes nothing when a key does not parse", "[cli][sort][errors]") {
    SortOptions options;
    options.keys = {"1:float"};
    std::istringstream input("x,1\ny,two\n");
    std::ostringstream out;

    auto result = csvutil::cli::run_sort(options, input, out);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::NonNumericValue);
    REQUIRE(out.str().empty());
}

TEST_CASE("run_sort requires keys", "[cli][sort][errors]") {
    SortOptions options;
    std::istringstream input("a\n");
    std::ostringstream out;

    auto result = csvutil::cli::run_sort(options, input, out);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::MalformedSpec);
}

TEST_CASE("run_sort reads from a file", "[cli][sort]") {
    SortOptions options;
    options.input_path = data_path("measurements.csv");
    options.keys = {"2:int"};
    std::ostringstream out;

    REQUIRE(csvutil::cli::run_sort(options, out).has_value());
    REQUIRE(out.str() ==
            "host-a,mem,5\nhost-b,cpu,7\nhost-b,cpu,9\nhost-a,cpu,10\nhost-b,cpu,11\n"
            "host-a,cpu,20\n");
}

TEST_CASE("Error::format names the kind", "[cli][errors]") {
    csvutil::Error error{.kind = ErrorKind::UnknownFunction, .message = "no such thing"};
    REQUIRE(error.format() == "unknown function: no such thing");
}
