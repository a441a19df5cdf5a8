#include <csvutil/merge/field_function.hpp>
#include <csvutil/merge/merger.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using csvutil::ErrorKind;
using csvutil::Result;
using csvutil::Row;
using csvutil::merge::FieldFunction;
using csvutil::merge::Merger;
using csvutil::merge::Reduction;
using csvutil::merge::RowComparator;

namespace {

struct MergeRun {
    std::vector<Row> output;
    Result<void> status;
};

auto bindings_for(const std::vector<std::string>& specs) -> std::vector<FieldFunction> {
    auto bindings = csvutil::merge::parse_field_functions(specs);
    REQUIRE(bindings.has_value());
    return *bindings;
}

auto run_merge(const std::vector<Row>& rows, const std::vector<std::string>& specs) -> MergeRun {
    MergeRun run;
    Merger merger(bindings_for(specs), [&](const Row& row) { run.output.push_back(row); });
    for (const auto& row : rows) {
        run.status = merger.push(row);
        if (!run.status) {
            return run;
        }
    }
    run.status = merger.finish();
    return run;
}

auto merged(const std::vector<Row>& rows, const std::vector<std::string>& specs)
    -> std::vector<Row> {
    auto run = run_merge(rows, specs);
    REQUIRE(run.status.has_value());
    return run.output;
}

}  // namespace

TEST_CASE("RowComparator projects out aggregated fields", "[merge][comparator]") {
    RowComparator comparator({FieldFunction{.field = 2, .reduction = Reduction::Sum},
                              FieldFunction{.field = 0, .reduction = Reduction::First},
                              FieldFunction{.field = 2, .reduction = Reduction::Max}});

    REQUIRE(comparator.aggregated() == std::vector<std::size_t>{0, 2});
    REQUIRE(comparator.is_aggregated(0));
    REQUIRE_FALSE(comparator.is_aggregated(1));
    REQUIRE(comparator.project(Row{"a", "b", "c", "d"}) == Row{"b", "d"});
    REQUIRE(comparator.project(Row{"a"}).empty());
}

TEST_CASE("RowComparator without bindings keeps the whole row", "[merge][comparator]") {
    RowComparator comparator(std::vector<FieldFunction>{});
    REQUIRE(comparator.aggregated().empty());
    REQUIRE(comparator.project(Row{"a", "b"}) == Row{"a", "b"});
}

TEST_CASE("merge sums runs of matching rows", "[merge]") {
    auto out = merged({{"a", "1", "10"}, {"a", "1", "20"}, {"b", "2", "30"}}, {"2:sum"});
    REQUIRE(out == std::vector<Row>{{"a", "1", "30"}, {"b", "2", "30"}});
}

TEST_CASE("merge without bindings removes adjacent duplicates", "[merge]") {
    auto out = merged({{"a"}, {"a"}, {"b"}, {"a"}, {"a"}}, {});
    REQUIRE(out == std::vector<Row>{{"a"}, {"b"}, {"a"}});
}

TEST_CASE("merge only groups adjacent rows", "[merge]") {
    auto out = merged({{"x", "1"}, {"y", "2"}, {"x", "3"}}, {"1:sum"});
    REQUIRE(out == std::vector<Row>{{"x", "1"}, {"y", "2"}, {"x", "3"}});
}

TEST_CASE("merge emits one row per maximal run", "[merge]") {
    std::vector<Row> rows{{"a", "1"}, {"a", "2"}, {"b", "3"}, {"b", "4"},
                          {"b", "5"}, {"a", "6"}, {"c", "7"}};
    auto out = merged(rows, {"1:max"});
    REQUIRE(out.size() == 4);
    REQUIRE(out == std::vector<Row>{{"a", "2"}, {"b", "5"}, {"a", "6"}, {"c", "7"}});
}

TEST_CASE("merge appends results in binding order", "[merge]") {
    auto out = merged({{"1", "k", "5"}, {"2", "k", "7"}}, {"2:max", "0:first"});
    REQUIRE(out == std::vector<Row>{{"k", "7", "1"}});
}

TEST_CASE("merge keys on every field that is not aggregated", "[merge]") {
    auto out = merged({{"a", "1", "x"}, {"a", "2", "x"}, {"a", "3", "y"}}, {"1:sum"});
    REQUIRE(out == std::vector<Row>{{"a", "x", "3"}, {"a", "y", "3"}});
}

TEST_CASE("merge with duplicate bindings emits each of them", "[merge]") {
    auto out = merged({{"a", "4"}, {"a", "1"}, {"a", "9"}}, {"1:min", "1:max"});
    REQUIRE(out == std::vector<Row>{{"a", "1", "9"}});
}

TEST_CASE("ignore aggregates a field without emitting it", "[merge]") {
    auto out = merged({{"a", "1", "t1"}, {"a", "2", "t2"}, {"b", "3", "t3"}}, {"1:sum", "2:ignore"});
    REQUIRE(out == std::vector<Row>{{"a", "3"}, {"b", "3"}});
}

TEST_CASE("stdev of a single-row group is zero", "[merge]") {
    auto out = merged({{"a", "5"}, {"b", "1"}, {"b", "3"}}, {"1:stdev"});
    REQUIRE(out.size() == 2);
    REQUIRE(out[0] == Row{"a", "0"});
    REQUIRE(out[1][0] == "b");
}

TEST_CASE("first and last pass non-numeric text through", "[merge]") {
    auto out = merged({{"k", "alpha"}, {"k", "beta"}, {"k", "gamma"}}, {"1:first", "1:last"});
    REQUIRE(out == std::vector<Row>{{"k", "alpha", "gamma"}});
}

TEST_CASE("merge on empty input emits nothing", "[merge]") {
    std::vector<Row> out;
    Merger merger(bindings_for({"0:sum"}), [&](const Row& row) { out.push_back(row); });
    REQUIRE_FALSE(merger.has_open_group());
    REQUIRE(merger.finish().has_value());
    REQUIRE(out.empty());
    REQUIRE(merger.groups_emitted() == 0);
}

TEST_CASE("merge tracks the open group and counters", "[merge]") {
    std::vector<Row> out;
    Merger merger(bindings_for({"1:sum"}), [&](const Row& row) { out.push_back(row); });

    REQUIRE(merger.push(Row{"a", "1"}).has_value());
    REQUIRE(merger.has_open_group());
    REQUIRE(out.empty());

    REQUIRE(merger.push(Row{"a", "2"}).has_value());
    REQUIRE(out.empty());

    REQUIRE(merger.push(Row{"b", "5"}).has_value());
    REQUIRE(out == std::vector<Row>{{"a", "3"}});

    REQUIRE(merger.finish().has_value());
    REQUIRE_FALSE(merger.has_open_group());
    REQUIRE(out == std::vector<Row>{{"a", "3"}, {"b", "5"}});
    REQUIRE(merger.rows_consumed() == 3);
    REQUIRE(merger.groups_emitted() == 2);
}

TEST_CASE("merge is idempotent on merged output", "[merge]") {
    std::vector<Row> rows{{"a", "1", "10"}, {"a", "1", "20"}, {"b", "2", "30"}, {"b", "2", "5"}};
    auto once = merged(rows, {"2:sum"});
    auto twice = merged(once, {"2:sum"});
    REQUIRE(twice == once);
}

TEST_CASE("merge fails on a field index past the end of the row", "[merge][errors]") {
    auto run = run_merge({{"a", "1", "10"}, {"a", "1", "20"}}, {"9:max"});
    REQUIRE_FALSE(run.status.has_value());
    REQUIRE(run.status.error().kind == ErrorKind::FieldIndexOutOfRange);
    REQUIRE(run.output.empty());
}

TEST_CASE("merge reports bad values when their group is flushed", "[merge][errors]") {
    SECTION("in the first group") {
        auto run = run_merge({{"a", "1"}, {"a", "x"}, {"b", "3"}}, {"1:sum"});
        REQUIRE_FALSE(run.status.has_value());
        REQUIRE(run.status.error().kind == ErrorKind::NonNumericValue);
        REQUIRE(run.output.empty());
    }

    SECTION("rows already emitted stay emitted") {
        auto run = run_merge({{"b", "1"}, {"a", "x"}, {"c", "2"}}, {"1:sum"});
        REQUIRE_FALSE(run.status.has_value());
        REQUIRE(run.status.error().kind == ErrorKind::NonNumericValue);
        REQUIRE(run.output == std::vector<Row>{{"b", "1"}});
    }

    SECTION("in the last group") {
        auto run = run_merge({{"b", "1"}, {"a", "x"}}, {"1:mean"});
        REQUIRE_FALSE(run.status.has_value());
        REQUIRE(run.status.error().kind == ErrorKind::NonNumericValue);
        REQUIRE(run.output == std::vector<Row>{{"b", "1"}});
    }
}

TEST_CASE("merge fails when a later row is too short", "[merge][errors]") {
    auto run = run_merge({{"a", "1", "2"}, {"b", "3"}}, {"2:sum"});
    REQUIRE_FALSE(run.status.has_value());
    REQUIRE(run.status.error().kind == ErrorKind::FieldIndexOutOfRange);
    REQUIRE(run.output == std::vector<Row>{{"a", "1", "2"}});
}
