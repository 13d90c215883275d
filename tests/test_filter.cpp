#include <kodiak/core/series.hpp>
#include <kodiak/runtime/filter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace kodiak;
using runtime::ExecConfig;
using runtime::IndexSet;

}  // namespace

TEST_CASE("filter keeps matches in order for 1..8 workers", "[runtime][filter]") {
    for (std::size_t workers = 1; workers <= 8; ++workers) {
        auto series = Series::floats({10, 20, 30, 40, 50});

        auto kept = runtime::filter(series, [](double v) { return v > 15.0; },
                                    ExecConfig{.workers = workers});

        REQUIRE(kept == IndexSet{1, 2, 3, 4});
        REQUIRE(series.float_column() == Column<double>{20, 30, 40, 50});
    }
}

TEST_CASE("filter preserves relative order of scattered matches", "[runtime][filter]") {
    std::vector<double> values;
    IndexSet expected;
    for (std::size_t i = 0; i < 1'000; ++i) {
        values.push_back(static_cast<double>(i));
        if (i % 7 == 3) {
            expected.push_back(i);
        }
    }

    for (std::size_t workers : {1U, 2U, 5U, 8U}) {
        auto series = Series::floats(values);
        auto kept = runtime::filter(
            series, [](double v) { return static_cast<std::size_t>(v) % 7 == 3; },
            ExecConfig{.workers = workers});

        REQUIRE(kept == expected);
        REQUIRE(series.size() == expected.size());
        for (std::size_t j = 0; j < expected.size(); ++j) {
            REQUIRE(series.float_column()[j] == static_cast<double>(expected[j]));
        }
    }
}

TEST_CASE("filter on a string series", "[runtime][filter]") {
    auto series = Series::strings({"apple", "banana", "avocado", "cherry"}, "fruit");

    auto kept = runtime::filter(
        series, [](const std::string& s) { return !s.empty() && s.front() == 'a'; },
        ExecConfig{.workers = 3});

    REQUIRE(kept == IndexSet{0, 2});
    REQUIRE(series.string_column() == Column<std::string>{"apple", "avocado"});
    REQUIRE(series.name() == "fruit");
}

TEST_CASE("filter edge cases", "[runtime][filter]") {
    SECTION("empty series") {
        auto series = Series::floats({});
        auto kept = runtime::filter(series, [](double) { return true; });
        REQUIRE(kept.empty());
        REQUIRE(series.empty());
        REQUIRE(series.is_float());
    }

    SECTION("no matches empties the series") {
        auto series = Series::floats({1, 2, 3});
        auto kept = runtime::filter(series, [](double v) { return v > 100.0; },
                                    ExecConfig{.workers = 2});
        REQUIRE(kept.empty());
        REQUIRE(series.empty());
    }
}

TEST_CASE("filter predicate must match the series type", "[runtime][filter]") {
    auto numbers = Series::floats({1, 2, 3});
    auto text = Series::strings({"a", "b"});
    auto numbers_before = numbers;
    auto text_before = text;

    REQUIRE_THROWS_AS(runtime::filter(numbers, [](const std::string&) { return true; }),
                      std::logic_error);
    REQUIRE_THROWS_AS(runtime::filter(text, [](double) { return true; }), std::logic_error);
    REQUIRE(numbers == numbers_before);
    REQUIRE(text == text_before);
}

TEST_CASE("take compacts to the given rows", "[runtime][filter]") {
    auto series = Series::strings({"a", "b", "c", "d"});
    runtime::take(series, IndexSet{0, 3});
    REQUIRE(series.string_column() == Column<std::string>{"a", "d"});

    auto before = series;
    REQUIRE_THROWS_AS(runtime::take(series, IndexSet{5}), std::out_of_range);
    REQUIRE(series == before);
}
