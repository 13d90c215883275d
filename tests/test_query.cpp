#include <kodiak/core/series.hpp>
#include <kodiak/runtime/query.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

using namespace kodiak;
using runtime::ExecConfig;
using runtime::ValueCount;

}  // namespace

TEST_CASE("count_word counts exact tokens", "[runtime][query]") {
    auto series = Series::strings({"the cat and the hat", "The end", "thethe", "  the\tthe  "});

    REQUIRE(runtime::count_word(series, "the") == 4);
    REQUIRE(runtime::count_word(series, "The") == 1);
    REQUIRE(runtime::count_word(series, "dog") == 0);
    REQUIRE(runtime::count_word(series, "") == 0);
}

TEST_CASE("count_word on a numeric series is zero", "[runtime][query]") {
    REQUIRE(runtime::count_word(Series::floats({1.0, 2.0}), "1") == 0);
}

TEST_CASE("non_numeric_values lists rejects in order", "[runtime][query]") {
    auto series = Series::strings({"1", "one", "2.5", "", "3e2", "n/a"});

    REQUIRE(runtime::non_numeric_values(series) == std::vector<std::string>{"one", "", "n/a"});
    REQUIRE(runtime::non_numeric_values(Series::strings({"1", "2"})).empty());
    REQUIRE(runtime::non_numeric_values(Series::floats({1.0})).empty());
}

TEST_CASE("value_counts merges per-chunk counts", "[runtime][query]") {
    auto series = Series::strings({"b", "a", "c", "a", "b", "a", "d"});

    for (std::size_t workers = 1; workers <= 8; ++workers) {
        auto counts = runtime::value_counts(series, ExecConfig{.workers = workers});
        REQUIRE(counts == std::vector<ValueCount>{{"a", 3}, {"b", 2}, {"c", 1}, {"d", 1}});
    }
}

TEST_CASE("value_counts on numeric or empty series is empty", "[runtime][query]") {
    REQUIRE(runtime::value_counts(Series::floats({1.0})).empty());
    REQUIRE(runtime::value_counts(Series::strings({})).empty());
}
