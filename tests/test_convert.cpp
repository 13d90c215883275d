#include <kodiak/core/series.hpp>
#include <kodiak/runtime/convert.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace {

using namespace kodiak;
using runtime::ExecConfig;

}  // namespace

TEST_CASE("parse_number accepts whole numeric text only", "[runtime][convert]") {
    REQUIRE(runtime::parse_number("1.5") == 1.5);
    REQUIRE(runtime::parse_number("-3") == -3.0);
    REQUIRE(runtime::parse_number("+4.25") == 4.25);
    REQUIRE(runtime::parse_number("1e3") == 1000.0);
    REQUIRE(runtime::parse_number("inf") == std::numeric_limits<double>::infinity());
    REQUIRE(std::isnan(*runtime::parse_number("nan")));

    REQUIRE_FALSE(runtime::parse_number("").has_value());
    REQUIRE_FALSE(runtime::parse_number("+").has_value());
    REQUIRE_FALSE(runtime::parse_number("x").has_value());
    REQUIRE_FALSE(runtime::parse_number("1.5x").has_value());
    REQUIRE_FALSE(runtime::parse_number(" 2").has_value());
    REQUIRE_FALSE(runtime::parse_number("+-2").has_value());
}

TEST_CASE("format_number prints the shortest round-trip text", "[runtime][convert]") {
    REQUIRE(runtime::format_number(1.5) == "1.5");
    REQUIRE(runtime::format_number(2.0) == "2");
    REQUIRE(runtime::format_number(-0.25) == "-0.25");
    REQUIRE(runtime::format_number(0.1) == "0.1");
    REQUIRE(runtime::parse_number(runtime::format_number(1.0 / 3.0)) == 1.0 / 3.0);
}

TEST_CASE("format_number never switches to exponent notation", "[runtime][convert]") {
    REQUIRE(runtime::format_number(1e16) == "10000000000000000");
    REQUIRE(runtime::format_number(1e20) == "100000000000000000000");
    REQUIRE(runtime::format_number(1e-7) == "0.0000001");
    REQUIRE(runtime::format_number(0.00001) == "0.00001");
    REQUIRE(runtime::format_number(-2.5e-6) == "-0.0000025");

    const double tiny = std::numeric_limits<double>::denorm_min();
    REQUIRE(runtime::parse_number(runtime::format_number(tiny)) == tiny);
    const double huge = std::numeric_limits<double>::max();
    REQUIRE(runtime::parse_number(runtime::format_number(huge)) == huge);
}

TEST_CASE("to_numeric then to_text", "[runtime][convert]") {
    for (std::size_t workers = 1; workers <= 4; ++workers) {
        const ExecConfig config{.workers = workers};
        auto series = Series::strings({"1.5", "2.0", "3"}, "qty");

        auto converted = runtime::to_numeric(series, config);
        REQUIRE(converted.has_value());
        REQUIRE(series.is_float());
        REQUIRE(series.float_column() == Column<double>{1.5, 2.0, 3.0});

        runtime::to_text(series, config);
        REQUIRE(series.is_string());
        REQUIRE(series.string_column() == Column<std::string>{"1.5", "2", "3"});
        REQUIRE(series.name() == "qty");
    }
}

TEST_CASE("to_numeric failure leaves the series unchanged", "[runtime][convert]") {
    for (std::size_t workers = 1; workers <= 8; ++workers) {
        auto series = Series::strings({"1.5", "x", "3"});

        auto converted = runtime::to_numeric(series, ExecConfig{.workers = workers});

        REQUIRE_FALSE(converted.has_value());
        REQUIRE(converted.error().kind == ErrorKind::ParseFailure);
        REQUIRE(converted.error().index == 1);
        REQUIRE(converted.error().value == "x");
        REQUIRE(series.is_string());
        REQUIRE(series.string_column() == Column<std::string>{"1.5", "x", "3"});
    }
}

TEST_CASE("to_numeric reports the lowest failing index", "[runtime][convert]") {
    std::vector<std::string> values(200, "1");
    values[37] = "bad";
    values[38] = "worse";
    values[150] = "?";
    values[199] = "";

    for (std::size_t workers = 1; workers <= 8; ++workers) {
        auto series = Series::strings(values);
        auto converted = runtime::to_numeric(series, ExecConfig{.workers = workers});
        REQUIRE_FALSE(converted.has_value());
        REQUIRE(converted.error().index == 37);
        REQUIRE(converted.error().value == "bad");
        REQUIRE(series.string_column().size() == 200);
    }

    SECTION("message carries index and value") {
        auto series = Series::strings(values);
        auto converted = runtime::to_numeric(series);
        REQUIRE(converted.error().format() ==
                "parse failure: value is not numeric (index 37, value \"bad\")");
    }
}

TEST_CASE("conversions are no-ops on the matching type", "[runtime][convert]") {
    auto numbers = Series::floats({1.0, 2.5});
    auto before = numbers;
    REQUIRE(runtime::to_numeric(numbers).has_value());
    REQUIRE(numbers == before);

    auto text = Series::strings({"a"});
    auto text_before = text;
    runtime::to_text(text);
    REQUIRE(text == text_before);
}

TEST_CASE("empty series conversions flip the tag", "[runtime][convert]") {
    auto series = Series::strings({});
    REQUIRE(runtime::to_numeric(series).has_value());
    REQUIRE(series.is_float());
    REQUIRE(series.empty());

    runtime::to_text(series);
    REQUIRE(series.is_string());
    REQUIRE(series.empty());
}
