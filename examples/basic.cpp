#include <kodiak/kodiak.hpp>

#include <fmt/core.h>

auto main() -> int {
    namespace rt = kodiak::runtime;

    // A numeric series of prices
    auto prices = kodiak::Series::floats({100.5, 200.3, 50.0, 175.8, 320.1}, "price");

    fmt::print("=== Reductions ===\n");
    fmt::print("prices: {} elements\n", prices.size());
    if (auto total = rt::sum(prices)) {
        fmt::print("sum: {}\n", *total);
    }
    if (auto avg = rt::mean(prices)) {
        fmt::print("mean: {}\n", *avg);
    }
    if (auto med = rt::median(prices)) {
        fmt::print("median: {}\n", *med);
    }

    // Filter: keep prices above 100, pinned to two workers
    const rt::ExecConfig two_workers{.workers = 2};
    auto kept = rt::filter(prices, rt::NumericPredicate{[](double p) { return p > 100.0; }},
                           two_workers);
    fmt::print("prices > 100: {} elements, first kept row {}\n", prices.size(), kept.front());

    fmt::print("\n=== Conversion ===\n");
    auto raw = kodiak::Series::strings({"1.5", "n/a", "3"}, "qty");
    for (const auto& bad : rt::non_numeric_values(raw)) {
        fmt::print("not numeric: {}\n", bad);
    }
    if (auto converted = rt::to_numeric(raw); !converted) {
        fmt::print("conversion rejected: {}\n", converted.error().format());
    }
    rt::replace(raw, "n/a", "0");
    if (auto converted = rt::to_numeric(raw); converted) {
        fmt::print("qty is now {} with {} values\n", kodiak::to_string(raw.kind()), raw.size());
    }

    return 0;
}
