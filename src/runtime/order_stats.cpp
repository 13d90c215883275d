#include <kodiak/runtime/order_stats.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <exception>
#include <string_view>
#include <thread>
#include <vector>

namespace kodiak::runtime {

namespace {

auto nan_last_less(double lhs, double rhs) -> bool {
    if (std::isnan(lhs)) {
        return false;
    }
    return std::isnan(rhs) || lhs < rhs;
}

void merge_sort(std::span<double> values, std::size_t depth, std::size_t threshold) {
    if (values.size() <= threshold || depth == 0) {
        std::sort(values.begin(), values.end(), nan_last_less);
        return;
    }
    const std::size_t mid = values.size() / 2;
    auto left = values.first(mid);
    auto right = values.subspan(mid);
    // Both halves must finish before either failure is rethrown, or the
    // joinable thread would terminate the process on unwind.
    std::exception_ptr left_failure;
    std::exception_ptr right_failure;
    std::thread left_worker([left, depth, threshold, &left_failure] {
        try {
            merge_sort(left, depth - 1, threshold);
        } catch (...) {
            left_failure = std::current_exception();
        }
    });
    try {
        merge_sort(right, depth - 1, threshold);
    } catch (...) {
        right_failure = std::current_exception();
    }
    left_worker.join();
    if (left_failure) {
        std::rethrow_exception(left_failure);
    }
    if (right_failure) {
        std::rethrow_exception(right_failure);
    }
    std::inplace_merge(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid),
                       values.end(), nan_last_less);
}

/// Sorted private copy of a numeric series, or the error the caller reports.
auto sorted_copy(const Series& series, std::string_view operation, const ExecConfig& config)
    -> Result<std::vector<double>> {
    const auto* column = series.get_if_float();
    if (column == nullptr) {
        return std::unexpected(wrong_column_type(operation, "float"));
    }
    if (column->empty()) {
        return std::unexpected(empty_series(operation));
    }
    std::vector<double> values(column->begin(), column->end());
    parallel_sort(values, config);
    return values;
}

}  // namespace

void parallel_sort(std::span<double> values, const ExecConfig& config,
                   std::size_t sequential_threshold) {
    // Each level of recursion doubles the number of running threads.
    const std::size_t workers = parallel::resolve_workers(config);
    const auto depth = static_cast<std::size_t>(std::bit_width(workers - 1));
    spdlog::debug("sort: {} rows, split depth {}", values.size(), depth);
    merge_sort(values, depth, std::max<std::size_t>(1, sequential_threshold));
}

auto median(const Series& series, const ExecConfig& config) -> Result<double> {
    auto sorted = sorted_copy(series, "median", config);
    if (!sorted) {
        return std::unexpected(sorted.error());
    }
    const auto& values = *sorted;
    const std::size_t n = values.size();
    if (n % 2 == 1) {
        return values[n / 2];
    }
    return (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

auto percentile(const Series& series, double p, const ExecConfig& config) -> Result<double> {
    if (std::isnan(p) || p < 0.0 || p > 100.0) {
        return std::unexpected(invalid_argument("percentile must be within [0, 100]"));
    }
    auto sorted = sorted_copy(series, "percentile", config);
    if (!sorted) {
        return std::unexpected(sorted.error());
    }
    const auto& values = *sorted;
    const std::size_t n = values.size();
    // Rank over the N - 1 gaps between sorted values, so p == 50 agrees with median().
    const double idx = (p / 100.0) * static_cast<double>(n - 1);
    const std::size_t lower = std::min(static_cast<std::size_t>(idx), n - 1);
    const std::size_t upper = lower + 1;
    const double weight = idx - static_cast<double>(lower);
    if (upper >= n) {
        return values[lower];
    }
    return values[lower] * (1.0 - weight) + values[upper] * weight;
}

}  // namespace kodiak::runtime
