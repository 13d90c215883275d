#pragma once

#include <kodiak/core/error.hpp>
#include <kodiak/core/series.hpp>
#include <kodiak/parallel/config.hpp>

#include <cstddef>
#include <span>

namespace kodiak::runtime {

using parallel::ExecConfig;

/// Ranges at or below this size are sorted sequentially.
inline constexpr std::size_t kSequentialSortThreshold = 16'384;

/// Parallel merge sort in ascending order; NaN values sort last.
///
/// The range is halved recursively, the halves are sorted on separate
/// threads until the worker budget is spent or a half falls to
/// `sequential_threshold`, and sorted halves are merged in place.
void parallel_sort(std::span<double> values, const ExecConfig& config = {},
                   std::size_t sequential_threshold = kSequentialSortThreshold);

/// Median of a numeric series, computed on a private sorted copy.
/// Even length yields the mean of the two central values.
[[nodiscard]] auto median(const Series& series, const ExecConfig& config = {})
    -> Result<double>;

/// Linearly interpolated percentile, `p` in [0, 100], on a private sorted
/// copy: idx = p/100 * (N - 1), interpolating between floor(idx) and
/// floor(idx) + 1.
[[nodiscard]] auto percentile(const Series& series, double p, const ExecConfig& config = {})
    -> Result<double>;

}  // namespace kodiak::runtime
