#pragma once

#include <kodiak/core/series.hpp>
#include <kodiak/parallel/config.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kodiak::runtime {

using parallel::ExecConfig;

// ─── Diagnostic queries ───────────────────────────────────────────────────────
//  Total over both variants: on a numeric series they return an empty
//  result instead of an error.

/// Number of whitespace-separated tokens equal to `token` across all
/// elements. 0 for a numeric series or an empty token.
[[nodiscard]] auto count_word(const Series& series, std::string_view token) -> std::size_t;

/// Elements of a textual series that parse_number() rejects, in series
/// order. Use before to_numeric() to see what would fail.
[[nodiscard]] auto non_numeric_values(const Series& series) -> std::vector<std::string>;

struct ValueCount {
    std::string value;
    std::size_t count = 0;

    auto operator==(const ValueCount&) const -> bool = default;
};

/// Distinct values of a textual series with their frequencies, most
/// frequent first (ties by value, ascending).
[[nodiscard]] auto value_counts(const Series& series, const ExecConfig& config = {})
    -> std::vector<ValueCount>;

}  // namespace kodiak::runtime
