#pragma once

#include <kodiak/core/error.hpp>
#include <kodiak/core/series.hpp>
#include <kodiak/parallel/config.hpp>
#include <kodiak/parallel/fan_out.hpp>

#include <concepts>
#include <span>

namespace kodiak::runtime {

using parallel::ExecConfig;

// ─── Generic fan-out / fan-in reduction ───────────────────────────────────────

/// Parallel fold: each worker folds `fold(acc, element)` over its chunk
/// starting from `identity`; the per-chunk accumulators are merged with
/// `combine` on the calling thread, in chunk order.
///
/// `combine` must be associative and commutative with `identity` as its
/// neutral element.
template <typename Acc, typename T, typename Fold, typename Combine>
    requires std::invocable<Fold&, Acc, const T&> && std::invocable<Combine&, Acc, Acc>
[[nodiscard]] auto map_reduce(std::span<const T> values, Acc identity, Fold fold,
                              Combine combine, const ExecConfig& config = {}) -> Acc {
    auto partials = parallel::fan_out(
        "reduce", values.size(), config, [&](const parallel::Chunk& chunk) -> Acc {
            Acc acc = identity;
            for (std::size_t i = chunk.start; i < chunk.end; ++i) {
                acc = fold(acc, values[i]);
            }
            return acc;
        });
    Acc result = identity;
    for (const auto& partial : partials) {
        result = combine(result, partial);
    }
    return result;
}

/// map_reduce where the element fold and the partial merge are the same
/// operation.
template <typename T, typename Combine>
    requires std::invocable<Combine&, T, const T&>
[[nodiscard]] auto reduce(std::span<const T> values, T identity, Combine combine,
                          const ExecConfig& config = {}) -> T {
    return map_reduce(values, identity, combine, combine, config);
}

// ─── Series reductions ────────────────────────────────────────────────────────
//  All of these fail with WrongColumnType on a textual series and with
//  EmptySeries on a series of length 0.

[[nodiscard]] auto sum(const Series& series, const ExecConfig& config = {}) -> Result<double>;
[[nodiscard]] auto product(const Series& series, const ExecConfig& config = {}) -> Result<double>;
[[nodiscard]] auto min(const Series& series, const ExecConfig& config = {}) -> Result<double>;
[[nodiscard]] auto max(const Series& series, const ExecConfig& config = {}) -> Result<double>;
[[nodiscard]] auto mean(const Series& series, const ExecConfig& config = {}) -> Result<double>;

/// Population variance (divisor = length) around a freshly computed mean.
[[nodiscard]] auto variance(const Series& series, const ExecConfig& config = {})
    -> Result<double>;

/// Population variance around a caller-supplied mean.
[[nodiscard]] auto variance(const Series& series, double mean, const ExecConfig& config = {})
    -> Result<double>;

/// Population standard deviation.
[[nodiscard]] auto std_dev(const Series& series, const ExecConfig& config = {})
    -> Result<double>;

}  // namespace kodiak::runtime
