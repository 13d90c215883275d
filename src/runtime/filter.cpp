#include <kodiak/parallel/fan_out.hpp>
#include <kodiak/runtime/filter.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace kodiak::runtime {

namespace {

/// Scan every chunk for matches and concatenate the per-chunk index lists
/// in chunk order, so the result is ascending however the workers finish.
template <typename T, typename Pred>
auto scan_matches(const Column<T>& column, const Pred& pred, const ExecConfig& config)
    -> IndexSet {
    auto partials =
        parallel::fan_out("filter", column.size(), config, [&](const parallel::Chunk& chunk) {
            IndexSet local;
            for (std::size_t i = chunk.start; i < chunk.end; ++i) {
                if (pred(column[i])) {
                    local.push_back(i);
                }
            }
            return local;
        });

    std::size_t total = 0;
    for (const auto& local : partials) {
        total += local.size();
    }
    IndexSet matched;
    matched.reserve(total);
    for (const auto& local : partials) {
        matched.insert(matched.end(), local.begin(), local.end());
    }
    return matched;
}

}  // namespace

auto filter(Series& series, const NumericPredicate& pred, const ExecConfig& config)
    -> IndexSet {
    if (!series.is_float()) {
        throw std::logic_error("filter: numeric predicate applied to a string series");
    }
    auto matched = scan_matches(series.float_column(), pred, config);
    take(series, matched);
    spdlog::debug("filter: kept {} rows", matched.size());
    return matched;
}

auto filter(Series& series, const TextPredicate& pred, const ExecConfig& config) -> IndexSet {
    if (!series.is_string()) {
        throw std::logic_error("filter: text predicate applied to a float series");
    }
    auto matched = scan_matches(series.string_column(), pred, config);
    take(series, matched);
    spdlog::debug("filter: kept {} rows", matched.size());
    return matched;
}

void take(Series& series, const IndexSet& indexes) {
    if (const auto* floats = series.get_if_float()) {
        series.assign(floats->gather(indexes));
    } else {
        series.assign(series.string_column().gather(indexes));
    }
}

}  // namespace kodiak::runtime
