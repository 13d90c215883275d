#include <kodiak/parallel/fan_out.hpp>
#include <kodiak/runtime/convert.hpp>
#include <kodiak/runtime/query.hpp>

#include <robin_hood.h>

#include <algorithm>

namespace kodiak::runtime {

namespace {

auto is_space(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

auto count_tokens(std::string_view text, std::string_view token) -> std::size_t {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && is_space(text[pos])) {
            ++pos;
        }
        std::size_t start = pos;
        while (pos < text.size() && !is_space(text[pos])) {
            ++pos;
        }
        if (pos > start && text.substr(start, pos - start) == token) {
            ++count;
        }
    }
    return count;
}

// Keys view into the series, which outlives the maps.
using CountMap = robin_hood::unordered_flat_map<std::string_view, std::size_t>;

}  // namespace

auto count_word(const Series& series, std::string_view token) -> std::size_t {
    const auto* strings = series.get_if_string();
    if (strings == nullptr || token.empty()) {
        return 0;
    }
    std::size_t count = 0;
    for (const auto& value : *strings) {
        count += count_tokens(value, token);
    }
    return count;
}

auto non_numeric_values(const Series& series) -> std::vector<std::string> {
    std::vector<std::string> rejected;
    const auto* strings = series.get_if_string();
    if (strings == nullptr) {
        return rejected;
    }
    for (const auto& value : *strings) {
        if (!parse_number(value)) {
            rejected.push_back(value);
        }
    }
    return rejected;
}

auto value_counts(const Series& series, const ExecConfig& config) -> std::vector<ValueCount> {
    std::vector<ValueCount> counts;
    const auto* strings = series.get_if_string();
    if (strings == nullptr) {
        return counts;
    }
    const auto& column = *strings;

    auto partials = parallel::fan_out(
        "value_counts", column.size(), config, [&](const parallel::Chunk& chunk) {
            CountMap local;
            for (std::size_t i = chunk.start; i < chunk.end; ++i) {
                ++local[std::string_view(column[i])];
            }
            return local;
        });

    CountMap merged;
    for (const auto& local : partials) {
        for (const auto& entry : local) {
            merged[entry.first] += entry.second;
        }
    }

    counts.reserve(merged.size());
    for (const auto& entry : merged) {
        counts.push_back(ValueCount{.value = std::string(entry.first), .count = entry.second});
    }
    std::sort(counts.begin(), counts.end(), [](const ValueCount& a, const ValueCount& b) {
        if (a.count != b.count) {
            return a.count > b.count;
        }
        return a.value < b.value;
    });
    return counts;
}

}  // namespace kodiak::runtime
