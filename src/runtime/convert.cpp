#include <kodiak/parallel/fan_out.hpp>
#include <kodiak/runtime/convert.hpp>

#include <array>
#include <atomic>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <vector>

namespace kodiak::runtime {

namespace {

constexpr std::size_t kNoFailure = std::numeric_limits<std::size_t>::max();

/// Per-chunk outcome of to_numeric: the parsed values, or the first index
/// in the chunk that failed to parse.
struct ChunkParse {
    std::vector<double> values;
    std::optional<std::size_t> failure;
};

/// Lower the shared failure hint to `index` if it is smaller.
void publish_failure(std::atomic<std::size_t>& hint, std::size_t index) {
    std::size_t current = hint.load(std::memory_order_relaxed);
    while (index < current &&
           !hint.compare_exchange_weak(current, index, std::memory_order_relaxed)) {
    }
}

}  // namespace

auto parse_number(std::string_view text) -> std::optional<double> {
    // from_chars rejects a leading '+', strtod-style input accepts it.
    if (text.size() > 1 && text.front() == '+' && text[1] != '-') {
        text.remove_prefix(1);
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    double out = 0.0;
    auto result = std::from_chars(begin, end, out);
    if (text.empty() || result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return out;
}

auto format_number(double value) -> std::string {
    // Plain decimal, never exponent notation. Subnormals need the most room:
    // over three hundred leading zeros before the significant digits.
    std::array<char, 512> buffer{};
    auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                std::chars_format::fixed);
    if (result.ec != std::errc()) {
        throw std::length_error("format_number: buffer too small");
    }
    return std::string(buffer.data(), result.ptr);
}

auto to_numeric(Series& series, const ExecConfig& config) -> Result<void> {
    const auto* strings = series.get_if_string();
    if (strings == nullptr) {
        return {};
    }
    const auto& text = *strings;

    // Lowest failing index any worker has seen so far. Only used to skip
    // work that can no longer change the outcome; the reported index comes
    // from the per-chunk results below.
    std::atomic<std::size_t> failure_hint{kNoFailure};

    auto partials =
        parallel::fan_out("to_numeric", text.size(), config, [&](const parallel::Chunk& chunk) {
            ChunkParse local;
            local.values.reserve(chunk.size());
            for (std::size_t i = chunk.start; i < chunk.end; ++i) {
                if (i > failure_hint.load(std::memory_order_relaxed)) {
                    break;
                }
                auto value = parse_number(text[i]);
                if (!value) {
                    local.failure = i;
                    publish_failure(failure_hint, i);
                    break;
                }
                local.values.push_back(*value);
            }
            return local;
        });

    std::optional<std::size_t> first_failure;
    for (const auto& local : partials) {
        if (local.failure && (!first_failure || *local.failure < *first_failure)) {
            first_failure = local.failure;
        }
    }
    if (first_failure) {
        return std::unexpected(parse_failure(*first_failure, text[*first_failure]));
    }

    std::vector<double> values;
    values.reserve(text.size());
    for (auto& local : partials) {
        values.insert(values.end(), local.values.begin(), local.values.end());
    }
    series.assign(Series::FloatColumn{std::move(values)});
    return {};
}

void to_text(Series& series, const ExecConfig& config) {
    const auto* floats = series.get_if_float();
    if (floats == nullptr) {
        return;
    }
    const auto& numbers = *floats;

    // Each worker writes only the slots of its own chunk.
    std::vector<std::string> text(numbers.size());
    parallel::for_each_chunk("to_text", numbers.size(), config,
                             [&](const parallel::Chunk& chunk) {
                                 for (std::size_t i = chunk.start; i < chunk.end; ++i) {
                                     text[i] = format_number(numbers[i]);
                                 }
                             });
    series.assign(Series::StringColumn{std::move(text)});
}

}  // namespace kodiak::runtime
