#pragma once

#include <cstddef>
#include <vector>

namespace kodiak::parallel {

/// Half-open index range [start, end) handled by one worker.
struct Chunk {
    std::size_t start = 0;
    std::size_t end = 0;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return end - start; }
    auto operator==(const Chunk&) const -> bool = default;
};

/// Split [0, length) into at most `workers` contiguous chunks of
/// ceil(length / workers) elements; the last chunk may be shorter.
///
/// Chunks are ordered, disjoint, non-empty and cover [0, length) exactly.
/// length == 0 yields no chunks; workers == 0 is treated as 1.
[[nodiscard]] auto partition(std::size_t length, std::size_t workers) -> std::vector<Chunk>;

}  // namespace kodiak::parallel
