#include <kodiak/parallel/config.hpp>
#include <kodiak/parallel/partition.hpp>

#include <algorithm>
#include <thread>

namespace kodiak::parallel {

auto resolve_workers(const ExecConfig& config) noexcept -> std::size_t {
    if (config.workers > 0) {
        return config.workers;
    }
    return std::max<unsigned>(1, std::thread::hardware_concurrency());
}

auto partition(std::size_t length, std::size_t workers) -> std::vector<Chunk> {
    std::vector<Chunk> chunks;
    if (length == 0) {
        return chunks;
    }
    workers = std::max<std::size_t>(1, workers);
    // Rounded-up division without forming length + workers, which can wrap.
    const std::size_t chunk = length / workers + (length % workers != 0 ? 1 : 0);
    chunks.reserve(std::min(length, workers));
    for (std::size_t t = 0; t < workers; ++t) {
        std::size_t start = t * chunk;
        if (start >= length) {
            break;
        }
        chunks.push_back(Chunk{.start = start, .end = std::min(length, start + chunk)});
    }
    return chunks;
}

}  // namespace kodiak::parallel
