#pragma once

#include <kodiak/parallel/config.hpp>
#include <kodiak/parallel/partition.hpp>

#include <spdlog/spdlog.h>

#include <concepts>
#include <exception>
#include <string_view>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

namespace kodiak::parallel {

/// Run `worker` once per chunk of [0, length) and return the partial
/// results indexed by chunk (chunk 0 first), whatever order the workers
/// finish in.
///
/// A fresh set of threads is spawned per call and joined before returning;
/// a single chunk runs on the calling thread. The worker must only read
/// shared state, or write to indexes inside its own chunk. An exception
/// thrown by a worker is rethrown here after every worker has joined
/// (lowest chunk first).
template <typename Worker>
    requires std::invocable<Worker&, const Chunk&>
[[nodiscard]] auto fan_out(std::string_view operation, std::size_t length,
                           const ExecConfig& config, Worker&& worker)
    -> std::vector<std::invoke_result_t<Worker&, const Chunk&>> {
    using Partial = std::invoke_result_t<Worker&, const Chunk&>;
    static_assert(!std::is_void_v<Partial>, "fan_out workers must return a partial result");
    // std::vector<bool> packs bits, so neighbouring chunks would share a word.
    static_assert(!std::is_same_v<Partial, bool>, "fan_out partials must not be bool");

    const auto chunks = partition(length, resolve_workers(config));
    spdlog::debug("{}: {} rows across {} chunk(s)", operation, length, chunks.size());

    std::vector<Partial> partials(chunks.size());
    if (chunks.size() <= 1) {
        for (std::size_t c = 0; c < chunks.size(); ++c) {
            partials[c] = worker(chunks[c]);
        }
        return partials;
    }

    std::vector<std::exception_ptr> failures(chunks.size());
    std::vector<std::thread> threads;
    threads.reserve(chunks.size());
    auto join_all = [&threads] {
        for (auto& th : threads) {
            if (th.joinable()) {
                th.join();
            }
        }
    };

    try {
        for (std::size_t c = 0; c < chunks.size(); ++c) {
            threads.emplace_back([&, c] {
                try {
                    partials[c] = worker(chunks[c]);
                } catch (...) {
                    failures[c] = std::current_exception();
                }
            });
        }
    } catch (...) {
        // Thread creation failed: wait for the ones already running.
        join_all();
        throw;
    }
    join_all();

    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }
    return partials;
}

/// fan_out for workers that only write into their own chunk and produce
/// no partial result.
template <typename Worker>
    requires std::invocable<Worker&, const Chunk&>
void for_each_chunk(std::string_view operation, std::size_t length, const ExecConfig& config,
                    Worker&& worker) {
    auto done = fan_out(operation, length, config, [&worker](const Chunk& chunk) {
        worker(chunk);
        return std::monostate{};
    });
    static_cast<void>(done);
}

}  // namespace kodiak::parallel
