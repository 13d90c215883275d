#pragma once

#include <cstddef>

namespace kodiak::parallel {

/// Execution settings for one parallel operation.
struct ExecConfig {
    /// Number of workers to fan out to. 0 selects the platform default
    /// (hardware concurrency), resolved again on every call.
    std::size_t workers = 0;
};

/// Worker count for a call: the explicit setting, or the hardware
/// concurrency at call time. Never less than 1.
[[nodiscard]] auto resolve_workers(const ExecConfig& config) noexcept -> std::size_t;

}  // namespace kodiak::parallel
