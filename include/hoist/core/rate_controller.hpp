// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hoist/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <set>

namespace hoist::core {

// Per-session upload bookkeeping. Owned by the scheduler's coordinator.
struct UploadTracker {
    std::uint64_t bytes_uploaded{0};
    std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};
    std::uint32_t active_uploads{0};
    std::set<std::uint32_t> completed_chunk_ids;
};

// Coarse feedback loop toward a target rate. Not a token bucket: chunk
// transfer latency dominates the polling granularity.
class RateController {
public:
    RateController(std::uint32_t max_concurrent, double target_rate_bps,
                   std::chrono::milliseconds under_target = PACING_UNDER_TARGET,
                   std::chrono::milliseconds over_target = PACING_OVER_TARGET) noexcept;

    // bytes_uploaded / elapsed seconds; 0 until time has passed
    [[nodiscard]] static double rate(const UploadTracker& tracker,
                                     std::chrono::steady_clock::time_point now) noexcept;

    // Admit iff a slot is free and we are under target, or nothing is in flight
    [[nodiscard]] bool should_admit(const UploadTracker& tracker,
                                    std::chrono::steady_clock::time_point now) const noexcept;

    // Pause before the next scheduling pass
    [[nodiscard]] std::chrono::milliseconds pacing_delay(const UploadTracker& tracker,
                                                         std::chrono::steady_clock::time_point now) const noexcept;

    [[nodiscard]] std::uint32_t max_concurrent() const noexcept { return max_concurrent_; }
    [[nodiscard]] double target_rate() const noexcept { return target_rate_bps_; }

private:
    std::uint32_t max_concurrent_;
    double target_rate_bps_;
    std::chrono::milliseconds under_target_;
    std::chrono::milliseconds over_target_;
};

} // namespace hoist::core
