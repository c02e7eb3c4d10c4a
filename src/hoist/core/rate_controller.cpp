// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hoist/core/rate_controller.hpp>

namespace hoist::core {

RateController::RateController(std::uint32_t max_concurrent, double target_rate_bps,
                               std::chrono::milliseconds under_target,
                               std::chrono::milliseconds over_target) noexcept
    : max_concurrent_(max_concurrent)
    , target_rate_bps_(target_rate_bps)
    , under_target_(under_target)
    , over_target_(over_target) {}

double RateController::rate(const UploadTracker& tracker,
                            std::chrono::steady_clock::time_point now) noexcept {
    auto elapsed = std::chrono::duration<double>(now - tracker.start_time).count();
    if (elapsed <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(tracker.bytes_uploaded) / elapsed;
}

bool RateController::should_admit(const UploadTracker& tracker,
                                  std::chrono::steady_clock::time_point now) const noexcept {
    if (tracker.active_uploads >= max_concurrent_) {
        return false;
    }

    // Nothing in flight: always admit so a rate blip can't stall the session
    return tracker.active_uploads == 0 || rate(tracker, now) < target_rate_bps_;
}

std::chrono::milliseconds RateController::pacing_delay(const UploadTracker& tracker,
                                                       std::chrono::steady_clock::time_point now) const noexcept {
    return rate(tracker, now) > target_rate_bps_ ? over_target_ : under_target_;
}

} // namespace hoist::core
