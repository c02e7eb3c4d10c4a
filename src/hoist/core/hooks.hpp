// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hoist/core/upload_config.hpp>
#include <spdlog/spdlog.h>
#include <exception>

// Observer hooks are side channels. A throwing hook is logged and ignored.
namespace hoist::core::detail {

inline void notify_progress(const ProgressHook& hook, std::uint64_t identity,
                            std::uint64_t amount, std::string_view status) noexcept {
    if (!hook) return;
    try {
        hook(identity, amount, status);
    } catch (const std::exception& e) {
        spdlog::warn("progress hook threw: {}", e.what());
    } catch (...) {
        spdlog::warn("progress hook threw a non-standard exception");
    }
}

inline void notify_rate(const RateHook& hook, double rate_bps) noexcept {
    if (!hook) return;
    try {
        hook(rate_bps);
    } catch (const std::exception& e) {
        spdlog::warn("rate hook threw: {}", e.what());
    } catch (...) {
        spdlog::warn("rate hook threw a non-standard exception");
    }
}

} // namespace hoist::core::detail
