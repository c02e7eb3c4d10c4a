// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hoist/core/config.hpp>
#include <hoist/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace hoist::core {

// (identity, size or total, status). Identity is the completed count in
// sequential mode and the chunk ID in parallel mode.
using ProgressHook = std::function<void(std::uint64_t, std::uint64_t, std::string_view)>;

// Current throughput estimate in bytes per second
using RateHook = std::function<void(double)>;

// Run configuration, shared by the sequential uploader and the parallel scheduler.
// Hooks are side channels: they never change control flow.
struct UploadConfig {
    std::uint32_t max_retries{DEFAULT_MAX_RETRIES};       // Attempts per chunk
    std::chrono::milliseconds retry_delay{DEFAULT_RETRY_DELAY};
    std::uint32_t max_concurrent{DEFAULT_MAX_CONCURRENT};
    double target_rate_bps{DEFAULT_TARGET_RATE_BPS};
    bool auto_resume{false};                              // Sequential mode only
    std::string failed_manifest_path;                     // Written on partial failure if set

    ProgressHook progress_hook;
    RateHook rate_hook;

    [[nodiscard]] std::error_code validate() const noexcept;
};

// Overlay a JSON config file onto `base`. Keys: max_retries, retry_delay_ms,
// max_concurrent, target_rate_mibs, auto_resume, failed_manifest.
[[nodiscard]] std::expected<UploadConfig, std::error_code>
load_config(std::string_view path, UploadConfig base = {});

// Same, from an in-memory document
[[nodiscard]] std::expected<UploadConfig, std::error_code>
parse_config(std::string_view json_text, UploadConfig base = {});

} // namespace hoist::core
