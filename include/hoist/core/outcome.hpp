// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hoist/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace hoist::core {

enum class UploadStatus : std::uint8_t {
    success,          // Every submitted chunk landed
    partial_failure,  // Some chunks failed permanently (parallel)
    failed,           // Nothing to resume from, or no chunk landed
    interrupted       // Sequential retries exhausted; resumable
};

// Snapshot of a session's tracker, taken when the session ends
struct UploadStats {
    std::uint64_t bytes_uploaded{0};
    std::chrono::steady_clock::duration elapsed{};
    double rate_bps{0.0};
};

struct UploadOutcome {
    UploadStatus status{UploadStatus::failed};
    std::error_code error;
    std::string reason;

    std::vector<std::uint32_t> successful_ids;         // Ascending
    std::map<std::uint32_t, std::string> failed_ids;   // id -> last error

    std::size_t interrupted_at{0};  // Chunk index to resume from (interrupted only)
    UploadStats stats;

    std::error_code manifest_error;  // Set if the failed-chunk manifest could not be written

    [[nodiscard]] bool ok() const noexcept { return status == UploadStatus::success; }

    [[nodiscard]] static UploadOutcome success() {
        UploadOutcome out;
        out.status = UploadStatus::success;
        return out;
    }

    [[nodiscard]] static UploadOutcome failure(std::error_code ec, std::string why) {
        UploadOutcome out;
        out.status = UploadStatus::failed;
        out.error = ec;
        out.reason = std::move(why);
        return out;
    }

    [[nodiscard]] static UploadOutcome interruption(std::size_t at, std::string why) {
        UploadOutcome out;
        out.status = UploadStatus::interrupted;
        out.error = make_error_code(UploadErrc::interrupted);
        out.interrupted_at = at;
        out.reason = std::move(why);
        return out;
    }
};

[[nodiscard]] constexpr const char* to_string(UploadStatus status) noexcept {
    switch (status) {
        case UploadStatus::success:         return "success";
        case UploadStatus::partial_failure: return "partial failure";
        case UploadStatus::failed:          return "failed";
        case UploadStatus::interrupted:     return "interrupted";
    }
    return "unknown";
}

} // namespace hoist::core
