// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>

namespace hoist::core {

constexpr std::size_t MAX_PAYLOAD_SIZE = 2 * 1000 * 1000;           // per-request ceiling
constexpr std::size_t DEFAULT_CHUNK_SIZE = MAX_PAYLOAD_SIZE;

constexpr std::uint32_t DEFAULT_MAX_RETRIES = 3;
constexpr std::chrono::milliseconds DEFAULT_RETRY_DELAY{1000};

constexpr std::uint32_t DEFAULT_MAX_CONCURRENT = 4;                 // Start conservative
constexpr double MIB = 1024.0 * 1024.0;
constexpr double DEFAULT_TARGET_RATE_MIBS = 4.0;
constexpr double DEFAULT_TARGET_RATE_BPS = DEFAULT_TARGET_RATE_MIBS * MIB;

// Coordinator pacing between scheduling passes
constexpr std::chrono::milliseconds PACING_UNDER_TARGET{10};
constexpr std::chrono::milliseconds PACING_OVER_TARGET{100};

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;

} // namespace hoist::core
