// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hoist/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <utility>

namespace hoist::core {

struct TransferError {
    std::error_code code;
    std::string message;
};

using TransferResult = std::expected<void, TransferError>;

// Moves one chunk to the destination. Synchronous, opaque latency and failure
// behavior. The parallel scheduler calls it from several threads at once.
using TransferFn = std::function<TransferResult(std::uint32_t chunk_id,
                                                std::span<const std::uint8_t> payload)>;

inline TransferResult transfer_failure(std::error_code code, std::string message) {
    return std::unexpected(TransferError{code, std::move(message)});
}

} // namespace hoist::core
