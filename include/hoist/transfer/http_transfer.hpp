// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hoist/core/transfer.hpp>
#include <hoist/transfer/url.hpp>
#include <cstdint>
#include <span>
#include <string>

namespace hoist::transfer {

// POSTs each chunk as application/octet-stream to <destination>/<operation>.
// The chunk ID travels in X-Chunk-Id, the network selector in X-Network.
// One curl easy handle per call, so send() is safe to call from many workers.
class HttpTransfer {
public:
    HttpTransfer(Url destination, std::string operation, std::string network = {});

    // Non-copyable, non-movable (handed out by reference through as_transfer())
    HttpTransfer(const HttpTransfer&) = delete;
    HttpTransfer& operator=(const HttpTransfer&) = delete;

    [[nodiscard]] core::TransferResult send(std::uint32_t chunk_id,
                                            std::span<const std::uint8_t> payload) const;

    // Bound to this object; it must outlive the returned function
    [[nodiscard]] core::TransferFn as_transfer() const;

    [[nodiscard]] const Url& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] const std::string& network() const noexcept { return network_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    Url endpoint_;
    std::string endpoint_str_;
    std::string network_;
};

} // namespace hoist::transfer
