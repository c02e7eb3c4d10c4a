// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hoist/core/chunker.hpp>
#include <hoist/core/transfer.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <span>
#include <vector>

namespace hoist::store {

// In-memory receiving end of an upload. Two independent areas:
// a sequential append buffer and an ID-keyed chunk map. Thread-safe.
class ChunkStore {
public:
    ChunkStore() = default;

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    //-------------------------------------------------------------------------
    // Sequential buffer
    //-------------------------------------------------------------------------

    void append(std::span<const std::uint8_t> data);
    [[nodiscard]] std::size_t buffer_size() const noexcept;

    // Returns the buffer and leaves it empty
    [[nodiscard]] core::Bytes take_buffer();
    void clear_buffer() noexcept;

    //-------------------------------------------------------------------------
    // ID-keyed chunks
    //-------------------------------------------------------------------------

    // Replaces any chunk already stored under `id`
    void put(std::uint32_t id, std::span<const std::uint8_t> data);

    // True if a chunk was removed
    bool remove(std::uint32_t id) noexcept;

    [[nodiscard]] std::size_t chunk_count() const noexcept;
    [[nodiscard]] std::vector<std::uint32_t> chunk_ids() const;  // Ascending
    [[nodiscard]] std::uint64_t total_size() const noexcept;

    // Stored IDs are exactly 0..expected_count-1
    [[nodiscard]] bool is_complete(std::size_t expected_count) const noexcept;

    // Concatenate in ID order and clear the map
    [[nodiscard]] std::expected<core::Bytes, std::error_code> consolidate();

    // Drop both areas
    void clear() noexcept;

    //-------------------------------------------------------------------------
    // Transfer adapters (bound to this store; it must outlive them)
    //-------------------------------------------------------------------------

    [[nodiscard]] core::TransferFn append_sink();
    [[nodiscard]] core::TransferFn put_sink();

private:
    core::Bytes buffer_;
    std::map<std::uint32_t, core::Bytes> chunks_;
    std::uint64_t chunk_bytes_{0};
    mutable std::mutex mutex_;
};

} // namespace hoist::store
