// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hoist/core/error.hpp>
#include <cstdint>
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace hoist::core {

using Bytes = std::vector<std::uint8_t>;

// A chunk plus its stable identity. IDs survive completion reordering,
// array positions do not.
struct ChunkInfo {
    std::uint32_t id{0};
    Bytes data;
    std::size_t size{0};  // == data.size()
};

// Split data[start_offset:] into chunk_size pieces; the last one may be shorter.
// start_offset >= data.size() yields an empty vector.
[[nodiscard]] std::expected<std::vector<Bytes>, std::error_code>
split(std::span<const std::uint8_t> data,
      std::size_t chunk_size,
      std::size_t start_offset = 0);

// Assign IDs 0..N-1 in order. Chunk data is moved, not copied.
[[nodiscard]] std::vector<ChunkInfo> to_chunk_info(std::vector<Bytes> chunks);

// Drop the first `count` chunks (chunk-index resume)
[[nodiscard]] std::vector<ChunkInfo> skip_chunks(std::vector<ChunkInfo> chunks, std::size_t count);

// Keep exactly the chunks whose ID appears in `ids`, preserving order
[[nodiscard]] std::vector<ChunkInfo> filter_by_ids(std::vector<ChunkInfo> chunks,
                                                   std::span<const std::uint32_t> ids);

} // namespace hoist::core
