// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hoist/core/chunker.hpp>
#include <algorithm>
#include <unordered_set>

namespace hoist::core {

std::expected<std::vector<Bytes>, std::error_code>
split(std::span<const std::uint8_t> data, std::size_t chunk_size, std::size_t start_offset) {
    if (chunk_size == 0) {
        return std::unexpected(make_error_code(UploadErrc::invalid_chunk_size));
    }

    std::vector<Bytes> chunks;
    if (start_offset >= data.size()) {
        return chunks;
    }

    const std::size_t remaining = data.size() - start_offset;
    chunks.reserve((remaining + chunk_size - 1) / chunk_size);  // Round up

    std::size_t offset = start_offset;
    while (offset < data.size()) {
        std::size_t this_size = std::min(chunk_size, data.size() - offset);
        auto piece = data.subspan(offset, this_size);
        chunks.emplace_back(piece.begin(), piece.end());
        offset += this_size;
    }

    return chunks;
}

std::vector<ChunkInfo> to_chunk_info(std::vector<Bytes> chunks) {
    std::vector<ChunkInfo> infos;
    infos.reserve(chunks.size());

    std::uint32_t id = 0;
    for (auto& data : chunks) {
        ChunkInfo info;
        info.id = id++;
        info.size = data.size();
        info.data = std::move(data);
        infos.push_back(std::move(info));
    }
    return infos;
}

std::vector<ChunkInfo> skip_chunks(std::vector<ChunkInfo> chunks, std::size_t count) {
    if (count >= chunks.size()) {
        return {};
    }
    chunks.erase(chunks.begin(), chunks.begin() + static_cast<std::ptrdiff_t>(count));
    return chunks;
}

std::vector<ChunkInfo> filter_by_ids(std::vector<ChunkInfo> chunks,
                                     std::span<const std::uint32_t> ids) {
    const std::unordered_set<std::uint32_t> wanted(ids.begin(), ids.end());

    std::vector<ChunkInfo> kept;
    kept.reserve(std::min(chunks.size(), wanted.size()));
    for (auto& chunk : chunks) {
        if (wanted.contains(chunk.id)) {
            kept.push_back(std::move(chunk));
        }
    }
    return kept;
}

} // namespace hoist::core
