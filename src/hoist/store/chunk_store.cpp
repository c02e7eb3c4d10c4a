// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hoist/store/chunk_store.hpp>
#include <spdlog/spdlog.h>

namespace hoist::store {

using core::UploadErrc;

//=============================================================================
// Sequential buffer
//=============================================================================

void ChunkStore::append(std::span<const std::uint8_t> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

std::size_t ChunkStore::buffer_size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

core::Bytes ChunkStore::take_buffer() {
    std::lock_guard<std::mutex> lock(mutex_);
    core::Bytes out;
    out.swap(buffer_);
    return out;
}

void ChunkStore::clear_buffer() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
}

//=============================================================================
// ID-keyed chunks
//=============================================================================

void ChunkStore::put(std::uint32_t id, std::span<const std::uint8_t> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = chunks_[id];
    chunk_bytes_ -= slot.size();
    slot.assign(data.begin(), data.end());
    chunk_bytes_ += slot.size();
}

bool ChunkStore::remove(std::uint32_t id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunks_.find(id);
    if (it == chunks_.end()) {
        return false;
    }
    chunk_bytes_ -= it->second.size();
    chunks_.erase(it);
    return true;
}

std::size_t ChunkStore::chunk_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

std::vector<std::uint32_t> ChunkStore::chunk_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::uint32_t> ids;
    ids.reserve(chunks_.size());
    for (const auto& [id, _] : chunks_) {
        ids.push_back(id);
    }
    return ids;
}

std::uint64_t ChunkStore::total_size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunk_bytes_;
}

bool ChunkStore::is_complete(std::size_t expected_count) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (chunks_.size() != expected_count) {
        return false;
    }
    // Sorted keys with the right count: complete iff the last key is count-1
    return expected_count == 0 || chunks_.rbegin()->first == expected_count - 1;
}

std::expected<core::Bytes, std::error_code> ChunkStore::consolidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (chunks_.empty()) {
        return std::unexpected(make_error_code(UploadErrc::no_chunks));
    }

    core::Bytes out;
    out.reserve(chunk_bytes_);
    for (const auto& [id, data] : chunks_) {
        out.insert(out.end(), data.begin(), data.end());
    }

    spdlog::debug("consolidated {} chunks into {} bytes", chunks_.size(), out.size());
    chunks_.clear();
    chunk_bytes_ = 0;
    return out;
}

void ChunkStore::clear() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
    chunks_.clear();
    chunk_bytes_ = 0;
}

//=============================================================================
// Transfer adapters
//=============================================================================

core::TransferFn ChunkStore::append_sink() {
    return [this](std::uint32_t, std::span<const std::uint8_t> payload) -> core::TransferResult {
        append(payload);
        return {};
    };
}

core::TransferFn ChunkStore::put_sink() {
    return [this](std::uint32_t id, std::span<const std::uint8_t> payload) -> core::TransferResult {
        put(id, payload);
        return {};
    };
}

} // namespace hoist::store
