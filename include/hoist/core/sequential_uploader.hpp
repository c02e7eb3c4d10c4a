// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hoist/core/chunker.hpp>
#include <hoist/core/outcome.hpp>
#include <hoist/core/transfer.hpp>
#include <hoist/core/upload_config.hpp>
#include <cstdint>
#include <span>

namespace hoist::core {

// Chunk state machine (sequential mode)
enum class ChunkState : std::uint8_t {
    pending,        // Not reached yet
    uploading,      // Transfer in progress
    retry_pending,  // Attempt failed, waiting out retry_delay
    done,           // Landed
    failed          // Out of attempts
};

// Uploads chunks strictly in ascending order, one at a time.
//
// Without auto_resume every chunk gets a single attempt and the first failure
// aborts the run. With auto_resume a chunk gets up to max_retries attempts and
// exhaustion yields an interrupted outcome; re-invoke with
// start_from_chunk = outcome.interrupted_at to resume.
class SequentialUploader {
public:
    SequentialUploader(UploadConfig config, TransferFn transfer);

    [[nodiscard]] UploadOutcome upload(std::span<const ChunkInfo> chunks,
                                       std::size_t start_from_chunk = 0);

    [[nodiscard]] const UploadConfig& config() const noexcept { return config_; }

    // State of a chunk index during/after the last upload() call
    [[nodiscard]] ChunkState state(std::size_t index) const noexcept;

private:
    // Attempt one chunk until it lands or attempts run out
    [[nodiscard]] TransferResult upload_one(const ChunkInfo& chunk,
                                            std::size_t index,
                                            std::size_t total,
                                            std::uint32_t& attempts);

    UploadConfig config_;
    TransferFn transfer_;
    std::vector<ChunkState> states_;
};

} // namespace hoist::core
