// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hoist/core/chunker.hpp>
#include <hoist/core/outcome.hpp>
#include <hoist/core/transfer.hpp>
#include <hoist/core/upload_config.hpp>
#include <vector>

namespace hoist::core {

// Bounded-concurrency, rate-governed upload coordinator.
//
// One worker thread per in-flight chunk, at most max_concurrent of them. Each
// worker retries its chunk up to max_retries times and posts the result to a
// completion channel. A single coordinator owns all session bookkeeping: it
// admits new work through a RateController, reaps finished workers, reports
// the rate, and waits on the channel (bounded by the pacing interval) between
// passes.
//
// Chunks are consumed by the run. Progress hooks fire on worker threads.
class ParallelScheduler {
public:
    ParallelScheduler(UploadConfig config, TransferFn transfer);

    // Non-copyable, movable
    ParallelScheduler(const ParallelScheduler&) = delete;
    ParallelScheduler& operator=(const ParallelScheduler&) = delete;
    ParallelScheduler(ParallelScheduler&&) noexcept = default;
    ParallelScheduler& operator=(ParallelScheduler&&) noexcept = default;

    // success, partial_failure (failed IDs written to the manifest if configured)
    // or failed. Blocks until every submitted chunk is accounted for.
    [[nodiscard]] UploadOutcome run(std::vector<ChunkInfo> chunks);

    [[nodiscard]] const UploadConfig& config() const noexcept { return config_; }

private:
    UploadConfig config_;
    TransferFn transfer_;
};

} // namespace hoist::core
