// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hoist/core/sequential_uploader.hpp>
#include <hoist/core/rate_controller.hpp>
#include "hooks.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <thread>

namespace hoist::core {

SequentialUploader::SequentialUploader(UploadConfig config, TransferFn transfer)
    : config_(std::move(config))
    , transfer_(std::move(transfer)) {}

ChunkState SequentialUploader::state(std::size_t index) const noexcept {
    if (index >= states_.size()) return ChunkState::pending;
    return states_[index];
}

UploadOutcome SequentialUploader::upload(std::span<const ChunkInfo> chunks,
                                         std::size_t start_from_chunk) {
    if (chunks.empty()) {
        return UploadOutcome::failure(make_error_code(UploadErrc::no_chunks), "no chunks");
    }

    if (start_from_chunk >= chunks.size()) {
        return UploadOutcome::failure(
            make_error_code(UploadErrc::start_out_of_range),
            fmt::format("start chunk {} exceeds total chunks {}", start_from_chunk, chunks.size()));
    }

    if (!transfer_) {
        return UploadOutcome::failure(make_error_code(UploadErrc::invalid_config),
                                      "no transfer primitive configured");
    }

    const std::size_t total = chunks.size();
    states_.assign(total, ChunkState::pending);
    for (std::size_t i = 0; i < start_from_chunk; ++i) {
        states_[i] = ChunkState::done;  // Landed in an earlier run
    }

    UploadTracker tracker;
    UploadOutcome outcome = UploadOutcome::success();

    auto finish = [&](UploadOutcome out) {
        auto now = std::chrono::steady_clock::now();
        out.successful_ids = outcome.successful_ids;
        out.stats.bytes_uploaded = tracker.bytes_uploaded;
        out.stats.elapsed = now - tracker.start_time;
        out.stats.rate_bps = RateController::rate(tracker, now);
        return out;
    };

    for (std::size_t i = start_from_chunk; i < total; ++i) {
        const auto& chunk = chunks[i];
        std::uint32_t attempts = 0;

        auto result = upload_one(chunk, i, total, attempts);
        if (!result) {
            states_[i] = ChunkState::failed;
            auto why = fmt::format("Failed to upload chunk {}/{} after {} attempts. Last error: {}",
                                   i + 1, total, attempts, result.error().message);
            spdlog::warn("{}", why);

            if (config_.auto_resume) {
                return finish(UploadOutcome::interruption(i, std::move(why)));
            }
            return finish(UploadOutcome::failure(result.error().code, std::move(why)));
        }

        states_[i] = ChunkState::done;
        tracker.bytes_uploaded += chunk.size;
        tracker.completed_chunk_ids.insert(chunk.id);
        outcome.successful_ids.push_back(chunk.id);

        auto status = attempts > 1
            ? fmt::format("Uploaded after {} attempts", attempts)
            : std::string("Uploaded");
        detail::notify_progress(config_.progress_hook, i + 1, total, status);
    }

    spdlog::info("Uploaded {} of {} chunks", total - start_from_chunk, total);
    return finish(UploadOutcome::success());
}

TransferResult SequentialUploader::upload_one(const ChunkInfo& chunk,
                                              std::size_t index,
                                              std::size_t total,
                                              std::uint32_t& attempts) {
    const std::uint32_t max_attempts = config_.auto_resume ? std::max(config_.max_retries, 1u) : 1u;

    while (true) {
        ++attempts;
        states_[index] = ChunkState::uploading;
        spdlog::debug("chunk {}/{}: attempt {}/{}", index + 1, total, attempts, max_attempts);

        TransferResult result;
        try {
            result = transfer_(chunk.id, chunk.data);
        } catch (const std::exception& e) {
            result = transfer_failure(make_error_code(UploadErrc::worker_crashed), e.what());
        } catch (...) {
            result = transfer_failure(make_error_code(UploadErrc::worker_crashed),
                                      "transfer threw a non-standard exception");
        }

        if (result) {
            return result;
        }

        if (attempts >= max_attempts) {
            return result;
        }

        states_[index] = ChunkState::retry_pending;
        detail::notify_progress(config_.progress_hook, index + 1, total,
                                fmt::format("Attempt {}/{} failed, retrying...", attempts, max_attempts));
        spdlog::warn("chunk {}/{}: attempt {}/{} failed: {}",
                     index + 1, total, attempts, max_attempts, result.error().message);

        std::this_thread::sleep_for(config_.retry_delay);
    }
}

} // namespace hoist::core
