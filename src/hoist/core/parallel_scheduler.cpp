// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hoist/core/parallel_scheduler.hpp>
#include <hoist/core/failed_manifest.hpp>
#include <hoist/core/rate_controller.hpp>
#include "hooks.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>

namespace hoist::core {

namespace {

// What a worker hands back to the coordinator
struct WorkerReport {
    std::uint32_t chunk_id{0};
    std::size_t bytes{0};
    std::uint32_t attempts{0};
    TransferResult result;
};

// Workers push, the coordinator drains. The only state shared across threads.
class CompletionChannel {
public:
    void push(WorkerReport report) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reports_.push_back(std::move(report));
        }
        cv_.notify_one();
    }

    // Wait up to `timeout` for at least one report, then take everything queued
    [[nodiscard]] std::vector<WorkerReport> wait_drain(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !reports_.empty(); });
        std::vector<WorkerReport> drained;
        drained.swap(reports_);
        return drained;
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reports_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<WorkerReport> reports_;
};

TransferResult upload_with_retry(const UploadConfig& config,
                                 const TransferFn& transfer,
                                 std::uint32_t max_attempts,
                                 const ChunkInfo& chunk,
                                 std::uint32_t& attempts) {
    while (true) {
        ++attempts;
        spdlog::debug("chunk {}: attempt {}/{}", chunk.id, attempts, max_attempts);

        auto result = transfer(chunk.id, chunk.data);
        if (result) {
            auto status = attempts > 1
                ? fmt::format("Uploaded after {} attempts", attempts)
                : std::string("Uploaded");
            detail::notify_progress(config.progress_hook, chunk.id, chunk.size, status);
            return result;
        }

        if (attempts >= max_attempts) {
            return transfer_failure(
                result.error().code,
                fmt::format("Chunk {} failed after {} attempts. Last error: {}",
                            chunk.id, attempts, result.error().message));
        }

        spdlog::warn("chunk {}: attempt {}/{} failed: {}",
                     chunk.id, attempts, max_attempts, result.error().message);
        detail::notify_progress(config.progress_hook, chunk.id, chunk.size,
                                fmt::format("Attempt {}/{} failed, retrying...", attempts, max_attempts));

        std::this_thread::sleep_for(config.retry_delay);
    }
}

// Worker thread body. Always posts exactly one report.
void run_worker(const UploadConfig& config,
                const TransferFn& transfer,
                std::uint32_t max_attempts,
                const ChunkInfo& chunk,
                CompletionChannel& channel) noexcept {
    WorkerReport report;
    report.chunk_id = chunk.id;
    report.bytes = chunk.size;

    // A crash ends the worker like exhausted retries would
    try {
        report.result = upload_with_retry(config, transfer, max_attempts, chunk, report.attempts);
    } catch (const std::exception& e) {
        report.result = transfer_failure(make_error_code(UploadErrc::worker_crashed),
                                         fmt::format("Chunk {} worker crashed: {}", chunk.id, e.what()));
    } catch (...) {
        report.result = transfer_failure(make_error_code(UploadErrc::worker_crashed),
                                         fmt::format("Chunk {} worker crashed", chunk.id));
    }

    channel.push(std::move(report));
}

} // namespace

ParallelScheduler::ParallelScheduler(UploadConfig config, TransferFn transfer)
    : config_(std::move(config))
    , transfer_(std::move(transfer)) {}

UploadOutcome ParallelScheduler::run(std::vector<ChunkInfo> chunks) {
    using clock = std::chrono::steady_clock;

    if (chunks.empty()) {
        return UploadOutcome::failure(make_error_code(UploadErrc::no_chunks), "no chunks");
    }

    if (!transfer_) {
        return UploadOutcome::failure(make_error_code(UploadErrc::invalid_config),
                                      "no transfer primitive configured");
    }

    std::uint32_t max_concurrent = config_.max_concurrent;
    if (max_concurrent == 0) {
        spdlog::warn("max_concurrent is 0, clamping to 1");
        max_concurrent = 1;
    }
    const std::uint32_t max_attempts = std::max(config_.max_retries, 1u);

    const std::size_t total = chunks.size();
    RateController controller(max_concurrent, config_.target_rate_bps);
    UploadTracker tracker;
    CompletionChannel channel;

    std::map<std::uint32_t, std::jthread> workers;
    std::vector<std::uint32_t> successful;
    std::map<std::uint32_t, std::string> failed;

    spdlog::info("Starting parallel upload of {} chunks", total);
    spdlog::info("Target rate: {:.1f} MiB/s, max concurrent: {}",
                 config_.target_rate_bps / MIB, max_concurrent);

    auto reap = [&](WorkerReport report) {
        if (auto it = workers.find(report.chunk_id); it != workers.end()) {
            it->second.join();
            workers.erase(it);
        }
        --tracker.active_uploads;

        if (report.result) {
            tracker.bytes_uploaded += report.bytes;
            tracker.completed_chunk_ids.insert(report.chunk_id);
            successful.push_back(report.chunk_id);
        } else {
            spdlog::warn("{}", report.result.error().message);
            failed.emplace(report.chunk_id, std::move(report.result.error().message));
        }
    };

    while (true) {
        auto now = clock::now();

        // Admission. active_uploads goes up before the worker exists.
        while (!chunks.empty() && controller.should_admit(tracker, now)) {
            ChunkInfo chunk = std::move(chunks.back());
            chunks.pop_back();

            const auto id = chunk.id;
            ++tracker.active_uploads;

            try {
                std::jthread worker([this, &channel, max_attempts, chunk = std::move(chunk)] {
                    run_worker(config_, transfer_, max_attempts, chunk, channel);
                });
                workers.emplace(id, std::move(worker));
            } catch (const std::system_error& e) {
                channel.push(WorkerReport{
                    id, 0, 0,
                    transfer_failure(make_error_code(UploadErrc::worker_crashed),
                                     fmt::format("Chunk {} worker could not start: {}", id, e.what()))});
            }
        }

        // Reaping. Suspends until a worker finishes or the pacing interval passes.
        for (auto& report : channel.wait_drain(controller.pacing_delay(tracker, now))) {
            reap(std::move(report));
        }

        now = clock::now();
        detail::notify_rate(config_.rate_hook, RateController::rate(tracker, now));

        if (successful.size() + failed.size() >= total) {
            break;
        }

        if (chunks.empty() && workers.empty() && channel.empty()) {
            spdlog::warn("scheduler drained with {} of {} chunks accounted for",
                         successful.size() + failed.size(), total);
            break;
        }
    }

    auto end = clock::now();
    UploadStats stats;
    stats.bytes_uploaded = tracker.bytes_uploaded;
    stats.elapsed = end - tracker.start_time;
    stats.rate_bps = RateController::rate(tracker, end);

    spdlog::info("Upload completed. Final rate: {:.2f} MiB/s, Total: {:.2f} MiB",
                 stats.rate_bps / MIB, static_cast<double>(stats.bytes_uploaded) / MIB);

    std::sort(successful.begin(), successful.end());

    UploadOutcome outcome;
    if (failed.empty()) {
        outcome = UploadOutcome::success();
        spdlog::info("All {} chunks uploaded successfully", successful.size());
    } else if (successful.empty()) {
        outcome = UploadOutcome::failure(
            make_error_code(UploadErrc::all_chunks_failed),
            fmt::format("All {} chunks failed. First error: {}", failed.size(), failed.begin()->second));
        spdlog::error("All chunks failed");
    } else {
        outcome.status = UploadStatus::partial_failure;
        outcome.error = make_error_code(UploadErrc::partial_failure);
        outcome.reason = fmt::format("{} of {} chunks failed", failed.size(), total);
        spdlog::error("Upload completed with {} successes and {} failures",
                      successful.size(), failed.size());

        if (!config_.failed_manifest_path.empty()) {
            FailedManifest manifest;
            for (const auto& [id, _] : failed) {
                manifest.chunk_ids.push_back(id);
            }
            if (auto ec = manifest.save(config_.failed_manifest_path)) {
                spdlog::error("could not write failed-chunk manifest {}: {}",
                              config_.failed_manifest_path, ec.message());
                outcome.manifest_error = ec;
            }
        }
    }

    outcome.successful_ids = std::move(successful);
    outcome.failed_ids = std::move(failed);
    outcome.stats = stats;
    return outcome;
}

} // namespace hoist::core
