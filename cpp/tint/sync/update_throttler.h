#pragma once

#include "tint/core/types.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace tint {

struct PendingBatch {
    ObservationBatch observations;
    Pose referencePose;
    // Cancellation epoch at submit time.
    std::uint64_t epoch = 0;
};

/**
 * Coalesces observation batches into at most one pass per window.
 *
 * submit() only records the latest batch and opens a window when none is
 * open; it never waits for a pass. When the window expires the worker thread
 * hands the most recent batch to the sink. Batches submitted while a window
 * is open replace the pending one. Passes run one at a time on the worker.
 */
class UpdateThrottler {
public:
    using Sink = std::function<void(const PendingBatch&)>;

    UpdateThrottler(std::chrono::milliseconds window, Sink sink);
    ~UpdateThrottler();

    UpdateThrottler(const UpdateThrottler&) = delete;
    UpdateThrottler& operator=(const UpdateThrottler&) = delete;

    void start();
    // Cancels the open window and joins the worker. An in-flight pass completes.
    void stop();
    bool isRunning() const;

    // Returns false when the throttler is not running and the batch was dropped.
    bool submit(ObservationBatch batch, const Pose& referencePose);
    // Drops the open window and its batch and advances the epoch, so a pass
    // already handed to the sink can tell it was cancelled.
    void cancel();
    // Blocks until no window is open and no pass is running.
    void waitIdle();

    std::chrono::milliseconds window() const noexcept { return window_; }
    std::uint64_t epoch() const;
    bool isPassInFlight() const;
    std::uint64_t submittedCount() const;
    std::uint64_t passCount() const;
    std::uint64_t supersededCount() const;

private:
    void loop();

    const std::chrono::milliseconds window_;
    Sink sink_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::thread thread_;
    bool running_ = false;
    bool stopRequested_ = false;
    bool windowOpen_ = false;
    bool passInFlight_ = false;
    std::chrono::steady_clock::time_point deadline_{};
    std::optional<PendingBatch> pending_;

    std::uint64_t submitted_ = 0;
    std::uint64_t passes_ = 0;
    std::uint64_t superseded_ = 0;
    std::uint64_t epoch_ = 0;
};

} // namespace tint
