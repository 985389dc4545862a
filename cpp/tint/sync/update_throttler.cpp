#include "tint/sync/update_throttler.h"
#include "tint/core/logging.h"
#include <utility>

namespace tint {

UpdateThrottler::UpdateThrottler(std::chrono::milliseconds window, Sink sink)
    : window_(window), sink_(std::move(sink)) {}

UpdateThrottler::~UpdateThrottler() {
    stop();
}

void UpdateThrottler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    stopRequested_ = false;
    thread_ = std::thread(&UpdateThrottler::loop, this);
    TINT_LOG_DEBUG("throttler started (window %lld ms)", static_cast<long long>(window_.count()));
}

void UpdateThrottler::stop() {
    std::thread toJoin;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stopRequested_ = true;
        windowOpen_ = false;
        pending_.reset();
        cv_.notify_all();
        toJoin = std::move(thread_);
    }
    if (toJoin.joinable()) {
        toJoin.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        stopRequested_ = false;
    }
    idleCv_.notify_all();
    TINT_LOG_DEBUG("throttler stopped");
}

bool UpdateThrottler::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && !stopRequested_;
}

bool UpdateThrottler::submit(ObservationBatch batch, const Pose& referencePose) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || stopRequested_) return false;

    submitted_++;
    if (pending_) superseded_++;
    pending_ = PendingBatch{std::move(batch), referencePose, epoch_};
    if (!windowOpen_) {
        windowOpen_ = true;
        deadline_ = std::chrono::steady_clock::now() + window_;
        cv_.notify_all();
    }
    return true;
}

void UpdateThrottler::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        epoch_++;
        if (!windowOpen_ && !pending_) return;
        windowOpen_ = false;
        pending_.reset();
        cv_.notify_all();
    }
    idleCv_.notify_all();
}

void UpdateThrottler::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idleCv_.wait(lock, [&]() {
        return !running_ || stopRequested_ || (!windowOpen_ && !passInFlight_);
    });
}

std::uint64_t UpdateThrottler::epoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
}

bool UpdateThrottler::isPassInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return passInFlight_;
}

std::uint64_t UpdateThrottler::submittedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted_;
}

std::uint64_t UpdateThrottler::passCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return passes_;
}

std::uint64_t UpdateThrottler::supersededCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return superseded_;
}

void UpdateThrottler::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [&]() { return stopRequested_ || windowOpen_; });
        if (stopRequested_) break;

        const auto deadline = deadline_;
        cv_.wait_until(lock, deadline, [&]() { return stopRequested_ || !windowOpen_; });
        if (stopRequested_) break;
        if (windowOpen_ && deadline_ != deadline) {
            // Cancelled and reopened while waiting; honour the new deadline.
            continue;
        }
        if (!windowOpen_ || !pending_) {
            // Cancelled while the window was open.
            windowOpen_ = false;
            continue;
        }

        PendingBatch batch = std::move(*pending_);
        pending_.reset();
        windowOpen_ = false;
        passInFlight_ = true;
        lock.unlock();

        sink_(batch);

        lock.lock();
        passInFlight_ = false;
        passes_++;
        idleCv_.notify_all();
    }
    passInFlight_ = false;
}

} // namespace tint
