#include <gtest/gtest.h>
#include "tint/sync/update_throttler.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace tint;
using namespace std::chrono_literals;

namespace {

SurfaceObservation tagged(WallId id) {
    return SurfaceObservation{id, PlaneAlignment::Vertical, Extent{1.0f, 1.0f}, Pose::identity()};
}

struct SinkLog {
    std::mutex mutex;
    std::vector<WallId> firstIds;

    UpdateThrottler::Sink sink() {
        return [this](const PendingBatch& batch) {
            std::lock_guard<std::mutex> lock(mutex);
            firstIds.push_back(batch.observations.empty() ? kInvalidWallId : batch.observations.front().id);
        };
    }

    std::vector<WallId> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return firstIds;
    }
};

} // namespace

TEST(UpdateThrottlerTest, DropsBatchesWhenNotRunning) {
    SinkLog log;
    UpdateThrottler throttler(20ms, log.sink());
    EXPECT_FALSE(throttler.submit({tagged(1)}, Pose::identity()));
    EXPECT_EQ(throttler.submittedCount(), 0u);
}

TEST(UpdateThrottlerTest, BurstCoalescesIntoLatestBatch) {
    SinkLog log;
    UpdateThrottler throttler(200ms, log.sink());
    throttler.start();

    for (WallId id = 1; id <= 10; ++id) {
        ASSERT_TRUE(throttler.submit({tagged(id)}, Pose::identity()));
    }
    throttler.waitIdle();

    const auto passes = log.snapshot();
    ASSERT_EQ(passes.size(), 1u);
    EXPECT_EQ(passes.front(), 10u);
    EXPECT_EQ(throttler.submittedCount(), 10u);
    EXPECT_EQ(throttler.supersededCount(), 9u);
    EXPECT_EQ(throttler.passCount(), 1u);
    throttler.stop();
}

TEST(UpdateThrottlerTest, PassesAreSpacedByWindow) {
    std::mutex mutex;
    std::vector<std::chrono::steady_clock::time_point> times;
    UpdateThrottler throttler(50ms, [&](const PendingBatch&) {
        std::lock_guard<std::mutex> lock(mutex);
        times.push_back(std::chrono::steady_clock::now());
    });
    throttler.start();

    const auto begin = std::chrono::steady_clock::now();
    for (int i = 0; i < 3; ++i) {
        throttler.submit({tagged(1)}, Pose::identity());
        throttler.waitIdle();
    }
    throttler.stop();

    ASSERT_EQ(times.size(), 3u);
    EXPECT_GE(times.front() - begin, 50ms);
    for (std::size_t i = 1; i < times.size(); ++i) {
        EXPECT_GE(times[i] - times[i - 1], 50ms);
    }
}

TEST(UpdateThrottlerTest, CancelDropsOpenWindow) {
    SinkLog log;
    UpdateThrottler throttler(100ms, log.sink());
    throttler.start();
    throttler.submit({tagged(1)}, Pose::identity());
    throttler.cancel();
    throttler.waitIdle();
    std::this_thread::sleep_for(150ms);
    EXPECT_TRUE(log.snapshot().empty());

    throttler.submit({tagged(2)}, Pose::identity());
    throttler.waitIdle();
    ASSERT_EQ(log.snapshot().size(), 1u);
    EXPECT_EQ(log.snapshot().front(), 2u);
}

TEST(UpdateThrottlerTest, SubmitDuringPassDoesNotBlockAndIsNotLost) {
    std::atomic<bool> inPass{false};
    std::atomic<bool> release{false};
    std::atomic<int> passes{0};
    UpdateThrottler throttler(10ms, [&](const PendingBatch&) {
        inPass = true;
        while (!release) std::this_thread::sleep_for(1ms);
        passes++;
    });
    throttler.start();
    throttler.submit({tagged(1)}, Pose::identity());
    while (!inPass) std::this_thread::sleep_for(1ms);

    const auto before = std::chrono::steady_clock::now();
    EXPECT_TRUE(throttler.submit({tagged(2)}, Pose::identity()));
    EXPECT_LT(std::chrono::steady_clock::now() - before, 50ms);

    release = true;
    while (passes < 2) std::this_thread::sleep_for(1ms);
    throttler.waitIdle();
    EXPECT_EQ(throttler.passCount(), 2u);
}

TEST(UpdateThrottlerTest, StopIsIdempotent) {
    SinkLog log;
    UpdateThrottler throttler(10ms, log.sink());
    throttler.start();
    EXPECT_TRUE(throttler.isRunning());
    throttler.stop();
    throttler.stop();
    EXPECT_FALSE(throttler.isRunning());
    EXPECT_FALSE(throttler.submit({tagged(1)}, Pose::identity()));
}

TEST(UpdateThrottlerTest, CancelAdvancesEpochCarriedByBatches) {
    std::mutex mutex;
    std::vector<std::uint64_t> epochs;
    UpdateThrottler throttler(5ms, [&](const PendingBatch& batch) {
        std::lock_guard<std::mutex> lock(mutex);
        epochs.push_back(batch.epoch);
    });
    throttler.start();
    EXPECT_EQ(throttler.epoch(), 0u);

    throttler.submit({tagged(1)}, Pose::identity());
    throttler.waitIdle();
    throttler.cancel();
    throttler.cancel();
    EXPECT_EQ(throttler.epoch(), 2u);
    EXPECT_FALSE(throttler.isPassInFlight());

    throttler.submit({tagged(2)}, Pose::identity());
    throttler.waitIdle();
    throttler.stop();

    ASSERT_EQ(epochs.size(), 2u);
    EXPECT_EQ(epochs[0], 0u);
    EXPECT_EQ(epochs[1], 2u);
}
