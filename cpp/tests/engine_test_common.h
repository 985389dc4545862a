#pragma once

#include <gtest/gtest.h>
#include "tint/engine.h"
#include "tests/test_accessors.h"
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tint_test {
using namespace tint;

inline constexpr PaintColor kRed{1.0f, 0.0f, 0.0f, 1.0f};
inline constexpr PaintColor kGreen{0.0f, 1.0f, 0.0f, 1.0f};
inline constexpr PaintColor kBlue{0.0f, 0.0f, 1.0f, 1.0f};

// Vertical wall `dist` metres in front of the origin.
inline SurfaceObservation makeWall(WallId id, float width = 1.0f, float height = 2.0f, float dist = 2.0f) {
    return SurfaceObservation{id, PlaneAlignment::Vertical, Extent{width, height}, Pose::fromTranslation(0.0f, 0.0f, dist)};
}

inline SurfaceObservation makeFloor(WallId id) {
    return SurfaceObservation{id, PlaneAlignment::Horizontal, Extent{3.0f, 3.0f}, Pose::fromTranslation(0.0f, -1.0f, 1.0f)};
}

// Fixed clock the tests advance by hand.
struct ManualClock {
    double now = 1000.0;
    Clock fn() { return [this]() { return now; }; }
};

inline EngineConfig immediateConfig() {
    EngineConfig config{};
    config.throttleWindowMs = 10;
    return config;
}

// Records every callback as a short string, in delivery order.
class RecordingListener : public TintListener {
public:
    void onEntityDetected(const WallEntity& wall) override { push("detected:" + std::to_string(wall.id())); }
    void onEntityUpdated(const WallEntity& wall) override {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.push_back("updated:" + std::to_string(wall.id()));
        lastUpdated_ = wall;
    }
    void onEntityRemoved(WallId id) override { push("removed:" + std::to_string(id)); }
    void onSelectionChanged(std::optional<WallId> id) override {
        push(id ? "selected:" + std::to_string(*id) : std::string("selected:none"));
    }
    void onSessionStateChanged(const SessionState& state) override {
        push(std::string("state:") + stateName(state.kind));
    }

    std::vector<std::string> log() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_;
    }
    std::optional<WallEntity> lastUpdated() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastUpdated_;
    }
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.clear();
    }

private:
    void push(std::string entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.push_back(std::move(entry));
    }

    mutable std::mutex mutex_;
    std::vector<std::string> log_;
    std::optional<WallEntity> lastUpdated_;
};

} // namespace tint_test
