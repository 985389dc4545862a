#pragma once

#include "tint/core/types.h"
#include <cstdint>

namespace tint {

enum class RestartPolicy : std::uint32_t {
    ClearRegistry = 0,
    PreserveRegistry = 1,
};

// Acceptance policy applied to every observation of a reconciliation pass.
struct ReconcileFilter {
    float minSize{0.5f};
    float maxDistance{5.0f};
    Pose referencePose{};
    // Consecutive passes an entity may be missing before it is removed.
    std::uint32_t removalGracePasses{0};
    // 0 = unlimited.
    std::uint32_t maxTrackedWalls{0};
};

struct EngineConfig {
    static constexpr std::uint32_t kDefaultThrottleWindowMs = 100;
    static constexpr std::uint32_t kDefaultMaxColorHistory = 20;

    float minWallSize{0.5f};
    float maxWallDistance{5.0f};
    std::uint32_t throttleWindowMs{kDefaultThrottleWindowMs};
    std::uint32_t maxColorHistory{kDefaultMaxColorHistory};
    std::uint32_t removalGracePasses{0};
    std::uint32_t maxTrackedWalls{0};
    RestartPolicy restartPolicy{RestartPolicy::ClearRegistry};

    ReconcileFilter makeFilter(const Pose& referencePose) const {
        ReconcileFilter filter{};
        filter.minSize = minWallSize;
        filter.maxDistance = maxWallDistance;
        filter.referencePose = referencePose;
        filter.removalGracePasses = removalGracePasses;
        filter.maxTrackedWalls = maxTrackedWalls;
        return filter;
    }
};

} // namespace tint
