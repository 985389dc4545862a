// tint_replay: drives TintEngine with a synthetic tracking feed and prints
// the listener stream. Usage: tint_replay [ticks] [tick-ms]

#include "tint/engine.h"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <thread>

namespace {

using namespace tint;

class PrintingListener : public TintListener {
public:
    void onEntityDetected(const WallEntity& wall) override {
        std::printf("detected  wall %llu  %.2fx%.2f m\n", idArg(wall.id()), wall.geometry().extent.width, wall.geometry().extent.height);
    }
    void onEntityRemoved(WallId id) override {
        std::printf("removed   wall %llu\n", idArg(id));
    }
    void onEntityUpdated(const WallEntity& wall) override {
        if (wall.currentColor()) {
            const PaintColor& c = *wall.currentColor();
            std::printf("painted   wall %llu  (%.2f, %.2f, %.2f) %s\n", idArg(wall.id()), c.r, c.g, c.b, finishName(wall.finish()));
        }
    }
    void onSelectionChanged(std::optional<WallId> id) override {
        if (id) {
            std::printf("selected  wall %llu\n", idArg(*id));
        } else {
            std::printf("selected  none\n");
        }
    }
    void onSessionStateChanged(const SessionState& state) override {
        std::printf("session   %s\n", describeState(state).c_str());
    }

private:
    static unsigned long long idArg(WallId id) { return static_cast<unsigned long long>(id); }
};

// Walls 1..4 around the viewer; wall 4 comes and goes, wall 5 is too small.
ObservationBatch syntheticBatch(int tick) {
    ObservationBatch batch;
    const float drift = 0.001f * static_cast<float>(tick);
    batch.push_back({1, PlaneAlignment::Vertical, Extent{3.0f, 2.5f}, Pose::fromTranslation(0.0f, 0.0f, 2.0f + drift)});
    if (tick > 5) {
        batch.push_back({2, PlaneAlignment::Vertical, Extent{2.0f, 2.5f}, Pose::fromTranslation(2.0f, 0.0f, 0.0f)});
    }
    if (tick > 10) {
        batch.push_back({3, PlaneAlignment::Vertical, Extent{4.0f, 2.5f}, Pose::fromTranslation(-2.5f, 0.0f, 0.0f)});
    }
    if ((tick / 20) % 2 == 1) {
        batch.push_back({4, PlaneAlignment::Vertical, Extent{1.0f, 2.0f}, Pose::fromTranslation(0.0f, 0.0f, -3.0f)});
    }
    batch.push_back({5, PlaneAlignment::Vertical, Extent{0.2f, 0.3f}, Pose::fromTranslation(1.0f, 0.0f, 1.0f)});
    batch.push_back({6, PlaneAlignment::Horizontal, Extent{5.0f, 5.0f}, Pose::fromTranslation(0.0f, -1.5f, 0.0f)});
    return batch;
}

} // namespace

int main(int argc, char** argv) {
    const int ticks = argc > 1 ? std::atoi(argv[1]) : 90;
    const int tickMs = argc > 2 ? std::atoi(argv[2]) : 16;
    if (ticks <= 0 || tickMs <= 0) {
        std::fprintf(stderr, "usage: %s [ticks] [tick-ms]\n", argv[0]);
        return 2;
    }

    TintEngine engine;
    engine.subscribe(std::make_shared<PrintingListener>());
    if (!engine.startSession()) {
        std::fprintf(stderr, "failed to start session: %s\n", errorName(engine.lastError()));
        return 1;
    }

    for (int tick = 0; tick < ticks; ++tick) {
        engine.onObservationBatch(syntheticBatch(tick), Pose::identity());
        if (tick == 30) {
            engine.onTrackingQualityChanged(TrackingQuality::limited(LimitedReason::ExcessiveMotion));
        } else if (tick == 36) {
            engine.onTrackingQualityChanged(TrackingQuality::normal());
        }
        if (tick == 50) {
            engine.waitForPendingUpdates();
            if (engine.selectEntity(3) == TintError::Ok) {
                engine.applyColor(PaintColor{0.85f, 0.32f, 0.25f});
                engine.applyColor(PaintColor{0.20f, 0.45f, 0.70f});
                engine.undoColor();
                engine.setFinish(PaintFinish::Satin);
            } else {
                std::fprintf(stderr, "select failed: %s\n", errorName(engine.lastError()));
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(tickMs));
    }
    engine.waitForPendingUpdates();

    const ReconcileStats stats = engine.lastReconcileStats();
    std::printf("passes %llu  walls %zu  last pass: accepted %u filtered %u\n",
        static_cast<unsigned long long>(engine.reconcileCount()), engine.entityCount(), stats.accepted, stats.filtered);
    engine.shutdown();
    return 0;
}
