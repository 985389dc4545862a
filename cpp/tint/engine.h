#pragma once

#include "tint/core/config.h"
#include "tint/core/types.h"
#include "tint/core/util.h"

#include "tint/entity/entity_registry.h"
#include "tint/entity/wall_entity.h"
#include "tint/event/event_stream.h"
#include "tint/event/listener.h"
#include "tint/session/session_state.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace tint {

struct EngineState;
struct PendingBatch;

// Thread-safe facade over the wall registry, selection, color history and
// session lifecycle.
//
// Threads: the tracking feed calls onObservationBatch() (never blocks on a
// pass); passes run on the throttler's worker; UI threads issue commands and
// queries. Registry, selection and session state share one lock, so every
// command observes either the state before a pass or after it.
class TintEngine {
    friend struct EngineState;
    friend class TintEngineTestAccessor;
public:
    explicit TintEngine(EngineConfig config = EngineConfig{}, Clock clock = steadyClock());
    ~TintEngine();

    TintEngine(const TintEngine&) = delete;
    TintEngine& operator=(const TintEngine&) = delete;

    // ---------------------------------------------------------------------
    // Session lifecycle
    // ---------------------------------------------------------------------
    bool startSession();
    bool pauseSession();
    // Applies the restart policy to the registry, then returns to Scanning.
    bool resumeSession();
    // Cancels pending updates, applies the restart policy and starts again.
    void restartSession();
    // Stops the update worker. Called by the destructor.
    void shutdown();

    // ---------------------------------------------------------------------
    // Tracking engine inbound
    // ---------------------------------------------------------------------
    // Records the batch for the next throttled pass. Returns false when the
    // session is not running and the batch was dropped.
    bool onObservationBatch(ObservationBatch batch, const Pose& referencePose);
    void onTrackingQualityChanged(const TrackingQuality& quality);
    void onSessionFault(const TintFault& fault);

    // Runs one reconciliation pass on the calling thread, bypassing the
    // throttler. Returns empty stats and records InvalidState when the
    // session is not running.
    ReconcileStats reconcileNow(const ObservationBatch& batch, const Pose& referencePose);
    // Blocks until the throttler has no open window and no running pass.
    void waitForPendingUpdates();

    // ---------------------------------------------------------------------
    // Listeners
    // ---------------------------------------------------------------------
    SubscriptionId subscribe(std::shared_ptr<TintListener> listener);
    bool unsubscribe(SubscriptionId id);

    // ---------------------------------------------------------------------
    // Queries (snapshots)
    // ---------------------------------------------------------------------
    std::vector<WallEntity> listEntities() const;
    std::optional<WallEntity> getEntity(WallId id) const;
    std::optional<WallEntity> getSelected() const;
    std::optional<WallId> getSelectedId() const;
    SessionState getSessionState() const;
    std::size_t entityCount() const;
    ReconcileStats lastReconcileStats() const;
    std::uint64_t reconcileCount() const;
    TintError lastError() const;
    const EngineConfig& config() const;

    // Polled event stream (compact records, bounded queue).
    std::vector<TintEvent> pollEvents(std::size_t maxEvents);
    bool eventsOverflowed() const;
    void ackOverflow();

    // ---------------------------------------------------------------------
    // Commands
    // ---------------------------------------------------------------------
    TintError selectEntity(WallId id);
    TintError clearSelection();
    // Color commands act on the current selection.
    TintError applyColor(const PaintColor& color);
    // Paints a wall by id, selected or not. Only painting the selected wall
    // moves the session to ColorApplied.
    TintError applyColorTo(WallId id, const PaintColor& color);
    TintError undoColor();
    TintError redoColor();
    TintError setFinish(PaintFinish finish);
    TintError removeEntity(WallId id);
    std::size_t clearEntities();

private:
    EngineState& state() { return *state_; }
    const EngineState& state() const { return *state_; }

    void applyPass(const PendingBatch& batch);
    ReconcileStats runPass(const ObservationBatch& batch, const Pose& referencePose);
    // Population/selection bookkeeping after a registry mutation outside a pass.
    void syncSessionAfterRemoval(std::uint32_t selectionGenerationBefore);
    // Moves the pending events out, releases the state lock and delivers them.
    // The caller holds the dispatch lock.
    void publish(std::unique_lock<std::mutex>& stateLock);
    TintError recordResult(TintError result);

    std::unique_ptr<EngineState> state_;
};

} // namespace tint
