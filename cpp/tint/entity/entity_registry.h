#pragma once

#include "tint/core/config.h"
#include "tint/core/types.h"
#include "tint/entity/color_history.h"
#include "tint/entity/wall_entity.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tint {

class SelectionManager; // Forward declaration
class EventStream;      // Forward declaration

struct ReconcileStats {
    std::uint32_t accepted = 0;
    std::uint32_t filtered = 0;
    std::uint32_t created = 0;
    std::uint32_t updated = 0;
    std::uint32_t removed = 0;
};

// Map from tracking id to WallEntity, reconciled against observation batches.
// Not thread-safe on its own: TintEngine calls it under its state lock.
class EntityRegistry {
public:
    explicit EntityRegistry(std::size_t historyCapacity = ColorHistory::kDefaultCapacity);

    // One full pass: create/update accepted observations, remove absent ids.
    // Removing the selected entity deselects it first, so the
    // selectionChanged(None) event precedes the removed event.
    ReconcileStats reconcile(
        const ObservationBatch& batch,
        const ReconcileFilter& filter,
        double nowMs,
        SelectionManager& selection,
        EventStream& events);

    static bool passesFilter(const SurfaceObservation& obs, const ReconcileFilter& filter);

    bool remove(WallId id, SelectionManager& selection, EventStream& events);
    std::size_t clear(SelectionManager& selection, EventStream& events);
    // Drops everything without events (engine teardown and tests).
    void reset() noexcept;

    const WallEntity* find(WallId id) const;
    WallEntity* find(WallId id);
    std::optional<WallEntity> get(WallId id) const;
    std::vector<WallEntity> all() const;

    bool contains(WallId id) const { return walls_.find(id) != walls_.end(); }
    std::size_t size() const noexcept { return walls_.size(); }
    bool empty() const noexcept { return walls_.empty(); }
    // Ids in detection order.
    const std::vector<WallId>& order() const noexcept { return order_; }
    std::size_t historyCapacity() const noexcept { return historyCapacity_; }

private:
    void eraseEntity(WallId id, SelectionManager& selection, EventStream& events);

    std::unordered_map<WallId, WallEntity> walls_;
    std::vector<WallId> order_;
    std::unordered_map<WallId, std::uint32_t> missedPasses_;
    std::size_t historyCapacity_;
};

} // namespace tint
