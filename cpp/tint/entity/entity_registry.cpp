#include "tint/entity/entity_registry.h"
#include "tint/core/logging.h"
#include "tint/entity/selection_manager.h"
#include "tint/event/event_stream.h"
#include <algorithm>
#include <cassert>

namespace tint {

namespace {
    unsigned long long idArg(WallId id) {
        return static_cast<unsigned long long>(id);
    }
}

EntityRegistry::EntityRegistry(std::size_t historyCapacity)
    : historyCapacity_(historyCapacity) {}

bool EntityRegistry::passesFilter(const SurfaceObservation& obs, const ReconcileFilter& filter) {
    if (obs.id == kInvalidWallId) return false;
    if (obs.alignment != PlaneAlignment::Vertical) return false;
    if (!(obs.extent.width >= filter.minSize && obs.extent.height >= filter.minSize)) return false;
    const float dist = distance(obs.pose.translation(), filter.referencePose.translation());
    if (!(dist <= filter.maxDistance)) return false;
    return true;
}

ReconcileStats EntityRegistry::reconcile(
    const ObservationBatch& batch,
    const ReconcileFilter& filter,
    double nowMs,
    SelectionManager& selection,
    EventStream& events) {
    ReconcileStats stats{};

    // Accepted ids in first-appearance order; the last observation of an id wins.
    std::vector<WallId> acceptedOrder;
    std::unordered_map<WallId, const SurfaceObservation*> accepted;
    acceptedOrder.reserve(batch.size());
    for (const auto& obs : batch) {
        if (!passesFilter(obs, filter)) {
            stats.filtered++;
            TINT_LOG_DEBUG("reconcile: observation %llu filtered", idArg(obs.id));
            continue;
        }
        auto [it, inserted] = accepted.emplace(obs.id, &obs);
        if (inserted) {
            acceptedOrder.push_back(obs.id);
        } else {
            it->second = &obs;
        }
    }

    // Existing entities that survive this pass count against the cap before new ones.
    if (filter.maxTrackedWalls > 0) {
        std::size_t retained = 0;
        for (const WallId id : order_) {
            if (accepted.find(id) != accepted.end()) {
                retained++;
                continue;
            }
            const auto missed = missedPasses_.find(id);
            const std::uint32_t count = missed == missedPasses_.end() ? 0 : missed->second;
            if (count + 1 <= filter.removalGracePasses) retained++;
        }
        std::size_t room = filter.maxTrackedWalls > retained ? filter.maxTrackedWalls - retained : 0;
        std::vector<WallId> admitted;
        admitted.reserve(acceptedOrder.size());
        for (const WallId id : acceptedOrder) {
            if (contains(id)) {
                admitted.push_back(id);
            } else if (room > 0) {
                admitted.push_back(id);
                room--;
            } else {
                accepted.erase(id);
                stats.filtered++;
                TINT_LOG_DEBUG("reconcile: wall %llu over tracking cap", idArg(id));
            }
        }
        acceptedOrder.swap(admitted);
    }

    for (const WallId id : acceptedOrder) {
        const SurfaceObservation& obs = *accepted[id];
        const WallGeometry geometry{obs.extent, obs.pose};
        stats.accepted++;
        missedPasses_.erase(id);

        auto it = walls_.find(id);
        if (it == walls_.end()) {
            const auto created = walls_.emplace(id, WallEntity(id, geometry, nowMs, historyCapacity_)).first;
            order_.push_back(id);
            stats.created++;
            events.recordDetected(created->second);
            TINT_LOG_INFO("wall %llu detected", idArg(id));
        } else {
            it->second.updateGeometry(geometry, nowMs);
            stats.updated++;
            events.recordUpdated(it->second);
        }
    }

    std::vector<WallId> absent;
    for (const WallId id : order_) {
        if (accepted.find(id) != accepted.end()) continue;
        const std::uint32_t missed = ++missedPasses_[id];
        if (missed > filter.removalGracePasses) absent.push_back(id);
    }
    for (const WallId id : absent) {
        eraseEntity(id, selection, events);
        stats.removed++;
    }

    assert(walls_.size() == order_.size());
    return stats;
}

void EntityRegistry::eraseEntity(WallId id, SelectionManager& selection, EventStream& events) {
    selection.clearIfSelected(id);
    walls_.erase(id);
    missedPasses_.erase(id);
    const auto it = std::find(order_.begin(), order_.end(), id);
    if (it != order_.end()) order_.erase(it);
    events.recordRemoved(id);
    TINT_LOG_INFO("wall %llu removed", idArg(id));
}

bool EntityRegistry::remove(WallId id, SelectionManager& selection, EventStream& events) {
    if (!contains(id)) {
        TINT_LOG_WARN("remove: wall %llu not found", idArg(id));
        return false;
    }
    eraseEntity(id, selection, events);
    return true;
}

std::size_t EntityRegistry::clear(SelectionManager& selection, EventStream& events) {
    selection.deselect();
    const std::vector<WallId> ids = order_;
    for (const WallId id : ids) {
        eraseEntity(id, selection, events);
    }
    return ids.size();
}

void EntityRegistry::reset() noexcept {
    walls_.clear();
    order_.clear();
    missedPasses_.clear();
}

const WallEntity* EntityRegistry::find(WallId id) const {
    const auto it = walls_.find(id);
    if (it == walls_.end()) return nullptr;
    return &it->second;
}

WallEntity* EntityRegistry::find(WallId id) {
    const auto it = walls_.find(id);
    if (it == walls_.end()) return nullptr;
    return &it->second;
}

std::optional<WallEntity> EntityRegistry::get(WallId id) const {
    const WallEntity* wall = find(id);
    if (!wall) return std::nullopt;
    return *wall;
}

std::vector<WallEntity> EntityRegistry::all() const {
    std::vector<WallEntity> out;
    out.reserve(order_.size());
    for (const WallId id : order_) {
        const auto it = walls_.find(id);
        if (it != walls_.end()) out.push_back(it->second);
    }
    return out;
}

} // namespace tint
