// TintEngine user commands: selection, color, finish and registry edits

#include "tint/engine.h"
#include "tint/core/logging.h"
#include "tint/internal/engine_state.h"

namespace tint {

TintError TintEngine::selectEntity(WallId id) {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    EngineState& s = state();
    const std::uint32_t generation = s.selectionManager_.getGeneration();
    const TintError result = s.selectionManager_.select(id);
    if (result == TintError::Ok && s.selectionManager_.getGeneration() != generation) {
        s.session_.onSelectionChanged(true, s.registry_.size());
    }
    recordResult(result);
    publish(lock);
    return result;
}

TintError TintEngine::clearSelection() {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    EngineState& s = state();
    if (!s.selectionManager_.deselect()) {
        return recordResult(TintError::Unchanged);
    }
    s.session_.onSelectionChanged(false, s.registry_.size());
    recordResult(TintError::Ok);
    publish(lock);
    return TintError::Ok;
}

TintError TintEngine::applyColor(const PaintColor& color) {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    EngineState& s = state();
    WallEntity* wall = s.selectionManager_.selectedEntity();
    if (!wall) {
        TINT_LOG_WARN("applyColor: nothing selected");
        return recordResult(TintError::NoSelection);
    }
    if (!wall->applyColor(color)) {
        return recordResult(TintError::Unchanged);
    }
    s.events_.recordUpdated(*wall);
    s.session_.onColorApplied();
    recordResult(TintError::Ok);
    publish(lock);
    return TintError::Ok;
}

TintError TintEngine::applyColorTo(WallId id, const PaintColor& color) {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    EngineState& s = state();
    WallEntity* wall = s.registry_.find(id);
    if (!wall) {
        TINT_LOG_WARN("applyColorTo: wall %llu not found", static_cast<unsigned long long>(id));
        return recordResult(TintError::NotFound);
    }
    if (!wall->applyColor(color)) {
        return recordResult(TintError::Unchanged);
    }
    s.events_.recordUpdated(*wall);
    if (s.selectionManager_.isSelected(id)) {
        s.session_.onColorApplied();
    }
    recordResult(TintError::Ok);
    publish(lock);
    return TintError::Ok;
}

TintError TintEngine::undoColor() {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    WallEntity* wall = state().selectionManager_.selectedEntity();
    if (!wall) return recordResult(TintError::NoSelection);
    if (!wall->undoColor()) return recordResult(TintError::Unchanged);
    state().events_.recordUpdated(*wall);
    recordResult(TintError::Ok);
    publish(lock);
    return TintError::Ok;
}

TintError TintEngine::redoColor() {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    WallEntity* wall = state().selectionManager_.selectedEntity();
    if (!wall) return recordResult(TintError::NoSelection);
    if (!wall->redoColor()) return recordResult(TintError::Unchanged);
    state().events_.recordUpdated(*wall);
    recordResult(TintError::Ok);
    publish(lock);
    return TintError::Ok;
}

TintError TintEngine::setFinish(PaintFinish finish) {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    WallEntity* wall = state().selectionManager_.selectedEntity();
    if (!wall) return recordResult(TintError::NoSelection);
    if (!wall->setFinish(finish)) return recordResult(TintError::Unchanged);
    TINT_LOG_DEBUG("wall %llu finish %s", static_cast<unsigned long long>(wall->id()), finishName(finish));
    state().events_.recordUpdated(*wall);
    recordResult(TintError::Ok);
    publish(lock);
    return TintError::Ok;
}

TintError TintEngine::removeEntity(WallId id) {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    EngineState& s = state();
    const std::uint32_t generation = s.selectionManager_.getGeneration();
    if (!s.registry_.remove(id, s.selectionManager_, s.events_)) {
        TINT_LOG_WARN("removeEntity: wall %llu not found", static_cast<unsigned long long>(id));
        return recordResult(TintError::NotFound);
    }
    syncSessionAfterRemoval(generation);
    recordResult(TintError::Ok);
    publish(lock);
    return TintError::Ok;
}

std::size_t TintEngine::clearEntities() {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    EngineState& s = state();
    const std::uint32_t generation = s.selectionManager_.getGeneration();
    const std::size_t removed = s.registry_.clear(s.selectionManager_, s.events_);
    if (removed > 0) {
        syncSessionAfterRemoval(generation);
    }
    recordResult(TintError::Ok);
    publish(lock);
    return removed;
}

void TintEngine::syncSessionAfterRemoval(std::uint32_t selectionGenerationBefore) {
    EngineState& s = state();
    if (s.selectionManager_.getGeneration() != selectionGenerationBefore) {
        s.session_.onSelectionChanged(s.selectionManager_.hasSelection(), s.registry_.size());
    }
    s.session_.onPopulationChanged(s.registry_.size(), s.selectionManager_.hasSelection());
}

} // namespace tint
