#include "tint/entity/selection_manager.h"
#include "tint/core/logging.h"
#include "tint/entity/entity_registry.h"
#include "tint/event/event_stream.h"

namespace tint {

SelectionManager::SelectionManager(EntityRegistry& registry, EventStream& events)
    : registry_(registry), events_(events) {}

TintError SelectionManager::select(WallId id) {
    WallEntity* target = registry_.find(id);
    if (!target) {
        TINT_LOG_WARN("select: wall %llu not found", static_cast<unsigned long long>(id));
        return TintError::NotFound;
    }
    if (isSelected(id)) return TintError::Ok;

    if (selected_) {
        if (WallEntity* previous = registry_.find(*selected_)) {
            previous->setSelected(false);
        }
    }
    target->setSelected(true);
    selected_ = id;
    generation_++;
    events_.recordSelectionChanged(selected_);
    TINT_LOG_INFO("wall %llu selected", static_cast<unsigned long long>(id));
    return TintError::Ok;
}

bool SelectionManager::deselect() {
    if (!selected_) return false;
    if (WallEntity* wall = registry_.find(*selected_)) {
        wall->setSelected(false);
    }
    selected_.reset();
    generation_++;
    events_.recordSelectionChanged(std::nullopt);
    return true;
}

bool SelectionManager::clearIfSelected(WallId id) {
    if (!isSelected(id)) return false;
    return deselect();
}

void SelectionManager::prune() {
    if (!selected_) return;
    if (registry_.contains(*selected_)) return;
    selected_.reset();
    generation_++;
    events_.recordSelectionChanged(std::nullopt);
}

std::optional<WallEntity> SelectionManager::current() const {
    if (!selected_) return std::nullopt;
    return registry_.get(*selected_);
}

WallEntity* SelectionManager::selectedEntity() {
    if (!selected_) return nullptr;
    return registry_.find(*selected_);
}

void SelectionManager::clear() noexcept {
    selected_.reset();
    generation_ = 0;
}

} // namespace tint
