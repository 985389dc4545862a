#include "tint/entity/wall_entity.h"

namespace tint {

WallEntity::WallEntity(WallId id, const WallGeometry& geometry, double nowMs, std::size_t historyCapacity)
    : id_(id),
      geometry_(geometry),
      history_(historyCapacity),
      detectedAtMs_(nowMs),
      lastUpdatedAtMs_(nowMs) {}

void WallEntity::updateGeometry(const WallGeometry& geometry, double nowMs) {
    geometry_ = geometry;
    lastUpdatedAtMs_ = nowMs;
}

bool WallEntity::applyColor(const PaintColor& color) {
    if (!history_.apply(color)) return false;
    syncCurrentColor();
    return true;
}

bool WallEntity::undoColor() {
    if (!history_.undo()) return false;
    syncCurrentColor();
    return true;
}

bool WallEntity::redoColor() {
    if (!history_.redo()) return false;
    syncCurrentColor();
    return true;
}

bool WallEntity::setFinish(PaintFinish finish) noexcept {
    if (finish_ == finish) return false;
    finish_ = finish;
    return true;
}

void WallEntity::syncCurrentColor() {
    currentColor_ = history_.current();
}

} // namespace tint
