#pragma once

#include "tint/core/types.h"
#include "tint/entity/color_history.h"
#include <cstddef>
#include <optional>

namespace tint {

struct WallGeometry {
    Extent extent;
    Pose pose;
};

// One tracked wall. Owned by EntityRegistry; everything outside the
// registry works on copies.
class WallEntity {
public:
    WallEntity(WallId id, const WallGeometry& geometry, double nowMs, std::size_t historyCapacity = ColorHistory::kDefaultCapacity);

    WallId id() const noexcept { return id_; }
    const WallGeometry& geometry() const noexcept { return geometry_; }
    bool isSelected() const noexcept { return selected_; }
    const std::optional<PaintColor>& currentColor() const noexcept { return currentColor_; }
    PaintFinish finish() const noexcept { return finish_; }
    const ColorHistory& colorHistory() const noexcept { return history_; }
    double detectedAtMs() const noexcept { return detectedAtMs_; }
    double lastUpdatedAtMs() const noexcept { return lastUpdatedAtMs_; }

    Vec3 center() const { return geometry_.pose.translation(); }
    // Plane normal is the pose's local z axis.
    Vec3 normal() const { return geometry_.pose.column(2); }
    float area() const { return geometry_.extent.width * geometry_.extent.height; }

    void updateGeometry(const WallGeometry& geometry, double nowMs);
    void setSelected(bool selected) noexcept { selected_ = selected; }

    bool applyColor(const PaintColor& color);
    bool undoColor();
    bool redoColor();
    bool setFinish(PaintFinish finish) noexcept;

private:
    void syncCurrentColor();

    WallId id_;
    WallGeometry geometry_;
    bool selected_ = false;
    std::optional<PaintColor> currentColor_;
    PaintFinish finish_ = PaintFinish::Matte;
    ColorHistory history_;
    double detectedAtMs_;
    double lastUpdatedAtMs_;
};

} // namespace tint
