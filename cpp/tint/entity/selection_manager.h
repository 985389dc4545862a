#pragma once

#include "tint/core/types.h"
#include "tint/entity/wall_entity.h"
#include <cstdint>
#include <optional>

namespace tint {

class EntityRegistry; // Forward declaration
class EventStream;    // Forward declaration

// Enforces the single-selection invariant over the registry. Only the final
// selection is published: switching from A to B emits selectionChanged(B)
// without an intermediate selectionChanged(None).
class SelectionManager {
public:
    SelectionManager(EntityRegistry& registry, EventStream& events);

    TintError select(WallId id);
    bool deselect();
    // Deselects id if it holds the selection. Called before id is removed.
    bool clearIfSelected(WallId id);
    // Drops a selection that no longer refers to a live entity.
    void prune();

    std::optional<WallId> currentId() const noexcept { return selected_; }
    std::optional<WallEntity> current() const;
    WallEntity* selectedEntity();
    bool isSelected(WallId id) const noexcept { return selected_ && *selected_ == id; }
    bool hasSelection() const noexcept { return selected_.has_value(); }
    std::uint32_t getGeneration() const noexcept { return generation_; }

    void clear() noexcept; // Resets state without events

private:
    EntityRegistry& registry_;
    EventStream& events_;
    std::optional<WallId> selected_;
    std::uint32_t generation_ = 0;
};

} // namespace tint
