#pragma once

#include "tint/core/types.h"
#include <cstddef>
#include <optional>
#include <vector>

namespace tint {

// Bounded undo/redo stack of colors applied to one wall.
// position() is -1 while empty, otherwise the index of the active color.
class ColorHistory {
public:
    static constexpr std::size_t kDefaultCapacity = 20;

    explicit ColorHistory(std::size_t capacity = kDefaultCapacity);

    // Returns false (and leaves the history untouched) when color is already current.
    bool apply(const PaintColor& color);
    bool undo() noexcept;
    bool redo() noexcept;
    std::optional<PaintColor> current() const;

    bool canUndo() const noexcept { return position_ > 0; }
    bool canRedo() const noexcept { return position_ + 1 < static_cast<int>(entries_.size()); }

    void clear() noexcept;

    std::size_t size() const noexcept { return entries_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }
    int position() const noexcept { return position_; }
    const std::vector<PaintColor>& entries() const noexcept { return entries_; }

private:
    std::vector<PaintColor> entries_;
    int position_ = -1;
    std::size_t capacity_;
};

} // namespace tint
