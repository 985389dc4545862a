#include "tint/entity/color_history.h"
#include <algorithm>

namespace tint {

ColorHistory::ColorHistory(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool ColorHistory::apply(const PaintColor& color) {
    if (position_ >= 0 && entries_[static_cast<std::size_t>(position_)] == color) {
        return false;
    }

    const std::size_t keep = static_cast<std::size_t>(position_ + 1);
    if (keep < entries_.size()) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(keep), entries_.end());
    }

    entries_.push_back(color);
    if (entries_.size() > capacity_) {
        const std::size_t overflow = entries_.size() - capacity_;
        entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(overflow));
    }
    position_ = static_cast<int>(entries_.size()) - 1;
    return true;
}

bool ColorHistory::undo() noexcept {
    if (!canUndo()) return false;
    position_--;
    return true;
}

bool ColorHistory::redo() noexcept {
    if (!canRedo()) return false;
    position_++;
    return true;
}

std::optional<PaintColor> ColorHistory::current() const {
    if (position_ < 0) return std::nullopt;
    return entries_[static_cast<std::size_t>(position_)];
}

void ColorHistory::clear() noexcept {
    entries_.clear();
    position_ = -1;
}

} // namespace tint
