#include "tint/event/event_stream.h"
#include "tint/core/logging.h"
#include <algorithm>

namespace tint {

EventStream::EventStream()
    : queue_(kMaxEvents) {}

void EventStream::recordDetected(const WallEntity& wall) {
    PendingEvent ev{EventType::EntityDetected};
    ev.id = wall.id();
    ev.entity = wall;
    pending_.push_back(std::move(ev));
}

void EventStream::recordUpdated(const WallEntity& wall) {
    PendingEvent ev{EventType::EntityUpdated};
    ev.id = wall.id();
    ev.entity = wall;
    pending_.push_back(std::move(ev));
}

void EventStream::recordRemoved(WallId id) {
    PendingEvent ev{EventType::EntityRemoved};
    ev.id = id;
    pending_.push_back(std::move(ev));
}

void EventStream::recordSelectionChanged(std::optional<WallId> id) {
    PendingEvent ev{EventType::SelectionChanged};
    ev.id = id.value_or(kInvalidWallId);
    ev.selection = id;
    pending_.push_back(std::move(ev));
}

void EventStream::recordStateChanged(const SessionState& state) {
    PendingEvent ev{EventType::SessionStateChanged};
    ev.state = state;
    pending_.push_back(std::move(ev));
}

std::vector<PendingEvent> EventStream::takePending() {
    std::vector<PendingEvent> out;
    out.swap(pending_);
    if (out.empty()) return out;

    generation_++;
    for (const auto& ev : out) {
        TintEvent record{ev.type, ev.id, 0, generation_};
        if (ev.state) {
            record.state = static_cast<std::uint32_t>(ev.state->kind);
        }
        if (!pushEvent(record)) break;
    }
    return out;
}

bool EventStream::pushEvent(const TintEvent& ev) {
    if (overflowed_) return false;
    if (count_ >= kMaxEvents) {
        TINT_LOG_WARN("event queue overflow at generation %u", generation_);
        overflowed_ = true;
        head_ = 0;
        tail_ = 0;
        count_ = 0;
        return false;
    }
    queue_[tail_] = ev;
    tail_ = (tail_ + 1) % kMaxEvents;
    count_++;
    return true;
}

std::vector<TintEvent> EventStream::poll(std::size_t maxCount) {
    std::vector<TintEvent> out;
    if (overflowed_) {
        out.push_back(TintEvent{EventType::Overflow, kInvalidWallId, 0, generation_});
        return out;
    }
    if (count_ == 0 || maxCount == 0) return out;

    const std::size_t n = std::min(maxCount, count_);
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(queue_[head_]);
        head_ = (head_ + 1) % kMaxEvents;
        count_--;
    }
    return out;
}

void EventStream::ackOverflow() noexcept {
    if (!overflowed_) return;
    overflowed_ = false;
    clearQueue();
}

void EventStream::clearQueue() noexcept {
    head_ = 0;
    tail_ = 0;
    count_ = 0;
}

SubscriptionId EventStream::subscribe(std::shared_ptr<TintListener> listener) {
    if (!listener) return 0;
    std::lock_guard<std::mutex> lock(listenersMutex_);
    const SubscriptionId id = nextSubscription_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool EventStream::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    const auto it = std::find_if(listeners_.begin(), listeners_.end(), [id](const auto& entry) {
        return entry.first == id;
    });
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

std::size_t EventStream::listenerCount() const {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    return listeners_.size();
}

void EventStream::dispatch(const std::vector<PendingEvent>& events) const {
    if (events.empty()) return;

    std::vector<std::shared_ptr<TintListener>> targets;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        targets.reserve(listeners_.size());
        for (const auto& entry : listeners_) targets.push_back(entry.second);
    }
    if (targets.empty()) return;

    for (const auto& ev : events) {
        for (const auto& listener : targets) {
            switch (ev.type) {
                case EventType::EntityDetected:
                    listener->onEntityDetected(*ev.entity);
                    break;
                case EventType::EntityUpdated:
                    listener->onEntityUpdated(*ev.entity);
                    break;
                case EventType::EntityRemoved:
                    listener->onEntityRemoved(ev.id);
                    break;
                case EventType::SelectionChanged:
                    listener->onSelectionChanged(ev.selection);
                    break;
                case EventType::SessionStateChanged:
                    listener->onSessionStateChanged(*ev.state);
                    break;
                case EventType::Overflow:
                    break;
            }
        }
    }
}

} // namespace tint
