#pragma once

#include "tint/core/types.h"
#include "tint/entity/wall_entity.h"
#include "tint/event/listener.h"
#include "tint/session/session_state.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace tint {

enum class EventType : std::uint16_t {
    Overflow = 1,
    EntityDetected = 2,
    EntityUpdated = 3,
    EntityRemoved = 4,
    SelectionChanged = 5,
    SessionStateChanged = 6,
};

// Compact record kept in the polled ring buffer.
struct TintEvent {
    EventType type;
    WallId id;            // entity id; selected id (0 = none) for SelectionChanged
    std::uint32_t state;  // SessionState::Kind for SessionStateChanged
    std::uint32_t generation;
};

// Full payload delivered to listeners.
struct PendingEvent {
    EventType type;
    WallId id = kInvalidWallId;
    std::optional<WallEntity> entity;
    std::optional<WallId> selection;
    std::optional<SessionState> state;
};

using SubscriptionId = std::uint32_t;

// Collects the events of one critical section, keeps a bounded polled queue
// of compact records and fans pending events out to subscribed listeners.
// record*/takePending/poll run under the engine's state lock; the listener
// list has its own lock.
class EventStream {
public:
    static constexpr std::size_t kMaxEvents = 2048;

    EventStream();

    void recordDetected(const WallEntity& wall);
    void recordUpdated(const WallEntity& wall);
    void recordRemoved(WallId id);
    void recordSelectionChanged(std::optional<WallId> id);
    void recordStateChanged(const SessionState& state);

    bool hasPending() const noexcept { return !pending_.empty(); }
    // Moves the pending events out and mirrors them into the polled queue.
    std::vector<PendingEvent> takePending();
    void discardPending() { pending_.clear(); }

    std::vector<TintEvent> poll(std::size_t maxCount);
    std::size_t queuedCount() const noexcept { return count_; }
    bool overflowed() const noexcept { return overflowed_; }
    void ackOverflow() noexcept;
    void clearQueue() noexcept;

    SubscriptionId subscribe(std::shared_ptr<TintListener> listener);
    bool unsubscribe(SubscriptionId id);
    std::size_t listenerCount() const;
    void dispatch(const std::vector<PendingEvent>& events) const;

private:
    bool pushEvent(const TintEvent& ev);

    std::vector<PendingEvent> pending_;

    std::vector<TintEvent> queue_;
    std::size_t head_{0};
    std::size_t tail_{0};
    std::size_t count_{0};
    bool overflowed_{false};
    std::uint32_t generation_{0};

    mutable std::mutex listenersMutex_;
    std::vector<std::pair<SubscriptionId, std::shared_ptr<TintListener>>> listeners_;
    SubscriptionId nextSubscription_{1};
};

} // namespace tint
