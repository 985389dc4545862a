// TintEngine snapshot queries, polled events and listener registration

#include "tint/engine.h"
#include "tint/internal/engine_state.h"
#include <utility>

namespace tint {

SubscriptionId TintEngine::subscribe(std::shared_ptr<TintListener> listener) {
    return state().events_.subscribe(std::move(listener));
}

bool TintEngine::unsubscribe(SubscriptionId id) {
    return state().events_.unsubscribe(id);
}

std::vector<WallEntity> TintEngine::listEntities() const {
    std::lock_guard<std::mutex> lock(state().stateMutex_);
    return state().registry_.all();
}

std::optional<WallEntity> TintEngine::getEntity(WallId id) const {
    std::lock_guard<std::mutex> lock(state().stateMutex_);
    return state().registry_.get(id);
}

std::optional<WallEntity> TintEngine::getSelected() const {
    std::lock_guard<std::mutex> lock(state().stateMutex_);
    return state().selectionManager_.current();
}

std::optional<WallId> TintEngine::getSelectedId() const {
    std::lock_guard<std::mutex> lock(state().stateMutex_);
    return state().selectionManager_.currentId();
}

SessionState TintEngine::getSessionState() const {
    std::lock_guard<std::mutex> lock(state().stateMutex_);
    return state().session_.state();
}

std::size_t TintEngine::entityCount() const {
    std::lock_guard<std::mutex> lock(state().stateMutex_);
    return state().registry_.size();
}

ReconcileStats TintEngine::lastReconcileStats() const {
    std::lock_guard<std::mutex> lock(state().stateMutex_);
    return state().lastStats_;
}

std::uint64_t TintEngine::reconcileCount() const {
    std::lock_guard<std::mutex> lock(state().stateMutex_);
    return state().passCount_;
}

TintError TintEngine::lastError() const {
    std::lock_guard<std::mutex> lock(state().stateMutex_);
    return state().lastError;
}

const EngineConfig& TintEngine::config() const {
    return state().config;
}

std::vector<TintEvent> TintEngine::pollEvents(std::size_t maxEvents) {
    std::lock_guard<std::mutex> lock(state().stateMutex_);
    return state().events_.poll(maxEvents);
}

bool TintEngine::eventsOverflowed() const {
    std::lock_guard<std::mutex> lock(state().stateMutex_);
    return state().events_.overflowed();
}

void TintEngine::ackOverflow() {
    std::lock_guard<std::mutex> lock(state().stateMutex_);
    state().events_.ackOverflow();
}

} // namespace tint
