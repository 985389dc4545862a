#include "tint/engine.h"
#include "tint/core/logging.h"
#include "tint/internal/engine_state.h"
#include <utility>

namespace tint {

TintEngine::TintEngine(EngineConfig config, Clock clock)
    : state_(std::make_unique<EngineState>(*this, std::move(config), std::move(clock))) {
    TINT_LOG_INFO("engine created (window %u ms, history %u)",
        state().config.throttleWindowMs, state().config.maxColorHistory);
}

TintEngine::~TintEngine() {
    shutdown();
}

void TintEngine::shutdown() {
    // No engine lock here: the worker may be waiting for one.
    state().acceptingObservations_.store(false);
    state().throttler_.stop();
}

void TintEngine::publish(std::unique_lock<std::mutex>& stateLock) {
    std::vector<PendingEvent> events = state().events_.takePending();
    stateLock.unlock();
    state().events_.dispatch(events);
}

TintError TintEngine::recordResult(TintError result) {
    state().lastError = result;
    return result;
}

} // namespace tint
