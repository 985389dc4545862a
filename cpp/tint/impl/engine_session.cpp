// TintEngine session lifecycle and tracking-engine inbound methods

#include "tint/engine.h"
#include "tint/core/logging.h"
#include "tint/internal/engine_state.h"
#include <utility>

namespace tint {

bool TintEngine::startSession() {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    if (!state().session_.start()) {
        TINT_LOG_WARN("startSession ignored in state %s", describeState(state().session_.state()).c_str());
        recordResult(TintError::InvalidState);
        return false;
    }
    state().throttler_.start();
    recordResult(TintError::Ok);
    publish(lock);
    return true;
}

bool TintEngine::pauseSession() {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    if (!state().session_.isStarted() || !state().session_.pause()) {
        recordResult(TintError::InvalidState);
        return false;
    }
    state().throttler_.cancel();
    recordResult(TintError::Ok);
    publish(lock);
    return true;
}

bool TintEngine::resumeSession() {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    EngineState& s = state();
    if (!s.session_.state().is(SessionState::Kind::Paused)) {
        recordResult(TintError::InvalidState);
        return false;
    }
    s.throttler_.cancel();
    if (s.config.restartPolicy == RestartPolicy::ClearRegistry) {
        s.registry_.clear(s.selectionManager_, s.events_);
    }
    s.session_.resume();
    s.session_.onPopulationChanged(s.registry_.size(), s.selectionManager_.hasSelection());
    s.throttler_.start();
    recordResult(TintError::Ok);
    publish(lock);
    return true;
}

void TintEngine::restartSession() {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    EngineState& s = state();
    s.throttler_.cancel();
    if (s.config.restartPolicy == RestartPolicy::ClearRegistry) {
        s.registry_.clear(s.selectionManager_, s.events_);
    }
    s.session_.restart();
    s.session_.start();
    s.session_.onPopulationChanged(s.registry_.size(), s.selectionManager_.hasSelection());
    s.throttler_.start();
    TINT_LOG_INFO("session restarted (%zu walls kept)", s.registry_.size());
    recordResult(TintError::Ok);
    publish(lock);
}

bool TintEngine::onObservationBatch(ObservationBatch batch, const Pose& referencePose) {
    if (!state().acceptingObservations_.load()) {
        TINT_LOG_DEBUG("observation batch dropped: session not running");
        return false;
    }
    return state().throttler_.submit(std::move(batch), referencePose);
}

void TintEngine::onTrackingQualityChanged(const TrackingQuality& quality) {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    EngineState& s = state();
    if (quality.kind != TrackingQuality::Kind::Normal) {
        TINT_LOG_WARN("tracking degraded: %s", limitedReasonName(quality.reason));
    }
    s.session_.onTrackingQuality(quality, s.registry_.size(), s.selectionManager_.hasSelection());
    publish(lock);
}

void TintEngine::onSessionFault(const TintFault& fault) {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    state().throttler_.cancel();
    state().session_.onFault(fault);
    publish(lock);
}

ReconcileStats TintEngine::reconcileNow(const ObservationBatch& batch, const Pose& referencePose) {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    if (!state().session_.isRunning()) {
        recordResult(TintError::InvalidState);
        return ReconcileStats{};
    }
    const ReconcileStats stats = runPass(batch, referencePose);
    recordResult(TintError::Ok);
    publish(lock);
    return stats;
}

void TintEngine::applyPass(const PendingBatch& batch) {
    std::unique_lock<std::mutex> dispatchLock(state().dispatchMutex_);
    std::unique_lock<std::mutex> lock(state().stateMutex_);
    if (batch.epoch != state().throttler_.epoch()) {
        // Paused, restarted or faulted after the window closed.
        TINT_LOG_DEBUG("pass dropped: batch from cancelled epoch %llu",
            static_cast<unsigned long long>(batch.epoch));
        return;
    }
    if (!state().session_.isRunning()) {
        TINT_LOG_DEBUG("pass dropped: session %s", describeState(state().session_.state()).c_str());
        return;
    }
    runPass(batch.observations, batch.referencePose);
    publish(lock);
}

ReconcileStats TintEngine::runPass(const ObservationBatch& batch, const Pose& referencePose) {
    EngineState& s = state();
    const std::uint32_t selectionGeneration = s.selectionManager_.getGeneration();
    const ReconcileStats stats = s.registry_.reconcile(
        batch, s.config.makeFilter(referencePose), s.clock(), s.selectionManager_, s.events_);

    if (stats.created > 0) {
        s.session_.onEntityDetected();
    }
    if (s.selectionManager_.getGeneration() != selectionGeneration) {
        s.session_.onSelectionChanged(s.selectionManager_.hasSelection(), s.registry_.size());
    }
    s.session_.onPopulationChanged(s.registry_.size(), s.selectionManager_.hasSelection());

    s.lastStats_ = stats;
    s.passCount_++;
    TINT_LOG_DEBUG("pass %llu: accepted %u filtered %u created %u updated %u removed %u",
        static_cast<unsigned long long>(s.passCount_),
        stats.accepted, stats.filtered, stats.created, stats.updated, stats.removed);
    return stats;
}

void TintEngine::waitForPendingUpdates() {
    state().throttler_.waitIdle();
}

} // namespace tint
