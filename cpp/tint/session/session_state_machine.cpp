#include "tint/session/session_state_machine.h"
#include "tint/core/logging.h"

namespace tint {

using Kind = SessionState::Kind;

SessionState SessionStateMachine::impliedState(std::size_t population, bool hasSelection) {
    if (population == 0) return SessionState::scanning();
    return hasSelection ? SessionState::wallSelected() : SessionState::wallsDetected();
}

bool SessionStateMachine::isTracking() const noexcept {
    switch (state_.kind) {
        case Kind::Scanning:
        case Kind::WallsDetected:
        case Kind::WallSelected:
        case Kind::ColorApplied:
            return true;
        default:
            return false;
    }
}

bool SessionStateMachine::isRunning() const noexcept {
    return isTracking() || state_.is(Kind::Limited);
}

bool SessionStateMachine::start() {
    if (!state_.is(Kind::Initializing)) return false;
    started_ = true;
    transitionTo(SessionState::scanning());
    return true;
}

void SessionStateMachine::onEntityDetected() {
    if (state_.is(Kind::Scanning)) {
        transitionTo(SessionState::wallsDetected());
    }
}

void SessionStateMachine::onSelectionChanged(bool hasSelection, std::size_t population) {
    if (!isTracking()) return;
    transitionTo(impliedState(population, hasSelection));
}

void SessionStateMachine::onColorApplied() {
    if (state_.is(Kind::WallSelected)) {
        transitionTo(SessionState::colorApplied());
    }
}

void SessionStateMachine::onPopulationChanged(std::size_t population, bool hasSelection) {
    if (!isTracking()) return;
    if (population == 0) {
        transitionTo(SessionState::scanning());
        return;
    }
    if (state_.is(Kind::Scanning)) {
        // Registry preserved across a resume: no detected event will follow.
        transitionTo(impliedState(population, hasSelection));
        return;
    }
    if (!hasSelection && (state_.is(Kind::WallSelected) || state_.is(Kind::ColorApplied))) {
        transitionTo(SessionState::wallsDetected());
    }
}

void SessionStateMachine::onTrackingQuality(const TrackingQuality& quality, std::size_t population, bool hasSelection) {
    if (!started_) return;
    if (state_.is(Kind::Failed) || state_.is(Kind::Paused)) return;

    switch (quality.kind) {
        case TrackingQuality::Kind::Normal:
            if (state_.is(Kind::Limited)) {
                transitionTo(impliedState(population, hasSelection));
            }
            break;
        case TrackingQuality::Kind::Initializing:
            transitionTo(SessionState::limited(LimitedReason::Initializing));
            break;
        case TrackingQuality::Kind::Limited:
            transitionTo(SessionState::limited(quality.reason));
            break;
        case TrackingQuality::Kind::Unavailable:
            transitionTo(SessionState::limited(LimitedReason::Unavailable));
            break;
    }
}

void SessionStateMachine::onFault(const TintFault& fault) {
    if (state_.is(Kind::Failed)) return;
    TINT_LOG_ERROR("session fault %u: %s", fault.code, fault.message.c_str());
    transitionTo(SessionState::failed(fault));
}

bool SessionStateMachine::pause() {
    if (state_.is(Kind::Failed) || state_.is(Kind::Paused)) return false;
    transitionTo(SessionState::paused());
    return true;
}

bool SessionStateMachine::resume() {
    if (!state_.is(Kind::Paused)) return false;
    started_ = true;
    transitionTo(SessionState::scanning());
    return true;
}

void SessionStateMachine::restart() {
    started_ = false;
    transitionTo(SessionState::initializing());
}

void SessionStateMachine::transitionTo(const SessionState& next) {
    if (state_ == next) return;
    const SessionState previous = state_;
    state_ = next;
    TINT_LOG_INFO("session state %s -> %s", describeState(previous).c_str(), describeState(next).c_str());
    if (transitionCallback_) {
        transitionCallback_(previous, state_);
    }
}

} // namespace tint
