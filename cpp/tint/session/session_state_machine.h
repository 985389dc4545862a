#pragma once

#include "tint/core/types.h"
#include "tint/session/session_state.h"
#include <cstddef>
#include <functional>
#include <utility>

namespace tint {

/**
 * Derives the coarse session lifecycle from registry population, selection
 * and tracking-quality signals.
 *
 * Initializing -> Scanning -> WallsDetected <-> WallSelected -> ColorApplied
 * Any -> Limited(reason) while tracking is degraded, Failed(fault) on a fault
 * (terminal until restart), Paused on pause.
 */
class SessionStateMachine {
public:
    using TransitionCallback = std::function<void(const SessionState& from, const SessionState& to)>;

    SessionStateMachine() = default;

    bool start();
    void onEntityDetected();
    void onSelectionChanged(bool hasSelection, std::size_t population);
    void onColorApplied();
    void onPopulationChanged(std::size_t population, bool hasSelection);
    void onTrackingQuality(const TrackingQuality& quality, std::size_t population, bool hasSelection);
    void onFault(const TintFault& fault);
    bool pause();
    bool resume();
    void restart();

    const SessionState& state() const noexcept { return state_; }
    bool isStarted() const noexcept { return started_; }
    // Scanning, WallsDetected, WallSelected, ColorApplied or Limited.
    bool isRunning() const noexcept;

    void setTransitionCallback(TransitionCallback callback) { transitionCallback_ = std::move(callback); }

    static SessionState impliedState(std::size_t population, bool hasSelection);

private:
    // Scanning, WallsDetected, WallSelected or ColorApplied.
    bool isTracking() const noexcept;
    void transitionTo(const SessionState& next);

    SessionState state_{};
    bool started_ = false;
    TransitionCallback transitionCallback_;
};

} // namespace tint
