#include "tint/internal/engine_state.h"
#include "tint/engine.h"
#include <chrono>
#include <utility>

namespace tint {

EngineState::EngineState(TintEngine& engine, EngineConfig cfg, Clock clk)
    : config(std::move(cfg)),
      clock(clk ? std::move(clk) : steadyClock()),
      registry_(config.maxColorHistory),
      selectionManager_(registry_, events_),
      throttler_(std::chrono::milliseconds(config.throttleWindowMs), [&engine](const PendingBatch& batch) {
          engine.applyPass(batch);
      }) {
    session_.setTransitionCallback([this](const SessionState& /*from*/, const SessionState& to) {
        events_.recordStateChanged(to);
        acceptingObservations_.store(session_.isRunning());
    });
}

} // namespace tint
