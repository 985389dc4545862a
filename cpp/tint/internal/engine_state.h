#pragma once

#include "tint/core/config.h"
#include "tint/core/types.h"
#include "tint/core/util.h"
#include "tint/entity/entity_registry.h"
#include "tint/entity/selection_manager.h"
#include "tint/event/event_stream.h"
#include "tint/session/session_state_machine.h"
#include "tint/sync/update_throttler.h"

#include <atomic>
#include <cstdint>
#include <mutex>

namespace tint {

class TintEngine;

struct EngineState {
    EngineState(TintEngine& engine, EngineConfig cfg, Clock clk);

    EngineState(const EngineState&) = delete;
    EngineState& operator=(const EngineState&) = delete;

    const EngineConfig config;
    Clock clock;

    // Taken before stateMutex_ by every operation that publishes events.
    std::mutex dispatchMutex_;
    // Guards registry, selection, session and the event queue.
    mutable std::mutex stateMutex_;

    EventStream events_;
    EntityRegistry registry_;
    SelectionManager selectionManager_;
    SessionStateMachine session_;

    // Mirrors session_.isRunning() for the producer thread, which must not
    // wait on stateMutex_.
    std::atomic<bool> acceptingObservations_{false};

    ReconcileStats lastStats_{};
    std::uint64_t passCount_{0};
    TintError lastError{TintError::Ok};

    // Declared last: its worker calls back into the engine and must stop first.
    UpdateThrottler throttler_;
};

} // namespace tint
