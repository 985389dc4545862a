#pragma once

#include "tint/core/types.h"
#include "tint/entity/wall_entity.h"
#include "tint/session/session_state.h"
#include <optional>

namespace tint {

// Outbound notifications for the UI/render layer. Callbacks run on the thread
// that produced the change, after the engine's state lock has been released,
// in production order. A callback must not issue engine commands
// synchronously; queries are allowed.
class TintListener {
public:
    virtual ~TintListener() = default;
    virtual void onEntityDetected(const WallEntity& /*wall*/) {}
    virtual void onEntityUpdated(const WallEntity& /*wall*/) {}
    virtual void onEntityRemoved(WallId /*id*/) {}
    virtual void onSelectionChanged(std::optional<WallId> /*id*/) {}
    virtual void onSessionStateChanged(const SessionState& /*state*/) {}
};

} // namespace tint
