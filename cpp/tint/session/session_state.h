#pragma once

#include "tint/core/types.h"
#include <cstdint>
#include <string>

namespace tint {

// Coarse lifecycle state published to the UI layer.
struct SessionState {
    enum class Kind : std::uint32_t {
        Initializing = 0,
        Scanning = 1,
        WallsDetected = 2,
        WallSelected = 3,
        ColorApplied = 4,
        Limited = 5,
        Failed = 6,
        Paused = 7,
    };

    Kind kind = Kind::Initializing;
    // Meaningful only for Limited.
    LimitedReason reason = LimitedReason::Initializing;
    // Meaningful only for Failed.
    TintFault fault{};

    static SessionState initializing() { return SessionState{}; }
    static SessionState scanning() { return make(Kind::Scanning); }
    static SessionState wallsDetected() { return make(Kind::WallsDetected); }
    static SessionState wallSelected() { return make(Kind::WallSelected); }
    static SessionState colorApplied() { return make(Kind::ColorApplied); }
    static SessionState paused() { return make(Kind::Paused); }
    static SessionState limited(LimitedReason reason);
    static SessionState failed(TintFault fault);

    bool is(Kind k) const noexcept { return kind == k; }

    // Payload-sensitive: Limited compares reasons, Failed compares faults.
    bool operator==(const SessionState& other) const;
    bool operator!=(const SessionState& other) const { return !(*this == other); }

private:
    static SessionState make(Kind k) {
        SessionState s{};
        s.kind = k;
        return s;
    }
};

const char* stateName(SessionState::Kind kind);
std::string describeState(const SessionState& state);

} // namespace tint
