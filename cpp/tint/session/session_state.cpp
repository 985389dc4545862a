#include "tint/session/session_state.h"
#include <utility>

namespace tint {

SessionState SessionState::limited(LimitedReason reason) {
    SessionState s = make(Kind::Limited);
    s.reason = reason;
    return s;
}

SessionState SessionState::failed(TintFault fault) {
    SessionState s = make(Kind::Failed);
    s.fault = std::move(fault);
    return s;
}

bool SessionState::operator==(const SessionState& other) const {
    if (kind != other.kind) return false;
    switch (kind) {
        case Kind::Limited: return reason == other.reason;
        case Kind::Failed: return fault == other.fault;
        default: return true;
    }
}

const char* stateName(SessionState::Kind kind) {
    switch (kind) {
        case SessionState::Kind::Initializing: return "initializing";
        case SessionState::Kind::Scanning: return "scanning";
        case SessionState::Kind::WallsDetected: return "walls-detected";
        case SessionState::Kind::WallSelected: return "wall-selected";
        case SessionState::Kind::ColorApplied: return "color-applied";
        case SessionState::Kind::Limited: return "limited";
        case SessionState::Kind::Failed: return "failed";
        case SessionState::Kind::Paused: return "paused";
    }
    return "unknown";
}

std::string describeState(const SessionState& state) {
    std::string out = stateName(state.kind);
    if (state.is(SessionState::Kind::Limited)) {
        out += "(";
        out += limitedReasonName(state.reason);
        out += ")";
    } else if (state.is(SessionState::Kind::Failed)) {
        out += "(";
        out += std::to_string(state.fault.code);
        if (!state.fault.message.empty()) {
            out += ": ";
            out += state.fault.message;
        }
        out += ")";
    }
    return out;
}

} // namespace tint
