#include "tint/core/types.h"

namespace tint {

const char* finishName(PaintFinish finish) {
    switch (finish) {
        case PaintFinish::Matte: return "matte";
        case PaintFinish::Satin: return "satin";
        case PaintFinish::Gloss: return "gloss";
    }
    return "unknown";
}

const char* limitedReasonName(LimitedReason reason) {
    switch (reason) {
        case LimitedReason::Initializing: return "initializing";
        case LimitedReason::ExcessiveMotion: return "excessive-motion";
        case LimitedReason::InsufficientFeatures: return "insufficient-features";
        case LimitedReason::Relocalizing: return "relocalizing";
        case LimitedReason::Unavailable: return "unavailable";
    }
    return "unknown";
}

const char* errorName(TintError error) {
    switch (error) {
        case TintError::Ok: return "ok";
        case TintError::NotFound: return "not-found";
        case TintError::NoSelection: return "no-selection";
        case TintError::Unchanged: return "unchanged";
        case TintError::InvalidState: return "invalid-state";
    }
    return "unknown";
}

} // namespace tint
