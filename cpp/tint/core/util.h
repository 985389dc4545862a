#pragma once

#include <chrono>
#include <functional>

namespace tint {

// Monotonic milliseconds, used for entity timestamps and pass timing.
inline double nowMs() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}

// Injectable time source; the engine stamps entities through it.
using Clock = std::function<double()>;

inline Clock steadyClock() {
    return []() { return nowMs(); };
}

} // namespace tint
