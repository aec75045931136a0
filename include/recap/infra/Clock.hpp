#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace recap::infra {

using MonoClock = std::chrono::steady_clock;
using MonoTime  = MonoClock::time_point;
using Duration  = std::chrono::microseconds;

// 0 is never a live timer
using TimerId = uint64_t;

inline Duration fromMillis(double ms) noexcept {
    return Duration(static_cast<int64_t>(ms * 1000.0));
}

inline double toMillis(Duration d) noexcept {
    return static_cast<double>(d.count()) / 1000.0;
}

// Timer source for the playback engine. All callbacks run on the thread
// that drives the clock. After cancel(id) returns, id's callback is never
// invoked again, even if its expiry was already queued.
class Clock {
public:
    using Callback = std::function<void()>;

    virtual ~Clock() = default;

    // Repeating timer, first fire one interval from now
    virtual TimerId every(Duration interval, Callback fn) = 0;

    // One-shot timer
    virtual TimerId after(Duration delay, Callback fn) = 0;

    // Idempotent. Unknown or already fired ids are ignored.
    virtual void cancel(TimerId id) = 0;

    virtual std::size_t activeTimers() const = 0;
};

} // namespace recap::infra
