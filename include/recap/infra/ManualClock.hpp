#pragma once

#include <map>
#include <memory>

#include "recap/infra/Clock.hpp"

namespace recap::infra {

// Virtual-time clock. Nothing fires until advance() or runNext() is called,
// which makes replays deterministic (dry runs, tests).
class ManualClock : public Clock {
public:
    TimerId every(Duration interval, Callback fn) override;
    TimerId after(Duration delay, Callback fn) override;
    void cancel(TimerId id) override;
    std::size_t activeTimers() const override;

    // Fires every timer due within [now, now + d] in expiry order
    void advance(Duration d);

    // Jumps to the earliest pending timer and fires it. False if none.
    bool runNext();

    // Runs until no timer is pending or max_fires is reached.
    // Returns the number of callbacks fired.
    std::size_t runUntilIdle(std::size_t max_fires = 1000000);

    Duration now() const { return now_; }

private:
    struct Entry {
        Duration due;
        Duration interval;
        bool repeat;
        std::shared_ptr<Callback> fn;
    };

    TimerId schedule(Duration d, bool repeat, Callback fn);
    std::map<TimerId, Entry>::iterator earliest();
    void fire(std::map<TimerId, Entry>::iterator it);

    std::map<TimerId, Entry> timers_;
    Duration now_{0};
    TimerId next_id_ = 0;
};

} // namespace recap::infra
