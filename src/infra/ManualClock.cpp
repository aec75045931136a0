#include "recap/infra/ManualClock.hpp"

#include <algorithm>

namespace recap::infra {

TimerId ManualClock::every(Duration interval, Callback fn) {
    return schedule(interval, true, std::move(fn));
}

TimerId ManualClock::after(Duration delay, Callback fn) {
    return schedule(delay, false, std::move(fn));
}

TimerId ManualClock::schedule(Duration d, bool repeat, Callback fn) {
    // Zero-length repeating timers would never let virtual time move
    if (repeat && d.count() <= 0) d = Duration(1);
    if (d.count() < 0) d = Duration(0);

    TimerId id = ++next_id_;
    timers_[id] = Entry{now_ + d, d, repeat, std::make_shared<Callback>(std::move(fn))};
    return id;
}

void ManualClock::cancel(TimerId id) {
    timers_.erase(id);
}

std::size_t ManualClock::activeTimers() const {
    return timers_.size();
}

std::map<TimerId, ManualClock::Entry>::iterator ManualClock::earliest() {
    // Ties resolve by creation order (map is ordered by id)
    return std::min_element(timers_.begin(), timers_.end(),
        [](const auto& a, const auto& b) { return a.second.due < b.second.due; });
}

void ManualClock::fire(std::map<TimerId, Entry>::iterator it) {
    now_ = std::max(now_, it->second.due);
    std::shared_ptr<Callback> fn = it->second.fn;

    if (it->second.repeat) {
        it->second.due += it->second.interval;
    } else {
        timers_.erase(it);
    }

    (*fn)();
}

void ManualClock::advance(Duration d) {
    const Duration target = now_ + d;
    while (!timers_.empty()) {
        auto it = earliest();
        if (it->second.due > target) break;
        fire(it);
    }
    now_ = target;
}

bool ManualClock::runNext() {
    if (timers_.empty()) return false;
    fire(earliest());
    return true;
}

std::size_t ManualClock::runUntilIdle(std::size_t max_fires) {
    std::size_t fired = 0;
    while (fired < max_fires && runNext()) {
        ++fired;
    }
    return fired;
}

} // namespace recap::infra
