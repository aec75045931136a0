#include "recap/infra/AsioClock.hpp"

#include <boost/asio/error.hpp>

namespace asio = boost::asio;

namespace recap::infra {

AsioClock::AsioClock(asio::io_context& io) : io_(io) {}

AsioClock::~AsioClock() {
    for (auto& kv : timers_) {
        kv.second.timer->cancel();
    }
    timers_.clear();
}

TimerId AsioClock::every(Duration interval, Callback fn) {
    return schedule(interval, true, std::move(fn));
}

TimerId AsioClock::after(Duration delay, Callback fn) {
    return schedule(delay, false, std::move(fn));
}

TimerId AsioClock::schedule(Duration d, bool repeat, Callback fn) {
    TimerId id = ++next_id_;

    Entry e;
    e.timer = std::make_unique<asio::steady_timer>(io_);
    e.interval = d;
    e.repeat = repeat;
    e.fn = std::make_shared<Callback>(std::move(fn));
    e.timer->expires_after(d);

    timers_.emplace(id, std::move(e));
    arm(id);
    return id;
}

void AsioClock::arm(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return;

    it->second.timer->async_wait([this, id](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) return;

        // A handler whose expiry was queued before cancel() still arrives
        // with success; the registry is the source of truth.
        auto it = timers_.find(id);
        if (it == timers_.end()) return;

        std::shared_ptr<Callback> fn = it->second.fn;

        if (it->second.repeat) {
            auto& t = *it->second.timer;
            t.expires_at(t.expiry() + it->second.interval);
            arm(id);
        } else {
            timers_.erase(it);
        }

        (*fn)();
    });
}

void AsioClock::cancel(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return;
    it->second.timer->cancel();
    timers_.erase(it);
}

std::size_t AsioClock::activeTimers() const {
    return timers_.size();
}

} // namespace recap::infra
