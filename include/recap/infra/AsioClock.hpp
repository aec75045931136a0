#pragma once

#include <memory>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "recap/infra/Clock.hpp"

namespace recap::infra {

// Clock backed by boost::asio::steady_timer. Single-threaded: every call
// and every callback happens on the thread running io_context::run().
class AsioClock : public Clock {
public:
    explicit AsioClock(boost::asio::io_context& io);
    ~AsioClock() override;

    AsioClock(const AsioClock&) = delete;
    AsioClock& operator=(const AsioClock&) = delete;

    TimerId every(Duration interval, Callback fn) override;
    TimerId after(Duration delay, Callback fn) override;
    void cancel(TimerId id) override;
    std::size_t activeTimers() const override;

private:
    struct Entry {
        std::unique_ptr<boost::asio::steady_timer> timer;
        Duration interval;
        bool repeat;
        std::shared_ptr<Callback> fn;
    };

    TimerId schedule(Duration d, bool repeat, Callback fn);
    void arm(TimerId id);

    boost::asio::io_context& io_;
    std::unordered_map<TimerId, Entry> timers_;
    TimerId next_id_ = 0;
};

} // namespace recap::infra
