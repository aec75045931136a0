#include "recap/playback/WordClock.hpp"

namespace recap::playback {

WordClock::WordClock(infra::Clock& clock) : clock_(clock) {}

WordClock::~WordClock() {
    stop();
}

void WordClock::start(
    const std::vector<captions::CaptionScreen>& screens,
    double ms_per_word,
    TickHandler on_tick,
    DoneHandler on_done
) {
    stop();

    screens_ = screens;
    total_words_ = captions::wordCount(screens_);
    cursor_ = 0;
    on_tick_ = std::move(on_tick);
    on_done_ = std::move(on_done);

    timer_ = clock_.every(infra::fromMillis(ms_per_word), [this] { tick(); });
}

void WordClock::stop() {
    if (timer_ != 0) {
        clock_.cancel(timer_);
        timer_ = 0;
    }
}

void WordClock::tick() {
    ++cursor_;

    if (cursor_ < total_words_) {
        const std::size_t screen = captions::screenForWord(screens_, cursor_);
        TickHandler cb = on_tick_;
        if (cb) cb(screen, cursor_);
        return;
    }

    stop();
    // on_done_ may restart this clock for the next item
    DoneHandler done = std::move(on_done_);
    on_done_ = nullptr;
    if (done) done();
}

} // namespace recap::playback
