#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "recap/captions/ScreenSegmenter.hpp"
#include "recap/infra/Clock.hpp"

namespace recap::playback {

// Advances a global word cursor once per tick and maps it to a screen.
// Word 0 counts as shown at start; the first tick moves to word 1. When the
// cursor reaches the word count the clock stops itself and reports
// exhaustion. One timer at most; start() replaces any running one.
class WordClock {
public:
    using TickHandler = std::function<void(std::size_t screen, std::size_t word)>;
    using DoneHandler = std::function<void()>;

    explicit WordClock(infra::Clock& clock);
    ~WordClock();

    WordClock(const WordClock&) = delete;
    WordClock& operator=(const WordClock&) = delete;

    void start(
        const std::vector<captions::CaptionScreen>& screens,
        double ms_per_word,
        TickHandler on_tick,
        DoneHandler on_done
    );

    // Idempotent; no callback fires after this returns
    void stop();

    bool running() const { return timer_ != 0; }
    std::size_t cursor() const { return cursor_; }

private:
    void tick();

    infra::Clock& clock_;
    infra::TimerId timer_ = 0;

    std::vector<captions::CaptionScreen> screens_;
    std::size_t total_words_ = 0;
    std::size_t cursor_ = 0;

    TickHandler on_tick_;
    DoneHandler on_done_;
};

} // namespace recap::playback
