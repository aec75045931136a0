#pragma once

#include <cstddef>
#include <optional>

namespace recap::captions {

struct TimingEstimate {
    double duration_ms = 0.0;
    double ms_per_word = 0.0;
    bool complete = false;      // Nothing to pace (zero words)
};

// Display duration for one item. Known audio duration wins over the
// per-word fallback; both are divided by speed.
TimingEstimate estimate(
    std::size_t total_words,
    std::optional<double> known_duration_ms,
    double speed
);

// Post-caption pause before auto-advancing an audio-less item
double postCaptionPauseMs(double speed);

} // namespace recap::captions
