#include "recap/captions/TimingEstimator.hpp"
#include "recap/config/PlaybackParameters.hpp"

namespace recap::captions {

TimingEstimate estimate(
    std::size_t total_words,
    std::optional<double> known_duration_ms,
    double speed
) {
    TimingEstimate t;
    if (total_words == 0) {
        t.complete = true;
        return t;
    }
    if (speed <= 0.0) speed = 1.0;

    const double base = known_duration_ms
        ? *known_duration_ms
        : static_cast<double>(total_words) * config::Timing::MS_PER_WORD_FALLBACK;

    t.duration_ms = base / speed;
    t.ms_per_word = t.duration_ms / static_cast<double>(total_words);
    return t;
}

double postCaptionPauseMs(double speed) {
    if (speed <= 0.0) speed = 1.0;
    return config::Timing::POST_CAPTION_PAUSE_MS / speed;
}

} // namespace recap::captions
