#pragma once

#include "recap/audio/AudioChannel.hpp"
#include "recap/infra/Clock.hpp"

namespace recap::audio {

// Channel with no output: every play() fails on the next clock turn, so
// the cursor paces items by captions alone. Used for --mute and dry runs.
class SilentChannel : public AudioChannel {
public:
    explicit SilentChannel(infra::Clock& clock) : clock_(clock) {}
    ~SilentChannel() override;

    AudioHandle play(
        const std::string& asset,
        double rate,
        CompletionHandler on_complete,
        FailureHandler on_failure
    ) override;

    void stop(AudioHandle handle) override;
    void setRate(AudioHandle, double) override {}
    bool live(AudioHandle) const override { return false; }

private:
    infra::Clock& clock_;
    AudioHandle pending_ = 0;
    infra::TimerId timer_ = 0;
    AudioHandle next_id_ = 0;
};

} // namespace recap::audio
