#include "recap/audio/SilentChannel.hpp"

namespace recap::audio {

SilentChannel::~SilentChannel() {
    if (timer_ != 0) clock_.cancel(timer_);
}

AudioHandle SilentChannel::play(
    const std::string& asset,
    double,
    CompletionHandler,
    FailureHandler on_failure
) {
    stop(pending_);

    AudioHandle id = ++next_id_;
    pending_ = id;
    timer_ = clock_.after(infra::Duration(0), [this, id, asset, on_failure] {
        if (pending_ != id) return;
        pending_ = 0;
        timer_ = 0;
        if (on_failure) on_failure("muted: " + asset);
    });
    return id;
}

void SilentChannel::stop(AudioHandle handle) {
    if (handle == 0 || handle != pending_) return;
    if (timer_ != 0) {
        clock_.cancel(timer_);
        timer_ = 0;
    }
    pending_ = 0;
}

} // namespace recap::audio
