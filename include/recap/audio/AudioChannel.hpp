#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace recap::audio {

// 0 is never a live handle
using AudioHandle = uint64_t;

// Owns at most one live playback. Playback problems are never thrown:
// they surface through on_failure so the caller can pace by captions
// instead. Both callbacks are delivered on the event-loop thread, never
// from inside play(), at most once, and never after stop(handle).
class AudioChannel {
public:
    using CompletionHandler = std::function<void()>;
    using FailureHandler = std::function<void(const std::string& reason)>;

    virtual ~AudioChannel() = default;

    // Stops any previous handle first
    virtual AudioHandle play(
        const std::string& asset,
        double rate,
        CompletionHandler on_complete,
        FailureHandler on_failure
    ) = 0;

    // Idempotent
    virtual void stop(AudioHandle handle) = 0;

    // Applies immediately, playback position is kept
    virtual void setRate(AudioHandle handle, double rate) = 0;

    virtual bool live(AudioHandle handle) const = 0;
};

} // namespace recap::audio
