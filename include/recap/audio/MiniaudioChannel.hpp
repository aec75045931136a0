#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <miniaudio.h>

#include "recap/audio/AudioChannel.hpp"

namespace recap::audio {

// AudioChannel on the miniaudio high-level engine. The end-of-sound
// callback runs on miniaudio's device thread; it only posts onto the
// io_context, where the handle is checked against the live voice.
class MiniaudioChannel : public AudioChannel {
public:
    explicit MiniaudioChannel(boost::asio::io_context& io);
    ~MiniaudioChannel() override;

    MiniaudioChannel(const MiniaudioChannel&) = delete;
    MiniaudioChannel& operator=(const MiniaudioChannel&) = delete;

    AudioHandle play(
        const std::string& asset,
        double rate,
        CompletionHandler on_complete,
        FailureHandler on_failure
    ) override;

    void stop(AudioHandle handle) override;
    void setRate(AudioHandle handle, double rate) override;
    bool live(AudioHandle handle) const override;

    bool deviceReady() const { return engine_ready_; }

private:
    struct Voice {
        MiniaudioChannel* owner = nullptr;
        AudioHandle id = 0;
        ma_sound sound;
        CompletionHandler on_complete;
    };

    // A play() that failed before producing a voice; delivered later
    struct PendingFailure {
        AudioHandle id = 0;
        FailureHandler on_failure;
    };

    static void onSoundEnd(void* user, ma_sound* sound);

    AudioHandle rejectLater(AudioHandle id, FailureHandler on_failure, const std::string& reason);
    void finish(AudioHandle id);
    void deliverFailure(AudioHandle id, const std::string& reason);
    void release();

    boost::asio::io_context& io_;
    ma_engine engine_;
    bool engine_ready_ = false;

    std::unique_ptr<Voice> voice_;
    PendingFailure pending_;
    AudioHandle next_id_ = 0;
};

} // namespace recap::audio
