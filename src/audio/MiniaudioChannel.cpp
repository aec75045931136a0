#include "recap/audio/MiniaudioChannel.hpp"

#include <boost/asio/post.hpp>
#include <iostream>

namespace recap::audio {

MiniaudioChannel::MiniaudioChannel(boost::asio::io_context& io) : io_(io) {
    ma_result r = ma_engine_init(nullptr, &engine_);
    if (r != MA_SUCCESS) {
        std::cerr << "[Audio] no output device (" << ma_result_description(r)
                  << ") - captions only\n";
        return;
    }
    engine_ready_ = true;
}

MiniaudioChannel::~MiniaudioChannel() {
    release();
    pending_ = PendingFailure{};
    if (engine_ready_) {
        ma_engine_uninit(&engine_);
        engine_ready_ = false;
    }
}

AudioHandle MiniaudioChannel::play(
    const std::string& asset,
    double rate,
    CompletionHandler on_complete,
    FailureHandler on_failure
) {
    // Previous handle goes first, whatever state it is in
    release();
    pending_ = PendingFailure{};

    AudioHandle id = ++next_id_;

    if (!engine_ready_) {
        return rejectLater(id, std::move(on_failure), "audio engine unavailable");
    }

    auto v = std::make_unique<Voice>();
    v->owner = this;
    v->id = id;
    v->on_complete = std::move(on_complete);

    ma_result r = ma_sound_init_from_file(
        &engine_,
        asset.c_str(),
        MA_SOUND_FLAG_STREAM | MA_SOUND_FLAG_NO_SPATIALIZATION,
        nullptr,
        nullptr,
        &v->sound
    );
    if (r != MA_SUCCESS) {
        return rejectLater(id, std::move(on_failure),
                           std::string("cannot open ") + asset + ": " + ma_result_description(r));
    }

    ma_sound_set_pitch(&v->sound, static_cast<float>(rate));
    ma_sound_set_end_callback(&v->sound, &MiniaudioChannel::onSoundEnd, v.get());

    r = ma_sound_start(&v->sound);
    if (r != MA_SUCCESS) {
        ma_sound_uninit(&v->sound);
        return rejectLater(id, std::move(on_failure),
                           std::string("cannot start ") + asset + ": " + ma_result_description(r));
    }

    voice_ = std::move(v);
    return id;
}

AudioHandle MiniaudioChannel::rejectLater(
    AudioHandle id,
    FailureHandler on_failure,
    const std::string& reason
) {
    pending_.id = id;
    pending_.on_failure = std::move(on_failure);
    boost::asio::post(io_, [this, id, reason] { deliverFailure(id, reason); });
    return id;
}

void MiniaudioChannel::stop(AudioHandle handle) {
    if (handle == 0) return;
    if (pending_.id == handle) pending_ = PendingFailure{};
    if (voice_ && voice_->id == handle) release();
}

void MiniaudioChannel::setRate(AudioHandle handle, double rate) {
    if (!voice_ || voice_->id != handle) return;
    ma_sound_set_pitch(&voice_->sound, static_cast<float>(rate));
}

bool MiniaudioChannel::live(AudioHandle handle) const {
    return handle != 0 && voice_ && voice_->id == handle;
}

void MiniaudioChannel::onSoundEnd(void* user, ma_sound*) {
    // Device thread: touch nothing but the immutable voice identity
    auto* v = static_cast<Voice*>(user);
    MiniaudioChannel* owner = v->owner;
    AudioHandle id = v->id;
    boost::asio::post(owner->io_, [owner, id] { owner->finish(id); });
}

void MiniaudioChannel::finish(AudioHandle id) {
    if (!voice_ || voice_->id != id) return;
    CompletionHandler cb = std::move(voice_->on_complete);
    release();
    if (cb) cb();
}

void MiniaudioChannel::deliverFailure(AudioHandle id, const std::string& reason) {
    if (pending_.id != id) return;
    FailureHandler cb = std::move(pending_.on_failure);
    pending_ = PendingFailure{};
    std::cerr << "[Audio] playback failed: " << reason << "\n";
    if (cb) cb(reason);
}

void MiniaudioChannel::release() {
    if (!voice_) return;
    ma_sound_stop(&voice_->sound);
    ma_sound_uninit(&voice_->sound);
    voice_.reset();
}

} // namespace recap::audio
