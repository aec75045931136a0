#include "recap/playback/PlaylistCursor.hpp"
#include "recap/captions/TimingEstimator.hpp"
#include "recap/config/PlaybackParameters.hpp"

namespace recap::playback {

PlaylistCursor::PlaylistCursor(
    transcript::Playlist playlist,
    infra::Clock& clock,
    audio::AudioChannel& audio
) : playlist_(std::move(playlist)),
    clock_(clock),
    audio_(audio),
    word_clock_(clock) {
    state_.speed = config::SPEEDS[speed_index_];
}

PlaylistCursor::~PlaylistCursor() {
    teardown();
}

// ---------------------------------------------------------------------------
// Resource discipline: everything belonging to the current item is released
// here and nowhere else. Safe to call any number of times.
// ---------------------------------------------------------------------------
void PlaylistCursor::teardown() {
    word_clock_.stop();

    if (pause_timer_ != 0) {
        clock_.cancel(pause_timer_);
        pause_timer_ = 0;
    }

    if (audio_handle_ != 0) {
        audio_.stop(audio_handle_);
        audio_handle_ = 0;
    }

    ++generation_;
}

void PlaylistCursor::playItem(int idx) {
    teardown();

    if (idx < 0 || idx >= static_cast<int>(playlist_.size())) {
        state_.playing = false;
        publish();
        return;
    }

    const transcript::ReplayItem& item = playlist_[static_cast<std::size_t>(idx)];
    const uint64_t gen = generation_;

    state_.current_index = idx;
    state_.caption_screens = captions::segment(item.content);
    state_.caption_screen_index = 0;
    state_.caption_word_index = 0;

    const auto timing = captions::estimate(
        captions::wordCount(state_.caption_screens),
        item.audio_duration_ms,
        state_.speed
    );

    captions_done_ = false;
    audio_paced_ = item.hasAudio();

    if (item.hasAudio()) {
        audio_handle_ = audio_.play(
            *item.audio_asset,
            state_.speed,
            [this, gen, idx] { onAudioComplete(gen, idx); },
            [this, gen, idx](const std::string&) { onAudioFailed(gen, idx); }
        );
    }

    if (timing.complete) {
        // Nothing to caption; pace by audio or go straight to the pause
        captions_done_ = true;
        if (!audio_paced_) scheduleAdvance(idx);
    } else {
        word_clock_.start(
            state_.caption_screens,
            timing.ms_per_word,
            [this, gen](std::size_t screen, std::size_t word) { onWord(gen, screen, word); },
            [this, gen, idx] { onCaptionsDone(gen, idx); }
        );
    }

    publish();
}

void PlaylistCursor::togglePlay() {
    if (state_.playing) {
        // Freeze on the current word; resuming restarts the item
        teardown();
        state_.playing = false;
        publish();
        return;
    }
    state_.playing = true;
    playItem(state_.current_index < 0 ? 0 : state_.current_index);
}

void PlaylistCursor::skipForward() {
    if (state_.current_index + 1 < static_cast<int>(playlist_.size())) {
        playItem(state_.current_index + 1);
    }
}

void PlaylistCursor::skipBack() {
    if (state_.current_index > 0) {
        playItem(state_.current_index - 1);
    }
}

void PlaylistCursor::jumpTo(int idx) {
    state_.playing = true;
    playItem(idx);
}

double PlaylistCursor::cycleSpeed() {
    speed_index_ = (speed_index_ + 1) % config::SPEEDS.size();
    state_.speed = config::SPEEDS[speed_index_];

    // The running word clock keeps its cadence until the next item
    if (audio_handle_ != 0 && audio_.live(audio_handle_)) {
        audio_.setRate(audio_handle_, state_.speed);
    }

    publish();
    return state_.speed;
}

void PlaylistCursor::onWord(uint64_t gen, std::size_t screen, std::size_t word) {
    if (gen != generation_) return;
    state_.caption_screen_index = screen;
    state_.caption_word_index = word;
    publish();
}

void PlaylistCursor::onCaptionsDone(uint64_t gen, int idx) {
    if (gen != generation_) return;
    captions_done_ = true;
    if (!audio_paced_) scheduleAdvance(idx);
}

void PlaylistCursor::onAudioComplete(uint64_t gen, int idx) {
    if (gen != generation_) return;
    audio_handle_ = 0;
    playItem(idx + 1);
}

void PlaylistCursor::onAudioFailed(uint64_t gen, int idx) {
    if (gen != generation_) return;
    audio_handle_ = 0;
    audio_paced_ = false;
    if (captions_done_) scheduleAdvance(idx);
}

void PlaylistCursor::scheduleAdvance(int idx) {
    if (pause_timer_ != 0) clock_.cancel(pause_timer_);

    const uint64_t gen = generation_;
    pause_timer_ = clock_.after(
        infra::fromMillis(captions::postCaptionPauseMs(state_.speed)),
        [this, gen, idx] {
            if (gen != generation_) return;
            pause_timer_ = 0;
            playItem(idx + 1);
        }
    );
}

void PlaylistCursor::subscribe(Listener fn) {
    listeners_.push_back(std::move(fn));
}

void PlaylistCursor::publish() {
    for (auto& fn : listeners_) {
        fn(state_);
    }
}

const transcript::ReplayItem* PlaylistCursor::currentItem() const {
    if (state_.current_index < 0) return nullptr;
    return &playlist_[static_cast<std::size_t>(state_.current_index)];
}

double PlaylistCursor::progress() const {
    if (playlist_.empty()) return 0.0;
    return static_cast<double>(state_.current_index + 1) / static_cast<double>(playlist_.size());
}

std::size_t PlaylistCursor::visibleCount() const {
    return static_cast<std::size_t>(state_.current_index + 1);
}

bool PlaylistCursor::audioLive() const {
    return audio_handle_ != 0 && audio_.live(audio_handle_);
}

} // namespace recap::playback
