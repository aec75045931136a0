#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "recap/audio/AudioChannel.hpp"
#include "recap/infra/Clock.hpp"
#include "recap/playback/PlaybackState.hpp"
#include "recap/playback/WordClock.hpp"
#include "recap/transcript/Playlist.hpp"

namespace recap::playback {

// Playback state machine for one playlist.
//
//   Idle (-1, stopped) -> Selected/Paused (idx, stopped) -> Playing (idx)
//
// Owns the word clock, the post-caption pause timer and the audio handle;
// at most one of each is ever live. Every item switch tears the previous
// item down first and bumps the generation, so callbacks created for an
// older item are inert even if they were already queued.
//
// The transport methods are the only mutators. Listeners are notified
// after every state change, including each word tick.
class PlaylistCursor {
public:
    using Listener = std::function<void(const PlaybackState&)>;

    PlaylistCursor(
        transcript::Playlist playlist,
        infra::Clock& clock,
        audio::AudioChannel& audio
    );
    ~PlaylistCursor();

    PlaylistCursor(const PlaylistCursor&) = delete;
    PlaylistCursor& operator=(const PlaylistCursor&) = delete;

    // --- Transport controls ------------------------------------------------
    void playItem(int idx);
    void togglePlay();
    void skipForward();
    void skipBack();
    void jumpTo(int idx);
    double cycleSpeed();

    // --- Observation ---------------------------------------------------------
    void subscribe(Listener fn);

    const PlaybackState& state() const { return state_; }
    const transcript::Playlist& playlist() const { return playlist_; }
    const transcript::ReplayItem* currentItem() const;

    // (currentIndex + 1) / N, 0 for an empty playlist
    double progress() const;

    // Messages revealed in the thread so far
    std::size_t visibleCount() const;

    bool audioLive() const;
    bool captionsRunning() const { return word_clock_.running(); }
    bool advancePending() const { return pause_timer_ != 0; }

private:
    void teardown();
    void publish();

    void onWord(uint64_t gen, std::size_t screen, std::size_t word);
    void onCaptionsDone(uint64_t gen, int idx);
    void onAudioComplete(uint64_t gen, int idx);
    void onAudioFailed(uint64_t gen, int idx);
    void scheduleAdvance(int idx);

    transcript::Playlist playlist_;
    infra::Clock& clock_;
    audio::AudioChannel& audio_;

    PlaybackState state_;
    std::size_t speed_index_ = 0;

    WordClock word_clock_;
    infra::TimerId pause_timer_ = 0;
    audio::AudioHandle audio_handle_ = 0;

    // Per-item pacing flags, reset by playItem
    bool captions_done_ = false;
    bool audio_paced_ = false;      // Item advance waits for audio end

    uint64_t generation_ = 0;
    std::vector<Listener> listeners_;
};

} // namespace recap::playback
