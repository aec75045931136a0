#pragma once

#include <cstddef>
#include <vector>

#include "recap/captions/ScreenSegmenter.hpp"

namespace recap::playback {

// Snapshot published to observers. Owned and mutated by PlaylistCursor only.
struct PlaybackState {
    int current_index = -1;     // -1: nothing selected
    bool playing = false;
    double speed = 1.0;
    std::vector<captions::CaptionScreen> caption_screens;
    std::size_t caption_screen_index = 0;
    std::size_t caption_word_index = 0;     // Global word index within the item
};

} // namespace recap::playback
