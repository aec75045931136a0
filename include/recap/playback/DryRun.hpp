#pragma once

#include <cstddef>
#include <ostream>

#include "recap/transcript/Playlist.hpp"

namespace recap::playback {

struct DryRunReport {
    std::size_t items_started = 0;
    int final_index = -1;
    bool playing = false;
    double elapsed_ms = 0.0;        // Virtual time
};

// Plays the whole playlist from item 0 on a ManualClock with no audio
// output and prints the timeline. Returns once the cursor comes to rest.
DryRunReport runDryRun(const transcript::Playlist& playlist, double speed, std::ostream& out);

} // namespace recap::playback
