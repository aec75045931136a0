#include "recap/playback/DryRun.hpp"
#include "recap/audio/SilentChannel.hpp"
#include "recap/config/PlaybackParameters.hpp"
#include "recap/infra/ManualClock.hpp"
#include "recap/playback/PlaylistCursor.hpp"

#include <iomanip>

namespace recap::playback {

DryRunReport runDryRun(const transcript::Playlist& playlist, double speed, std::ostream& out) {
    infra::ManualClock clock;
    audio::SilentChannel audio(clock);
    PlaylistCursor cursor(playlist, clock, audio);

    for (std::size_t i = 0; i < config::SPEEDS.size() && cursor.state().speed != speed; ++i) {
        cursor.cycleSpeed();
    }

    DryRunReport report;
    int last = -1;

    cursor.subscribe([&](const PlaybackState& s) {
        if (s.current_index == last || s.current_index < 0) return;
        last = s.current_index;
        ++report.items_started;

        const auto& item = playlist[static_cast<std::size_t>(s.current_index)];
        out << "[+" << std::fixed << std::setprecision(3) << std::setw(9)
            << infra::toMillis(clock.now()) / 1000.0 << "s] #"
            << (s.current_index + 1) << "/" << playlist.size() << " "
            << item.speaker_name << " (" << transcript::senderClassName(item.sender) << ") "
            << captions::wordCount(s.caption_screens) << " words, "
            << s.caption_screens.size() << " screens"
            << (item.hasAudio() ? ", audio" : "") << "\n";
    });

    cursor.togglePlay();

    // Every item ends in a clock event, so the run settles once the
    // cursor stops playing or nothing is scheduled.
    while (cursor.state().playing && clock.runNext()) {
    }

    report.final_index = cursor.state().current_index;
    report.playing = cursor.state().playing;
    report.elapsed_ms = infra::toMillis(clock.now());

    out << "[Replay] dry run finished at +" << std::fixed << std::setprecision(3)
        << report.elapsed_ms / 1000.0 << "s, " << report.items_started << "/" << playlist.size()
        << " items, speed " << cursor.state().speed << "x\n";
    return report;
}

} // namespace recap::playback
