// =============================================================================
// main.cpp - recap_replay: meeting replay with synced audio and captions
// =============================================================================
// Loads one meeting (file or engine API), builds the playlist, and drives the
// PlaylistCursor from a single asio event loop. The terminal view observes
// the cursor; keystrokes are the only way to mutate it.
// =============================================================================
#include <csignal>
#include <iostream>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <curl/curl.h>
#include <unistd.h>

#include "recap/audio/MiniaudioChannel.hpp"
#include "recap/audio/SilentChannel.hpp"
#include "recap/config/ReplayConfig.hpp"
#include "recap/infra/AsioClock.hpp"
#include "recap/playback/DryRun.hpp"
#include "recap/playback/PlaylistCursor.hpp"
#include "recap/transcript/AssetCache.hpp"
#include "recap/transcript/EngineClient.hpp"
#include "recap/transcript/TranscriptLoader.hpp"
#include "recap/view/KeyboardInput.hpp"
#include "recap/view/TerminalView.hpp"

namespace asio = boost::asio;
using namespace recap;

namespace {

// RAII for libcurl's process-wide state
struct CurlGlobal {
    CurlGlobal()  { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

transcript::MeetingTranscript loadMeeting(const config::ReplayConfig& cfg) {
    if (!cfg.useEngine()) {
        return transcript::loadTranscriptFile(cfg.meeting_file);
    }
    transcript::EngineClient engine(cfg.engine_url, cfg.access_token);
    return engine.loadTranscript(cfg.team_id, cfg.meeting_id);
}

} // namespace

int main(int argc, char** argv) {
    config::ReplayConfig cfg = config::ReplayConfig::fromEnvironment();
    if (!config::parseArgs(argc, argv, cfg)) {
        return 1;
    }

    CurlGlobal curl;

    // -------------------------------------------------------------------------
    // Load: the only externally visible failure. The cursor is never built
    // for a meeting that cannot be obtained.
    // -------------------------------------------------------------------------
    transcript::MeetingTranscript meeting;
    try {
        meeting = loadMeeting(cfg);
    } catch (const transcript::TranscriptError& e) {
        std::cerr << "[Replay] Meeting not found: " << e.what() << "\n";
        return 2;
    } catch (const transcript::EngineError& e) {
        std::cerr << "[Replay] Meeting not found: " << e.what() << "\n";
        return 2;
    }

    if (cfg.dry_run) {
        transcript::Playlist playlist = transcript::buildPlaylist(meeting);
        std::cout << "[Replay] " << meeting.meeting.title << " - "
                  << view::TerminalView::formatDate(meeting.meeting.started_at) << "\n";
        playback::runDryRun(playlist, cfg.speed, std::cout);
        return 0;
    }

    transcript::Playlist playlist;
    if (cfg.mute) {
        playlist = transcript::buildPlaylist(meeting);
    } else {
        try {
            transcript::AssetCache assets(cfg.engine_url, cfg.access_token, cfg.cache_dir);
            playlist = transcript::buildPlaylist(meeting, [&assets](const std::string& key) {
                return assets.resolve(key);
            });
        } catch (const transcript::EngineError& e) {
            std::cerr << "[Replay] asset cache unavailable (" << e.what() << ") - captions only\n";
            playlist = transcript::buildPlaylist(meeting);
        }
    }

    // -------------------------------------------------------------------------
    // Event loop. Declaration order is teardown order in reverse: the cursor
    // releases its timer and audio handle before the clock and channel go.
    // -------------------------------------------------------------------------
    asio::io_context io;
    infra::AsioClock clock(io);

    std::unique_ptr<audio::AudioChannel> channel;
    if (!cfg.mute) {
        auto device = std::make_unique<audio::MiniaudioChannel>(io);
        if (device->deviceReady()) {
            channel = std::move(device);
        } else {
            std::cerr << "[Replay] audio output unavailable - replaying muted\n";
        }
    }
    if (!channel) {
        channel = std::make_unique<audio::SilentChannel>(clock);
    }

    playback::PlaylistCursor cursor(std::move(playlist), clock, *channel);
    for (std::size_t i = 0; i < config::SPEEDS.size() && cursor.state().speed != cfg.speed; ++i) {
        cursor.cycleSpeed();
    }

    view::TerminalView screen(cursor, meeting.meeting, std::cout);
    screen.attach(cursor);

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        std::cerr << "\n[Replay] Signal " << sig << " received - stopping\n";
        io.stop();
    });

    const bool interactive = ::isatty(STDIN_FILENO) == 1;
    std::unique_ptr<view::RawTerminal> raw;
    std::unique_ptr<view::KeyboardInput> keys;

    if (interactive) {
        raw = std::make_unique<view::RawTerminal>(STDIN_FILENO);
        keys = std::make_unique<view::KeyboardInput>(io, cursor, [&io] { io.stop(); }, ::dup(STDIN_FILENO));
        keys->start();
        screen.render(cursor.state());
    } else {
        // Unattended: play straight through and exit when the cursor rests
        cursor.subscribe([&io](const playback::PlaybackState& s) {
            if (!s.playing) io.stop();
        });
        cursor.togglePlay();
    }

    io.run();

    std::cout << "\n[Replay] stopped at message " << (cursor.state().current_index + 1)
              << " / " << cursor.playlist().size() << "\n";
    return 0;
}
