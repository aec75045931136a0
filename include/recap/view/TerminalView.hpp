#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "recap/playback/PlaylistCursor.hpp"
#include "recap/transcript/Meeting.hpp"

namespace recap::view {

// ANSI renderer for the replay screen. Read-only: it observes the cursor
// and never mutates it.
class TerminalView {
public:
    enum class WordState { Spoken, Active, Pending };

    struct CaptionWord {
        std::string text;
        WordState state;
    };

    TerminalView(
        const playback::PlaylistCursor& cursor,
        const transcript::MeetingDescriptor& meeting,
        std::ostream& out
    );

    // Subscribes render() to the cursor
    void attach(playback::PlaylistCursor& cursor);

    void render(const playback::PlaybackState& s);

    // Words of the current caption screen, classified against the word cursor
    static std::vector<CaptionWord> captionWords(const playback::PlaybackState& s);

    // Plain-text caption line, '[word]' marks the active word
    static std::string captionLine(const playback::PlaybackState& s);

    // Single line of at most width bytes, cut on a UTF-8 boundary
    static std::string clip(const std::string& s, std::size_t width);

    // "2026-02-25T10:00:00Z" -> "February 25, 2026"
    static std::string formatDate(const std::string& iso);

    static constexpr std::size_t THREAD_ROWS = 8;
    static constexpr std::size_t BAR_WIDTH = 40;
    static constexpr std::size_t LINE_WIDTH = 100;

private:
    void renderBanner(const transcript::ReplayItem& item, const playback::PlaybackState& s);
    void renderHeader();
    void renderSummary();
    void renderThread(const playback::PlaybackState& s);
    void renderControls(const playback::PlaybackState& s);

    const playback::PlaylistCursor& cursor_;
    const transcript::MeetingDescriptor& meeting_;
    std::ostream& out_;
};

} // namespace recap::view
