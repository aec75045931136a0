#pragma once

#include <array>
#include <functional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <termios.h>

#include "recap/playback/PlaylistCursor.hpp"

namespace recap::view {

// Puts the terminal in raw mode for its lifetime
class RawTerminal {
public:
    explicit RawTerminal(int fd);
    ~RawTerminal();

    RawTerminal(const RawTerminal&) = delete;
    RawTerminal& operator=(const RawTerminal&) = delete;

    bool active() const { return active_; }

private:
    int fd_;
    bool active_ = false;
    termios saved_{};
};

// Maps keystrokes on stdin to transport controls:
//   space      togglePlay        n, right   skipForward
//   b, left    skipBack          s          cycleSpeed
//   digits + enter  jumpTo(n-1)  q          quit
class KeyboardInput {
public:
    // Takes ownership of fd (a dup of stdin in the replay tool)
    KeyboardInput(
        boost::asio::io_context& io,
        playback::PlaylistCursor& cursor,
        std::function<void()> on_quit,
        int fd
    );
    ~KeyboardInput();

    KeyboardInput(const KeyboardInput&) = delete;
    KeyboardInput& operator=(const KeyboardInput&) = delete;

    void start();
    void stop();

    // Feeds one byte through the key map. Exposed for scripted input.
    void handleKey(char c);

private:
    void readNext();

    enum class Escape { None, Esc, Bracket };

    boost::asio::posix::stream_descriptor in_;
    playback::PlaylistCursor& cursor_;
    std::function<void()> on_quit_;

    std::array<char, 16> buf_{};
    std::string digits_;
    Escape escape_ = Escape::None;
    bool stopped_ = false;
};

} // namespace recap::view
