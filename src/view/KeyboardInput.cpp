#include "recap/view/KeyboardInput.hpp"

#include <boost/asio/error.hpp>
#include <iostream>
#include <unistd.h>

namespace asio = boost::asio;

namespace recap::view {

RawTerminal::RawTerminal(int fd) : fd_(fd) {
    if (!::isatty(fd_) || ::tcgetattr(fd_, &saved_) != 0) return;

    termios raw = saved_;
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(fd_, TCSANOW, &raw) == 0) active_ = true;
}

RawTerminal::~RawTerminal() {
    if (active_) ::tcsetattr(fd_, TCSANOW, &saved_);
}

KeyboardInput::KeyboardInput(
    asio::io_context& io,
    playback::PlaylistCursor& cursor,
    std::function<void()> on_quit,
    int fd
) : in_(io, fd),
    cursor_(cursor),
    on_quit_(std::move(on_quit)) {}

KeyboardInput::~KeyboardInput() {
    stop();
}

void KeyboardInput::start() {
    stopped_ = false;
    readNext();
}

void KeyboardInput::stop() {
    if (stopped_) return;
    stopped_ = true;
    boost::system::error_code ec;
    in_.cancel(ec);
}

void KeyboardInput::readNext() {
    in_.async_read_some(asio::buffer(buf_), [this](const boost::system::error_code& ec, std::size_t n) {
        if (ec == asio::error::operation_aborted || stopped_) return;
        if (ec) {
            // EOF on a pipe or closed terminal: keep playing without input
            if (ec != asio::error::eof) {
                std::cerr << "[Input] stdin read failed: " << ec.message() << "\n";
            }
            return;
        }
        for (std::size_t i = 0; i < n; ++i) {
            handleKey(buf_[i]);
            if (stopped_) return;
        }
        readNext();
    });
}

void KeyboardInput::handleKey(char c) {
    // Arrow keys arrive as ESC [ C / ESC [ D
    if (escape_ == Escape::Esc) {
        escape_ = Escape::None;
        if (c == '[') {
            escape_ = Escape::Bracket;
            return;
        }
        // A lone ESC: the byte after it is an ordinary key
    }
    if (escape_ == Escape::Bracket) {
        escape_ = Escape::None;
        if (c == 'C') cursor_.skipForward();
        else if (c == 'D') cursor_.skipBack();
        return;
    }

    if (c >= '0' && c <= '9') {
        if (digits_.size() < 6) digits_.push_back(c);
        return;
    }

    switch (c) {
        case '\033':
            escape_ = Escape::Esc;
            break;
        case '\r':
        case '\n':
            if (!digits_.empty()) {
                int n = std::stoi(digits_);
                digits_.clear();
                if (n >= 1 && n <= static_cast<int>(cursor_.playlist().size())) {
                    cursor_.jumpTo(n - 1);
                }
            }
            break;
        case ' ':
            cursor_.togglePlay();
            break;
        case 'n':
            cursor_.skipForward();
            break;
        case 'b':
            cursor_.skipBack();
            break;
        case 's':
            cursor_.cycleSpeed();
            break;
        case 'q':
            stop();
            if (on_quit_) on_quit_();
            break;
        default:
            digits_.clear();
            break;
    }
}

} // namespace recap::view
