#include "recap/view/TerminalView.hpp"
#include "recap/captions/ScreenSegmenter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace recap::view {

namespace {

constexpr const char* CLEAR   = "\033[2J\033[H";
constexpr const char* RESET   = "\033[0m";
constexpr const char* BOLD    = "\033[1m";
constexpr const char* DIM     = "\033[2m";
constexpr const char* AMBER   = "\033[1;33m";
constexpr const char* WHITE   = "\033[97m";
constexpr const char* GREEN   = "\033[32m";

std::string speedLabel(double speed) {
    std::ostringstream ss;
    ss << speed << "x";
    return ss.str();
}

} // namespace

TerminalView::TerminalView(
    const playback::PlaylistCursor& cursor,
    const transcript::MeetingDescriptor& meeting,
    std::ostream& out
) : cursor_(cursor), meeting_(meeting), out_(out) {}

void TerminalView::attach(playback::PlaylistCursor& cursor) {
    cursor.subscribe([this](const playback::PlaybackState& s) { render(s); });
}

std::string TerminalView::formatDate(const std::string& iso) {
    static const char* MONTHS[] = {
        "January", "February", "March", "April", "May", "June",
        "July", "August", "September", "October", "November", "December"
    };
    int y = 0, m = 0, d = 0;
    if (std::sscanf(iso.c_str(), "%4d-%2d-%2d", &y, &m, &d) != 3 || m < 1 || m > 12) {
        return iso;
    }
    return std::string(MONTHS[m - 1]) + " " + std::to_string(d) + ", " + std::to_string(y);
}

std::string TerminalView::clip(const std::string& s, std::size_t width) {
    std::string flat;
    flat.reserve(s.size());
    for (char c : s) flat.push_back(c == '\n' ? ' ' : c);
    if (flat.size() <= width) return flat;

    const bool ellipsis = width >= 3;
    std::size_t cut = ellipsis ? width - 3 : width;
    // Never end inside a multibyte sequence
    while (cut > 0 && (static_cast<unsigned char>(flat[cut]) & 0xC0) == 0x80) --cut;
    return flat.substr(0, cut) + (ellipsis ? "..." : "");
}

std::vector<TerminalView::CaptionWord> TerminalView::captionWords(const playback::PlaybackState& s) {
    std::vector<CaptionWord> out;
    if (s.caption_screens.empty()) return out;

    const std::size_t screen = std::min(s.caption_screen_index, s.caption_screens.size() - 1);
    const std::size_t base = captions::screenStartWord(s.caption_screens, screen);
    const auto& words = s.caption_screens[screen];

    out.reserve(words.size());
    for (std::size_t wi = 0; wi < words.size(); ++wi) {
        const std::size_t global = base + wi;
        WordState state = WordState::Pending;
        if (global == s.caption_word_index) state = WordState::Active;
        else if (global < s.caption_word_index) state = WordState::Spoken;
        out.push_back(CaptionWord{words[wi], state});
    }
    return out;
}

std::string TerminalView::captionLine(const playback::PlaybackState& s) {
    std::string line;
    for (const auto& w : captionWords(s)) {
        if (!line.empty()) line += ' ';
        line += w.state == WordState::Active ? "[" + w.text + "]" : w.text;
    }
    return line;
}

void TerminalView::render(const playback::PlaybackState& s) {
    out_ << CLEAR;

    const transcript::ReplayItem* item = cursor_.currentItem();
    if (item && item->sender == transcript::SenderClass::Agent) {
        renderBanner(*item, s);
    } else {
        renderHeader();
    }

    if (meeting_.summary && s.current_index < 0) {
        renderSummary();
    }

    renderThread(s);
    renderControls(s);
    out_.flush();
}

void TerminalView::renderBanner(const transcript::ReplayItem& item, const playback::PlaybackState& s) {
    out_ << BOLD << item.speaker_name << RESET << "  " << AMBER << "Replaying" << RESET
         << "  [" << speedLabel(s.speed) << "]\n\n";

    if (s.caption_screens.empty()) {
        out_ << "\n\n";
        return;
    }

    out_ << "  ";
    for (const auto& w : captionWords(s)) {
        switch (w.state) {
            case WordState::Active:  out_ << AMBER; break;
            case WordState::Spoken:  out_ << WHITE; break;
            case WordState::Pending: out_ << DIM;   break;
        }
        out_ << w.text << RESET << ' ';
    }
    out_ << "\n\n";
}

void TerminalView::renderHeader() {
    out_ << BOLD << meeting_.title << RESET << "\n"
         << DIM << formatDate(meeting_.started_at) << RESET << "\n\n";
}

void TerminalView::renderSummary() {
    out_ << AMBER << "Meeting Summary" << RESET << "\n"
         << "  " << *meeting_.summary << "\n";
    if (!meeting_.action_items.empty()) {
        out_ << AMBER << "Action Items" << RESET << "\n";
        for (const auto& a : meeting_.action_items) {
            out_ << "  * " << a.description << " - " << BOLD << a.assignee << RESET << "\n";
        }
    }
    out_ << "\n";
}

void TerminalView::renderThread(const playback::PlaybackState& s) {
    const auto& items = cursor_.playlist();
    const std::size_t visible = cursor_.visibleCount();
    const std::size_t first = visible > THREAD_ROWS ? visible - THREAD_ROWS : 0;

    for (std::size_t i = first; i < visible && i < items.size(); ++i) {
        const auto& it = items[i];
        const bool current = static_cast<int>(i) == s.current_index;
        const bool human = it.sender == transcript::SenderClass::Human;

        out_ << (current ? AMBER : "") << (current ? "> " : "  ") << (current ? RESET : "");
        if (human) {
            out_ << std::setw(4) << (i + 1) << "  " << GREEN << "You" << RESET << ": ";
        } else {
            out_ << std::setw(4) << (i + 1) << "  " << BOLD << it.speaker_name << RESET << ": ";
        }
        out_ << clip(it.content, LINE_WIDTH) << "\n";
    }
    out_ << "\n";
}

void TerminalView::renderControls(const playback::PlaybackState& s) {
    const std::size_t filled = static_cast<std::size_t>(
        std::lround(cursor_.progress() * static_cast<double>(BAR_WIDTH)));

    out_ << "[" << GREEN << std::string(filled, '#') << RESET
         << std::string(BAR_WIDTH - std::min(filled, BAR_WIDTH), '-') << "]\n";

    out_ << (s.playing ? "  ||  playing" : "  >   paused ")
         << "   " << speedLabel(s.speed)
         << "   " << (s.current_index + 1) << " / " << cursor_.playlist().size() << " messages\n"
         << DIM << "  space play/pause  n/-> next  b/<- back  s speed  <num>+enter jump  q quit"
         << RESET << "\n";
}

} // namespace recap::view
