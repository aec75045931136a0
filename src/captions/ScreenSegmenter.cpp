#include "recap/captions/ScreenSegmenter.hpp"
#include "recap/config/PlaybackParameters.hpp"

#include <cctype>

namespace recap::captions {

static bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool isTerminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> words;
    std::size_t i = 0;
    const std::size_t n = text.size();

    while (i < n) {
        while (i < n && isSpace(text[i])) ++i;
        std::size_t start = i;
        while (i < n && !isSpace(text[i])) ++i;
        if (i > start) words.emplace_back(text, start, i - start);
    }
    return words;
}

std::vector<std::string> splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::size_t start = 0;
    std::size_t i = 0;
    const std::size_t n = text.size();

    while (i < n) {
        if (isTerminal(text[i]) && i + 1 < n && isSpace(text[i + 1])) {
            sentences.emplace_back(text, start, i + 1 - start);
            // The separating whitespace belongs to neither sentence
            i += 1;
            while (i < n && isSpace(text[i])) ++i;
            start = i;
            continue;
        }
        ++i;
    }
    if (start < n) sentences.emplace_back(text, start, n - start);
    return sentences;
}

std::vector<CaptionScreen> segment(const std::string& text) {
    std::vector<CaptionScreen> screens;
    CaptionScreen current;

    for (const auto& sentence : splitSentences(text)) {
        for (auto& w : tokenize(sentence)) {
            current.push_back(std::move(w));
        }
        if (current.size() >= config::Captions::SCREEN_MIN_WORDS) {
            screens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) screens.push_back(std::move(current));
    return screens;
}

std::size_t screenStartWord(const std::vector<CaptionScreen>& screens, std::size_t screen_idx) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < screen_idx && i < screens.size(); ++i) {
        count += screens[i].size();
    }
    return count;
}

std::size_t wordCount(const std::vector<CaptionScreen>& screens) {
    return screenStartWord(screens, screens.size());
}

std::size_t screenForWord(const std::vector<CaptionScreen>& screens, std::size_t word) {
    std::size_t count = 0;
    for (std::size_t s = 0; s < screens.size(); ++s) {
        count += screens[s].size();
        if (word < count) return s;
    }
    return screens.empty() ? 0 : screens.size() - 1;
}

} // namespace recap::captions
