#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace recap::captions {

// One caption frame: a contiguous slice of the message's words
using CaptionScreen = std::vector<std::string>;

// Splits text into caption screens. Sentences (terminated by . ! or ?
// followed by whitespace) are never split across screens; a screen is
// closed as soon as it holds SCREEN_MIN_WORDS or more words. Empty text
// yields no screens. Pure.
std::vector<CaptionScreen> segment(const std::string& text);

// Whitespace tokenization, empty tokens dropped
std::vector<std::string> tokenize(const std::string& text);

// Sentence split on terminal punctuation followed by whitespace
std::vector<std::string> splitSentences(const std::string& text);

// Global index of the first word of screens[screen_idx]
std::size_t screenStartWord(const std::vector<CaptionScreen>& screens, std::size_t screen_idx);

std::size_t wordCount(const std::vector<CaptionScreen>& screens);

// Smallest i with screenStartWord(i + 1) > word; clamps to the last screen
std::size_t screenForWord(const std::vector<CaptionScreen>& screens, std::size_t word);

} // namespace recap::captions
