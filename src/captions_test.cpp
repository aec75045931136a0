// =============================================================================
// src/captions_test.cpp - Screen segmenter and timing estimator tests
// =============================================================================
// Pure functions only; no clock, no audio.
// =============================================================================

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

#include "recap/captions/ScreenSegmenter.hpp"
#include "recap/captions/TimingEstimator.hpp"
#include "recap/config/PlaybackParameters.hpp"

using namespace recap::captions;

class CaptionsTest {
public:
    int run_all_tests() {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║           RECAP CAPTIONS - UNIT TESTS                            ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n\n";

        test_tokenize();
        test_sentence_split();
        test_three_sentence_scenario();
        test_word_count_invariant();
        test_screen_size_bound();
        test_long_sentence_not_split();
        test_empty_text();
        test_screen_offsets();
        test_segment_is_pure();
        test_timing_known_duration();
        test_timing_fallback();
        test_timing_zero_words();
        test_post_caption_pause();

        print_summary();
        return tests_failed_ == 0 ? 0 : 1;
    }

private:
    int tests_passed_ = 0;
    int tests_failed_ = 0;

    void test_pass(const char* name) {
        std::cout << "  ✓ " << name << "\n";
        tests_passed_++;
    }

    void test_fail(const char* name, const std::string& reason) {
        std::cout << "  ✗ " << name << " - " << reason << "\n";
        tests_failed_++;
    }

    void check(bool ok, const char* name, const std::string& reason) {
        if (ok) test_pass(name);
        else test_fail(name, reason);
    }

    static std::vector<std::string> flatten(const std::vector<CaptionScreen>& screens) {
        std::vector<std::string> out;
        for (const auto& s : screens) out.insert(out.end(), s.begin(), s.end());
        return out;
    }

    static std::string repeatSentence(const std::string& word, int n, char end) {
        std::string s;
        for (int i = 0; i < n; ++i) {
            if (i) s += ' ';
            s += word + std::to_string(i);
        }
        return s + end;
    }

    // =========================================================================
    // SEGMENTER
    // =========================================================================

    void test_tokenize() {
        std::cout << "Testing Tokenizer...\n";
        auto w = tokenize("  alpha\tbeta \n gamma  ");
        check(w.size() == 3 && w[0] == "alpha" && w[2] == "gamma",
              "Whitespace runs collapse, edges trimmed", "got " + std::to_string(w.size()) + " words");
        check(tokenize("   ").empty(), "All-whitespace yields no tokens", "tokens produced");
        std::cout << "\n";
    }

    void test_sentence_split() {
        std::cout << "Testing Sentence Split...\n";
        auto s = splitSentences("One. Two!  Three? Four");
        check(s.size() == 4, "Splits on . ! ? followed by whitespace", "got " + std::to_string(s.size()));
        if (s.size() == 4) {
            check(s[0] == "One." && s[1] == "Two!" && s[3] == "Four",
                  "Terminal punctuation stays with its sentence", "'" + s[0] + "' '" + s[1] + "'");
        }
        auto d = splitSentences("Version 2.5 shipped.Next");
        check(d.size() == 1, "Punctuation without following whitespace does not split",
              "got " + std::to_string(d.size()));
        std::cout << "\n";
    }

    void test_three_sentence_scenario() {
        std::cout << "Testing Three-Sentence Scenario...\n";
        const std::string text =
            "Hello. This is sentence two. Sentence three has more words to push the "
            "running count past the twenty word threshold easily.";
        auto screens = segment(text);

        check(screens.size() == 1, "Flushes once, after sentence three",
              "got " + std::to_string(screens.size()) + " screens");
        check(wordCount(screens) == tokenize(text).size(), "All words present",
              std::to_string(wordCount(screens)) + " vs " + std::to_string(tokenize(text).size()));
        check(wordCount(screens) == 21, "Word count is 21", std::to_string(wordCount(screens)));
        check(screenStartWord(screens, 0) == 0, "screenStartWord(0) == 0", "non-zero");
        std::cout << "\n";
    }

    void test_word_count_invariant() {
        std::cout << "Testing Word-Count Invariant...\n";
        const std::vector<std::string> texts = {
            "Short one.",
            "A. B. C. D. E. F. G. H. I. J. K. L. M. N. O. P. Q. R. S. T. U. V. W. X.",
            repeatSentence("w", 12, '.') + " " + repeatSentence("x", 12, '!') + " " +
                repeatSentence("y", 3, '?') + " tail words without end",
            "Multiple   spaces.\n\nNew paragraph!   And   more?",
            repeatSentence("long", 45, '.'),
        };

        bool ok = true;
        std::string why;
        for (const auto& t : texts) {
            auto screens = segment(t);
            if (flatten(screens) != tokenize(t)) {
                ok = false;
                why = "mismatch for \"" + t.substr(0, 30) + "...\"";
                break;
            }
        }
        check(ok, "Concatenated screens reproduce tokenized input", why);
        std::cout << "\n";
    }

    void test_screen_size_bound() {
        std::cout << "Testing Screen Size Bound...\n";
        std::string text;
        for (int i = 0; i < 15; ++i) {
            text += repeatSentence("s" + std::to_string(i) + "_", 3 + (i % 5) * 2, '.') + " ";
        }
        auto screens = segment(text);

        bool ok = screens.size() > 1;
        for (std::size_t i = 0; i + 1 < screens.size(); ++i) {
            if (screens[i].size() < recap::config::Captions::SCREEN_MIN_WORDS) ok = false;
        }
        check(ok, "Every screen but the last has >= 20 words", std::to_string(screens.size()) + " screens");

        // Screen boundaries must coincide with sentence boundaries
        bool aligned = true;
        std::size_t word = 0;
        std::vector<std::size_t> sentence_ends;
        for (const auto& s : splitSentences(text)) {
            word += tokenize(s).size();
            sentence_ends.push_back(word);
        }
        for (std::size_t i = 1; i < screens.size(); ++i) {
            std::size_t start = screenStartWord(screens, i);
            bool found = false;
            for (auto e : sentence_ends) found = found || e == start;
            aligned = aligned && found;
        }
        check(aligned, "No sentence is split across screens", "boundary inside a sentence");
        std::cout << "\n";
    }

    void test_long_sentence_not_split() {
        std::cout << "Testing Long Sentence...\n";
        auto screens = segment(repeatSentence("word", 57, '.'));
        check(screens.size() == 1 && screens[0].size() == 57, "57-word sentence stays one screen",
              std::to_string(screens.size()) + " screens");
        std::cout << "\n";
    }

    void test_empty_text() {
        std::cout << "Testing Empty Text...\n";
        check(segment("").empty(), "Empty text yields zero screens", "screens produced");
        check(segment(" \n\t ").empty(), "Whitespace-only text yields zero screens", "screens produced");
        std::cout << "\n";
    }

    void test_screen_offsets() {
        std::cout << "Testing Screen Offsets...\n";
        std::vector<CaptionScreen> screens = {{"a", "b", "c"}, {"d", "e"}, {"f"}};
        check(screenStartWord(screens, 1) == 3 && screenStartWord(screens, 2) == 5,
              "screenStartWord is the prefix sum", "wrong offsets");
        check(wordCount(screens) == 6, "wordCount sums all screens", std::to_string(wordCount(screens)));
        check(screenForWord(screens, 0) == 0 && screenForWord(screens, 3) == 1 &&
              screenForWord(screens, 4) == 1 && screenForWord(screens, 5) == 2,
              "screenForWord finds the owning screen", "wrong screen");
        check(screenForWord(screens, 99) == 2, "screenForWord clamps past the end", "not clamped");
        std::cout << "\n";
    }

    void test_segment_is_pure() {
        std::cout << "Testing Determinism...\n";
        const std::string t = repeatSentence("p", 14, '.') + " " + repeatSentence("q", 9, '!');
        check(segment(t) == segment(t), "Same text, same screens", "outputs differ");
        std::cout << "\n";
    }

    // =========================================================================
    // TIMING
    // =========================================================================

    void test_timing_known_duration() {
        std::cout << "Testing Timing (known duration)...\n";
        auto t = estimate(8, 4000.0, 2.0);
        check(t.duration_ms == 2000.0, "4000ms at 2x lasts 2000ms", std::to_string(t.duration_ms));
        check(t.ms_per_word == 250.0, "msPerWord = 2000 / 8", std::to_string(t.ms_per_word));
        check(!t.complete, "Non-empty item is not complete", "complete");
        std::cout << "\n";
    }

    void test_timing_fallback() {
        std::cout << "Testing Timing (fallback)...\n";
        auto t = estimate(24, std::nullopt, 1.0);
        check(t.duration_ms == 6000.0, "24 words at 250ms each", std::to_string(t.duration_ms));
        auto f = estimate(24, std::nullopt, 1.5);
        check(f.duration_ms == 4000.0 && f.ms_per_word == 4000.0 / 24.0,
              "Fallback scales by 1/speed", std::to_string(f.duration_ms));
        std::cout << "\n";
    }

    void test_timing_zero_words() {
        std::cout << "Testing Timing (zero words)...\n";
        auto t = estimate(0, 3000.0, 1.0);
        check(t.complete && t.duration_ms == 0.0 && t.ms_per_word == 0.0,
              "Zero words: duration 0, already complete", "not complete");
        std::cout << "\n";
    }

    void test_post_caption_pause() {
        std::cout << "Testing Post-Caption Pause...\n";
        check(postCaptionPauseMs(1.0) == 1000.0 && postCaptionPauseMs(2.0) == 500.0,
              "Pause is 1000ms / speed", std::to_string(postCaptionPauseMs(2.0)));
        std::cout << "\n";
    }

    void print_summary() {
        std::cout << "╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║                         TEST SUMMARY                             ║\n";
        std::cout << "╠══════════════════════════════════════════════════════════════════╣\n";
        std::cout << "║  Passed: " << std::setw(3) << tests_passed_
                  << "                                                     ║\n";
        std::cout << "║  Failed: " << std::setw(3) << tests_failed_
                  << "                                                     ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n";

        if (tests_failed_ == 0) {
            std::cout << "\n✓ ALL TESTS PASSED\n\n";
        } else {
            std::cout << "\n✗ SOME TESTS FAILED\n\n";
        }
    }
};

int main() {
    CaptionsTest tester;
    return tester.run_all_tests();
}
