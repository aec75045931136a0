#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

// ============================================================================
// PLAYBACK PARAMETERS
// Caption pacing, speed set and engine I/O limits for meeting replay
// ============================================================================

namespace recap::config {

// === CAPTION SEGMENTATION ===
struct Captions {
    static constexpr std::size_t SCREEN_MIN_WORDS = 20;   // Flush buffer at >= 20 words
};

// === TIMING ===
struct Timing {
    static constexpr double MS_PER_WORD_FALLBACK = 250.0; // No audio metadata
    static constexpr double POST_CAPTION_PAUSE_MS = 1000.0; // Audio-less items only, scaled by 1/speed
};

// === SPEED SET (cycled in order, wraps) ===
static constexpr std::array<double, 3> SPEEDS = {1.0, 1.5, 2.0};

// === ENGINE API ===
struct Engine {
    static constexpr const char* DEFAULT_URL = "http://localhost:3001";
    static constexpr int MESSAGE_LIMIT = 500;
    static constexpr long TIMEOUT_S = 10;
    static constexpr long CONNECT_TIMEOUT_S = 3;
    static constexpr int MAX_RETRIES = 3;             // 100ms / 200ms / 400ms backoff
    static constexpr uint32_t RETRY_BASE_MS = 100;
};

// === AUDIO ASSET CACHE ===
struct Assets {
    static constexpr const char* DEFAULT_CACHE_DIR = "/tmp/recap-audio";
    static constexpr long DOWNLOAD_TIMEOUT_S = 30;
};

} // namespace recap::config
