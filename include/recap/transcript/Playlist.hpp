#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "recap/transcript/Meeting.hpp"

namespace recap::transcript {

// Playback projection of one transcript message. Never mutated.
struct ReplayItem {
    std::size_t index = 0;
    std::string speaker_name;
    std::string speaker_icon;
    std::string speaker_color;
    SenderClass sender = SenderClass::System;
    std::string content;
    std::optional<std::string> audio_asset;     // Playable reference
    std::optional<double> audio_duration_ms;
    std::string created_at;

    bool hasAudio() const { return audio_asset.has_value(); }
};

using Playlist = std::vector<ReplayItem>;

// Maps an audio key to a playable reference, nullopt when unavailable
using AssetResolver = std::function<std::optional<std::string>(const std::string& key)>;

// Speaker defaults for senders outside the participant list
struct SpeakerDefaults {
    static constexpr const char* HUMAN_NAME  = "You";
    static constexpr const char* HUMAN_ICON  = "person";
    static constexpr const char* HUMAN_COLOR = "#6B7280";
    static constexpr const char* OTHER_ICON  = "smart_toy";
    static constexpr const char* OTHER_COLOR = "#0F4D26";
};

// One item per message, transcript order. With no resolver the audio key
// is used as the asset reference unchanged.
Playlist buildPlaylist(
    const MeetingTranscript& transcript,
    const AssetResolver& resolve = nullptr
);

} // namespace recap::transcript
