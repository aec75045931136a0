#include "recap/transcript/Playlist.hpp"

#include <unordered_map>

namespace recap::transcript {

Playlist buildPlaylist(const MeetingTranscript& transcript, const AssetResolver& resolve) {
    std::unordered_map<std::string, const AgentInfo*> agents;
    for (const auto& a : transcript.meeting.agents) {
        agents[a.id] = &a;
    }

    Playlist items;
    items.reserve(transcript.messages.size());

    for (std::size_t idx = 0; idx < transcript.messages.size(); ++idx) {
        const auto& msg = transcript.messages[idx];
        const bool human = msg.sender == SenderClass::Human;

        auto it = agents.find(msg.sender_id);
        const AgentInfo* agent = it == agents.end() ? nullptr : it->second;

        ReplayItem item;
        item.index = idx;
        item.sender = msg.sender;
        item.content = msg.content;
        item.created_at = msg.created_at;
        item.audio_duration_ms = msg.audio_duration_ms;

        if (agent) {
            item.speaker_name = agent->name;
        } else {
            item.speaker_name = human ? SpeakerDefaults::HUMAN_NAME : msg.sender_id;
        }

        if (agent && agent->icon_name) {
            item.speaker_icon = *agent->icon_name;
        } else {
            item.speaker_icon = human ? SpeakerDefaults::HUMAN_ICON : SpeakerDefaults::OTHER_ICON;
        }

        if (agent && agent->icon_color) {
            item.speaker_color = *agent->icon_color;
        } else {
            item.speaker_color = human ? SpeakerDefaults::HUMAN_COLOR : SpeakerDefaults::OTHER_COLOR;
        }

        if (msg.audio_key) {
            item.audio_asset = resolve ? resolve(*msg.audio_key) : msg.audio_key;
        }

        items.push_back(std::move(item));
    }
    return items;
}

} // namespace recap::transcript
