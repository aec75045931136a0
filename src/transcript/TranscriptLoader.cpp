#include "recap/transcript/TranscriptLoader.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace recap::transcript {

const char* senderClassName(SenderClass s) {
    switch (s) {
        case SenderClass::Agent:  return "agent";
        case SenderClass::Human:  return "human";
        case SenderClass::System: return "system";
    }
    return "system";
}

SenderClass parseSenderClass(const std::string& s) {
    if (s == "agent")  return SenderClass::Agent;
    if (s == "human")  return SenderClass::Human;
    if (s == "system") return SenderClass::System;
    std::cerr << "[Replay] unknown senderType '" << s << "' - treated as system\n";
    return SenderClass::System;
}

// ---------------------------------------------------------------------------
// Field helpers: engine rows use null for absent optionals
// ---------------------------------------------------------------------------
static std::string requireString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw TranscriptError(std::string("missing string field: ") + key);
    }
    return it->get<std::string>();
}

static std::string stringOr(const json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

static std::optional<std::string> optString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

static std::optional<double> optNumber(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

MeetingDescriptor parseMeeting(const json& j) {
    if (!j.is_object()) throw TranscriptError("meeting is not an object");

    MeetingDescriptor m;
    m.id         = stringOr(j, "id", "");
    m.title      = requireString(j, "title");
    m.started_at = stringOr(j, "startedAt", "");
    m.summary    = optString(j, "summary");
    m.channel_id = optString(j, "channelId");

    auto items = j.find("actionItems");
    if (items != j.end() && items->is_array()) {
        for (const auto& a : *items) {
            m.action_items.push_back(ActionItem{
                stringOr(a, "description", ""),
                stringOr(a, "assignee", "")
            });
        }
    }

    auto agents = j.find("agents");
    if (agents != j.end() && agents->is_array()) {
        for (const auto& a : *agents) {
            AgentInfo info;
            info.id         = requireString(a, "id");
            info.name       = stringOr(a, "name", info.id);
            info.icon_name  = optString(a, "iconName");
            info.icon_color = optString(a, "iconColor");
            m.agents.push_back(std::move(info));
        }
    }
    return m;
}

TranscriptMessage parseMessage(const json& j) {
    if (!j.is_object()) throw TranscriptError("message is not an object");

    TranscriptMessage msg;
    msg.sender_id  = stringOr(j, "senderId", "");
    msg.sender     = parseSenderClass(requireString(j, "senderType"));
    msg.content    = stringOr(j, "content", "");
    msg.created_at = stringOr(j, "createdAt", "");
    msg.audio_key  = optString(j, "audioKey");
    msg.audio_duration_ms = optNumber(j, "audioDurationMs");

    if (msg.audio_key && msg.audio_key->empty()) msg.audio_key.reset();
    if (msg.audio_duration_ms && *msg.audio_duration_ms < 0.0) msg.audio_duration_ms.reset();
    return msg;
}

std::vector<TranscriptMessage> parseMessages(const json& j) {
    if (!j.is_array()) throw TranscriptError("messages is not an array");
    std::vector<TranscriptMessage> out;
    out.reserve(j.size());
    for (const auto& m : j) {
        out.push_back(parseMessage(m));
    }
    return out;
}

MeetingTranscript parseTranscript(const std::string& body) {
    json root = json::parse(body, nullptr, false);
    if (root.is_discarded()) throw TranscriptError("transcript is not valid JSON");
    if (!root.is_object()) throw TranscriptError("transcript root is not an object");

    auto meeting = root.find("meeting");
    if (meeting == root.end() || meeting->is_null()) {
        throw TranscriptError("meeting not found");
    }

    MeetingTranscript t;
    t.meeting = parseMeeting(*meeting);

    auto messages = root.find("messages");
    if (messages != root.end() && !messages->is_null()) {
        t.messages = parseMessages(*messages);
    }
    return t;
}

MeetingTranscript loadTranscriptFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw TranscriptError("cannot open " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parseTranscript(ss.str());
}

} // namespace recap::transcript
