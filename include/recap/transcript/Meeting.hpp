#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace recap::transcript {

enum class SenderClass {
    Agent,
    Human,
    System
};

const char* senderClassName(SenderClass s);

// Unknown values are logged and read as System (default speaker projection)
SenderClass parseSenderClass(const std::string& s);

struct AgentInfo {
    std::string id;
    std::string name;
    std::optional<std::string> icon_name;
    std::optional<std::string> icon_color;
};

struct ActionItem {
    std::string description;
    std::string assignee;
};

struct MeetingDescriptor {
    std::string id;
    std::string title;
    std::string started_at;
    std::optional<std::string> summary;
    std::optional<std::string> channel_id;
    std::vector<ActionItem> action_items;
    std::vector<AgentInfo> agents;
};

struct TranscriptMessage {
    std::string sender_id;
    SenderClass sender = SenderClass::System;
    std::string content;
    std::string created_at;
    std::optional<std::string> audio_key;
    std::optional<double> audio_duration_ms;
};

struct MeetingTranscript {
    MeetingDescriptor meeting;
    std::vector<TranscriptMessage> messages;
};

// Meeting or transcript could not be obtained or understood
class TranscriptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace recap::transcript
