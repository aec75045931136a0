#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "recap/transcript/Meeting.hpp"

namespace recap::transcript {

// Engine JSON (camelCase) -> domain types. All throw TranscriptError.
MeetingDescriptor parseMeeting(const nlohmann::json& j);
TranscriptMessage parseMessage(const nlohmann::json& j);
std::vector<TranscriptMessage> parseMessages(const nlohmann::json& j);

// {"meeting": {...}, "messages": [...]}
MeetingTranscript parseTranscript(const std::string& body);

MeetingTranscript loadTranscriptFile(const std::string& path);

} // namespace recap::transcript
