#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <curl/curl.h>

#include "recap/transcript/Meeting.hpp"

namespace recap::transcript {

class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Read-only client for the engine REST API
class EngineClient {
public:
    EngineClient(const std::string& base_url, const std::string& access_token);
    ~EngineClient();

    EngineClient(const EngineClient&) = delete;
    EngineClient& operator=(const EngineClient&) = delete;

    // GET /api/teams/{team}/meetings/{meeting}
    MeetingDescriptor getMeeting(const std::string& team_id, const std::string& meeting_id);

    // GET /api/chat/channels/{channel}/messages?limit=N
    std::vector<TranscriptMessage> getMessages(const std::string& channel_id, int limit);

    // Meeting plus its channel messages. A meeting without a channel has
    // an empty transcript.
    MeetingTranscript loadTranscript(const std::string& team_id, const std::string& meeting_id);

    const std::string& baseUrl() const { return base_; }

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    std::string get(const std::string& path);

    CURL*       curl_{nullptr};   // persistent handle, reused across calls
    std::string base_;
    std::string token_;
};

// Percent-encodes a single path segment or query value
std::string urlEncode(const std::string& s);

} // namespace recap::transcript
