#include "recap/transcript/EngineClient.hpp"
#include "recap/transcript/TranscriptLoader.hpp"
#include "recap/config/PlaybackParameters.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

using json = nlohmann::json;

namespace recap::transcript {

std::string urlEncode(const std::string& s) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

EngineClient::EngineClient(const std::string& base_url, const std::string& access_token)
    : base_(base_url), token_(access_token) {
    while (!base_.empty() && base_.back() == '/') base_.pop_back();
    curl_ = curl_easy_init();
    if (!curl_) throw EngineError("[Engine] curl_easy_init failed");
}

EngineClient::~EngineClient() {
    if (curl_) { curl_easy_cleanup(curl_); curl_ = nullptr; }
}

size_t EngineClient::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

// ---------------------------------------------------------------------------
// GET with bearer auth. Transport errors retry with exponential backoff
// (100ms / 200ms / 400ms); HTTP errors do not, the engine answered.
// ---------------------------------------------------------------------------
std::string EngineClient::get(const std::string& path) {
    const std::string url = base_ + path;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    std::string auth;
    if (!token_.empty()) {
        auth = "Authorization: Bearer " + token_;
        headers = curl_slist_append(headers, auth.c_str());
    }

    std::string response;

    curl_easy_setopt(curl_, CURLOPT_URL,            url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER,     headers);
    curl_easy_setopt(curl_, CURLOPT_HTTPGET,        1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION,  write_cb);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA,      &response);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT,        config::Engine::TIMEOUT_S);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, config::Engine::CONNECT_TIMEOUT_S);

    CURLcode res = CURLE_OK;
    for (int attempt = 0; attempt < config::Engine::MAX_RETRIES; ++attempt) {
        response.clear();
        res = curl_easy_perform(curl_);
        if (res == CURLE_OK) break;
        if (attempt < config::Engine::MAX_RETRIES - 1) {
            std::cerr << "[Engine] Retry " << (attempt + 1) << "/" << config::Engine::MAX_RETRIES
                      << " (" << curl_easy_strerror(res) << ")\n";
            std::this_thread::sleep_for(
                std::chrono::milliseconds(config::Engine::RETRY_BASE_MS * (1u << attempt)));
        }
    }
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        throw EngineError("GET " + path + " failed: " + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        // Engine errors come back as {"error": "..."}
        std::string detail = "Engine error: " + std::to_string(status);
        json err = json::parse(response, nullptr, false);
        if (!err.is_discarded() && err.is_object() && err.contains("error") && err["error"].is_string()) {
            detail = err["error"].get<std::string>();
        }
        throw EngineError("GET " + path + ": " + detail);
    }
    return response;
}

MeetingDescriptor EngineClient::getMeeting(const std::string& team_id, const std::string& meeting_id) {
    std::string body = get("/api/teams/" + urlEncode(team_id) + "/meetings/" + urlEncode(meeting_id));
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) throw TranscriptError("meeting response is not valid JSON");
    return parseMeeting(j);
}

std::vector<TranscriptMessage> EngineClient::getMessages(const std::string& channel_id, int limit) {
    std::string body = get("/api/chat/channels/" + urlEncode(channel_id) +
                           "/messages?limit=" + std::to_string(limit));
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) throw TranscriptError("messages response is not valid JSON");
    return parseMessages(j);
}

MeetingTranscript EngineClient::loadTranscript(const std::string& team_id, const std::string& meeting_id) {
    MeetingTranscript t;
    t.meeting = getMeeting(team_id, meeting_id);
    if (t.meeting.channel_id) {
        t.messages = getMessages(*t.meeting.channel_id, config::Engine::MESSAGE_LIMIT);
    }
    std::cerr << "[Engine] Loaded meeting \"" << t.meeting.title << "\" ("
              << t.messages.size() << " messages)\n";
    return t;
}

} // namespace recap::transcript
