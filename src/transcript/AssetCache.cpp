#include "recap/transcript/AssetCache.hpp"
#include "recap/transcript/EngineClient.hpp"
#include "recap/config/PlaybackParameters.hpp"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace recap::transcript {

static bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

AssetCache::AssetCache(
    const std::string& engine_url,
    const std::string& access_token,
    const std::string& cache_dir
) : base_(engine_url), token_(access_token), dir_(cache_dir) {
    while (!base_.empty() && base_.back() == '/') base_.pop_back();
    curl_ = curl_easy_init();
    if (!curl_) throw EngineError("[Assets] curl_easy_init failed");
}

AssetCache::~AssetCache() {
    if (curl_) { curl_easy_cleanup(curl_); curl_ = nullptr; }
}

std::string AssetCache::urlForKey(const std::string& key) const {
    return base_ + "/api/meetings/audio/" + urlEncode(key);
}

std::string AssetCache::cacheName(const std::string& reference) {
    std::string name;
    name.reserve(reference.size());
    for (unsigned char c : reference) {
        name.push_back((std::isalnum(c) || c == '.' || c == '-' || c == '_') ? static_cast<char>(c) : '_');
    }
    return name;
}

std::optional<std::string> AssetCache::resolve(const std::string& reference) {
    if (reference.empty()) return std::nullopt;

    std::error_code ec;
    if (startsWith(reference, "file://")) {
        std::string path = reference.substr(7);
        if (fs::exists(path, ec)) return path;
        std::cerr << "[Assets] missing local asset " << path << " - captions only\n";
        return std::nullopt;
    }

    const bool remote = startsWith(reference, "http://") || startsWith(reference, "https://");
    if (!remote && fs::exists(reference, ec)) return reference;

    const std::string url = remote ? reference : urlForKey(reference);
    const fs::path dest = fs::path(dir_) / cacheName(reference);

    if (fs::exists(dest, ec) && fs::file_size(dest, ec) > 0) {
        return dest.string();
    }

    fs::create_directories(dir_, ec);
    if (ec) {
        std::cerr << "[Assets] cannot create " << dir_ << ": " << ec.message() << "\n";
        return std::nullopt;
    }

    if (!download(url, dest.string())) return std::nullopt;
    return dest.string();
}

size_t AssetCache::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::FILE* f = static_cast<std::FILE*>(userdata);
    return std::fwrite(ptr, size, nmemb, f) * size;
}

bool AssetCache::download(const std::string& url, const std::string& dest) {
    const std::string tmp = dest + ".part";
    std::FILE* f = std::fopen(tmp.c_str(), "wb");
    if (!f) {
        std::cerr << "[Assets] cannot write " << tmp << "\n";
        return false;
    }

    struct curl_slist* headers = nullptr;
    std::string auth;
    if (!token_.empty()) {
        auth = "Authorization: Bearer " + token_;
        headers = curl_slist_append(headers, auth.c_str());
    }

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL,            url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER,     headers);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION,  write_cb);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA,      f);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT,        config::Assets::DOWNLOAD_TIMEOUT_S);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, config::Engine::CONNECT_TIMEOUT_S);

    CURLcode res = curl_easy_perform(curl_);
    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    std::fclose(f);

    std::error_code ec;
    if (res != CURLE_OK || status < 200 || status >= 300) {
        std::string why = res != CURLE_OK ? curl_easy_strerror(res) : "HTTP " + std::to_string(status);
        std::cerr << "[Assets] fetch failed " << url << " (" << why << ") - captions only\n";
        fs::remove(tmp, ec);
        return false;
    }

    fs::rename(tmp, dest, ec);
    if (ec) {
        std::cerr << "[Assets] cannot move " << tmp << ": " << ec.message() << "\n";
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace recap::transcript
