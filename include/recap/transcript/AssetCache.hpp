#pragma once

#include <optional>
#include <string>

#include <curl/curl.h>

namespace recap::transcript {

// Turns audio references into local files miniaudio can open. Local paths
// pass through; URLs and bare engine keys are downloaded once into the
// cache directory.
class AssetCache {
public:
    AssetCache(const std::string& engine_url, const std::string& access_token, const std::string& cache_dir);
    ~AssetCache();

    AssetCache(const AssetCache&) = delete;
    AssetCache& operator=(const AssetCache&) = delete;

    // nullopt when the asset cannot be obtained (logged, not thrown)
    std::optional<std::string> resolve(const std::string& reference);

    // Engine URL for a bare audio key
    std::string urlForKey(const std::string& key) const;

    // Cache file name for a reference
    static std::string cacheName(const std::string& reference);

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    bool download(const std::string& url, const std::string& dest);

    CURL*       curl_{nullptr};
    std::string base_;
    std::string token_;
    std::string dir_;
};

} // namespace recap::transcript
