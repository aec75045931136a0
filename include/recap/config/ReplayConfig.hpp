#pragma once

#include <string>

namespace recap::config {

// Runtime configuration. Environment first, CLI flags override.
struct ReplayConfig {
    std::string engine_url;
    std::string access_token;
    std::string team_id;
    std::string meeting_id;
    std::string meeting_file;
    std::string cache_dir;
    double speed = 1.0;
    bool dry_run = false;
    bool mute = false;

    static ReplayConfig fromEnvironment();

    bool useEngine() const { return meeting_file.empty(); }
};

std::string envOr(const std::string& key, const std::string& fallback);

// Parses argv into cfg. Returns false (and prints usage) on bad input.
bool parseArgs(int argc, char** argv, ReplayConfig& cfg);

void printUsage(const char* argv0);

} // namespace recap::config
