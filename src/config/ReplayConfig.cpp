#include "recap/config/ReplayConfig.hpp"
#include "recap/config/PlaybackParameters.hpp"

#include <cstdlib>
#include <iostream>

namespace recap::config {

std::string envOr(const std::string& key, const std::string& fallback) {
    const char* val = std::getenv(key.c_str());
    return (val && *val) ? std::string(val) : fallback;
}

ReplayConfig ReplayConfig::fromEnvironment() {
    ReplayConfig cfg;
    cfg.engine_url   = envOr("RECAP_ENGINE_URL", Engine::DEFAULT_URL);
    cfg.access_token = envOr("RECAP_ACCESS_TOKEN", "");
    cfg.team_id      = envOr("RECAP_TEAM_ID", "");
    cfg.cache_dir    = envOr("RECAP_CACHE_DIR", Assets::DEFAULT_CACHE_DIR);
    return cfg;
}

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " --file <meeting.json> [--dry-run] [--mute] [--speed 1|1.5|2]\n"
              << "       " << argv0 << " --team <id> --meeting <id> [--dry-run] [--mute] [--speed 1|1.5|2]\n"
              << "env:   RECAP_ENGINE_URL RECAP_ACCESS_TOKEN RECAP_TEAM_ID RECAP_CACHE_DIR\n";
}

static bool isSupportedSpeed(double s) {
    for (double v : SPEEDS) {
        if (v == s) return true;
    }
    return false;
}

bool parseArgs(int argc, char** argv, ReplayConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "[Config] missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--file") {
            if (!value(cfg.meeting_file)) return false;
        } else if (arg == "--team") {
            if (!value(cfg.team_id)) return false;
        } else if (arg == "--meeting") {
            if (!value(cfg.meeting_id)) return false;
        } else if (arg == "--engine") {
            if (!value(cfg.engine_url)) return false;
        } else if (arg == "--cache-dir") {
            if (!value(cfg.cache_dir)) return false;
        } else if (arg == "--dry-run") {
            cfg.dry_run = true;
        } else if (arg == "--mute") {
            cfg.mute = true;
        } else if (arg == "--speed") {
            std::string s;
            if (!value(s)) return false;
            char* end = nullptr;
            double v = std::strtod(s.c_str(), &end);
            if (end == s.c_str() || *end != '\0' || !isSupportedSpeed(v)) {
                std::cerr << "[Config] unsupported speed: " << s << "\n";
                return false;
            }
            cfg.speed = v;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return false;
        } else {
            std::cerr << "[Config] unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return false;
        }
    }

    if (cfg.meeting_file.empty() && cfg.meeting_id.empty()) {
        printUsage(argv[0]);
        return false;
    }
    if (cfg.useEngine() && cfg.team_id.empty()) {
        std::cerr << "[Config] --team (or RECAP_TEAM_ID) is required with --meeting\n";
        return false;
    }
    return true;
}

} // namespace recap::config
