#pragma once
#include <chrono>
#include <map>
#include <string>
#include <vector>

// CLI runtime settings. Precedence: flags > environment > defaults.
struct AppConfig {
    std::string          dbPath      = "data/s2k.sqlite";
    std::chrono::seconds idleTimeout = std::chrono::seconds(60);
    bool                 showPasswords = false; // print derived passwords unmasked
    bool                 showHelp      = false;
};

// Recognised environment variables
constexpr const char* ENV_DB           = "S2K_DB";
constexpr const char* ENV_IDLE_TIMEOUT = "S2K_IDLE_TIMEOUT";

// Longest accepted idle timeout (one day)
constexpr std::chrono::seconds MAX_IDLE_TIMEOUT = std::chrono::hours(24);

// `args` excludes argv[0]. Throws std::invalid_argument on unknown flags,
// missing values or a timeout outside (0, MAX_IDLE_TIMEOUT].
AppConfig loadConfig(const std::vector<std::string>& args,
                     const std::map<std::string, std::string>& env);

// Same, reading ENV_DB / ENV_IDLE_TIMEOUT from the process environment.
AppConfig loadConfig(const std::vector<std::string>& args);

std::string usage();
