#include "AppConfig.hpp"

#include <cstdlib>
#include <stdexcept>

namespace {

std::chrono::seconds parse_timeout(const std::string& value, const std::string& source) {
    std::size_t used = 0;
    long long secs = 0;
    try {
        secs = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(source + ": not a number: '" + value + "'");
    }
    if (used != value.size() || secs <= 0) {
        throw std::invalid_argument(source + ": expected a positive number of seconds, got '" + value + "'");
    }
    if (secs > MAX_IDLE_TIMEOUT.count()) {
        throw std::invalid_argument(source + ": timeout above the maximum of "
                                    + std::to_string(MAX_IDLE_TIMEOUT.count()) + " seconds");
    }
    return std::chrono::seconds(secs);
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string{};
}

}  // namespace

AppConfig loadConfig(const std::vector<std::string>& args,
                     const std::map<std::string, std::string>& env) {
    AppConfig cfg;

    auto it = env.find(ENV_DB);
    if (it != env.end() && !it->second.empty()) cfg.dbPath = it->second;
    it = env.find(ENV_IDLE_TIMEOUT);
    if (it != env.end() && !it->second.empty()) cfg.idleTimeout = parse_timeout(it->second, ENV_IDLE_TIMEOUT);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto next = [&](const char* flag) -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(std::string(flag) + " requires a value");
            }
            return args[++i];
        };

        if (arg == "--db") {
            cfg.dbPath = next("--db");
            if (cfg.dbPath.empty()) throw std::invalid_argument("--db: path must not be empty");
        } else if (arg == "--idle-timeout") {
            cfg.idleTimeout = parse_timeout(next("--idle-timeout"), "--idle-timeout");
        } else if (arg == "--show") {
            cfg.showPasswords = true;
        } else if (arg == "-h" || arg == "--help") {
            cfg.showHelp = true;
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }
    return cfg;
}

AppConfig loadConfig(const std::vector<std::string>& args) {
    std::map<std::string, std::string> env;
    env[ENV_DB] = env_or_empty(ENV_DB);
    env[ENV_IDLE_TIMEOUT] = env_or_empty(ENV_IDLE_TIMEOUT);
    return loadConfig(args, env);
}

std::string usage() {
    return
        "Usage: s2k [--db <path>] [--idle-timeout <seconds>] [--show]\n"
        "  --db <path>             profile database (env S2K_DB, default data/s2k.sqlite)\n"
        "  --idle-timeout <secs>   lock after this much inactivity, at most 86400\n"
        "                          (env S2K_IDLE_TIMEOUT, default 60)\n"
        "  --show                  print derived passwords without asking\n";
}
