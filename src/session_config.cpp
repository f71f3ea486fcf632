#include "session_config.h"
#include "log.h"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

IceConfig SessionConfig::iceConfig() const {
    IceConfig config;
    if (!stun_server.empty()) {
        IceServer stun;
        stun.uri = stun_server;
        config.servers.push_back(stun);
    }
    if (!turn_server.uri.empty()) {
        config.servers.push_back(turn_server);
    }
    config.candidate_pool_size = ice_candidate_pool_size;
    return config;
}

std::vector<std::string> defaultEnvSearchPaths() {
    return {
        ".env",           // Current directory
        "../.env",        // Parent directory (when running from build/)
        "../../.env",     // Two levels up
    };
}

static std::string stripQuotes(const std::string& value) {
    if (value.size() >= 2) {
        char first = value.front();
        if ((first == '"' || first == '\'') && value.back() == first) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

static std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

std::map<std::string, std::string> loadEnvFile(const std::vector<std::string>& search_paths) {
    std::map<std::string, std::string> values;

    for (const auto& path : search_paths) {
        std::ifstream env_file(path);
        if (!env_file.is_open()) {
            continue;
        }

        LOG_VAR("CONFIG", "Loading config from: ", path);
        std::string line;
        while (std::getline(env_file, line)) {
            line = trim(line);
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#') continue;

            size_t eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                continue;
            }
            std::string key = trim(line.substr(0, eq_pos));
            std::string value = stripQuotes(trim(line.substr(eq_pos + 1)));
            if (!key.empty()) {
                values[key] = value;
            }
        }
        return values;  // Stop after first found file
    }

    LOG("CONFIG", "No .env file found in search paths");
    return values;
}

std::string lookupSetting(const std::map<std::string, std::string>& env_file, const std::string& key) {
    const char* value = std::getenv(key.c_str());
    if (value && value[0]) {
        return value;
    }
    auto it = env_file.find(key);
    if (it != env_file.end()) {
        return it->second;
    }
    return "";
}

static bool parseInt(const std::string& key, const std::string& value, int* out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        *out = parsed;
        return true;
    } catch (const std::exception& e) {
        LOG("CONFIG-WARN", "Ignoring " << key << "=" << value << " (" << e.what() << ")");
        return false;
    }
}

static bool parseBool(const std::string& key, const std::string& value, bool* out) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        *out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        *out = false;
        return true;
    }
    LOG("CONFIG-WARN", "Ignoring " << key << "=" << value << " (expected a boolean)");
    return false;
}

void applySessionSettings(const std::map<std::string, std::string>& settings, SessionConfig* config) {
    auto get = [&settings](const char* key) {
        auto it = settings.find(key);
        return it == settings.end() ? std::string() : it->second;
    };

    std::string value;
    if (!(value = get("STREAM_ID")).empty()) config->stream_id = value;
    if (!(value = get("CLIENT_ID")).empty()) config->local_id = value;
    if (!(value = get("STUN_SERVER")).empty()) config->stun_server = value;
    if (!(value = get("TURN_SERVER")).empty()) config->turn_server.uri = value;
    if (!(value = get("TURN_USERNAME")).empty()) config->turn_server.username = value;
    if (!(value = get("TURN_PASSWORD")).empty()) config->turn_server.password = value;
    if (!(value = get("PLATFORM_PROFILE")).empty()) config->platform_profile = value;

    int number = 0;
    if (!(value = get("ICE_CANDIDATE_POOL_SIZE")).empty() && parseInt("ICE_CANDIDATE_POOL_SIZE", value, &number)) {
        config->ice_candidate_pool_size = number;
    }
    if (!(value = get("HEALTH_CHECK_INTERVAL_MS")).empty() && parseInt("HEALTH_CHECK_INTERVAL_MS", value, &number)) {
        if (number > 0) {
            config->health_check_interval = std::chrono::milliseconds(number);
        } else {
            LOG("CONFIG-WARN", "HEALTH_CHECK_INTERVAL_MS must be positive, keeping "
                << config->health_check_interval.count());
        }
    }
    if (!(value = get("STALL_POLL_THRESHOLD")).empty() && parseInt("STALL_POLL_THRESHOLD", value, &number)) {
        if (number > 0) {
            config->stall_poll_threshold = number;
        } else {
            LOG("CONFIG-WARN", "STALL_POLL_THRESHOLD must be positive, keeping " << config->stall_poll_threshold);
        }
    }
    if (!(value = get("CONNECT_TIMEOUT_MS")).empty() && parseInt("CONNECT_TIMEOUT_MS", value, &number)) {
        config->connect_timeout = std::chrono::milliseconds(number);
    }

    bool flag = false;
    if (!(value = get("AUTO_ACCEPT_OFFERS")).empty() && parseBool("AUTO_ACCEPT_OFFERS", value, &flag)) {
        config->auto_accept_offers = flag;
    }
}

void loadSessionConfigFromEnv(SessionConfig* config) {
    static const char* kKeys[] = {
        "STREAM_ID", "CLIENT_ID", "STUN_SERVER", "TURN_SERVER", "TURN_USERNAME",
        "TURN_PASSWORD", "ICE_CANDIDATE_POOL_SIZE", "HEALTH_CHECK_INTERVAL_MS",
        "STALL_POLL_THRESHOLD", "CONNECT_TIMEOUT_MS", "AUTO_ACCEPT_OFFERS", "PLATFORM_PROFILE",
    };

    std::map<std::string, std::string> env_file = loadEnvFile(defaultEnvSearchPaths());
    std::map<std::string, std::string> settings;
    for (const char* key : kKeys) {
        std::string value = lookupSetting(env_file, key);
        if (!value.empty()) {
            settings[key] = value;
        }
    }
    applySessionSettings(settings, config);

    LOG("CONFIG", "stream_id=" << config->stream_id
        << " profile=" << config->platform_profile
        << " health_interval=" << config->health_check_interval.count() << "ms"
        << " turn=" << (config->turn_server.uri.empty() ? "none" : "static"));
}
