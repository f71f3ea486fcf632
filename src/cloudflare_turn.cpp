#include "cloudflare_turn.h"
#include "log.h"
#include "session_config.h"

#include <curl/curl.h>
#include <json/json.h>
#include <sstream>
#include <stdexcept>

// Callback for libcurl to write response data
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CloudflareTurn::CloudflareTurn(const Config& config) {
    setConfig(config);
}

void CloudflareTurn::setConfig(const Config& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    configured_ = !config.turn_key_id.empty() && !config.api_token.empty();
    credentials_ = Credentials();

    if (configured_) {
        LOG("CLOUDFLARE", "TURN configured with key ID: " << config.turn_key_id.substr(0, 8) << "...");
    }
}

bool CloudflareTurn::configFromSettings(const std::map<std::string, std::string>& settings, Config* config) {
    auto get = [&settings](const char* key) {
        auto it = settings.find(key);
        return it == settings.end() ? std::string() : it->second;
    };

    Config parsed;
    parsed.account_id = get("CLOUDFLARE_ACCOUNT_ID");
    parsed.turn_key_id = get("CLOUDFLARE_TURN_KEY_ID");
    parsed.api_token = get("CLOUDFLARE_API_TOKEN");

    std::string ttl = get("CLOUDFLARE_TURN_TTL");
    if (!ttl.empty()) {
        try {
            size_t used = 0;
            int seconds = std::stoi(ttl, &used);
            if (used != ttl.size() || seconds <= 0) {
                throw std::invalid_argument("expected a positive number of seconds");
            }
            parsed.ttl_seconds = seconds;
        } catch (const std::exception& e) {
            LOG("CLOUDFLARE-WARN", "Ignoring CLOUDFLARE_TURN_TTL=" << ttl << " (" << e.what() << ")");
        }
    }

    *config = parsed;
    return !parsed.turn_key_id.empty() && !parsed.api_token.empty();
}

bool CloudflareTurn::loadConfigFromEnv() {
    static const char* kKeys[] = {
        "CLOUDFLARE_ACCOUNT_ID", "CLOUDFLARE_TURN_KEY_ID", "CLOUDFLARE_API_TOKEN", "CLOUDFLARE_TURN_TTL",
    };

    std::map<std::string, std::string> env_file = loadEnvFile(defaultEnvSearchPaths());
    std::map<std::string, std::string> settings;
    for (const char* key : kKeys) {
        std::string value = lookupSetting(env_file, key);
        if (!value.empty()) {
            settings[key] = value;
        }
    }

    Config config;
    if (!configFromSettings(settings, &config)) {
        LOG("CLOUDFLARE-ERROR", "Missing required configuration:");
        if (config.turn_key_id.empty()) LOG("CLOUDFLARE-ERROR", "  - CLOUDFLARE_TURN_KEY_ID");
        if (config.api_token.empty()) LOG("CLOUDFLARE-ERROR", "  - CLOUDFLARE_API_TOKEN");
        return false;
    }

    setConfig(config);
    return true;
}

bool CloudflareTurn::isConfigured() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configured_;
}

CloudflareTurn::Credentials CloudflareTurn::getCredentials() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (credentials_.valid) {
        auto now = std::chrono::system_clock::now();
        auto time_until_expiry = std::chrono::duration_cast<std::chrono::seconds>(
            credentials_.expires_at - now).count();

        if (time_until_expiry > REFRESH_MARGIN_SECONDS) {
            return credentials_;
        }
        LOG("CLOUDFLARE", "Credentials expiring soon, refreshing...");
    }

    if (fetchCredentials()) {
        return credentials_;
    }
    return Credentials{};
}

CloudflareTurn::Credentials CloudflareTurn::refreshCredentials() {
    std::lock_guard<std::mutex> lock(mutex_);
    credentials_.valid = false;

    if (fetchCredentials()) {
        return credentials_;
    }
    return Credentials{};
}

bool CloudflareTurn::turnServer(IceServer* server) {
    Credentials creds = getCredentials();
    if (!creds.valid) {
        return false;
    }
    server->uri = creds.turn_uri;
    server->username = creds.username;
    server->password = creds.password;
    return true;
}

bool CloudflareTurn::fetchCredentials() {
    if (!configured_) {
        LOG("CLOUDFLARE-ERROR", "Not configured, cannot fetch credentials");
        return false;
    }

    LOG("CLOUDFLARE", "Fetching TURN credentials from Cloudflare...");

    CURL* curl = curl_easy_init();
    if (!curl) {
        LOG("CLOUDFLARE-ERROR", "Failed to initialize curl");
        return false;
    }

    std::string url = "https://rtc.live.cloudflare.com/v1/turn/keys/" +
                      config_.turn_key_id + "/credentials/generate-ice-servers";

    Json::Value request_body;
    request_body["ttl"] = config_.ttl_seconds;
    Json::StreamWriterBuilder writer;
    std::string body = Json::writeString(writer, request_body);

    std::string response;

    struct curl_slist* headers = nullptr;
    std::string auth_header = "Authorization: Bearer " + config_.api_token;
    headers = curl_slist_append(headers, auth_header.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);  // 10 second timeout

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        LOG_VAR("CLOUDFLARE-ERROR", "curl failed: ", curl_easy_strerror(res));
        return false;
    }

    if (http_code != 200) {
        LOG_VAR("CLOUDFLARE-ERROR", "API returned HTTP ", http_code);
        LOG_VAR("CLOUDFLARE-ERROR", "Response: ", response);
        return false;
    }

    Credentials parsed;
    if (!parseResponse(response, config_.ttl_seconds, &parsed)) {
        return false;
    }
    credentials_ = parsed;

    LOG("CLOUDFLARE", "Credentials fetched successfully!");
    LOG_VAR("CLOUDFLARE", "TURN URI: ", credentials_.turn_uri);
    LOG("CLOUDFLARE", "Username: " << credentials_.username.substr(0, 20) << "...");
    LOG("CLOUDFLARE", "Valid for: " << config_.ttl_seconds << " seconds");
    return true;
}

bool CloudflareTurn::parseResponse(const std::string& json_response, int ttl_seconds, Credentials* out) {
    Json::Value root;
    Json::CharReaderBuilder reader;
    std::string errors;
    std::istringstream stream(json_response);

    if (!Json::parseFromStream(reader, stream, &root, &errors)) {
        LOG_VAR("CLOUDFLARE-ERROR", "Failed to parse JSON: ", errors);
        return false;
    }

    // Response format:
    // {
    //   "iceServers": [
    //     {
    //       "urls": ["stun:...", "turn:...", "turns:..."],
    //       "username": "xxx",
    //       "credential": "yyy"
    //     }
    //   ]
    // }

    if (!root.isObject() || !root["iceServers"].isArray() || root["iceServers"].empty()) {
        LOG("CLOUDFLARE-ERROR", "Invalid response format - no iceServers");
        return false;
    }

    const Json::Value& ice_server = root["iceServers"][0];
    if (!ice_server["username"].isString() || !ice_server["credential"].isString()) {
        LOG("CLOUDFLARE-ERROR", "Missing username/credential in response");
        return false;
    }

    Credentials creds;
    creds.username = ice_server["username"].asString();
    creds.password = ice_server["credential"].asString();

    if (ice_server["urls"].isArray()) {
        for (const auto& url : ice_server["urls"]) {
            if (!url.isString()) {
                continue;
            }
            std::string url_str = url.asString();
            if (url_str.find("turn:") == 0) {
                // Prefer UDP TURN
                if (url_str.find("transport=udp") != std::string::npos ||
                    url_str.find("transport=") == std::string::npos) {
                    creds.turn_uri = url_str;
                }
            } else if (url_str.find("turns:") == 0) {
                creds.turns_uri = url_str;
            }
        }
    }

    if (creds.turn_uri.empty()) {
        creds.turn_uri = "turn:turn.cloudflare.com:3478";
    }
    if (creds.turns_uri.empty()) {
        creds.turns_uri = "turns:turn.cloudflare.com:5349";
    }

    creds.expires_at = std::chrono::system_clock::now() + std::chrono::seconds(ttl_seconds);
    creds.valid = true;

    *out = creds;
    return true;
}
