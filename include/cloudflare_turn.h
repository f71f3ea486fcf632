#ifndef CLOUDFLARE_TURN_H
#define CLOUDFLARE_TURN_H

#include "media_backend.h"

#include <string>
#include <chrono>
#include <map>
#include <mutex>

/**
 * CloudflareTurn - Fetches short-lived TURN credentials from Cloudflare's API
 *
 * Cloudflare TURN requires dynamic credentials that expire (max 48 hours).
 * This class handles fetching and caching credentials from their REST API.
 *
 * Settings (.env or environment):
 *   CLOUDFLARE_ACCOUNT_ID  - Your Cloudflare account ID
 *   CLOUDFLARE_TURN_KEY_ID - The TURN key ID from Cloudflare Calls dashboard
 *   CLOUDFLARE_API_TOKEN   - API token with Calls permissions
 *   CLOUDFLARE_TURN_TTL    - Credential lifetime in seconds
 */
class CloudflareTurn {
public:
    struct Config {
        std::string account_id;     // Cloudflare account ID
        std::string turn_key_id;    // TURN key ID from Cloudflare Calls
        std::string api_token;      // API token with Calls:Edit permission
        int ttl_seconds = 86400;    // Credential TTL (default 24 hours, max 48 hours)
    };

    struct Credentials {
        std::string username;
        std::string password;
        std::string turn_uri;       // turn:turn.cloudflare.com:3478
        std::string turns_uri;      // turns:turn.cloudflare.com:5349
        std::chrono::system_clock::time_point expires_at;
        bool valid = false;
    };

    CloudflareTurn() = default;
    explicit CloudflareTurn(const Config& config);

    CloudflareTurn(const CloudflareTurn&) = delete;
    CloudflareTurn& operator=(const CloudflareTurn&) = delete;

    void setConfig(const Config& config);

    // Read the CLOUDFLARE_* keys from .env and the environment. False when
    // the key id or token is missing.
    bool loadConfigFromEnv();

    bool isConfigured() const;

    // Cached credentials, fetched again within 5 minutes of expiry
    Credentials getCredentials();
    Credentials refreshCredentials();

    // TURN entry for the ICE configuration; false when no credentials
    bool turnServer(IceServer* server);

    // Parse a generate-ice-servers response; credentials expire after ttl_seconds
    static bool parseResponse(const std::string& json_response, int ttl_seconds, Credentials* out);

    // Build a Config from CLOUDFLARE_* settings; invalid TTL keeps the default
    static bool configFromSettings(const std::map<std::string, std::string>& settings, Config* config);

private:
    // Fetch new credentials from Cloudflare API (mutex held)
    bool fetchCredentials();

    Config config_;
    Credentials credentials_;
    bool configured_ = false;
    mutable std::mutex mutex_;

    // Refresh credentials 5 minutes before expiry
    static constexpr int REFRESH_MARGIN_SECONDS = 300;
};

#endif // CLOUDFLARE_TURN_H
