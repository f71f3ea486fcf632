#ifndef SESSION_CONFIG_H
#define SESSION_CONFIG_H

#include "media_backend.h"

#include <chrono>
#include <map>
#include <string>
#include <vector>

struct SessionConfig {
    std::string local_id;           // our identity on the relay
    std::string stream_id;

    std::string stun_server = "stun://stun.l.google.com:19302";
    IceServer turn_server;          // uri empty = no static TURN
    int ice_candidate_pool_size = 10;

    std::chrono::milliseconds health_check_interval{10000};
    int stall_poll_threshold = 2;
    std::chrono::milliseconds connect_timeout{10000};

    std::string data_channel_label = "stream-data";
    int data_channel_max_retransmits = 3;

    // Offer from an unknown peer creates a receiver connection for it
    bool auto_accept_offers = true;

    std::string platform_profile = "default";

    // STUN entry plus static TURN entry, if any
    IceConfig iceConfig() const;
};

// KEY=value pairs from the first .env found in ".", ".." and "../..".
// Comments and blank lines are skipped; matching quotes are stripped.
std::map<std::string, std::string> loadEnvFile(const std::vector<std::string>& search_paths);
std::vector<std::string> defaultEnvSearchPaths();

// Process environment wins over the .env value; empty when neither is set
std::string lookupSetting(const std::map<std::string, std::string>& env_file, const std::string& key);

// Apply .env and environment overrides on top of config. Malformed numbers
// are logged and the previous value kept.
void loadSessionConfigFromEnv(SessionConfig* config);
void applySessionSettings(const std::map<std::string, std::string>& settings, SessionConfig* config);

#endif // SESSION_CONFIG_H
