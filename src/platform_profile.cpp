#include "platform_profile.h"
#include "log.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace {

bool isNumber(const std::string& value) {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

}  // namespace

MediaConstraints PlatformProfile::adjustConstraints(const MediaConstraints& requested) const {
    return requested;
}

bool PlatformProfile::retryWithMinimalConstraints(ErrorCode) const {
    return false;
}

IceConfig PlatformProfile::iceConfig(const IceConfig& base) const {
    return base;
}

bool PlatformProfile::acceptRemoteCandidate(const IceCandidate&) const {
    return true;
}

std::chrono::milliseconds PlatformProfile::connectTimeout(std::chrono::milliseconds base) const {
    return base;
}

MediaConstraints ConservativePlatformProfile::adjustConstraints(const MediaConstraints& requested) const {
    MediaConstraints adjusted = requested;
    if (adjusted.video) {
        // Explicit dimensions instead of open ranges
        adjusted.video_constraints.ideal_width = 1280;
        adjusted.video_constraints.max_width = 1920;
        adjusted.video_constraints.ideal_height = 720;
        adjusted.video_constraints.max_height = 1080;
        adjusted.video_constraints.ideal_framerate = 30;
        adjusted.video_constraints.max_framerate = 60;
        adjusted.video_constraints.facing_mode = "user";
    }
    if (adjusted.audio) {
        adjusted.audio_constraints = AudioConstraints{true, true, true};
    }
    return adjusted;
}

bool ConservativePlatformProfile::retryWithMinimalConstraints(ErrorCode error) const {
    return error == ErrorCode::Overconstrained;
}

IceConfig ConservativePlatformProfile::iceConfig(const IceConfig& base) const {
    IceConfig config = base;
    config.candidate_pool_size = std::min(base.candidate_pool_size, 4);

    // One STUN server plus TCP TURN entries only
    std::vector<IceServer> servers;
    bool have_stun = false;
    for (const auto& server : base.servers) {
        bool is_stun = server.uri.compare(0, 4, "stun") == 0;
        if (is_stun) {
            if (!have_stun) {
                servers.push_back(server);
                have_stun = true;
            }
        } else if (server.uri.find("transport=tcp") != std::string::npos) {
            servers.push_back(server);
        }
    }
    // Keep the first TURN entry when none is explicitly TCP
    if (servers.size() == static_cast<size_t>(have_stun ? 1 : 0)) {
        for (const auto& server : base.servers) {
            if (server.uri.compare(0, 4, "turn") == 0) {
                servers.push_back(server);
                break;
            }
        }
    }
    config.servers = servers;
    return config;
}

bool ConservativePlatformProfile::acceptRemoteCandidate(const IceCandidate& candidate) const {
    // End-of-candidates marker always passes
    if (candidate.candidate.empty()) {
        return true;
    }
    return isWellFormedCandidate(candidate.candidate);
}

std::chrono::milliseconds ConservativePlatformProfile::connectTimeout(std::chrono::milliseconds base) const {
    return base + base / 2;
}

bool isWellFormedCandidate(const std::string& candidate) {
    std::string value = candidate;
    const std::string prefix = "candidate:";
    if (value.compare(0, prefix.size(), prefix) == 0) {
        value = value.substr(prefix.size());
    }

    std::istringstream stream(value);
    std::vector<std::string> parts;
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    if (parts.size() < 8) {
        return false;
    }

    const std::string protocol = upper(parts[2]);
    static const char* kTypes[] = {"host", "srflx", "prflx", "relay"};
    bool known_type = std::any_of(std::begin(kTypes), std::end(kTypes),
                                  [&](const char* type) { return parts[7] == type; });

    return !parts[0].empty() &&
           isNumber(parts[1]) &&
           (protocol == "UDP" || protocol == "TCP") &&
           isNumber(parts[3]) &&
           !parts[4].empty() &&
           isNumber(parts[5]) &&
           parts[6] == "typ" &&
           known_type;
}

std::unique_ptr<PlatformProfile> makePlatformProfile(const std::string& name) {
    if (name == "conservative") {
        return std::unique_ptr<PlatformProfile>(new ConservativePlatformProfile());
    }
    if (!name.empty() && name != "default") {
        LOG("PLATFORM-WARN", "Unknown platform profile '" << name << "', using default");
    }
    return std::unique_ptr<PlatformProfile>(new DefaultPlatformProfile());
}
