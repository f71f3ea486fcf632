#ifndef PLATFORM_PROFILE_H
#define PLATFORM_PROFILE_H

#include "media_backend.h"
#include "media_types.h"
#include "session_error.h"

#include <chrono>
#include <memory>
#include <string>

// Platform-capability strategy, selected once when a session is built.
// Every platform-specific workaround lives behind this interface instead of
// being scattered through the connection logic.
class PlatformProfile {
public:
    virtual ~PlatformProfile() = default;

    virtual std::string name() const = 0;

    // Rewrite caller constraints before the capture request
    virtual MediaConstraints adjustConstraints(const MediaConstraints& requested) const;

    // Whether a failed capture should be retried once with minimal constraints
    virtual bool retryWithMinimalConstraints(ErrorCode error) const;

    // ICE servers and pool size for new connections
    virtual IceConfig iceConfig(const IceConfig& base) const;

    // Gate for remote candidates before they reach the media stack
    virtual bool acceptRemoteCandidate(const IceCandidate& candidate) const;

    virtual std::chrono::milliseconds connectTimeout(std::chrono::milliseconds base) const;
};

class DefaultPlatformProfile : public PlatformProfile {
public:
    std::string name() const override { return "default"; }
};

// Narrow ICE server set, smaller candidate pool, explicit capture sizes with a
// minimal-constraints fallback, and strict candidate validation.
class ConservativePlatformProfile : public PlatformProfile {
public:
    std::string name() const override { return "conservative"; }

    MediaConstraints adjustConstraints(const MediaConstraints& requested) const override;
    bool retryWithMinimalConstraints(ErrorCode error) const override;
    IceConfig iceConfig(const IceConfig& base) const override;
    bool acceptRemoteCandidate(const IceCandidate& candidate) const override;
    std::chrono::milliseconds connectTimeout(std::chrono::milliseconds base) const override;
};

// Syntactic check of an a=candidate value (foundation, component, protocol,
// priority, address, port, "typ", type)
bool isWellFormedCandidate(const std::string& candidate);

// Unknown names fall back to the default profile
std::unique_ptr<PlatformProfile> makePlatformProfile(const std::string& name);

#endif // PLATFORM_PROFILE_H
