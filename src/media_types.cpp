#include "media_types.h"

std::string IceCandidate::fingerprint() const {
    if (candidate.empty()) {
        return "null-candidate";
    }
    return candidate + ":" + std::to_string(sdp_mline_index) + ":" + sdp_mid;
}

MediaConstraints MediaConstraints::minimal(const MediaConstraints& base) {
    MediaConstraints minimal;
    minimal.audio = base.audio;
    minimal.video = base.video;
    minimal.audio_constraints = AudioConstraints{false, false, false};
    minimal.video_constraints = VideoConstraints{0, 0, 0, 0, 0, 0, ""};
    minimal.video_device = base.video_device;
    minimal.audio_device = base.audio_device;
    minimal.camera_type = base.camera_type;
    return minimal;
}

MediaConstraints MediaConstraints::microphoneOnly() {
    MediaConstraints mic;
    mic.audio = true;
    mic.video = false;
    return mic;
}

const std::vector<StreamQuality>& streamQualityPresets() {
    static const std::vector<StreamQuality> presets = {
        {1920, 1080, 4000000, 30, "1080p"},
        {1280, 720, 2500000, 30, "720p"},
        {854, 480, 1000000, 30, "480p"},
        {640, 360, 600000, 30, "360p"},
    };
    return presets;
}

const StreamQuality& defaultStreamQuality() {
    return streamQualityPresets()[1];  // 720p
}

bool findStreamQuality(const std::string& label, StreamQuality& out) {
    for (const auto& preset : streamQualityPresets()) {
        if (preset.label == label) {
            out = preset;
            return true;
        }
    }
    return false;
}

uint64_t StatsReport::inboundBytes(MediaKind kind, bool* found) const {
    uint64_t total = 0;
    bool any = false;
    for (const auto& entry : streams) {
        if (entry.direction == RtpDirection::Inbound && entry.kind == kind) {
            total += entry.bytes;
            any = true;
        }
    }
    if (found) {
        *found = any;
    }
    return total;
}

const char* peerRoleName(PeerRole role) {
    return role == PeerRole::Initiator ? "initiator" : "receiver";
}

const char* signalingStateName(SignalingState state) {
    switch (state) {
        case SignalingState::Stable: return "stable";
        case SignalingState::HaveLocalOffer: return "have-local-offer";
        case SignalingState::HaveRemoteOffer: return "have-remote-offer";
        case SignalingState::Closed: return "closed";
    }
    return "unknown";
}

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::New: return "new";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Failed: return "failed";
        case ConnectionState::Closed: return "closed";
    }
    return "unknown";
}

const char* mediaKindName(MediaKind kind) {
    return kind == MediaKind::Audio ? "audio" : "video";
}

const char* transceiverDirectionName(TransceiverDirection direction) {
    switch (direction) {
        case TransceiverDirection::SendRecv: return "sendrecv";
        case TransceiverDirection::SendOnly: return "sendonly";
        case TransceiverDirection::RecvOnly: return "recvonly";
        case TransceiverDirection::Inactive: return "inactive";
    }
    return "unknown";
}

const char* sdpTypeName(SdpType type) {
    return type == SdpType::Offer ? "offer" : "answer";
}
