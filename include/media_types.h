#ifndef MEDIA_TYPES_H
#define MEDIA_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

enum class PeerRole {
    Initiator,   // creates the offer (broadcaster side)
    Receiver     // answers the offer (viewer side)
};

enum class SignalingState {
    Stable,
    HaveLocalOffer,
    HaveRemoteOffer,
    Closed
};

enum class ConnectionState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

enum class MediaKind {
    Audio,
    Video
};

enum class TransceiverDirection {
    SendRecv,
    SendOnly,
    RecvOnly,
    Inactive
};

enum class SdpType {
    Offer,
    Answer
};

struct SessionDescription {
    SdpType type = SdpType::Offer;
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    int sdp_mline_index = 0;

    // Dedupe key: candidate string, m-line index and mid.
    std::string fingerprint() const;
};

struct OfferOptions {
    bool ice_restart = false;
};

// Camera types understood by the GStreamer capture pipeline
enum class CameraType {
    CSI,         // Raspberry Pi Camera Module (libcamerasrc)
    LEGACY_CSI,  // Raspberry Pi Camera Module (rpicamsrc, old camera stack)
    USB          // USB Webcam (v4l2src)
};

struct AudioConstraints {
    bool echo_cancellation = true;
    bool noise_suppression = true;
    bool auto_gain_control = true;
};

struct VideoConstraints {
    int ideal_width = 1280;
    int max_width = 0;       // 0 = unconstrained
    int ideal_height = 720;
    int max_height = 0;
    int ideal_framerate = 30;
    int max_framerate = 0;
    std::string facing_mode = "user";
};

struct MediaConstraints {
    bool audio = true;
    bool video = true;
    AudioConstraints audio_constraints;
    VideoConstraints video_constraints;

    std::string video_device = "/dev/video0";
    std::string audio_device = "default";
    CameraType camera_type = CameraType::CSI;

    // Plain audio+video request with every refinement dropped.
    static MediaConstraints minimal(const MediaConstraints& base);
    static MediaConstraints microphoneOnly();
};

struct StreamQuality {
    int width;
    int height;
    int bitrate;     // bits per second
    int framerate;
    std::string label;
};

const std::vector<StreamQuality>& streamQualityPresets();
const StreamQuality& defaultStreamQuality();
bool findStreamQuality(const std::string& label, StreamQuality& out);

enum class RtpDirection {
    Inbound,
    Outbound
};

struct RtpStreamStats {
    MediaKind kind = MediaKind::Video;
    RtpDirection direction = RtpDirection::Inbound;
    uint64_t bytes = 0;
    uint64_t packets = 0;
};

struct StatsReport {
    std::vector<RtpStreamStats> streams;

    // Sum of inbound bytes for one media kind; found is false when the
    // report carries no inbound entry of that kind.
    uint64_t inboundBytes(MediaKind kind, bool* found = nullptr) const;
};

const char* peerRoleName(PeerRole role);
const char* signalingStateName(SignalingState state);
const char* connectionStateName(ConnectionState state);
const char* mediaKindName(MediaKind kind);
const char* transceiverDirectionName(TransceiverDirection direction);
const char* sdpTypeName(SdpType type);

#endif // MEDIA_TYPES_H
