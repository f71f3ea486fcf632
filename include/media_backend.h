#ifndef MEDIA_BACKEND_H
#define MEDIA_BACKEND_H

#include "event_loop.h"
#include "media_track.h"
#include "media_types.h"
#include "session_error.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

// ICE server entry handed to the media stack
struct IceServer {
    std::string uri;        // e.g., "stun://stun.l.google.com:19302" or "turn://..."
    std::string username;
    std::string password;
};

struct IceConfig {
    std::vector<IceServer> servers;
    int candidate_pool_size = 10;
    bool max_bundle = true;
};

// One m-line of a native connection: a sender slot plus its receiver.
class NativeTransceiver {
public:
    virtual ~NativeTransceiver() = default;

    virtual MediaKind kind() const = 0;
    virtual TransceiverDirection direction() const = 0;
    virtual void setDirection(TransceiverDirection direction) = 0;

    // Track currently feeding the sender; null when the sender is empty
    virtual MediaTrackPtr senderTrack() const = 0;

    // Swap the sender's source without renegotiation. The swap is atomic:
    // the old track keeps flowing until the new one is attached.
    virtual SessionError replaceSenderTrack(const MediaTrackPtr& track) = 0;

    // Encoding limits for the sender (0 = leave unchanged)
    virtual SessionError setEncodingParameters(int max_bitrate, int max_framerate) = 0;
};

using NativeTransceiverPtr = std::shared_ptr<NativeTransceiver>;

class NativeDataChannel {
public:
    virtual ~NativeDataChannel() = default;

    virtual std::string label() const = 0;
    virtual bool isOpen() const = 0;
    virtual bool send(const std::string& text) = 0;
    virtual void close() = 0;

    virtual void setOnOpen(std::function<void()> callback) = 0;
    virtual void setOnClose(std::function<void()> callback) = 0;
    virtual void setOnMessage(std::function<void(const std::string&)> callback) = 0;
};

using NativeDataChannelPtr = std::shared_ptr<NativeDataChannel>;

// Connection handle of the underlying real-time media stack. All callbacks,
// observer events included, are delivered on the backend's event loop.
class NativePeerConnection {
public:
    using DescriptionCallback = std::function<void(const SessionError&, const SessionDescription&)>;
    using CompletionCallback = std::function<void(const SessionError&)>;
    using StatsCallback = std::function<void(const SessionError&, const StatsReport&)>;

    struct Observer {
        std::function<void(const IceCandidate&)> on_ice_candidate;
        std::function<void(const MediaTrackPtr&, const MediaStreamPtr&)> on_track;
        std::function<void(ConnectionState)> on_connection_state;
        std::function<void(const NativeDataChannelPtr&)> on_data_channel;
    };

    virtual ~NativePeerConnection() = default;

    virtual void setObserver(const Observer& observer) = 0;
    virtual void clearObserver() = 0;

    virtual void createOffer(const OfferOptions& options, DescriptionCallback callback) = 0;
    virtual void createAnswer(DescriptionCallback callback) = 0;
    virtual void setLocalDescription(const SessionDescription& description,
                                     CompletionCallback callback) = 0;
    virtual void setRemoteDescription(const SessionDescription& description,
                                      CompletionCallback callback) = 0;

    virtual SessionError addIceCandidate(const IceCandidate& candidate) = 0;

    virtual std::vector<NativeTransceiverPtr> transceivers() const = 0;
    virtual NativeTransceiverPtr addTrack(const MediaTrackPtr& track) = 0;
    virtual NativeTransceiverPtr addTransceiver(MediaKind kind, TransceiverDirection direction) = 0;

    // Detach the track from its sender; the transceiver stays, receive-only
    virtual SessionError removeTrack(const MediaTrackPtr& track) = 0;

    virtual NativeDataChannelPtr createDataChannel(const std::string& label, bool ordered,
                                                   int max_retransmits) = 0;

    virtual void getStats(StatsCallback callback) = 0;

    virtual void close() = 0;
};

enum class PlaybackStatus {
    Playing,
    Blocked,    // refused by autoplay policy; may succeed after user interaction
    Failed
};

// Local output for one remote audio stream
class PlaybackSink {
public:
    virtual ~PlaybackSink() = default;

    virtual void setSource(const MediaStreamPtr& stream) = 0;
    virtual MediaStreamPtr source() const = 0;
    virtual PlaybackStatus play(std::string* error) = 0;
    virtual void stop() = 0;
};

// Platform media stack: connection factory, capture devices, playback
// outputs and the event loop they all report on.
class MediaBackend {
public:
    struct UserMedia {
        MediaTrackPtr audio;
        MediaTrackPtr video;
    };

    using UserMediaCallback = std::function<void(const SessionError&, const UserMedia&)>;
    using DisplayMediaCallback = std::function<void(const SessionError&, const MediaTrackPtr&)>;

    virtual ~MediaBackend() = default;

    virtual EventLoop& eventLoop() = 0;

    virtual std::unique_ptr<NativePeerConnection> createPeerConnection(const std::string& peer_id,
                                                                       const IceConfig& config) = 0;

    virtual void acquireUserMedia(const MediaConstraints& constraints, UserMediaCallback callback) = 0;
    virtual void acquireDisplayMedia(DisplayMediaCallback callback) = 0;

    virtual std::unique_ptr<PlaybackSink> createPlaybackSink(const std::string& peer_id) = 0;

    // Ask the encoder for a fresh keyframe so a newly joined viewer can decode
    virtual void requestKeyframe() {}
};

#endif // MEDIA_BACKEND_H
