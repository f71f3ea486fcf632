#ifndef SESSION_MANAGER_H
#define SESSION_MANAGER_H

#include "health_monitor.h"
#include "media_backend.h"
#include "peer_connection_registry.h"
#include "platform_profile.h"
#include "renegotiation_controller.h"
#include "session_config.h"
#include "signaling_message.h"
#include "track_manager.h"
#include "viewer_audio_backchannel.h"

#include <json/json.h>
#include <functional>
#include <memory>
#include <string>

// Entry point for the UI/caller layer. One instance per streaming session;
// owns every connection and local media source of that session. All methods
// and callbacks run on the backend's event loop.
class SessionManager {
public:
    using RemoteStreamCallback = std::function<void(const std::string& peer_id, const MediaStreamPtr& stream)>;
    using ConnectionStateCallback = std::function<void(const std::string& peer_id, ConnectionState state)>;
    using StalledCallback = std::function<void(const std::string& peer_id, MediaKind kind)>;
    using PlaybackFailedCallback = std::function<void(const std::string& peer_id, const SessionError& error)>;
    using DataMessageCallback = std::function<void(const std::string& peer_id, const Json::Value& message)>;
    using LocalMediaCallback = TrackManager::AcquireCallback;
    using CompletionCallback = std::function<void(const SessionError&)>;
    // Supplies short-lived TURN credentials per connection; false = none
    using TurnProvider = std::function<bool(IceServer* server)>;

    // A null profile selects the one named in config.platform_profile
    SessionManager(const SessionConfig& config, MediaBackend& backend, SignalingAdapter& signaling,
                   std::unique_ptr<PlatformProfile> profile = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Events
    void setOnRemoteStream(RemoteStreamCallback callback) { on_remote_stream_ = std::move(callback); }
    void setOnPeerConnectionStateChanged(ConnectionStateCallback callback) { on_state_changed_ = std::move(callback); }
    void setOnStalled(StalledCallback callback) { on_stalled_ = std::move(callback); }
    void setOnViewerAudioPlaybackFailed(PlaybackFailedCallback callback) { on_playback_failed_ = std::move(callback); }
    void setOnDataMessage(DataMessageCallback callback) { on_data_message_ = std::move(callback); }

    // Consulted by createConnection; its server replaces the static TURN entry
    void setTurnProvider(TurnProvider provider) { turn_provider_ = std::move(provider); }

    // Local media
    void startLocalMedia(const MediaConstraints& constraints, LocalMediaCallback callback);
    void stopLocalMedia();
    void toggleAudio(bool enabled);
    void toggleVideo(bool enabled);
    void startScreenShare(CompletionCallback callback = nullptr);
    void stopScreenShare();
    void setStreamQuality(const StreamQuality& quality);

    // Connections
    SessionError createConnection(const std::string& peer_id, bool is_initiator);
    bool removePeer(const std::string& peer_id);
    void teardownAll();

    // Inbound relay traffic. Malformed or misaddressed messages are dropped.
    void handleSignalingMessage(const SignalingMessage& message);
    SessionError handleSignalingText(const std::string& text);

    // Viewer side: send our microphone to the broadcaster. Broadcaster side:
    // removeViewerAudio tears down that viewer's playback.
    void addViewerAudio(const std::string& peer_id, CompletionCallback callback = nullptr);
    SessionError removeViewerAudio(const std::string& peer_id);

    // Retry audio playback blocked by autoplay policy
    void notifyUserInteraction();

    SessionError restartIce(const std::string& peer_id);

    // Data channel
    bool sendDataMessage(const std::string& peer_id, const Json::Value& message);
    size_t broadcastDataMessage(const Json::Value& message);

    // Accessors
    size_t peerCount() const { return registry_.size(); }
    bool hasPeer(const std::string& peer_id) const { return registry_.contains(peer_id); }
    SignalingState signalingState(const std::string& peer_id) const;
    ConnectionState connectionState(const std::string& peer_id) const;
    const LocalMediaState& localMedia() const { return tracks_.localMedia(); }
    bool isScreenSharing() const { return tracks_.isScreenSharing(); }
    const SessionConfig& config() const { return config_; }
    const PlatformProfile& profile() const { return *profile_; }
    const ViewerAudioBackchannel& backchannel() const { return backchannel_; }

private:
    IceConfig iceConfigFor(const std::string& peer_id) const;
    void installObserver(const PeerConnectionPtr& peer);
    void setupDataChannel(const PeerConnectionPtr& peer, const NativeDataChannelPtr& channel);

    void onLocalCandidate(const PeerConnectionPtr& peer, const IceCandidate& candidate);
    void onRemoteTrack(const PeerConnectionPtr& peer, const MediaTrackPtr& track, const MediaStreamPtr& stream);
    void onConnectionState(const PeerConnectionPtr& peer, ConnectionState state);

    void handleOffer(const SignalingMessage& message);
    void handleAnswer(const SignalingMessage& message);
    void handleCandidate(const SignalingMessage& message);
    void answerOffer(const PeerConnectionPtr& peer);
    void failOperation(const PeerConnectionPtr& peer, const char* step, const SessionError& error);
    void flushCandidates(const PeerConnectionPtr& peer);

    void sendMessage(SignalingMessageType type, const std::string& to, const std::string& sdp,
                     const IceCandidate* candidate = nullptr);
    void removePeerInternal(const std::string& peer_id);

    // profile_ must outlive registry_: candidate filters point into it
    SessionConfig config_;
    MediaBackend& backend_;
    SignalingAdapter& signaling_;
    std::unique_ptr<PlatformProfile> profile_;
    PeerConnectionRegistry registry_;
    TrackManager tracks_;
    RenegotiationController renegotiation_;
    HealthMonitor health_;
    ViewerAudioBackchannel backchannel_;
    CancellationToken alive_;

    RemoteStreamCallback on_remote_stream_;
    ConnectionStateCallback on_state_changed_;
    StalledCallback on_stalled_;
    PlaybackFailedCallback on_playback_failed_;
    DataMessageCallback on_data_message_;
    TurnProvider turn_provider_;
};

#endif // SESSION_MANAGER_H
