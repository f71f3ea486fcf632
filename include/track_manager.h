#ifndef TRACK_MANAGER_H
#define TRACK_MANAGER_H

#include "event_loop.h"
#include "media_backend.h"
#include "media_track.h"
#include "media_types.h"
#include "peer_connection_registry.h"
#include "platform_profile.h"
#include "session_error.h"

#include <functional>

// Local capture sources. Exactly one of camera/screen feeds the outbound
// video senders at any time; screen wins while it is set.
struct LocalMediaState {
    MediaTrackPtr camera;
    MediaTrackPtr microphone;
    MediaTrackPtr screen;
    bool audio_enabled = true;
    bool video_enabled = true;

    MediaTrackPtr activeVideo() const { return screen ? screen : camera; }
    bool empty() const { return !camera && !microphone && !screen; }
};

// Owns the local camera, microphone and screen capture and keeps every
// connection's outbound senders in step with them.
class TrackManager {
public:
    using AcquireCallback = std::function<void(const SessionError&, const LocalMediaState&)>;
    using CompletionCallback = std::function<void(const SessionError&)>;
    using MicrophoneCallback = std::function<void(const SessionError&, const MediaTrackPtr&)>;

    TrackManager(MediaBackend& backend, PeerConnectionRegistry& registry, const PlatformProfile& profile);
    ~TrackManager();

    TrackManager(const TrackManager&) = delete;
    TrackManager& operator=(const TrackManager&) = delete;

    // Capture camera and microphone. A newer call (or releaseLocalMedia)
    // cancels an in-flight one; its callback then gets Cancelled.
    void acquireLocalMedia(const MediaConstraints& constraints, AcquireCallback callback);

    // Stop every local track and forget them
    void releaseLocalMedia();

    const LocalMediaState& localMedia() const { return local_; }
    bool hasLocalMedia() const { return !local_.empty(); }

    // Enable state only; senders stay attached, nothing is renegotiated
    void toggleAudio(bool enabled);
    void toggleVideo(bool enabled);

    // Swap the screen capture into every outbound video sender. Capture end
    // (e.g. the user closing the picker window) reverts to the camera.
    void startScreenShare(CompletionCallback callback);
    void stopScreenShare();
    bool isScreenSharing() const { return local_.screen != nullptr; }
    bool screenSharePending() const { return screen_pending_; }

    // Audio-only capture for the viewer back-channel
    void acquireMicrophone(MicrophoneCallback callback);

    // Encoding limits for every outbound video sender
    void setStreamQuality(const StreamQuality& quality);
    const StreamQuality& streamQuality() const { return quality_; }

    // Add the active video source and the microphone to a new connection
    SessionError attachLocalTracks(PeerConnection& peer);

private:
    void requestUserMedia(const MediaConstraints& constraints, CancellationToken token,
                          AcquireCallback callback, bool allow_retry);
    void installLocalMedia(const MediaBackend::UserMedia& media);
    void replaceOutbound(MediaKind kind, const MediaTrackPtr& track);
    void applyEncoding(PeerConnection& peer);

    MediaBackend& backend_;
    PeerConnectionRegistry& registry_;
    const PlatformProfile& profile_;

    LocalMediaState local_;
    StreamQuality quality_;
    bool screen_pending_;

    CancellationToken alive_;
    CancellationToken acquire_token_;
    CancellationToken screen_token_;
};

#endif // TRACK_MANAGER_H
