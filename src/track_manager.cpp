#include "track_manager.h"
#include "log.h"

namespace {

void stopUserMedia(const MediaBackend::UserMedia& media) {
    if (media.audio) media.audio->stop();
    if (media.video) media.video->stop();
}

}  // namespace

TrackManager::TrackManager(MediaBackend& backend, PeerConnectionRegistry& registry,
                           const PlatformProfile& profile)
    : backend_(backend)
    , registry_(registry)
    , profile_(profile)
    , quality_(defaultStreamQuality())
    , screen_pending_(false) {
}

TrackManager::~TrackManager() {
    // Late capture results find the token cancelled and only stop their tracks
    alive_.cancel();
    acquire_token_.cancel();
    screen_token_.cancel();
    releaseLocalMedia();
}

void TrackManager::acquireLocalMedia(const MediaConstraints& constraints, AcquireCallback callback) {
    acquire_token_.cancel();
    CancellationToken token;
    acquire_token_ = token;

    MediaConstraints adjusted = profile_.adjustConstraints(constraints);
    LOG("MEDIA", "Acquiring local media (audio=" << adjusted.audio << ", video=" << adjusted.video
        << ", profile=" << profile_.name() << ")");
    requestUserMedia(adjusted, token, std::move(callback), true);
}

void TrackManager::requestUserMedia(const MediaConstraints& constraints, CancellationToken token,
                                    AcquireCallback callback, bool allow_retry) {
    CancellationToken alive = alive_;
    backend_.acquireUserMedia(constraints,
        [this, alive, token, constraints, callback, allow_retry](const SessionError& error,
                                                                const MediaBackend::UserMedia& media) {
            if (alive.isCancelled()) {
                stopUserMedia(media);
                return;
            }
            if (token.isCancelled()) {
                LOG("MEDIA-WARN", "Discarding superseded local media request");
                stopUserMedia(media);
                if (callback) {
                    callback(SessionError(ErrorCode::Cancelled, "superseded by a newer request"), LocalMediaState());
                }
                return;
            }
            if (error) {
                if (allow_retry && profile_.retryWithMinimalConstraints(error.code)) {
                    LOG("MEDIA-WARN", "Capture failed (" << error.describe()
                        << "), retrying with minimal constraints");
                    requestUserMedia(MediaConstraints::minimal(constraints), token, callback, false);
                    return;
                }
                LOG("MEDIA-ERROR", "Local media acquisition failed: " << error.describe());
                if (callback) {
                    callback(error, LocalMediaState());
                }
                return;
            }

            installLocalMedia(media);
            if (callback) {
                callback(SessionError(), local_);
            }
        });
}

void TrackManager::installLocalMedia(const MediaBackend::UserMedia& media) {
    MediaTrackPtr old_camera = local_.camera;
    MediaTrackPtr old_microphone = local_.microphone;

    local_.camera = media.video;
    local_.microphone = media.audio;
    if (local_.camera) {
        local_.camera->setEnabled(local_.video_enabled);
    }
    if (local_.microphone) {
        local_.microphone->setEnabled(local_.audio_enabled);
    }

    // Re-acquisition while connected: swap new sources in before stopping old ones
    if (!registry_.empty()) {
        if (!local_.screen && local_.camera && local_.camera != old_camera) {
            replaceOutbound(MediaKind::Video, local_.camera);
        }
        if (local_.microphone && local_.microphone != old_microphone) {
            replaceOutbound(MediaKind::Audio, local_.microphone);
        }
    }
    if (old_camera && old_camera != local_.camera) old_camera->stop();
    if (old_microphone && old_microphone != local_.microphone) old_microphone->stop();

    LOG("MEDIA", "Local media ready: camera=" << (local_.camera ? local_.camera->id() : "none")
        << " microphone=" << (local_.microphone ? local_.microphone->id() : "none"));
}

void TrackManager::releaseLocalMedia() {
    acquire_token_.cancel();
    screen_token_.cancel();
    screen_pending_ = false;

    if (local_.empty()) {
        return;
    }
    if (local_.screen) local_.screen->stop();
    if (local_.camera) local_.camera->stop();
    if (local_.microphone) local_.microphone->stop();
    local_ = LocalMediaState();
    LOG("MEDIA", "Local media released");
}

void TrackManager::toggleAudio(bool enabled) {
    local_.audio_enabled = enabled;
    if (local_.microphone) {
        local_.microphone->setEnabled(enabled);
    }
    LOG("MEDIA", "Audio " << (enabled ? "enabled" : "disabled"));
}

void TrackManager::toggleVideo(bool enabled) {
    // Camera only; the screen sender is untouched while sharing
    local_.video_enabled = enabled;
    if (local_.camera) {
        local_.camera->setEnabled(enabled);
    }
    LOG("MEDIA", "Video " << (enabled ? "enabled" : "disabled")
        << (local_.screen ? " (camera, screen share active)" : ""));
}

void TrackManager::startScreenShare(CompletionCallback callback) {
    if (local_.screen) {
        LOG("SCREEN", "Screen share already active");
        if (callback) callback(SessionError());
        return;
    }

    screen_token_.cancel();
    CancellationToken token;
    screen_token_ = token;
    screen_pending_ = true;

    LOG("SCREEN", "Requesting screen capture");
    CancellationToken alive = alive_;
    backend_.acquireDisplayMedia([this, alive, token, callback](const SessionError& error,
                                                                const MediaTrackPtr& track) {
        if (alive.isCancelled()) {
            if (track) track->stop();
            return;
        }
        if (token.isCancelled()) {
            LOG("SCREEN-WARN", "Screen capture arrived after stop, discarding");
            if (track) track->stop();
            if (callback) callback(SessionError(ErrorCode::Cancelled, "screen share stopped before capture"));
            return;
        }
        screen_pending_ = false;

        if (error || !track) {
            SessionError result = error ? error : SessionError(ErrorCode::Internal, "no screen track");
            LOG("SCREEN-ERROR", "Screen capture failed: " << result.describe());
            if (callback) callback(result);
            return;
        }

        local_.screen = track;
        std::weak_ptr<MediaTrack> weak_track = track;
        track->setEndedCallback([this, alive, weak_track]() {
            if (alive.isCancelled()) {
                return;
            }
            MediaTrackPtr ended = weak_track.lock();
            if (ended && local_.screen == ended) {
                LOG("SCREEN", "Screen capture ended, reverting to camera");
                stopScreenShare();
            }
        });

        replaceOutbound(MediaKind::Video, track);
        LOG("SCREEN", "Screen share started on " << registry_.size() << " connection(s)");
        if (callback) callback(SessionError());
    });
}

void TrackManager::stopScreenShare() {
    screen_token_.cancel();
    screen_pending_ = false;

    if (!local_.screen) {
        return;
    }

    MediaTrackPtr screen = local_.screen;
    local_.screen.reset();

    // Camera goes in before the screen track stops
    if (!local_.camera) {
        LOG("SCREEN-WARN", "No camera to revert to; video senders keep the stopped screen track");
    } else {
        replaceOutbound(MediaKind::Video, local_.camera);
    }
    screen->stop();
    LOG("SCREEN", "Screen share stopped");
}

void TrackManager::acquireMicrophone(MicrophoneCallback callback) {
    CancellationToken alive = alive_;
    LOG("MEDIA", "Acquiring microphone");
    backend_.acquireUserMedia(MediaConstraints::microphoneOnly(),
        [alive, callback](const SessionError& error, const MediaBackend::UserMedia& media) {
            if (alive.isCancelled()) {
                stopUserMedia(media);
                return;
            }
            if (media.video) {
                media.video->stop();
            }
            if (error || !media.audio) {
                SessionError result = error ? error : SessionError(ErrorCode::DeviceNotFound, "no audio track");
                LOG("MEDIA-ERROR", "Microphone acquisition failed: " << result.describe());
                if (callback) callback(result, nullptr);
                return;
            }
            if (callback) callback(SessionError(), media.audio);
        });
}

void TrackManager::setStreamQuality(const StreamQuality& quality) {
    quality_ = quality;
    LOG("MEDIA", "Stream quality: " << quality.label << " (" << quality.width << "x" << quality.height
        << ", " << quality.bitrate << " bps, " << quality.framerate << " fps)");
    registry_.forEach([this](const PeerConnectionPtr& peer) {
        applyEncoding(*peer);
    });
}

void TrackManager::applyEncoding(PeerConnection& peer) {
    NativeTransceiverPtr sender = peer.findSender(MediaKind::Video);
    if (!sender) {
        return;
    }
    SessionError error = sender->setEncodingParameters(quality_.bitrate, quality_.framerate);
    if (error) {
        LOG("MEDIA-ERROR", peer.peerId() << " encoding parameters rejected: " << error.describe());
    }
}

SessionError TrackManager::attachLocalTracks(PeerConnection& peer) {
    NativePeerConnection* native = peer.native();
    if (!native) {
        return SessionError(ErrorCode::PeerNotFound, "connection " + peer.peerId() + " is closed");
    }

    MediaTrackPtr video = local_.activeVideo();
    if (video && !native->addTrack(video)) {
        return SessionError(ErrorCode::Internal, "could not add video track for " + peer.peerId());
    }
    if (local_.microphone && !native->addTrack(local_.microphone)) {
        return SessionError(ErrorCode::Internal, "could not add audio track for " + peer.peerId());
    }
    if (video) {
        applyEncoding(peer);
    }
    return SessionError();
}

void TrackManager::replaceOutbound(MediaKind kind, const MediaTrackPtr& track) {
    registry_.forEach([kind, &track](const PeerConnectionPtr& peer) {
        NativeTransceiverPtr sender = peer->findSender(kind);
        if (!sender) {
            LOG("MEDIA-WARN", peer->peerId() << " has no outbound " << mediaKindName(kind) << " sender");
            return;
        }
        SessionError error = sender->replaceSenderTrack(track);
        if (error) {
            // One peer failing must not stop the swap on the others
            LOG("MEDIA-ERROR", peer->peerId() << " " << mediaKindName(kind)
                << " track replacement failed: " << error.describe());
            return;
        }
        LOG("MEDIA", peer->peerId() << " " << mediaKindName(kind) << " sender now "
            << (track ? track->id() : "empty"));
    });
}
