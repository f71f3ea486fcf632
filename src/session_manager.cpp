#include "session_manager.h"
#include "log.h"

#include <sstream>

SessionManager::SessionManager(const SessionConfig& config, MediaBackend& backend,
                               SignalingAdapter& signaling, std::unique_ptr<PlatformProfile> profile)
    : config_(config)
    , backend_(backend)
    , signaling_(signaling)
    , profile_(profile ? std::move(profile) : makePlatformProfile(config.platform_profile))
    , registry_()
    , tracks_(backend, registry_, *profile_)
    , renegotiation_(registry_, signaling, config_)
    , health_(backend.eventLoop(), config.health_check_interval, config.stall_poll_threshold,
              profile_->connectTimeout(config.connect_timeout))
    , backchannel_(backend) {

    health_.setOnStalled([this](const std::string& peer_id, MediaKind kind) {
        if (on_stalled_) {
            on_stalled_(peer_id, kind);
        }
    });
    backchannel_.setOnPlaybackFailed([this](const std::string& peer_id, const SessionError& error) {
        if (on_playback_failed_) {
            on_playback_failed_(peer_id, error);
        }
    });

    LOG("SESSION", "Session created: id=" << config_.local_id << " stream=" << config_.stream_id
        << " profile=" << profile_->name());
}

SessionManager::~SessionManager() {
    alive_.cancel();
    teardownAll();
}

// ==================== Local media ====================

void SessionManager::startLocalMedia(const MediaConstraints& constraints, LocalMediaCallback callback) {
    tracks_.acquireLocalMedia(constraints, std::move(callback));
}

void SessionManager::stopLocalMedia() {
    tracks_.releaseLocalMedia();
}

void SessionManager::toggleAudio(bool enabled) {
    tracks_.toggleAudio(enabled);
}

void SessionManager::toggleVideo(bool enabled) {
    tracks_.toggleVideo(enabled);
}

void SessionManager::startScreenShare(CompletionCallback callback) {
    tracks_.startScreenShare(std::move(callback));
}

void SessionManager::stopScreenShare() {
    tracks_.stopScreenShare();
}

void SessionManager::setStreamQuality(const StreamQuality& quality) {
    tracks_.setStreamQuality(quality);
}

// ==================== Connections ====================

SessionError SessionManager::createConnection(const std::string& peer_id, bool is_initiator) {
    if (peer_id.empty()) {
        return SessionError(ErrorCode::Internal, "empty peer id");
    }
    if (registry_.contains(peer_id)) {
        LOG_VAR("SESSION-WARN", "Connection already exists, remove it first: ", peer_id);
        return SessionError(ErrorCode::DuplicatePeer, "peer " + peer_id + " already has a connection");
    }

    IceConfig ice = profile_->iceConfig(iceConfigFor(peer_id));
    SessionError error;
    PeerConnectionPtr peer = registry_.create(
        peer_id, is_initiator ? PeerRole::Initiator : PeerRole::Receiver,
        backend_.createPeerConnection(peer_id, ice), &error);
    if (!peer) {
        LOG("SESSION-ERROR", "Failed to create connection for " << peer_id << ": " << error.describe());
        return error;
    }

    const PlatformProfile* profile = profile_.get();
    peer->candidates().setAcceptFilter([profile](const IceCandidate& candidate) {
        return profile->acceptRemoteCandidate(candidate);
    });
    installObserver(peer);

    NativePeerConnection* native = peer->native();
    if (tracks_.hasLocalMedia()) {
        error = tracks_.attachLocalTracks(*peer);
        if (error) {
            LOG("SESSION-ERROR", "Failed to attach local media for " << peer_id << ": " << error.describe());
            registry_.remove(peer_id);
            return error;
        }
    } else if (is_initiator) {
        // Nothing to send yet: receive video, keep an audio slot for the back-channel
        native->addTransceiver(MediaKind::Audio, TransceiverDirection::SendRecv);
        native->addTransceiver(MediaKind::Video, TransceiverDirection::RecvOnly);
    }

    if (!is_initiator) {
        LOG_VAR("SESSION", "Receiver connection ready, waiting for offer from ", peer_id);
        return SessionError();
    }

    NativeDataChannelPtr channel = native->createDataChannel(
        config_.data_channel_label, true, config_.data_channel_max_retransmits);
    if (channel) {
        setupDataChannel(peer, channel);
    } else {
        LOG_VAR("SESSION-WARN", "Data channel unavailable for ", peer_id);
    }

    error = renegotiation_.startNegotiation(peer_id);
    if (error) {
        LOG("SESSION-ERROR", "Failed to start negotiation with " << peer_id << ": " << error.describe());
        registry_.remove(peer_id);
        return error;
    }
    return SessionError();
}

IceConfig SessionManager::iceConfigFor(const std::string& peer_id) const {
    SessionConfig config = config_;
    if (turn_provider_) {
        IceServer turn;
        if (turn_provider_(&turn)) {
            config.turn_server = turn;
        } else if (!config.turn_server.uri.empty()) {
            LOG_VAR("SESSION-WARN", "No fresh TURN credentials, using static server for ", peer_id);
        } else {
            LOG_VAR("SESSION-WARN", "No TURN server available for ", peer_id);
        }
    }
    return config.iceConfig();
}

void SessionManager::installObserver(const PeerConnectionPtr& peer) {
    PeerConnectionWeakPtr weak = peer;
    NativePeerConnection::Observer observer;

    observer.on_ice_candidate = [this, weak](const IceCandidate& candidate) {
        PeerConnectionPtr peer = weak.lock();
        if (peer && !peer->isClosed()) {
            onLocalCandidate(peer, candidate);
        }
    };
    observer.on_track = [this, weak](const MediaTrackPtr& track, const MediaStreamPtr& stream) {
        PeerConnectionPtr peer = weak.lock();
        if (peer && !peer->isClosed()) {
            onRemoteTrack(peer, track, stream);
        }
    };
    observer.on_connection_state = [this, weak](ConnectionState state) {
        PeerConnectionPtr peer = weak.lock();
        if (peer && !peer->isClosed()) {
            onConnectionState(peer, state);
        }
    };
    observer.on_data_channel = [this, weak](const NativeDataChannelPtr& channel) {
        PeerConnectionPtr peer = weak.lock();
        if (!peer || peer->isClosed() || !channel) {
            return;
        }
        if (peer->dataChannel()) {
            LOG_VAR("DATA-WARN", "Ignoring extra data channel from ", peer->peerId());
            return;
        }
        setupDataChannel(peer, channel);
    };

    peer->native()->setObserver(observer);
}

void SessionManager::setupDataChannel(const PeerConnectionPtr& peer, const NativeDataChannelPtr& channel) {
    peer->setDataChannel(channel);
    std::string peer_id = peer->peerId();
    CancellationToken alive = alive_;

    channel->setOnOpen([peer_id]() {
        LOG_VAR("DATA", "Data channel open: ", peer_id);
    });
    channel->setOnClose([peer_id]() {
        LOG_VAR("DATA", "Data channel closed: ", peer_id);
    });
    channel->setOnMessage([this, alive, peer_id](const std::string& text) {
        if (alive.isCancelled()) {
            return;
        }
        Json::Value root;
        Json::CharReaderBuilder builder;
        std::istringstream stream(text);
        std::string errs;
        if (!Json::parseFromStream(builder, stream, &root, &errs)) {
            LOG("DATA-WARN", "Dropping malformed data message from " << peer_id << ": " << errs);
            return;
        }
        if (on_data_message_) {
            on_data_message_(peer_id, root);
        }
    });
}

void SessionManager::onLocalCandidate(const PeerConnectionPtr& peer, const IceCandidate& candidate) {
    sendMessage(SignalingMessageType::IceCandidate, peer->peerId(), "", &candidate);
}

void SessionManager::onRemoteTrack(const PeerConnectionPtr& peer, const MediaTrackPtr& track,
                                   const MediaStreamPtr& stream) {
    ConnectionState state = peer->connectionState();
    if (state == ConnectionState::Failed || state == ConnectionState::Closed) {
        LOG_VAR("SESSION-WARN", "Ignoring track on terminated connection ", peer->peerId());
        return;
    }
    if (!track) {
        return;
    }

    const std::string& peer_id = peer->peerId();
    LOG("SESSION", "Remote " << mediaKindName(track->kind()) << " track from " << peer_id);
    peer->addRemoteKind(track->kind());

    MediaStreamPtr delivered = stream;
    if (!delivered) {
        delivered = std::make_shared<MediaStream>(peer_id);
        delivered->addTrack(track);
    }

    if (on_remote_stream_) {
        on_remote_stream_(peer_id, delivered);
    }

    // Only the broadcaster plays viewer audio
    if (track->kind() != MediaKind::Audio || !tracks_.hasLocalMedia()) {
        return;
    }
    backchannel_.attach(peer_id, delivered);

    CancellationToken alive = alive_;
    std::weak_ptr<MediaStream> weak_stream = delivered;
    track->setEndedCallback([this, alive, peer_id, weak_stream]() {
        if (alive.isCancelled()) {
            return;
        }
        const ViewerAudioBackchannel::Entry* entry = backchannel_.entry(peer_id);
        MediaStreamPtr ended = weak_stream.lock();
        if (entry && ended && entry->stream == ended) {
            LOG_VAR("BACKCHANNEL", "Viewer audio ended: ", peer_id);
            backchannel_.release(peer_id);
        }
    });
}

void SessionManager::onConnectionState(const PeerConnectionPtr& peer, ConnectionState state) {
    if (peer->connectionState() == state) {
        return;
    }
    const std::string peer_id = peer->peerId();
    LOG("SESSION", peer_id << " connection state: " << connectionStateName(peer->connectionState())
        << " -> " << connectionStateName(state));
    peer->setConnectionState(state);
    health_.onConnectionStateChanged(peer, state);

    if (on_state_changed_) {
        on_state_changed_(peer_id, state);
    }

    if (state != ConnectionState::Failed && state != ConnectionState::Closed) {
        return;
    }

    // Terminal for this peer only. Removal runs after the native callback returns.
    LOG("SESSION-WARN", peer_id << " connection " << connectionStateName(state) << ", cleaning up");
    CancellationToken alive = alive_;
    PeerConnectionWeakPtr weak = peer;
    backend_.eventLoop().post([this, alive, weak, peer_id]() {
        if (alive.isCancelled()) {
            return;
        }
        PeerConnectionPtr current = registry_.lookup(peer_id);
        PeerConnectionPtr terminated = weak.lock();
        if (current && current == terminated) {
            removePeerInternal(peer_id);
        }
    });
}

bool SessionManager::removePeer(const std::string& peer_id) {
    if (!registry_.contains(peer_id)) {
        LOG_VAR("SESSION-WARN", "removePeer: unknown peer ", peer_id);
        return false;
    }
    removePeerInternal(peer_id);
    return true;
}

void SessionManager::removePeerInternal(const std::string& peer_id) {
    PeerConnectionPtr peer = registry_.lookup(peer_id);
    if (!peer) {
        return;
    }
    health_.stop(*peer);
    backchannel_.release(peer_id);
    if (peer->outboundAudio()) {
        peer->outboundAudio()->stop();
    }
    registry_.remove(peer_id);
}

void SessionManager::teardownAll() {
    if (registry_.empty() && tracks_.localMedia().empty() && backchannel_.sinkCount() == 0) {
        return;
    }
    LOG("SESSION", "Tearing down session: " << registry_.size() << " connection(s)");
    for (const auto& peer_id : registry_.peerIds()) {
        removePeerInternal(peer_id);
    }
    backchannel_.releaseAll();
    registry_.clear();
    tracks_.releaseLocalMedia();
}

// ==================== Signaling ====================

SessionError SessionManager::handleSignalingText(const std::string& text) {
    SignalingMessage message;
    SessionError error = decodeSignalingMessage(text, &message);
    if (error) {
        LOG("SIGNALING-WARN", "Dropping message: " << error.describe());
        return error;
    }
    handleSignalingMessage(message);
    return SessionError();
}

void SessionManager::handleSignalingMessage(const SignalingMessage& message) {
    if (!message.to.empty() && !config_.local_id.empty() && message.to != config_.local_id) {
        LOG("SIGNALING-WARN", "Dropping " << signalingMessageTypeName(message.type)
            << " addressed to " << message.to);
        return;
    }
    if (!message.stream_id.empty() && !config_.stream_id.empty() && message.stream_id != config_.stream_id) {
        LOG("SIGNALING-WARN", "Dropping " << signalingMessageTypeName(message.type)
            << " for stream " << message.stream_id);
        return;
    }

    switch (message.type) {
        case SignalingMessageType::Offer:
        case SignalingMessageType::RenegotiationOffer:
            handleOffer(message);
            break;
        case SignalingMessageType::Answer:
            handleAnswer(message);
            break;
        case SignalingMessageType::IceCandidate:
            handleCandidate(message);
            break;
    }
}

void SessionManager::handleOffer(const SignalingMessage& message) {
    const std::string& peer_id = message.from;
    PeerConnectionPtr peer = registry_.lookup(peer_id);

    if (!peer) {
        if (!config_.auto_accept_offers) {
            LOG_VAR("SIGNALING-WARN", "Dropping offer from unknown peer ", peer_id);
            return;
        }
        SessionError error = createConnection(peer_id, false);
        if (error) {
            return;
        }
        peer = registry_.lookup(peer_id);
    }

    if (peer->operationPending()) {
        LOG_VAR("SIGNALING-WARN", "Dropping offer, operation in progress for ", peer_id);
        return;
    }
    if (!peer->acceptsSignalingEvent(SignalingEvent::RemoteOfferSet)) {
        LOG("SIGNALING-WARN", "Dropping " << signalingMessageTypeName(message.type) << " from " << peer_id
            << " in state " << signalingStateName(peer->signalingState()));
        return;
    }

    LOG("SIGNALING", "Applying " << signalingMessageTypeName(message.type) << " from " << peer_id);
    peer->setOperationPending(true);

    SessionDescription offer;
    offer.type = SdpType::Offer;
    offer.sdp = message.sdp;

    PeerConnectionWeakPtr weak = peer;
    peer->native()->setRemoteDescription(offer, [this, weak](const SessionError& error) {
        PeerConnectionPtr peer = weak.lock();
        if (!peer || peer->isClosed()) {
            return;
        }
        if (error) {
            failOperation(peer, "set remote offer", error);
            return;
        }
        peer->applySignalingEvent(SignalingEvent::RemoteOfferSet);
        peer->markRemoteDescriptionSet();
        flushCandidates(peer);
        answerOffer(peer);
    });
}

void SessionManager::answerOffer(const PeerConnectionPtr& peer) {
    PeerConnectionWeakPtr weak = peer;
    peer->native()->createAnswer([this, weak](const SessionError& error, const SessionDescription& answer) {
        PeerConnectionPtr peer = weak.lock();
        if (!peer || peer->isClosed()) {
            return;
        }
        if (error) {
            failOperation(peer, "create answer", error);
            return;
        }

        peer->native()->setLocalDescription(answer, [this, weak, answer](const SessionError& error) {
            PeerConnectionPtr peer = weak.lock();
            if (!peer || peer->isClosed()) {
                return;
            }
            if (error) {
                failOperation(peer, "set local answer", error);
                return;
            }
            peer->setOperationPending(false);
            if (!peer->applySignalingEvent(SignalingEvent::LocalAnswerSet)) {
                return;
            }
            sendMessage(SignalingMessageType::Answer, peer->peerId(), answer.sdp);
            LOG_VAR("SIGNALING", "Sent answer to ", peer->peerId());
            renegotiation_.onNegotiationComplete(peer->peerId());
        });
    });
}

void SessionManager::handleAnswer(const SignalingMessage& message) {
    const std::string& peer_id = message.from;
    PeerConnectionPtr peer = registry_.lookup(peer_id);
    if (!peer) {
        LOG_VAR("SIGNALING-WARN", "Dropping answer from unknown peer ", peer_id);
        return;
    }
    if (peer->operationPending()) {
        LOG_VAR("SIGNALING-WARN", "Dropping answer, operation in progress for ", peer_id);
        return;
    }
    if (!peer->acceptsSignalingEvent(SignalingEvent::RemoteAnswerSet)) {
        LOG("SIGNALING-WARN", "Dropping answer from " << peer_id
            << " in state " << signalingStateName(peer->signalingState()));
        return;
    }

    LOG_VAR("SIGNALING", "Applying answer from ", peer_id);
    peer->setOperationPending(true);

    SessionDescription answer;
    answer.type = SdpType::Answer;
    answer.sdp = message.sdp;

    PeerConnectionWeakPtr weak = peer;
    peer->native()->setRemoteDescription(answer, [this, weak](const SessionError& error) {
        PeerConnectionPtr peer = weak.lock();
        if (!peer || peer->isClosed()) {
            return;
        }
        if (error) {
            failOperation(peer, "set remote answer", error);
            renegotiation_.onRemoteAnswerFailed(peer->peerId(), error);
            return;
        }
        peer->setOperationPending(false);
        peer->applySignalingEvent(SignalingEvent::RemoteAnswerSet);
        peer->markRemoteDescriptionSet();
        flushCandidates(peer);

        // New viewer needs a keyframe to start decoding
        if (tracks_.hasLocalMedia()) {
            backend_.requestKeyframe();
        }
        renegotiation_.onNegotiationComplete(peer->peerId());
    });
}

void SessionManager::failOperation(const PeerConnectionPtr& peer, const char* step, const SessionError& error) {
    LOG("SIGNALING-ERROR", peer->peerId() << " failed to " << step << ": " << error.describe());
    peer->setOperationPending(false);
}

void SessionManager::handleCandidate(const SignalingMessage& message) {
    PeerConnectionPtr peer = registry_.lookup(message.from);
    if (!peer || !peer->native()) {
        LOG_VAR("ICE-WARN", "Dropping candidate for unknown peer ", message.from);
        return;
    }

    NativePeerConnection* native = peer->native();
    CandidateDisposition disposition = peer->candidates().enqueueOrApply(
        message.candidate, peer->remoteDescriptionSet(),
        [native](const IceCandidate& candidate) { return native->addIceCandidate(candidate); });

    if (disposition == CandidateDisposition::Queued) {
        LOG("ICE", "Queued candidate for " << message.from << " (" << peer->candidates().pendingCount()
            << " pending)");
    }
}

void SessionManager::flushCandidates(const PeerConnectionPtr& peer) {
    if (peer->candidates().pendingCount() == 0) {
        return;
    }
    NativePeerConnection* native = peer->native();
    IceCandidateQueue::FlushResult result = peer->candidates().flush(
        [native](const IceCandidate& candidate) { return native->addIceCandidate(candidate); });
    LOG("ICE", "Flushed candidates for " << peer->peerId() << ": " << result.applied << " applied, "
        << result.failed << " failed");
}

void SessionManager::sendMessage(SignalingMessageType type, const std::string& to, const std::string& sdp,
                                 const IceCandidate* candidate) {
    SignalingMessage message;
    message.type = type;
    message.stream_id = config_.stream_id;
    message.from = config_.local_id;
    message.to = to;
    message.sdp = sdp;
    if (candidate) {
        message.candidate = *candidate;
    }
    signaling_.send(message);
}

// ==================== Viewer audio ====================

void SessionManager::addViewerAudio(const std::string& peer_id, CompletionCallback callback) {
    if (!registry_.contains(peer_id)) {
        SessionError error(ErrorCode::PeerNotFound, "no connection to " + peer_id);
        LOG("BACKCHANNEL-ERROR", error.message);
        if (callback) callback(error);
        return;
    }

    CancellationToken alive = alive_;
    tracks_.acquireMicrophone([this, alive, peer_id, callback](const SessionError& error,
                                                              const MediaTrackPtr& track) {
        if (alive.isCancelled()) {
            if (track) track->stop();
            return;
        }
        if (error) {
            if (callback) callback(error);
            return;
        }

        PeerConnectionPtr peer = registry_.lookup(peer_id);
        if (!peer) {
            track->stop();
            if (callback) callback(SessionError(ErrorCode::PeerNotFound, "peer " + peer_id + " left"));
            return;
        }
        if (peer->outboundAudio()) {
            LOG_VAR("BACKCHANNEL", "Microphone already sent to ", peer_id);
            track->stop();
            if (callback) callback(SessionError());
            return;
        }

        // Reported once the offer carrying the microphone is out
        SessionError result = renegotiation_.addOutboundAudio(peer_id, track,
            [this, alive, peer_id, track, callback](const SessionError& error) {
                if (!error) {
                    if (callback) callback(error);
                    return;
                }
                track->stop();
                if (alive.isCancelled()) {
                    return;
                }
                LOG("BACKCHANNEL-ERROR", "Microphone offer to " << peer_id << " failed: " << error.describe());
                PeerConnectionPtr peer = registry_.lookup(peer_id);
                if (peer && !peer->isClosed() && peer->outboundAudio() == track) {
                    SessionError detach_error = renegotiation_.detachOutboundAudio(peer_id);
                    if (detach_error) {
                        LOG("BACKCHANNEL-ERROR", "Microphone left attached for " << peer_id << ": "
                            << detach_error.describe());
                    }
                }
                if (callback) callback(error);
            });
        if (result) {
            track->stop();
            if (callback) callback(result);
        }
    });
}

SessionError SessionManager::removeViewerAudio(const std::string& peer_id) {
    PeerConnectionPtr peer = registry_.lookup(peer_id);
    if (!peer) {
        return SessionError(ErrorCode::PeerNotFound, "no connection to " + peer_id);
    }

    if (tracks_.hasLocalMedia()) {
        // Broadcaster: stop playing this viewer
        backchannel_.release(peer_id);
        return SessionError();
    }

    MediaTrackPtr track = peer->outboundAudio();
    SessionError error = renegotiation_.removeOutboundAudio(peer_id);
    if (track) {
        track->stop();
    }
    return error;
}

void SessionManager::notifyUserInteraction() {
    backchannel_.notifyUserInteraction();
}

SessionError SessionManager::restartIce(const std::string& peer_id) {
    return renegotiation_.restartIce(peer_id);
}

// ==================== Data channel ====================

bool SessionManager::sendDataMessage(const std::string& peer_id, const Json::Value& message) {
    PeerConnectionPtr peer = registry_.lookup(peer_id);
    if (!peer || !peer->dataChannel() || !peer->dataChannel()->isOpen()) {
        LOG_VAR("DATA-WARN", "No open data channel for ", peer_id);
        return false;
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return peer->dataChannel()->send(Json::writeString(builder, message));
}

size_t SessionManager::broadcastDataMessage(const Json::Value& message) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::string text = Json::writeString(builder, message);

    size_t sent = 0;
    registry_.forEach([&text, &sent](const PeerConnectionPtr& peer) {
        const NativeDataChannelPtr& channel = peer->dataChannel();
        if (channel && channel->isOpen() && channel->send(text)) {
            sent++;
        }
    });
    return sent;
}

// ==================== Accessors ====================

SignalingState SessionManager::signalingState(const std::string& peer_id) const {
    PeerConnectionPtr peer = registry_.lookup(peer_id);
    return peer ? peer->signalingState() : SignalingState::Closed;
}

ConnectionState SessionManager::connectionState(const std::string& peer_id) const {
    PeerConnectionPtr peer = registry_.lookup(peer_id);
    return peer ? peer->connectionState() : ConnectionState::Closed;
}
