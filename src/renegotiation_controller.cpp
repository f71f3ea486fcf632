#include "renegotiation_controller.h"
#include "log.h"

RenegotiationController::RenegotiationController(PeerConnectionRegistry& registry,
                                                 SignalingAdapter& signaling,
                                                 const SessionConfig& config)
    : registry_(registry)
    , signaling_(signaling)
    , config_(config) {
}

PeerConnectionPtr RenegotiationController::lookupOpen(const std::string& peer_id, const char* operation,
                                                      SessionError* error) const {
    PeerConnectionPtr peer = registry_.lookup(peer_id);
    if (!peer || peer->isClosed() || !peer->native()) {
        *error = SessionError(ErrorCode::RenegotiationConflict,
                              std::string(operation) + " on unknown or closed peer " + peer_id);
        LOG("RENEGOTIATE-ERROR", error->message);
        return nullptr;
    }
    return peer;
}

bool RenegotiationController::canOfferNow(PeerConnection& peer) const {
    // have-local-offer without an offer in flight: the answer was rejected
    // and a fresh offer may replace the old one
    return !peer.renegotiation().in_flight &&
           !peer.operationPending() &&
           (peer.signalingState() == SignalingState::Stable ||
            peer.signalingState() == SignalingState::HaveLocalOffer);
}

SessionError RenegotiationController::startNegotiation(const std::string& peer_id) {
    SessionError error;
    PeerConnectionPtr peer = lookupOpen(peer_id, "negotiate", &error);
    if (!peer) {
        return error;
    }
    if (!canOfferNow(*peer)) {
        return SessionError(ErrorCode::SignalingStateViolation,
                            "cannot offer to " + peer_id + " in state " +
                            signalingStateName(peer->signalingState()));
    }
    createAndSendOffer(peer, SignalingMessageType::Offer);
    return SessionError();
}

SessionError RenegotiationController::addOutboundAudio(const std::string& peer_id, const MediaTrackPtr& track,
                                                       CompletionCallback callback) {
    SessionError error;
    PeerConnectionPtr peer = lookupOpen(peer_id, "addOutboundAudio", &error);
    if (!peer) {
        return error;
    }
    if (!track || track->kind() != MediaKind::Audio) {
        return SessionError(ErrorCode::Internal, "addOutboundAudio needs an audio track");
    }
    if (peer->outboundAudio() == track) {
        LOG_VAR("RENEGOTIATE", "Outbound audio already attached for ", peer_id);
        if (callback) callback(SessionError());
        return SessionError();
    }

    NativePeerConnection* native = peer->native();
    NativeTransceiverPtr reusable;
    for (const auto& transceiver : native->transceivers()) {
        if (transceiver->kind() == MediaKind::Audio && !transceiver->senderTrack()) {
            reusable = transceiver;
            break;
        }
    }

    if (reusable) {
        reusable->setDirection(TransceiverDirection::SendRecv);
        error = reusable->replaceSenderTrack(track);
        if (error) {
            LOG("RENEGOTIATE-ERROR", peer_id << " could not reuse audio transceiver: " << error.describe());
            return error;
        }
        LOG_VAR("RENEGOTIATE", "Reusing existing audio transceiver for ", peer_id);
    } else {
        if (!native->addTrack(track)) {
            return SessionError(ErrorCode::Internal, "media stack refused audio track for " + peer_id);
        }
        LOG_VAR("RENEGOTIATE", "Added new audio sender for ", peer_id);
    }

    peer->setOutboundAudio(track);
    return renegotiate(peer_id, callback);
}

SessionError RenegotiationController::detachOutboundAudio(const std::string& peer_id) {
    SessionError error;
    PeerConnectionPtr peer = lookupOpen(peer_id, "detachOutboundAudio", &error);
    if (!peer) {
        return error;
    }
    MediaTrackPtr track = peer->outboundAudio();
    if (!track) {
        return SessionError();
    }

    error = peer->native()->removeTrack(track);
    if (error) {
        LOG("RENEGOTIATE-ERROR", peer_id << " removeTrack failed: " << error.describe());
        return error;
    }
    peer->setOutboundAudio(nullptr);
    return SessionError();
}

SessionError RenegotiationController::removeOutboundAudio(const std::string& peer_id) {
    SessionError error;
    PeerConnectionPtr peer = lookupOpen(peer_id, "removeOutboundAudio", &error);
    if (!peer) {
        return error;
    }
    if (!peer->outboundAudio()) {
        LOG_VAR("RENEGOTIATE", "No outbound audio to remove for ", peer_id);
        return SessionError();
    }

    error = detachOutboundAudio(peer_id);
    if (error) {
        return error;
    }
    return renegotiate(peer_id);
}

SessionError RenegotiationController::renegotiate(const std::string& peer_id, CompletionCallback callback) {
    SessionError error;
    PeerConnectionPtr peer = lookupOpen(peer_id, "renegotiate", &error);
    if (!peer) {
        return error;
    }
    if (callback) {
        peer->renegotiation().waiters.push_back(callback);
    }

    if (!canOfferNow(*peer)) {
        peer->renegotiation().requested = true;
        LOG("RENEGOTIATE", peer_id << " renegotiation deferred (state "
            << signalingStateName(peer->signalingState())
            << (peer->renegotiation().in_flight ? ", offer in flight" : "") << ")");
        return SessionError();
    }

    createAndSendOffer(peer, SignalingMessageType::RenegotiationOffer);
    return SessionError();
}

SessionError RenegotiationController::restartIce(const std::string& peer_id) {
    SessionError error;
    PeerConnectionPtr peer = lookupOpen(peer_id, "restartIce", &error);
    if (!peer) {
        return error;
    }
    LOG_VAR("RENEGOTIATE", "ICE restart requested for ", peer_id);
    peer->renegotiation().ice_restart = true;
    return renegotiate(peer_id);
}

void RenegotiationController::onNegotiationComplete(const std::string& peer_id) {
    PeerConnectionPtr peer = registry_.lookup(peer_id);
    if (!peer || peer->isClosed()) {
        return;
    }

    RenegotiationRecord& record = peer->renegotiation();
    record.in_flight = false;
    if (!record.requested || !canOfferNow(*peer)) {
        return;
    }
    record.requested = false;

    bool desired_audio = peer->outboundAudio() != nullptr;
    if (desired_audio == record.negotiated_audio && !record.ice_restart) {
        LOG_VAR("RENEGOTIATE", "Coalesced request already satisfied for ", peer_id);
        notify(record.waiters, SessionError());
        return;
    }
    createAndSendOffer(peer, SignalingMessageType::RenegotiationOffer);
}

void RenegotiationController::onRemoteAnswerFailed(const std::string& peer_id, const SessionError& error) {
    PeerConnectionPtr peer = registry_.lookup(peer_id);
    if (!peer || peer->isClosed() || !peer->renegotiation().in_flight) {
        return;
    }

    // Nothing the offer carried took effect on the remote side
    peer->renegotiation().requested = true;
    SignalingMessageType type = peer->remoteDescriptionSet() ? SignalingMessageType::RenegotiationOffer
                                                             : SignalingMessageType::Offer;
    abortOffer(peer, type, false, Waiters(), error);
}

void RenegotiationController::abortOffer(const PeerConnectionPtr& peer, SignalingMessageType type,
                                         bool ice_restart, Waiters waiters, const SessionError& error) {
    LOG("RENEGOTIATE-ERROR", peer->peerId() << " " << signalingMessageTypeName(type)
        << " failed: " << error.describe());
    peer->setOperationPending(false);

    RenegotiationRecord& record = peer->renegotiation();
    record.in_flight = false;

    bool desired_audio = peer->outboundAudio() != nullptr;
    bool outstanding = record.requested || ice_restart || desired_audio != record.negotiated_audio;
    if (outstanding && !record.retried) {
        record.retried = true;
        record.ice_restart = record.ice_restart || ice_restart;
        record.waiters.insert(record.waiters.begin(), waiters.begin(), waiters.end());

        if (canOfferNow(*peer)) {
            LOG_VAR("RENEGOTIATE", "Retrying offer for ", peer->peerId());
            createAndSendOffer(peer, type);
        } else {
            record.requested = true;
        }
        return;
    }

    record.retried = false;
    record.requested = false;
    waiters.insert(waiters.end(), record.waiters.begin(), record.waiters.end());
    record.waiters.clear();
    notify(waiters, error);
}

void RenegotiationController::notify(Waiters& waiters, const SessionError& result) {
    Waiters pending;
    pending.swap(waiters);
    for (const auto& waiter : pending) {
        waiter(result);
    }
}

void RenegotiationController::createAndSendOffer(const PeerConnectionPtr& peer, SignalingMessageType type) {
    RenegotiationRecord& record = peer->renegotiation();
    record.in_flight = true;
    record.requested = false;
    bool offer_audio = peer->outboundAudio() != nullptr;

    // Everyone waiting so far is served by this offer
    std::shared_ptr<Waiters> waiters = std::make_shared<Waiters>();
    waiters->swap(record.waiters);

    OfferOptions options;
    options.ice_restart = record.ice_restart;
    record.ice_restart = false;

    peer->setOperationPending(true);
    LOG("RENEGOTIATE", "Creating " << signalingMessageTypeName(type) << " for " << peer->peerId()
        << (options.ice_restart ? " (ice restart)" : ""));

    PeerConnectionWeakPtr weak = peer;
    bool ice_restart = options.ice_restart;
    peer->native()->createOffer(options,
        [this, weak, type, ice_restart, offer_audio, waiters](const SessionError& error,
                                                              const SessionDescription& offer) {
            PeerConnectionPtr peer = weak.lock();
            if (!peer || peer->isClosed()) {
                notify(*waiters, SessionError(ErrorCode::ConnectionFailed, "connection closed before offer"));
                return;
            }
            if (error) {
                abortOffer(peer, type, ice_restart, *waiters, error);
                return;
            }

            peer->native()->setLocalDescription(offer,
                [this, weak, type, ice_restart, offer_audio, waiters, offer](const SessionError& error) {
                    PeerConnectionPtr peer = weak.lock();
                    if (!peer || peer->isClosed()) {
                        notify(*waiters, SessionError(ErrorCode::ConnectionFailed, "connection closed before offer"));
                        return;
                    }
                    if (error) {
                        abortOffer(peer, type, ice_restart, *waiters, error);
                        return;
                    }
                    peer->setOperationPending(false);
                    if (!peer->applySignalingEvent(SignalingEvent::LocalOfferSet)) {
                        abortOffer(peer, type, ice_restart, *waiters,
                                   SessionError(ErrorCode::SignalingStateViolation,
                                                "local offer refused in state " +
                                                std::string(signalingStateName(peer->signalingState()))));
                        return;
                    }

                    RenegotiationRecord& record = peer->renegotiation();
                    record.negotiated_audio = offer_audio;
                    record.retried = false;
                    record.offers_sent++;

                    SignalingMessage message;
                    message.type = type;
                    message.stream_id = config_.stream_id;
                    message.from = config_.local_id;
                    message.to = peer->peerId();
                    message.sdp = offer.sdp;
                    signaling_.send(message);
                    LOG("RENEGOTIATE", "Sent " << signalingMessageTypeName(type) << " to " << peer->peerId());
                    notify(*waiters, SessionError());
                });
        });
}
