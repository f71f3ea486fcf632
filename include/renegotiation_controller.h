#ifndef RENEGOTIATION_CONTROLLER_H
#define RENEGOTIATION_CONTROLLER_H

#include "media_track.h"
#include "peer_connection_registry.h"
#include "session_config.h"
#include "session_error.h"
#include "signaling_message.h"

#include <functional>
#include <string>
#include <vector>

// Drives offer/answer cycles on connections that are already up. Only track
// add/remove needs one; enable toggles and track swaps never do.
//
// At most one offer per peer is in flight. Requests made meanwhile (or while
// the peer is answering a remote offer) collapse into a single follow-up that
// is only sent if the desired outbound-audio state differs from what the
// in-flight offer carried.
class RenegotiationController {
public:
    using CompletionCallback = std::function<void(const SessionError&)>;

    RenegotiationController(PeerConnectionRegistry& registry, SignalingAdapter& signaling,
                            const SessionConfig& config);

    // First offer on a fresh initiator connection
    SessionError startNegotiation(const std::string& peer_id);

    // Reuses an audio transceiver whose sender is empty, otherwise adds a track.
    // Either way a renegotiation follows. An immediate failure is returned and
    // the callback is not run; otherwise the callback fires once the offer
    // carrying the track has been sent, or with the error once it cannot be.
    SessionError addOutboundAudio(const std::string& peer_id, const MediaTrackPtr& track,
                                  CompletionCallback callback = nullptr);

    // Detach the outbound audio sender (transceiver kept) and renegotiate
    SessionError removeOutboundAudio(const std::string& peer_id);

    // Detach the outbound audio sender without renegotiating
    SessionError detachOutboundAudio(const std::string& peer_id);

    SessionError renegotiate(const std::string& peer_id, CompletionCallback callback = nullptr);

    // Renegotiation whose offer asks for fresh ICE credentials
    SessionError restartIce(const std::string& peer_id);

    // Peer is back in stable: the answer to our offer was applied, or our
    // answer to a remote offer was set. Sends any deferred follow-up.
    void onNegotiationComplete(const std::string& peer_id);

    // The answer to our outstanding offer could not be applied. The peer is
    // left in have-local-offer; a fresh offer is sent once.
    void onRemoteAnswerFailed(const std::string& peer_id, const SessionError& error);

private:
    using Waiters = std::vector<CompletionCallback>;

    PeerConnectionPtr lookupOpen(const std::string& peer_id, const char* operation, SessionError* error) const;
    bool canOfferNow(PeerConnection& peer) const;
    void createAndSendOffer(const PeerConnectionPtr& peer, SignalingMessageType type);

    // A failed offer gets one retry when a change is still outstanding;
    // after that its waiters are failed and the request is dropped
    void abortOffer(const PeerConnectionPtr& peer, SignalingMessageType type, bool ice_restart,
                    Waiters waiters, const SessionError& error);
    static void notify(Waiters& waiters, const SessionError& result);

    PeerConnectionRegistry& registry_;
    SignalingAdapter& signaling_;
    const SessionConfig& config_;
};

#endif // RENEGOTIATION_CONTROLLER_H
