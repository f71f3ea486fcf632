#ifndef PEER_CONNECTION_H
#define PEER_CONNECTION_H

#include "event_loop.h"
#include "ice_candidate_queue.h"
#include "media_backend.h"
#include "media_types.h"
#include "signaling_state.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

// Renegotiation bookkeeping for one connection
struct RenegotiationRecord {
    bool in_flight = false;          // offer sent, answer not yet applied
    bool requested = false;          // another cycle wanted once the current one ends
    bool ice_restart = false;        // next offer requests an ICE restart
    bool negotiated_audio = false;   // outbound audio carried by the last offer sent
    bool retried = false;            // the pending change already had its one retry
    int offers_sent = 0;

    // Callers waiting for the next offer to go out (or fail for good)
    std::vector<std::function<void(const SessionError&)>> waiters;
};

// Stats polling bookkeeping for one connection
struct HealthRecord {
    ScopedTimer poll_timer;
    ScopedTimer connect_timer;
    bool poll_in_flight = false;
    int polls = 0;
    std::map<MediaKind, int> zero_polls;
    std::map<MediaKind, uint64_t> last_bytes;   // inbound bytes at the previous poll
    std::set<MediaKind> stalled;
};

// One bidirectional media session with a single remote endpoint.
class PeerConnection {
public:
    PeerConnection(const std::string& peer_id, PeerRole role,
                   std::unique_ptr<NativePeerConnection> native);
    ~PeerConnection();

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;

    const std::string& peerId() const { return peer_id_; }
    PeerRole role() const { return role_; }
    std::chrono::steady_clock::time_point createdAt() const { return created_at_; }

    // Null once the connection is closed
    NativePeerConnection* native() const { return native_.get(); }

    SignalingState signalingState() const { return signaling_state_; }
    ConnectionState connectionState() const { return connection_state_; }
    void setConnectionState(ConnectionState state) { connection_state_ = state; }

    // Move along a defined edge; logs and returns false otherwise
    bool applySignalingEvent(SignalingEvent event);
    bool acceptsSignalingEvent(SignalingEvent event) const;

    // One offer/answer/description operation at a time
    bool operationPending() const { return operation_pending_; }
    void setOperationPending(bool pending) { operation_pending_ = pending; }

    bool remoteDescriptionSet() const { return remote_description_set_; }
    void markRemoteDescriptionSet() { remote_description_set_ = true; }

    IceCandidateQueue& candidates() { return candidates_; }
    const IceCandidateQueue& candidates() const { return candidates_; }

    const NativeDataChannelPtr& dataChannel() const { return data_channel_; }
    void setDataChannel(const NativeDataChannelPtr& channel) { data_channel_ = channel; }

    void addRemoteKind(MediaKind kind) { remote_kinds_.insert(kind); }
    const std::set<MediaKind>& remoteKinds() const { return remote_kinds_; }

    // Viewer side: microphone track sent back to the broadcaster
    const MediaTrackPtr& outboundAudio() const { return outbound_audio_; }
    void setOutboundAudio(const MediaTrackPtr& track) { outbound_audio_ = track; }

    // Audio transceiver currently carrying a sender track, if any
    NativeTransceiverPtr findSender(MediaKind kind) const;

    RenegotiationRecord& renegotiation() { return renegotiation_; }
    HealthRecord& health() { return health_; }

    bool isClosed() const { return closed_; }

    // Close the native connection and drop every piece of per-peer state:
    // timers, candidate queue and dedupe set, data channel. Idempotent.
    void close();

private:
    std::string peer_id_;
    PeerRole role_;
    std::unique_ptr<NativePeerConnection> native_;
    SignalingState signaling_state_;
    ConnectionState connection_state_;
    bool operation_pending_;
    bool remote_description_set_;
    bool closed_;
    IceCandidateQueue candidates_;
    NativeDataChannelPtr data_channel_;
    std::set<MediaKind> remote_kinds_;
    MediaTrackPtr outbound_audio_;
    RenegotiationRecord renegotiation_;
    HealthRecord health_;
    std::chrono::steady_clock::time_point created_at_;
};

using PeerConnectionPtr = std::shared_ptr<PeerConnection>;
using PeerConnectionWeakPtr = std::weak_ptr<PeerConnection>;

#endif // PEER_CONNECTION_H
