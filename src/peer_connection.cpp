#include "peer_connection.h"
#include "log.h"

PeerConnection::PeerConnection(const std::string& peer_id, PeerRole role,
                               std::unique_ptr<NativePeerConnection> native)
    : peer_id_(peer_id)
    , role_(role)
    , native_(std::move(native))
    , signaling_state_(SignalingState::Stable)
    , connection_state_(ConnectionState::New)
    , operation_pending_(false)
    , remote_description_set_(false)
    , closed_(false)
    , candidates_(peer_id)
    , created_at_(std::chrono::steady_clock::now()) {
    LOG("PEER", "PeerConnection created: " << peer_id_ << " (" << peerRoleName(role_) << ")");
}

PeerConnection::~PeerConnection() {
    close();
}

bool PeerConnection::applySignalingEvent(SignalingEvent event) {
    SignalingState next;
    if (!nextSignalingState(signaling_state_, event, &next)) {
        LOG("SIGNALING-WARN", peer_id_ << " dropping " << signalingEventName(event)
            << " in state " << signalingStateName(signaling_state_));
        return false;
    }
    if (next != signaling_state_) {
        LOG("SIGNALING", peer_id_ << " signaling state: " << signalingStateName(signaling_state_)
            << " -> " << signalingStateName(next));
    }
    signaling_state_ = next;
    return true;
}

bool PeerConnection::acceptsSignalingEvent(SignalingEvent event) const {
    return isSignalingEventAllowed(signaling_state_, event);
}

NativeTransceiverPtr PeerConnection::findSender(MediaKind kind) const {
    if (!native_) {
        return nullptr;
    }
    for (const auto& transceiver : native_->transceivers()) {
        if (transceiver->kind() == kind && transceiver->senderTrack()) {
            return transceiver;
        }
    }
    return nullptr;
}

void PeerConnection::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    LOG_VAR("PEER", "Closing peer connection: ", peer_id_);

    // Timers first so nothing polls a half-closed connection
    health_.poll_timer.reset();
    health_.connect_timer.reset();
    health_.zero_polls.clear();
    health_.last_bytes.clear();
    health_.stalled.clear();

    candidates_.clear();

    if (data_channel_) {
        data_channel_->close();
        data_channel_.reset();
    }

    if (native_) {
        // No callback for this peer may fire after close
        native_->clearObserver();
        native_->close();
        native_.reset();
    }

    outbound_audio_.reset();
    std::vector<std::function<void(const SessionError&)>> waiters;
    waiters.swap(renegotiation_.waiters);
    renegotiation_ = RenegotiationRecord();
    operation_pending_ = false;
    signaling_state_ = SignalingState::Closed;
    connection_state_ = ConnectionState::Closed;

    for (const auto& waiter : waiters) {
        waiter(SessionError(ErrorCode::ConnectionFailed, "connection to " + peer_id_ + " closed"));
    }
}
