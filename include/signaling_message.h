#ifndef SIGNALING_MESSAGE_H
#define SIGNALING_MESSAGE_H

#include "media_types.h"
#include "session_error.h"

#include <json/json.h>
#include <string>

enum class SignalingMessageType {
    Offer,
    Answer,
    IceCandidate,
    RenegotiationOffer
};

const char* signalingMessageTypeName(SignalingMessageType type);
bool parseSignalingMessageType(const std::string& name, SignalingMessageType* type);

// Offer/answer/candidate exchanged with a remote peer through the relay
struct SignalingMessage {
    SignalingMessageType type = SignalingMessageType::Offer;
    std::string stream_id;
    std::string from;
    std::string to;
    std::string sdp;            // offer, answer, renegotiation-offer
    IceCandidate candidate;     // ice-candidate

    bool isOffer() const {
        return type == SignalingMessageType::Offer || type == SignalingMessageType::RenegotiationOffer;
    }
};

Json::Value signalingMessageToJson(const SignalingMessage& message);
std::string encodeSignalingMessage(const SignalingMessage& message);

// InvalidMessage on a missing field, wrong field type or unknown type
SessionError signalingMessageFromJson(const Json::Value& root, SignalingMessage* message);
SessionError decodeSignalingMessage(const std::string& text, SignalingMessage* message);

// Relay control traffic wrapped around the peer messages
enum class RelayEvent {
    PeerMessage,    // offer/answer/candidate for the session
    ViewerJoined,
    ViewerLeft,
    Error           // relay rejected something we sent
};

struct RelayMessage {
    RelayEvent event = RelayEvent::PeerMessage;
    std::string viewer_id;      // viewer-joined, viewer-left
    std::string error;          // error
    SignalingMessage message;   // peer message
};

Json::Value registrationMessage(const std::string& role, const std::string& stream_id,
                                const std::string& client_id);

// InvalidMessage for malformed JSON, unknown types and bad peer messages
SessionError parseRelayMessage(const std::string& text, RelayMessage* relay);

// Outbound port to whatever carries signaling messages. Delivery is
// at-least-once at best; callers never assume a message arrived.
class SignalingAdapter {
public:
    virtual ~SignalingAdapter() = default;

    virtual void send(const SignalingMessage& message) = 0;
};

#endif // SIGNALING_MESSAGE_H
