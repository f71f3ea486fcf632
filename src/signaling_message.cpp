#include "signaling_message.h"

#include <sstream>

const char* signalingMessageTypeName(SignalingMessageType type) {
    switch (type) {
        case SignalingMessageType::Offer: return "offer";
        case SignalingMessageType::Answer: return "answer";
        case SignalingMessageType::IceCandidate: return "ice-candidate";
        case SignalingMessageType::RenegotiationOffer: return "renegotiation-offer";
    }
    return "unknown";
}

bool parseSignalingMessageType(const std::string& name, SignalingMessageType* type) {
    if (name == "offer") {
        *type = SignalingMessageType::Offer;
    } else if (name == "answer") {
        *type = SignalingMessageType::Answer;
    } else if (name == "ice-candidate") {
        *type = SignalingMessageType::IceCandidate;
    } else if (name == "renegotiation-offer") {
        *type = SignalingMessageType::RenegotiationOffer;
    } else {
        return false;
    }
    return true;
}

Json::Value signalingMessageToJson(const SignalingMessage& message) {
    Json::Value msg;
    msg["type"] = signalingMessageTypeName(message.type);
    msg["stream_id"] = message.stream_id;
    msg["from"] = message.from;
    msg["to"] = message.to;

    if (message.type == SignalingMessageType::IceCandidate) {
        Json::Value candidate;
        candidate["candidate"] = message.candidate.candidate;
        candidate["sdp_mid"] = message.candidate.sdp_mid;
        candidate["sdp_mline_index"] = message.candidate.sdp_mline_index;
        msg["candidate"] = candidate;
    } else {
        msg["sdp"] = message.sdp;
    }
    return msg;
}

std::string encodeSignalingMessage(const SignalingMessage& message) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, signalingMessageToJson(message));
}

namespace {

SessionError invalid(const std::string& what) {
    return SessionError(ErrorCode::InvalidMessage, what);
}

// Optional string field; present but non-string is an error
bool readString(const Json::Value& root, const char* key, std::string* out) {
    if (!root.isMember(key) || root[key].isNull()) {
        out->clear();
        return true;
    }
    if (!root[key].isString()) {
        return false;
    }
    *out = root[key].asString();
    return true;
}

} // namespace

SessionError signalingMessageFromJson(const Json::Value& root, SignalingMessage* message) {
    if (!root.isObject()) {
        return invalid("message is not a JSON object");
    }
    if (!root["type"].isString()) {
        return invalid("missing message type");
    }

    SignalingMessage parsed;
    if (!parseSignalingMessageType(root["type"].asString(), &parsed.type)) {
        return invalid("unknown message type: " + root["type"].asString());
    }

    if (!readString(root, "stream_id", &parsed.stream_id) ||
        !readString(root, "from", &parsed.from) ||
        !readString(root, "to", &parsed.to)) {
        return invalid("stream_id, from and to must be strings");
    }
    if (parsed.from.empty()) {
        return invalid(std::string(signalingMessageTypeName(parsed.type)) + " without sender");
    }

    if (parsed.type == SignalingMessageType::IceCandidate) {
        const Json::Value& candidate = root["candidate"];
        if (!candidate.isObject()) {
            return invalid("ice-candidate without candidate object");
        }
        if (!candidate["candidate"].isString()) {
            return invalid("candidate.candidate must be a string");
        }
        parsed.candidate.candidate = candidate["candidate"].asString();
        if (!readString(candidate, "sdp_mid", &parsed.candidate.sdp_mid)) {
            return invalid("candidate.sdp_mid must be a string");
        }
        if (candidate.isMember("sdp_mline_index") && !candidate["sdp_mline_index"].isNull()) {
            if (!candidate["sdp_mline_index"].isInt()) {
                return invalid("candidate.sdp_mline_index must be an integer");
            }
            parsed.candidate.sdp_mline_index = candidate["sdp_mline_index"].asInt();
        }
    } else {
        if (!root["sdp"].isString() || root["sdp"].asString().empty()) {
            return invalid(std::string(signalingMessageTypeName(parsed.type)) + " without sdp");
        }
        parsed.sdp = root["sdp"].asString();
    }

    *message = parsed;
    return SessionError();
}

SessionError decodeSignalingMessage(const std::string& text, SignalingMessage* message) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::istringstream stream(text);
    std::string errs;

    if (!Json::parseFromStream(builder, stream, &root, &errs)) {
        return invalid("malformed JSON: " + errs);
    }
    return signalingMessageFromJson(root, message);
}

Json::Value registrationMessage(const std::string& role, const std::string& stream_id,
                                const std::string& client_id) {
    Json::Value msg;
    msg["type"] = "register";
    msg["role"] = role;
    msg["stream_id"] = stream_id;
    if (!client_id.empty()) {
        msg["client_id"] = client_id;
    }
    return msg;
}

SessionError parseRelayMessage(const std::string& text, RelayMessage* relay) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::istringstream stream(text);
    std::string errs;

    if (!Json::parseFromStream(builder, stream, &root, &errs)) {
        return invalid("malformed JSON: " + errs);
    }
    if (!root.isObject() || !root["type"].isString()) {
        return invalid("missing message type");
    }

    RelayMessage parsed;
    std::string type = root["type"].asString();

    if (type == "viewer-joined" || type == "viewer-left") {
        if (!root["viewer_id"].isString() || root["viewer_id"].asString().empty()) {
            return invalid(type + " without viewer_id");
        }
        parsed.event = type == "viewer-joined" ? RelayEvent::ViewerJoined : RelayEvent::ViewerLeft;
        parsed.viewer_id = root["viewer_id"].asString();
    } else if (type == "error") {
        parsed.event = RelayEvent::Error;
        parsed.error = root["message"].isString() ? root["message"].asString() : "unspecified";
    } else {
        SessionError error = signalingMessageFromJson(root, &parsed.message);
        if (error) {
            return error;
        }
        parsed.event = RelayEvent::PeerMessage;
    }

    *relay = parsed;
    return SessionError();
}
