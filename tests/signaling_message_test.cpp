#include "signaling_message.h"

#include <gtest/gtest.h>

namespace {

TEST(SignalingMessageTest, OfferRoundTripsThroughJson) {
    SignalingMessage offer;
    offer.type = SignalingMessageType::RenegotiationOffer;
    offer.stream_id = "stream-1";
    offer.from = "viewer-1";
    offer.to = "broadcaster";
    offer.sdp = "v=0\r\n";

    Json::Value json = signalingMessageToJson(offer);
    EXPECT_EQ("renegotiation-offer", json["type"].asString());
    EXPECT_EQ("v=0\r\n", json["sdp"].asString());
    EXPECT_FALSE(json.isMember("candidate"));

    SignalingMessage decoded;
    ASSERT_FALSE(decodeSignalingMessage(encodeSignalingMessage(offer), &decoded));
    EXPECT_EQ(SignalingMessageType::RenegotiationOffer, decoded.type);
    EXPECT_TRUE(decoded.isOffer());
    EXPECT_EQ("stream-1", decoded.stream_id);
    EXPECT_EQ("viewer-1", decoded.from);
    EXPECT_EQ("broadcaster", decoded.to);
    EXPECT_EQ("v=0\r\n", decoded.sdp);
}

TEST(SignalingMessageTest, CandidateUsesNestedObject) {
    SignalingMessage message;
    message.type = SignalingMessageType::IceCandidate;
    message.from = "broadcaster";
    message.candidate.candidate = "candidate:1 1 UDP 2122 192.168.1.2 50000 typ host";
    message.candidate.sdp_mid = "0";
    message.candidate.sdp_mline_index = 1;

    Json::Value json = signalingMessageToJson(message);
    EXPECT_EQ("ice-candidate", json["type"].asString());
    EXPECT_EQ(1, json["candidate"]["sdp_mline_index"].asInt());
    EXPECT_EQ("0", json["candidate"]["sdp_mid"].asString());
    EXPECT_FALSE(json.isMember("sdp"));

    SignalingMessage decoded;
    ASSERT_FALSE(signalingMessageFromJson(json, &decoded));
    EXPECT_EQ(message.candidate.fingerprint(), decoded.candidate.fingerprint());
}

TEST(SignalingMessageTest, DecodeAcceptsCandidateWithoutMid) {
    SignalingMessage decoded;
    SessionError error = decodeSignalingMessage(
        R"({"type":"ice-candidate","from":"b","candidate":{"candidate":"candidate:1 1 UDP 1 1.2.3.4 9 typ host","sdp_mline_index":0}})",
        &decoded);
    ASSERT_FALSE(error) << error.describe();
    EXPECT_EQ("", decoded.candidate.sdp_mid);
    EXPECT_EQ(0, decoded.candidate.sdp_mline_index);
}

TEST(SignalingMessageTest, RejectsMalformedMessages) {
    const char* bad[] = {
        "not json",
        R"([1,2,3])",
        R"({"from":"b","sdp":"v=0"})",
        R"({"type":"bogus","from":"b","sdp":"v=0"})",
        R"({"type":"offer","sdp":"v=0"})",
        R"({"type":"offer","from":"b"})",
        R"({"type":"answer","from":"b","sdp":""})",
        R"({"type":"offer","from":7,"sdp":"v=0"})",
        R"({"type":"ice-candidate","from":"b"})",
        R"({"type":"ice-candidate","from":"b","candidate":{"sdp_mline_index":0}})",
        R"({"type":"ice-candidate","from":"b","candidate":{"candidate":"c","sdp_mline_index":"0"}})",
    };

    for (const char* text : bad) {
        SignalingMessage decoded;
        SessionError error = decodeSignalingMessage(text, &decoded);
        EXPECT_EQ(ErrorCode::InvalidMessage, error.code) << text;
    }
}

TEST(SignalingMessageTest, RegistrationOmitsEmptyClientId) {
    Json::Value viewer = registrationMessage("viewer", "stream-1", "");
    EXPECT_EQ("register", viewer["type"].asString());
    EXPECT_EQ("viewer", viewer["role"].asString());
    EXPECT_EQ("stream-1", viewer["stream_id"].asString());
    EXPECT_FALSE(viewer.isMember("client_id"));

    Json::Value broadcaster = registrationMessage("broadcaster", "stream-1", "cam-7");
    EXPECT_EQ("cam-7", broadcaster["client_id"].asString());
}

TEST(SignalingMessageTest, RelayControlMessages) {
    RelayMessage relay;
    ASSERT_FALSE(parseRelayMessage(R"({"type":"viewer-joined","viewer_id":"v1"})", &relay));
    EXPECT_EQ(RelayEvent::ViewerJoined, relay.event);
    EXPECT_EQ("v1", relay.viewer_id);

    ASSERT_FALSE(parseRelayMessage(R"({"type":"viewer-left","viewer_id":"v1"})", &relay));
    EXPECT_EQ(RelayEvent::ViewerLeft, relay.event);

    ASSERT_FALSE(parseRelayMessage(R"({"type":"error","message":"stream taken"})", &relay));
    EXPECT_EQ(RelayEvent::Error, relay.event);
    EXPECT_EQ("stream taken", relay.error);

    ASSERT_FALSE(parseRelayMessage(R"({"type":"error"})", &relay));
    EXPECT_EQ("unspecified", relay.error);
}

TEST(SignalingMessageTest, RelayPeerMessage) {
    RelayMessage relay;
    ASSERT_FALSE(parseRelayMessage(
        R"({"type":"answer","stream_id":"s","from":"v1","to":"b","sdp":"v=0"})", &relay));
    EXPECT_EQ(RelayEvent::PeerMessage, relay.event);
    EXPECT_EQ(SignalingMessageType::Answer, relay.message.type);
    EXPECT_EQ("v1", relay.message.from);
}

TEST(SignalingMessageTest, RelayRejectsBadInput) {
    RelayMessage relay;
    EXPECT_EQ(ErrorCode::InvalidMessage, parseRelayMessage("{", &relay).code);
    EXPECT_EQ(ErrorCode::InvalidMessage, parseRelayMessage(R"({"viewer_id":"v1"})", &relay).code);
    EXPECT_EQ(ErrorCode::InvalidMessage, parseRelayMessage(R"({"type":"viewer-joined"})", &relay).code);
    EXPECT_EQ(ErrorCode::InvalidMessage, parseRelayMessage(R"({"type":"viewer-left","viewer_id":""})", &relay).code);
    EXPECT_EQ(ErrorCode::InvalidMessage, parseRelayMessage(R"({"type":"welcome"})", &relay).code);
}

}  // namespace
