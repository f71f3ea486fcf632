#include "signaling_state.h"

#include <gtest/gtest.h>

namespace {

struct Edge {
    SignalingState from;
    SignalingEvent event;
    SignalingState to;
};

TEST(SignalingStateTest, DefinedEdges) {
    const Edge edges[] = {
        {SignalingState::Stable, SignalingEvent::LocalOfferSet, SignalingState::HaveLocalOffer},
        {SignalingState::HaveLocalOffer, SignalingEvent::LocalOfferSet, SignalingState::HaveLocalOffer},
        {SignalingState::HaveLocalOffer, SignalingEvent::RemoteAnswerSet, SignalingState::Stable},
        {SignalingState::Stable, SignalingEvent::RemoteOfferSet, SignalingState::HaveRemoteOffer},
        {SignalingState::HaveRemoteOffer, SignalingEvent::RemoteOfferSet, SignalingState::HaveRemoteOffer},
        {SignalingState::HaveRemoteOffer, SignalingEvent::LocalAnswerSet, SignalingState::Stable},
        {SignalingState::Stable, SignalingEvent::Close, SignalingState::Closed},
        {SignalingState::HaveLocalOffer, SignalingEvent::Close, SignalingState::Closed},
        {SignalingState::HaveRemoteOffer, SignalingEvent::Close, SignalingState::Closed},
    };

    for (const Edge& edge : edges) {
        SignalingState next = SignalingState::Stable;
        EXPECT_TRUE(nextSignalingState(edge.from, edge.event, &next))
            << signalingStateName(edge.from) << " + " << signalingEventName(edge.event);
        EXPECT_EQ(edge.to, next);
    }
}

TEST(SignalingStateTest, AnswerInStableIsRejected) {
    SignalingState next = SignalingState::HaveRemoteOffer;
    EXPECT_FALSE(nextSignalingState(SignalingState::Stable, SignalingEvent::RemoteAnswerSet, &next));
    EXPECT_EQ(SignalingState::HaveRemoteOffer, next);
}

TEST(SignalingStateTest, GlareOfferIsRejected) {
    EXPECT_FALSE(isSignalingEventAllowed(SignalingState::HaveLocalOffer, SignalingEvent::RemoteOfferSet));
    EXPECT_FALSE(isSignalingEventAllowed(SignalingState::HaveRemoteOffer, SignalingEvent::LocalOfferSet));
    EXPECT_FALSE(isSignalingEventAllowed(SignalingState::Stable, SignalingEvent::LocalAnswerSet));
}

TEST(SignalingStateTest, ClosedIsTerminal) {
    const SignalingEvent events[] = {
        SignalingEvent::LocalOfferSet, SignalingEvent::RemoteAnswerSet, SignalingEvent::RemoteOfferSet,
        SignalingEvent::LocalAnswerSet, SignalingEvent::Close,
    };
    for (SignalingEvent event : events) {
        EXPECT_FALSE(isSignalingEventAllowed(SignalingState::Closed, event)) << signalingEventName(event);
    }
}

}  // namespace
