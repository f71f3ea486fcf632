#include "signaling_state.h"

const char* signalingEventName(SignalingEvent event) {
    switch (event) {
        case SignalingEvent::LocalOfferSet: return "local-offer";
        case SignalingEvent::RemoteAnswerSet: return "remote-answer";
        case SignalingEvent::RemoteOfferSet: return "remote-offer";
        case SignalingEvent::LocalAnswerSet: return "local-answer";
        case SignalingEvent::Close: return "close";
    }
    return "unknown";
}

bool nextSignalingState(SignalingState current, SignalingEvent event, SignalingState* next) {
    if (current == SignalingState::Closed) {
        return false;
    }

    switch (event) {
        case SignalingEvent::LocalOfferSet:
            if (current == SignalingState::Stable || current == SignalingState::HaveLocalOffer) {
                *next = SignalingState::HaveLocalOffer;
                return true;
            }
            return false;
        case SignalingEvent::RemoteAnswerSet:
            if (current == SignalingState::HaveLocalOffer) {
                *next = SignalingState::Stable;
                return true;
            }
            return false;
        case SignalingEvent::RemoteOfferSet:
            if (current == SignalingState::Stable || current == SignalingState::HaveRemoteOffer) {
                *next = SignalingState::HaveRemoteOffer;
                return true;
            }
            return false;
        case SignalingEvent::LocalAnswerSet:
            if (current == SignalingState::HaveRemoteOffer) {
                *next = SignalingState::Stable;
                return true;
            }
            return false;
        case SignalingEvent::Close:
            *next = SignalingState::Closed;
            return true;
    }
    return false;
}
