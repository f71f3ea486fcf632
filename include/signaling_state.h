#ifndef SIGNALING_STATE_H
#define SIGNALING_STATE_H

#include "media_types.h"

// Events that move a connection's signaling state
enum class SignalingEvent {
    LocalOfferSet,     // local offer created and set
    RemoteAnswerSet,   // remote answer applied
    RemoteOfferSet,    // remote offer applied (also a renegotiation offer)
    LocalAnswerSet,    // local answer created and set
    Close
};

const char* signalingEventName(SignalingEvent event);

// Edges:
//   stable            --LocalOfferSet-->   have-local-offer
//   have-local-offer  --LocalOfferSet-->   have-local-offer   (fresh offer replaces an unanswered one)
//   have-local-offer  --RemoteAnswerSet--> stable
//   stable            --RemoteOfferSet-->  have-remote-offer
//   have-remote-offer --RemoteOfferSet-->  have-remote-offer
//   have-remote-offer --LocalAnswerSet-->  stable
//   any non-closed    --Close-->           closed
// Returns false (and leaves *next untouched) for every other pair.
bool nextSignalingState(SignalingState current, SignalingEvent event, SignalingState* next);

inline bool isSignalingEventAllowed(SignalingState current, SignalingEvent event) {
    SignalingState ignored;
    return nextSignalingState(current, event, &ignored);
}

#endif // SIGNALING_STATE_H
