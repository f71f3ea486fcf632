#include "session_error.h"

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "ok";
        case ErrorCode::PermissionDenied: return "permission-denied";
        case ErrorCode::DeviceNotFound: return "device-not-found";
        case ErrorCode::DeviceBusy: return "device-busy";
        case ErrorCode::Overconstrained: return "overconstrained";
        case ErrorCode::SignalingStateViolation: return "signaling-state-violation";
        case ErrorCode::IceApplyError: return "ice-apply-error";
        case ErrorCode::RenegotiationConflict: return "renegotiation-conflict";
        case ErrorCode::ConnectionFailed: return "connection-failed";
        case ErrorCode::StatsUnavailable: return "stats-unavailable";
        case ErrorCode::DuplicatePeer: return "duplicate-peer";
        case ErrorCode::PeerNotFound: return "peer-not-found";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::InvalidMessage: return "invalid-message";
        case ErrorCode::PlaybackBlocked: return "playback-blocked";
        case ErrorCode::PlaybackFailed: return "playback-failed";
        case ErrorCode::Internal: return "internal";
    }
    return "unknown";
}

bool isMediaAcquisitionError(ErrorCode code) {
    return code == ErrorCode::PermissionDenied ||
           code == ErrorCode::DeviceNotFound ||
           code == ErrorCode::DeviceBusy ||
           code == ErrorCode::Overconstrained;
}

std::string SessionError::describe() const {
    if (message.empty()) {
        return errorCodeName(code);
    }
    return std::string(errorCodeName(code)) + ": " + message;
}
