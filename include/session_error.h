#ifndef SESSION_ERROR_H
#define SESSION_ERROR_H

#include <string>

// Error taxonomy shared by every component of the session core.
enum class ErrorCode {
    Ok,
    // media-acquisition-error
    PermissionDenied,
    DeviceNotFound,
    DeviceBusy,
    Overconstrained,
    // signaling / connection
    SignalingStateViolation,
    IceApplyError,
    RenegotiationConflict,
    ConnectionFailed,
    StatsUnavailable,
    // session bookkeeping
    DuplicatePeer,
    PeerNotFound,
    Cancelled,
    InvalidMessage,
    PlaybackBlocked,
    PlaybackFailed,
    Internal
};

const char* errorCodeName(ErrorCode code);

bool isMediaAcquisitionError(ErrorCode code);

struct SessionError {
    ErrorCode code = ErrorCode::Ok;
    std::string message;

    SessionError() = default;
    SessionError(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool ok() const { return code == ErrorCode::Ok; }
    explicit operator bool() const { return !ok(); }

    std::string describe() const;
};

#endif // SESSION_ERROR_H
