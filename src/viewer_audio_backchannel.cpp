#include "viewer_audio_backchannel.h"
#include "log.h"

#include <vector>

ViewerAudioBackchannel::ViewerAudioBackchannel(MediaBackend& backend)
    : backend_(backend) {
}

ViewerAudioBackchannel::~ViewerAudioBackchannel() {
    releaseAll();
}

const ViewerAudioBackchannel::Entry* ViewerAudioBackchannel::entry(const std::string& peer_id) const {
    auto it = entries_.find(peer_id);
    return it == entries_.end() ? nullptr : &it->second;
}

SessionError ViewerAudioBackchannel::attach(const std::string& peer_id, const MediaStreamPtr& stream) {
    if (!stream) {
        return SessionError(ErrorCode::Internal, "no stream for viewer audio " + peer_id);
    }

    auto it = entries_.find(peer_id);
    if (it != entries_.end()) {
        Entry& entry = it->second;
        if (entry.stream == stream && entry.attached) {
            return SessionError();
        }
        LOG_VAR("BACKCHANNEL", "Updating audio source in place for viewer ", peer_id);
        entry.stream = stream;
        entry.sink->setSource(stream);
        return start(peer_id, entry);
    }

    std::unique_ptr<PlaybackSink> sink = backend_.createPlaybackSink(peer_id);
    if (!sink) {
        SessionError error(ErrorCode::PlaybackFailed, "could not create playback sink for " + peer_id);
        reportFailure(peer_id, error);
        return error;
    }

    Entry& entry = entries_[peer_id];
    entry.stream = stream;
    entry.sink = std::move(sink);
    entry.sink->setSource(stream);
    LOG("BACKCHANNEL", "Created playback sink for viewer " << peer_id << ", Total: " << entries_.size());
    return start(peer_id, entry);
}

SessionError ViewerAudioBackchannel::start(const std::string& peer_id, Entry& entry) {
    std::string reason;
    PlaybackStatus status = entry.sink->play(&reason);

    switch (status) {
        case PlaybackStatus::Playing:
            entry.attached = true;
            entry.retry_pending = false;
            LOG_VAR("BACKCHANNEL", "Playing viewer audio: ", peer_id);
            return SessionError();
        case PlaybackStatus::Blocked:
            entry.attached = false;
            entry.retry_pending = true;
            LOG("BACKCHANNEL-WARN", "Playback for " << peer_id
                << " blocked, will retry on next user interaction (" << reason << ")");
            return SessionError(ErrorCode::PlaybackBlocked, reason);
        case PlaybackStatus::Failed:
            break;
    }

    entry.attached = false;
    entry.retry_pending = false;
    SessionError error(ErrorCode::PlaybackFailed, reason.empty() ? "playback failed" : reason);
    reportFailure(peer_id, error);
    return error;
}

void ViewerAudioBackchannel::notifyUserInteraction() {
    std::vector<std::string> blocked;
    for (const auto& pair : entries_) {
        if (pair.second.retry_pending) {
            blocked.push_back(pair.first);
        }
    }

    for (const auto& peer_id : blocked) {
        auto it = entries_.find(peer_id);
        if (it == entries_.end()) {
            continue;
        }
        Entry& entry = it->second;
        entry.retry_pending = false;

        std::string reason;
        if (entry.sink->play(&reason) == PlaybackStatus::Playing) {
            entry.attached = true;
            LOG_VAR("BACKCHANNEL", "Playback resumed after user interaction: ", peer_id);
            continue;
        }
        reportFailure(peer_id, SessionError(ErrorCode::PlaybackFailed,
                                            reason.empty() ? "playback refused after retry" : reason));
    }
}

void ViewerAudioBackchannel::reportFailure(const std::string& peer_id, const SessionError& error) {
    LOG("BACKCHANNEL-ERROR", "Viewer audio playback failed for " << peer_id << ": " << error.describe());
    if (on_failed_) {
        on_failed_(peer_id, error);
    }
}

void ViewerAudioBackchannel::release(const std::string& peer_id) {
    auto it = entries_.find(peer_id);
    if (it == entries_.end()) {
        return;
    }
    if (it->second.sink) {
        it->second.sink->stop();
    }
    entries_.erase(it);
    LOG("BACKCHANNEL", "Released playback sink for " << peer_id << ", Remaining: " << entries_.size());
}

void ViewerAudioBackchannel::releaseAll() {
    for (auto& pair : entries_) {
        if (pair.second.sink) {
            pair.second.sink->stop();
        }
    }
    if (!entries_.empty()) {
        LOG("BACKCHANNEL", "Released " << entries_.size() << " playback sinks");
    }
    entries_.clear();
}
