#include "media_track.h"

#include <algorithm>

const char* trackSourceName(TrackSource source) {
    switch (source) {
        case TrackSource::Camera: return "camera";
        case TrackSource::Microphone: return "microphone";
        case TrackSource::Screen: return "screen";
        case TrackSource::Remote: return "remote";
    }
    return "unknown";
}

MediaTrack::MediaTrack(const std::string& id, MediaKind kind, TrackSource source)
    : id_(id)
    , kind_(kind)
    , source_(source)
    , enabled_(true)
    , ended_(false) {
}

void MediaTrack::setEnabled(bool enabled) {
    if (ended_ || enabled_ == enabled) {
        return;
    }
    enabled_ = enabled;
    applyEnabled(enabled);
}

void MediaTrack::stop() {
    if (ended_) {
        return;
    }
    ended_ = true;
    ended_callback_ = nullptr;
    applyStop();
}

void MediaTrack::setEndedCallback(std::function<void()> callback) {
    ended_callback_ = std::move(callback);
}

void MediaTrack::notifyEnded() {
    if (ended_) {
        return;
    }
    ended_ = true;
    // Move out first: the callback may drop the last reference to this track
    auto callback = std::move(ended_callback_);
    ended_callback_ = nullptr;
    if (callback) {
        callback();
    }
}

void MediaStream::addTrack(const MediaTrackPtr& track) {
    if (!track) {
        return;
    }
    auto it = std::find(tracks_.begin(), tracks_.end(), track);
    if (it == tracks_.end()) {
        tracks_.push_back(track);
    }
}

void MediaStream::removeTrack(const MediaTrackPtr& track) {
    tracks_.erase(std::remove(tracks_.begin(), tracks_.end(), track), tracks_.end());
}

MediaTrackPtr MediaStream::firstTrack(MediaKind kind) const {
    for (const auto& track : tracks_) {
        if (track->kind() == kind) {
            return track;
        }
    }
    return nullptr;
}
