#ifndef MEDIA_TRACK_H
#define MEDIA_TRACK_H

#include "media_types.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class TrackSource {
    Camera,
    Microphone,
    Screen,
    Remote
};

const char* trackSourceName(TrackSource source);

// A single local or remote media source. The media stack subclasses this to
// bind enable/stop to its own elements.
class MediaTrack {
public:
    MediaTrack(const std::string& id, MediaKind kind, TrackSource source);
    virtual ~MediaTrack() = default;

    MediaTrack(const MediaTrack&) = delete;
    MediaTrack& operator=(const MediaTrack&) = delete;

    const std::string& id() const { return id_; }
    MediaKind kind() const { return kind_; }
    TrackSource source() const { return source_; }

    bool enabled() const { return enabled_; }
    bool ended() const { return ended_; }

    // Enable/disable in place; a disabled track keeps its sender attachment
    void setEnabled(bool enabled);

    // Stop capture. Idempotent; does not fire the ended callback.
    void stop();

    // Fired once when the source ends on its own (e.g. capture window closed)
    void setEndedCallback(std::function<void()> callback);

    // Called by the media stack when the underlying source ends
    void notifyEnded();

protected:
    virtual void applyEnabled(bool enabled) {}
    virtual void applyStop() {}

private:
    std::string id_;
    MediaKind kind_;
    TrackSource source_;
    bool enabled_;
    bool ended_;
    std::function<void()> ended_callback_;
};

using MediaTrackPtr = std::shared_ptr<MediaTrack>;

// Group of tracks delivered together by a remote peer
class MediaStream {
public:
    explicit MediaStream(const std::string& id) : id_(id) {}
    virtual ~MediaStream() = default;

    const std::string& id() const { return id_; }

    void addTrack(const MediaTrackPtr& track);
    void removeTrack(const MediaTrackPtr& track);
    const std::vector<MediaTrackPtr>& tracks() const { return tracks_; }

    MediaTrackPtr firstTrack(MediaKind kind) const;

private:
    std::string id_;
    std::vector<MediaTrackPtr> tracks_;
};

using MediaStreamPtr = std::shared_ptr<MediaStream>;

#endif // MEDIA_TRACK_H
