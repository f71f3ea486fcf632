#ifndef VIEWER_AUDIO_BACKCHANNEL_H
#define VIEWER_AUDIO_BACKCHANNEL_H

#include "media_backend.h"
#include "media_track.h"
#include "session_error.h"

#include <functional>
#include <map>
#include <memory>
#include <string>

// Broadcaster side: plays the microphone audio viewers send back. One
// playback sink per viewer, reused when the viewer's stream changes.
class ViewerAudioBackchannel {
public:
    using FailureCallback = std::function<void(const std::string& peer_id, const SessionError& error)>;

    struct Entry {
        MediaStreamPtr stream;
        std::unique_ptr<PlaybackSink> sink;
        bool attached = false;        // playing
        bool retry_pending = false;   // blocked by autoplay, waiting for a user gesture
    };

    explicit ViewerAudioBackchannel(MediaBackend& backend);
    ~ViewerAudioBackchannel();

    ViewerAudioBackchannel(const ViewerAudioBackchannel&) = delete;
    ViewerAudioBackchannel& operator=(const ViewerAudioBackchannel&) = delete;

    void setOnPlaybackFailed(FailureCallback callback) { on_failed_ = std::move(callback); }

    // Route a viewer's inbound audio to its sink, creating it on first use
    SessionError attach(const std::string& peer_id, const MediaStreamPtr& stream);

    // Retry every sink blocked by autoplay policy. One retry each; a second
    // refusal is reported through the failure callback.
    void notifyUserInteraction();

    void release(const std::string& peer_id);
    void releaseAll();

    bool hasSink(const std::string& peer_id) const { return entries_.count(peer_id) > 0; }
    size_t sinkCount() const { return entries_.size(); }
    const Entry* entry(const std::string& peer_id) const;

private:
    SessionError start(const std::string& peer_id, Entry& entry);
    void reportFailure(const std::string& peer_id, const SessionError& error);

    MediaBackend& backend_;
    std::map<std::string, Entry> entries_;
    FailureCallback on_failed_;
};

#endif // VIEWER_AUDIO_BACKCHANNEL_H
