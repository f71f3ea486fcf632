#ifndef GST_MEDIA_TRACK_H
#define GST_MEDIA_TRACK_H

#include "event_loop.h"
#include "media_backend.h"
#include "media_track.h"

#include <gst/gst.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Key frame interval the encoders run with
constexpr int kKeyframeInterval = 30;

// One local capture source inside the shared pipeline:
//   source ! convert ! valve ! [videorate] ! encoder ! payloader ! tee
// The source is encoded once; every peer that sends it requests its own
// output from the tee.
class GstSourceTrack : public MediaTrack {
public:
    // bin must already be a child of pipeline
    GstSourceTrack(const std::string& id, MediaKind kind, TrackSource source,
                   GstElement* pipeline, GstElement* bin);
    ~GstSourceTrack() override;

    GstElement* bin() const { return bin_; }

    // New tee branch for one consumer, exposed as a ghost pad on the bin.
    // Returns nullptr once the track is stopped. The pad stays owned by the
    // bin; hand it back with releaseOutput().
    GstPad* requestOutput();
    void releaseOutput(GstPad* output);

    // Encoder limits; bitrate in bits per second, 0 leaves a value unchanged
    bool applyEncoding(int bitrate, int framerate);

    // Ask the encoder for an IDR frame (video only)
    void forceKeyframe(EventLoop& loop);

    // Whether a bus message source belongs to this track's elements
    bool ownsObject(GstObject* object) const;

protected:
    void applyEnabled(bool enabled) override;
    void applyStop() override;

private:
    GstElement* pipeline_;
    GstElement* bin_;
    GstElement* tee_;
    GstElement* valve_;
    GstElement* encoder_;
    GstElement* rate_;
    bool removed_;
    std::mutex mutex_;
    std::map<GstPad*, GstPad*> outputs_;    // ghost pad -> tee request pad
};

using GstSourceTrackPtr = std::shared_ptr<GstSourceTrack>;

// Everything one remote peer sends us. Each incoming webrtcbin pad feeds a
// decode branch; audio branches start muted until a playback sink plays them.
class GstRemoteStream : public MediaStream {
public:
    GstRemoteStream(const std::string& id, GstElement* pipeline);
    ~GstRemoteStream() override;

    void addBranch(const MediaTrackPtr& track, GstPad* source_pad, GstElement* bin, GstElement* volume);

    // Detach the branch fed by source_pad; returns its track
    MediaTrackPtr releaseBranch(GstPad* source_pad);
    void releaseAll();

    bool setAudioMuted(bool muted, std::string* error);

private:
    struct Branch {
        MediaTrackPtr track;
        GstPad* source_pad;     // webrtcbin src pad (ref)
        GstElement* bin;
        GstElement* volume;     // audio only (ref)
    };

    void teardown(Branch& branch);

    GstElement* pipeline_;
    mutable std::mutex mutex_;
    std::vector<Branch> branches_;
};

// Unmutes one remote stream's audio branch
class GstPlaybackSink : public PlaybackSink {
public:
    explicit GstPlaybackSink(const std::string& peer_id);
    ~GstPlaybackSink() override;

    void setSource(const MediaStreamPtr& stream) override;
    MediaStreamPtr source() const override { return source_; }
    PlaybackStatus play(std::string* error) override;
    void stop() override;

private:
    std::string peer_id_;
    MediaStreamPtr source_;
    bool playing_;
};

#endif // GST_MEDIA_TRACK_H
