#ifndef SHARED_MEDIA_PIPELINE_H
#define SHARED_MEDIA_PIPELINE_H

#include "glib_event_loop.h"
#include "gst_media_track.h"
#include "media_backend.h"

#include <gst/gst.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Media stack on one GStreamer pipeline. Capture sources are encoded once
// and fanned out through tee elements; every peer connection adds its own
// webrtcbin to the same pipeline.
class SharedMediaPipeline : public MediaBackend {
public:
    struct Options {
        // Element (plus properties) used for screen capture
        std::string display_source = "ximagesrc use-damage=false show-pointer=true";
        // Decode and show remote video; otherwise it goes to a fakesink
        bool render_remote_video = false;
        int video_bitrate = 2500000;    // bits per second
        int audio_bitrate = 32000;
    };

    explicit SharedMediaPipeline(GlibEventLoop& loop, const Options& options = Options());
    ~SharedMediaPipeline() override;

    SharedMediaPipeline(const SharedMediaPipeline&) = delete;
    SharedMediaPipeline& operator=(const SharedMediaPipeline&) = delete;

    // Create the (initially empty) pipeline and set it PLAYING
    bool start();
    void stop();

    GstElement* getPipeline() const { return pipeline_; }
    const Options& options() const { return options_; }

    // MediaBackend
    EventLoop& eventLoop() override { return loop_; }
    std::unique_ptr<NativePeerConnection> createPeerConnection(const std::string& peer_id,
                                                               const IceConfig& config) override;
    void acquireUserMedia(const MediaConstraints& constraints, UserMediaCallback callback) override;
    void acquireDisplayMedia(DisplayMediaCallback callback) override;
    std::unique_ptr<PlaybackSink> createPlaybackSink(const std::string& peer_id) override;
    void requestKeyframe() override;

private:
    GstSourceTrackPtr createSourceTrack(MediaKind kind, TrackSource source,
                                        const std::string& description, SessionError* error);
    SessionError takeBranchError(GstElement* bin);
    void onBusError(GstMessage* msg);
    std::vector<GstSourceTrackPtr> liveSources();

    static gboolean busCallback(GstBus* bus, GstMessage* msg, gpointer user_data);

    GlibEventLoop& loop_;
    Options options_;
    GstElement* pipeline_;
    guint bus_watch_id_;
    bool is_running_;
    int next_source_id_;

    std::mutex mutex_;
    std::vector<std::weak_ptr<GstSourceTrack>> sources_;
};

// Capture branch descriptions, exposed for diagnostics
std::string cameraBranchDescription(const MediaConstraints& constraints, int bitrate);
std::string microphoneBranchDescription(const MediaConstraints& constraints, int bitrate);
std::string displayBranchDescription(const std::string& display_source, int bitrate);

// Map a GStreamer error to the acquisition taxonomy
ErrorCode classifyCaptureError(const GError* error);

#endif // SHARED_MEDIA_PIPELINE_H
