#include "shared_media_pipeline.h"
#include "log.h"
#include "webrtc_peer.h"

#include <algorithm>
#include <sstream>

namespace {

int pick(int ideal, int max) {
    if (max > 0 && (ideal <= 0 || ideal > max)) {
        return max;
    }
    return ideal;
}

std::string rawVideoCaps(const VideoConstraints& video, const char* format) {
    std::ostringstream caps;
    caps << "video/x-raw";
    int width = pick(video.ideal_width, video.max_width);
    int height = pick(video.ideal_height, video.max_height);
    int framerate = pick(video.ideal_framerate, video.max_framerate);
    if (width > 0 && height > 0) {
        caps << ",width=" << width << ",height=" << height;
    }
    if (framerate > 0) {
        caps << ",framerate=" << framerate << "/1";
    }
    if (format) {
        caps << ",format=" << format;
    }
    return caps.str();
}

// Shared tail of every video branch: encode once, fan out through the tee.
// The fakesink branch keeps data flowing with no peers attached.
std::string videoEncodeTail(int bitrate) {
    std::ostringstream tail;
    tail << "valve name=valve drop=false ! "
         << "videorate name=rate ! "
         << "x264enc name=encoder tune=zerolatency speed-preset=ultrafast bitrate=" << bitrate / 1000
         << " key-int-max=" << kKeyframeInterval << " bframes=0 ! "
         << "video/x-h264,profile=constrained-baseline ! "
         << "h264parse config-interval=-1 ! "
         << "rtph264pay config-interval=-1 pt=96 aggregate-mode=zero-latency ! "
         << "application/x-rtp,media=video,encoding-name=H264,payload=96 ! "
         << "tee name=tee allow-not-linked=true "
         << "tee. ! queue ! fakesink async=false sync=false";
    return tail.str();
}

}  // namespace

std::string cameraBranchDescription(const MediaConstraints& constraints, int bitrate) {
    const VideoConstraints& video = constraints.video_constraints;
    std::string source;

    if (constraints.camera_type == CameraType::CSI) {
        source =
            "libcamerasrc ! " +
            rawVideoCaps(video, "NV12") + " ! "
            "videoconvert ! "
            "video/x-raw,format=I420 ! ";
    } else if (constraints.camera_type == CameraType::LEGACY_CSI) {
        source =
            "rpicamsrc preview=false ! " +
            rawVideoCaps(video, nullptr) + " ! "
            "videoconvert ! ";
    } else {
        source =
            "v4l2src device=" + constraints.video_device + " ! " +
            rawVideoCaps(video, nullptr) + " ! "
            "videoconvert ! "
            "queue max-size-buffers=3 leaky=downstream ! ";
    }
    return source + videoEncodeTail(bitrate);
}

std::string microphoneBranchDescription(const MediaConstraints& constraints, int bitrate) {
    const AudioConstraints& audio = constraints.audio_constraints;
    std::ostringstream desc;
    desc << "alsasrc device=" << constraints.audio_device << " ! "
         << "audioconvert ! "
         << "audioresample ! "
         << "audio/x-raw,rate=48000,channels=1 ! ";

    if (audio.noise_suppression || audio.auto_gain_control) {
        // Echo cancellation needs a webrtcechoprobe on the playback path,
        // which the capture branch does not have
        desc << "webrtcdsp echo-cancel=false"
             << " noise-suppression=" << (audio.noise_suppression ? "true" : "false")
             << " gain-control=" << (audio.auto_gain_control ? "true" : "false") << " ! "
             << "audioconvert ! ";
    }

    desc << "queue max-size-buffers=3 leaky=downstream ! "
         << "valve name=valve drop=false ! "
         << "opusenc name=encoder bitrate=" << bitrate << " ! "
         << "rtpopuspay pt=97 ! "
         << "application/x-rtp,media=audio,encoding-name=OPUS,payload=97 ! "
         << "tee name=tee allow-not-linked=true "
         << "tee. ! queue ! fakesink async=false sync=false";
    return desc.str();
}

std::string displayBranchDescription(const std::string& display_source, int bitrate) {
    return display_source + " ! "
           "video/x-raw,framerate=30/1 ! "
           "videoconvert ! "
           "videoscale ! "
           "video/x-raw,width=1280,height=720,format=I420 ! "
           "queue max-size-buffers=3 leaky=downstream ! " +
           videoEncodeTail(bitrate);
}

ErrorCode classifyCaptureError(const GError* error) {
    if (!error) {
        return ErrorCode::Internal;
    }
    if (error->domain == GST_RESOURCE_ERROR) {
        switch (error->code) {
            case GST_RESOURCE_ERROR_NOT_AUTHORIZED:
                return ErrorCode::PermissionDenied;
            case GST_RESOURCE_ERROR_NOT_FOUND:
                return ErrorCode::DeviceNotFound;
            case GST_RESOURCE_ERROR_BUSY:
            case GST_RESOURCE_ERROR_OPEN_READ:
            case GST_RESOURCE_ERROR_OPEN_WRITE:
            case GST_RESOURCE_ERROR_OPEN_READ_WRITE:
                return ErrorCode::DeviceBusy;
            case GST_RESOURCE_ERROR_SETTINGS:
                return ErrorCode::Overconstrained;
            default:
                return ErrorCode::Internal;
        }
    }
    if (error->domain == GST_CORE_ERROR && error->code == GST_CORE_ERROR_NEGOTIATION) {
        return ErrorCode::Overconstrained;
    }
    if (error->domain == GST_STREAM_ERROR && error->code == GST_STREAM_ERROR_FORMAT) {
        return ErrorCode::Overconstrained;
    }
    if (error->domain == GST_PARSE_ERROR && error->code == GST_PARSE_ERROR_NO_SUCH_ELEMENT) {
        return ErrorCode::DeviceNotFound;
    }
    return ErrorCode::Internal;
}

// ==================== SharedMediaPipeline Implementation ====================

SharedMediaPipeline::SharedMediaPipeline(GlibEventLoop& loop, const Options& options)
    : loop_(loop)
    , options_(options)
    , pipeline_(nullptr)
    , bus_watch_id_(0)
    , is_running_(false)
    , next_source_id_(0) {
    LOG("SHARED", "SharedMediaPipeline created");
}

SharedMediaPipeline::~SharedMediaPipeline() {
    LOG("SHARED", "SharedMediaPipeline destroying");
    stop();
}

bool SharedMediaPipeline::start() {
    if (is_running_) {
        return true;
    }

    LOG("SHARED", "Starting shared pipeline...");
    pipeline_ = gst_pipeline_new("castlink");
    if (!pipeline_) {
        LOG("SHARED-ERROR", "Failed to create pipeline");
        return false;
    }

    GstBus* bus = gst_element_get_bus(pipeline_);
    bus_watch_id_ = gst_bus_add_watch(bus, busCallback, this);
    gst_object_unref(bus);

    GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
    if (ret == GST_STATE_CHANGE_FAILURE) {
        LOG("SHARED-ERROR", "Failed to start pipeline");
        g_source_remove(bus_watch_id_);
        bus_watch_id_ = 0;
        gst_object_unref(pipeline_);
        pipeline_ = nullptr;
        return false;
    }

    is_running_ = true;
    LOG("SHARED", "Shared pipeline started");
    return true;
}

void SharedMediaPipeline::stop() {
    if (!is_running_) {
        return;
    }

    LOG("SHARED", "Stopping shared pipeline...");
    for (const auto& track : liveSources()) {
        track->stop();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sources_.clear();
    }

    if (bus_watch_id_ != 0) {
        g_source_remove(bus_watch_id_);
        bus_watch_id_ = 0;
    }
    if (pipeline_) {
        gst_element_set_state(pipeline_, GST_STATE_NULL);
        gst_object_unref(pipeline_);
        pipeline_ = nullptr;
    }

    is_running_ = false;
    LOG("SHARED", "Shared pipeline stopped");
}

std::unique_ptr<NativePeerConnection> SharedMediaPipeline::createPeerConnection(const std::string& peer_id,
                                                                                const IceConfig& config) {
    if (!start()) {
        return nullptr;
    }

    LOG_VAR("SHARED", ">>> createPeerConnection called for: ", peer_id);
    std::unique_ptr<WebRTCPeer> peer(new WebRTCPeer(peer_id, *this, config));
    if (!peer->initialize()) {
        LOG_VAR("SHARED-ERROR", "Failed to initialize peer: ", peer_id);
        return nullptr;
    }
    return std::unique_ptr<NativePeerConnection>(peer.release());
}

void SharedMediaPipeline::acquireUserMedia(const MediaConstraints& constraints, UserMediaCallback callback) {
    UserMedia media;
    SessionError error;

    if (!start()) {
        error = SessionError(ErrorCode::Internal, "pipeline not running");
    }

    if (!error && constraints.video) {
        LOG("SHARED", "Opening camera (" << constraints.video_device << ")");
        media.video = createSourceTrack(MediaKind::Video, TrackSource::Camera,
                                        cameraBranchDescription(constraints, options_.video_bitrate), &error);
    }
    if (!error && constraints.audio) {
        LOG("SHARED", "Opening microphone (" << constraints.audio_device << ")");
        media.audio = createSourceTrack(MediaKind::Audio, TrackSource::Microphone,
                                        microphoneBranchDescription(constraints, options_.audio_bitrate), &error);
    }

    if (error) {
        LOG("SHARED-ERROR", "User media acquisition failed: " << error.describe());
        if (media.video) media.video->stop();
        if (media.audio) media.audio->stop();
        media = UserMedia();
    }

    loop_.post([callback, error, media]() {
        if (callback) {
            callback(error, media);
        }
    });
}

void SharedMediaPipeline::acquireDisplayMedia(DisplayMediaCallback callback) {
    SessionError error;
    MediaTrackPtr track;

    if (!start()) {
        error = SessionError(ErrorCode::Internal, "pipeline not running");
    } else {
        LOG_VAR("SHARED", "Opening display capture: ", options_.display_source);
        track = createSourceTrack(MediaKind::Video, TrackSource::Screen,
                                  displayBranchDescription(options_.display_source, options_.video_bitrate),
                                  &error);
    }

    loop_.post([callback, error, track]() {
        if (callback) {
            callback(error, track);
        }
    });
}

std::unique_ptr<PlaybackSink> SharedMediaPipeline::createPlaybackSink(const std::string& peer_id) {
    return std::unique_ptr<PlaybackSink>(new GstPlaybackSink(peer_id));
}

void SharedMediaPipeline::requestKeyframe() {
    for (const auto& track : liveSources()) {
        track->forceKeyframe(loop_);
    }
}

GstSourceTrackPtr SharedMediaPipeline::createSourceTrack(MediaKind kind, TrackSource source,
                                                         const std::string& description, SessionError* error) {
    std::string id = std::string(trackSourceName(source)) + "-" + std::to_string(++next_source_id_);
    LOG("SHARED", "Branch " << id << ": " << description.substr(0, 400));

    GError* gerror = nullptr;
    GstElement* bin = gst_parse_bin_from_description(description.c_str(), FALSE, &gerror);
    if (!bin) {
        ErrorCode code = classifyCaptureError(gerror);
        std::string message = gerror ? gerror->message : "could not build capture branch";
        g_clear_error(&gerror);
        *error = SessionError(code, message);
        return nullptr;
    }
    if (gerror) {
        // Recoverable parse problem (e.g. unknown property); the bin is usable
        LOG_VAR("SHARED-WARN", "Branch parse warning: ", gerror->message);
        g_clear_error(&gerror);
    }

    gst_element_set_name(bin, id.c_str());
    gst_bin_add(GST_BIN(pipeline_), bin);
    auto track = std::make_shared<GstSourceTrack>(id, kind, source, pipeline_, bin);

    GstStateChangeReturn ret = gst_element_set_state(bin, GST_STATE_PLAYING);
    if (ret != GST_STATE_CHANGE_FAILURE) {
        ret = gst_element_get_state(bin, nullptr, nullptr, 2 * GST_SECOND);
    }
    if (ret == GST_STATE_CHANGE_FAILURE) {
        *error = takeBranchError(bin);
        track->stop();
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sources_.push_back(track);
    return track;
}

SessionError SharedMediaPipeline::takeBranchError(GstElement* bin) {
    // Still on the loop thread: the bus watch has not dispatched these yet
    GstBus* bus = gst_element_get_bus(pipeline_);
    SessionError result(ErrorCode::Internal, "capture branch failed to start");

    GstMessage* msg;
    while ((msg = gst_bus_pop_filtered(bus, GST_MESSAGE_ERROR)) != nullptr) {
        GError* err = nullptr;
        gchar* debug = nullptr;
        gst_message_parse_error(msg, &err, &debug);

        GstObject* src = GST_MESSAGE_SRC(msg);
        bool ours = src && gst_object_has_as_ancestor(src, GST_OBJECT(bin));
        LOG_VAR("GST-ERROR", "Error: ", err->message);
        if (debug) {
            LOG_VAR("GST-ERROR", "Debug: ", debug);
        }
        if (ours && result.code == ErrorCode::Internal) {
            result = SessionError(classifyCaptureError(err), err->message);
        }

        g_error_free(err);
        g_free(debug);
        gst_message_unref(msg);
    }

    gst_object_unref(bus);
    return result;
}

std::vector<GstSourceTrackPtr> SharedMediaPipeline::liveSources() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GstSourceTrackPtr> live;
    auto it = sources_.begin();
    while (it != sources_.end()) {
        GstSourceTrackPtr track = it->lock();
        if (!track || track->ended()) {
            it = sources_.erase(it);
            continue;
        }
        live.push_back(track);
        ++it;
    }
    return live;
}

void SharedMediaPipeline::onBusError(GstMessage* msg) {
    GError* err;
    gchar* debug;
    gst_message_parse_error(msg, &err, &debug);
    LOG_VAR("GST-ERROR", "Error: ", err->message);
    LOG_VAR("GST-ERROR", "Debug: ", debug);

    // A capture source that errors out has ended
    for (const auto& track : liveSources()) {
        if (!track->ownsObject(GST_MESSAGE_SRC(msg))) {
            continue;
        }
        LOG("SHARED-WARN", "Source " << track->id() << " ended: " << err->message);
        std::weak_ptr<GstSourceTrack> weak = track;
        loop_.post([weak]() {
            if (auto ended = weak.lock()) {
                ended->notifyEnded();
            }
        });
        break;
    }

    g_error_free(err);
    g_free(debug);
}

gboolean SharedMediaPipeline::busCallback(GstBus* bus, GstMessage* msg, gpointer user_data) {
    SharedMediaPipeline* pipeline = static_cast<SharedMediaPipeline*>(user_data);

    switch (GST_MESSAGE_TYPE(msg)) {
        case GST_MESSAGE_ERROR:
            pipeline->onBusError(msg);
            break;
        case GST_MESSAGE_WARNING: {
            GError* err;
            gchar* debug;
            gst_message_parse_warning(msg, &err, &debug);
            LOG_VAR("GST-WARN", "Warning: ", err->message);
            g_error_free(err);
            g_free(debug);
            break;
        }
        case GST_MESSAGE_STATE_CHANGED: {
            if (GST_MESSAGE_SRC(msg) == GST_OBJECT(pipeline->getPipeline())) {
                GstState old_state, new_state, pending;
                gst_message_parse_state_changed(msg, &old_state, &new_state, &pending);
                LOG("GST-STATE", "Pipeline state: " <<
                    gst_element_state_get_name(old_state) << " -> " <<
                    gst_element_state_get_name(new_state));
            }
            break;
        }
        case GST_MESSAGE_LATENCY: {
            LOG("GST-LATENCY", "Latency message received, recalculating...");
            gst_bin_recalculate_latency(GST_BIN(pipeline->getPipeline()));
            break;
        }
        default:
            break;
    }
    return TRUE;
}
