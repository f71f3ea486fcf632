#include "gst_media_track.h"
#include "log.h"

#include <gst/video/video.h>

// ==================== GstSourceTrack ====================

GstSourceTrack::GstSourceTrack(const std::string& id, MediaKind kind, TrackSource source,
                               GstElement* pipeline, GstElement* bin)
    : MediaTrack(id, kind, source)
    , pipeline_(GST_ELEMENT(gst_object_ref(pipeline)))
    , bin_(GST_ELEMENT(gst_object_ref(bin)))
    , tee_(gst_bin_get_by_name(GST_BIN(bin), "tee"))
    , valve_(gst_bin_get_by_name(GST_BIN(bin), "valve"))
    , encoder_(gst_bin_get_by_name(GST_BIN(bin), "encoder"))
    , rate_(gst_bin_get_by_name(GST_BIN(bin), "rate"))
    , removed_(false) {
    LOG("TRACK", "Source track created: " << id << " (" << trackSourceName(source) << ")");
    if (!tee_) {
        LOG("TRACK-ERROR", id << " has no tee, peers cannot attach to it");
    }
}

GstSourceTrack::~GstSourceTrack() {
    // stop() is a no-op once the source ended on its own; the bin still has to go
    applyStop();
    if (tee_) gst_object_unref(tee_);
    if (valve_) gst_object_unref(valve_);
    if (encoder_) gst_object_unref(encoder_);
    if (rate_) gst_object_unref(rate_);
    gst_object_unref(bin_);
    gst_object_unref(pipeline_);
}

GstPad* GstSourceTrack::requestOutput() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (removed_ || !tee_) {
        return nullptr;
    }

    GstPad* tee_pad = gst_element_request_pad_simple(tee_, "src_%u");
    if (!tee_pad) {
        LOG_VAR("TRACK-ERROR", "Failed to get tee pad for ", id());
        return nullptr;
    }

    gchar* name = g_strdup_printf("out_%s", GST_PAD_NAME(tee_pad));
    GstPad* ghost = gst_ghost_pad_new(name, tee_pad);
    g_free(name);

    gst_pad_set_active(ghost, TRUE);
    if (!gst_element_add_pad(bin_, ghost)) {
        LOG_VAR("TRACK-ERROR", "Failed to expose tee pad on ", id());
        gst_element_release_request_pad(tee_, tee_pad);
        gst_object_unref(tee_pad);
        return nullptr;
    }

    outputs_[ghost] = tee_pad;
    LOG("TRACK", id() << " output " << GST_PAD_NAME(ghost) << " requested, Total: " << outputs_.size());
    return ghost;
}

void GstSourceTrack::releaseOutput(GstPad* output) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = outputs_.find(output);
    if (it == outputs_.end()) {
        return;
    }

    GstPad* peer = gst_pad_get_peer(output);
    if (peer) {
        gst_pad_unlink(output, peer);
        gst_object_unref(peer);
    }

    GstPad* tee_pad = it->second;
    outputs_.erase(it);

    gst_pad_set_active(output, FALSE);
    gst_element_remove_pad(bin_, output);
    gst_element_release_request_pad(tee_, tee_pad);
    gst_object_unref(tee_pad);
}

bool GstSourceTrack::applyEncoding(int bitrate, int framerate) {
    if (!encoder_) {
        return false;
    }

    if (bitrate > 0) {
        if (kind() == MediaKind::Video) {
            // x264enc takes kbit/s
            g_object_set(encoder_, "bitrate", static_cast<guint>(bitrate / 1000), nullptr);
        } else {
            g_object_set(encoder_, "bitrate", bitrate, nullptr);
        }
    }
    if (framerate > 0 && rate_) {
        g_object_set(rate_, "max-rate", framerate, nullptr);
    }

    LOG("TRACK", id() << " encoding: bitrate=" << bitrate << " framerate=" << framerate);
    return true;
}

void GstSourceTrack::forceKeyframe(EventLoop& loop) {
    if (kind() != MediaKind::Video || !encoder_ || ended()) {
        return;
    }

    GstEvent* event = gst_video_event_new_upstream_force_key_unit(
        GST_CLOCK_TIME_NONE,  // running_time
        TRUE,                  // all_headers - include SPS/PPS
        0);

    if (gst_element_send_event(encoder_, event)) {
        LOG_VAR("TRACK", "Keyframe request sent to encoder of ", id());
        return;
    }

    // Encoder rejected the event: drop key-int-max to 1 for a frame, then restore
    LOG("TRACK-WARN", "Encoder of " << id() << " rejected keyframe request, trying property method...");
    g_object_set(encoder_, "key-int-max", 1, nullptr);

    GstElement* encoder = GST_ELEMENT(gst_object_ref(encoder_));
    loop.scheduleOnce(std::chrono::milliseconds(100), [encoder]() {
        g_object_set(encoder, "key-int-max", kKeyframeInterval, nullptr);
        gst_object_unref(encoder);
    });
}

bool GstSourceTrack::ownsObject(GstObject* object) const {
    return object && (object == GST_OBJECT(bin_) || gst_object_has_as_ancestor(object, GST_OBJECT(bin_)));
}

void GstSourceTrack::applyEnabled(bool enabled) {
    if (valve_) {
        g_object_set(valve_, "drop", enabled ? FALSE : TRUE, nullptr);
    }
    LOG("TRACK", id() << (enabled ? " enabled" : " disabled"));
}

void GstSourceTrack::applyStop() {
    std::vector<GstPad*> outputs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (removed_) {
            return;
        }
        for (const auto& pair : outputs_) {
            outputs.push_back(pair.first);
        }
    }
    for (GstPad* output : outputs) {
        releaseOutput(output);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    removed_ = true;

    gst_element_set_locked_state(bin_, TRUE);
    gst_element_set_state(bin_, GST_STATE_NULL);
    gst_bin_remove(GST_BIN(pipeline_), bin_);
    LOG_VAR("TRACK", "Source track stopped: ", id());
}

// ==================== GstRemoteStream ====================

GstRemoteStream::GstRemoteStream(const std::string& id, GstElement* pipeline)
    : MediaStream(id)
    , pipeline_(GST_ELEMENT(gst_object_ref(pipeline))) {
}

GstRemoteStream::~GstRemoteStream() {
    releaseAll();
    gst_object_unref(pipeline_);
}

void GstRemoteStream::addBranch(const MediaTrackPtr& track, GstPad* source_pad,
                                GstElement* bin, GstElement* volume) {
    std::lock_guard<std::mutex> lock(mutex_);
    Branch branch;
    branch.track = track;
    branch.source_pad = GST_PAD(gst_object_ref(source_pad));
    branch.bin = bin;
    branch.volume = volume;
    branches_.push_back(branch);
    addTrack(track);
}

MediaTrackPtr GstRemoteStream::releaseBranch(GstPad* source_pad) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = branches_.begin(); it != branches_.end(); ++it) {
        if (it->source_pad != source_pad) {
            continue;
        }
        MediaTrackPtr track = it->track;
        teardown(*it);
        branches_.erase(it);
        removeTrack(track);
        return track;
    }
    return nullptr;
}

void GstRemoteStream::releaseAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& branch : branches_) {
        teardown(branch);
    }
    branches_.clear();
}

void GstRemoteStream::teardown(Branch& branch) {
    GstPad* sink = gst_element_get_static_pad(branch.bin, "sink");
    if (sink) {
        if (gst_pad_is_linked(sink)) {
            gst_pad_unlink(branch.source_pad, sink);
        }
        gst_object_unref(sink);
    }

    gst_element_set_locked_state(branch.bin, TRUE);
    gst_element_set_state(branch.bin, GST_STATE_NULL);
    gst_bin_remove(GST_BIN(pipeline_), branch.bin);

    if (branch.volume) {
        gst_object_unref(branch.volume);
        branch.volume = nullptr;
    }
    gst_object_unref(branch.source_pad);
    branch.source_pad = nullptr;
}

bool GstRemoteStream::setAudioMuted(bool muted, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool found = false;
    for (const auto& branch : branches_) {
        if (!branch.volume) {
            continue;
        }
        g_object_set(branch.volume, "mute", muted ? TRUE : FALSE, nullptr);
        found = true;
    }
    if (!found && error) {
        *error = "stream " + id() + " has no audio output";
    }
    return found;
}

// ==================== GstPlaybackSink ====================

GstPlaybackSink::GstPlaybackSink(const std::string& peer_id)
    : peer_id_(peer_id)
    , playing_(false) {
}

GstPlaybackSink::~GstPlaybackSink() {
    stop();
}

void GstPlaybackSink::setSource(const MediaStreamPtr& stream) {
    if (source_ == stream) {
        return;
    }
    stop();
    source_ = stream;
}

PlaybackStatus GstPlaybackSink::play(std::string* error) {
    auto stream = std::dynamic_pointer_cast<GstRemoteStream>(source_);
    if (!stream) {
        if (error) {
            *error = "no playable stream for " + peer_id_;
        }
        return PlaybackStatus::Failed;
    }
    if (!stream->setAudioMuted(false, error)) {
        return PlaybackStatus::Failed;
    }
    playing_ = true;
    return PlaybackStatus::Playing;
}

void GstPlaybackSink::stop() {
    if (!playing_) {
        return;
    }
    playing_ = false;
    auto stream = std::dynamic_pointer_cast<GstRemoteStream>(source_);
    if (stream) {
        stream->setAudioMuted(true, nullptr);
    }
}
