#ifndef WEBRTC_PEER_H
#define WEBRTC_PEER_H

#include "event_loop.h"
#include "gst_media_track.h"
#include "media_backend.h"

#include <gst/gst.h>
#include <gst/webrtc/webrtc.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class SharedMediaPipeline;
class WebRTCPeer;

// One m-line of a webrtcbin. A local source reaches the webrtcbin sink pad
// through a per-peer input-selector:
//   source tee -> queue -> input-selector -> webrtcbin sink_N
// so replacing the source is an active-pad switch on a running link.
class GstTransceiver : public NativeTransceiver {
public:
    GstTransceiver(WebRTCPeer& peer, MediaKind kind, GstWebRTCRTPTransceiver* handle);
    ~GstTransceiver() override;

    MediaKind kind() const override { return kind_; }
    TransceiverDirection direction() const override;
    void setDirection(TransceiverDirection direction) override;
    MediaTrackPtr senderTrack() const override { return sender_track_; }
    SessionError replaceSenderTrack(const MediaTrackPtr& track) override;
    SessionError setEncodingParameters(int max_bitrate, int max_framerate) override;

    GstWebRTCRTPTransceiver* handle() const { return handle_; }

    // Unlink every source and release the selector; used on peer cleanup
    void detach();

private:
    struct Link {
        GstSourceTrackPtr track;
        GstPad* output = nullptr;         // ghost pad on the source bin
        GstElement* queue = nullptr;
        GstPad* selector_pad = nullptr;   // request pad on the selector
    };

    SessionError ensureSelector();
    SessionError linkSource(const GstSourceTrackPtr& track, Link* link);
    void unlinkSource(Link& link);

    WebRTCPeer& peer_;
    MediaKind kind_;
    GstWebRTCRTPTransceiver* handle_;
    TransceiverDirection direction_;
    GstElement* selector_;
    GstPad* webrtc_sink_;
    MediaTrackPtr sender_track_;
    Link active_;
    bool detached_;
};

using GstTransceiverPtr = std::shared_ptr<GstTransceiver>;

class GstDataChannel : public NativeDataChannel {
public:
    GstDataChannel(GstWebRTCDataChannel* channel, EventLoop& loop);
    ~GstDataChannel() override;

    std::string label() const override;
    bool isOpen() const override;
    bool send(const std::string& text) override;
    void close() override;

    void setOnOpen(std::function<void()> callback) override { on_open_ = std::move(callback); }
    void setOnClose(std::function<void()> callback) override { on_close_ = std::move(callback); }
    void setOnMessage(std::function<void(const std::string&)> callback) override { on_message_ = std::move(callback); }

private:
    static void onOpen(GstWebRTCDataChannel* channel, gpointer user_data);
    static void onClose(GstWebRTCDataChannel* channel, gpointer user_data);
    static void onMessageString(GstWebRTCDataChannel* channel, gchar* text, gpointer user_data);

    GstWebRTCDataChannel* channel_;
    EventLoop& loop_;
    CancellationToken alive_;
    bool closed_;
    std::function<void()> on_open_;
    std::function<void()> on_close_;
    std::function<void(const std::string&)> on_message_;
};

// WebRTC connection to one remote peer: a webrtcbin inside the shared
// pipeline. GStreamer signals and promise replies arrive on streaming
// threads and are re-posted to the event loop.
class WebRTCPeer : public NativePeerConnection {
public:
    WebRTCPeer(const std::string& peer_id, SharedMediaPipeline& media, const IceConfig& ice);
    ~WebRTCPeer() override;

    bool initialize();

    const std::string& peerId() const { return peer_id_; }
    GstElement* webrtcbin() const { return webrtcbin_; }
    GstElement* pipeline() const { return pipeline_; }

    // NativePeerConnection
    void setObserver(const Observer& observer) override { observer_ = observer; }
    void clearObserver() override { observer_ = Observer(); }

    void createOffer(const OfferOptions& options, DescriptionCallback callback) override;
    void createAnswer(DescriptionCallback callback) override;
    void setLocalDescription(const SessionDescription& description, CompletionCallback callback) override;
    void setRemoteDescription(const SessionDescription& description, CompletionCallback callback) override;
    SessionError addIceCandidate(const IceCandidate& candidate) override;

    std::vector<NativeTransceiverPtr> transceivers() const override;
    NativeTransceiverPtr addTrack(const MediaTrackPtr& track) override;
    NativeTransceiverPtr addTransceiver(MediaKind kind, TransceiverDirection direction) override;
    SessionError removeTrack(const MediaTrackPtr& track) override;

    NativeDataChannelPtr createDataChannel(const std::string& label, bool ordered,
                                           int max_retransmits) override;

    void getStats(StatsCallback callback) override;

    void close() override;

private:
    using PromiseHandler = std::function<void(GstPromise*)>;

    struct PromiseContext {
        EventLoop* loop;
        CancellationToken alive;
        PromiseHandler handler;
    };

    GstPromise* makePromise(PromiseHandler handler);
    void describe(const char* signal, const char* field, GstStructure* options, DescriptionCallback callback);
    void applyDescription(const char* signal, const SessionDescription& description, CompletionCallback callback);
    void configureIceServers();
    void syncTransceivers();
    GstTransceiverPtr findTransceiver(GstWebRTCRTPTransceiver* handle) const;
    void addRemotePad(GstPad* pad);
    void removeRemotePad(GstPad* pad);
    void cleanup();

    static void onPromiseChanged(GstPromise* promise, gpointer user_data);
    static void onIceCandidate(GstElement* webrtc, guint mlineindex, gchar* candidate, gpointer user_data);
    static void onConnectionStateChange(GstElement* webrtc, GParamSpec* pspec, gpointer user_data);
    static void onIceConnectionStateChange(GstElement* webrtc, GParamSpec* pspec, gpointer user_data);
    static void onIceGatheringStateChange(GstElement* webrtc, GParamSpec* pspec, gpointer user_data);
    static void onPadAdded(GstElement* webrtc, GstPad* pad, gpointer user_data);
    static void onPadRemoved(GstElement* webrtc, GstPad* pad, gpointer user_data);
    static void onDataChannel(GstElement* webrtc, GstWebRTCDataChannel* channel, gpointer user_data);

    std::string peer_id_;
    SharedMediaPipeline& media_;
    EventLoop& loop_;
    GstElement* pipeline_;          // Parent pipeline (not owned)
    GstElement* webrtcbin_;         // Our webrtcbin (owned)
    IceConfig ice_;
    Observer observer_;
    CancellationToken alive_;       // Cancelled on close; gates tasks posted from GStreamer threads
    bool cleaned_up_;

    std::vector<GstTransceiverPtr> transceivers_;

    std::mutex remote_mutex_;       // pad-added runs on a streaming thread
    std::shared_ptr<GstRemoteStream> remote_stream_;
};

// Parse webrtcbin's get-stats reply into RTP byte counters
StatsReport parseWebRTCStats(const GstStructure* reply);

#endif // WEBRTC_PEER_H
