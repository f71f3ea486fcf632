#ifndef FAKE_MEDIA_H
#define FAKE_MEDIA_H

#include "event_loop.h"
#include "media_backend.h"
#include "signaling_message.h"

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Event loop with manual time. Nothing runs until the test drives it.
class FakeEventLoop : public EventLoop {
public:
    void post(std::function<void()> task) override;
    TimerId scheduleRepeating(std::chrono::milliseconds interval, std::function<void()> task) override;
    TimerId scheduleOnce(std::chrono::milliseconds delay, std::function<void()> task) override;
    void cancel(TimerId id) override;

    // Run posted tasks, including ones they post, until none are left
    size_t runPending();

    // Move the clock forward, firing due timers in order
    void advance(std::chrono::milliseconds duration);

    size_t timerCount() const { return timers_.size(); }
    size_t pendingCount() const { return posted_.size(); }
    std::chrono::milliseconds now() const { return now_; }

private:
    struct Timer {
        std::chrono::milliseconds due;
        std::chrono::milliseconds interval;
        bool repeating;
        std::function<void()> fn;
    };

    TimerId add(std::chrono::milliseconds delay, bool repeating, std::function<void()> task);

    std::deque<std::function<void()>> posted_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = 1;
    std::chrono::milliseconds now_{0};
};

class FakeTrack : public MediaTrack {
public:
    FakeTrack(const std::string& id, MediaKind kind, TrackSource source)
        : MediaTrack(id, kind, source) {}

    int stop_count = 0;
    std::vector<bool> enable_calls;

protected:
    void applyEnabled(bool enabled) override { enable_calls.push_back(enabled); }
    void applyStop() override { stop_count++; }
};

using FakeTrackPtr = std::shared_ptr<FakeTrack>;

class FakeTransceiver : public NativeTransceiver {
public:
    FakeTransceiver(MediaKind kind, TransceiverDirection direction, const MediaTrackPtr& track)
        : kind_(kind), direction_(direction), sender_(track) {}

    MediaKind kind() const override { return kind_; }
    TransceiverDirection direction() const override { return direction_; }
    void setDirection(TransceiverDirection direction) override { direction_ = direction; }
    MediaTrackPtr senderTrack() const override { return sender_; }
    SessionError replaceSenderTrack(const MediaTrackPtr& track) override;
    SessionError setEncodingParameters(int max_bitrate, int max_framerate) override;

    bool fail_replace = false;
    int replace_count = 0;
    std::vector<MediaTrackPtr> sender_history;   // every track installed by replaceSenderTrack
    int max_bitrate = 0;
    int max_framerate = 0;

private:
    MediaKind kind_;
    TransceiverDirection direction_;
    MediaTrackPtr sender_;
};

using FakeTransceiverPtr = std::shared_ptr<FakeTransceiver>;

class FakeDataChannel : public NativeDataChannel {
public:
    explicit FakeDataChannel(const std::string& label) : label_(label) {}

    std::string label() const override { return label_; }
    bool isOpen() const override { return open_; }
    bool send(const std::string& text) override;
    void close() override;

    void setOnOpen(std::function<void()> callback) override { on_open_ = std::move(callback); }
    void setOnClose(std::function<void()> callback) override { on_close_ = std::move(callback); }
    void setOnMessage(std::function<void(const std::string&)> callback) override { on_message_ = std::move(callback); }

    void open();
    void receive(const std::string& text);

    std::vector<std::string> sent;
    bool closed = false;

private:
    std::string label_;
    bool open_ = false;
    std::function<void()> on_open_;
    std::function<void()> on_close_;
    std::function<void(const std::string&)> on_message_;
};

class FakeMediaBackend;

// Records every call; completions are posted to the loop like a real stack
class FakeNativePeerConnection : public NativePeerConnection {
public:
    FakeNativePeerConnection(const std::string& peer_id, EventLoop& loop, FakeMediaBackend* backend = nullptr);
    ~FakeNativePeerConnection() override;

    void setObserver(const Observer& observer) override { observer_ = observer; has_observer_ = true; }
    void clearObserver() override { observer_ = Observer(); has_observer_ = false; }

    void createOffer(const OfferOptions& options, DescriptionCallback callback) override;
    void createAnswer(DescriptionCallback callback) override;
    void setLocalDescription(const SessionDescription& description, CompletionCallback callback) override;
    void setRemoteDescription(const SessionDescription& description, CompletionCallback callback) override;
    SessionError addIceCandidate(const IceCandidate& candidate) override;

    std::vector<NativeTransceiverPtr> transceivers() const override;
    NativeTransceiverPtr addTrack(const MediaTrackPtr& track) override;
    NativeTransceiverPtr addTransceiver(MediaKind kind, TransceiverDirection direction) override;
    SessionError removeTrack(const MediaTrackPtr& track) override;

    NativeDataChannelPtr createDataChannel(const std::string& label, bool ordered, int max_retransmits) override;

    void getStats(StatsCallback callback) override;

    void close() override { closed = true; }

    // Drive observer events; false when no observer is installed
    bool emitIceCandidate(const IceCandidate& candidate);
    bool emitTrack(const MediaTrackPtr& track, const MediaStreamPtr& stream);
    bool emitConnectionState(ConnectionState state);
    bool emitDataChannel(const NativeDataChannelPtr& channel);

    bool hasObserver() const { return has_observer_; }
    const std::vector<FakeTransceiverPtr>& fakeTransceivers() const { return transceivers_; }
    FakeTransceiverPtr sender(MediaKind kind) const;

    // Failure injection
    bool fail_create_offer = false;
    bool fail_set_remote = false;
    bool fail_candidates = false;
    SessionError stats_error;
    StatsReport next_stats;

    // Recorded calls
    int offers_created = 0;
    int answers_created = 0;
    std::vector<OfferOptions> offer_options;
    std::vector<SessionDescription> local_descriptions;
    std::vector<SessionDescription> remote_descriptions;
    std::vector<IceCandidate> applied_candidates;
    int stats_requests = 0;
    std::shared_ptr<FakeDataChannel> data_channel;
    bool closed = false;

private:
    std::string peer_id_;
    EventLoop& loop_;
    FakeMediaBackend* backend_;
    Observer observer_;
    bool has_observer_ = false;
    std::vector<FakeTransceiverPtr> transceivers_;
};

class FakePlaybackSink : public PlaybackSink {
public:
    FakePlaybackSink(const std::string& peer_id, FakeMediaBackend* backend,
                     const std::deque<PlaybackStatus>& script);
    ~FakePlaybackSink() override;

    void setSource(const MediaStreamPtr& stream) override { source_ = stream; source_changes++; }
    MediaStreamPtr source() const override { return source_; }
    PlaybackStatus play(std::string* error) override;
    void stop() override { stop_count++; }

    int play_count = 0;
    int stop_count = 0;
    int source_changes = 0;

private:
    std::string peer_id_;
    FakeMediaBackend* backend_;
    std::deque<PlaybackStatus> script_;
    MediaStreamPtr source_;
};

class FakeMediaBackend : public MediaBackend {
public:
    explicit FakeMediaBackend(FakeEventLoop& loop) : loop_(loop) {}

    EventLoop& eventLoop() override { return loop_; }
    std::unique_ptr<NativePeerConnection> createPeerConnection(const std::string& peer_id,
                                                               const IceConfig& config) override;
    void acquireUserMedia(const MediaConstraints& constraints, UserMediaCallback callback) override;
    void acquireDisplayMedia(DisplayMediaCallback callback) override;
    std::unique_ptr<PlaybackSink> createPlaybackSink(const std::string& peer_id) override;
    void requestKeyframe() override { keyframes++; }

    // Live objects by peer id; nullptr once destroyed
    FakeNativePeerConnection* connection(const std::string& peer_id) const;
    FakePlaybackSink* sink(const std::string& peer_id) const;

    // Complete held capture requests
    void releaseHeldUserMedia();
    void releaseHeldDisplayMedia();

    void forget(FakeNativePeerConnection* connection, const std::string& peer_id);
    void forget(FakePlaybackSink* sink, const std::string& peer_id);

    // Failure injection and scripting
    bool fail_create_connection = false;
    std::deque<SessionError> user_media_errors;      // consumed one per request
    SessionError display_error;
    bool hold_user_media = false;
    bool hold_display_media = false;
    bool fail_create_sink = false;
    std::deque<PlaybackStatus> playback_script;      // copied into each new sink

    // Recorded calls
    std::vector<MediaConstraints> user_media_requests;
    int display_requests = 0;
    int sinks_created = 0;
    int keyframes = 0;
    std::map<std::string, IceConfig> ice_configs;
    std::vector<FakeTrackPtr> created_tracks;
    FakeTrackPtr last_camera;
    FakeTrackPtr last_microphone;
    FakeTrackPtr last_screen;

private:
    FakeEventLoop& loop_;
    int next_track_ = 1;
    std::map<std::string, FakeNativePeerConnection*> connections_;
    std::map<std::string, FakePlaybackSink*> sinks_;
    std::vector<std::function<void()>> held_user_media_;
    std::vector<std::function<void()>> held_display_media_;
};

class RecordingSignalingAdapter : public SignalingAdapter {
public:
    void send(const SignalingMessage& message) override { sent.push_back(message); }

    size_t count(SignalingMessageType type, const std::string& to = "") const;
    size_t countTo(const std::string& to) const;
    const SignalingMessage* last(SignalingMessageType type, const std::string& to = "") const;

    std::vector<SignalingMessage> sent;
};

#endif // FAKE_MEDIA_H
