#include "fake_media.h"

// ==================== FakeEventLoop ====================

void FakeEventLoop::post(std::function<void()> task) {
    posted_.push_back(std::move(task));
}

EventLoop::TimerId FakeEventLoop::scheduleRepeating(std::chrono::milliseconds interval,
                                                    std::function<void()> task) {
    return add(interval, true, std::move(task));
}

EventLoop::TimerId FakeEventLoop::scheduleOnce(std::chrono::milliseconds delay, std::function<void()> task) {
    return add(delay, false, std::move(task));
}

EventLoop::TimerId FakeEventLoop::add(std::chrono::milliseconds delay, bool repeating,
                                      std::function<void()> task) {
    TimerId id = next_id_++;
    timers_[id] = Timer{now_ + delay, delay, repeating, std::move(task)};
    return id;
}

void FakeEventLoop::cancel(TimerId id) {
    timers_.erase(id);
}

size_t FakeEventLoop::runPending() {
    size_t ran = 0;
    while (!posted_.empty()) {
        std::function<void()> task = std::move(posted_.front());
        posted_.pop_front();
        task();
        ran++;
    }
    return ran;
}

void FakeEventLoop::advance(std::chrono::milliseconds duration) {
    const std::chrono::milliseconds target = now_ + duration;
    runPending();

    while (true) {
        auto next = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.due <= target && (next == timers_.end() || it->second.due < next->second.due)) {
                next = it;
            }
        }
        if (next == timers_.end()) {
            break;
        }

        now_ = next->second.due;
        std::function<void()> fn = next->second.fn;
        if (next->second.repeating) {
            next->second.due += next->second.interval;
        } else {
            timers_.erase(next);
        }
        fn();
        runPending();
    }

    now_ = target;
}

// ==================== FakeTransceiver / FakeDataChannel ====================

SessionError FakeTransceiver::replaceSenderTrack(const MediaTrackPtr& track) {
    if (fail_replace) {
        return SessionError(ErrorCode::Internal, "replace refused");
    }
    replace_count++;
    sender_ = track;
    sender_history.push_back(track);
    return SessionError();
}

SessionError FakeTransceiver::setEncodingParameters(int bitrate, int framerate) {
    max_bitrate = bitrate;
    max_framerate = framerate;
    return SessionError();
}

bool FakeDataChannel::send(const std::string& text) {
    if (!open_) {
        return false;
    }
    sent.push_back(text);
    return true;
}

void FakeDataChannel::close() {
    closed = true;
    open_ = false;
    if (on_close_) {
        on_close_();
    }
}

void FakeDataChannel::open() {
    open_ = true;
    if (on_open_) {
        on_open_();
    }
}

void FakeDataChannel::receive(const std::string& text) {
    if (on_message_) {
        on_message_(text);
    }
}

// ==================== FakeNativePeerConnection ====================

FakeNativePeerConnection::FakeNativePeerConnection(const std::string& peer_id, EventLoop& loop,
                                                   FakeMediaBackend* backend)
    : peer_id_(peer_id)
    , loop_(loop)
    , backend_(backend) {
}

FakeNativePeerConnection::~FakeNativePeerConnection() {
    if (backend_) {
        backend_->forget(this, peer_id_);
    }
}

void FakeNativePeerConnection::createOffer(const OfferOptions& options, DescriptionCallback callback) {
    offers_created++;
    offer_options.push_back(options);
    SessionError error;
    if (fail_create_offer) {
        error = SessionError(ErrorCode::Internal, "offer refused");
    }
    SessionDescription offer;
    offer.type = SdpType::Offer;
    offer.sdp = "v=0 offer " + std::to_string(offers_created) + " " + peer_id_;
    loop_.post([callback, error, offer]() { callback(error, offer); });
}

void FakeNativePeerConnection::createAnswer(DescriptionCallback callback) {
    answers_created++;
    SessionDescription answer;
    answer.type = SdpType::Answer;
    answer.sdp = "v=0 answer " + std::to_string(answers_created) + " " + peer_id_;
    loop_.post([callback, answer]() { callback(SessionError(), answer); });
}

void FakeNativePeerConnection::setLocalDescription(const SessionDescription& description,
                                                   CompletionCallback callback) {
    local_descriptions.push_back(description);
    loop_.post([callback]() { callback(SessionError()); });
}

void FakeNativePeerConnection::setRemoteDescription(const SessionDescription& description,
                                                    CompletionCallback callback) {
    remote_descriptions.push_back(description);
    if (fail_set_remote) {
        loop_.post([callback]() { callback(SessionError(ErrorCode::InvalidMessage, "bad sdp")); });
        return;
    }
    // A remote offer brings its m-lines with it
    if (description.type == SdpType::Offer && transceivers_.empty()) {
        addTransceiver(MediaKind::Audio, TransceiverDirection::RecvOnly);
        addTransceiver(MediaKind::Video, TransceiverDirection::RecvOnly);
    }
    loop_.post([callback]() { callback(SessionError()); });
}

SessionError FakeNativePeerConnection::addIceCandidate(const IceCandidate& candidate) {
    if (fail_candidates) {
        return SessionError(ErrorCode::IceApplyError, "candidate refused");
    }
    applied_candidates.push_back(candidate);
    return SessionError();
}

std::vector<NativeTransceiverPtr> FakeNativePeerConnection::transceivers() const {
    return std::vector<NativeTransceiverPtr>(transceivers_.begin(), transceivers_.end());
}

NativeTransceiverPtr FakeNativePeerConnection::addTrack(const MediaTrackPtr& track) {
    if (!track) {
        return nullptr;
    }
    auto transceiver = std::make_shared<FakeTransceiver>(track->kind(), TransceiverDirection::SendRecv, track);
    transceivers_.push_back(transceiver);
    return transceiver;
}

NativeTransceiverPtr FakeNativePeerConnection::addTransceiver(MediaKind kind, TransceiverDirection direction) {
    auto transceiver = std::make_shared<FakeTransceiver>(kind, direction, nullptr);
    transceivers_.push_back(transceiver);
    return transceiver;
}

SessionError FakeNativePeerConnection::removeTrack(const MediaTrackPtr& track) {
    for (const auto& transceiver : transceivers_) {
        if (track && transceiver->senderTrack() == track) {
            transceiver->replaceSenderTrack(nullptr);
            transceiver->setDirection(TransceiverDirection::RecvOnly);
            return SessionError();
        }
    }
    return SessionError(ErrorCode::Internal, "track is not attached");
}

NativeDataChannelPtr FakeNativePeerConnection::createDataChannel(const std::string& label, bool ordered,
                                                                 int max_retransmits) {
    data_channel = std::make_shared<FakeDataChannel>(label);
    return data_channel;
}

void FakeNativePeerConnection::getStats(StatsCallback callback) {
    stats_requests++;
    SessionError error = stats_error;
    StatsReport report = next_stats;
    loop_.post([callback, error, report]() { callback(error, report); });
}

FakeTransceiverPtr FakeNativePeerConnection::sender(MediaKind kind) const {
    for (const auto& transceiver : transceivers_) {
        if (transceiver->kind() == kind && transceiver->senderTrack()) {
            return transceiver;
        }
    }
    return nullptr;
}

bool FakeNativePeerConnection::emitIceCandidate(const IceCandidate& candidate) {
    if (!observer_.on_ice_candidate) return false;
    observer_.on_ice_candidate(candidate);
    return true;
}

bool FakeNativePeerConnection::emitTrack(const MediaTrackPtr& track, const MediaStreamPtr& stream) {
    if (!observer_.on_track) return false;
    observer_.on_track(track, stream);
    return true;
}

bool FakeNativePeerConnection::emitConnectionState(ConnectionState state) {
    if (!observer_.on_connection_state) return false;
    observer_.on_connection_state(state);
    return true;
}

bool FakeNativePeerConnection::emitDataChannel(const NativeDataChannelPtr& channel) {
    if (!observer_.on_data_channel) return false;
    observer_.on_data_channel(channel);
    return true;
}

// ==================== FakePlaybackSink ====================

FakePlaybackSink::FakePlaybackSink(const std::string& peer_id, FakeMediaBackend* backend,
                                   const std::deque<PlaybackStatus>& script)
    : peer_id_(peer_id)
    , backend_(backend)
    , script_(script) {
}

FakePlaybackSink::~FakePlaybackSink() {
    if (backend_) {
        backend_->forget(this, peer_id_);
    }
}

PlaybackStatus FakePlaybackSink::play(std::string* error) {
    play_count++;
    PlaybackStatus status = PlaybackStatus::Playing;
    if (!script_.empty()) {
        status = script_.front();
        script_.pop_front();
    }
    if (status != PlaybackStatus::Playing && error) {
        *error = status == PlaybackStatus::Blocked ? "autoplay blocked" : "no output device";
    }
    return status;
}

// ==================== FakeMediaBackend ====================

std::unique_ptr<NativePeerConnection> FakeMediaBackend::createPeerConnection(const std::string& peer_id,
                                                                            const IceConfig& config) {
    ice_configs[peer_id] = config;
    if (fail_create_connection) {
        return nullptr;
    }
    auto connection = new FakeNativePeerConnection(peer_id, loop_, this);
    connections_[peer_id] = connection;
    return std::unique_ptr<NativePeerConnection>(connection);
}

void FakeMediaBackend::acquireUserMedia(const MediaConstraints& constraints, UserMediaCallback callback) {
    user_media_requests.push_back(constraints);

    SessionError error;
    if (!user_media_errors.empty()) {
        error = user_media_errors.front();
        user_media_errors.pop_front();
    }

    UserMedia media;
    if (!error) {
        if (constraints.audio) {
            last_microphone = std::make_shared<FakeTrack>("mic-" + std::to_string(next_track_++),
                                                          MediaKind::Audio, TrackSource::Microphone);
            created_tracks.push_back(last_microphone);
            media.audio = last_microphone;
        }
        if (constraints.video) {
            last_camera = std::make_shared<FakeTrack>("camera-" + std::to_string(next_track_++),
                                                      MediaKind::Video, TrackSource::Camera);
            created_tracks.push_back(last_camera);
            media.video = last_camera;
        }
    }

    auto deliver = [callback, error, media]() { callback(error, media); };
    if (hold_user_media) {
        held_user_media_.push_back(deliver);
    } else {
        loop_.post(deliver);
    }
}

void FakeMediaBackend::acquireDisplayMedia(DisplayMediaCallback callback) {
    display_requests++;

    SessionError error = display_error;
    MediaTrackPtr track;
    if (!error) {
        last_screen = std::make_shared<FakeTrack>("screen-" + std::to_string(next_track_++),
                                                  MediaKind::Video, TrackSource::Screen);
        created_tracks.push_back(last_screen);
        track = last_screen;
    }

    auto deliver = [callback, error, track]() { callback(error, track); };
    if (hold_display_media) {
        held_display_media_.push_back(deliver);
    } else {
        loop_.post(deliver);
    }
}

std::unique_ptr<PlaybackSink> FakeMediaBackend::createPlaybackSink(const std::string& peer_id) {
    if (fail_create_sink) {
        return nullptr;
    }
    sinks_created++;
    auto sink = new FakePlaybackSink(peer_id, this, playback_script);
    sinks_[peer_id] = sink;
    return std::unique_ptr<PlaybackSink>(sink);
}

FakeNativePeerConnection* FakeMediaBackend::connection(const std::string& peer_id) const {
    auto it = connections_.find(peer_id);
    return it == connections_.end() ? nullptr : it->second;
}

FakePlaybackSink* FakeMediaBackend::sink(const std::string& peer_id) const {
    auto it = sinks_.find(peer_id);
    return it == sinks_.end() ? nullptr : it->second;
}

void FakeMediaBackend::releaseHeldUserMedia() {
    std::vector<std::function<void()>> held;
    held.swap(held_user_media_);
    for (auto& deliver : held) {
        loop_.post(deliver);
    }
}

void FakeMediaBackend::releaseHeldDisplayMedia() {
    std::vector<std::function<void()>> held;
    held.swap(held_display_media_);
    for (auto& deliver : held) {
        loop_.post(deliver);
    }
}

void FakeMediaBackend::forget(FakeNativePeerConnection* connection, const std::string& peer_id) {
    auto it = connections_.find(peer_id);
    if (it != connections_.end() && it->second == connection) {
        connections_.erase(it);
    }
}

void FakeMediaBackend::forget(FakePlaybackSink* sink, const std::string& peer_id) {
    auto it = sinks_.find(peer_id);
    if (it != sinks_.end() && it->second == sink) {
        sinks_.erase(it);
    }
}

// ==================== RecordingSignalingAdapter ====================

size_t RecordingSignalingAdapter::count(SignalingMessageType type, const std::string& to) const {
    size_t total = 0;
    for (const auto& message : sent) {
        if (message.type == type && (to.empty() || message.to == to)) {
            total++;
        }
    }
    return total;
}

size_t RecordingSignalingAdapter::countTo(const std::string& to) const {
    size_t total = 0;
    for (const auto& message : sent) {
        if (message.to == to) {
            total++;
        }
    }
    return total;
}

const SignalingMessage* RecordingSignalingAdapter::last(SignalingMessageType type, const std::string& to) const {
    for (auto it = sent.rbegin(); it != sent.rend(); ++it) {
        if (it->type == type && (to.empty() || it->to == to)) {
            return &*it;
        }
    }
    return nullptr;
}
