#include "fake_media.h"
#include "health_monitor.h"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace {

using std::chrono::milliseconds;

StatsReport inbound(uint64_t video_bytes, uint64_t audio_bytes) {
    StatsReport report;
    RtpStreamStats video;
    video.kind = MediaKind::Video;
    video.direction = RtpDirection::Inbound;
    video.bytes = video_bytes;
    RtpStreamStats audio;
    audio.kind = MediaKind::Audio;
    audio.direction = RtpDirection::Inbound;
    audio.bytes = audio_bytes;
    report.streams = {video, audio};
    return report;
}

class HealthMonitorTest : public ::testing::Test {
protected:
    HealthMonitorTest()
        : monitor_(loop_, milliseconds(1000), 2, milliseconds(5000)) {
        native_ = new FakeNativePeerConnection("viewer-1", loop_);
        peer_ = std::make_shared<PeerConnection>("viewer-1", PeerRole::Receiver,
                                                 std::unique_ptr<NativePeerConnection>(native_));
        peer_->addRemoteKind(MediaKind::Video);
        peer_->addRemoteKind(MediaKind::Audio);
        monitor_.setOnStalled([this](const std::string& peer_id, MediaKind kind) {
            stalls_.push_back(std::make_pair(peer_id, kind));
        });
    }

    void setState(ConnectionState state) {
        peer_->setConnectionState(state);
        monitor_.onConnectionStateChanged(peer_, state);
    }

    FakeEventLoop loop_;
    HealthMonitor monitor_;
    FakeNativePeerConnection* native_;
    PeerConnectionPtr peer_;
    std::vector<std::pair<std::string, MediaKind>> stalls_;
};

TEST_F(HealthMonitorTest, PollsOnlyWhileConnected) {
    setState(ConnectionState::Connecting);
    loop_.advance(milliseconds(3000));
    EXPECT_EQ(0, native_->stats_requests);

    setState(ConnectionState::Connected);
    EXPECT_EQ(1u, loop_.timerCount());
    loop_.advance(milliseconds(3000));
    EXPECT_EQ(3, native_->stats_requests);

    setState(ConnectionState::Disconnected);
    EXPECT_EQ(0u, loop_.timerCount());
    loop_.advance(milliseconds(3000));
    EXPECT_EQ(3, native_->stats_requests);
}

TEST_F(HealthMonitorTest, StallRaisedOnceAfterThreshold) {
    native_->next_stats = inbound(0, 0);
    setState(ConnectionState::Connected);

    loop_.advance(milliseconds(1000));
    EXPECT_TRUE(stalls_.empty());

    loop_.advance(milliseconds(1000));
    ASSERT_EQ(2u, stalls_.size());
    EXPECT_EQ("viewer-1", stalls_[0].first);

    // Still stalled; no repeat warnings
    loop_.advance(milliseconds(5000));
    EXPECT_EQ(2u, stalls_.size());
}

TEST_F(HealthMonitorTest, GrowingByteCountsAreHealthy) {
    setState(ConnectionState::Connected);
    for (uint64_t i = 1; i <= 5; i++) {
        native_->next_stats = inbound(i * 1000, i * 100);
        loop_.advance(milliseconds(1000));
    }
    EXPECT_TRUE(stalls_.empty());
    EXPECT_EQ(5, peer_->health().polls);
}

TEST_F(HealthMonitorTest, OnlyTheFrozenKindStalls) {
    setState(ConnectionState::Connected);
    for (uint64_t i = 1; i <= 3; i++) {
        native_->next_stats = inbound(5000, i * 100);
        loop_.advance(milliseconds(1000));
    }
    ASSERT_EQ(1u, stalls_.size());
    EXPECT_EQ(MediaKind::Video, stalls_[0].second);
}

TEST_F(HealthMonitorTest, RecoveryRearmsTheWarning) {
    native_->next_stats = inbound(100, 100);
    setState(ConnectionState::Connected);
    loop_.advance(milliseconds(3000));
    EXPECT_EQ(2u, stalls_.size());

    native_->next_stats = inbound(200, 200);
    loop_.advance(milliseconds(1000));
    EXPECT_TRUE(peer_->health().stalled.empty());

    loop_.advance(milliseconds(2000));
    EXPECT_EQ(4u, stalls_.size());
}

TEST_F(HealthMonitorTest, StatsErrorNeitherAdvancesNorResets) {
    native_->next_stats = inbound(0, 0);
    setState(ConnectionState::Connected);
    loop_.advance(milliseconds(1000));
    EXPECT_EQ(1, peer_->health().zero_polls[MediaKind::Video]);

    native_->stats_error = SessionError(ErrorCode::StatsUnavailable, "no report");
    loop_.advance(milliseconds(3000));
    EXPECT_EQ(1, peer_->health().zero_polls[MediaKind::Video]);
    EXPECT_TRUE(stalls_.empty());

    native_->stats_error = SessionError();
    loop_.advance(milliseconds(1000));
    EXPECT_EQ(2u, stalls_.size());
}

TEST_F(HealthMonitorTest, ConnectWatchdogIsCancelledOnConnect) {
    setState(ConnectionState::Connecting);
    EXPECT_EQ(1u, loop_.timerCount());
    EXPECT_TRUE(peer_->health().connect_timer.active());

    setState(ConnectionState::Connected);
    EXPECT_FALSE(peer_->health().connect_timer.active());
    EXPECT_TRUE(peer_->health().poll_timer.active());
    EXPECT_EQ(1u, loop_.timerCount());
}

TEST_F(HealthMonitorTest, ConnectWatchdogFiresOnce) {
    setState(ConnectionState::Connecting);
    loop_.advance(milliseconds(5000));
    EXPECT_FALSE(peer_->health().connect_timer.active());
    EXPECT_EQ(0u, loop_.timerCount());
    EXPECT_EQ(ConnectionState::Connecting, peer_->connectionState());
}

TEST_F(HealthMonitorTest, FailureStopsEverything) {
    setState(ConnectionState::Connected);
    setState(ConnectionState::Failed);
    EXPECT_FALSE(peer_->health().poll_timer.active());
    EXPECT_EQ(0u, loop_.timerCount());
}

TEST_F(HealthMonitorTest, ClosingThePeerCancelsItsTimer) {
    setState(ConnectionState::Connected);
    peer_->close();
    EXPECT_EQ(0u, loop_.timerCount());
    loop_.advance(milliseconds(5000));
    EXPECT_TRUE(stalls_.empty());
}

TEST_F(HealthMonitorTest, ReportArrivingAfterStopIsIgnored) {
    native_->next_stats = inbound(0, 0);
    setState(ConnectionState::Connected);
    monitor_.poll(peer_);          // report posted, not yet delivered
    monitor_.stop(*peer_);
    loop_.runPending();
    EXPECT_EQ(0, peer_->health().polls);
}

}  // namespace
