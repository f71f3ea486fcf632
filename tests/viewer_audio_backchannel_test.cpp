#include "fake_media.h"
#include "viewer_audio_backchannel.h"

#include <gtest/gtest.h>

#include <vector>

namespace {

MediaStreamPtr viewerStream(const std::string& id) {
    MediaStreamPtr stream = std::make_shared<MediaStream>(id);
    stream->addTrack(std::make_shared<FakeTrack>(id + "-audio", MediaKind::Audio, TrackSource::Remote));
    return stream;
}

class ViewerAudioBackchannelTest : public ::testing::Test {
protected:
    ViewerAudioBackchannelTest()
        : backend_(loop_)
        , backchannel_(backend_) {
        backchannel_.setOnPlaybackFailed([this](const std::string& peer_id, const SessionError& error) {
            failures_.push_back(peer_id + ":" + errorCodeName(error.code));
        });
    }

    FakeEventLoop loop_;
    FakeMediaBackend backend_;
    ViewerAudioBackchannel backchannel_;
    std::vector<std::string> failures_;
};

TEST_F(ViewerAudioBackchannelTest, OneSinkPerViewer) {
    MediaStreamPtr stream = viewerStream("v1");
    ASSERT_FALSE(backchannel_.attach("viewer-1", stream));
    ASSERT_FALSE(backchannel_.attach("viewer-1", stream));

    EXPECT_EQ(1, backend_.sinks_created);
    EXPECT_EQ(1u, backchannel_.sinkCount());
    FakePlaybackSink* sink = backend_.sink("viewer-1");
    ASSERT_NE(nullptr, sink);
    EXPECT_EQ(stream, sink->source());
    EXPECT_EQ(1, sink->play_count);
    EXPECT_TRUE(backchannel_.entry("viewer-1")->attached);
}

TEST_F(ViewerAudioBackchannelTest, NewStreamReusesTheSink) {
    backchannel_.attach("viewer-1", viewerStream("v1-a"));
    MediaStreamPtr replacement = viewerStream("v1-b");
    ASSERT_FALSE(backchannel_.attach("viewer-1", replacement));

    EXPECT_EQ(1, backend_.sinks_created);
    FakePlaybackSink* sink = backend_.sink("viewer-1");
    EXPECT_EQ(replacement, sink->source());
    EXPECT_EQ(2, sink->source_changes);
}

TEST_F(ViewerAudioBackchannelTest, SeparateViewersGetSeparateSinks) {
    backchannel_.attach("viewer-1", viewerStream("v1"));
    backchannel_.attach("viewer-2", viewerStream("v2"));
    EXPECT_EQ(2, backend_.sinks_created);

    backchannel_.release("viewer-1");
    EXPECT_EQ(nullptr, backend_.sink("viewer-1"));
    EXPECT_NE(nullptr, backend_.sink("viewer-2"));
    EXPECT_FALSE(backchannel_.hasSink("viewer-1"));
}

TEST_F(ViewerAudioBackchannelTest, BlockedPlaybackRetriesOnUserInteraction) {
    backend_.playback_script = {PlaybackStatus::Blocked, PlaybackStatus::Playing};

    SessionError error = backchannel_.attach("viewer-1", viewerStream("v1"));
    EXPECT_EQ(ErrorCode::PlaybackBlocked, error.code);
    EXPECT_TRUE(backchannel_.entry("viewer-1")->retry_pending);
    EXPECT_FALSE(backchannel_.entry("viewer-1")->attached);
    EXPECT_TRUE(failures_.empty());

    backchannel_.notifyUserInteraction();

    EXPECT_TRUE(backchannel_.entry("viewer-1")->attached);
    EXPECT_FALSE(backchannel_.entry("viewer-1")->retry_pending);
    EXPECT_EQ(2, backend_.sink("viewer-1")->play_count);
    EXPECT_TRUE(failures_.empty());

    // Nothing left to retry
    backchannel_.notifyUserInteraction();
    EXPECT_EQ(2, backend_.sink("viewer-1")->play_count);
}

TEST_F(ViewerAudioBackchannelTest, SecondRefusalIsReported) {
    backend_.playback_script = {PlaybackStatus::Blocked, PlaybackStatus::Blocked};
    backchannel_.attach("viewer-1", viewerStream("v1"));

    backchannel_.notifyUserInteraction();
    ASSERT_EQ(1u, failures_.size());
    EXPECT_EQ(std::string("viewer-1:") + errorCodeName(ErrorCode::PlaybackFailed), failures_[0]);

    // Only one retry per block
    backchannel_.notifyUserInteraction();
    EXPECT_EQ(1u, failures_.size());
    EXPECT_EQ(2, backend_.sink("viewer-1")->play_count);
}

TEST_F(ViewerAudioBackchannelTest, OutputFailureIsReported) {
    backend_.playback_script = {PlaybackStatus::Failed};
    SessionError error = backchannel_.attach("viewer-1", viewerStream("v1"));

    EXPECT_EQ(ErrorCode::PlaybackFailed, error.code);
    EXPECT_EQ(1u, failures_.size());
    EXPECT_FALSE(backchannel_.entry("viewer-1")->retry_pending);
}

TEST_F(ViewerAudioBackchannelTest, SinkCreationFailureIsReported) {
    backend_.fail_create_sink = true;
    EXPECT_EQ(ErrorCode::PlaybackFailed, backchannel_.attach("viewer-1", viewerStream("v1")).code);
    EXPECT_EQ(1u, failures_.size());
    EXPECT_FALSE(backchannel_.hasSink("viewer-1"));
}

TEST_F(ViewerAudioBackchannelTest, ReleaseAllStopsEverySink) {
    backchannel_.attach("viewer-1", viewerStream("v1"));
    backchannel_.attach("viewer-2", viewerStream("v2"));
    backchannel_.releaseAll();

    EXPECT_EQ(0u, backchannel_.sinkCount());
    EXPECT_EQ(nullptr, backend_.sink("viewer-1"));
    EXPECT_EQ(nullptr, backend_.sink("viewer-2"));
}

TEST_F(ViewerAudioBackchannelTest, NullStreamIsAnError) {
    EXPECT_TRUE(backchannel_.attach("viewer-1", nullptr));
    EXPECT_EQ(0, backend_.sinks_created);
}

}  // namespace
