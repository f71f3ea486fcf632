#include "ice_candidate_queue.h"

#include <gtest/gtest.h>

#include <vector>

namespace {

IceCandidate candidate(const std::string& value, int mline = 0, const std::string& mid = "") {
    IceCandidate c;
    c.candidate = value;
    c.sdp_mline_index = mline;
    c.sdp_mid = mid;
    return c;
}

class IceCandidateQueueTest : public ::testing::Test {
protected:
    IceCandidateQueueTest() : queue_("viewer-1") {}

    IceCandidateQueue::ApplyFunction recorder() {
        return [this](const IceCandidate& c) {
            applied_.push_back(c.candidate);
            return SessionError();
        };
    }

    IceCandidateQueue queue_;
    std::vector<std::string> applied_;
};

TEST_F(IceCandidateQueueTest, QueuesUntilRemoteDescriptionThenFlushesInOrder) {
    EXPECT_EQ(CandidateDisposition::Queued, queue_.enqueueOrApply(candidate("a"), false, recorder()));
    EXPECT_EQ(CandidateDisposition::Queued, queue_.enqueueOrApply(candidate("b"), false, recorder()));
    EXPECT_EQ(CandidateDisposition::Queued, queue_.enqueueOrApply(candidate("c"), false, recorder()));
    EXPECT_TRUE(applied_.empty());
    EXPECT_EQ(3u, queue_.pendingCount());

    IceCandidateQueue::FlushResult result = queue_.flush(recorder());
    EXPECT_EQ(3u, result.applied);
    EXPECT_EQ(0u, result.failed);
    EXPECT_EQ((std::vector<std::string>{"a", "b", "c"}), applied_);
    EXPECT_EQ(0u, queue_.pendingCount());

    // A second flush has nothing left to apply
    result = queue_.flush(recorder());
    EXPECT_EQ(0u, result.applied);
    EXPECT_EQ(3u, applied_.size());
}

TEST_F(IceCandidateQueueTest, AppliesImmediatelyOnceRemoteDescriptionIsSet) {
    EXPECT_EQ(CandidateDisposition::Applied, queue_.enqueueOrApply(candidate("a"), true, recorder()));
    EXPECT_EQ(1u, applied_.size());
    EXPECT_EQ(0u, queue_.pendingCount());
}

TEST_F(IceCandidateQueueTest, DuplicateWhileQueuedIsDropped) {
    queue_.enqueueOrApply(candidate("a", 0, "0"), false, recorder());
    EXPECT_EQ(CandidateDisposition::Duplicate, queue_.enqueueOrApply(candidate("a", 0, "0"), false, recorder()));
    EXPECT_EQ(1u, queue_.pendingCount());

    queue_.flush(recorder());
    EXPECT_EQ(1u, applied_.size());
}

TEST_F(IceCandidateQueueTest, DuplicateAfterApplyIsDropped) {
    queue_.enqueueOrApply(candidate("a"), true, recorder());
    EXPECT_EQ(CandidateDisposition::Duplicate, queue_.enqueueOrApply(candidate("a"), true, recorder()));
    EXPECT_EQ(1u, applied_.size());
}

TEST_F(IceCandidateQueueTest, SameCandidateOnAnotherMLineIsDistinct) {
    queue_.enqueueOrApply(candidate("a", 0), true, recorder());
    EXPECT_EQ(CandidateDisposition::Applied, queue_.enqueueOrApply(candidate("a", 1), true, recorder()));
    EXPECT_EQ(2u, queue_.seenCount());
}

TEST_F(IceCandidateQueueTest, FailingCandidateDoesNotStopTheFlush) {
    queue_.enqueueOrApply(candidate("a"), false, recorder());
    queue_.enqueueOrApply(candidate("bad"), false, recorder());
    queue_.enqueueOrApply(candidate("c"), false, recorder());

    IceCandidateQueue::FlushResult result = queue_.flush([this](const IceCandidate& c) {
        if (c.candidate == "bad") {
            return SessionError(ErrorCode::IceApplyError, "refused");
        }
        applied_.push_back(c.candidate);
        return SessionError();
    });

    EXPECT_EQ(2u, result.applied);
    EXPECT_EQ(1u, result.failed);
    EXPECT_EQ((std::vector<std::string>{"a", "c"}), applied_);
}

TEST_F(IceCandidateQueueTest, AcceptFilterRejectsBeforeApply) {
    queue_.setAcceptFilter([](const IceCandidate& c) { return c.candidate != "junk"; });

    EXPECT_EQ(CandidateDisposition::Rejected, queue_.enqueueOrApply(candidate("junk"), true, recorder()));
    EXPECT_EQ(CandidateDisposition::Applied, queue_.enqueueOrApply(candidate("good"), true, recorder()));
    EXPECT_EQ((std::vector<std::string>{"good"}), applied_);
}

TEST_F(IceCandidateQueueTest, RejectedCandidatesCountAsFailedOnFlush) {
    queue_.setAcceptFilter([](const IceCandidate& c) { return c.candidate != "junk"; });
    queue_.enqueueOrApply(candidate("junk"), false, recorder());
    queue_.enqueueOrApply(candidate("good"), false, recorder());

    IceCandidateQueue::FlushResult result = queue_.flush(recorder());
    EXPECT_EQ(1u, result.applied);
    EXPECT_EQ(1u, result.failed);
}

TEST_F(IceCandidateQueueTest, ClearForgetsQueuedAndSeen) {
    queue_.enqueueOrApply(candidate("a"), false, recorder());
    queue_.clear();

    EXPECT_EQ(0u, queue_.pendingCount());
    EXPECT_EQ(0u, queue_.seenCount());
    EXPECT_FALSE(queue_.hasSeen(candidate("a")));
    EXPECT_EQ(CandidateDisposition::Applied, queue_.enqueueOrApply(candidate("a"), true, recorder()));
}

TEST_F(IceCandidateQueueTest, EndOfCandidatesMarkerIsDedupedToo) {
    EXPECT_EQ("null-candidate", candidate("").fingerprint());
    queue_.enqueueOrApply(candidate(""), true, recorder());
    EXPECT_EQ(CandidateDisposition::Duplicate, queue_.enqueueOrApply(candidate(""), true, recorder()));
}

}  // namespace
