#ifndef ICE_CANDIDATE_QUEUE_H
#define ICE_CANDIDATE_QUEUE_H

#include "media_types.h"
#include "session_error.h"

#include <functional>
#include <set>
#include <string>
#include <vector>

enum class CandidateDisposition {
    Applied,
    Queued,
    Duplicate,
    Rejected,   // refused by the platform profile
    Failed      // media stack refused it
};

const char* candidateDispositionName(CandidateDisposition disposition);

// Per-peer candidate buffer. Candidates are held until the peer's remote
// description is set, then flushed once in arrival order. Every fingerprint
// seen is remembered so a redelivered candidate is dropped whether its first
// copy is still queued or already applied.
class IceCandidateQueue {
public:
    using ApplyFunction = std::function<SessionError(const IceCandidate&)>;
    using AcceptFunction = std::function<bool(const IceCandidate&)>;

    struct FlushResult {
        size_t applied = 0;
        size_t failed = 0;
    };

    explicit IceCandidateQueue(const std::string& peer_id);

    // Optional gate applied before a candidate reaches the media stack
    void setAcceptFilter(AcceptFunction filter) { accept_ = std::move(filter); }

    CandidateDisposition enqueueOrApply(const IceCandidate& candidate,
                                        bool remote_description_set,
                                        const ApplyFunction& apply);

    // Apply every queued candidate in arrival order, then empty the queue.
    // A failing candidate is logged and the rest still go through.
    FlushResult flush(const ApplyFunction& apply);

    // Drop queued candidates and the dedupe set
    void clear();

    size_t pendingCount() const { return queued_.size(); }
    size_t seenCount() const { return fingerprints_.size(); }
    bool hasSeen(const IceCandidate& candidate) const;

private:
    CandidateDisposition applyOne(const IceCandidate& candidate, const ApplyFunction& apply);

    std::string peer_id_;
    std::vector<IceCandidate> queued_;
    std::set<std::string> fingerprints_;
    AcceptFunction accept_;
};

#endif // ICE_CANDIDATE_QUEUE_H
