#include "ice_candidate_queue.h"
#include "log.h"

const char* candidateDispositionName(CandidateDisposition disposition) {
    switch (disposition) {
        case CandidateDisposition::Applied: return "applied";
        case CandidateDisposition::Queued: return "queued";
        case CandidateDisposition::Duplicate: return "duplicate";
        case CandidateDisposition::Rejected: return "rejected";
        case CandidateDisposition::Failed: return "failed";
    }
    return "unknown";
}

IceCandidateQueue::IceCandidateQueue(const std::string& peer_id)
    : peer_id_(peer_id) {
}

CandidateDisposition IceCandidateQueue::enqueueOrApply(const IceCandidate& candidate,
                                                       bool remote_description_set,
                                                       const ApplyFunction& apply) {
    const std::string fingerprint = candidate.fingerprint();
    if (!fingerprints_.insert(fingerprint).second) {
        return CandidateDisposition::Duplicate;
    }

    if (!remote_description_set) {
        LOG("ICE", "Queuing ICE candidate for " << peer_id_ << " (remote desc not set), mlineindex: "
            << candidate.sdp_mline_index);
        queued_.push_back(candidate);
        return CandidateDisposition::Queued;
    }

    return applyOne(candidate, apply);
}

IceCandidateQueue::FlushResult IceCandidateQueue::flush(const ApplyFunction& apply) {
    FlushResult result;
    if (queued_.empty()) {
        return result;
    }

    // Detach first so a re-entrant call cannot see a half-flushed queue
    std::vector<IceCandidate> pending;
    pending.swap(queued_);

    LOG("ICE", "Processing " << pending.size() << " queued ICE candidates for " << peer_id_);
    for (size_t i = 0; i < pending.size(); i++) {
        if (applyOne(pending[i], apply) == CandidateDisposition::Applied) {
            result.applied++;
        } else {
            result.failed++;
        }
    }
    LOG("ICE", "Finished queued candidates for " << peer_id_ << ": " << result.applied
        << " applied, " << result.failed << " failed");
    return result;
}

void IceCandidateQueue::clear() {
    if (!queued_.empty() || !fingerprints_.empty()) {
        LOG("ICE", "Discarding " << queued_.size() << " queued and " << fingerprints_.size()
            << " seen candidates for " << peer_id_);
    }
    queued_.clear();
    fingerprints_.clear();
}

bool IceCandidateQueue::hasSeen(const IceCandidate& candidate) const {
    return fingerprints_.count(candidate.fingerprint()) > 0;
}

CandidateDisposition IceCandidateQueue::applyOne(const IceCandidate& candidate, const ApplyFunction& apply) {
    if (accept_ && !accept_(candidate)) {
        LOG("ICE-WARN", "Skipping invalid candidate for " << peer_id_ << ": " << candidate.candidate);
        return CandidateDisposition::Rejected;
    }

    SessionError error = apply(candidate);
    if (error) {
        LOG("ICE-ERROR", "Failed to add ICE candidate for " << peer_id_ << ": " << error.describe());
        return CandidateDisposition::Failed;
    }
    return CandidateDisposition::Applied;
}
