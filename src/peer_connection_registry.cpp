#include "peer_connection_registry.h"
#include "log.h"

PeerConnectionRegistry::~PeerConnectionRegistry() {
    clear();
}

PeerConnectionPtr PeerConnectionRegistry::create(const std::string& peer_id, PeerRole role,
                                                 std::unique_ptr<NativePeerConnection> native,
                                                 SessionError* error) {
    if (peers_.count(peer_id) > 0) {
        LOG_VAR("REGISTRY-WARN", "Rejecting duplicate peer connection: ", peer_id);
        if (native) {
            native->close();
        }
        if (error) {
            *error = SessionError(ErrorCode::DuplicatePeer, "peer " + peer_id + " already has a connection");
        }
        return nullptr;
    }
    if (!native) {
        if (error) {
            *error = SessionError(ErrorCode::Internal, "media stack returned no connection for " + peer_id);
        }
        return nullptr;
    }

    auto peer = std::make_shared<PeerConnection>(peer_id, role, std::move(native));
    peers_[peer_id] = peer;
    LOG("REGISTRY", "Peer added: " << peer_id << ", Total peers: " << peers_.size());
    if (error) {
        *error = SessionError();
    }
    return peer;
}

PeerConnectionPtr PeerConnectionRegistry::lookup(const std::string& peer_id) const {
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return nullptr;
    }
    return it->second;
}

bool PeerConnectionRegistry::contains(const std::string& peer_id) const {
    return peers_.count(peer_id) > 0;
}

bool PeerConnectionRegistry::remove(const std::string& peer_id) {
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        LOG_VAR("REGISTRY-WARN", "Peer not found in registry: ", peer_id);
        return false;
    }

    // Erase before closing so callbacks fired during close see no entry
    PeerConnectionPtr peer = it->second;
    peers_.erase(it);
    peer->close();
    LOG("REGISTRY", "Peer removed: " << peer_id << ", Remaining peers: " << peers_.size());
    return true;
}

void PeerConnectionRegistry::clear() {
    if (peers_.empty()) {
        return;
    }
    std::map<std::string, PeerConnectionPtr> peers;
    peers.swap(peers_);
    for (auto& pair : peers) {
        pair.second->close();
    }
    LOG("REGISTRY", "Cleared " << peers.size() << " peer connections");
}

std::vector<std::string> PeerConnectionRegistry::peerIds() const {
    std::vector<std::string> ids;
    ids.reserve(peers_.size());
    for (const auto& pair : peers_) {
        ids.push_back(pair.first);
    }
    return ids;
}

void PeerConnectionRegistry::forEach(const std::function<void(const PeerConnectionPtr&)>& callback) const {
    std::vector<PeerConnectionPtr> snapshot;
    snapshot.reserve(peers_.size());
    for (const auto& pair : peers_) {
        snapshot.push_back(pair.second);
    }
    for (const auto& peer : snapshot) {
        if (!peer->isClosed()) {
            callback(peer);
        }
    }
}
