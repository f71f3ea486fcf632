#ifndef PEER_CONNECTION_REGISTRY_H
#define PEER_CONNECTION_REGISTRY_H

#include "peer_connection.h"
#include "session_error.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Owns the active peer connections, at most one per peer id.
class PeerConnectionRegistry {
public:
    PeerConnectionRegistry() = default;
    ~PeerConnectionRegistry();

    PeerConnectionRegistry(const PeerConnectionRegistry&) = delete;
    PeerConnectionRegistry& operator=(const PeerConnectionRegistry&) = delete;

    // Register a new connection. Fails with DuplicatePeer while an entry for
    // the id exists; the caller has to remove() it first.
    PeerConnectionPtr create(const std::string& peer_id, PeerRole role,
                             std::unique_ptr<NativePeerConnection> native,
                             SessionError* error = nullptr);

    PeerConnectionPtr lookup(const std::string& peer_id) const;
    bool contains(const std::string& peer_id) const;

    // Close and drop the entry. Returns false for an unknown id.
    bool remove(const std::string& peer_id);

    void clear();

    size_t size() const { return peers_.size(); }
    bool empty() const { return peers_.empty(); }
    std::vector<std::string> peerIds() const;

    // Iterates a snapshot, so the callback may remove entries
    void forEach(const std::function<void(const PeerConnectionPtr&)>& callback) const;

private:
    std::map<std::string, PeerConnectionPtr> peers_;
};

#endif // PEER_CONNECTION_REGISTRY_H
