#include "health_monitor.h"
#include "log.h"

HealthMonitor::HealthMonitor(EventLoop& loop, std::chrono::milliseconds interval, int stall_threshold,
                             std::chrono::milliseconds connect_timeout)
    : loop_(loop)
    , interval_(interval)
    , stall_threshold_(stall_threshold > 0 ? stall_threshold : 1)
    , connect_timeout_(connect_timeout) {
}

void HealthMonitor::onConnectionStateChanged(const PeerConnectionPtr& peer, ConnectionState state) {
    HealthRecord& health = peer->health();

    switch (state) {
        case ConnectionState::Connecting:
            armConnectWatchdog(peer);
            break;
        case ConnectionState::Connected:
            health.connect_timer.reset();
            startPolling(peer);
            break;
        case ConnectionState::New:
            break;
        case ConnectionState::Disconnected:
        case ConnectionState::Failed:
        case ConnectionState::Closed:
            stop(*peer);
            break;
    }
}

void HealthMonitor::stop(PeerConnection& peer) {
    HealthRecord& health = peer.health();
    if (health.poll_timer.active()) {
        LOG_VAR("HEALTH", "Stopping stats polling for ", peer.peerId());
    }
    health.poll_timer.reset();
    health.connect_timer.reset();
    health.poll_in_flight = false;
    health.zero_polls.clear();
    health.last_bytes.clear();
    health.stalled.clear();
}

void HealthMonitor::startPolling(const PeerConnectionPtr& peer) {
    HealthRecord& health = peer->health();
    if (health.poll_timer.active()) {
        return;
    }

    // Fresh counters every time the connection (re)enters connected
    health.zero_polls.clear();
    health.last_bytes.clear();
    health.stalled.clear();
    health.polls = 0;
    health.poll_in_flight = false;

    PeerConnectionWeakPtr weak = peer;
    EventLoop::TimerId id = loop_.scheduleRepeating(interval_, [this, weak]() {
        PeerConnectionPtr peer = weak.lock();
        if (peer && !peer->isClosed()) {
            poll(peer);
        }
    });
    health.poll_timer = ScopedTimer(&loop_, id);
    LOG("HEALTH", "Polling stats for " << peer->peerId() << " every " << interval_.count() << "ms");
}

void HealthMonitor::armConnectWatchdog(const PeerConnectionPtr& peer) {
    HealthRecord& health = peer->health();
    if (health.connect_timer.active() || connect_timeout_.count() <= 0) {
        return;
    }

    PeerConnectionWeakPtr weak = peer;
    std::chrono::milliseconds timeout = connect_timeout_;
    EventLoop::TimerId id = loop_.scheduleOnce(timeout, [weak, timeout]() {
        PeerConnectionPtr peer = weak.lock();
        if (!peer || peer->isClosed()) {
            return;
        }
        peer->health().connect_timer.release();
        if (peer->connectionState() == ConnectionState::Connecting) {
            LOG("HEALTH-WARN", peer->peerId() << " still connecting after " << timeout.count() << "ms");
        }
    });
    health.connect_timer = ScopedTimer(&loop_, id);
}

void HealthMonitor::poll(const PeerConnectionPtr& peer) {
    HealthRecord& health = peer->health();
    if (peer->connectionState() != ConnectionState::Connected || !peer->native()) {
        stop(*peer);
        return;
    }
    if (health.poll_in_flight) {
        return;
    }
    health.poll_in_flight = true;

    PeerConnectionWeakPtr weak = peer;
    peer->native()->getStats([this, weak](const SessionError& error, const StatsReport& report) {
        PeerConnectionPtr peer = weak.lock();
        if (!peer || peer->isClosed()) {
            return;
        }
        HealthRecord& health = peer->health();
        health.poll_in_flight = false;
        if (peer->connectionState() != ConnectionState::Connected || !health.poll_timer.active()) {
            return;
        }
        if (error) {
            // Counter neither advances nor resets on a missing report
            LOG("HEALTH-WARN", peer->peerId() << " stats unavailable: " << error.describe());
            return;
        }
        evaluate(*peer, report);
    });
}

void HealthMonitor::evaluate(PeerConnection& peer, const StatsReport& report) {
    HealthRecord& health = peer.health();
    health.polls++;

    for (MediaKind kind : peer.remoteKinds()) {
        bool found = false;
        uint64_t bytes = report.inboundBytes(kind, &found);
        uint64_t previous = health.last_bytes[kind];
        if (found) {
            health.last_bytes[kind] = bytes;
        }

        // Zero bytes received since the previous poll
        if (found && bytes > previous) {
            health.zero_polls[kind] = 0;
            if (health.stalled.erase(kind) > 0) {
                LOG("HEALTH", peer.peerId() << " " << mediaKindName(kind) << " flowing again");
            }
            continue;
        }

        int zero = ++health.zero_polls[kind];
        if (zero >= stall_threshold_ && health.stalled.count(kind) == 0) {
            health.stalled.insert(kind);
            LOG("HEALTH-WARN", peer.peerId() << " " << mediaKindName(kind)
                << " stalled: no new bytes in " << zero << " consecutive polls");
            if (on_stalled_) {
                on_stalled_(peer.peerId(), kind);
            }
        }
    }
}
