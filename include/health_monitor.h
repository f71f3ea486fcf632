#ifndef HEALTH_MONITOR_H
#define HEALTH_MONITOR_H

#include "event_loop.h"
#include "media_types.h"
#include "peer_connection.h"

#include <chrono>
#include <functional>
#include <string>

// Watches connected peers for inbound media that stopped flowing. Raises a
// warning only; nothing is restarted or torn down from here.
class HealthMonitor {
public:
    using StallCallback = std::function<void(const std::string& peer_id, MediaKind kind)>;

    HealthMonitor(EventLoop& loop, std::chrono::milliseconds interval, int stall_threshold,
                  std::chrono::milliseconds connect_timeout);

    void setOnStalled(StallCallback callback) { on_stalled_ = std::move(callback); }

    // Start/stop polling and the connect watchdog from a state change
    void onConnectionStateChanged(const PeerConnectionPtr& peer, ConnectionState state);

    // Cancel everything for the peer
    void stop(PeerConnection& peer);

    // One stats round; normally driven by the repeating timer
    void poll(const PeerConnectionPtr& peer);

    std::chrono::milliseconds interval() const { return interval_; }
    int stallThreshold() const { return stall_threshold_; }

private:
    void startPolling(const PeerConnectionPtr& peer);
    void armConnectWatchdog(const PeerConnectionPtr& peer);
    void evaluate(PeerConnection& peer, const StatsReport& report);

    EventLoop& loop_;
    std::chrono::milliseconds interval_;
    int stall_threshold_;
    std::chrono::milliseconds connect_timeout_;
    StallCallback on_stalled_;
};

#endif // HEALTH_MONITOR_H
