#ifndef SIGNALING_CLIENT_H
#define SIGNALING_CLIENT_H

#include "event_loop.h"
#include "signaling_message.h"

#include <string>
#include <functional>
#include <memory>
#include <thread>
#include <atomic>
#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>
#include <json/json.h>

// TLS client for wss://
typedef websocketpp::client<websocketpp::config::asio_tls_client> WSClientTLS;
// Non-TLS client for ws://
typedef websocketpp::client<websocketpp::config::asio_client> WSClientNoTLS;
typedef websocketpp::connection_hdl ConnectionHdl;

// Relay-socket signaling. The websocket runs on its own io thread; every
// inbound message is parsed there and handed to the callbacks on the loop.
class SignalingClient : public SignalingAdapter {
public:
    SignalingClient(const std::string& server_url, EventLoop& loop);
    ~SignalingClient() override;

    // Connect to signaling server (waits up to 5s for the handshake)
    bool connect();

    // Disconnect
    void disconnect();

    bool isConnected() const { return connected_; }
    bool usesTls() const { return use_tls_; }

    // Announce ourselves to the relay; role is "broadcaster" or "viewer"
    bool registerPeer(const std::string& role, const std::string& stream_id,
                      const std::string& client_id);

    // SignalingAdapter
    void send(const SignalingMessage& message) override;

    // Set callbacks
    void setOnViewerJoined(std::function<void(const std::string&)> callback) { on_viewer_joined_ = std::move(callback); }
    void setOnViewerLeft(std::function<void(const std::string&)> callback) { on_viewer_left_ = std::move(callback); }
    void setOnSignalingMessage(std::function<void(const SignalingMessage&)> callback) { on_signaling_ = std::move(callback); }
    void setOnDisconnected(std::function<void()> callback) { on_disconnected_ = std::move(callback); }

private:
    std::string server_url_;
    EventLoop& loop_;
    bool use_tls_;

    // Two client types - only one is used based on URL scheme
    WSClientTLS client_tls_;
    WSClientNoTLS client_no_tls_;

    ConnectionHdl connection_;
    std::thread io_thread_;
    std::atomic<bool> connected_;
    CancellationToken alive_;

    std::function<void(const std::string&)> on_viewer_joined_;
    std::function<void(const std::string&)> on_viewer_left_;
    std::function<void(const SignalingMessage&)> on_signaling_;
    std::function<void()> on_disconnected_;

    // WebSocket callbacks (io thread)
    void onOpen(ConnectionHdl hdl);
    void onClose(ConnectionHdl hdl);
    void onMessageTLS(ConnectionHdl hdl, WSClientTLS::message_ptr msg);
    void onMessageNoTLS(ConnectionHdl hdl, WSClientNoTLS::message_ptr msg);
    void onFail(ConnectionHdl hdl);

    // Message handling
    void handleMessage(const std::string& message);
    void dispatch(const RelayMessage& relay);
    bool sendMessage(const Json::Value& message);

    // TLS context (only used for wss://)
    std::shared_ptr<boost::asio::ssl::context> onTlsInit(ConnectionHdl hdl);
};

#endif // SIGNALING_CLIENT_H
