#include "signaling_client.h"
#include "log.h"

SignalingClient::SignalingClient(const std::string& server_url, EventLoop& loop)
    : server_url_(server_url)
    , loop_(loop)
    , connected_(false) {

    // Determine if TLS is needed based on URL scheme
    use_tls_ = (server_url_.substr(0, 6) == "wss://");

    if (use_tls_) {
        client_tls_.clear_access_channels(websocketpp::log::alevel::all);
        client_tls_.set_access_channels(websocketpp::log::alevel::connect);
        client_tls_.set_access_channels(websocketpp::log::alevel::disconnect);
        client_tls_.set_error_channels(websocketpp::log::elevel::all);

        client_tls_.init_asio();

        client_tls_.set_open_handler([this](ConnectionHdl hdl) { onOpen(hdl); });
        client_tls_.set_close_handler([this](ConnectionHdl hdl) { onClose(hdl); });
        client_tls_.set_message_handler([this](ConnectionHdl hdl, WSClientTLS::message_ptr msg) {
            onMessageTLS(hdl, msg);
        });
        client_tls_.set_fail_handler([this](ConnectionHdl hdl) { onFail(hdl); });
        client_tls_.set_tls_init_handler([this](ConnectionHdl hdl) { return onTlsInit(hdl); });

        LOG("SIGNALING", "Using secure WebSocket (wss://)");
    } else {
        client_no_tls_.clear_access_channels(websocketpp::log::alevel::all);
        client_no_tls_.set_access_channels(websocketpp::log::alevel::connect);
        client_no_tls_.set_access_channels(websocketpp::log::alevel::disconnect);
        client_no_tls_.set_error_channels(websocketpp::log::elevel::all);

        client_no_tls_.init_asio();

        client_no_tls_.set_open_handler([this](ConnectionHdl hdl) { onOpen(hdl); });
        client_no_tls_.set_close_handler([this](ConnectionHdl hdl) { onClose(hdl); });
        client_no_tls_.set_message_handler([this](ConnectionHdl hdl, WSClientNoTLS::message_ptr msg) {
            onMessageNoTLS(hdl, msg);
        });
        client_no_tls_.set_fail_handler([this](ConnectionHdl hdl) { onFail(hdl); });

        LOG("SIGNALING", "Using plain WebSocket (ws://)");
    }
}

SignalingClient::~SignalingClient() {
    alive_.cancel();
    disconnect();
}

bool SignalingClient::connect() {
    try {
        websocketpp::lib::error_code ec;

        if (use_tls_) {
            WSClientTLS::connection_ptr con = client_tls_.get_connection(server_url_, ec);
            if (ec) {
                LOG_VAR("SIGNALING-ERROR", "Connection error: ", ec.message());
                return false;
            }

            connection_ = con->get_handle();
            client_tls_.connect(con);

            io_thread_ = std::thread([this]() {
                client_tls_.run();
            });
        } else {
            WSClientNoTLS::connection_ptr con = client_no_tls_.get_connection(server_url_, ec);
            if (ec) {
                LOG_VAR("SIGNALING-ERROR", "Connection error: ", ec.message());
                return false;
            }

            connection_ = con->get_handle();
            client_no_tls_.connect(con);

            io_thread_ = std::thread([this]() {
                client_no_tls_.run();
            });
        }

        // Wait for connection
        int retry = 0;
        while (!connected_ && retry < 50) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            retry++;
        }

        if (!connected_) {
            LOG_VAR("SIGNALING-ERROR", "Timed out connecting to ", server_url_);
        }
        return connected_;

    } catch (const std::exception& e) {
        LOG_VAR("SIGNALING-ERROR", "Connect exception: ", e.what());
        return false;
    }
}

void SignalingClient::disconnect() {
    if (connected_) {
        websocketpp::lib::error_code ec;
        if (use_tls_) {
            client_tls_.close(connection_, websocketpp::close::status::normal, "", ec);
        } else {
            client_no_tls_.close(connection_, websocketpp::close::status::normal, "", ec);
        }
        if (ec) {
            LOG_VAR("SIGNALING-WARN", "Close failed: ", ec.message());
        }
        connected_ = false;
    }

    if (io_thread_.joinable()) {
        if (use_tls_) {
            client_tls_.stop();
        } else {
            client_no_tls_.stop();
        }
        io_thread_.join();
    }
}

bool SignalingClient::registerPeer(const std::string& role, const std::string& stream_id,
                                   const std::string& client_id) {
    LOG("SIGNALING", "Registering as " << role << " for stream " << stream_id);
    return sendMessage(registrationMessage(role, stream_id, client_id));
}

void SignalingClient::send(const SignalingMessage& message) {
    if (!sendMessage(signalingMessageToJson(message))) {
        LOG("SIGNALING-WARN", "Dropped outbound " << signalingMessageTypeName(message.type)
            << " to " << message.to);
    }
}

void SignalingClient::onOpen(ConnectionHdl hdl) {
    LOG("SIGNALING", "WebSocket connected");
    connected_ = true;
}

void SignalingClient::onClose(ConnectionHdl hdl) {
    LOG("SIGNALING", "WebSocket disconnected");
    bool was_connected = connected_.exchange(false);
    if (!was_connected) {
        return;
    }

    CancellationToken alive = alive_;
    loop_.post([this, alive]() {
        if (alive.isCancelled()) {
            return;
        }
        if (on_disconnected_) {
            on_disconnected_();
        }
    });
}

void SignalingClient::onMessageTLS(ConnectionHdl hdl, WSClientTLS::message_ptr msg) {
    handleMessage(msg->get_payload());
}

void SignalingClient::onMessageNoTLS(ConnectionHdl hdl, WSClientNoTLS::message_ptr msg) {
    handleMessage(msg->get_payload());
}

void SignalingClient::onFail(ConnectionHdl hdl) {
    LOG("SIGNALING-ERROR", "WebSocket connection failed");
    connected_ = false;
}

void SignalingClient::handleMessage(const std::string& message) {
    RelayMessage relay;
    SessionError error = parseRelayMessage(message, &relay);
    if (error) {
        LOG_VAR("SIGNALING-WARN", "Dropping relay message: ", error.describe());
        return;
    }

    CancellationToken alive = alive_;
    loop_.post([this, alive, relay]() {
        if (!alive.isCancelled()) {
            dispatch(relay);
        }
    });
}

void SignalingClient::dispatch(const RelayMessage& relay) {
    switch (relay.event) {
        case RelayEvent::ViewerJoined:
            LOG_VAR("SIGNALING", "Viewer joined: ", relay.viewer_id);
            if (on_viewer_joined_) {
                on_viewer_joined_(relay.viewer_id);
            }
            break;
        case RelayEvent::ViewerLeft:
            LOG_VAR("SIGNALING", "Viewer left: ", relay.viewer_id);
            if (on_viewer_left_) {
                on_viewer_left_(relay.viewer_id);
            }
            break;
        case RelayEvent::Error:
            LOG_VAR("SIGNALING-ERROR", "Relay error: ", relay.error);
            break;
        case RelayEvent::PeerMessage:
            if (on_signaling_) {
                on_signaling_(relay.message);
            }
            break;
    }
}

bool SignalingClient::sendMessage(const Json::Value& message) {
    if (!connected_) {
        LOG("SIGNALING-WARN", "Not connected, cannot send " << message["type"].asString());
        return false;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::string msg_str = Json::writeString(builder, message);

    websocketpp::lib::error_code ec;
    if (use_tls_) {
        client_tls_.send(connection_, msg_str, websocketpp::frame::opcode::text, ec);
    } else {
        client_no_tls_.send(connection_, msg_str, websocketpp::frame::opcode::text, ec);
    }
    if (ec) {
        LOG_VAR("SIGNALING-ERROR", "Send error: ", ec.message());
        return false;
    }
    return true;
}

std::shared_ptr<boost::asio::ssl::context> SignalingClient::onTlsInit(ConnectionHdl hdl) {
    auto ctx = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tlsv12);

    try {
        ctx->set_options(boost::asio::ssl::context::default_workarounds |
                        boost::asio::ssl::context::no_sslv2 |
                        boost::asio::ssl::context::no_sslv3 |
                        boost::asio::ssl::context::single_dh_use);

        ctx->set_verify_mode(boost::asio::ssl::verify_none);
    } catch (const std::exception& e) {
        LOG_VAR("SIGNALING-ERROR", "TLS init error: ", e.what());
    }

    return ctx;
}
