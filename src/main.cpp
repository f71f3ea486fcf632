#include "cloudflare_turn.h"
#include "glib_event_loop.h"
#include "log.h"
#include "session_config.h"
#include "session_manager.h"
#include "shared_media_pipeline.h"
#include "signaling_client.h"

#include <iostream>
#include <signal.h>
#include <map>
#include <memory>
#include <random>
#include <set>
#include <gst/gst.h>

static volatile sig_atomic_t running = 1;

void signalHandler(int signum) {
    running = 0;
}

static std::string randomClientId(const std::string& prefix) {
    std::random_device rd;
    std::uniform_int_distribution<int> dist(0, 0xffff);
    char buf[16];
    snprintf(buf, sizeof(buf), "%04x%04x", dist(rd), dist(rd));
    return prefix + "-" + buf;
}

// Wires one SessionManager to the relay. A broadcaster offers to every
// viewer that joins; a viewer answers the broadcaster and plays its audio.
class StreamManager {
public:
    enum class Role {
        Broadcaster,
        Viewer,
        Talkback      // viewer that also sends its microphone
    };

    StreamManager(const std::string& signaling_url, const SessionConfig& config, Role role,
                  GlibEventLoop& loop, SharedMediaPipeline& pipeline, CloudflareTurn* turn)
        : role_(role)
        , loop_(loop)
        , pipeline_(pipeline)
        , signaling_(signaling_url, loop)
        , session_(config, pipeline, signaling_) {

        if (turn) {
            session_.setTurnProvider([turn](IceServer* server) {
                return turn->turnServer(server);
            });
        }

        signaling_.setOnViewerJoined([this](const std::string& viewer_id) {
            onViewerJoined(viewer_id);
        });
        signaling_.setOnViewerLeft([this](const std::string& viewer_id) {
            onViewerLeft(viewer_id);
        });
        signaling_.setOnSignalingMessage([this](const SignalingMessage& message) {
            session_.handleSignalingMessage(message);
        });
        signaling_.setOnDisconnected([this]() {
            LOG("MAIN-ERROR", "Lost connection to signaling server, shutting down");
            loop_.quit();
        });

        session_.setOnRemoteStream([this](const std::string& peer_id, const MediaStreamPtr& stream) {
            onRemoteStream(peer_id, stream);
        });
        session_.setOnPeerConnectionStateChanged([this](const std::string& peer_id, ConnectionState state) {
            onConnectionState(peer_id, state);
        });
        session_.setOnStalled([](const std::string& peer_id, MediaKind kind) {
            LOG("MAIN-WARN", "Inbound " << mediaKindName(kind) << " from " << peer_id << " stalled");
        });
        session_.setOnViewerAudioPlaybackFailed([](const std::string& peer_id, const SessionError& error) {
            LOG("MAIN-WARN", "Viewer audio from " << peer_id << " blocked: " << error.describe());
        });
    }

    bool start(const MediaConstraints& constraints) {
        LOG("MAIN", "Connecting to signaling server...");
        if (!signaling_.connect()) {
            LOG("MAIN-ERROR", "Failed to connect to signaling server");
            return false;
        }
        LOG("MAIN", "Connected to signaling server");

        const SessionConfig& config = session_.config();
        if (role_ != Role::Broadcaster) {
            return signaling_.registerPeer("viewer", config.stream_id, config.local_id);
        }

        // Register once the camera is live so joining viewers get media
        session_.startLocalMedia(constraints, [this](const SessionError& error, const LocalMediaState& media) {
            if (error) {
                LOG("MAIN-ERROR", "Failed to start local media: " << error.describe());
                loop_.quit();
                return;
            }

            const SessionConfig& config = session_.config();
            signaling_.registerPeer("broadcaster", config.stream_id, config.local_id);

            std::cout << "\n========================================" << std::endl;
            std::cout << "   STREAMING READY - Waiting for viewers" << std::endl;
            std::cout << "========================================" << std::endl;
            std::cout << "Stream ID: " << config.stream_id << std::endl;
            std::cout << "Video: " << (media.camera ? media.camera->id() : "none") << std::endl;
            std::cout << "Audio: " << (media.microphone ? media.microphone->id() : "none") << std::endl;
            std::cout << "========================================\n" << std::endl;
        });
        return true;
    }

    void stop() {
        LOG("MAIN", "Stopping all streams...");
        sinks_.clear();
        session_.teardownAll();
        session_.stopLocalMedia();
        signaling_.disconnect();
        LOG("MAIN", "All streams stopped");
    }

private:
    Role role_;
    GlibEventLoop& loop_;
    SharedMediaPipeline& pipeline_;
    SignalingClient signaling_;
    SessionManager session_;
    std::map<std::string, std::unique_ptr<PlaybackSink>> sinks_;
    std::set<std::string> talking_to_;

    void onViewerJoined(const std::string& viewer_id) {
        if (role_ != Role::Broadcaster) {
            return;
        }
        LOG_VAR("MAIN", "[+] Viewer joined: ", viewer_id);

        // A rejoin replaces the stale connection
        if (session_.hasPeer(viewer_id)) {
            sinks_.erase(viewer_id);
            talking_to_.erase(viewer_id);
            session_.removePeer(viewer_id);
        }

        SessionError error = session_.createConnection(viewer_id, true);
        if (error) {
            LOG("MAIN-ERROR", "Failed to create peer for " << viewer_id << ": " << error.describe());
            return;
        }
        LOG("MAIN", "Active viewers: " << session_.peerCount());
    }

    void onViewerLeft(const std::string& viewer_id) {
        LOG_VAR("MAIN", "[-] Viewer left: ", viewer_id);
        sinks_.erase(viewer_id);
        talking_to_.erase(viewer_id);
        session_.removePeer(viewer_id);
        LOG("MAIN", "Active viewers: " << session_.peerCount());
    }

    // Viewer side: the broadcaster's audio arrives muted until a sink plays it
    void onRemoteStream(const std::string& peer_id, const MediaStreamPtr& stream) {
        if (role_ == Role::Broadcaster || !stream->firstTrack(MediaKind::Audio)) {
            return;
        }

        std::unique_ptr<PlaybackSink>& sink = sinks_[peer_id];
        if (!sink) {
            sink = pipeline_.createPlaybackSink(peer_id);
        }
        sink->setSource(stream);

        std::string error;
        if (sink->play(&error) != PlaybackStatus::Playing) {
            LOG("MAIN-WARN", "Cannot play audio from " << peer_id << ": " << error);
        }
    }

    void onConnectionState(const std::string& peer_id, ConnectionState state) {
        LOG("MAIN", peer_id << " is " << connectionStateName(state));

        if (state == ConnectionState::Connected && role_ == Role::Talkback &&
            talking_to_.insert(peer_id).second) {
            session_.addViewerAudio(peer_id, [peer_id](const SessionError& error) {
                if (error) {
                    LOG("MAIN-ERROR", "Failed to send microphone to " << peer_id << ": " << error.describe());
                } else {
                    LOG_VAR("MAIN", "Talking to ", peer_id);
                }
            });
        }
    }
};

static void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [signaling_url] [stream_id] [role] [video_device] [audio_device] [camera_type]" << std::endl;
    std::cout << "\nRoles:" << std::endl;
    std::cout << "  broadcaster - Capture camera/microphone and serve viewers - default" << std::endl;
    std::cout << "  viewer      - Receive the stream" << std::endl;
    std::cout << "  talkback    - Receive the stream and send microphone back" << std::endl;
    std::cout << "\nCamera types:" << std::endl;
    std::cout << "  csi    - Modern Pi Camera (libcamera) - default" << std::endl;
    std::cout << "  legacy - Legacy Pi Camera (rpicamsrc) - for old Raspberry Pi OS" << std::endl;
    std::cout << "  usb    - USB webcam (v4l2)" << std::endl;
    std::cout << "\nExample:" << std::endl;
    std::cout << "  " << argv0 << " ws://localhost:8080 pi-camera-stream broadcaster /dev/video0 default usb" << std::endl;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        printUsage(argv[0]);
        return 0;
    }

    SessionConfig config;
    config.stream_id = "pi-camera-stream";
    loadSessionConfigFromEnv(&config);

    std::string signaling_url = "ws://localhost:8080";
    std::string role_str = "broadcaster";
    std::string camera_type_str = "csi";  // Default to CSI for Pi Camera Module
    MediaConstraints constraints;

    if (argc > 1) signaling_url = argv[1];
    if (argc > 2) config.stream_id = argv[2];
    if (argc > 3) role_str = argv[3];
    if (argc > 4) constraints.video_device = argv[4];
    if (argc > 5) constraints.audio_device = argv[5];
    if (argc > 6) camera_type_str = argv[6];

    StreamManager::Role role;
    if (role_str == "broadcaster") {
        role = StreamManager::Role::Broadcaster;
    } else if (role_str == "viewer") {
        role = StreamManager::Role::Viewer;
    } else if (role_str == "talkback") {
        role = StreamManager::Role::Talkback;
    } else {
        std::cerr << "Unknown role: " << role_str << "\n" << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    if (config.local_id.empty()) {
        config.local_id = randomClientId(role == StreamManager::Role::Broadcaster ? "broadcaster" : "viewer");
    }

    if (camera_type_str == "usb" || camera_type_str == "USB") {
        constraints.camera_type = CameraType::USB;
    } else if (camera_type_str == "legacy" || camera_type_str == "LEGACY") {
        constraints.camera_type = CameraType::LEGACY_CSI;
    } else {
        constraints.camera_type = CameraType::CSI;
    }

    std::string camera_display;
    if (constraints.camera_type == CameraType::CSI) {
        camera_display = "CSI (Pi Camera Module - libcamera)";
    } else if (constraints.camera_type == CameraType::LEGACY_CSI) {
        camera_display = "CSI (Pi Camera Module - legacy)";
    } else {
        camera_display = "USB (" + constraints.video_device + ")";
    }

    // TURN priority: 1. Cloudflare TURN (dynamic credentials)
    //                2. Static TURN server from .env / environment
    std::string turn_display = "Not configured";
    std::unique_ptr<CloudflareTurn> cloudflare(new CloudflareTurn());
    if (cloudflare->loadConfigFromEnv()) {
        // Test fetching credentials to validate configuration
        auto creds = cloudflare->getCredentials();
        if (creds.valid) {
            turn_display = "Cloudflare TURN (dynamic credentials)";
        } else {
            LOG("MAIN-WARN", "Cloudflare TURN configured but failed to fetch credentials");
            cloudflare.reset();
        }
    } else {
        cloudflare.reset();
    }
    if (!cloudflare && !config.turn_server.uri.empty()) {
        turn_display = config.turn_server.uri;
    }

    std::cout << "\n=====================================" << std::endl;
    std::cout << "  castlink WebRTC streamer" << std::endl;
    std::cout << "=====================================" << std::endl;
    std::cout << "Signaling: " << signaling_url << std::endl;
    std::cout << "Stream ID: " << config.stream_id << std::endl;
    std::cout << "Client ID: " << config.local_id << std::endl;
    std::cout << "Role:      " << role_str << std::endl;
    if (role == StreamManager::Role::Broadcaster) {
        std::cout << "Camera:    " << camera_display << std::endl;
        std::cout << "Audio:     " << constraints.audio_device << std::endl;
    }
    std::cout << "Profile:   " << config.platform_profile << std::endl;
    std::cout << "TURN:      " << turn_display << std::endl;
    if (turn_display == "Not configured") {
        std::cout << "           (Set TURN_SERVER, TURN_USERNAME, TURN_PASSWORD env vars for NAT traversal)" << std::endl;
    }
    std::cout << "=====================================\n" << std::endl;

    gst_init(&argc, &argv);

    GlibEventLoop loop;

    SharedMediaPipeline::Options options;
    options.render_remote_video = role != StreamManager::Role::Broadcaster;
    SharedMediaPipeline pipeline(loop, options);
    if (!pipeline.start()) {
        LOG("MAIN-ERROR", "Failed to start shared media pipeline");
        return 1;
    }

    int status = 0;
    {
        StreamManager manager(signaling_url, config, role, loop, pipeline, cloudflare.get());
        if (manager.start(constraints)) {
            // Poll the signal flag from the loop
            loop.scheduleRepeating(std::chrono::milliseconds(100), [&loop]() {
                if (!running) {
                    std::cout << "\nShutting down..." << std::endl;
                    loop.quit();
                }
            });
            loop.run();
        } else {
            status = 1;
        }
        manager.stop();
    }

    pipeline.stop();

    std::cout << "\nGoodbye!\n" << std::endl;
    return status;
}
