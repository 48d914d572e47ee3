#pragma once
#include "config/config.hpp"
#include "telemetry/frame_broadcast.hpp"
#include "telemetry/peer_connection.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// LAN allow-list: 192.168.*, 10.*, 172.* or exactly 127.0.0.1.
bool is_valid_console_ip(const std::string& ip);

// Multi-console telemetry ingest. The worker threads share the connection
// table under one mutex and never hold it across socket I/O.
class TelemetryEngine {
public:
    // Validates the config; throws TelemetryError (ConfigError).
    explicit TelemetryEngine(const TelemetryConfig& config);
    ~TelemetryEngine();

    TelemetryEngine(const TelemetryEngine&) = delete;
    TelemetryEngine& operator=(const TelemetryEngine&) = delete;

    std::shared_ptr<FrameSubscription> subscribe();

    // Throws InvalidIP, InvalidPort or AddressParseError before any socket
    // is created; SocketError if binding fails. Re-adding an ip replaces it.
    void add_peer(const std::string& ip, std::optional<uint16_t> port = std::nullopt);
    // Throws NetworkError if the ip is not registered.
    void remove_peer(const std::string& ip);

    std::map<std::string, Liveness> status() const;
    std::map<std::string, PeerStats> peer_stats() const;
    size_t peer_count() const;

    // Throws InvalidGameState if already running.
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    uint64_t frames_received() const { return frames_received_.load(); }
    uint64_t frames_dropped() const { return broadcast_.total_dropped(); }
    const TelemetryConfig& config() const { return config_; }

private:
    struct PeerHandle {
        std::string ip;
        sockaddr_in address;
        std::shared_ptr<UDPSocket> socket;
    };

    void receive_thread_main();
    void heartbeat_thread_main();
    void monitor_thread_main();
    void tap_thread_main();

    void handle_datagram(const PeerHandle& peer, const uint8_t* data, size_t len);
    std::vector<PeerHandle> snapshot_peers() const;

    // Sleeps until `deadline` or stop(); returns false once stopping.
    bool wait_until(SteadyTime deadline);

    TelemetryConfig config_;
    FrameBroadcast broadcast_;
    std::shared_ptr<FrameSubscription> tap_;
    bool owns_log_sink_;

    std::map<std::string, PeerConnection> peers_;
    mutable std::mutex peers_mutex_;

    std::thread receive_thread_;
    std::thread heartbeat_thread_;
    std::thread monitor_thread_;
    std::thread tap_thread_;
    std::atomic<bool> running_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    std::atomic<uint64_t> frames_received_;
    uint64_t short_datagram_counter_;
    uint64_t decode_error_counter_;
    uint64_t recv_error_counter_;
    uint64_t send_error_counter_;
};
