#include "telemetry/telemetry_engine.hpp"
#include "telemetry/config_validation.hpp"
#include "telemetry/frame_codec.hpp"
#include "telemetry/telemetry_error.hpp"
#include "config/constants.hpp"
#include "utils/logging.hpp"
#include <cstdio>

bool is_valid_console_ip(const std::string& ip) {
    auto starts_with = [&ip](const char* prefix) {
        return ip.rfind(prefix, 0) == 0;
    };
    return starts_with("192.168.") || starts_with("10.") || starts_with("172.") || ip == "127.0.0.1";
}

TelemetryEngine::TelemetryEngine(const TelemetryConfig& config)
    : config_(config)
    , broadcast_(config.channel_capacity)
    , owns_log_sink_(false)
    , running_(false)
    , frames_received_(0)
    , short_datagram_counter_(0)
    , decode_error_counter_(0)
    , recv_error_counter_(0)
    , send_error_counter_(0) {

    validate_config(config_);

    if (config_.log_file_path) {
        owns_log_sink_ = Logger::set_file_sink(*config_.log_file_path);
    }
    if (config_.enable_logging) {
        tap_ = broadcast_.subscribe();
    }
}

TelemetryEngine::~TelemetryEngine() {
    stop();
    broadcast_.close();
    if (owns_log_sink_) {
        Logger::close_file_sink();
    }
}

std::shared_ptr<FrameSubscription> TelemetryEngine::subscribe() {
    return broadcast_.subscribe();
}

void TelemetryEngine::add_peer(const std::string& ip, std::optional<uint16_t> port) {
    if (!is_valid_console_ip(ip)) {
        throw TelemetryError::invalid_ip(ip);
    }
    uint16_t peer_port = port.value_or(config_.port);
    if (peer_port == 0) {
        throw TelemetryError::invalid_port(peer_port);
    }

    PeerConnection conn;
    conn.ip = ip;
    if (!UDPSocket::parse_ipv4(ip, peer_port, conn.address)) {
        throw TelemetryError::address_parse_error(ip);
    }

    conn.socket = std::make_shared<UDPSocket>();
    conn.socket->set_read_timeout(Constants::SOCKET_READ_TIMEOUT_MS);
    conn.socket->set_non_blocking(true);

    bool replaced;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        replaced = peers_.erase(ip) > 0;
        peers_.emplace(ip, std::move(conn));
    }

    Logger::info(std::string(replaced ? "Replaced" : "Added") + " console " + ip + ":" +
                 std::to_string(peer_port));
}

void TelemetryEngine::remove_peer(const std::string& ip) {
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        if (peers_.erase(ip) == 0) {
            throw TelemetryError::network_error(ip, "connection not found");
        }
    }
    Logger::info("Removed console " + ip);
}

std::map<std::string, Liveness> TelemetryEngine::status() const {
    std::map<std::string, Liveness> result;
    std::lock_guard<std::mutex> lock(peers_mutex_);
    for (const auto& entry : peers_) {
        result[entry.first] = entry.second.liveness;
    }
    return result;
}

std::map<std::string, PeerStats> TelemetryEngine::peer_stats() const {
    std::map<std::string, PeerStats> result;
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(peers_mutex_);
    for (const auto& entry : peers_) {
        const PeerConnection& conn = entry.second;
        PeerStats stats;
        stats.address = UDPSocket::describe(conn.address);
        stats.local_port = conn.socket->local_port();
        stats.liveness = conn.liveness;
        stats.packet_count = conn.packet_count;
        if (conn.last_received) {
            stats.last_received_age =
                std::chrono::duration_cast<std::chrono::milliseconds>(now - *conn.last_received);
        }
        result[entry.first] = stats;
    }
    return result;
}

size_t TelemetryEngine::peer_count() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    return peers_.size();
}

void TelemetryEngine::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        throw TelemetryError::invalid_game_state("running", "start");
    }

    receive_thread_ = std::thread(&TelemetryEngine::receive_thread_main, this);
    heartbeat_thread_ = std::thread(&TelemetryEngine::heartbeat_thread_main, this);
    monitor_thread_ = std::thread(&TelemetryEngine::monitor_thread_main, this);
    if (tap_) {
        tap_thread_ = std::thread(&TelemetryEngine::tap_thread_main, this);
    }

    Logger::info("Telemetry engine started (" + std::to_string(peer_count()) + " consoles, heartbeat " +
                 std::to_string(config_.heartbeat_interval_ms) + "ms, timeout " +
                 std::to_string(config_.timeout_s) + "s)");
}

void TelemetryEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false) && !receive_thread_.joinable()) {
            return;
        }
    }
    wake_cv_.notify_all();

    if (receive_thread_.joinable()) receive_thread_.join();
    if (heartbeat_thread_.joinable()) heartbeat_thread_.join();
    if (monitor_thread_.joinable()) monitor_thread_.join();
    if (tap_thread_.joinable()) tap_thread_.join();

    Logger::info("Telemetry engine stopped (" + std::to_string(frames_received_.load()) + " frames received)");
}

bool TelemetryEngine::wait_until(SteadyTime deadline) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_until(lock, deadline, [this] { return !running_.load(); });
    return running_.load();
}

std::vector<TelemetryEngine::PeerHandle> TelemetryEngine::snapshot_peers() const {
    std::vector<PeerHandle> handles;
    std::lock_guard<std::mutex> lock(peers_mutex_);
    handles.reserve(peers_.size());
    for (const auto& entry : peers_) {
        handles.push_back({entry.first, entry.second.address, entry.second.socket});
    }
    return handles;
}

void TelemetryEngine::receive_thread_main() {
    uint8_t buffer[Constants::GT7_RECV_BUFFER_SIZE];

    while (running_.load()) {
        std::vector<PeerHandle> peers = snapshot_peers();

        for (const auto& peer : peers) {
            size_t received = 0;
            std::string error;
            UDPSocket::RecvStatus rs = peer.socket->receive(buffer, sizeof(buffer), received, error);

            if (rs == UDPSocket::RecvStatus::Data) {
                handle_datagram(peer, buffer, received);
            } else if (rs == UDPSocket::RecvStatus::Error) {
                if ((recv_error_counter_++ % Constants::WARN_EVERY_N) == 0) {
                    Logger::warn(TelemetryError::network_error(peer.ip, error).what());
                }
            }
        }

        if (!wait_until(std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(Constants::RECEIVE_SWEEP_MS))) {
            break;
        }
    }
}

void TelemetryEngine::handle_datagram(const PeerHandle& peer, const uint8_t* data, size_t len) {
    if (len < Constants::GT7_PACKET_SIZE) {
        if ((short_datagram_counter_++ % Constants::WARN_EVERY_N) == 0) {
            Logger::warn("Skipping datagram from " + peer.ip + ": " +
                         TelemetryError::incomplete_data(Constants::GT7_PACKET_SIZE, len).what());
        }
        return;
    }

    TelemetryFrame frame;
    try {
        frame = FrameCodec::decode(data, Constants::GT7_PACKET_SIZE);
    } catch (const TelemetryError& e) {
        if ((decode_error_counter_++ % Constants::WARN_EVERY_N) == 0) {
            Logger::warn("Dropping frame from " + peer.ip + ": " + e.what());
        }
        return;
    }

    Liveness previous = Liveness::Unknown;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(peer.ip);
        // Removed or replaced while the datagram was in flight.
        if (it == peers_.end() || it->second.socket != peer.socket) {
            return;
        }
        previous = it->second.liveness;
        it->second.liveness = Liveness::Live;
        it->second.last_received = std::chrono::steady_clock::now();
        it->second.packet_count++;
    }

    if (previous != Liveness::Live) {
        Logger::info("Console " + peer.ip + " is live (was " + to_string(previous) + ")");
    }

    uint64_t count = ++frames_received_;
    uint64_t dropped_before = (count % Constants::WARN_EVERY_N) == 0 ? broadcast_.total_dropped() : 0;

    TelemetryEvent event;
    event.peer_ip = peer.ip;
    event.frame = std::move(frame);
    size_t delivered = broadcast_.publish(event);

    Logger::debug("Frame #" + std::to_string(event.frame.packet_id) + " from " + peer.ip + " -> " +
                  std::to_string(delivered) + " subscribers");

    if ((count % Constants::WARN_EVERY_N) == 0) {
        uint64_t dropped_after = broadcast_.total_dropped();
        if (dropped_after > dropped_before) {
            Logger::warn("Subscribers lagging: " + std::to_string(dropped_after) + " frames dropped");
        }
    }
}

void TelemetryEngine::heartbeat_thread_main() {
    const auto interval = std::chrono::milliseconds(config_.heartbeat_interval_ms);
    const uint8_t heartbeat = Constants::GT7_HEARTBEAT_BYTE;
    auto next_tick = std::chrono::steady_clock::now();

    while (running_.load()) {
        // Scheduled time, so wake-up jitter never makes a peer miss a tick.
        SteadyTime tick = next_tick;

        std::vector<PeerHandle> due;
        {
            std::lock_guard<std::mutex> lock(peers_mutex_);
            for (const auto& entry : peers_) {
                const PeerConnection& conn = entry.second;
                if (!conn.last_heartbeat || tick - *conn.last_heartbeat >= interval) {
                    due.push_back({entry.first, conn.address, conn.socket});
                }
            }
        }

        for (const auto& peer : due) {
            std::string error;
            if (!peer.socket->send_to(&heartbeat, 1, peer.address, error)) {
                if ((send_error_counter_++ % Constants::WARN_EVERY_N) == 0) {
                    Logger::warn("Heartbeat to " + peer.ip + " failed: " + error);
                }
            }
        }

        if (!due.empty()) {
            std::lock_guard<std::mutex> lock(peers_mutex_);
            for (const auto& peer : due) {
                auto it = peers_.find(peer.ip);
                if (it != peers_.end() && it->second.socket == peer.socket) {
                    it->second.last_heartbeat = tick;
                }
            }
        }

        next_tick += interval;
        auto now = std::chrono::steady_clock::now();
        if (next_tick < now) {
            next_tick = now;
        }
        if (!wait_until(next_tick)) {
            break;
        }
    }
}

void TelemetryEngine::monitor_thread_main() {
    const auto interval = std::chrono::milliseconds(config_.monitor_interval_ms);
    const auto timeout = std::chrono::seconds(config_.timeout_s);

    while (wait_until(std::chrono::steady_clock::now() + interval)) {
        std::vector<std::string> went_stale;
        auto now = std::chrono::steady_clock::now();
        {
            std::lock_guard<std::mutex> lock(peers_mutex_);
            for (auto& entry : peers_) {
                PeerConnection& conn = entry.second;
                if (conn.liveness == Liveness::Live && conn.last_received &&
                    now - *conn.last_received > timeout) {
                    conn.liveness = Liveness::Stale;
                    went_stale.push_back(entry.first);
                }
            }
        }

        for (const auto& ip : went_stale) {
            Logger::warn("Console " + ip + " went stale (no frame for " + std::to_string(config_.timeout_s) + "s)");
        }
    }
}

void TelemetryEngine::tap_thread_main() {
    while (running_.load()) {
        std::optional<TelemetryEvent> event =
            tap_->recv(std::chrono::milliseconds(Constants::SOCKET_READ_TIMEOUT_MS));
        if (!event) {
            if (tap_->closed()) break;
            continue;
        }

        const TelemetryFrame& frame = event->frame;
        char speed[32];
        std::snprintf(speed, sizeof(speed), "%.1f", frame.speed_kmh());
        Logger::info("[" + event->peer_ip + "] #" + std::to_string(frame.packet_id) + " " +
                     to_string(frame.game_state.state) + " " + speed + " km/h gear " + frame.gear_display());
    }
}
