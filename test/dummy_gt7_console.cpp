// Console stand-in for manual end-to-end runs: listens on the telemetry port,
// and while heartbeats keep arriving streams sine-wave frames back to the
// host that sent them.

#include "config/constants.hpp"
#include "telemetry/frame_codec.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

// Host is dropped after this long without a heartbeat
constexpr auto HEARTBEAT_GRACE = std::chrono::seconds(2);

struct Subscriber {
    sockaddr_in addr{};
    std::chrono::steady_clock::time_point last_heartbeat;
};

TelemetryFrame make_frame(uint32_t packet_id, float angle) {
    TelemetryFrame f;
    f.version = Constants::GT7_PACKET_VERSION;
    f.packet_id = packet_id;
    f.game_state.state = GameStateType::InRace;

    RaceInfo race;
    race.current_lap = 2;
    race.total_laps = 5;
    race.position = 3;
    race.total_participants = 16;
    race.best_lap_ms = 92345;
    race.last_lap_ms = 93012;
    race.current_lap_ms = (packet_id * 16) % 95000;
    race.track_progress = 0.5f + 0.5f * sinf(angle * 0.1f);
    f.game_state.race = race;

    float speed = 40.0f + 30.0f * sinf(angle);   // m/s
    f.car.position.velocity = Vector3{speed, 0.0f, 0.0f};
    f.car.position.world = Vector3{100.0f * cosf(angle), 0.0f, 100.0f * sinf(angle)};

    EngineInfo& e = f.car.engine;
    e.rpm = 5000.0f + 2500.0f * sinf(angle);
    e.max_rpm = 8000.0f;
    e.throttle = 0.5f + 0.5f * sinf(angle);
    e.brake = 0.5f - 0.5f * sinf(angle);
    e.fuel_remaining = 40.0f;
    e.fuel_capacity = 100.0f;
    e.fuel_consumption = 0.2f;
    return f;
}

int main(int argc, char** argv) {
    int port = argc > 1 ? std::atoi(argv[1]) : Constants::GT7_PORT;

    int sock = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock < 0) { perror("socket"); return 1; }

    sockaddr_in addr{}; addr.sin_family = AF_INET; addr.sin_addr.s_addr = INADDR_ANY; addr.sin_port = htons(port);
    if (bind(sock, (sockaddr*)&addr, sizeof(addr)) < 0) { perror("bind"); return 1; }

    timeval tv{}; tv.tv_usec = 100 * 1000;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::cout << "Dummy GT7 console listening on UDP " << port << "\n";

    std::vector<Subscriber> subscribers;
    std::mutex sub_mutex;
    std::atomic<bool> running{true};

    // Receive thread: every 'A' registers or refreshes the sender
    std::thread recv_thread([&](){
        while (running) {
            uint8_t buf[64]; sockaddr_in src{}; socklen_t sl = sizeof(src);
            ssize_t n = recvfrom(sock, buf, sizeof(buf), 0, (sockaddr*)&src, &sl);
            if (n != 1 || buf[0] != Constants::GT7_HEARTBEAT_BYTE) continue;

            std::lock_guard<std::mutex> lock(sub_mutex);
            auto now = std::chrono::steady_clock::now();
            bool found = false;
            for (auto& s : subscribers) {
                if (s.addr.sin_addr.s_addr == src.sin_addr.s_addr && s.addr.sin_port == src.sin_port) {
                    s.last_heartbeat = now;
                    found = true;
                    break;
                }
            }
            if (!found) {
                subscribers.push_back(Subscriber{src, now});
                char ip[INET_ADDRSTRLEN] = {0};
                inet_ntop(AF_INET, &src.sin_addr, ip, sizeof(ip));
                std::cout << "[info] Heartbeat from " << ip << ":" << ntohs(src.sin_port)
                          << ", streaming. Total: " << subscribers.size() << "\n";
            }
        }
    });

    // Send thread: ~60 Hz frames
    std::thread send_thread([&](){
        float angle = 0.0f;
        uint32_t packet_id = 0;
        while (running) {
            auto loop_start = std::chrono::steady_clock::now();

            std::vector<Subscriber> subs_copy;
            {
                std::lock_guard<std::mutex> lock(sub_mutex);
                for (auto it = subscribers.begin(); it != subscribers.end();) {
                    if (loop_start - it->last_heartbeat > HEARTBEAT_GRACE) {
                        std::cout << "[info] Heartbeats stopped, dropping subscriber\n";
                        it = subscribers.erase(it);
                    } else {
                        ++it;
                    }
                }
                subs_copy = subscribers;
            }

            if (!subs_copy.empty()) {
                angle += 0.02f; if (angle > 6.2831853f) angle -= 6.2831853f;
                TelemetryFrame frame = make_frame(packet_id++, angle);
                frame.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count();
                std::vector<uint8_t> pkt = FrameCodec::encode(frame);

                for (auto& s : subs_copy) {
                    sendto(sock, pkt.data(), pkt.size(), 0, (sockaddr*)&s.addr, sizeof(s.addr));
                }

                if ((packet_id % 60) == 0) {
                    std::cout << "[send] frame #" << packet_id << " -> " << subs_copy.size()
                              << " hosts (speed " << frame.speed_kmh() << " km/h)\n";
                }
            }

            std::this_thread::sleep_until(loop_start + std::chrono::microseconds(16667));
        }
    });

    recv_thread.join();
    send_thread.join();
    close(sock);
    return 0;
}
