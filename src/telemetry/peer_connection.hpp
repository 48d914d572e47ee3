#pragma once
#include "network/udp_socket.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

enum class Liveness {
    Unknown,
    Live,
    Stale
};

inline const char* to_string(Liveness liveness) {
    switch (liveness) {
        case Liveness::Live: return "live";
        case Liveness::Stale: return "stale";
        default: return "unknown";
    }
}

using SteadyTime = std::chrono::steady_clock::time_point;

// Row of the engine's connection table. The socket is shared so the receive
// and heartbeat passes can use it without holding the table lock.
struct PeerConnection {
    std::string ip;
    sockaddr_in address{};
    std::shared_ptr<UDPSocket> socket;
    std::optional<SteadyTime> last_received;
    std::optional<SteadyTime> last_heartbeat;
    Liveness liveness = Liveness::Unknown;
    uint64_t packet_count = 0;
};

struct PeerStats {
    std::string address;            // ip:port
    uint16_t local_port = 0;        // where this peer's frames arrive
    Liveness liveness = Liveness::Unknown;
    uint64_t packet_count = 0;
    std::optional<std::chrono::milliseconds> last_received_age;
};
