#pragma once
#include "utils/platform.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

// One UDP socket bound to an ephemeral local port. Owned by a single peer
// connection; the receive pass is its only reader.
class UDPSocket {
public:
    enum class RecvStatus {
        Data,
        WouldBlock,
        Error
    };

    // Binds 0.0.0.0:0. Throws TelemetryError (SocketError) on failure.
    UDPSocket();
    ~UDPSocket();

    UDPSocket(const UDPSocket&) = delete;
    UDPSocket& operator=(const UDPSocket&) = delete;

    void set_read_timeout(int timeout_ms);
    void set_non_blocking(bool enabled);

    // Receives one datagram. On Error, `error` carries the OS description.
    RecvStatus receive(uint8_t* buffer, size_t capacity, size_t& received, std::string& error);
    bool send_to(const uint8_t* data, size_t len, const sockaddr_in& addr, std::string& error);

    uint16_t local_port() const;

    static bool parse_ipv4(const std::string& ip, uint16_t port, sockaddr_in& out);
    static std::string describe(const sockaddr_in& addr);

private:
    static std::string last_error_string();

    socket_t sock_;
};
