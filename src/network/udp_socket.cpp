#include "network/udp_socket.hpp"
#include "telemetry/telemetry_error.hpp"
#include "utils/logging.hpp"

UDPSocket::UDPSocket() : sock_(INVALID_SOCKET_HANDLE) {
#ifdef _WIN32
    WSADATA wsaData;
    if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
        throw TelemetryError::socket_error("WSAStartup failed");
    }
#endif

    sock_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock_ == INVALID_SOCKET_HANDLE) {
        std::string reason = "socket() failed: " + last_error_string();
#ifdef _WIN32
        WSACleanup();
#endif
        throw TelemetryError::socket_error(reason);
    }

    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_port = htons(0);
    bind_addr.sin_addr.s_addr = INADDR_ANY;

    if (bind(sock_, (sockaddr*)&bind_addr, sizeof(bind_addr)) < 0) {
        std::string reason = "bind() failed: " + last_error_string();
        CLOSE_SOCKET(sock_);
        sock_ = INVALID_SOCKET_HANDLE;
#ifdef _WIN32
        WSACleanup();
#endif
        throw TelemetryError::socket_error(reason);
    }
}

UDPSocket::~UDPSocket() {
    if (sock_ != INVALID_SOCKET_HANDLE) {
        CLOSE_SOCKET(sock_);
        sock_ = INVALID_SOCKET_HANDLE;
    }
#ifdef _WIN32
    WSACleanup();
#endif
}

void UDPSocket::set_read_timeout(int timeout_ms) {
#ifdef _WIN32
    DWORD tv = static_cast<DWORD>(timeout_ms);
    if (setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tv, sizeof(tv)) != 0) {
        Logger::warn("Failed to set read timeout: " + last_error_string());
    }
#else
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    if (setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        Logger::warn("Failed to set read timeout: " + last_error_string());
    }
#endif
}

void UDPSocket::set_non_blocking(bool enabled) {
#ifdef _WIN32
    u_long mode = enabled ? 1 : 0;
    if (ioctlsocket(sock_, FIONBIO, &mode) != 0) {
        Logger::warn("Failed to change blocking mode: " + last_error_string());
    }
#else
    int flags = fcntl(sock_, F_GETFL, 0);
    if (flags < 0) {
        Logger::warn("fcntl(F_GETFL) failed: " + last_error_string());
        return;
    }
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (fcntl(sock_, F_SETFL, flags) != 0) {
        Logger::warn("Failed to change blocking mode: " + last_error_string());
    }
#endif
}

UDPSocket::RecvStatus UDPSocket::receive(uint8_t* buffer, size_t capacity, size_t& received, std::string& error) {
    received = 0;
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);

#ifdef _WIN32
    int bytes = recvfrom(sock_, (char*)buffer, (int)capacity, 0, (sockaddr*)&from, &from_len);
    if (bytes == SOCKET_ERROR) {
        int code = last_socket_error();
        if (is_transient_socket_error(code)) {
            return RecvStatus::WouldBlock;
        }
        // A heartbeat to a closed port comes back as a reset on the next read.
        if (code == WSAECONNRESET) {
            error = "connection reset by peer (ICMP port unreachable)";
            return RecvStatus::Error;
        }
        error = socket_error_string(code);
        return RecvStatus::Error;
    }
#else
    ssize_t bytes = recvfrom(sock_, buffer, capacity, 0, (sockaddr*)&from, &from_len);
    if (bytes < 0) {
        int code = last_socket_error();
        if (is_transient_socket_error(code)) {
            return RecvStatus::WouldBlock;
        }
        error = socket_error_string(code);
        return RecvStatus::Error;
    }
#endif

    received = static_cast<size_t>(bytes);
    return RecvStatus::Data;
}

bool UDPSocket::send_to(const uint8_t* data, size_t len, const sockaddr_in& addr, std::string& error) {
#ifdef _WIN32
    int result = sendto(sock_, (const char*)data, (int)len, 0, (const sockaddr*)&addr, sizeof(addr));
    if (result == SOCKET_ERROR) {
        error = last_error_string();
        return false;
    }
#else
    ssize_t result = sendto(sock_, data, len, MSG_DONTWAIT, (const sockaddr*)&addr, sizeof(addr));
    if (result < 0) {
        error = last_error_string();
        return false;
    }
#endif
    return true;
}

uint16_t UDPSocket::local_port() const {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(sock_, (sockaddr*)&local, &len) != 0) {
        return 0;
    }
    return ntohs(local.sin_port);
}

bool UDPSocket::parse_ipv4(const std::string& ip, uint16_t port, sockaddr_in& out) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return false;
    }
    out = addr;
    return true;
}

std::string UDPSocket::describe(const sockaddr_in& addr) {
    char text[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text))) {
        return "<invalid>";
    }
    return std::string(text) + ":" + std::to_string(ntohs(addr.sin_port));
}

std::string UDPSocket::last_error_string() {
    return socket_error_string(last_socket_error());
}
