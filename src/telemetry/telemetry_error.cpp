#include "telemetry/telemetry_error.hpp"
#include <iomanip>
#include <sstream>

TelemetryError::TelemetryError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

TelemetryError TelemetryError::incomplete(size_t expected, size_t actual) {
    TelemetryError e(Kind::Incomplete, "incomplete frame: expected " + std::to_string(expected) +
                                       " bytes, got " + std::to_string(actual));
    e.expected_ = expected;
    e.actual_ = actual;
    return e;
}

TelemetryError TelemetryError::version_mismatch(uint16_t expected, uint16_t actual) {
    TelemetryError e(Kind::VersionMismatch, "frame version mismatch: expected " +
                                            std::to_string(expected) + ", got " + std::to_string(actual));
    e.expected_ = expected;
    e.actual_ = actual;
    return e;
}

TelemetryError TelemetryError::parse_error(const std::string& field, size_t offset, size_t length) {
    TelemetryError e(Kind::ParseError, "failed to read " + field + " (offset " + std::to_string(offset) +
                                       ", length " + std::to_string(length) + ")");
    e.field_ = field;
    e.offset_ = offset;
    e.length_ = length;
    return e;
}

TelemetryError TelemetryError::invalid_format(const std::string& field) {
    TelemetryError e(Kind::InvalidFormat, "invalid frame format: field '" + field + "'");
    e.field_ = field;
    return e;
}

TelemetryError TelemetryError::checksum_error(uint32_t calculated, uint32_t expected) {
    std::ostringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0')
       << "checksum mismatch: calculated 0x" << std::setw(8) << calculated
       << ", expected 0x" << std::setw(8) << expected;
    TelemetryError e(Kind::ChecksumError, ss.str());
    e.expected_ = expected;
    e.actual_ = calculated;
    return e;
}

TelemetryError TelemetryError::network_error(const std::string& address, const std::string& reason) {
    TelemetryError e(Kind::NetworkError, "network error on " + address + ": " + reason);
    e.address_ = address;
    e.reason_ = reason;
    return e;
}

TelemetryError TelemetryError::socket_error(const std::string& reason) {
    TelemetryError e(Kind::SocketError, "UDP socket error: " + reason);
    e.reason_ = reason;
    return e;
}

TelemetryError TelemetryError::address_parse_error(const std::string& address) {
    TelemetryError e(Kind::AddressParseError, "cannot parse IPv4 address '" + address + "'");
    e.address_ = address;
    return e;
}

TelemetryError TelemetryError::invalid_ip(const std::string& ip) {
    TelemetryError e(Kind::InvalidIP, "invalid console address '" + ip +
                                      "' (expected a LAN IPv4 address)");
    e.address_ = ip;
    return e;
}

TelemetryError TelemetryError::invalid_port(uint32_t port) {
    TelemetryError e(Kind::InvalidPort, "invalid port " + std::to_string(port) + " (valid range 1-65535)");
    e.actual_ = port;
    return e;
}

TelemetryError TelemetryError::timeout(const std::string& operation, uint64_t timeout_ms) {
    TelemetryError e(Kind::Timeout, "operation '" + operation + "' timed out after " +
                                    std::to_string(timeout_ms) + "ms");
    e.field_ = operation;
    e.expected_ = timeout_ms;
    return e;
}

TelemetryError TelemetryError::game_not_connected(const std::string& last_heartbeat) {
    TelemetryError e(Kind::GameNotConnected, "game not connected (last heartbeat: " + last_heartbeat + ")");
    e.reason_ = last_heartbeat;
    return e;
}

TelemetryError TelemetryError::incomplete_data(size_t expected, size_t actual) {
    TelemetryError e(Kind::IncompleteData, "incomplete datagram: expected " + std::to_string(expected) +
                                           " bytes, got " + std::to_string(actual));
    e.expected_ = expected;
    e.actual_ = actual;
    return e;
}

TelemetryError TelemetryError::config_error(const std::string& field, const std::string& value,
                                            const std::string& reason) {
    TelemetryError e(Kind::ConfigError, "config error: " + field + " = " + value + " (" + reason + ")");
    e.field_ = field;
    e.address_ = value;
    e.reason_ = reason;
    return e;
}

TelemetryError TelemetryError::invalid_game_state(const std::string& current, const std::string& operation) {
    TelemetryError e(Kind::InvalidGameState, "state '" + current + "' does not allow operation '" +
                                             operation + "'");
    e.field_ = operation;
    e.reason_ = current;
    return e;
}

const char* TelemetryError::kind_name() const {
    switch (kind_) {
        case Kind::Incomplete: return "Incomplete";
        case Kind::VersionMismatch: return "VersionMismatch";
        case Kind::ParseError: return "ParseError";
        case Kind::InvalidFormat: return "InvalidFormat";
        case Kind::ChecksumError: return "ChecksumError";
        case Kind::NetworkError: return "NetworkError";
        case Kind::SocketError: return "SocketError";
        case Kind::AddressParseError: return "AddressParseError";
        case Kind::InvalidIP: return "InvalidIP";
        case Kind::InvalidPort: return "InvalidPort";
        case Kind::Timeout: return "Timeout";
        case Kind::GameNotConnected: return "GameNotConnected";
        case Kind::IncompleteData: return "IncompleteData";
        case Kind::ConfigError: return "ConfigError";
        case Kind::InvalidGameState: return "InvalidGameState";
    }
    return "Unknown";
}

bool TelemetryError::is_network() const {
    return kind_ == Kind::NetworkError || kind_ == Kind::SocketError || kind_ == Kind::AddressParseError;
}

bool TelemetryError::is_packet() const {
    switch (kind_) {
        case Kind::Incomplete:
        case Kind::IncompleteData:
        case Kind::ParseError:
        case Kind::VersionMismatch:
        case Kind::ChecksumError:
        case Kind::InvalidFormat:
            return true;
        default:
            return false;
    }
}

bool TelemetryError::is_config() const {
    return kind_ == Kind::ConfigError || kind_ == Kind::InvalidIP || kind_ == Kind::InvalidPort;
}

bool TelemetryError::is_recoverable() const {
    switch (kind_) {
        case Kind::Timeout:
        case Kind::GameNotConnected:
        case Kind::Incomplete:
        case Kind::IncompleteData:
        case Kind::NetworkError:
            return true;
        default:
            return false;
    }
}
