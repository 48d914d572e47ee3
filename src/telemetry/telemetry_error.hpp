#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// Error raised by the telemetry core. The kind drives the classification
// predicates so callers can build retry loops without parsing messages.
class TelemetryError : public std::runtime_error {
public:
    enum class Kind {
        // Codec
        Incomplete,
        VersionMismatch,
        ParseError,
        InvalidFormat,
        ChecksumError,
        // Network
        NetworkError,
        SocketError,
        AddressParseError,
        InvalidIP,
        InvalidPort,
        Timeout,
        GameNotConnected,
        IncompleteData,
        // Config
        ConfigError,
        // State
        InvalidGameState
    };

    static TelemetryError incomplete(size_t expected, size_t actual);
    static TelemetryError version_mismatch(uint16_t expected, uint16_t actual);
    static TelemetryError parse_error(const std::string& field, size_t offset, size_t length);
    static TelemetryError invalid_format(const std::string& field);
    static TelemetryError checksum_error(uint32_t calculated, uint32_t expected);

    static TelemetryError network_error(const std::string& address, const std::string& reason);
    static TelemetryError socket_error(const std::string& reason);
    static TelemetryError address_parse_error(const std::string& address);
    static TelemetryError invalid_ip(const std::string& ip);
    static TelemetryError invalid_port(uint32_t port);
    static TelemetryError timeout(const std::string& operation, uint64_t timeout_ms);
    static TelemetryError game_not_connected(const std::string& last_heartbeat);
    static TelemetryError incomplete_data(size_t expected, size_t actual);

    static TelemetryError config_error(const std::string& field, const std::string& value,
                                       const std::string& reason);
    static TelemetryError invalid_game_state(const std::string& current, const std::string& operation);

    Kind kind() const { return kind_; }
    const char* kind_name() const;

    // Structured context; fields not used by a kind stay empty / zero.
    const std::string& field() const { return field_; }
    const std::string& address() const { return address_; }
    const std::string& reason() const { return reason_; }
    size_t offset() const { return offset_; }
    size_t length() const { return length_; }
    uint64_t expected() const { return expected_; }
    uint64_t actual() const { return actual_; }

    bool is_network() const;
    bool is_packet() const;
    bool is_config() const;
    bool is_recoverable() const;

private:
    TelemetryError(Kind kind, const std::string& message);

    Kind kind_;
    std::string field_;
    std::string address_;
    std::string reason_;
    size_t offset_ = 0;
    size_t length_ = 0;
    uint64_t expected_ = 0;
    uint64_t actual_ = 0;
};
