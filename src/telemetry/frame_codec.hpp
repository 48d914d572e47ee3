#pragma once
#include "telemetry/telemetry_types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Bytes <-> TelemetryFrame. Stateless; every section is read from its fixed
// offset so sections can be tested and fuzzed independently.
class FrameCodec {
public:
    // Throws TelemetryError in this order: Incomplete (length), InvalidFormat
    // ("magic"), VersionMismatch, ParseError (short read), InvalidFormat
    // (range check on throttle/brake/wetness).
    static TelemetryFrame decode(const uint8_t* data, size_t len);
    static TelemetryFrame decode(const std::vector<uint8_t>& data) { return decode(data.data(), data.size()); }

    // Canonical 296-byte frame: reserved bytes zero, booleans as 1, absent
    // lap times as 0.
    static std::vector<uint8_t> encode(const TelemetryFrame& frame);

    static void validate(const TelemetryFrame& frame);

    static GameState decode_game_state(const uint8_t* data, size_t len);
    static CarInfo decode_car(const uint8_t* data, size_t len);
    static TrackInfo decode_track(const uint8_t* data, size_t len);

private:
    static void put_u8(std::vector<uint8_t>& b, size_t offset, uint8_t v);
    static void put_u16(std::vector<uint8_t>& b, size_t offset, uint16_t v);
    static void put_u32(std::vector<uint8_t>& b, size_t offset, uint32_t v);
    static void put_u64(std::vector<uint8_t>& b, size_t offset, uint64_t v);
    static void put_f32(std::vector<uint8_t>& b, size_t offset, float f);
    static void put_vec3(std::vector<uint8_t>& b, size_t offset, const Vector3& v);
};

// Lossy UTF-8: invalid sequences become U+FFFD, trailing NULs are trimmed.
std::string decode_track_name(const uint8_t* data, size_t len);
