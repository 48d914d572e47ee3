#include "telemetry/frame_codec.hpp"
#include "telemetry/frame_layout.hpp"
#include "telemetry/telemetry_error.hpp"
#include "config/constants.hpp"
#include <cstring>

namespace {

// Bounds-checked little-endian reads at absolute offsets.
class FieldReader {
public:
    FieldReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

    uint8_t u8(size_t offset, const char* field) const {
        check(offset, 1, field);
        return data_[offset];
    }

    int8_t i8(size_t offset, const char* field) const {
        return static_cast<int8_t>(u8(offset, field));
    }

    uint16_t u16(size_t offset, const char* field) const {
        check(offset, 2, field);
        return uint16_t(data_[offset]) | (uint16_t(data_[offset + 1]) << 8);
    }

    uint32_t u32(size_t offset, const char* field) const {
        check(offset, 4, field);
        uint32_t v = 0;
        for (int i = 0; i < 4; i++) {
            v |= uint32_t(data_[offset + i]) << (8 * i);
        }
        return v;
    }

    uint64_t u64(size_t offset, const char* field) const {
        check(offset, 8, field);
        uint64_t v = 0;
        for (int i = 0; i < 8; i++) {
            v |= uint64_t(data_[offset + i]) << (8 * i);
        }
        return v;
    }

    float f32(size_t offset, const char* field) const {
        uint32_t v = u32(offset, field);
        float f;
        std::memcpy(&f, &v, 4);
        return f;
    }

    Vector3 vec3(size_t offset, const char* field) const {
        Vector3 v;
        v.x = f32(offset, field);
        v.y = f32(offset + 4, field);
        v.z = f32(offset + 8, field);
        return v;
    }

    const uint8_t* bytes(size_t offset, size_t n, const char* field) const {
        check(offset, n, field);
        return data_ + offset;
    }

private:
    void check(size_t offset, size_t n, const char* field) const {
        if (offset > len_ || n > len_ - offset) {
            throw TelemetryError::parse_error(field, offset, n);
        }
    }

    const uint8_t* data_;
    size_t len_;
};

TireData read_tire(const FieldReader& r, size_t base) {
    using namespace FrameLayout;
    TireData t;
    t.temperature = r.f32(base + TIRE_TEMPERATURE, "tire_temperature");
    t.wear = r.f32(base + TIRE_WEAR, "tire_wear");
    t.suspension_travel = r.f32(base + TIRE_SUSPENSION, "tire_suspension_travel");
    t.wheel_speed = r.f32(base + TIRE_WHEEL_SPEED, "tire_wheel_speed");
    t.radius = r.f32(base + TIRE_RADIUS, "tire_radius");
    return t;
}

bool in_unit_range(float v) {
    // NaN fails both comparisons
    return v >= 0.0f && v <= 1.0f;
}

bool is_continuation(uint8_t b) {
    return (b & 0xC0) == 0x80;
}

// Length of the valid UTF-8 sequence starting at data[i], or 0 if invalid.
size_t utf8_sequence_length(const uint8_t* data, size_t len, size_t i) {
    uint8_t lead = data[i];
    if (lead < 0x80) return 1;

    size_t need;
    uint8_t lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        need = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        need = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }

    if (i + need > len) return 0;
    if (data[i + 1] < lo || data[i + 1] > hi) return 0;
    for (size_t k = 2; k < need; k++) {
        if (!is_continuation(data[i + k])) return 0;
    }
    return need;
}

}

std::string decode_track_name(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len);
    size_t i = 0;
    while (i < len) {
        size_t n = utf8_sequence_length(data, len, i);
        if (n == 0) {
            out += "\xEF\xBF\xBD";
            i++;
            continue;
        }
        out.append(reinterpret_cast<const char*>(data + i), n);
        i += n;
    }
    while (!out.empty() && out.back() == '\0') {
        out.pop_back();
    }
    return out;
}

GameState FrameCodec::decode_game_state(const uint8_t* data, size_t len) {
    using namespace FrameLayout;
    FieldReader r(data, len);

    GameState gs;
    gs.state = game_state_from_byte(r.u8(GAME_STATE, "game_state"));
    gs.is_paused = r.u8(IS_PAUSED, "is_paused") != 0;
    gs.is_replay = r.u8(IS_REPLAY, "is_replay") != 0;
    gs.menu_id = r.u32(MENU_ID, "menu_id");

    if (gs.state == GameStateType::InRace) {
        RaceInfo race;
        race.current_lap = r.u16(RACE_CURRENT_LAP, "current_lap");
        race.total_laps = r.u16(RACE_TOTAL_LAPS, "total_laps");
        race.position = r.u8(RACE_POSITION, "position");
        race.total_participants = r.u8(RACE_PARTICIPANTS, "total_participants");
        uint32_t best = r.u32(RACE_BEST_LAP_MS, "best_lap_time");
        if (best > 0) race.best_lap_ms = best;
        uint32_t last = r.u32(RACE_LAST_LAP_MS, "last_lap_time");
        if (last > 0) race.last_lap_ms = last;
        race.current_lap_ms = r.u32(RACE_CURRENT_LAP_MS, "current_lap_time");
        race.track_progress = r.f32(RACE_PROGRESS, "track_progress");
        gs.race = race;
    }
    return gs;
}

CarInfo FrameCodec::decode_car(const uint8_t* data, size_t len) {
    using namespace FrameLayout;
    FieldReader r(data, len);

    CarInfo car;
    car.position.world = r.vec3(CAR_WORLD, "world_position");
    car.position.velocity = r.vec3(CAR_VELOCITY, "velocity");
    car.position.rotation = r.vec3(CAR_ROTATION, "rotation");
    car.position.angular_velocity = r.vec3(CAR_ANGULAR_VELOCITY, "angular_velocity");

    car.tires.front_left = read_tire(r, TIRES + 0 * TIRE_STRIDE);
    car.tires.front_right = read_tire(r, TIRES + 1 * TIRE_STRIDE);
    car.tires.rear_left = read_tire(r, TIRES + 2 * TIRE_STRIDE);
    car.tires.rear_right = read_tire(r, TIRES + 3 * TIRE_STRIDE);

    EngineInfo& e = car.engine;
    e.fuel_remaining = r.f32(ENGINE_FUEL_REMAINING, "fuel_remaining");
    e.fuel_capacity = r.f32(ENGINE_FUEL_CAPACITY, "fuel_capacity");
    e.rpm = r.f32(ENGINE_RPM, "rpm");
    e.max_rpm = r.f32(ENGINE_MAX_RPM, "max_rpm");
    e.throttle = r.f32(ENGINE_THROTTLE, "throttle");
    e.brake = r.f32(ENGINE_BRAKE, "brake");
    e.clutch = r.f32(ENGINE_CLUTCH, "clutch");
    e.gear = r.i8(ENGINE_GEAR, "gear");
    e.suggested_gear = r.i8(ENGINE_SUGGESTED_GEAR, "suggested_gear");
    e.fuel_consumption = r.f32(ENGINE_FUEL_CONSUMPTION, "fuel_consumption");
    e.fuel_level = e.fuel_capacity > 0.0f ? e.fuel_remaining / e.fuel_capacity : 0.0f;
    return car;
}

TrackInfo FrameCodec::decode_track(const uint8_t* data, size_t len) {
    using namespace FrameLayout;
    FieldReader r(data, len);

    TrackInfo t;
    t.id = r.u32(TRACK_ID, "track_id");
    t.length = r.f32(TRACK_LENGTH, "track_length");
    t.altitude = r.f32(TRACK_ALTITUDE, "altitude");
    t.weather = weather_from_byte(r.u8(TRACK_WEATHER, "weather"));
    t.road_temperature = r.f32(TRACK_ROAD_TEMP, "road_temperature");
    t.air_temperature = r.f32(TRACK_AIR_TEMP, "air_temperature");
    t.current_sector = r.u8(TRACK_SECTOR, "current_sector");
    t.wetness = r.f32(TRACK_WETNESS, "wetness");
    t.name = decode_track_name(r.bytes(TRACK_NAME, TRACK_NAME_SIZE, "track_name"), TRACK_NAME_SIZE);
    return t;
}

TelemetryFrame FrameCodec::decode(const uint8_t* data, size_t len) {
    using namespace FrameLayout;
    if (len != Constants::GT7_PACKET_SIZE) {
        throw TelemetryError::incomplete(Constants::GT7_PACKET_SIZE, len);
    }

    FieldReader r(data, len);
    if (r.u32(MAGIC, "magic") != Constants::GT7_MAGIC) {
        throw TelemetryError::invalid_format("magic");
    }

    TelemetryFrame frame;
    frame.version = r.u16(VERSION, "version");
    if (frame.version != Constants::GT7_PACKET_VERSION) {
        throw TelemetryError::version_mismatch(Constants::GT7_PACKET_VERSION, frame.version);
    }

    frame.packet_id = r.u32(PACKET_ID, "packet_id");
    frame.game_state = decode_game_state(data, len);
    frame.car = decode_car(data, len);
    frame.track = decode_track(data, len);
    frame.timestamp = r.u64(TIMESTAMP, "timestamp");

    validate(frame);
    return frame;
}

void FrameCodec::validate(const TelemetryFrame& frame) {
    if (frame.version != Constants::GT7_PACKET_VERSION) {
        throw TelemetryError::version_mismatch(Constants::GT7_PACKET_VERSION, frame.version);
    }
    if (!in_unit_range(frame.car.engine.throttle)) {
        throw TelemetryError::invalid_format("throttle");
    }
    if (!in_unit_range(frame.car.engine.brake)) {
        throw TelemetryError::invalid_format("brake");
    }
    if (!in_unit_range(frame.track.wetness)) {
        throw TelemetryError::invalid_format("wetness");
    }
}

void FrameCodec::put_u8(std::vector<uint8_t>& b, size_t offset, uint8_t v) {
    b[offset] = v;
}

void FrameCodec::put_u16(std::vector<uint8_t>& b, size_t offset, uint16_t v) {
    b[offset] = v & 0xFF;
    b[offset + 1] = (v >> 8) & 0xFF;
}

void FrameCodec::put_u32(std::vector<uint8_t>& b, size_t offset, uint32_t v) {
    for (int i = 0; i < 4; i++) {
        b[offset + i] = (v >> (8 * i)) & 0xFF;
    }
}

void FrameCodec::put_u64(std::vector<uint8_t>& b, size_t offset, uint64_t v) {
    for (int i = 0; i < 8; i++) {
        b[offset + i] = (v >> (8 * i)) & 0xFF;
    }
}

void FrameCodec::put_f32(std::vector<uint8_t>& b, size_t offset, float f) {
    uint32_t v;
    std::memcpy(&v, &f, 4);
    put_u32(b, offset, v);
}

void FrameCodec::put_vec3(std::vector<uint8_t>& b, size_t offset, const Vector3& v) {
    put_f32(b, offset, v.x);
    put_f32(b, offset + 4, v.y);
    put_f32(b, offset + 8, v.z);
}

std::vector<uint8_t> FrameCodec::encode(const TelemetryFrame& frame) {
    using namespace FrameLayout;
    std::vector<uint8_t> b(Constants::GT7_PACKET_SIZE, 0);

    put_u32(b, MAGIC, Constants::GT7_MAGIC);
    put_u16(b, VERSION, frame.version);
    put_u32(b, PACKET_ID, frame.packet_id);

    const GameState& gs = frame.game_state;
    put_u8(b, GAME_STATE, static_cast<uint8_t>(gs.state));
    put_u8(b, IS_PAUSED, gs.is_paused ? 1 : 0);
    put_u8(b, IS_REPLAY, gs.is_replay ? 1 : 0);
    put_u32(b, MENU_ID, gs.menu_id);
    if (gs.state == GameStateType::InRace && gs.race) {
        const RaceInfo& race = *gs.race;
        put_u16(b, RACE_CURRENT_LAP, race.current_lap);
        put_u16(b, RACE_TOTAL_LAPS, race.total_laps);
        put_u8(b, RACE_POSITION, race.position);
        put_u8(b, RACE_PARTICIPANTS, race.total_participants);
        put_u32(b, RACE_BEST_LAP_MS, race.best_lap_ms.value_or(0));
        put_u32(b, RACE_LAST_LAP_MS, race.last_lap_ms.value_or(0));
        put_u32(b, RACE_CURRENT_LAP_MS, race.current_lap_ms);
        put_f32(b, RACE_PROGRESS, race.track_progress);
    }

    const CarInfo& car = frame.car;
    put_vec3(b, CAR_WORLD, car.position.world);
    put_vec3(b, CAR_VELOCITY, car.position.velocity);
    put_vec3(b, CAR_ROTATION, car.position.rotation);
    put_vec3(b, CAR_ANGULAR_VELOCITY, car.position.angular_velocity);

    const TireData* tires[4] = { &car.tires.front_left, &car.tires.front_right,
                                 &car.tires.rear_left, &car.tires.rear_right };
    for (size_t i = 0; i < 4; i++) {
        size_t base = TIRES + i * TIRE_STRIDE;
        put_f32(b, base + TIRE_TEMPERATURE, tires[i]->temperature);
        put_f32(b, base + TIRE_WEAR, tires[i]->wear);
        put_f32(b, base + TIRE_SUSPENSION, tires[i]->suspension_travel);
        put_f32(b, base + TIRE_WHEEL_SPEED, tires[i]->wheel_speed);
        put_f32(b, base + TIRE_RADIUS, tires[i]->radius);
    }

    const EngineInfo& e = car.engine;
    put_f32(b, ENGINE_FUEL_REMAINING, e.fuel_remaining);
    put_f32(b, ENGINE_FUEL_CAPACITY, e.fuel_capacity);
    put_f32(b, ENGINE_RPM, e.rpm);
    put_f32(b, ENGINE_MAX_RPM, e.max_rpm);
    put_f32(b, ENGINE_THROTTLE, e.throttle);
    put_f32(b, ENGINE_BRAKE, e.brake);
    put_f32(b, ENGINE_CLUTCH, e.clutch);
    put_u8(b, ENGINE_GEAR, static_cast<uint8_t>(e.gear));
    put_u8(b, ENGINE_SUGGESTED_GEAR, static_cast<uint8_t>(e.suggested_gear));
    put_f32(b, ENGINE_FUEL_CONSUMPTION, e.fuel_consumption);

    // Track last: it owns the bytes shared with the engine block.
    const TrackInfo& t = frame.track;
    put_u32(b, TRACK_ID, t.id);
    put_f32(b, TRACK_LENGTH, t.length);
    put_f32(b, TRACK_ALTITUDE, t.altitude);
    put_u8(b, TRACK_WEATHER, static_cast<uint8_t>(t.weather));
    put_f32(b, TRACK_ROAD_TEMP, t.road_temperature);
    put_f32(b, TRACK_AIR_TEMP, t.air_temperature);
    put_u8(b, TRACK_SECTOR, t.current_sector);
    put_f32(b, TRACK_WETNESS, t.wetness);

    size_t name_len = t.name.size() < TRACK_NAME_SIZE ? t.name.size() : TRACK_NAME_SIZE;
    if (name_len < t.name.size()) {
        // do not split a multi-byte sequence
        while (name_len > 0 && is_continuation(static_cast<uint8_t>(t.name[name_len]))) {
            name_len--;
        }
    }
    std::memcpy(b.data() + TRACK_NAME, t.name.data(), name_len);

    put_u64(b, TIMESTAMP, frame.timestamp);
    return b;
}
