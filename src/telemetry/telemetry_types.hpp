#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

struct Vector3 {
    float x = 0, y = 0, z = 0;

    float magnitude() const;
    bool operator==(const Vector3& other) const { return x == other.x && y == other.y && z == other.z; }
};

enum class GameStateType : uint8_t {
    InMenu = 0,
    InRace = 1,
    Paused = 2,
    Replay = 3,
    Garage = 4,
    Loading = 5,
    Unknown = 255
};

enum class WeatherCondition : uint8_t {
    Clear = 0,
    Cloudy = 1,
    LightRain = 2,
    HeavyRain = 3,
    Fog = 4,
    Snow = 5,
    Unknown = 255
};

// Unknown discriminants collapse to Unknown.
GameStateType game_state_from_byte(uint8_t value);
WeatherCondition weather_from_byte(uint8_t value);
const char* to_string(GameStateType state);
const char* to_string(WeatherCondition weather);

struct RaceInfo {
    uint16_t current_lap = 0;
    uint16_t total_laps = 0;
    uint8_t position = 0;
    uint8_t total_participants = 0;
    std::optional<uint32_t> best_lap_ms;     // absent when the wire value is 0
    std::optional<uint32_t> last_lap_ms;     // absent when the wire value is 0
    uint32_t current_lap_ms = 0;
    float track_progress = 0;
};

struct GameState {
    GameStateType state = GameStateType::Unknown;
    bool is_paused = false;
    bool is_replay = false;
    uint32_t menu_id = 0;
    std::optional<RaceInfo> race;            // present iff state == InRace
};

struct CarPosition {
    Vector3 world;
    Vector3 velocity;
    Vector3 angular_velocity;
    Vector3 rotation;
};

struct TireData {
    float temperature = 0;          // deg C
    float wear = 0;                 // 0..1
    float suspension_travel = 0;    // m
    float wheel_speed = 0;          // rad/s
    float radius = 0;               // m
};

struct TireSet {
    TireData front_left;
    TireData front_right;
    TireData rear_left;
    TireData rear_right;
};

struct EngineInfo {
    float rpm = 0;
    float max_rpm = 0;
    float throttle = 0;             // 0..1
    float brake = 0;                // 0..1
    float clutch = 0;               // 0..1
    int8_t gear = 0;                // 0 = reverse
    int8_t suggested_gear = 0;
    float fuel_remaining = 0;
    float fuel_consumption = 0;
    float fuel_capacity = 0;
    float fuel_level = 0;           // fuel_remaining / fuel_capacity, 0 without a tank
};

struct CarInfo {
    CarPosition position;
    TireSet tires;
    EngineInfo engine;
};

struct TrackInfo {
    uint32_t id = 0;
    std::string name;
    float length = 0;
    float altitude = 0;
    WeatherCondition weather = WeatherCondition::Unknown;
    float road_temperature = 0;
    float air_temperature = 0;
    uint8_t current_sector = 0;
    float wetness = 0;              // 0..1
};

struct TelemetryFrame {
    uint16_t version = 0;
    uint32_t packet_id = 0;
    GameState game_state;
    CarInfo car;
    TrackInfo track;
    uint64_t timestamp = 0;

    bool is_in_race() const { return game_state.state == GameStateType::InRace; }
    bool is_in_menu() const { return game_state.state == GameStateType::InMenu; }
    float speed_kmh() const;
    std::string gear_display() const;
    std::optional<std::chrono::milliseconds> best_lap_time() const;
    std::optional<std::chrono::milliseconds> last_lap_time() const;
};

// One publication on the fan-out channel.
struct TelemetryEvent {
    std::string peer_ip;
    TelemetryFrame frame;
};
