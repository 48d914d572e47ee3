#pragma once
#include <cstddef>

// Byte offsets of the 296-byte GT7 telemetry frame (little-endian).
//
// The engine block ends at 212 while the track section starts at 200, so
// bytes 200..211 are read by both sections. Encoders write the car section
// first and the track section last.
namespace FrameLayout {
    constexpr size_t MAGIC = 0;
    constexpr size_t VERSION = 4;
    constexpr size_t PACKET_ID = 6;

    // Game state
    constexpr size_t GAME_STATE = 10;
    constexpr size_t IS_PAUSED = 11;
    constexpr size_t IS_REPLAY = 12;
    constexpr size_t MENU_ID = 13;

    // Race block, only meaningful when the state is InRace
    constexpr size_t RACE = 17;
    constexpr size_t RACE_CURRENT_LAP = RACE + 0;
    constexpr size_t RACE_TOTAL_LAPS = RACE + 2;
    constexpr size_t RACE_POSITION = RACE + 4;
    constexpr size_t RACE_PARTICIPANTS = RACE + 5;
    constexpr size_t RACE_BEST_LAP_MS = RACE + 6;
    constexpr size_t RACE_LAST_LAP_MS = RACE + 10;
    constexpr size_t RACE_CURRENT_LAP_MS = RACE + 14;
    constexpr size_t RACE_PROGRESS = RACE + 18;
    constexpr size_t RACE_END = RACE + 22;

    // Car position: world, velocity, rotation, angular velocity
    constexpr size_t CAR = 50;
    constexpr size_t CAR_WORLD = CAR + 0;
    constexpr size_t CAR_VELOCITY = CAR + 12;
    constexpr size_t CAR_ROTATION = CAR + 24;
    constexpr size_t CAR_ANGULAR_VELOCITY = CAR + 36;

    // Tires FL, FR, RL, RR; five floats each
    constexpr size_t TIRES = CAR + 48;
    constexpr size_t TIRE_STRIDE = 20;
    constexpr size_t TIRE_TEMPERATURE = 0;
    constexpr size_t TIRE_WEAR = 4;
    constexpr size_t TIRE_SUSPENSION = 8;
    constexpr size_t TIRE_WHEEL_SPEED = 12;
    constexpr size_t TIRE_RADIUS = 16;

    constexpr size_t ENGINE = TIRES + 4 * TIRE_STRIDE;
    constexpr size_t ENGINE_FUEL_REMAINING = ENGINE + 0;
    constexpr size_t ENGINE_FUEL_CAPACITY = ENGINE + 4;
    constexpr size_t ENGINE_RPM = ENGINE + 8;
    constexpr size_t ENGINE_MAX_RPM = ENGINE + 12;
    constexpr size_t ENGINE_THROTTLE = ENGINE + 16;
    constexpr size_t ENGINE_BRAKE = ENGINE + 20;
    constexpr size_t ENGINE_CLUTCH = ENGINE + 24;
    constexpr size_t ENGINE_GEAR = ENGINE + 28;
    constexpr size_t ENGINE_SUGGESTED_GEAR = ENGINE + 29;
    constexpr size_t ENGINE_FUEL_CONSUMPTION = ENGINE + 30;
    constexpr size_t ENGINE_END = ENGINE + 34;

    // Track
    constexpr size_t TRACK = 200;
    constexpr size_t TRACK_ID = TRACK + 0;
    constexpr size_t TRACK_LENGTH = TRACK + 4;
    constexpr size_t TRACK_ALTITUDE = TRACK + 8;
    constexpr size_t TRACK_WEATHER = TRACK + 12;
    constexpr size_t TRACK_ROAD_TEMP = TRACK + 13;
    constexpr size_t TRACK_AIR_TEMP = TRACK + 17;
    constexpr size_t TRACK_SECTOR = TRACK + 21;
    constexpr size_t TRACK_WETNESS = TRACK + 22;
    constexpr size_t TRACK_NAME = TRACK + 26;
    constexpr size_t TRACK_NAME_SIZE = 32;
    constexpr size_t TRACK_END = TRACK_NAME + TRACK_NAME_SIZE;

    constexpr size_t TIMESTAMP = 280;
    constexpr size_t FRAME_END = TIMESTAMP + 8;

    static_assert(RACE_END <= CAR, "race block must end before the car section");
    static_assert(ENGINE_END == 212, "engine block layout changed");
    static_assert(TRACK_END <= TIMESTAMP, "track section must end before the timestamp");
    static_assert(FRAME_END <= 296, "frame layout exceeds the datagram size");
}
