#pragma once
#include "config/constants.hpp"
#include <cstdint>

namespace DS4Button {
    constexpr uint16_t L1 = 0x0001;
    constexpr uint16_t R1 = 0x0002;
    constexpr uint16_t L2 = 0x0004;
    constexpr uint16_t R2 = 0x0008;
    constexpr uint16_t Cross = 0x0010;
    constexpr uint16_t Circle = 0x0020;
    constexpr uint16_t Square = 0x0040;
    constexpr uint16_t Triangle = 0x0080;
    constexpr uint16_t PlayStation = 0x0100;
    constexpr uint16_t TouchPad = 0x0200;
    constexpr uint16_t ThumbLeft = 0x0400;
    constexpr uint16_t ThumbRight = 0x0800;
    constexpr uint16_t Share = 0x1000;
    constexpr uint16_t Options = 0x2000;
}

enum class DS4DPad : uint8_t {
    North = 0,
    NorthEast = 1,
    East = 2,
    SouthEast = 3,
    South = 4,
    SouthWest = 5,
    West = 6,
    NorthWest = 7,
    None = 8
};

const char* to_string(DS4DPad dpad);

// Input report in the bus driver's DS4_REPORT layout. Handed to the driver
// by pointer, so it must stay exactly 64 bytes with no padding.
#pragma pack(push, 1)
struct DS4Report {
    uint8_t report_id = Constants::DS4_REPORT_ID;
    uint8_t left_thumb_x = Constants::DS4_AXIS_CENTER;
    uint8_t left_thumb_y = Constants::DS4_AXIS_CENTER;
    uint8_t right_thumb_x = Constants::DS4_AXIS_CENTER;
    uint8_t right_thumb_y = Constants::DS4_AXIS_CENTER;
    uint16_t buttons = 0;
    uint8_t dpad = static_cast<uint8_t>(DS4DPad::None);
    uint8_t left_trigger = 0;
    uint8_t right_trigger = 0;
    uint16_t timestamp = 0;
    uint8_t battery = 0;
    int16_t gyro_x = 0;
    int16_t gyro_y = 0;
    int16_t gyro_z = 0;
    int16_t accel_x = 0;
    int16_t accel_y = 0;
    int16_t accel_z = 0;
    uint8_t reserved[5] = {0};
    uint8_t extension[34] = {0};
};
#pragma pack(pop)

static_assert(sizeof(DS4Report) == Constants::DS4_REPORT_SIZE, "DS4Report must be 64 bytes");

struct RgbColor {
    uint8_t r = 0, g = 0, b = 0;
    bool operator==(const RgbColor& o) const { return r == o.r && g == o.g && b == o.b; }
};

// Full controller state. LED and rumble are side channels and are not part
// of the submitted report.
struct ControllerState {
    DS4Report report;
    RgbColor led{0, 0, 255};
    uint8_t left_rumble = 0;
    uint8_t right_rumble = 0;
};
