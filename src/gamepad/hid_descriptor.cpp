#include "gamepad/hid_descriptor.hpp"

const std::vector<uint8_t>& ds4_hid_descriptor() {
    static const std::vector<uint8_t> descriptor = {
        0x05, 0x01,         // Usage Page (Generic Desktop)
        0x09, 0x05,         // Usage (Game Pad)
        0xA1, 0x01,         // Collection (Application)
        0x85, 0x01,         //   Report ID (1)

        0x09, 0x30,         //   Usage (X)
        0x09, 0x31,         //   Usage (Y)
        0x09, 0x32,         //   Usage (Z)
        0x09, 0x35,         //   Usage (Rz)
        0x15, 0x00,         //   Logical Minimum (0)
        0x26, 0xFF, 0x00,   //   Logical Maximum (255)
        0x75, 0x08,         //   Report Size (8)
        0x95, 0x04,         //   Report Count (4)
        0x81, 0x02,         //   Input (Data,Var,Abs)

        0x05, 0x09,         //   Usage Page (Button)
        0x19, 0x01,         //   Usage Minimum (1)
        0x29, 0x0E,         //   Usage Maximum (14)
        0x15, 0x00,         //   Logical Minimum (0)
        0x25, 0x01,         //   Logical Maximum (1)
        0x75, 0x01,         //   Report Size (1)
        0x95, 0x0E,         //   Report Count (14)
        0x81, 0x02,         //   Input (Data,Var,Abs)

        0x75, 0x02,         //   Report Size (2)
        0x95, 0x01,         //   Report Count (1)
        0x81, 0x03,         //   Input (Cnst,Var,Abs)

        0x05, 0x01,         //   Usage Page (Generic Desktop)
        0x09, 0x39,         //   Usage (Hat switch)
        0x15, 0x00,         //   Logical Minimum (0)
        0x25, 0x07,         //   Logical Maximum (7)
        0x35, 0x00,         //   Physical Minimum (0)
        0x46, 0x3B, 0x01,   //   Physical Maximum (315)
        0x65, 0x14,         //   Unit (English Rotation, degrees)
        0x75, 0x04,         //   Report Size (4)
        0x95, 0x01,         //   Report Count (1)
        0x81, 0x42,         //   Input (Data,Var,Abs,Null State)

        0x75, 0x04,         //   Report Size (4)
        0x95, 0x01,         //   Report Count (1)
        0x81, 0x03,         //   Input (Cnst,Var,Abs)

        0x05, 0x01,         //   Usage Page (Generic Desktop)
        0x09, 0x32,         //   Usage (Z)
        0x09, 0x35,         //   Usage (Rz)
        0x15, 0x00,         //   Logical Minimum (0)
        0x26, 0xFF, 0x00,   //   Logical Maximum (255)
        0x75, 0x08,         //   Report Size (8)
        0x95, 0x02,         //   Report Count (2)
        0x81, 0x02,         //   Input (Data,Var,Abs)

        0xC0                // End Collection
    };
    return descriptor;
}

std::array<uint8_t, Constants::DS4_HID_INPUT_SIZE> ds4_hid_input_report(const DS4Report& report) {
    std::array<uint8_t, Constants::DS4_HID_INPUT_SIZE> out{};
    out[0] = report.report_id;
    out[1] = report.left_thumb_x;
    out[2] = report.left_thumb_y;
    out[3] = report.right_thumb_x;
    out[4] = report.right_thumb_y;
    uint16_t buttons = report.buttons;
    out[5] = uint8_t(buttons & 0xFF);
    out[6] = uint8_t((buttons >> 8) & 0x3F);   // 14 buttons, 2 filler bits
    out[7] = uint8_t(report.dpad & 0x0F);       // hat, 4 filler bits
    out[8] = report.left_trigger;
    out[9] = report.right_trigger;
    return out;
}
