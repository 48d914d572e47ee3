#pragma once
#include "gamepad/ds4_report.hpp"
#include <array>
#include <cstdint>
#include <vector>

// HID report descriptor for the virtual DS4 (report id 1): four stick axes,
// 14 buttons plus filler, a hat switch and two trigger axes.
const std::vector<uint8_t>& ds4_hid_descriptor();

// The head of a DS4Report laid out as the descriptor declares it.
std::array<uint8_t, Constants::DS4_HID_INPUT_SIZE> ds4_hid_input_report(const DS4Report& report);
