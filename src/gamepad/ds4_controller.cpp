#include "gamepad/ds4_controller.hpp"
#include "gamepad/gamepad_error.hpp"
#include "utils/logging.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace {

constexpr uint16_t ALL_BUTTONS = 0x3FFF;

bool in_range(float v, float lo, float hi) {
    // NaN fails both comparisons
    return v >= lo && v <= hi;
}

uint8_t stick_byte(float v) {
    return static_cast<uint8_t>(std::floor((v + 1.0f) * 127.5f));
}

uint8_t trigger_byte(float v) {
    return static_cast<uint8_t>(std::floor(v * 255.0f));
}

std::string format_pair(float x, float y) {
    std::ostringstream ss;
    ss << "(" << x << ", " << y << ")";
    return ss.str();
}

std::string format_value(float v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

std::string format_mask(uint16_t mask) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << mask;
    return ss.str();
}

void check_button(uint16_t button) {
    if (button == 0 || (button & ~ALL_BUTTONS) != 0) {
        throw GamepadError::invalid_input("button", "DS4Button mask within 0x3FFF", format_mask(button));
    }
}

void check_stick(const char* field, float x, float y) {
    if (!in_range(x, -1.0f, 1.0f) || !in_range(y, -1.0f, 1.0f)) {
        throw GamepadError::invalid_input(field, "-1.0 to 1.0", format_pair(x, y));
    }
}

void check_trigger(const char* field, float v) {
    if (!in_range(v, 0.0f, 1.0f)) {
        throw GamepadError::invalid_input(field, "0.0 to 1.0", format_value(v));
    }
}

}

const char* to_string(DS4DPad dpad) {
    switch (dpad) {
        case DS4DPad::North: return "N";
        case DS4DPad::NorthEast: return "NE";
        case DS4DPad::East: return "E";
        case DS4DPad::SouthEast: return "SE";
        case DS4DPad::South: return "S";
        case DS4DPad::SouthWest: return "SW";
        case DS4DPad::West: return "W";
        case DS4DPad::NorthWest: return "NW";
        case DS4DPad::None: return "None";
    }
    return "None";
}

DS4Controller::DS4Controller(GamepadAdapter& adapter)
    : adapter_(adapter)
    , handle_(adapter.attach()) {
    Logger::info("DS4 controller " + std::to_string(handle_) + " attached (" + adapter_.name() + ")");
}

DS4Controller::~DS4Controller() {
    adapter_.detach(handle_);
    Logger::info("DS4 controller " + std::to_string(handle_) + " detached");
}

void DS4Controller::press(uint16_t button) {
    check_button(button);
    Logger::debug("DS4 press " + format_mask(button));
    state_.report.buttons = uint16_t(state_.report.buttons | button);
    update();
}

void DS4Controller::release(uint16_t button) {
    check_button(button);
    Logger::debug("DS4 release " + format_mask(button));
    state_.report.buttons = uint16_t(state_.report.buttons & ~button);
    update();
}

void DS4Controller::set_dpad(DS4DPad direction) {
    if (static_cast<uint8_t>(direction) > static_cast<uint8_t>(DS4DPad::None)) {
        throw GamepadError::invalid_input("dpad", "0 to 8", std::to_string(static_cast<int>(direction)));
    }
    state_.report.dpad = static_cast<uint8_t>(direction);
    update();
}

void DS4Controller::set_left_stick(float x, float y) {
    check_stick("left_stick", x, y);
    state_.report.left_thumb_x = stick_byte(x);
    state_.report.left_thumb_y = stick_byte(y);
    update();
}

void DS4Controller::set_right_stick(float x, float y) {
    check_stick("right_stick", x, y);
    state_.report.right_thumb_x = stick_byte(x);
    state_.report.right_thumb_y = stick_byte(y);
    update();
}

void DS4Controller::set_left_trigger(float value) {
    check_trigger("left_trigger", value);
    state_.report.left_trigger = trigger_byte(value);
    update();
}

void DS4Controller::set_right_trigger(float value) {
    check_trigger("right_trigger", value);
    state_.report.right_trigger = trigger_byte(value);
    update();
}

void DS4Controller::reset() {
    Logger::debug("DS4 controller " + std::to_string(handle_) + " reset");
    state_ = ControllerState();
    update();
}

void DS4Controller::set_led_color(uint8_t r, uint8_t g, uint8_t b) {
    state_.led = RgbColor{r, g, b};
}

void DS4Controller::set_rumble(uint8_t left, uint8_t right) {
    state_.left_rumble = left;
    state_.right_rumble = right;
}

void DS4Controller::update() {
    adapter_.submit(handle_, state_.report);
}
