#pragma once
#include "gamepad/gamepad_adapter.hpp"
#include "gamepad/ds4_report.hpp"

// One virtual DualShock 4. Every successful mutator submits the new report
// to the adapter; a rejected input leaves the state untouched. Callers
// serialize mutations.
class DS4Controller {
public:
    // Attaches a new target; throws GamepadError if the adapter refuses.
    explicit DS4Controller(GamepadAdapter& adapter);
    ~DS4Controller();

    DS4Controller(const DS4Controller&) = delete;
    DS4Controller& operator=(const DS4Controller&) = delete;

    // `button` is one or more DS4Button masks.
    void press(uint16_t button);
    void release(uint16_t button);
    void set_dpad(DS4DPad direction);

    // Axes in [-1, 1]; byte = floor((v + 1) * 127.5).
    void set_left_stick(float x, float y);
    void set_right_stick(float x, float y);

    // [0, 1]; byte = floor(v * 255).
    void set_left_trigger(float value);
    void set_right_trigger(float value);

    void reset();

    // Side channels, not part of the report.
    void set_led_color(uint8_t r, uint8_t g, uint8_t b);
    void set_rumble(uint8_t left, uint8_t right);

    const ControllerState& snapshot() const { return state_; }
    TargetHandle handle() const { return handle_; }

    // Resubmits the current report.
    void update();

private:
    GamepadAdapter& adapter_;
    TargetHandle handle_;
    ControllerState state_;
};
