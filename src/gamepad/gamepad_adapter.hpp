#pragma once
#include "gamepad/ds4_report.hpp"
#include <cstdint>

using TargetHandle = uint32_t;

// Delivers DS4 reports to the operating system. One adapter serves many
// targets; it must outlive every target attached to it.
class GamepadAdapter {
public:
    virtual ~GamepadAdapter() = default;

    // Throws GamepadError if the platform refuses a new target.
    virtual TargetHandle attach() = 0;
    // Synchronous: returns once the native layer has accepted the report.
    virtual void submit(TargetHandle handle, const DS4Report& report) = 0;
    // Never throws; teardown failures are logged.
    virtual void detach(TargetHandle handle) = 0;

    virtual const char* name() const = 0;
};
