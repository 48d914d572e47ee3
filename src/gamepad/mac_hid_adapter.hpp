#pragma once
#include "gamepad/gamepad_adapter.hpp"
#include <map>
#include <mutex>
#include <IOKit/hid/IOHIDUserDevice.h>

// User-space HID backend for macOS.
class MacHidAdapter : public GamepadAdapter {
public:
    enum class Method {
        Simulation,       // logs only
        IOKitUserspace,   // IOHIDUserDevice; needs the HID entitlement or SIP off
        DriverKit         // rejected at construction
    };

    // Throws UnsupportedPlatform for DriverKit, InsufficientPermissions if
    // the IOKit master port cannot be opened.
    explicit MacHidAdapter(Method method);
    ~MacHidAdapter() override;

    MacHidAdapter(const MacHidAdapter&) = delete;
    MacHidAdapter& operator=(const MacHidAdapter&) = delete;

    TargetHandle attach() override;
    void submit(TargetHandle handle, const DS4Report& report) override;
    void detach(TargetHandle handle) override;
    const char* name() const override;

    Method method() const { return method_; }

private:
    IOHIDUserDeviceRef create_device();

    Method method_;
    std::mutex mutex_;
    std::map<TargetHandle, IOHIDUserDeviceRef> devices_;
    TargetHandle next_handle_;
    uint64_t submit_counter_;
};

const char* to_string(MacHidAdapter::Method method);
