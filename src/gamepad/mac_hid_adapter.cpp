#include "gamepad/mac_hid_adapter.hpp"
#include "gamepad/gamepad_error.hpp"
#include "gamepad/hid_descriptor.hpp"
#include "config/constants.hpp"
#include "utils/logging.hpp"
#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/IOKitLib.h>
#include <IOKit/hid/IOHIDKeys.h>
#include <mach/mach_time.h>
#include <iomanip>
#include <sstream>
#include <vector>

namespace {

bool check_iokit_access() {
    mach_port_t master_port = MACH_PORT_NULL;
    kern_return_t kr = IOMasterPort(MACH_PORT_NULL, &master_port);
    if (kr != KERN_SUCCESS) {
        return false;
    }
    mach_port_deallocate(mach_task_self(), master_port);
    return true;
}

void set_number(CFMutableDictionaryRef dict, CFStringRef key, int32_t value) {
    CFNumberRef number = CFNumberCreate(kCFAllocatorDefault, kCFNumberSInt32Type, &value);
    CFDictionarySetValue(dict, key, number);
    CFRelease(number);
}

}

const char* to_string(MacHidAdapter::Method method) {
    switch (method) {
        case MacHidAdapter::Method::Simulation: return "simulation";
        case MacHidAdapter::Method::IOKitUserspace: return "iokit";
        case MacHidAdapter::Method::DriverKit: return "driverkit";
    }
    return "unknown";
}

MacHidAdapter::MacHidAdapter(Method method)
    : method_(method)
    , next_handle_(1)
    , submit_counter_(0) {

    switch (method_) {
        case Method::Simulation:
            Logger::info("Virtual gamepad backend: macOS simulation (no HID device is created)");
            break;
        case Method::IOKitUserspace:
            Logger::warn("IOKit user-space HID devices require the HID virtual device entitlement or SIP disabled");
            if (!check_iokit_access()) {
                throw GamepadError::insufficient_permissions("IOKit HID master port access");
            }
            Logger::info("Virtual gamepad backend: IOKit user-space HID");
            break;
        case Method::DriverKit:
            throw GamepadError::unsupported_platform("macOS", "DriverKit virtual controllers");
    }
}

MacHidAdapter::~MacHidAdapter() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : devices_) {
        if (entry.second) {
            CFRelease(entry.second);
        }
    }
    devices_.clear();
}

const char* MacHidAdapter::name() const {
    return method_ == Method::IOKitUserspace ? "mac-iokit" : "mac-sim";
}

IOHIDUserDeviceRef MacHidAdapter::create_device() {
    const std::vector<uint8_t>& descriptor = ds4_hid_descriptor();

    CFMutableDictionaryRef props = CFDictionaryCreateMutable(
        kCFAllocatorDefault, 0, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks);

    CFDataRef descriptor_data = CFDataCreate(kCFAllocatorDefault, descriptor.data(), (CFIndex)descriptor.size());
    CFDictionarySetValue(props, CFSTR(kIOHIDReportDescriptorKey), descriptor_data);
    CFRelease(descriptor_data);

    set_number(props, CFSTR(kIOHIDVendorIDKey), Constants::DS4_VENDOR_ID);
    set_number(props, CFSTR(kIOHIDProductIDKey), Constants::DS4_PRODUCT_ID);
    CFDictionarySetValue(props, CFSTR(kIOHIDProductKey), CFSTR("Wireless Controller (virtual)"));

    IOHIDUserDeviceRef device = IOHIDUserDeviceCreateWithProperties(kCFAllocatorDefault, props, 0);
    CFRelease(props);

    if (!device) {
        throw GamepadError::insufficient_permissions("IOHIDUserDevice creation");
    }
    return device;
}

TargetHandle MacHidAdapter::attach() {
    IOHIDUserDeviceRef device = nullptr;
    if (method_ == Method::IOKitUserspace) {
        device = create_device();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    TargetHandle handle = next_handle_++;
    devices_[handle] = device;
    Logger::debug("HID target " + std::to_string(handle) + " attached (" + to_string(method_) + ")");
    return handle;
}

void MacHidAdapter::submit(TargetHandle handle, const DS4Report& report) {
    IOHIDUserDeviceRef device;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(handle);
        if (it == devices_.end()) {
            throw GamepadError::controller_disconnected();
        }
        device = it->second;
    }

    auto bytes = ds4_hid_input_report(report);

    if (method_ == Method::Simulation) {
        if ((submit_counter_++ % 100) == 0 && Logger::is_verbose()) {
            std::ostringstream ss;
            ss << "Sim report: buttons=0x" << std::hex << std::setw(4) << std::setfill('0')
               << (int(bytes[6]) << 8 | bytes[5]) << std::dec
               << " L=(" << int(bytes[1]) << "," << int(bytes[2]) << ")"
               << " R=(" << int(bytes[3]) << "," << int(bytes[4]) << ")"
               << " triggers=(" << int(bytes[8]) << "," << int(bytes[9]) << ")";
            Logger::debug(ss.str());
        }
        return;
    }

    IOReturn ret = IOHIDUserDeviceHandleReportWithTimeStamp(device, mach_absolute_time(), bytes.data(),
                                                            (CFIndex)bytes.size());
    if (ret != kIOReturnSuccess) {
        throw GamepadError::driver_rpc_failure("IOHIDUserDeviceHandleReportWithTimeStamp", static_cast<uint32_t>(ret));
    }
}

void MacHidAdapter::detach(TargetHandle handle) {
    IOHIDUserDeviceRef device = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(handle);
        if (it == devices_.end()) return;
        device = it->second;
        devices_.erase(it);
    }
    if (device) {
        CFRelease(device);
    }
    Logger::debug("HID target " + std::to_string(handle) + " detached");
}
