#include "gamepad/vigem_status.hpp"
#include "config/constants.hpp"

namespace {
const char* const kErrorNames[] = {
    "BusNotFound",                  // 0xE0000001
    "NoFreeSlot",
    "InvalidTarget",
    "RemovalFailed",
    "AlreadyConnected",
    "TargetUninitialized",
    "TargetNotPluggedIn",
    "BusVersionMismatch",
    "BusAccessFailed",
    "CallbackAlreadyRegistered",
    "CallbackNotFound",
    "UnknownUsbDevice",
    "IllegalArgument",
    "XusbUserIndexOutOfRange",
    "InvalidParameter",
    "NotSupported"                  // 0xE0000010
};

constexpr uint32_t kFirstError = 0xE0000001;
constexpr uint32_t kErrorCount = sizeof(kErrorNames) / sizeof(kErrorNames[0]);
}

const char* vigem_status_name(uint32_t code) {
    if (code == Constants::VIGEM_ERROR_NONE) {
        return "None";
    }
    if (code >= kFirstError && code - kFirstError < kErrorCount) {
        return kErrorNames[code - kFirstError];
    }
    return "Unknown";
}
