#pragma once
#include <cstddef>
#include <cstdint>

namespace Constants {
    // GT7 telemetry protocol
    constexpr uint16_t GT7_PORT = 33740;
    constexpr size_t GT7_PACKET_SIZE = 296;
    constexpr size_t GT7_RECV_BUFFER_SIZE = GT7_PACKET_SIZE * 2;
    constexpr uint32_t GT7_MAGIC = 0x47375053;   // "SP7G" on the wire
    constexpr uint16_t GT7_PACKET_VERSION = 1;
    constexpr uint8_t GT7_HEARTBEAT_BYTE = 'A';

    // Engine timing
    constexpr int SOCKET_READ_TIMEOUT_MS = 100;
    constexpr int RECEIVE_SWEEP_MS = 1;
    constexpr int MONITOR_INTERVAL_MS = 1000;
    constexpr size_t CHANNEL_CAPACITY = 1000;

    // Rate limit for hot-path warnings
    constexpr int WARN_EVERY_N = 100;

    // Unit conversion
    constexpr float MPS_TO_KMH = 3.6f;

    // Virtual gamepad
    constexpr size_t DS4_REPORT_SIZE = 64;
    constexpr size_t DS4_HID_INPUT_SIZE = 10;     // bytes covered by the HID descriptor
    constexpr uint8_t DS4_REPORT_ID = 0x01;
    constexpr uint8_t DS4_AXIS_CENTER = 128;
    constexpr uint16_t DS4_VENDOR_ID = 0x054C;
    constexpr uint16_t DS4_PRODUCT_ID = 0x05C4;

    // ViGEm bus
    constexpr const char* VIGEM_LIBRARY = "ViGEmClient.dll";
    constexpr const char* VIGEM_DRIVER_NAME = "ViGEm Bus Driver";
    constexpr const char* VIGEM_RELEASE_URL = "https://github.com/nefarius/ViGEmBus/releases";
    constexpr uint32_t VIGEM_ERROR_NONE = 0x20000000;
    constexpr uint32_t VIGEM_TARGET_DS4 = 2;
}
