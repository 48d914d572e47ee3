#pragma once
#include "config/constants.hpp"
#include <cstdint>

// Mnemonic for a ViGEm bus status code: "None" for success, "Unknown" for
// anything outside the documented range.
const char* vigem_status_name(uint32_t code);

inline bool vigem_success(uint32_t code) {
    return code == Constants::VIGEM_ERROR_NONE;
}
