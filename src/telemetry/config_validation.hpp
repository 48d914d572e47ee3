#pragma once
#include "config/config.hpp"

// Throws TelemetryError (ConfigError) on the first invalid field.
void validate_config(const TelemetryConfig& config);
