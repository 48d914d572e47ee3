#include "telemetry/config_validation.hpp"
#include "telemetry/telemetry_error.hpp"

void validate_config(const TelemetryConfig& config) {
    if (config.port == 0) {
        throw TelemetryError::config_error("port", "0", "port must be in 1-65535");
    }
    if (config.timeout_s == 0) {
        throw TelemetryError::config_error("timeout", "0", "timeout must be at least one second");
    }
    if (config.heartbeat_interval_ms == 0) {
        throw TelemetryError::config_error("heartbeat_interval", "0", "heartbeat interval must be positive");
    }
    if (config.monitor_interval_ms == 0) {
        throw TelemetryError::config_error("monitor_interval", "0", "monitor interval must be positive");
    }
    if (config.channel_capacity == 0) {
        throw TelemetryError::config_error("channel_capacity", "0", "channel needs room for at least one frame");
    }
    if (config.log_file_path && config.log_file_path->empty()) {
        throw TelemetryError::config_error("log_file_path", "\"\"", "path must not be empty when set");
    }
}
