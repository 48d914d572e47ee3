#include "telemetry/telemetry_types.hpp"
#include "config/constants.hpp"
#include <cmath>

float Vector3::magnitude() const {
    return std::sqrt(x * x + y * y + z * z);
}

GameStateType game_state_from_byte(uint8_t value) {
    if (value <= static_cast<uint8_t>(GameStateType::Loading)) {
        return static_cast<GameStateType>(value);
    }
    return GameStateType::Unknown;
}

WeatherCondition weather_from_byte(uint8_t value) {
    if (value <= static_cast<uint8_t>(WeatherCondition::Snow)) {
        return static_cast<WeatherCondition>(value);
    }
    return WeatherCondition::Unknown;
}

const char* to_string(GameStateType state) {
    switch (state) {
        case GameStateType::InMenu: return "InMenu";
        case GameStateType::InRace: return "InRace";
        case GameStateType::Paused: return "Paused";
        case GameStateType::Replay: return "Replay";
        case GameStateType::Garage: return "Garage";
        case GameStateType::Loading: return "Loading";
        case GameStateType::Unknown: return "Unknown";
    }
    return "Unknown";
}

const char* to_string(WeatherCondition weather) {
    switch (weather) {
        case WeatherCondition::Clear: return "Clear";
        case WeatherCondition::Cloudy: return "Cloudy";
        case WeatherCondition::LightRain: return "LightRain";
        case WeatherCondition::HeavyRain: return "HeavyRain";
        case WeatherCondition::Fog: return "Fog";
        case WeatherCondition::Snow: return "Snow";
        case WeatherCondition::Unknown: return "Unknown";
    }
    return "Unknown";
}

float TelemetryFrame::speed_kmh() const {
    return car.position.velocity.magnitude() * Constants::MPS_TO_KMH;
}

std::string TelemetryFrame::gear_display() const {
    int gear = car.engine.gear;
    if (gear == 0) return "R";
    if (gear > 0) return std::to_string(gear);
    return "N";
}

std::optional<std::chrono::milliseconds> TelemetryFrame::best_lap_time() const {
    if (!game_state.race || !game_state.race->best_lap_ms) return {};
    return std::chrono::milliseconds(*game_state.race->best_lap_ms);
}

std::optional<std::chrono::milliseconds> TelemetryFrame::last_lap_time() const {
    if (!game_state.race || !game_state.race->last_lap_ms) return {};
    return std::chrono::milliseconds(*game_state.race->last_lap_ms);
}
