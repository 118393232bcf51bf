#include "drone_config.hpp"
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace {

std::string parse_string(const char* name, const std::string& fallback) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || std::string_view{raw}.empty()) {
        return fallback;
    }
    return raw;
}

long parse_positive(const char* name, long fallback, long max_value) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        long value = std::stol(raw, &consumed);
        if (consumed != std::string_view{raw}.size() || value <= 0 || value > max_value) {
            std::cerr << "Ignoring " << name << "=" << raw << ", using " << fallback << std::endl;
            return fallback;
        }
        return value;
    } catch (const std::exception&) {
        std::cerr << "Failed to parse " << name << "=" << raw << ", using " << fallback << std::endl;
        return fallback;
    }
}

uint16_t parse_port(const char* name, uint16_t fallback) {
    return static_cast<uint16_t>(parse_positive(name, fallback, std::numeric_limits<uint16_t>::max()));
}

int parse_int(const char* name, int fallback) {
    return static_cast<int>(parse_positive(name, fallback, std::numeric_limits<int>::max()));
}

std::chrono::milliseconds parse_millis(const char* name, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(parse_positive(name, static_cast<long>(fallback.count()),
                                                    std::numeric_limits<long>::max()));
}

} // namespace

DroneControllerConfig load_config_from_env() {
    DroneControllerConfig config;
    config.drone_ip = parse_string("TELLO_IP", config.drone_ip);
    config.drone_port = parse_port("TELLO_PORT", config.drone_port);
    config.local_port = parse_port("TELLO_LOCAL_PORT", config.local_port);
    config.video_port = parse_port("TELLO_VIDEO_PORT", config.video_port);
    config.mode_switch_timeout = parse_millis("TELLO_MODE_SWITCH_TIMEOUT_MS", config.mode_switch_timeout);
    config.battery_timeout = parse_millis("TELLO_BATTERY_TIMEOUT_MS", config.battery_timeout);
    config.takeoff_timeout = parse_millis("TELLO_TAKEOFF_TIMEOUT_MS", config.takeoff_timeout);
    config.land_timeout = parse_millis("TELLO_LAND_TIMEOUT_MS", config.land_timeout);
    config.movement_timeout = parse_millis("TELLO_MOVEMENT_TIMEOUT_MS", config.movement_timeout);
    config.default_timeout = parse_millis("TELLO_DEFAULT_TIMEOUT_MS", config.default_timeout);
    config.connect_attempts = parse_int("TELLO_CONNECT_ATTEMPTS", config.connect_attempts);
    config.min_battery_level = parse_int("TELLO_MIN_BATTERY", config.min_battery_level);
    validate_config(config);

    std::cout << "Drone endpoint " << config.drone_ip << ":" << config.drone_port
              << ", local port " << config.local_port << std::endl;
    return config;
}

BridgeConfig load_bridge_config_from_env() {
    BridgeConfig config;
    config.amqp_host = parse_string("TELLO_AMQP_HOST", config.amqp_host);
    config.amqp_port = parse_port("TELLO_AMQP_PORT", config.amqp_port);
    config.amqp_user = parse_string("TELLO_AMQP_USER", config.amqp_user);
    config.amqp_password = parse_string("TELLO_AMQP_PASSWORD", config.amqp_password);
    return config;
}

void validate_config(const DroneControllerConfig& config) {
    if (config.drone_ip.empty()) {
        throw std::runtime_error("Drone IP address must not be empty");
    }
    if (config.min_distance > config.max_distance) {
        throw std::runtime_error("Distance range is empty: " + std::to_string(config.min_distance) + " > " +
                                 std::to_string(config.max_distance));
    }
    if (config.min_angle > config.max_angle) {
        throw std::runtime_error("Angle range is empty: " + std::to_string(config.min_angle) + " > " +
                                 std::to_string(config.max_angle));
    }
    if (config.connect_attempts < 1) {
        throw std::runtime_error("At least one connect attempt is required");
    }
    if (config.min_battery_level < 0 || config.min_battery_level > 100) {
        throw std::runtime_error("Minimum battery level must be within 0-100");
    }
}
