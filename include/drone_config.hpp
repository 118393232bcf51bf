#pragma once

#include <chrono>
#include <cstdint>
#include <string>

// Configuration struct for all controller constants
struct DroneControllerConfig {
    // Network endpoints
    std::string drone_ip = "192.168.10.1";
    uint16_t drone_port = 8889; // Command port on the drone
    uint16_t local_port = 9000; // Local bind port for commands and replies
    uint16_t video_port = 11111; // Where the drone pushes frames after streamon

    // Timeouts
    std::chrono::milliseconds mode_switch_timeout{10000}; // Per "command" handshake attempt
    std::chrono::milliseconds battery_timeout{5000};
    std::chrono::milliseconds takeoff_timeout{15000};
    std::chrono::milliseconds land_timeout{15000};
    std::chrono::milliseconds movement_timeout{10000}; // Move and rotate
    std::chrono::milliseconds default_timeout{5000}; // Emergency, stream toggles
    std::chrono::milliseconds send_timeout{1000}; // Event loop confirmation of a send

    // Connection handling
    int connect_attempts = 3;
    std::chrono::milliseconds connect_retry_pause{1000};
    std::chrono::milliseconds receiver_settle{500}; // After the receive loop starts
    std::chrono::milliseconds reconnect_settle{1000}; // Between teardown and rebind

    // Drone parameters
    int min_battery_level = 20; // Minimum battery percentage for takeoff
    int min_distance = 20; // Minimum distance in centimeters
    int max_distance = 500; // Maximum distance in centimeters
    int min_angle = 1; // Minimum angle in degrees
    int max_angle = 360; // Maximum angle in degrees
};

// Broker settings for the command bus bridge
struct BridgeConfig {
    std::string amqp_host = "localhost";
    uint16_t amqp_port = 5672;
    std::string amqp_user = "guest";
    std::string amqp_password = "guest";
    std::string command_queue = "tello_commands";
    std::string response_queue = "tello_responses";
    int max_reconnect_attempts = 5;
    int reconnect_delay_max = 16; // Seconds
};

// Overrides defaults from TELLO_* environment variables. Unparsable or
// non-positive values keep the default and print a warning.
DroneControllerConfig load_config_from_env();
BridgeConfig load_bridge_config_from_env();

// Throws std::runtime_error on inconsistent ranges or empty endpoints.
void validate_config(const DroneControllerConfig& config);
