#include "drone_controller.hpp"
#include "udp_transport.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

constexpr std::string_view kModeSwitchCommand = "command";

constexpr std::array<std::string_view, 6> kMoveDirections = {"up", "down", "left", "right", "forward", "back"};
constexpr std::array<std::string_view, 2> kRotateDirections = {"cw", "ccw"};

const std::vector<std::string> kAutoLandRecommendations = {
    "Check the battery level (30% or more recommended)",
    "Make sure the drone is not too far away",
    "Check the surroundings for obstacles",
    "Wait a moment before taking off again"
};

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

bool contains_ci(std::string_view text, std::string_view needle) {
    return to_lower(text).find(needle) != std::string::npos;
}

bool is_timeout(const CommandResponse& response) {
    return response.kind == ResponseKind::Timeout ||
           (response.kind == ResponseKind::Ok && to_lower(response.text) == "timeout");
}

bool is_success(const CommandResponse& response) {
    return response.kind == ResponseKind::Ok && contains_ci(response.text, "ok");
}

std::optional<int> parse_battery(const std::string& text) {
    if (text.empty() || text.size() > 3 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    int value = std::stoi(text);
    if (value > 100) {
        return std::nullopt;
    }
    return value;
}

template <std::size_t N>
bool is_one_of(std::string_view value, const std::array<std::string_view, N>& options) {
    return std::find(options.begin(), options.end(), value) != options.end();
}

Transport& require_transport(const std::unique_ptr<Transport>& transport) {
    if (!transport) {
        throw std::invalid_argument("DroneController requires a transport");
    }
    return *transport;
}

} // namespace

DroneController::DroneController(DroneControllerConfig config)
    : DroneController(config, std::make_unique<UdpTransport>(config.send_timeout)) {}

DroneController::DroneController(DroneControllerConfig config, std::unique_ptr<Transport> transport)
    : config_(std::move(config)), transport_(std::move(transport)),
      channel_(require_transport(transport_), Endpoint{config_.drone_ip, config_.drone_port}) {
    validate_config(config_);
}

DroneController::~DroneController() {
    transport_->close();
}

OperationResult DroneController::connect() {
    auto session = channel_.acquire();
    if (is_connected()) {
        auto result = OperationResult::ok("Already connected to Tello");
        result.battery = last_battery();
        result.flight_status = state_.status();
        return result;
    }

    std::cout << "Connecting to Tello at " << config_.drone_ip << ":" << config_.drone_port << "..." << std::endl;
    transport_->close();
    if (auto error = transport_->open(config_.local_port)) {
        std::cerr << error->message << std::endl;
        log_.append("connect", {{"status", "error"}, {"error", error->message}});
        return OperationResult::failure(OperationError::Transport, "Connection error: " + error->message);
    }
    std::this_thread::sleep_for(config_.receiver_settle);

    CommandResponse last_response;
    for (int attempt = 1; attempt <= config_.connect_attempts; ++attempt) {
        std::cout << "Connection attempt " << attempt << "/" << config_.connect_attempts << std::endl;
        last_response = session.execute(kModeSwitchCommand, config_.mode_switch_timeout);

        if (is_success(last_response)) {
            connected_ = true;
            auto battery = read_battery(session);
            if (battery.error == OperationError::Transport) {
                log_.append("connect", {{"status", "error"}, {"error", battery.message}});
                return OperationResult::failure(OperationError::Transport, "Connection error: " + battery.message);
            }
            if (!battery.success) {
                std::cerr << "Could not read battery level after connecting: " << battery.message << std::endl;
                last_battery_ = 0;
            }
            std::cout << "Connected to Tello, battery " << last_battery() << "%" << std::endl;
            log_.append("connect", {{"status", "success"}, {"battery", std::to_string(last_battery())}});

            auto result = OperationResult::ok("Connected to Tello");
            result.battery = last_battery();
            result.flight_status = state_.status();
            return result;
        }
        if (last_response.kind == ResponseKind::TransportError) {
            teardown(last_response.text);
            log_.append("connect", {{"status", "error"}, {"error", last_response.text}});
            return OperationResult::failure(OperationError::Transport, "Connection error: " + last_response.text);
        }
        if (is_timeout(last_response)) {
            std::cout << "Connection attempt " << attempt << " timed out" << std::endl;
        } else {
            std::cout << "Unexpected response during connection: " << last_response.text << std::endl;
        }
        if (attempt < config_.connect_attempts) {
            std::this_thread::sleep_for(config_.connect_retry_pause);
        }
    }

    transport_->close();
    log_.append("connect", {{"status", "failed"}, {"reason", is_timeout(last_response) ? "timeout" : "rejected"}});
    if (is_timeout(last_response)) {
        auto result = OperationResult::failure(OperationError::ProtocolTimeout, "Failed to connect to Tello");
        result.raw_response = "timeout";
        return result;
    }
    auto result = OperationResult::failure(OperationError::DeviceRejected, "Failed to connect to Tello: " + last_response.text);
    result.raw_response = last_response.text;
    return result;
}

OperationResult DroneController::disconnect() {
    auto session = channel_.acquire();
    if (video_streaming_ && is_connected()) {
        auto response = session.execute("streamoff", config_.default_timeout);
        if (!is_success(response)) {
            std::cerr << "streamoff before disconnect was not acknowledged" << std::endl;
        }
    }
    transport_->close();
    connected_ = false;
    video_streaming_ = false;
    state_.on_disconnect();
    std::cout << "Disconnected from Tello" << std::endl;
    log_.append("disconnect", {{"status", "success"}});

    auto result = OperationResult::ok("Disconnected from Tello");
    result.flight_status = state_.status();
    result.connected = false;
    return result;
}

OperationResult DroneController::get_status() const {
    auto result = OperationResult::ok("Status retrieved");
    result.connected = is_connected();
    result.flight_status = state_.status();
    result.battery = last_battery();
    result.video_streaming = video_streaming_.load();
    return result;
}

OperationResult DroneController::get_battery() {
    auto session = channel_.acquire();
    if (auto reason = check_connected()) {
        return OperationResult::failure(OperationError::Validation, *reason);
    }
    return read_battery(session);
}

OperationResult DroneController::takeoff() {
    auto session = channel_.acquire();
    if (auto reason = check_connected()) {
        return OperationResult::failure(OperationError::Validation, *reason);
    }
    if (auto reason = state_.check_takeoff()) {
        auto result = OperationResult::failure(OperationError::Validation, *reason);
        result.flight_status = state_.status();
        return result;
    }

    auto battery = read_battery(session);
    if (!battery.success) {
        auto result = OperationResult::failure(battery.error, "Unable to verify battery level before takeoff: " + battery.message);
        result.raw_response = battery.raw_response;
        log_.append("takeoff", {{"status", "failed"}, {"reason", "battery_unknown"}});
        return result;
    }
    if (*battery.battery < config_.min_battery_level) {
        std::cerr << "Battery level too low for flight: " << *battery.battery << "%" << std::endl;
        auto result = OperationResult::failure(
            OperationError::Validation,
            "Insufficient battery for takeoff: " + std::to_string(*battery.battery) + "% (minimum " +
                std::to_string(config_.min_battery_level) + "%)");
        result.battery = battery.battery;
        result.flight_status = state_.status();
        log_.append("takeoff", {{"status", "refused"}, {"battery", std::to_string(*battery.battery)}});
        return result;
    }

    auto resolution = execute(session, "takeoff", config_.takeoff_timeout, RetryPolicy::None);
    return resolve(session, "takeoff", resolution, {}, "Takeoff successful",
                   [this] { state_.on_takeoff_confirmed(); });
}

OperationResult DroneController::land() {
    auto session = channel_.acquire();
    if (auto reason = check_connected()) {
        return OperationResult::failure(OperationError::Validation, *reason);
    }
    if (auto reason = state_.check_airborne()) {
        auto result = OperationResult::failure(OperationError::Validation, *reason);
        result.flight_status = state_.status();
        return result;
    }

    auto resolution = execute(session, "land", config_.land_timeout, RetryPolicy::None);
    return resolve(session, "land", resolution, {}, "Landing successful",
                   [this] { state_.on_land_confirmed(); });
}

OperationResult DroneController::emergency() {
    auto session = channel_.acquire();
    if (!transport_->is_open()) {
        return OperationResult::failure(OperationError::Validation, "Not connected to Tello");
    }
    std::cout << "Emergency stop!" << std::endl;
    auto resolution = execute(session, "emergency", config_.default_timeout, RetryPolicy::None);
    return resolve(session, "emergency", resolution, {}, "Emergency stop executed",
                   [this] { state_.on_emergency_confirmed(); });
}

OperationResult DroneController::reset_emergency() {
    auto session = channel_.acquire();
    if (!state_.reset_emergency()) {
        auto result = OperationResult::failure(OperationError::Validation, "No emergency stop to reset");
        result.flight_status = state_.status();
        return result;
    }
    log_.append("reset_emergency", {{"status", "success"}});
    auto result = OperationResult::ok("Emergency state cleared, drone assumed landed");
    result.flight_status = state_.status();
    return result;
}

OperationResult DroneController::move(std::string_view direction, int distance_cm) {
    auto session = channel_.acquire();
    if (auto reason = check_connected()) {
        return OperationResult::failure(OperationError::Validation, *reason);
    }
    if (auto reason = state_.check_airborne()) {
        auto result = OperationResult::failure(OperationError::Validation, *reason);
        result.flight_status = state_.status();
        return result;
    }
    if (!is_one_of(direction, kMoveDirections)) {
        return OperationResult::failure(OperationError::Validation, "Invalid direction: " + std::string(direction));
    }
    if (distance_cm < config_.min_distance || distance_cm > config_.max_distance) {
        return OperationResult::failure(
            OperationError::Validation,
            "Distance must be between " + std::to_string(config_.min_distance) + " and " +
                std::to_string(config_.max_distance) + " cm, got: " + std::to_string(distance_cm));
    }

    const std::string command = std::string(direction) + " " + std::to_string(distance_cm);
    auto resolution = execute(session, command, config_.movement_timeout, RetryPolicy::ReconnectOnTimeout);
    std::string message = "Moved " + std::string(direction) + " " + std::to_string(distance_cm) + " cm";
    if (resolution.reconnected.value_or(false)) {
        message += " after reconnect";
    }
    return resolve(session, "move", resolution,
                   {{"direction", std::string(direction)}, {"distance", std::to_string(distance_cm)}},
                   message, {});
}

OperationResult DroneController::rotate(std::string_view direction, int degrees) {
    auto session = channel_.acquire();
    if (auto reason = check_connected()) {
        return OperationResult::failure(OperationError::Validation, *reason);
    }
    if (auto reason = state_.check_airborne()) {
        auto result = OperationResult::failure(OperationError::Validation, *reason);
        result.flight_status = state_.status();
        return result;
    }
    if (!is_one_of(direction, kRotateDirections)) {
        return OperationResult::failure(OperationError::Validation, "Invalid rotation direction: " + std::string(direction));
    }
    if (degrees < config_.min_angle || degrees > config_.max_angle) {
        return OperationResult::failure(
            OperationError::Validation,
            "Angle must be between " + std::to_string(config_.min_angle) + " and " +
                std::to_string(config_.max_angle) + " degrees, got: " + std::to_string(degrees));
    }

    const std::string command = std::string(direction) + " " + std::to_string(degrees);
    auto resolution = execute(session, command, config_.movement_timeout, RetryPolicy::ReconnectOnTimeout);
    std::string message = "Rotated " + std::string(direction) + " " + std::to_string(degrees) + " degrees";
    if (resolution.reconnected.value_or(false)) {
        message += " after reconnect";
    }
    return resolve(session, "rotate", resolution,
                   {{"direction", std::string(direction)}, {"degrees", std::to_string(degrees)}},
                   message, {});
}

OperationResult DroneController::start_video_stream() {
    auto session = channel_.acquire();
    if (auto reason = check_connected()) {
        return OperationResult::failure(OperationError::Validation, *reason);
    }
    auto resolution = execute(session, "streamon", config_.default_timeout, RetryPolicy::None);
    auto result = resolve(session, "streamon", resolution, {},
                          "Video stream started on UDP port " + std::to_string(config_.video_port),
                          [this] { video_streaming_ = true; });
    result.video_streaming = video_streaming_.load();
    return result;
}

OperationResult DroneController::stop_video_stream() {
    auto session = channel_.acquire();
    if (auto reason = check_connected()) {
        return OperationResult::failure(OperationError::Validation, *reason);
    }
    auto resolution = execute(session, "streamoff", config_.default_timeout, RetryPolicy::None);
    auto result = resolve(session, "streamoff", resolution, {}, "Video stream stopped",
                          [this] { video_streaming_ = false; });
    result.video_streaming = video_streaming_.load();
    return result;
}

bool DroneController::is_connected() const {
    return connected_ && transport_->is_open();
}

DroneController::Resolution DroneController::execute(CommandChannel::Session& session, const std::string& command,
                                                     std::chrono::milliseconds timeout, RetryPolicy policy) {
    Resolution resolution{session.execute(command, timeout), std::nullopt};
    if (resolution.response.kind == ResponseKind::TransportError) {
        teardown(resolution.response.text);
        return resolution;
    }
    if (policy != RetryPolicy::ReconnectOnTimeout || command == kModeSwitchCommand ||
        !is_timeout(resolution.response)) {
        return resolution;
    }

    std::cout << "Command " << command << " timed out, attempting automatic reconnect..." << std::endl;
    log_.append("reconnect", {{"trigger", command}});
    if (!reconnect(session)) {
        resolution.reconnected = false;
        return resolution;
    }
    std::cout << "Reconnected, resending command: " << command << std::endl;
    resolution.response = session.execute(command, timeout);
    resolution.reconnected = true;
    if (resolution.response.kind == ResponseKind::TransportError) {
        teardown(resolution.response.text);
    }
    return resolution;
}

bool DroneController::reconnect(CommandChannel::Session& session) {
    connected_ = false;
    transport_->close();
    std::this_thread::sleep_for(config_.reconnect_settle);

    if (auto error = transport_->open(config_.local_port)) {
        std::cerr << "Socket reinitialization failed: " << error->message << std::endl;
        return false;
    }
    std::this_thread::sleep_for(config_.receiver_settle);

    // Single handshake attempt; a nested timeout must not reconnect again.
    auto response = session.execute(kModeSwitchCommand, config_.mode_switch_timeout);
    if (!is_success(response)) {
        std::cerr << "SDK reconnect failed: " << (is_timeout(response) ? "timeout" : response.text) << std::endl;
        transport_->close();
        return false;
    }
    connected_ = true;
    if (!read_battery(session).success) {
        last_battery_ = 0;
    }
    std::cout << "Automatic reconnect succeeded" << std::endl;
    return true;
}

OperationResult DroneController::read_battery(CommandChannel::Session& session) {
    auto response = session.execute("battery?", config_.battery_timeout);
    if (response.kind == ResponseKind::TransportError) {
        teardown(response.text);
        return OperationResult::failure(OperationError::Transport, "Battery query failed: " + response.text);
    }
    if (is_timeout(response)) {
        auto result = OperationResult::failure(OperationError::ProtocolTimeout, "Battery query timed out");
        result.raw_response = "timeout";
        return result;
    }
    if (auto level = parse_battery(response.text)) {
        last_battery_ = *level;
        auto result = OperationResult::ok("Battery level " + std::to_string(*level) + "%");
        result.battery = *level;
        return result;
    }
    std::cerr << "Invalid battery response: " << response.text << std::endl;
    auto result = OperationResult::failure(OperationError::DeviceRejected, "Failed to read battery level");
    result.raw_response = response.text;
    return result;
}

OperationResult DroneController::resolve(CommandChannel::Session& session, const std::string& operation,
                                         const Resolution& resolution, std::map<std::string, std::string> log_details,
                                         const std::string& success_message, const std::function<void()>& on_success) {
    const CommandResponse& response = resolution.response;
    OperationResult result;

    if (response.kind == ResponseKind::TransportError) {
        result = OperationResult::failure(OperationError::Transport, operation + " failed: " + response.text);
        log_details["status"] = "transport_error";
    } else if (is_success(response)) {
        if (on_success) {
            on_success();
        }
        result = OperationResult::ok(success_message);
        log_details["status"] = resolution.reconnected.value_or(false) ? "success_after_reconnect" : "success";
    } else if (is_timeout(response)) {
        std::string message = operation + " timed out";
        if (resolution.reconnected.has_value()) {
            message = *resolution.reconnected
                          ? operation + " failed after reconnect: timeout"
                          : operation + " timed out and automatic reconnect failed; check the drone";
        }
        result = OperationResult::failure(OperationError::ProtocolTimeout, message);
        result.raw_response = "timeout";
        log_details["status"] = "timeout";
    } else if (contains_ci(response.text, "auto land")) {
        state_.on_auto_land_detected();
        auto battery = read_battery(session);

        result = OperationResult::failure(OperationError::AutonomousLanding,
                                          "Drone landed automatically: " + response.text);
        result.raw_response = response.text;
        result.battery = battery.battery;
        OperationDetails details;
        details.reason = "auto_land";
        details.battery = battery.battery.value_or(0);
        details.flight_status = state_.status();
        details.recommendations = kAutoLandRecommendations;
        result.details = std::move(details);
        log_details["status"] = "auto_land";
    } else if (contains_ci(response.text, "motor stop")) {
        result = OperationResult::failure(
            OperationError::DeviceRejected,
            operation + " failed: motors are stopped; the drone may have landed or detected an obstacle");
        result.raw_response = response.text;
        log_details["status"] = "motor_stop";
    } else {
        result = OperationResult::failure(OperationError::DeviceRejected, operation + " failed: " + response.text);
        result.raw_response = response.text;
        log_details["status"] = "failed";
    }

    if (response.kind == ResponseKind::Ok) {
        log_details["response"] = response.text;
    }
    if (resolution.reconnected.has_value()) {
        log_details["reconnected"] = *resolution.reconnected ? "true" : "false";
    }
    log_.append(operation, std::move(log_details));

    result.reconnected = resolution.reconnected;
    result.flight_status = state_.status();
    return result;
}

std::optional<std::string> DroneController::check_connected() const {
    if (!is_connected()) {
        return "Not connected to Tello";
    }
    return std::nullopt;
}

void DroneController::teardown(const std::string& reason) {
    std::cerr << "Transport failure, closing connection: " << reason << std::endl;
    connected_ = false;
    transport_->close();
}
