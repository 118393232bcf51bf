#pragma once

#include "flight_state.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class OperationError {
    None,
    Validation,         // Bad parameter or state guard, nothing was sent
    Transport,          // Socket bind/send failure, connection torn down
    ProtocolTimeout,    // No classified reply, after any reconnect-and-retry
    DeviceRejected,     // Reply received but not "ok"
    AutonomousLanding   // Device reported "auto land"
};

std::string_view to_string(OperationError error);

struct OperationDetails {
    std::string reason;
    int battery = 0;
    FlightStatus flight_status = FlightStatus::Landed;
    std::vector<std::string> recommendations;
};

// Outcome of every controller operation. The controller never throws.
struct OperationResult {
    bool success = false;
    std::string message;
    OperationError error = OperationError::None;
    std::optional<FlightStatus> flight_status;
    std::optional<int> battery;
    std::optional<bool> connected;
    std::optional<bool> video_streaming;
    std::optional<bool> reconnected;
    std::optional<std::string> raw_response;
    std::optional<OperationDetails> details;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    static OperationResult ok(std::string message) {
        OperationResult result;
        result.success = true;
        result.message = std::move(message);
        return result;
    }

    static OperationResult failure(OperationError error, std::string message) {
        OperationResult result;
        result.error = error;
        result.message = std::move(message);
        return result;
    }
};
