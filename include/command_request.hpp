#pragma once

#include "drone_controller.hpp"
#include "operation_result.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

// Text requests accepted from the command bus and the interactive CLI.
// They follow the drone's own command syntax where one exists:
//   connect | command, disconnect, status, battery | battery?, takeoff, land,
//   emergency, reset, streamon, streamoff,
//   <up|down|left|right|forward|back> <cm>, <cw|ccw> <degrees>
enum class RequestKind {
    Connect,
    Disconnect,
    Status,
    Battery,
    Takeoff,
    Land,
    Emergency,
    Reset,
    StreamOn,
    StreamOff,
    Move,
    Rotate
};

struct CommandRequest {
    RequestKind kind = RequestKind::Status;
    std::string direction; // Move and Rotate only
    int value = 0;         // centimeters or degrees
};

// Returns nullopt and fills error when the text is not a request. Numeric
// ranges are not checked here; the controller owns them.
std::optional<CommandRequest> parse_request(std::string_view text, std::string& error);

OperationResult dispatch(DroneController& controller, const CommandRequest& request);

// JSON rendering of an outcome. Optional fields are omitted when unset; the
// timestamp is ISO 8601 UTC with milliseconds.
void to_json(nlohmann::json& j, const OperationDetails& details);
void to_json(nlohmann::json& j, const OperationResult& result);

// Compact single-line JSON, as published on the response queue.
std::string format_result(const OperationResult& result);
