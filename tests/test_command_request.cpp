#include <memory>
#include <string>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "command_request.hpp"
#include "scripted_transport.hpp"

using tello_test::ScriptedTransport;

TEST_CASE("Simple requests parse case-insensitively") {
    std::string error;

    auto connect = parse_request("Connect", error);
    REQUIRE(connect.has_value());
    REQUIRE(connect->kind == RequestKind::Connect);

    auto command = parse_request("command", error);
    REQUIRE(command.has_value());
    REQUIRE(command->kind == RequestKind::Connect);

    auto battery = parse_request("  battery?  ", error);
    REQUIRE(battery.has_value());
    REQUIRE(battery->kind == RequestKind::Battery);

    REQUIRE(parse_request("reset", error)->kind == RequestKind::Reset);
    REQUIRE(parse_request("STREAMON", error)->kind == RequestKind::StreamOn);
}

TEST_CASE("Movement and rotation requests carry direction and value") {
    std::string error;

    auto move = parse_request("FORWARD 100", error);
    REQUIRE(move.has_value());
    REQUIRE(move->kind == RequestKind::Move);
    REQUIRE(move->direction == "forward");
    REQUIRE(move->value == 100);

    auto rotate = parse_request("ccw 45", error);
    REQUIRE(rotate.has_value());
    REQUIRE(rotate->kind == RequestKind::Rotate);
    REQUIRE(rotate->direction == "ccw");
    REQUIRE(rotate->value == 45);

    // Range is the controller's concern.
    auto far = parse_request("up 9000", error);
    REQUIRE(far.has_value());
    REQUIRE(far->value == 9000);
}

TEST_CASE("Malformed requests are rejected with a reason") {
    std::string error;

    REQUIRE_FALSE(parse_request("", error).has_value());
    REQUIRE(error == "Empty request");

    REQUIRE_FALSE(parse_request("flip l", error).has_value());
    REQUIRE(error == "Unknown request: flip");

    REQUIRE_FALSE(parse_request("takeoff now", error).has_value());
    REQUIRE(error == "Request 'takeoff' takes no arguments");

    REQUIRE_FALSE(parse_request("forward", error).has_value());
    REQUIRE(error.rfind("Usage:", 0) == 0);

    REQUIRE_FALSE(parse_request("forward ten", error).has_value());
    REQUIRE(error == "Distance must be an integer, got: ten");

    REQUIRE_FALSE(parse_request("cw 90.5", error).has_value());
    REQUIRE(error == "Angle must be an integer, got: 90.5");
}

TEST_CASE("format_result emits one JSON object with only the fields that are set") {
    auto plain = OperationResult::ok("Status retrieved");
    const auto text = format_result(plain);
    REQUIRE(text.find('\n') == std::string::npos);

    auto json = nlohmann::json::parse(text);
    REQUIRE(json["success"] == true);
    REQUIRE(json["message"] == "Status retrieved");
    REQUIRE(json["error"] == "none");
    REQUIRE_FALSE(json.contains("battery"));
    REQUIRE_FALSE(json.contains("details"));
}

TEST_CASE("format_result keeps control characters in device text escaped") {
    auto failed = OperationResult::failure(OperationError::DeviceRejected, "move failed: say \"no\"");
    failed.flight_status = FlightStatus::Flying;
    failed.battery = 42;
    failed.reconnected = false;
    failed.raw_response = "line1\r\nline2\x01";

    const auto text = format_result(failed);
    REQUIRE(text.find('\r') == std::string::npos);
    REQUIRE(text.find('\n') == std::string::npos);

    auto json = nlohmann::json::parse(text);
    REQUIRE(json["error"] == "device_rejected");
    REQUIRE(json["flight_status"] == "flying");
    REQUIRE(json["battery"] == 42);
    REQUIRE(json["reconnected"] == false);
    REQUIRE(json["message"] == "move failed: say \"no\"");
    REQUIRE(json["raw_response"] == "line1\r\nline2\x01");
}

TEST_CASE("Auto-land outcomes carry the full details and recommendations") {
    auto landed = OperationResult::failure(OperationError::AutonomousLanding, "Drone landed automatically: auto land");
    landed.flight_status = FlightStatus::Landed;
    landed.battery = 23;
    landed.details = OperationDetails{"auto_land", 23, FlightStatus::Landed,
                                      {"Check the battery level", "Check the distance", "Check for obstacles",
                                       "Wait before taking off again"}};

    auto json = nlohmann::json::parse(format_result(landed));
    REQUIRE(json["error"] == "autonomous_landing");
    REQUIRE(json["details"]["reason"] == "auto_land");
    REQUIRE(json["details"]["battery"] == 23);
    REQUIRE(json["details"]["flight_status"] == "landed");
    REQUIRE(json["details"]["recommendations"].size() == 4);
    REQUIRE(json["details"]["recommendations"][3] == "Wait before taking off again");

    const auto timestamp = json["timestamp"].get<std::string>();
    REQUIRE(timestamp.size() == 24);
    REQUIRE(timestamp[10] == 'T');
    REQUIRE(timestamp.back() == 'Z');
}

TEST_CASE("dispatch routes a parsed request to the controller") {
    auto transport = std::make_unique<ScriptedTransport>();
    auto* fake = transport.get();
    DroneController controller(tello_test::fast_config(), std::move(transport));

    fake->reply("command", "ok");
    fake->reply("battery?", "87");
    fake->reply("battery?", "86");

    std::string error;
    auto connected = dispatch(controller, *parse_request("connect", error));
    REQUIRE(connected.success);

    auto battery = dispatch(controller, *parse_request("battery", error));
    REQUIRE(battery.success);
    REQUIRE(battery.battery == 86);

    auto move = dispatch(controller, *parse_request("forward 100", error));
    REQUIRE_FALSE(move.success);
    REQUIRE(move.error == OperationError::Validation);

    auto status = nlohmann::json::parse(format_result(dispatch(controller, *parse_request("status", error))));
    REQUIRE(status["success"] == true);
    REQUIRE(status["flight_status"] == "landed");
    REQUIRE(status["battery"] == 86);
    REQUIRE(status["connected"] == true);
    REQUIRE(status["video_streaming"] == false);
}
