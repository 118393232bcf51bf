#include "command_request.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <map>
#include <sstream>
#include <vector>

namespace {

const std::map<std::string, RequestKind> kSimpleRequests = {
    {"connect", RequestKind::Connect},
    {"command", RequestKind::Connect},
    {"disconnect", RequestKind::Disconnect},
    {"status", RequestKind::Status},
    {"battery", RequestKind::Battery},
    {"battery?", RequestKind::Battery},
    {"takeoff", RequestKind::Takeoff},
    {"land", RequestKind::Land},
    {"emergency", RequestKind::Emergency},
    {"reset", RequestKind::Reset},
    {"streamon", RequestKind::StreamOn},
    {"streamoff", RequestKind::StreamOff},
};

const std::vector<std::string> kMoveVerbs = {"up", "down", "left", "right", "forward", "back"};
const std::vector<std::string> kRotateVerbs = {"cw", "ccw"};

std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::istringstream stream{std::string(text)};
    std::string word;
    while (stream >> word) {
        std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        words.push_back(word);
    }
    return words;
}

bool contains(const std::vector<std::string>& words, const std::string& word) {
    return std::find(words.begin(), words.end(), word) != words.end();
}

std::optional<int> parse_int(const std::string& text) {
    try {
        std::size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string iso_timestamp(std::chrono::system_clock::time_point time) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    char stamp[48];
    std::snprintf(stamp, sizeof(stamp), "%s.%03dZ", buffer, static_cast<int>(millis));
    return stamp;
}

} // namespace

std::optional<CommandRequest> parse_request(std::string_view text, std::string& error) {
    auto words = split_words(text);
    if (words.empty()) {
        error = "Empty request";
        return std::nullopt;
    }

    const std::string& verb = words.front();
    if (auto simple = kSimpleRequests.find(verb); simple != kSimpleRequests.end()) {
        if (words.size() != 1) {
            error = "Request '" + verb + "' takes no arguments";
            return std::nullopt;
        }
        CommandRequest request;
        request.kind = simple->second;
        return request;
    }

    const bool is_move = contains(kMoveVerbs, verb);
    if (!is_move && !contains(kRotateVerbs, verb)) {
        error = "Unknown request: " + verb;
        return std::nullopt;
    }
    if (words.size() != 2) {
        error = is_move ? "Usage: <direction> <distance cm>" : "Usage: <cw|ccw> <degrees>";
        return std::nullopt;
    }
    auto value = parse_int(words[1]);
    if (!value) {
        error = (is_move ? "Distance" : "Angle") + std::string(" must be an integer, got: ") + words[1];
        return std::nullopt;
    }

    CommandRequest request;
    request.kind = is_move ? RequestKind::Move : RequestKind::Rotate;
    request.direction = verb;
    request.value = *value;
    return request;
}

OperationResult dispatch(DroneController& controller, const CommandRequest& request) {
    switch (request.kind) {
        case RequestKind::Connect: return controller.connect();
        case RequestKind::Disconnect: return controller.disconnect();
        case RequestKind::Status: return controller.get_status();
        case RequestKind::Battery: return controller.get_battery();
        case RequestKind::Takeoff: return controller.takeoff();
        case RequestKind::Land: return controller.land();
        case RequestKind::Emergency: return controller.emergency();
        case RequestKind::Reset: return controller.reset_emergency();
        case RequestKind::StreamOn: return controller.start_video_stream();
        case RequestKind::StreamOff: return controller.stop_video_stream();
        case RequestKind::Move: return controller.move(request.direction, request.value);
        case RequestKind::Rotate: return controller.rotate(request.direction, request.value);
    }
    return OperationResult::failure(OperationError::Validation, "Unsupported request");
}

void to_json(nlohmann::json& j, const OperationDetails& details) {
    j = nlohmann::json{
        {"reason", details.reason},
        {"battery", details.battery},
        {"flight_status", std::string(to_string(details.flight_status))},
        {"recommendations", details.recommendations}
    };
}

void to_json(nlohmann::json& j, const OperationResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"message", result.message},
        {"error", std::string(to_string(result.error))},
        {"timestamp", iso_timestamp(result.timestamp)}
    };
    if (result.flight_status) {
        j["flight_status"] = std::string(to_string(*result.flight_status));
    }
    if (result.battery) {
        j["battery"] = *result.battery;
    }
    if (result.connected) {
        j["connected"] = *result.connected;
    }
    if (result.video_streaming) {
        j["video_streaming"] = *result.video_streaming;
    }
    if (result.reconnected) {
        j["reconnected"] = *result.reconnected;
    }
    if (result.raw_response) {
        j["raw_response"] = *result.raw_response;
    }
    if (result.details) {
        j["details"] = *result.details;
    }
}

std::string format_result(const OperationResult& result) {
    return nlohmann::json(result).dump();
}
