#pragma once

#include "command_channel.hpp"
#include "drone_config.hpp"
#include "flight_state.hpp"
#include "operation_log.hpp"
#include "operation_result.hpp"
#include "transport.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Owns the single logical drone session of the process. Validates parameters,
// serializes every exchange through the command channel, recovers timeouts by
// reconnecting, and keeps the flight state in step with confirmed outcomes.
// Every operation returns an OperationResult; none of them throws.
class DroneController {
public:
    explicit DroneController(DroneControllerConfig config = DroneControllerConfig());
    DroneController(DroneControllerConfig config, std::unique_ptr<Transport> transport);
    ~DroneController();

    DroneController(const DroneController&) = delete;
    DroneController& operator=(const DroneController&) = delete;

    OperationResult connect();
    OperationResult disconnect();
    OperationResult get_status() const;
    OperationResult get_battery();
    OperationResult takeoff();
    OperationResult land();
    OperationResult emergency();
    OperationResult reset_emergency();
    OperationResult move(std::string_view direction, int distance_cm);
    OperationResult rotate(std::string_view direction, int degrees);
    OperationResult start_video_stream();
    OperationResult stop_video_stream();

    bool is_connected() const;
    FlightStatus flight_status() const { return state_.status(); }
    int last_battery() const { return last_battery_.load(); }
    std::vector<OperationLogEntry> operation_log() const { return log_.entries(); }
    const DroneControllerConfig& config() const { return config_; }

private:
    enum class RetryPolicy { None, ReconnectOnTimeout };

    struct Resolution {
        CommandResponse response;
        std::optional<bool> reconnected; // set only when a reconnect was attempted
    };

    Resolution execute(CommandChannel::Session& session, const std::string& command,
                       std::chrono::milliseconds timeout, RetryPolicy policy);
    bool reconnect(CommandChannel::Session& session);
    OperationResult read_battery(CommandChannel::Session& session);
    OperationResult resolve(CommandChannel::Session& session, const std::string& operation,
                            const Resolution& resolution, std::map<std::string, std::string> log_details,
                            const std::string& success_message, const std::function<void()>& on_success);
    std::optional<std::string> check_connected() const;
    void teardown(const std::string& reason);

    DroneControllerConfig config_;
    std::unique_ptr<Transport> transport_;
    CommandChannel channel_;
    FlightStateMachine state_;
    OperationLog log_;
    std::atomic<bool> connected_{false};
    std::atomic<int> last_battery_{0};
    std::atomic<bool> video_streaming_{false};
};
