#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <string_view>

enum class FlightStatus { Landed, Flying, Emergency };

std::string_view to_string(FlightStatus status);

// Tracks the airframe state from confirmed command outcomes. Guards return the
// reason an operation is refused, or nullopt when it may proceed.
class FlightStateMachine {
public:
    FlightStatus status() const { return status_.load(); }

    std::optional<std::string> check_takeoff() const;
    std::optional<std::string> check_airborne() const;

    void on_takeoff_confirmed();
    void on_land_confirmed();
    void on_emergency_confirmed();
    // The device landed itself, reported via response text.
    void on_auto_land_detected();
    void on_disconnect();

    // Administrative recovery after an emergency stop, once the airframe has
    // been checked out-of-band. Returns false when not in Emergency.
    bool reset_emergency();

private:
    std::atomic<FlightStatus> status_{FlightStatus::Landed};
};
