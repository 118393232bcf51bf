#include "flight_state.hpp"
#include <iostream>

std::string_view to_string(FlightStatus status) {
    switch (status) {
        case FlightStatus::Landed: return "landed";
        case FlightStatus::Flying: return "flying";
        case FlightStatus::Emergency: return "emergency";
    }
    return "unknown";
}

std::optional<std::string> FlightStateMachine::check_takeoff() const {
    switch (status()) {
        case FlightStatus::Flying:
            return "Already flying";
        case FlightStatus::Emergency:
            return "Emergency stop is active; reset is required before takeoff";
        case FlightStatus::Landed:
            break;
    }
    return std::nullopt;
}

std::optional<std::string> FlightStateMachine::check_airborne() const {
    if (status() != FlightStatus::Flying) {
        return "Not flying (status: " + std::string(to_string(status())) + ")";
    }
    return std::nullopt;
}

void FlightStateMachine::on_takeoff_confirmed() {
    FlightStatus expected = FlightStatus::Landed;
    if (!status_.compare_exchange_strong(expected, FlightStatus::Flying)) {
        std::cerr << "Ignoring takeoff confirmation while " << to_string(expected) << std::endl;
    }
}

void FlightStateMachine::on_land_confirmed() {
    FlightStatus expected = FlightStatus::Flying;
    if (!status_.compare_exchange_strong(expected, FlightStatus::Landed)) {
        std::cerr << "Ignoring land confirmation while " << to_string(expected) << std::endl;
    }
}

void FlightStateMachine::on_emergency_confirmed() {
    status_.store(FlightStatus::Emergency);
}

void FlightStateMachine::on_auto_land_detected() {
    FlightStatus expected = FlightStatus::Flying;
    if (status_.compare_exchange_strong(expected, FlightStatus::Landed)) {
        std::cout << "Auto land detected, flight status corrected to landed" << std::endl;
    }
}

void FlightStateMachine::on_disconnect() {
    status_.store(FlightStatus::Landed);
}

bool FlightStateMachine::reset_emergency() {
    FlightStatus expected = FlightStatus::Emergency;
    return status_.compare_exchange_strong(expected, FlightStatus::Landed);
}
