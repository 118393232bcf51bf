#include "operation_result.hpp"

std::string_view to_string(OperationError error) {
    switch (error) {
        case OperationError::None: return "none";
        case OperationError::Validation: return "validation";
        case OperationError::Transport: return "transport";
        case OperationError::ProtocolTimeout: return "protocol_timeout";
        case OperationError::DeviceRejected: return "device_rejected";
        case OperationError::AutonomousLanding: return "autonomous_landing";
    }
    return "unknown";
}
