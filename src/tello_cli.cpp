#include "command_request.hpp"
#include "drone_config.hpp"
#include "drone_controller.hpp"
#include <iostream>
#include <string>

namespace {

void print_help() {
    std::cout << "\n=== Tello commands ===\n"
              << "takeoff | land | emergency | reset\n"
              << "up/down/left/right/forward/back <cm>   (20-500)\n"
              << "cw/ccw <degrees>                       (1-360)\n"
              << "battery | status | streamon | streamoff\n"
              << "quit\n"
              << "======================\n"
              << std::endl;
}

} // namespace

int main() {
    try {
        DroneController controller(load_config_from_env());
        if (auto result = controller.connect(); !result.success) {
            std::cerr << "Failed to connect to Tello: " << result.message << std::endl;
            return 1;
        }
        std::cout << "Battery: " << controller.last_battery() << "%" << std::endl;
        print_help();

        std::string line;
        while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
            if (line == "quit" || line == "exit") {
                break;
            }
            if (line == "help") {
                print_help();
                continue;
            }
            if (line.find_first_not_of(" \t") == std::string::npos) {
                continue;
            }

            std::string error;
            if (auto request = parse_request(line, error)) {
                std::cout << format_result(dispatch(controller, *request)) << std::endl;
            } else {
                std::cerr << error << std::endl;
            }
        }

        std::cout << controller.disconnect().message << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
