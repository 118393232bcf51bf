#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "drone_controller.hpp"
#include "scripted_transport.hpp"
#include "udp_peer.hpp"
#include "udp_transport.hpp"

using namespace std::chrono_literals;
using tello_test::UdpPeer;

namespace {

// Collects payloads handed to the transport receiver.
class Inbox {
public:
    Transport::Receiver receiver() {
        return [this](std::string text) {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(std::move(text));
            cv_.notify_all();
        };
    }

    bool wait_for_count(std::size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return messages_.size() >= count; });
    }

    std::vector<std::string> messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> messages_;
};

} // namespace

TEST_CASE("UdpTransport binds an ephemeral port and sends to the peer") {
    UdpPeer peer;
    UdpTransport transport;
    REQUIRE_FALSE(transport.open(0).has_value());
    REQUIRE(transport.is_open());
    REQUIRE(transport.local_port() != 0);

    REQUIRE_FALSE(transport.send("command", Endpoint{"127.0.0.1", peer.port()}).has_value());
    auto datagram = peer.receive(2000ms);
    REQUIRE(datagram.has_value());
    REQUIRE(datagram->payload == "command");
    REQUIRE(datagram->sender_port == transport.local_port());

    transport.close();
}

TEST_CASE("UdpTransport delivers text replies and drops binary datagrams") {
    UdpPeer peer;
    UdpTransport transport;
    Inbox inbox;
    transport.set_receiver(inbox.receiver());
    REQUIRE_FALSE(transport.open(0).has_value());

    std::string frame;
    for (int i = 0; i < 200; ++i) {
        frame.push_back(i < 80 ? 'a' : static_cast<char>(0x80 + (i % 100)));
    }
    peer.send_to(transport.local_port(), frame);
    peer.send_to(transport.local_port(), std::string(80, 'y'));
    peer.send_to(transport.local_port(), "ok\r\n");

    REQUIRE(inbox.wait_for_count(1, 2000ms));
    std::this_thread::sleep_for(50ms);
    REQUIRE(inbox.messages() == std::vector<std::string>{"ok"});
}

TEST_CASE("UdpTransport lifecycle errors") {
    UdpPeer peer;
    UdpTransport transport;

    SECTION("send before open") {
        auto error = transport.send("command", Endpoint{"127.0.0.1", peer.port()});
        REQUIRE(error.has_value());
    }
    SECTION("double open") {
        REQUIRE_FALSE(transport.open(0).has_value());
        REQUIRE(transport.open(0).has_value());
        REQUIRE(transport.is_open());
    }
    SECTION("close is idempotent and send after close fails") {
        REQUIRE_FALSE(transport.open(0).has_value());
        transport.close();
        transport.close();
        REQUIRE_FALSE(transport.is_open());
        REQUIRE(transport.send("land", Endpoint{"127.0.0.1", peer.port()}).has_value());
    }
    SECTION("invalid remote address") {
        REQUIRE_FALSE(transport.open(0).has_value());
        REQUIRE(transport.send("land", Endpoint{"not-an-ip", peer.port()}).has_value());
        REQUIRE(transport.is_open());
    }
}

TEST_CASE("UdpTransport can be reopened and keeps its receiver") {
    UdpPeer peer;
    UdpTransport transport;
    Inbox inbox;
    transport.set_receiver(inbox.receiver());

    REQUIRE_FALSE(transport.open(0).has_value());
    transport.close();
    REQUIRE_FALSE(transport.open(0).has_value());

    peer.send_to(transport.local_port(), "87");
    REQUIRE(inbox.wait_for_count(1, 2000ms));
    REQUIRE(inbox.messages().front() == "87");
}

TEST_CASE("DroneController drives a drone over real UDP") {
    UdpPeer drone;
    std::atomic<bool> running{true};
    std::vector<std::string> received;
    std::mutex received_mutex;

    // Answers like the drone: ok to control commands, a level to battery?, and a
    // video frame ahead of every reply.
    std::thread responder([&] {
        while (running) {
            auto datagram = drone.receive(50ms);
            if (!datagram) {
                continue;
            }
            {
                std::lock_guard<std::mutex> lock(received_mutex);
                received.push_back(datagram->payload);
            }
            drone.send_to(datagram->sender_port, std::string(200, '\xff'));
            drone.send_to(datagram->sender_port, datagram->payload == "battery?" ? "87" : "ok");
        }
    });

    auto config = tello_test::fast_config();
    config.drone_port = drone.port();
    config.local_port = 0;
    config.mode_switch_timeout = 2000ms;
    config.battery_timeout = 2000ms;
    config.takeoff_timeout = 2000ms;
    config.land_timeout = 2000ms;
    config.movement_timeout = 2000ms;

    {
        DroneController controller(config);
        auto connected = controller.connect();
        REQUIRE(connected.success);
        REQUIRE(connected.battery == 87);

        REQUIRE(controller.takeoff().success);
        REQUIRE(controller.move("forward", 100).success);
        REQUIRE(controller.rotate("cw", 90).success);
        REQUIRE(controller.land().success);
        REQUIRE(controller.flight_status() == FlightStatus::Landed);
        REQUIRE(controller.disconnect().success);
    }

    running = false;
    responder.join();

    std::lock_guard<std::mutex> lock(received_mutex);
    REQUIRE(received == std::vector<std::string>{"command", "battery?", "battery?", "takeoff", "forward 100",
                                                 "cw 90", "land"});
}
