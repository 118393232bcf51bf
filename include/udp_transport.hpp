#pragma once

#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

struct UdpLoopState;

// libuv-backed UDP transport. Each open() creates a private uv_loop_t driven by
// a background thread; the loop owns the socket, classifies every inbound
// datagram and performs sends marshalled from caller threads via uv_async_t.
class UdpTransport : public Transport {
public:
    explicit UdpTransport(std::chrono::milliseconds send_timeout = std::chrono::milliseconds(1000));
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    TransportStatus open(uint16_t local_port) override;
    TransportStatus send(std::string_view payload, const Endpoint& remote) override;
    void close() override;
    bool is_open() const override;
    void set_receiver(Receiver receiver) override;
    uint16_t local_port() const override { return bound_port_.load(); }

    // Receiver storage shared with the loop thread, which may outlive a close().
    struct ReceiverHolder {
        std::mutex mutex;
        Receiver receiver;
    };

private:
    std::shared_ptr<UdpLoopState> current_state() const;
    void close_locked();

    std::chrono::milliseconds send_timeout_;
    std::shared_ptr<ReceiverHolder> receiver_;
    std::mutex lifecycle_mutex_;
    mutable std::mutex state_mutex_;
    std::shared_ptr<UdpLoopState> state_;
    std::thread loop_thread_;
    std::future<void> loop_done_;
    std::atomic<uint16_t> bound_port_{0};
};
