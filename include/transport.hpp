#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

struct Endpoint {
    std::string ip;
    uint16_t port = 0;
};

struct TransportError {
    int code = 0; // libuv error code, or -1 when not applicable
    std::string message;
};

// nullopt on success.
using TransportStatus = std::optional<TransportError>;

// Datagram link to the drone. Accepted (classified) text payloads are handed
// to the receiver from the transport's own background thread.
class Transport {
public:
    using Receiver = std::function<void(std::string)>;

    virtual ~Transport() = default;

    virtual TransportStatus open(uint16_t local_port) = 0;
    virtual TransportStatus send(std::string_view payload, const Endpoint& remote) = 0;
    // Idempotent.
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    // The receiver survives close()/open() cycles.
    virtual void set_receiver(Receiver receiver) = 0;
    virtual uint16_t local_port() const = 0;
};
