#pragma once

#include "transport.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// Single-slot mailbox between the receive thread and the command issuer.
// Deliveries are accepted only while a waiter is armed and the slot is empty;
// everything else is dropped so a stale reply can never reach a later command.
class ResponseSlot {
public:
    void arm();
    void disarm();
    bool offer(std::string text);
    // Consumes the delivered text, or times out. Always leaves the slot disarmed.
    std::optional<std::string> wait_for(std::chrono::milliseconds timeout);

private:
    std::mutex mutex_;
    std::condition_variable ready_;
    bool armed_ = false;
    std::optional<std::string> value_;
};

enum class ResponseKind { Ok, Timeout, TransportError };

struct CommandResponse {
    ResponseKind kind = ResponseKind::Timeout;
    std::string text; // device reply for Ok, error description for TransportError

    bool ok() const { return kind == ResponseKind::Ok; }
};

// Serializes command issuance to the drone: at most one command is in flight,
// and its reply is the next classified datagram after the send.
class CommandChannel {
public:
    // Holds the command lock for its whole lifetime, so a multi-step operation
    // (pre-checks, retries, reconnect handshake) is never interleaved.
    class Session {
    public:
        CommandResponse execute(std::string_view command, std::chrono::milliseconds timeout);

    private:
        friend class CommandChannel;
        explicit Session(CommandChannel& channel);

        CommandChannel* channel_;
        std::unique_lock<std::mutex> lock_;
    };

    CommandChannel(Transport& transport, Endpoint remote);
    ~CommandChannel();

    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;

    Session acquire();
    // One-shot convenience: acquire, execute, release.
    CommandResponse execute(std::string_view command, std::chrono::milliseconds timeout);

    const Endpoint& remote() const { return remote_; }

private:
    CommandResponse send_and_wait(std::string_view command, std::chrono::milliseconds timeout);

    Transport& transport_;
    Endpoint remote_;
    std::mutex command_mutex_;
    ResponseSlot slot_;
};
