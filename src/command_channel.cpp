#include "command_channel.hpp"
#include <iostream>

void ResponseSlot::arm() {
    std::lock_guard<std::mutex> lock(mutex_);
    value_.reset();
    armed_ = true;
}

void ResponseSlot::disarm() {
    std::lock_guard<std::mutex> lock(mutex_);
    armed_ = false;
    value_.reset();
}

bool ResponseSlot::offer(std::string text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!armed_ || value_) {
            return false;
        }
        value_ = std::move(text);
    }
    ready_.notify_one();
    return true;
}

std::optional<std::string> ResponseSlot::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait_for(lock, timeout, [this] { return value_.has_value(); });
    std::optional<std::string> result = std::move(value_);
    value_.reset();
    armed_ = false;
    return result;
}

CommandChannel::Session::Session(CommandChannel& channel)
    : channel_(&channel), lock_(channel.command_mutex_) {}

CommandResponse CommandChannel::Session::execute(std::string_view command, std::chrono::milliseconds timeout) {
    return channel_->send_and_wait(command, timeout);
}

CommandChannel::CommandChannel(Transport& transport, Endpoint remote)
    : transport_(transport), remote_(std::move(remote)) {
    transport_.set_receiver([this](std::string text) {
        if (!slot_.offer(text)) {
            std::cout << "Discarding unsolicited response: " << text << std::endl;
        }
    });
}

CommandChannel::~CommandChannel() {
    transport_.set_receiver(nullptr);
}

CommandChannel::Session CommandChannel::acquire() {
    return Session(*this);
}

CommandResponse CommandChannel::execute(std::string_view command, std::chrono::milliseconds timeout) {
    auto session = acquire();
    return session.execute(command, timeout);
}

CommandResponse CommandChannel::send_and_wait(std::string_view command, std::chrono::milliseconds timeout) {
    std::cout << "Sending command: " << command << std::endl;
    // Arming clears any stale delivery before the new command goes out.
    slot_.arm();
    if (auto error = transport_.send(command, remote_)) {
        slot_.disarm();
        std::cerr << "Failed to send command " << command << ": " << error->message << std::endl;
        return {ResponseKind::TransportError, error->message};
    }

    if (auto reply = slot_.wait_for(timeout)) {
        std::cout << "Response to " << command << ": " << *reply << std::endl;
        return {ResponseKind::Ok, std::move(*reply)};
    }
    std::cerr << "Timeout waiting for response to command: " << command << std::endl;
    return {ResponseKind::Timeout, {}};
}
