#pragma once

#include "drone_config.hpp"
#include "transport.hpp"

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tello_test {

// In-memory transport that records every send and answers from a per-command
// script. Unscripted commands get no reply, which the channel sees as a timeout.
class ScriptedTransport : public Transport {
public:
    enum class Action { Reply, Silence, Fail };

    struct Step {
        Action action = Action::Reply;
        std::string text;
        std::chrono::milliseconds delay{0};
    };

    ~ScriptedTransport() override {
        std::vector<std::thread> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending.swap(reply_threads_);
        }
        for (auto& thread : pending) {
            thread.join();
        }
    }

    void reply(const std::string& command, std::string text, std::chrono::milliseconds delay = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_[command].push_back({Action::Reply, std::move(text), delay});
    }

    void silence(const std::string& command) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_[command].push_back({Action::Silence, {}, {}});
    }

    void fail_send(const std::string& command) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_[command].push_back({Action::Fail, {}, {}});
    }

    void fail_next_open() { fail_next_open_ = true; }

    // Delivers text as if it had arrived unsolicited on the socket.
    void inject(const std::string& text) { deliver(text); }

    TransportStatus open(uint16_t) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_next_open_) {
            fail_next_open_ = false;
            return TransportError{-98, "address already in use"};
        }
        open_ = true;
        ++open_count_;
        return std::nullopt;
    }

    TransportStatus send(std::string_view payload, const Endpoint&) override {
        Step step{Action::Silence, {}, {}};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) {
                return TransportError{-9, "socket not open"};
            }
            sent_.emplace_back(payload);
            events_.push_back("send:" + std::string(payload));
            auto& queue = script_[std::string(payload)];
            if (!queue.empty()) {
                step = queue.front();
                queue.pop_front();
            }
        }

        if (step.action == Action::Fail) {
            return TransportError{-32, "broken pipe"};
        }
        if (step.action == Action::Reply) {
            if (step.delay.count() == 0) {
                record_reply(step.text);
                deliver(step.text);
            } else {
                std::lock_guard<std::mutex> lock(mutex_);
                reply_threads_.emplace_back([this, step] {
                    std::this_thread::sleep_for(step.delay);
                    record_reply(step.text);
                    deliver(step.text);
                });
            }
        }
        return std::nullopt;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_) {
            ++close_count_;
        }
        open_ = false;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    void set_receiver(Receiver receiver) override {
        std::lock_guard<std::mutex> lock(mutex_);
        receiver_ = std::move(receiver);
    }

    uint16_t local_port() const override { return 9000; }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::size_t count_sent(const std::string& command) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& payload : sent_) {
            if (payload == command) {
                ++count;
            }
        }
        return count;
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    int open_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_count_;
    }

    int close_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_count_;
    }

private:
    void record_reply(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back("reply:" + text);
    }

    void deliver(const std::string& text) {
        Receiver receiver;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            receiver = receiver_;
        }
        if (receiver) {
            receiver(text);
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<Step>> script_;
    std::vector<std::string> sent_;
    std::vector<std::string> events_;
    std::vector<std::thread> reply_threads_;
    Receiver receiver_;
    bool open_ = false;
    bool fail_next_open_ = false;
    int open_count_ = 0;
    int close_count_ = 0;
};

// Millisecond-scale timings so timeout paths finish quickly.
inline DroneControllerConfig fast_config() {
    DroneControllerConfig config;
    config.drone_ip = "127.0.0.1";
    config.mode_switch_timeout = std::chrono::milliseconds(150);
    config.battery_timeout = std::chrono::milliseconds(150);
    config.takeoff_timeout = std::chrono::milliseconds(150);
    config.land_timeout = std::chrono::milliseconds(150);
    config.movement_timeout = std::chrono::milliseconds(150);
    config.default_timeout = std::chrono::milliseconds(150);
    config.connect_retry_pause = std::chrono::milliseconds(0);
    config.receiver_settle = std::chrono::milliseconds(0);
    config.reconnect_settle = std::chrono::milliseconds(0);
    return config;
}

} // namespace tello_test
