#include "command_request.hpp"
#include "drone_config.hpp"
#include "drone_controller.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libuv.h>
#include <uv.h>
#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

// Exposes the drone controller on a RabbitMQ command bus. Requests arrive as
// text on the command queue; every outcome is published as a JSON object to the
// response queue.
class CommandBridge {
public:
    CommandBridge(DroneController& controller, BridgeConfig config)
        : controller_(controller), config_(std::move(config)), loop_(create_loop()), handler_(loop_.get()) {
        uv_timer_init(loop_.get(), &reconnect_timer_);
        reconnect_timer_.data = this;
        uv_signal_init(loop_.get(), &sigint_);
        uv_signal_init(loop_.get(), &sigterm_);
        sigint_.data = this;
        sigterm_.data = this;
        uv_signal_start(&sigint_, on_signal, SIGINT);
        uv_signal_start(&sigterm_, on_signal, SIGTERM);

        connect_to_rabbitmq();
        setup_consumer();
    }

    void run() {
        uv_run(loop_.get(), UV_RUN_DEFAULT);
    }

    bool failed() const { return failed_; }

private:
    struct LoopDeleter {
        void operator()(uv_loop_t* loop) const {
            if (loop) {
                uv_loop_close(loop);
                delete loop;
            }
        }
    };

    static auto create_loop() -> std::unique_ptr<uv_loop_t, LoopDeleter> {
        auto* loop = new uv_loop_t;
        if (int result = uv_loop_init(loop); result != 0) {
            delete loop;
            throw std::runtime_error("Failed to initialize uv_loop: " + std::string(uv_strerror(result)));
        }
        return std::unique_ptr<uv_loop_t, LoopDeleter>(loop);
    }

    static void on_signal(uv_signal_t* handle, int signum) {
        auto* bridge = static_cast<CommandBridge*>(handle->data);
        std::cout << "Received signal " << signum << ", shutting down..." << std::endl;
        bridge->shutdown();
    }

    static void on_reconnect_timer(uv_timer_t* handle) {
        auto* bridge = static_cast<CommandBridge*>(handle->data);
        bridge->connect_to_rabbitmq();
        bridge->setup_consumer();
    }

    void connect_to_rabbitmq() {
        channel_.reset();
        conn_.reset();
        AMQP::Address address(config_.amqp_host, config_.amqp_port,
                              AMQP::Login(config_.amqp_user, config_.amqp_password), "/");
        std::cout << "Attempting to connect to RabbitMQ at " << config_.amqp_host << ":" << config_.amqp_port
                  << "..." << std::endl;
        conn_ = std::make_unique<AMQP::TcpConnection>(&handler_, address);
        channel_ = std::make_unique<AMQP::TcpChannel>(conn_.get());

        channel_->onReady([this]() {
            std::cout << "Channel is ready" << std::endl;
            reconnect_attempts_ = 0;
        });

        channel_->onError([this](const char* message) {
            if (shutting_down_) {
                std::cout << "Channel error during shutdown: " << message << std::endl;
                return;
            }
            std::cerr << "Channel error: " << message << ". Attempt " << reconnect_attempts_ + 1
                      << " to reconnect..." << std::endl;
            schedule_reconnect();
        });
    }

    // Reconnects with exponential backoff; the loop stops once the attempts are used up.
    void schedule_reconnect() {
        if (reconnect_attempts_ >= config_.max_reconnect_attempts) {
            std::cerr << "Failed to reconnect to RabbitMQ after " << config_.max_reconnect_attempts
                      << " attempts" << std::endl;
            failed_ = true;
            shutdown();
            return;
        }
        int delay = std::min(config_.reconnect_delay_max, 1 << reconnect_attempts_);
        ++reconnect_attempts_;
        std::cout << "Waiting " << delay << " seconds before reconnecting..." << std::endl;
        uv_timer_start(&reconnect_timer_, on_reconnect_timer, static_cast<uint64_t>(delay) * 1000, 0);
    }

    void setup_consumer() {
        channel_->declareQueue(config_.command_queue, AMQP::durable)
            .onSuccess([this]() {
                channel_->declareQueue(config_.response_queue, AMQP::durable)
                    .onSuccess([this]() {
                        channel_->consume(config_.command_queue, AMQP::noack)
                            .onSuccess([]() {
                                std::cout << "Consumer started successfully" << std::endl;
                            })
                            .onReceived([this](const AMQP::Message& message, uint64_t, bool) {
                                handle_request(std::string_view(message.body(), message.bodySize()));
                            })
                            .onError([](const char* message) {
                                std::cerr << "Consume error: " << message << std::endl;
                            });
                    })
                    .onError([](const char* message) {
                        std::cerr << "Response queue declare error: " << message << std::endl;
                    });
            })
            .onError([](const char* message) {
                std::cerr << "Queue declare error: " << message << std::endl;
            });

        std::cout << "CommandBridge listening on queue " << config_.command_queue << std::endl;
    }

    // Runs on the bus loop; controller calls block until the drone answers.
    void handle_request(std::string_view body) {
        std::cout << "Received request: " << body << std::endl;
        std::string error;
        OperationResult result;
        if (auto request = parse_request(body, error)) {
            result = dispatch(controller_, *request);
        } else {
            result = OperationResult::failure(OperationError::Validation, error);
        }

        const std::string response = format_result(result);
        std::cout << "Publishing response: " << response << std::endl;
        if (!channel_) {
            std::cerr << "Channel unavailable, dropping response" << std::endl;
            return;
        }
        AMQP::Envelope envelope(response.data(), response.size());
        envelope.setDeliveryMode(2);
        if (!channel_->publish("", config_.response_queue, envelope)) {
            std::cerr << "Failed to publish response" << std::endl;
        }
    }

    void shutdown() {
        if (shutting_down_) {
            return;
        }
        shutting_down_ = true;
        auto result = controller_.disconnect();
        std::cout << result.message << std::endl;

        uv_timer_stop(&reconnect_timer_);
        uv_signal_stop(&sigint_);
        uv_signal_stop(&sigterm_);
        uv_close(reinterpret_cast<uv_handle_t*>(&reconnect_timer_), nullptr);
        uv_close(reinterpret_cast<uv_handle_t*>(&sigint_), nullptr);
        uv_close(reinterpret_cast<uv_handle_t*>(&sigterm_), nullptr);
        if (conn_) {
            std::cout << "Closing RabbitMQ connection..." << std::endl;
            conn_->close();
        }
    }

    DroneController& controller_;
    BridgeConfig config_;
    std::unique_ptr<uv_loop_t, LoopDeleter> loop_;
    AMQP::LibUvHandler handler_;
    std::unique_ptr<AMQP::TcpConnection> conn_;
    std::unique_ptr<AMQP::TcpChannel> channel_;
    uv_timer_t reconnect_timer_{};
    uv_signal_t sigint_{};
    uv_signal_t sigterm_{};
    int reconnect_attempts_ = 0;
    bool shutting_down_ = false;
    bool failed_ = false;
};

int main() {
    try {
        DroneController controller(load_config_from_env());
        if (auto result = controller.connect(); !result.success) {
            std::cerr << "Failed to connect to Tello: " << result.message << std::endl;
            throw std::runtime_error("Tello connection failed");
        }

        CommandBridge bridge(controller, load_bridge_config_from_env());
        bridge.run();
        if (bridge.failed()) {
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
