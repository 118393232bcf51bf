#include "udp_transport.hpp"
#include "response_classifier.hpp"
#include <uv.h>
#include <cstdlib>
#include <deque>
#include <iostream>

namespace {
constexpr std::chrono::seconds kLoopJoinTimeout{2};
}

// Owns the payload until libuv reports completion.
struct UdpSendRequest {
    uv_udp_send_t req{};
    std::string payload;
    struct sockaddr_in addr{};
    std::promise<int> status;
};

struct UdpLoopState {
    uv_loop_t loop{};
    uv_udp_t udp{};
    uv_async_t wakeup{};
    std::shared_ptr<UdpTransport::ReceiverHolder> receiver;
    std::atomic<bool> failed{false};

    std::mutex mutex;
    std::deque<std::unique_ptr<UdpSendRequest>> outbox; // guarded by mutex
    bool stopping = false;                           // guarded by mutex
    bool handles_closing = false;                    // guarded by mutex
};

namespace {

TransportError make_error(int code, const std::string& what) {
    return TransportError{code, what + ": " + uv_strerror(code)};
}

// Runs on the loop thread. Once both handles are closed uv_run returns.
void close_handles(UdpLoopState& state) {
    std::deque<std::unique_ptr<UdpSendRequest>> abandoned;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.handles_closing) {
            return;
        }
        state.handles_closing = true;
        abandoned.swap(state.outbox);
    }
    for (auto& request : abandoned) {
        request->status.set_value(UV_ECANCELED);
    }
    uv_udp_recv_stop(&state.udp);
    uv_close(reinterpret_cast<uv_handle_t*>(&state.udp), nullptr);
    uv_close(reinterpret_cast<uv_handle_t*>(&state.wakeup), nullptr);
}

// Tears down a loop whose thread was never started.
void discard_loop(UdpLoopState& state) {
    uv_close(reinterpret_cast<uv_handle_t*>(&state.udp), nullptr);
    uv_close(reinterpret_cast<uv_handle_t*>(&state.wakeup), nullptr);
    uv_run(&state.loop, UV_RUN_DEFAULT);
    uv_loop_close(&state.loop);
}

void deliver(UdpLoopState& state, std::string text) {
    Transport::Receiver receiver;
    {
        std::lock_guard<std::mutex> lock(state.receiver->mutex);
        receiver = state.receiver->receiver;
    }
    if (!receiver) {
        std::cout << "No receiver attached, dropping response: " << text << std::endl;
        return;
    }
    receiver(std::move(text));
}

void on_send_complete(uv_udp_send_t* req, int status) {
    auto* request = static_cast<UdpSendRequest*>(req->data);
    if (status) {
        std::cerr << "UDP send failed: " << uv_strerror(status) << std::endl;
    }
    request->status.set_value(status);
    delete request;
}

void dispatch_send(UdpLoopState& state, std::unique_ptr<UdpSendRequest> owned) {
    auto* request = owned.release();
    request->req.data = request;
    uv_buf_t buf = uv_buf_init(request->payload.data(), static_cast<unsigned int>(request->payload.size()));
    int result = uv_udp_send(&request->req, &state.udp, &buf, 1,
                             reinterpret_cast<const struct sockaddr*>(&request->addr),
                             on_send_complete);
    if (result != 0) {
        std::cerr << "Failed to send datagram: " << uv_strerror(result) << std::endl;
        request->status.set_value(result);
        delete request;
    }
}

void on_wakeup(uv_async_t* handle) {
    auto* state = static_cast<UdpLoopState*>(handle->data);
    std::deque<std::unique_ptr<UdpSendRequest>> batch;
    bool stopping = false;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        stopping = state->stopping;
        if (!stopping) {
            batch.swap(state->outbox);
        }
    }
    if (stopping) {
        close_handles(*state);
        return;
    }
    for (auto& request : batch) {
        dispatch_send(*state, std::move(request));
    }
}

void alloc_buffer(uv_handle_t*, size_t suggested_size, uv_buf_t* buf) {
    buf->base = static_cast<char*>(malloc(suggested_size));
    buf->len = buf->base ? suggested_size : 0;
}

void on_receive(uv_udp_t* handle, ssize_t nread, const uv_buf_t* buf, const struct sockaddr*, unsigned) {
    auto* state = static_cast<UdpLoopState*>(handle->data);
    if (nread > 0) {
        std::string_view datagram(buf->base, static_cast<size_t>(nread));
        if (auto text = classify_datagram(datagram)) {
            deliver(*state, std::move(*text));
        } else {
            std::cout << "Ignoring non-response datagram (" << nread << " bytes)" << std::endl;
        }
    } else if (nread < 0) {
        std::cerr << "UDP receive error: " << uv_strerror(static_cast<int>(nread)) << std::endl;
        state->failed = true;
        close_handles(*state);
    }
    free(buf->base);
}

} // namespace

UdpTransport::UdpTransport(std::chrono::milliseconds send_timeout)
    : send_timeout_(send_timeout), receiver_(std::make_shared<ReceiverHolder>()) {}

UdpTransport::~UdpTransport() {
    set_receiver(nullptr);
    close();
}

TransportStatus UdpTransport::open(uint16_t local_port) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (auto existing = current_state()) {
        if (!existing->failed) {
            return TransportError{UV_EALREADY, "UDP socket already open on port " + std::to_string(bound_port_.load())};
        }
    }
    // A loop that died on a receive error is reaped before reopening.
    close_locked();

    auto state = std::make_shared<UdpLoopState>();
    state->receiver = receiver_;
    if (int result = uv_loop_init(&state->loop); result != 0) {
        return make_error(result, "Failed to initialize uv_loop");
    }
    uv_udp_init(&state->loop, &state->udp);
    uv_async_init(&state->loop, &state->wakeup, on_wakeup);
    state->udp.data = state.get();
    state->wakeup.data = state.get();

    struct sockaddr_in bind_addr;
    uv_ip4_addr("0.0.0.0", local_port, &bind_addr);
    if (int result = uv_udp_bind(&state->udp, reinterpret_cast<const struct sockaddr*>(&bind_addr), UV_UDP_REUSEADDR);
        result != 0) {
        discard_loop(*state);
        return make_error(result, "Failed to bind UDP socket to port " + std::to_string(local_port));
    }
    if (int result = uv_udp_recv_start(&state->udp, alloc_buffer, on_receive); result != 0) {
        discard_loop(*state);
        return make_error(result, "Failed to start UDP receive");
    }

    struct sockaddr_storage bound{};
    int bound_len = sizeof(bound);
    if (uv_udp_getsockname(&state->udp, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(reinterpret_cast<const struct sockaddr_in*>(&bound)->sin_port);
    } else {
        bound_port_ = local_port;
    }
    std::cout << "UDP socket bound to port " << bound_port_.load() << std::endl;

    std::promise<void> done;
    loop_done_ = done.get_future();
    loop_thread_ = std::thread([state, done = std::move(done)]() mutable {
        uv_run(&state->loop, UV_RUN_DEFAULT);
        if (int result = uv_loop_close(&state->loop); result != 0) {
            std::cerr << "uv_loop_close failed: " << uv_strerror(result) << std::endl;
        }
        done.set_value();
    });

    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = std::move(state);
    return std::nullopt;
}

TransportStatus UdpTransport::send(std::string_view payload, const Endpoint& remote) {
    auto state = current_state();
    if (!state || state->failed) {
        return TransportError{UV_EBADF, "UDP socket not open"};
    }

    auto request = std::make_unique<UdpSendRequest>();
    if (int result = uv_ip4_addr(remote.ip.c_str(), remote.port, &request->addr); result != 0) {
        return make_error(result, "Invalid remote address " + remote.ip);
    }
    request->payload.assign(payload.data(), payload.size());
    auto status = request->status.get_future();
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->stopping || state->handles_closing) {
            return TransportError{UV_EBADF, "UDP socket is closing"};
        }
        state->outbox.push_back(std::move(request));
        uv_async_send(&state->wakeup);
    }

    if (status.wait_for(send_timeout_) != std::future_status::ready) {
        return TransportError{UV_ETIMEDOUT, "UDP send was not confirmed by the event loop"};
    }
    if (int result = status.get(); result != 0) {
        return make_error(result, "UDP send failed");
    }
    return std::nullopt;
}

void UdpTransport::close() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    close_locked();
}

void UdpTransport::close_locked() {
    std::shared_ptr<UdpLoopState> state;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state = std::move(state_);
        state_.reset();
    }
    if (!state) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->stopping = true;
        if (!state->handles_closing) {
            uv_async_send(&state->wakeup);
        }
    }

    if (loop_done_.wait_for(kLoopJoinTimeout) == std::future_status::ready) {
        loop_thread_.join();
    } else {
        // The thread keeps its own reference to the loop state.
        std::cerr << "UDP receive loop did not stop in time, detaching it" << std::endl;
        loop_thread_.detach();
    }
    std::cout << "UDP socket closed" << std::endl;
}

bool UdpTransport::is_open() const {
    auto state = current_state();
    return state && !state->failed;
}

void UdpTransport::set_receiver(Receiver receiver) {
    std::lock_guard<std::mutex> lock(receiver_->mutex);
    receiver_->receiver = std::move(receiver);
}

std::shared_ptr<UdpLoopState> UdpTransport::current_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}
