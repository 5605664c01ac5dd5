#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace fastmda {

class DescriptorProtocol;
class RpcDispatcher;

/**
 * @brief WebSocket control endpoint (Boost.Beast).
 *
 * Every text frame is handed to the RpcDispatcher and the response is written
 * back to the same client. New clients receive the device descriptor message,
 * and all clients receive a periodic runs_update listing.
 */
class WebSocketServer {
public:
    WebSocketServer(int port, RpcDispatcher& dispatcher, DescriptorProtocol& protocol,
                    std::chrono::milliseconds broadcast_period = std::chrono::milliseconds(1000));
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Binds and starts the I/O and broadcast threads. Throws ConnectionError when the port cannot be bound.
    void start();
    void stop();

    bool is_running() const { return running.load(); }
    // Bound port; differs from the requested one when 0 was requested.
    int bound_port() const;
    std::size_t client_count() const;

private:
    struct Impl;

    void run_event_loop();
    void broadcast_runs_loop();

    int port;
    std::chrono::milliseconds broadcast_period;
    std::atomic<bool> running{false};
    std::thread event_thread;
    std::thread broadcast_thread;

    RpcDispatcher& dispatcher;
    DescriptorProtocol& protocol;
    std::shared_ptr<Impl> impl;
};

} // namespace fastmda
