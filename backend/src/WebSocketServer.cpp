#include "WebSocketServer.hpp"
#include "DescriptorProtocol.hpp"
#include "core/Errors.hpp"
#include "net/RpcDispatcher.hpp"
#include <iostream>
#include <mutex>
#include <set>
#include <vector>
// Boost.Beast / Asio for WebSocket
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace fastmda {

struct WsSession {
    explicit WsSession(tcp::socket socket) : ws(std::move(socket)) {}

    websocket::stream<tcp::socket> ws;
    beast::flat_buffer buffer;

    // Only called on the I/O thread, so writes never overlap.
    void send(const std::string& text) {
        boost::system::error_code ec;
        ws.text(true);
        ws.write(asio::buffer(text), ec);
        if (ec) std::cerr << "WebSocketServer: write failed: " << ec.message() << std::endl;
    }
};

struct WebSocketServer::Impl {
    asio::io_context ioc;
    tcp::acceptor acceptor;
    std::atomic<bool>& running;
    RpcDispatcher& dispatcher;
    DescriptorProtocol& protocol;
    mutable std::mutex sessions_m;
    std::set<std::shared_ptr<WsSession>> sessions;

    Impl(int port, std::atomic<bool>& running, RpcDispatcher& dispatcher, DescriptorProtocol& protocol)
    : ioc(), acceptor(ioc), running(running), dispatcher(dispatcher), protocol(protocol) {
        boost::system::error_code ec;
        acceptor.open(tcp::v4(), ec);
        if (!ec) acceptor.set_option(asio::socket_base::reuse_address(true), ec);
        if (!ec) acceptor.bind(tcp::endpoint(tcp::v4(), static_cast<unsigned short>(port)), ec);
        if (!ec) acceptor.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) {
            const auto code = ec == asio::error::address_in_use ? ConnectionCode::InUse : ConnectionCode::Transport;
            throw ConnectionError(code, "WebSocketServer: cannot listen on port " + std::to_string(port) + ": " + ec.message());
        }
    }

    void add_session(const std::shared_ptr<WsSession>& s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.insert(s);
        std::cerr << "WebSocketServer: client connected (count=" << sessions.size() << ")" << std::endl;
    }

    void remove_session(const std::shared_ptr<WsSession>& s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        if (sessions.erase(s) == 0) return;
        std::cerr << "WebSocketServer: client disconnected (count=" << sessions.size() << ")" << std::endl;
    }

    template <typename Fn>
    void for_each_session(Fn&& fn) {
        std::vector<std::shared_ptr<WsSession>> snapshot;
        {
            std::lock_guard<std::mutex> lk(sessions_m);
            snapshot.assign(sessions.begin(), sessions.end());
        }
        for (auto& s : snapshot) fn(s);
    }

    void do_accept() {
        auto socket = std::make_shared<tcp::socket>(ioc);
        acceptor.async_accept(*socket, [this, socket](boost::system::error_code ec) {
            if (ec) {
                if (running) std::cerr << "WebSocketServer: accept error: " << ec.message() << std::endl;
            } else {
                auto s = std::make_shared<WsSession>(std::move(*socket));
                s->ws.async_accept([this, s](boost::system::error_code ec) {
                    if (ec) {
                        std::cerr << "WebSocketServer: handshake failed: " << ec.message() << std::endl;
                        return;
                    }
                    add_session(s);
                    try {
                        s->send(protocol.build_descriptor_message().dump());
                    } catch (const std::exception& e) {
                        std::cerr << "WebSocketServer: descriptor failed: " << e.what() << std::endl;
                    }
                    do_read(s);
                });
            }
            if (running) do_accept();
        });
    }

    void do_read(const std::shared_ptr<WsSession>& s) {
        s->ws.async_read(s->buffer, [this, s](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec != websocket::error::closed && running) {
                    std::cerr << "WebSocketServer: " << errors::MSG_E2410_SESSION_DROPPED << " (" << ec.message() << ")" << std::endl;
                }
                remove_session(s);
                return;
            }
            const auto data = beast::buffers_to_string(s->buffer.data());
            s->buffer.consume(s->buffer.size());
            s->send(dispatcher.handle_text(data).dump());
            do_read(s);
        });
    }
};

WebSocketServer::WebSocketServer(int p, RpcDispatcher& dispatcher, DescriptorProtocol& protocol,
                                 std::chrono::milliseconds broadcast_period)
: port(p), broadcast_period(broadcast_period), dispatcher(dispatcher), protocol(protocol) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::start() {
    if (running) return;
    impl = std::make_shared<Impl>(port, running, dispatcher, protocol);
    running = true;
    impl->do_accept();

    event_thread = std::thread([this]() { run_event_loop(); });
    broadcast_thread = std::thread([this]() { broadcast_runs_loop(); });
    std::cout << "WebSocketServer: listening on port " << bound_port() << std::endl;
}

void WebSocketServer::stop() {
    if (!running.exchange(false)) return;
    if (event_thread.joinable()) event_thread.join();
    if (broadcast_thread.joinable()) broadcast_thread.join();
    std::cout << "WebSocketServer: stopped" << std::endl;
}

int WebSocketServer::bound_port() const {
    if (!impl) return port;
    boost::system::error_code ec;
    auto ep = impl->acceptor.local_endpoint(ec);
    return ec ? port : ep.port();
}

std::size_t WebSocketServer::client_count() const {
    if (!impl) return 0;
    std::lock_guard<std::mutex> lk(impl->sessions_m);
    return impl->sessions.size();
}

void WebSocketServer::run_event_loop() {
    // Non-blocking poll loop so stop() only has to flip the flag.
    while (running) {
        try {
            impl->ioc.poll();
        } catch (const std::exception& e) {
            std::cerr << "WebSocketServer: I/O context error: " << e.what() << std::endl;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    boost::system::error_code ec;
    impl->acceptor.close(ec);
    impl->for_each_session([](const std::shared_ptr<WsSession>& s) {
        boost::system::error_code ec;
        s->ws.close(websocket::close_code::normal, ec);
    });
    impl->ioc.stop();
}

void WebSocketServer::broadcast_runs_loop() {
    auto next = std::chrono::steady_clock::now();
    while (running) {
        next += broadcast_period;
        try {
            const auto payload = protocol.build_runs_update().dump();
            impl->for_each_session([&](const std::shared_ptr<WsSession>& s) {
                asio::post(impl->ioc, [s, payload]() { s->send(payload); });
            });
        } catch (const std::exception& e) {
            std::cerr << "WebSocketServer: broadcast error: " << e.what() << std::endl;
        }
        while (running && std::chrono::steady_clock::now() < next) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
}

} // namespace fastmda
