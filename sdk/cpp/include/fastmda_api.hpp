#pragma once

// FastMDA control client.
//
// Dependencies:
// - Boost (Asio + Beast WebSocket)
// - nlohmann::json (header-only)

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

namespace fastmda {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

struct WsUrl {
  std::string host;
  std::string port;
  std::string target;
};

inline bool parse_ws_url(const std::string& url, WsUrl& out) {
  // ws://host[:port][/path]
  std::string s = url;
  const std::string prefix = "ws://";
  if (s.rfind(prefix, 0) != 0) return false;
  s = s.substr(prefix.size());

  std::string hostport;
  auto slash = s.find('/');
  if (slash == std::string::npos) {
    hostport = s;
    out.target = "/";
  } else {
    hostport = s.substr(0, slash);
    out.target = s.substr(slash);
    if (out.target.empty()) out.target = "/";
  }

  auto colon = hostport.find(':');
  if (colon == std::string::npos) {
    out.host = hostport;
    out.port = "80";
  } else {
    out.host = hostport.substr(0, colon);
    out.port = hostport.substr(colon + 1);
    if (out.port.empty()) out.port = "80";
  }

  return !out.host.empty();
}

inline std::string random_request_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static const char* hex = "0123456789abcdef";
  std::string out = "cpp_";
  for (int i = 0; i < 16; ++i) out.push_back(hex[(rng() >> ((i % 8) * 8)) & 0xF]);
  return out;
}

// Raised when the backend answers ok=false; carries the backend error payload.
class RpcError : public std::runtime_error {
 public:
  explicit RpcError(json error)
      : std::runtime_error(error.value("message", std::string("rpc error"))), error_(std::move(error)) {}

  int code() const { return error_.value("code", 0); }
  std::string kind() const { return error_.value("kind", std::string{}); }
  const json& payload() const { return error_; }

 private:
  json error_;
};

class Client {
 public:
  explicit Client(std::string ws_url = "ws://localhost:8080/") : ws_url_(std::move(ws_url)) {
    if (!parse_ws_url(ws_url_, url_)) {
      throw std::runtime_error("Invalid ws url (expected ws://host:port/path): " + ws_url_);
    }
  }

  const std::string& ws_url() const { return ws_url_; }

  // Full rpc_result message, whatever the outcome.
  json rpc_raw(const std::string& method, const json& params = json::object(), int timeout_ms = 10000) const {
    net::io_context ioc;
    tcp::resolver resolver{ioc};
    websocket::stream<tcp::socket> ws{ioc};

    auto const results = resolver.resolve(url_.host, url_.port);
    net::connect(ws.next_layer(), results);
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.handshake(url_.host + ":" + url_.port, url_.target);

    const std::string id = random_request_id();
    json req = {{"type", "rpc"}, {"id", id}, {"method", method}, {"params", params}};
    ws.write(net::buffer(req.dump()));

    beast::flat_buffer buffer;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    for (;;) {
      if (std::chrono::steady_clock::now() >= deadline) {
        throw std::runtime_error("rpc timeout: " + method);
      }

      buffer.consume(buffer.size());
      ws.read(buffer);
      std::string data = beast::buffers_to_string(buffer.data());

      // Skip descriptor and runs_update pushes.
      json msg = json::parse(data, nullptr, false);
      if (!msg.is_object()) continue;
      if (msg.value("type", std::string{}) == "rpc_result" && msg.value("id", std::string{}) == id) {
        beast::error_code ec;
        ws.close(websocket::close_code::normal, ec);
        return msg;
      }
    }
  }

  json rpc(const std::string& method, const json& params = json::object(), int timeout_ms = 10000) const {
    json msg = rpc_raw(method, params, timeout_ms);
    if (!msg.value("ok", false)) throw RpcError(msg.value("error", json::object()));
    return msg.value("result", json::object());
  }

  json devices() const { return rpc("devices.list").value("devices", json::array()); }

  std::string start_measurement(const json& measurement) const {
    return rpc("measurement.start", json{{"measurement", measurement}}).value("run_id", std::string{});
  }

  json status(const std::string& run_id, bool include_data = true) const {
    return rpc("measurement.status", json{{"run_id", run_id}, {"include_data", include_data}});
  }

  bool cancel(const std::string& run_id) const {
    return rpc("measurement.cancel", json{{"run_id", run_id}}).value("cancel_requested", false);
  }

  // Polls measurement.status until the run is terminal.
  json wait_for_run(const std::string& run_id, double timeout_s, double poll_s = 0.1) const {
    const auto start = std::chrono::steady_clock::now();
    for (;;) {
      json s = status(run_id, false);
      const std::string state = s.value("state", std::string{});
      if (state == "completed" || state == "failed" || state == "cancelled") return status(run_id, true);
      if (std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count() > timeout_s) {
        throw std::runtime_error("wait_for_run timeout: " + run_id);
      }
      std::this_thread::sleep_for(std::chrono::duration<double>(poll_s));
    }
  }

 private:
  std::string ws_url_;
  WsUrl url_;
};

}  // namespace fastmda
