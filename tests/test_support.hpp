#pragma once

#include "config.hpp"
#include "identity.hpp"

#include <httplib.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

namespace relay_test {

// httplib::Server on an ephemeral loopback port, stopped on destruction.
class LoopbackServer {
 public:
  LoopbackServer() = default;
  ~LoopbackServer() { Stop(); }
  LoopbackServer(const LoopbackServer&) = delete;
  LoopbackServer& operator=(const LoopbackServer&) = delete;

  httplib::Server& server() { return server_; }

  int Start() {
    port_ = server_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this] { server_.listen_after_bind(); });
    for (int i = 0; i < 500 && !server_.is_running(); i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return port_;
  }

  void Stop() {
    if (!thread_.joinable()) return;
    server_.stop();
    thread_.join();
  }

  int port() const { return port_; }

  std::string Url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

 private:
  httplib::Server server_;
  std::thread thread_;
  int port_ = 0;
};

// A loopback port with no listener; connecting to it is refused.
inline int ClosedPort() {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  int port = 1;
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) port = ntohs(addr.sin_port);
  }
  ::close(fd);
  return port;
}

class CoutCapture {
 public:
  CoutCapture() : prev_(std::cout.rdbuf(buffer_.rdbuf())) {}
  ~CoutCapture() { Restore(); }

  std::string Restore() {
    if (prev_) {
      std::cout.rdbuf(prev_);
      prev_ = nullptr;
    }
    return buffer_.str();
  }

 private:
  std::ostringstream buffer_;
  std::streambuf* prev_;
};

class FixedIdentityProvider : public relay::IIdentityProvider {
 public:
  explicit FixedIdentityProvider(std::optional<relay::CallerIdentity> identity) : identity_(std::move(identity)) {}

  std::optional<relay::CallerIdentity> Identify(const httplib::Request&, std::string* err) const override {
    if (!identity_ && err) *err = "missing caller identity";
    return identity_;
  }

 private:
  std::optional<relay::CallerIdentity> identity_;
};

inline relay::CallerIdentity TestCaller() {
  return {"u-42", "Ada Lovelace", "ada@example.com", "admin"};
}

inline relay::Settings SettingsFor(const std::string& webhook_url) {
  relay::Settings s;
  s.webhook_url = webhook_url;
  s.timeout = std::chrono::seconds(5);
  s.max_retries = 0;
  s.api_prefix_mode = "root";
  return s;
}

}  // namespace relay_test
