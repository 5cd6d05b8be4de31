#pragma once

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace relay {

enum class UpstreamOutcome {
  kStreamingBody,
  kBufferedBody,
  kHttpError,
  kTransportError,
  // The chunk consumer stopped the transfer (downstream client went away).
  kCanceled,
};

enum class TransportErrorKind {
  kConnection,
  kUnexpected,
};

struct UpstreamResult {
  UpstreamOutcome outcome = UpstreamOutcome::kTransportError;
  int status = 0;
  // Error body for kHttpError, raw reply for kBufferedBody.
  std::string body;
  // Parsed reply for kBufferedBody; discarded when the reply is not json.
  nlohmann::json reply = nlohmann::json::value_t::discarded;
  std::string cause;
  TransportErrorKind transport_kind = TransportErrorKind::kConnection;
  int attempts = 0;
};

using ChunkCallback = std::function<bool(const char* data, size_t len)>;

class IUpstreamClient {
 public:
  virtual ~IUpstreamClient() = default;

  // Streaming bodies are handed to on_chunk as they arrive; returning false
  // aborts the exchange and closes the connection.
  virtual UpstreamResult Send(const nlohmann::json& envelope, const ChunkCallback& on_chunk) = 0;
};

class WebhookClient : public IUpstreamClient {
 public:
  explicit WebhookClient(const Settings& settings);

  UpstreamResult Send(const nlohmann::json& envelope, const ChunkCallback& on_chunk) override;

 private:
  using Clock = std::chrono::steady_clock;

  UpstreamResult SendOnce(const std::string& body,
                          bool stream,
                          Clock::time_point deadline,
                          const ChunkCallback& on_chunk,
                          bool* response_started);

  HttpEndpoint endpoint_;
  std::string auth_token_;
  std::chrono::seconds timeout_;
  int max_retries_;
  bool verify_tls_;
};

}  // namespace relay
