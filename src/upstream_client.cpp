#include "upstream_client.hpp"

#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace relay {
namespace {

constexpr auto kRetryPause = std::chrono::milliseconds(500);
// Socket timeouts are derived from the remaining budget, so a failure this close
// to the deadline is the deadline firing.
constexpr auto kDeadlineSlack = std::chrono::milliseconds(50);

static void SetTimeouts(httplib::Client& cli, std::chrono::milliseconds budget) {
  const auto ms = std::max<int64_t>(budget.count(), 1);
  const time_t sec = static_cast<time_t>(ms / 1000);
  const time_t usec = static_cast<time_t>((ms % 1000) * 1000);
  cli.set_connection_timeout(sec, usec);
  cli.set_read_timeout(sec, usec);
  cli.set_write_timeout(sec, usec);
}

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep,
                                                   std::chrono::milliseconds budget,
                                                   bool verify_tls) {
  auto cli = std::make_unique<httplib::Client>(ep.SchemeHostPort());
  SetTimeouts(*cli, budget);
  cli->set_keep_alive(false);
  cli->set_follow_location(false);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
  cli->enable_server_certificate_verification(verify_tls);
#else
  (void)verify_tls;
#endif
  return cli;
}

static TransportErrorKind ClassifyError(httplib::Error error) {
  switch (error) {
    case httplib::Error::Unknown:
    case httplib::Error::Canceled:
    case httplib::Error::Compression:
      return TransportErrorKind::kUnexpected;
    default:
      return TransportErrorKind::kConnection;
  }
}

static std::chrono::milliseconds Remaining(std::chrono::steady_clock::time_point deadline) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
}

// Socket timeouts apply per read, so a stream that goes quiet right before the
// deadline would otherwise wait one more full budget. Stops the client at the deadline.
class DeadlineWatchdog {
 public:
  DeadlineWatchdog(httplib::Client* cli, std::chrono::steady_clock::time_point deadline)
      : thread_([this, cli, deadline] {
          std::unique_lock<std::mutex> lock(mu_);
          if (cv_.wait_until(lock, deadline, [this] { return finished_; })) return;
          fired_ = true;
          cli->stop();
        }) {}

  ~DeadlineWatchdog() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      finished_ = true;
    }
    cv_.notify_all();
    thread_.join();
  }

  DeadlineWatchdog(const DeadlineWatchdog&) = delete;
  DeadlineWatchdog& operator=(const DeadlineWatchdog&) = delete;

  bool fired() const { return fired_; }

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool finished_ = false;
  std::atomic<bool> fired_{false};
  std::thread thread_;
};

}  // namespace

WebhookClient::WebhookClient(const Settings& settings)
    : endpoint_(settings.WebhookEndpoint()),
      auth_token_(settings.auth_token),
      timeout_(settings.timeout),
      max_retries_(settings.max_retries),
      verify_tls_(settings.verify_tls) {}

UpstreamResult WebhookClient::Send(const nlohmann::json& envelope, const ChunkCallback& on_chunk) {
  const bool stream = envelope.is_object() && envelope.value("stream", false);
  const std::string body = envelope.dump();
  const auto deadline = Clock::now() + timeout_;

  UpstreamResult result;
  for (int attempt = 1;; attempt++) {
    bool response_started = false;
    result = SendOnce(body, stream, deadline, on_chunk, &response_started);
    result.attempts = attempt;

    const bool retryable = result.outcome == UpstreamOutcome::kTransportError &&
                           result.transport_kind == TransportErrorKind::kConnection && !response_started;
    if (!retryable || attempt > max_retries_) break;
    if (Remaining(deadline) <= kRetryPause) break;
    std::cout << "[upstream] retry attempt=" << (attempt + 1) << "/" << (max_retries_ + 1) << " cause=" << result.cause
              << "\n";
    std::this_thread::sleep_for(kRetryPause);
  }
  return result;
}

UpstreamResult WebhookClient::SendOnce(const std::string& body,
                                       bool stream,
                                       Clock::time_point deadline,
                                       const ChunkCallback& on_chunk,
                                       bool* response_started) {
  UpstreamResult out;
  const auto budget = Remaining(deadline);
  if (budget.count() <= 0) {
    out.outcome = UpstreamOutcome::kTransportError;
    out.transport_kind = TransportErrorKind::kUnexpected;
    out.cause = "timed out after " + std::to_string(timeout_.count()) + "s";
    return out;
  }

  auto cli = MakeClient(endpoint_, budget, verify_tls_);
  if (!cli->is_valid()) {
    out.outcome = UpstreamOutcome::kTransportError;
    out.transport_kind = TransportErrorKind::kUnexpected;
    out.cause = "unsupported webhook url scheme: " + endpoint_.scheme;
    return out;
  }

  int status = 0;
  bool timed_out = false;
  bool consumer_stopped = false;
  std::string collected;

  httplib::Request req;
  req.method = "POST";
  req.path = endpoint_.path;
  req.set_header("Content-Type", "application/json");
  req.set_header("Accept", stream ? "text/event-stream, application/json" : "application/json");
  if (!auth_token_.empty()) req.set_header("Authorization", "Bearer " + auth_token_);
  req.body = body;
  req.response_handler = [&](const httplib::Response& response) {
    status = response.status;
    *response_started = true;
    return true;
  };
  req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
    if (Clock::now() >= deadline) {
      timed_out = true;
      return false;
    }
    if (status != 200 || !stream) {
      collected.append(data, len);
      return true;
    }
    if (!on_chunk(data, len)) {
      consumer_stopped = true;
      return false;
    }
    return true;
  };

  httplib::Response res;
  httplib::Error error = httplib::Error::Success;
  bool ok = false;
  bool deadline_fired = false;
  {
    DeadlineWatchdog watchdog(cli.get(), deadline);
    ok = cli->send(req, res, error);
    deadline_fired = watchdog.fired();
  }
  if (status == 0) status = res.status;

  if (consumer_stopped) {
    out.outcome = UpstreamOutcome::kCanceled;
    out.status = status;
    return out;
  }
  if (timed_out || (!ok && (deadline_fired || Clock::now() + kDeadlineSlack >= deadline))) {
    out.outcome = UpstreamOutcome::kTransportError;
    out.transport_kind = TransportErrorKind::kUnexpected;
    out.cause = "timed out after " + std::to_string(timeout_.count()) + "s";
    return out;
  }
  if (!ok) {
    out.outcome = UpstreamOutcome::kTransportError;
    out.transport_kind = ClassifyError(error);
    out.cause = httplib::to_string(error);
    return out;
  }

  out.status = status;
  if (status != 200) {
    out.outcome = UpstreamOutcome::kHttpError;
    out.body = std::move(collected);
    return out;
  }
  if (stream) {
    out.outcome = UpstreamOutcome::kStreamingBody;
    return out;
  }
  out.outcome = UpstreamOutcome::kBufferedBody;
  out.reply = nlohmann::json::parse(collected, nullptr, false);
  out.body = std::move(collected);
  return out;
}

}  // namespace relay
