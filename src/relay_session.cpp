#include "relay_session.hpp"

#include "log_util.hpp"
#include "stream_translator.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace relay {

const char* RelayStateName(RelayState state) {
  switch (state) {
    case RelayState::kIdle:
      return "idle";
    case RelayState::kConnecting:
      return "connecting";
    case RelayState::kStreaming:
      return "streaming";
    case RelayState::kBuffering:
      return "buffering";
    case RelayState::kFailed:
      return "failed";
    case RelayState::kClosed:
      return "closed";
  }
  return "unknown";
}

RelaySession::RelaySession(IUpstreamClient* upstream, std::string model)
    : upstream_(upstream), model_(std::move(model)) {}

void RelaySession::Transition(RelayState next) {
  if (next == RelayState::kClosed) terminal_state_ = state_;
  state_ = next;
}

bool RelaySession::WriteFrame(const std::string& frame, const FrameWriter& write) {
  if (client_gone_) return false;
  if (!write(frame)) {
    client_gone_ = true;
    return false;
  }
  frames_written_++;
  return true;
}

bool RelaySession::Run(const nlohmann::json& envelope, const FrameWriter& write) {
  if (state_ != RelayState::kIdle) return false;
  Transition(RelayState::kConnecting);

  LineReframer reframer;
  result_ = upstream_->Send(envelope, [&](const char* data, size_t len) {
    if (state_ == RelayState::kConnecting) Transition(RelayState::kStreaming);
    for (const auto& frame : reframer.Feed(std::string_view(data, len))) {
      if (!WriteFrame(frame, write)) return false;
    }
    return true;
  });

  switch (result_.outcome) {
    case UpstreamOutcome::kStreamingBody:
      if (state_ == RelayState::kConnecting) Transition(RelayState::kStreaming);
      for (const auto& frame : reframer.Finish()) {
        if (!WriteFrame(frame, write)) break;
      }
      break;
    case UpstreamOutcome::kBufferedBody:
      Transition(RelayState::kBuffering);
      break;
    case UpstreamOutcome::kHttpError:
      Transition(RelayState::kFailed);
      std::cout << "[upstream-error] n8n webhook error: " << result_.status << " - "
                << TruncateForLog(result_.body, 2000) << "\n";
      break;
    case UpstreamOutcome::kTransportError:
      Transition(RelayState::kFailed);
      std::cout << "[upstream-error] n8n webhook "
                << (result_.transport_kind == TransportErrorKind::kConnection ? "connection" : "unexpected")
                << " error: " << result_.cause << " attempts=" << result_.attempts << "\n";
      break;
    case UpstreamOutcome::kCanceled:
      std::cout << "[relay] client disconnected, upstream closed model=" << model_ << "\n";
      break;
  }

  for (const auto& frame : TranslateResult(result_, model_)) {
    if (!WriteFrame(frame, write)) break;
  }
  Transition(RelayState::kClosed);
  return !client_gone_;
}

}  // namespace relay
