#pragma once

#include "upstream_client.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <string>

namespace relay {

enum class RelayState {
  kIdle,
  kConnecting,
  kStreaming,
  kBuffering,
  kFailed,
  kClosed,
};

const char* RelayStateName(RelayState state);

// Writes one SSE frame downstream; false once the client is gone.
using FrameWriter = std::function<bool(const std::string& frame)>;

// Drives one upstream exchange and relays its translated frames in order.
// A session is single-use.
class RelaySession {
 public:
  RelaySession(IUpstreamClient* upstream, std::string model);

  // Returns true when every produced frame reached the client.
  bool Run(const nlohmann::json& envelope, const FrameWriter& write);

  RelayState state() const { return state_; }
  RelayState terminal_state() const { return terminal_state_; }
  size_t frames_written() const { return frames_written_; }
  const UpstreamResult& result() const { return result_; }

 private:
  void Transition(RelayState next);
  bool WriteFrame(const std::string& frame, const FrameWriter& write);

  IUpstreamClient* upstream_;
  std::string model_;
  RelayState state_ = RelayState::kIdle;
  // Last state before kClosed.
  RelayState terminal_state_ = RelayState::kIdle;
  size_t frames_written_ = 0;
  bool client_gone_ = false;
  UpstreamResult result_;
};

}  // namespace relay
