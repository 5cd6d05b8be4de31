#pragma once

#include "config.hpp"
#include "identity.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace relay {

struct ChatRequest {
  std::string model;
  // Messages are forwarded verbatim, extra fields included.
  nlohmann::json messages = nlohmann::json::array();
  bool stream = false;
  double temperature = 0.0;
  int max_tokens = 0;
  double top_p = 0.0;
  double frequency_penalty = 0.0;
  double presence_penalty = 0.0;
  std::optional<std::string> user;
};

std::optional<ChatRequest> ParseChatRequest(const nlohmann::json& body, const Settings& settings, std::string* err);

// The caller identity replaces any client-supplied "user" tag.
nlohmann::json BuildUpstreamEnvelope(const ChatRequest& req, const CallerIdentity& identity);

}  // namespace relay
