#include "chat_request.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace relay {
namespace {

static bool IsAbsent(const nlohmann::json& j, const char* key) {
  return !j.contains(key) || j[key].is_null();
}

static bool ReadNumber(const nlohmann::json& j, const char* key, double* out, std::string* err) {
  if (IsAbsent(j, key)) return true;
  if (!j[key].is_number()) {
    if (err) *err = std::string("invalid field: ") + key;
    return false;
  }
  *out = j[key].get<double>();
  return true;
}

// Whole numbers only, checked against the int range before any narrowing.
static bool ReadInt(const nlohmann::json& v, int* out) {
  if (v.is_number_unsigned()) {
    const auto u = v.get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int>::max())) return false;
    *out = static_cast<int>(u);
    return true;
  }
  if (v.is_number_integer()) {
    const auto i = v.get<int64_t>();
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) return false;
    *out = static_cast<int>(i);
    return true;
  }
  if (v.is_number_float()) {
    const double d = v.get<double>();
    if (!std::isfinite(d) || d != std::floor(d)) return false;
    if (d < static_cast<double>(std::numeric_limits<int>::min()) ||
        d > static_cast<double>(std::numeric_limits<int>::max())) {
      return false;
    }
    *out = static_cast<int>(d);
    return true;
  }
  return false;
}

}  // namespace

std::optional<ChatRequest> ParseChatRequest(const nlohmann::json& body, const Settings& settings, std::string* err) {
  if (!body.is_object()) {
    if (err) *err = "request body must be a json object";
    return std::nullopt;
  }

  ChatRequest out;
  out.model = settings.model_name;
  out.temperature = settings.default_temperature;
  out.max_tokens = settings.default_max_tokens;
  out.top_p = settings.default_top_p;

  if (!IsAbsent(body, "model")) {
    if (!body["model"].is_string()) {
      if (err) *err = "invalid field: model";
      return std::nullopt;
    }
    out.model = body["model"].get<std::string>();
  }

  if (!body.contains("messages") || !body["messages"].is_array()) {
    if (err) *err = "missing field: messages";
    return std::nullopt;
  }
  for (const auto& m : body["messages"]) {
    if (!m.is_object()) {
      if (err) *err = "invalid field: messages";
      return std::nullopt;
    }
  }
  out.messages = body["messages"];

  if (!IsAbsent(body, "stream")) {
    if (!body["stream"].is_boolean()) {
      if (err) *err = "invalid field: stream";
      return std::nullopt;
    }
    out.stream = body["stream"].get<bool>();
  }

  if (!IsAbsent(body, "max_tokens")) {
    int max_tokens = 0;
    if (!ReadInt(body["max_tokens"], &max_tokens)) {
      if (err) *err = "invalid field: max_tokens";
      return std::nullopt;
    }
    out.max_tokens = max_tokens;
  }

  if (!ReadNumber(body, "temperature", &out.temperature, err)) return std::nullopt;
  if (!ReadNumber(body, "top_p", &out.top_p, err)) return std::nullopt;
  if (!ReadNumber(body, "frequency_penalty", &out.frequency_penalty, err)) return std::nullopt;
  if (!ReadNumber(body, "presence_penalty", &out.presence_penalty, err)) return std::nullopt;

  if (!IsAbsent(body, "user")) {
    if (!body["user"].is_string()) {
      if (err) *err = "invalid field: user";
      return std::nullopt;
    }
    out.user = body["user"].get<std::string>();
  }
  return out;
}

nlohmann::json BuildUpstreamEnvelope(const ChatRequest& req, const CallerIdentity& identity) {
  nlohmann::json j;
  j["model"] = req.model;
  j["messages"] = req.messages;
  j["stream"] = req.stream;
  j["temperature"] = req.temperature;
  j["max_tokens"] = req.max_tokens;
  j["top_p"] = req.top_p;
  j["frequency_penalty"] = req.frequency_penalty;
  j["presence_penalty"] = req.presence_penalty;
  j["user"] = IdentityToJson(identity);
  return j;
}

}  // namespace relay
