#include "config.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace relay {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string Trim(std::string s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r' || s.front() == '\n')) {
    s.erase(s.begin());
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
  return s;
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(Trim(s));
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static bool TryParseInt(const std::string& s, long* out) {
  const auto v = Trim(s);
  if (v.empty()) return false;
  char* end = nullptr;
  errno = 0;
  long n = std::strtol(v.c_str(), &end, 10);
  if (errno != 0 || end == v.c_str() || *end != '\0') return false;
  *out = n;
  return true;
}

static bool TryParseDouble(const std::string& s, double* out) {
  const auto v = Trim(s);
  if (v.empty()) return false;
  char* end = nullptr;
  errno = 0;
  double d = std::strtod(v.c_str(), &end);
  if (errno != 0 || end == v.c_str() || *end != '\0') return false;
  *out = d;
  return true;
}

}  // namespace

std::string HttpEndpoint::SchemeHostPort() const {
  return scheme + "://" + host + ":" + std::to_string(port);
}

HttpEndpoint ParseHttpEndpoint(const std::string& url) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = Trim(url);
  if (StartsWith(ToLower(s), "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(ToLower(s), "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find_first_of("/?");
  if (slash_pos != std::string::npos) {
    ep.path = s.substr(slash_pos);
    if (ep.path.front() == '?') ep.path.insert(ep.path.begin(), '/');
    s = s.substr(0, slash_pos);
  }

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos && s.find(']', colon_pos) == std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.path.empty()) ep.path = "/";
  if (ep.port <= 0) ep.port = ep.scheme == "https" ? 443 : 80;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

bool Settings::IsConfigured() const {
  return !webhook_url.empty() && webhook_url != kWebhookUrlPlaceholder;
}

HttpEndpoint Settings::WebhookEndpoint() const {
  return ParseHttpEndpoint(webhook_url);
}

std::vector<std::string> Settings::RoutePrefixes() const {
  const auto mode = ToLower(api_prefix_mode);
  if (mode == "root" || mode == "none" || mode == "off") return {""};
  if (mode == "n8n") return {"/n8n"};
  return {"", "/n8n"};
}

Settings LoadSettingsFromEnv() {
  Settings cfg;

  if (auto url = Trim(GetEnvStr("N8N_WEBHOOK_URL")); !url.empty()) cfg.webhook_url = url;
  if (auto token = Trim(GetEnvStr("N8N_WEBHOOK_AUTH_TOKEN")); !token.empty() && token != kAuthTokenPlaceholder) {
    cfg.auth_token = token;
  }
  if (auto name = Trim(GetEnvStr("N8N_MODEL_NAME")); !name.empty()) cfg.model_name = name;
  if (auto desc = GetEnvStr("N8N_MODEL_DESCRIPTION"); !desc.empty()) cfg.model_description = desc;

  long n = 0;
  if (TryParseInt(GetEnvStr("N8N_TIMEOUT"), &n) && n > 0) cfg.timeout = std::chrono::seconds(n);
  if (TryParseInt(GetEnvStr("N8N_MAX_RETRIES"), &n) && n >= 0 && n <= 100) cfg.max_retries = static_cast<int>(n);
  if (TryParseInt(GetEnvStr("N8N_DEFAULT_MAX_TOKENS"), &n) && n > 0 && n <= INT32_MAX) {
    cfg.default_max_tokens = static_cast<int>(n);
  }

  double d = 0;
  if (TryParseDouble(GetEnvStr("N8N_DEFAULT_TEMPERATURE"), &d)) cfg.default_temperature = d;
  if (TryParseDouble(GetEnvStr("N8N_DEFAULT_TOP_P"), &d)) cfg.default_top_p = d;

  bool b = false;
  if (TryParseBool(GetEnvStr("N8N_DEBUG"), &b)) cfg.debug = b;
  if (TryParseBool(GetEnvStr("N8N_TLS_VERIFY"), &b)) cfg.verify_tls = b;

  if (auto host = Trim(GetEnvStr("RELAY_LISTEN_HOST")); !host.empty()) cfg.listen.host = host;
  if (TryParseInt(GetEnvStr("RELAY_LISTEN_PORT"), &n) && n > 0 && n <= 65535) cfg.listen.port = static_cast<int>(n);
  if (auto mode = Trim(GetEnvStr("RELAY_API_PREFIX_MODE")); !mode.empty()) cfg.api_prefix_mode = mode;

  return cfg;
}

}  // namespace relay
