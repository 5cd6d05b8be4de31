#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace relay {

inline constexpr const char* kWebhookUrlPlaceholder = "YOUR_N8N_WEBHOOK_URL";
inline constexpr const char* kAuthTokenPlaceholder = "YOUR_N8N_WEBHOOK_AUTH_TOKEN";

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 80;
  std::string path = "/";

  std::string SchemeHostPort() const;
};

// Immutable snapshot resolved once at startup and handed to every component.
struct Settings {
  std::string webhook_url = kWebhookUrlPlaceholder;
  std::string auth_token;
  std::string model_name = "n8n-agent";
  std::string model_description = "n8n Webhook Agent for AI interactions";
  std::chrono::seconds timeout{120};
  // Extra attempts for connection failures before any response arrived.
  int max_retries = 3;
  double default_temperature = 0.7;
  int default_max_tokens = 2048;
  double default_top_p = 1.0;
  bool debug = false;
  // Off only for trusted-network webhooks with self-signed certificates.
  bool verify_tls = true;
  HttpListenConfig listen;
  std::string api_prefix_mode = "auto";

  bool IsConfigured() const;
  HttpEndpoint WebhookEndpoint() const;
  std::vector<std::string> RoutePrefixes() const;
};

Settings LoadSettingsFromEnv();

HttpEndpoint ParseHttpEndpoint(const std::string& url);

}  // namespace relay
