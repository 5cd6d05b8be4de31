#pragma once

#include "config.hpp"
#include "identity.hpp"
#include "upstream_client.hpp"

#include <httplib.h>

#include <cstddef>
#include <string>

namespace relay {

inline constexpr const char* kNotConfiguredMessage =
    "n8n webhook URL not configured. Please set the N8N_WEBHOOK_URL.";
inline constexpr size_t kPlaceholderEmbeddingSize = 1536;

// "n8n-agent" -> "N8N Agent".
std::string DisplayNameForModel(const std::string& model);

class WebhookRouter {
 public:
  WebhookRouter(const Settings& settings, const IIdentityProvider* identity, IUpstreamClient* upstream);
  void Register(httplib::Server* server);

 private:
  const Settings& settings_;
  const IIdentityProvider* identity_;
  IUpstreamClient* upstream_;
};

}  // namespace relay
