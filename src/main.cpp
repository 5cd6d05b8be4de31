#include "config.hpp"
#include "identity.hpp"
#include "upstream_client.hpp"
#include "webhook_router.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <string>

int main() {
  std::cout.setf(std::ios::unitbuf);
  const auto settings = relay::LoadSettingsFromEnv();
  const auto webhook = settings.WebhookEndpoint();

  std::cout << "[relay] configured=" << (settings.IsConfigured() ? "true" : "false") << " model=" << settings.model_name
            << " debug=" << (settings.debug ? "true" : "false") << "\n";
  if (settings.IsConfigured()) {
    std::cout << "[relay] webhook endpoint=" << webhook.SchemeHostPort()
              << " auth=" << (settings.auth_token.empty() ? "none" : "bearer") << "\n";
  } else {
    std::cout << "[relay] " << relay::kNotConfiguredMessage << "\n";
  }
  std::cout << "[relay] timeout_s=" << settings.timeout.count() << " max_retries=" << settings.max_retries
            << " tls_verify=" << (settings.verify_tls ? "true" : "false") << "\n";
  if (!settings.verify_tls) {
    std::cout << "[relay] warning: webhook tls certificate verification disabled (N8N_TLS_VERIFY=false)\n";
  }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
  if (webhook.scheme == "https") {
    std::cout << "[relay] warning: built without tls support, https webhook calls will fail\n";
  }
#endif

  relay::HeaderIdentityProvider identity;
  relay::WebhookClient upstream(settings);
  relay::WebhookRouter router(settings, &identity, &upstream);

  httplib::Server server;
  router.Register(&server);

  server.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    std::cout << "[http] handler exception: " << message << "\n";
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", "server_error"}, {"param", nullptr}, {"code", nullptr}};
    res.status = 500;
    res.set_content(j.dump(), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    std::string type = "invalid_request_error";
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "internal error";
      type = "server_error";
    } else {
      message = "bad request";
    }
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", type}, {"param", nullptr}, {"code", nullptr}};
    res.set_content(j.dump(), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  // Downstream writes of a relayed stream share the upstream deadline.
  server.set_write_timeout(static_cast<time_t>(settings.timeout.count()));

  server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    res.status = 200;
    res.set_content(j.dump(), "application/json");
  });

  std::cout << "[http] listen host=" << settings.listen.host << " port=" << settings.listen.port << "\n";
  const bool ok = server.listen(settings.listen.host, settings.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  return ok ? 0 : 1;
}
