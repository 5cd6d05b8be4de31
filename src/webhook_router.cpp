#include "webhook_router.hpp"

#include "chat_request.hpp"
#include "log_util.hpp"
#include "relay_session.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace relay {
namespace {

static int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

static bool IsAsciiAlpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static nlohmann::json MakeError(const std::string& message, const std::string& type) {
  nlohmann::json j;
  j["error"] = {{"message", message}, {"type", type}, {"param", nullptr}, {"code", nullptr}};
  return j;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(), "application/json");
}

static nlohmann::json ParseJsonBody(const httplib::Request& req) {
  return nlohmann::json::parse(req.body, nullptr, false);
}

static std::string WebhookForLog(const HttpEndpoint& ep) {
  auto path = ep.path;
  auto q = path.find('?');
  if (q != std::string::npos) path = path.substr(0, q) + "?<redacted>";
  return ep.SchemeHostPort() + path;
}

}  // namespace

std::string DisplayNameForModel(const std::string& model) {
  std::string out;
  out.reserve(model.size());
  bool prev_alpha = false;
  for (char c : model) {
    if (c == '-') c = ' ';
    if (IsAsciiAlpha(c)) {
      if (prev_alpha) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
      } else if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
      }
      prev_alpha = true;
    } else {
      prev_alpha = false;
    }
    out.push_back(c);
  }
  return out;
}

WebhookRouter::WebhookRouter(const Settings& settings, const IIdentityProvider* identity, IUpstreamClient* upstream)
    : settings_(settings), identity_(identity), upstream_(upstream) {}

void WebhookRouter::Register(httplib::Server* server) {
  auto identify = [this](const httplib::Request& req, httplib::Response& res) -> std::optional<CallerIdentity> {
    if (settings_.debug) LogRequestRaw(req);
    std::string err;
    auto identity = identity_ ? identity_->Identify(req, &err) : std::nullopt;
    if (!identity) {
      SendJson(&res, 401, MakeError(err.empty() ? "not authenticated" : err, "authentication_error"));
      return std::nullopt;
    }
    return identity;
  };

  auto models_handler = [this, identify](const httplib::Request& req, httplib::Response& res) {
    if (!identify(req, res)) return;
    nlohmann::json item;
    item["id"] = settings_.model_name;
    item["object"] = "model";
    item["created"] = NowSeconds();
    item["owned_by"] = "n8n";
    item["permission"] = nlohmann::json::array();
    item["root"] = settings_.model_name;
    item["parent"] = nullptr;
    item["name"] = DisplayNameForModel(settings_.model_name);
    item["description"] = settings_.model_description;
    nlohmann::json out;
    out["object"] = "list";
    out["data"] = nlohmann::json::array({item});
    SendJson(&res, 200, out);
  };

  auto embeddings_handler = [this, identify](const httplib::Request& req, httplib::Response& res) {
    auto identity = identify(req, res);
    if (!identity) return;
    std::cout << "[embeddings] user=" << identity->email << "\n";
    auto j = ParseJsonBody(req);
    if (j.is_discarded()) return SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));

    nlohmann::json item;
    item["object"] = "embedding";
    item["embedding"] = nlohmann::json::array();
    for (size_t i = 0; i < kPlaceholderEmbeddingSize; i++) item["embedding"].push_back(0.0);
    item["index"] = 0;
    nlohmann::json out;
    out["object"] = "list";
    out["data"] = nlohmann::json::array({item});
    out["model"] = settings_.model_name;
    out["usage"] = {{"prompt_tokens", 0}, {"total_tokens", 0}};
    SendJson(&res, 200, out);
  };

  auto status_handler = [this, identify](const httplib::Request& req, httplib::Response& res) {
    if (!identify(req, res)) return;
    const bool configured = settings_.IsConfigured();
    nlohmann::json out;
    out["status"] = configured ? "ready" : "not_configured";
    out["configured"] = configured;
    out["model"] = settings_.model_name;
    out["description"] = settings_.model_description;
    SendJson(&res, 200, out);
  };

  auto chat_completions_handler = [this, identify](const httplib::Request& req, httplib::Response& res) {
    auto identity = identify(req, res);
    if (!identity) return;
    std::cout << "[chat] request user=" << identity->email << "\n";

    if (!settings_.IsConfigured()) {
      std::cout << "[chat] rejected user=" << identity->email << " reason=not_configured\n";
      return SendJson(&res, 500, MakeError(kNotConfiguredMessage, "server_error"));
    }

    auto j = ParseJsonBody(req);
    if (j.is_discarded()) return SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));
    std::string err;
    auto chat = ParseChatRequest(j, settings_, &err);
    if (!chat) return SendJson(&res, 400, MakeError(err, "invalid_request_error"));

    auto envelope = BuildUpstreamEnvelope(*chat, *identity);
    if (settings_.debug) {
      std::cout << "[chat-debug] webhook=" << WebhookForLog(settings_.WebhookEndpoint()) << " model=" << chat->model
                << " stream=" << (chat->stream ? 1 : 0) << " messages=" << chat->messages.size()
                << " temperature=" << chat->temperature << " max_tokens=" << chat->max_tokens
                << " top_p=" << chat->top_p << " auth=" << (settings_.auth_token.empty() ? "none" : "<redacted>")
                << "\n";
      std::cout << "[chat-debug] envelope=" << TruncateForLog(SanitizeBodyForLog(envelope.dump()), 4000) << "\n";
    }

    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");
    res.set_chunked_content_provider(
        "text/event-stream",
        [this, email = identity->email, model = chat->model, envelope = std::move(envelope)](
            size_t, httplib::DataSink& sink) {
          auto write_bytes = [&](const std::string& s) -> bool {
            if (sink.is_writable && !sink.is_writable()) return false;
            if (!sink.write) return false;
            return sink.write(s.data(), s.size());
          };
          RelaySession session(upstream_, model);
          try {
            const bool delivered = session.Run(envelope, write_bytes);
            std::cout << "[chat] done user=" << email << " model=" << model
                      << " outcome=" << RelayStateName(session.terminal_state())
                      << " frames=" << session.frames_written() << " delivered=" << (delivered ? 1 : 0) << "\n";
          } catch (const std::exception& e) {
            std::cout << "[relay-error] user=" << email << " state=" << RelayStateName(session.state())
                      << " error=" << e.what() << "\n";
          }
          sink.done();
          return true;
        });
  };

  for (const auto& prefix : settings_.RoutePrefixes()) {
    server->Get(prefix + "/models", models_handler);
    server->Post(prefix + "/chat/completions", chat_completions_handler);
    server->Post(prefix + "/embeddings", embeddings_handler);
    server->Get(prefix + "/", status_handler);
    if (!prefix.empty()) server->Get(prefix, status_handler);
  }
}

}  // namespace relay
