#include "stream_translator.hpp"

#include <chrono>
#include <cctype>
#include <random>
#include <string>
#include <utility>

namespace relay {
namespace {

constexpr std::string_view kDataPrefix = "data: ";

static int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

static std::string_view TrimWhitespace(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

}  // namespace

std::string SseData(const nlohmann::json& j) {
  // Upstream bodies may carry invalid utf-8; replace rather than throw mid-stream.
  return std::string("data: ") + j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n\n";
}

std::string SseErrorFrame(const std::string& message) {
  nlohmann::json j;
  j["error"] = message;
  return SseData(j);
}

std::string FrameUpstreamLine(std::string_view line) {
  const auto text = TrimWhitespace(line);
  if (text.empty()) return {};
  if (text.substr(0, kDataPrefix.size()) == kDataPrefix) return std::string(text) + "\n\n";
  return std::string(kDataPrefix) + std::string(text) + "\n\n";
}

std::vector<std::string> LineReframer::Feed(std::string_view bytes) {
  std::vector<std::string> out;
  pending_.append(bytes.data(), bytes.size());
  size_t start = 0;
  size_t nl;
  while ((nl = pending_.find('\n', start)) != std::string::npos) {
    auto frame = FrameUpstreamLine(std::string_view(pending_).substr(start, nl - start));
    if (!frame.empty()) out.push_back(std::move(frame));
    start = nl + 1;
  }
  pending_.erase(0, start);
  return out;
}

std::vector<std::string> LineReframer::Finish() {
  std::vector<std::string> out;
  auto frame = FrameUpstreamLine(pending_);
  pending_.clear();
  if (!frame.empty()) out.push_back(std::move(frame));
  return out;
}

nlohmann::json ExtractCompletionContent(const nlohmann::json& reply) {
  if (reply.is_object()) {
    if (reply.contains("content")) return reply["content"];
    if (reply.contains("response")) return reply["response"];
  }
  if (reply.is_string()) return reply;
  return reply.dump();
}

std::string NewCompletionId() {
  static thread_local std::mt19937 rng{std::random_device{}()};
  constexpr const char* kHex = "0123456789abcdef";
  std::uniform_int_distribution<int> dist(0, 15);
  std::string id = "chatcmpl-";
  for (int i = 0; i < 8; i++) id.push_back(kHex[dist(rng)]);
  return id;
}

nlohmann::json BuildChatCompletion(const nlohmann::json& content,
                                   const std::string& model,
                                   const std::string& id,
                                   int64_t created) {
  nlohmann::json out;
  out["id"] = id;
  out["object"] = "chat.completion";
  out["created"] = created;
  out["model"] = model;
  nlohmann::json choice;
  choice["index"] = 0;
  choice["message"] = {{"role", "assistant"}, {"content", content}};
  choice["finish_reason"] = "stop";
  out["choices"] = nlohmann::json::array({choice});
  out["usage"] = {{"prompt_tokens", 0}, {"completion_tokens", 0}, {"total_tokens", 0}};
  return out;
}

std::string UpstreamErrorMessage(const UpstreamResult& result) {
  switch (result.outcome) {
    case UpstreamOutcome::kHttpError:
      return "n8n webhook error: " + result.body;
    case UpstreamOutcome::kTransportError:
      if (result.transport_kind == TransportErrorKind::kConnection) return "Connection error: " + result.cause;
      return "Unexpected error: " + result.cause;
    default:
      return {};
  }
}

std::vector<std::string> TranslateResult(const UpstreamResult& result, const std::string& model) {
  switch (result.outcome) {
    case UpstreamOutcome::kHttpError:
    case UpstreamOutcome::kTransportError:
      return {SseErrorFrame(UpstreamErrorMessage(result))};
    case UpstreamOutcome::kBufferedBody: {
      const nlohmann::json reply = result.reply.is_discarded() ? nlohmann::json(result.body) : result.reply;
      auto completion = BuildChatCompletion(ExtractCompletionContent(reply), model, NewCompletionId(), NowSeconds());
      return {SseData(completion), kSseDone};
    }
    case UpstreamOutcome::kStreamingBody:
    case UpstreamOutcome::kCanceled:
      break;
  }
  return {};
}

}  // namespace relay
