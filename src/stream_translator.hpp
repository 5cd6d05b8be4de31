#pragma once

#include "upstream_client.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace relay {

inline constexpr const char* kSseDone = "data: [DONE]\n\n";

std::string SseData(const nlohmann::json& j);
std::string SseErrorFrame(const std::string& message);

// Frames one upstream line. Returns an empty string for blank lines.
std::string FrameUpstreamLine(std::string_view line);

// Splits raw upstream bytes into lines and frames each complete one.
class LineReframer {
 public:
  std::vector<std::string> Feed(std::string_view bytes);
  // Frames a trailing line that had no newline.
  std::vector<std::string> Finish();

 private:
  std::string pending_;
};

// "content" if present, else "response", else the whole reply serialized.
nlohmann::json ExtractCompletionContent(const nlohmann::json& reply);

std::string NewCompletionId();

nlohmann::json BuildChatCompletion(const nlohmann::json& content,
                                   const std::string& model,
                                   const std::string& id,
                                   int64_t created);

std::string UpstreamErrorMessage(const UpstreamResult& result);

// Frames that close out a non-streaming exchange: a completion and [DONE] for
// buffered replies, a single error frame for failures, nothing otherwise.
std::vector<std::string> TranslateResult(const UpstreamResult& result, const std::string& model);

}  // namespace relay
