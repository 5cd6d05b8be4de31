#include "log_util.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <iostream>
#include <string>

namespace relay {
namespace {

constexpr const char* kRedacted = "<redacted>";

// Compared lower-cased; covers both header names and json body keys.
constexpr const char* kSensitiveKeys[] = {
    "authorization", "proxy-authorization", "cookie",     "set-cookie", "api-key",    "api_key",
    "apikey",        "x-api-key",           "x-n8n-api-key", "token",   "auth_token", "access_token",
};

static std::string ToLowerAscii(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool IsSensitiveKey(const std::string& key) {
  const auto k = ToLowerAscii(key);
  for (const char* s : kSensitiveKeys) {
    if (k == s) return true;
  }
  return false;
}

static void MaskSensitive(nlohmann::json& j, int depth) {
  if (depth > 16) return;
  if (j.is_object()) {
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (IsSensitiveKey(it.key())) {
        it.value() = kRedacted;
      } else {
        MaskSensitive(it.value(), depth + 1);
      }
    }
  } else if (j.is_array()) {
    for (auto& v : j) MaskSensitive(v, depth + 1);
  }
}

}  // namespace

std::string RedactHeaderValue(const std::string& key, const std::string& value) {
  return IsSensitiveKey(key) ? kRedacted : value;
}

std::string SanitizeBodyForLog(const std::string& body) {
  if (body.empty()) return {};
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) return body;
  MaskSensitive(j, 0);
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  const size_t suffix_len = std::strlen(kSuffix);
  if (max_chars <= suffix_len) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - suffix_len);
  s += kSuffix;
  return s;
}

void LogRequestRaw(const httplib::Request& req) {
  std::cout << "[request] " << req.method << " " << req.path << " remote=" << req.remote_addr << "\n";
  for (const auto& it : req.headers) {
    std::cout << "  " << it.first << ": " << RedactHeaderValue(it.first, it.second) << "\n";
  }
  if (!req.body.empty()) {
    std::cout << "  body: " << TruncateForLog(SanitizeBodyForLog(req.body), 4000) << "\n";
  }
}

}  // namespace relay
