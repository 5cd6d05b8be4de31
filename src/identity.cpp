#include "identity.hpp"

#include <string>

namespace relay {
namespace {

static std::string TrimAscii(std::string s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.pop_back();
  return s;
}

}  // namespace

nlohmann::json IdentityToJson(const CallerIdentity& identity) {
  return {{"id", identity.id}, {"name", identity.name}, {"email", identity.email}, {"role", identity.role}};
}

std::optional<CallerIdentity> HeaderIdentityProvider::Identify(const httplib::Request& req, std::string* err) const {
  CallerIdentity out;
  out.id = TrimAscii(req.get_header_value("X-User-Id"));
  out.name = TrimAscii(req.get_header_value("X-User-Name"));
  out.email = TrimAscii(req.get_header_value("X-User-Email"));
  out.role = TrimAscii(req.get_header_value("X-User-Role"));
  if (out.id.empty() || out.email.empty()) {
    if (err) *err = "missing caller identity";
    return std::nullopt;
  }
  if (out.role.empty()) out.role = "user";
  return out;
}

}  // namespace relay
