#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace relay {

struct CallerIdentity {
  std::string id;
  std::string name;
  std::string email;
  std::string role;
};

nlohmann::json IdentityToJson(const CallerIdentity& identity);

class IIdentityProvider {
 public:
  virtual ~IIdentityProvider() = default;

  virtual std::optional<CallerIdentity> Identify(const httplib::Request& req, std::string* err) const = 0;
};

// Trusts the caller headers set by the authenticating gateway in front of the relay.
class HeaderIdentityProvider : public IIdentityProvider {
 public:
  std::optional<CallerIdentity> Identify(const httplib::Request& req, std::string* err) const override;
};

}  // namespace relay
