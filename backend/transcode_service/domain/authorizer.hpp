#pragma once
#include <cstdint>
#include <string>

namespace transcode_service {

// Capability check answered by the user service. The token state machine
// lives there; this side trusts the boolean.
class Authorizer {
public:
  virtual ~Authorizer() = default;
  virtual bool isAuthorized(const std::string& caller_token, int64_t video_id) = 0;
};

// auth.mode = "disabled"
class AllowAllAuthorizer final : public Authorizer {
public:
  bool isAuthorized(const std::string&, int64_t) override { return true; }
};

} // namespace transcode_service
