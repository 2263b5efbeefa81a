#pragma once
#include "domain/authorizer.hpp"
#include "common/config/config.hpp"
#include "auth.grpc.pb.h"

#include <grpcpp/grpcpp.h>
#include <memory>

namespace transcode_service {

// Asks the user service over gRPC. Any RPC failure denies access.
class GrpcAuthorizer final : public Authorizer {
public:
  explicit GrpcAuthorizer(const config::AuthConfig& cfg);

  bool isAuthorized(const std::string& caller_token, int64_t video_id) override;

private:
  std::unique_ptr<auth::AuthService::Stub> stub_;
  std::chrono::milliseconds timeout_;
};

} // namespace transcode_service
