#include "grpc_authorizer.hpp"
#include <iostream>

namespace transcode_service {

GrpcAuthorizer::GrpcAuthorizer(const config::AuthConfig& cfg) : timeout_(cfg.timeout) {
  auto channel = grpc::CreateChannel(cfg.user_service, grpc::InsecureChannelCredentials());
  stub_ = auth::AuthService::NewStub(channel);
}

bool GrpcAuthorizer::isAuthorized(const std::string& caller_token, int64_t video_id) {
  if (caller_token.empty()) {
    return false;
  }

  auth::CheckVideoAccessRequest request;
  request.set_auth_token(caller_token);
  request.set_video_id(video_id);

  auth::CheckVideoAccessResponse response;
  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout_);

  grpc::Status status = stub_->CheckVideoAccess(&context, request, &response);
  if (!status.ok()) {
    std::cerr << "[GrpcAuthorizer] CheckVideoAccess failed: " << status.error_message() << std::endl;
    return false;
  }
  return response.success() && response.allowed();
}

} // namespace transcode_service
