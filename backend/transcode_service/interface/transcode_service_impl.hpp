#pragma once
#include "application/job_queue.hpp"
#include "application/rendition_catalog.hpp"
#include "domain/authorizer.hpp"
#include "transcode.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <memory>

namespace transcode_service {

// Failures are reported in-band (success=false, message) like every other
// service of the platform; grpc::Status is reserved for transport problems.
class TranscodeServiceImpl final : public transcode::TranscodeService::Service {
public:
  TranscodeServiceImpl(std::shared_ptr<JobQueue> queue,
                       std::shared_ptr<RenditionCatalog> catalog,
                       std::shared_ptr<Authorizer> authorizer);

  grpc::Status Enqueue(grpc::ServerContext* context,
                       const transcode::EnqueueRequest* request,
                       transcode::EnqueueResponse* response) override;

  grpc::Status GetJob(grpc::ServerContext* context,
                      const transcode::GetJobRequest* request,
                      transcode::GetJobResponse* response) override;

  grpc::Status CancelJob(grpc::ServerContext* context,
                         const transcode::CancelJobRequest* request,
                         transcode::CancelJobResponse* response) override;

  grpc::Status ListRenditions(grpc::ServerContext* context,
                              const transcode::ListRenditionsRequest* request,
                              transcode::ListRenditionsResponse* response) override;

private:
  std::shared_ptr<JobQueue> queue_;
  std::shared_ptr<RenditionCatalog> catalog_;
  std::shared_ptr<Authorizer> authorizer_;
};

} // namespace transcode_service
