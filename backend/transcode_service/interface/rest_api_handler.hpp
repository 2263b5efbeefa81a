#pragma once
#include "application/job_queue.hpp"
#include "application/rendition_catalog.hpp"
#include "application/streaming_service.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include "domain/authorizer.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace transcode_service {

http::status httpStatusFor(ErrorCode code);
nlohmann::json jobToJson(const Job& job);

// Routes:
//   POST   /api/transcode                          {video_id, profile?, overwrite?}
//   GET    /api/jobs/{job_id}
//   DELETE /api/jobs/{job_id}
//   DELETE /api/video/{video_id}                   renditions and queued jobs
//   GET    /api/video/{video_id}/renditions
//   GET    /api/video/{video_id}/{profile}/index.m3u8
//   GET    /api/video/{video_id}/{profile}/{segment}   Range aware
//   GET    /healthz
class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<JobQueue> queue,
                 std::shared_ptr<RenditionCatalog> catalog,
                 std::shared_ptr<StreamingService> streaming,
                 std::shared_ptr<Authorizer> authorizer);

protected:
  common::Response doHandleRequest(common::Request&& req) override;

private:
  common::Response handleEnqueue(const common::Request& req);
  common::Response handleGetJob(const common::Request& req, const std::string& job_id);
  common::Response handleCancelJob(const common::Request& req, const std::string& job_id);
  common::Response handleRemoveVideo(const common::Request& req, int64_t video_id);
  common::Response handleListRenditions(const common::Request& req, int64_t video_id);
  common::Response handlePlaylist(const common::Request& req, int64_t video_id, const std::string& profile);
  common::Response handleSegment(const common::Request& req, int64_t video_id,
                                 const std::string& profile, const std::string& segment);

  common::Response errorResponse(const Error& error);
  bool authorized(const common::Request& req, int64_t video_id) const;

  std::shared_ptr<JobQueue> queue_;
  std::shared_ptr<RenditionCatalog> catalog_;
  std::shared_ptr<StreamingService> streaming_;
  std::shared_ptr<Authorizer> authorizer_;
};

} // namespace transcode_service
