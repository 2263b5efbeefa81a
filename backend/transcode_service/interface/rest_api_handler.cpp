#include "rest_api_handler.hpp"

#include <charconv>
#include <format>

namespace transcode_service {

namespace {

std::optional<int64_t> parseVideoId(std::string_view text) {
  int64_t id = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
  if (ec != std::errc() || ptr != text.data() + text.size() || id <= 0) {
    return std::nullopt;
  }
  return id;
}

} // namespace

http::status httpStatusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::Conflict: return http::status::conflict;
    case ErrorCode::NotFound: return http::status::not_found;
    case ErrorCode::InvalidArgument: return http::status::bad_request;
    case ErrorCode::Unauthorized: return http::status::unauthorized;
    case ErrorCode::RangeNotSatisfiable: return http::status::range_not_satisfiable;
    case ErrorCode::ProfileExceedsSource: return http::status::unprocessable_entity;
    case ErrorCode::Timeout: return http::status::gateway_timeout;
    default: return http::status::internal_server_error;
  }
}

nlohmann::json jobToJson(const Job& job) {
  nlohmann::json json = {
    {"id", job.id},
    {"video_id", job.video_id},
    {"profile", job.profile},
    {"overwrite", job.overwrite},
    {"status", std::string(toString(job.status))},
    {"attempts", job.attempts},
    {"last_error", job.last_error},
    {"created_at_ms", toEpochMillis(job.created_at)},
    {"started_at_ms", toEpochMillis(job.started_at)},
    {"finished_at_ms", toEpochMillis(job.finished_at)}
  };
  return json;
}

RestApiHandler::RestApiHandler(std::shared_ptr<JobQueue> queue,
                               std::shared_ptr<RenditionCatalog> catalog,
                               std::shared_ptr<StreamingService> streaming,
                               std::shared_ptr<Authorizer> authorizer)
  : queue_(std::move(queue)),
    catalog_(std::move(catalog)),
    streaming_(std::move(streaming)),
    authorizer_(std::move(authorizer)) {}

common::Response RestApiHandler::doHandleRequest(common::Request&& req) {
  auto target = common::Target::parse(std::string_view(req.target().data(), req.target().size()));
  const auto& path = target.segments;
  const auto method = req.method();

  if (path.size() == 1 && path[0] == "healthz" && method == http::verb::get) {
    return createJsonResponse(http::status::ok, {{"status", "ok"}});
  }
  if (path.size() < 2 || path[0] != "api") {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }

  if (path.size() == 2 && path[1] == "transcode" && method == http::verb::post) {
    return handleEnqueue(req);
  }
  if (path.size() == 3 && path[1] == "jobs") {
    if (method == http::verb::get) {
      return handleGetJob(req, path[2]);
    }
    if (method == http::verb::delete_) {
      return handleCancelJob(req, path[2]);
    }
    return createErrorResponse(http::status::method_not_allowed, "Method not allowed");
  }
  if (path.size() == 3 && path[1] == "video") {
    if (method != http::verb::delete_) {
      return createErrorResponse(http::status::method_not_allowed, "Method not allowed");
    }
    auto video_id = parseVideoId(path[2]);
    if (!video_id) {
      return createErrorResponse(http::status::bad_request, "Invalid video id: " + path[2]);
    }
    return handleRemoveVideo(req, *video_id);
  }
  if (path.size() >= 4 && path[1] == "video" && method == http::verb::get) {
    auto video_id = parseVideoId(path[2]);
    if (!video_id) {
      return createErrorResponse(http::status::bad_request, "Invalid video id: " + path[2]);
    }
    if (path.size() == 4 && path[3] == "renditions") {
      return handleListRenditions(req, *video_id);
    }
    if (path.size() == 5) {
      if (path[4] == PLAYLIST_FILE_NAME) {
        return handlePlaylist(req, *video_id, path[3]);
      }
      return handleSegment(req, *video_id, path[3], path[4]);
    }
  }
  return createErrorResponse(http::status::not_found, "Endpoint not found");
}

bool RestApiHandler::authorized(const common::Request& req, int64_t video_id) const {
  return authorizer_->isAuthorized(callerToken(req), video_id);
}

common::Response RestApiHandler::errorResponse(const Error& error) {
  nlohmann::json json = {
    {"success", false},
    {"code", std::string(toString(error.code))},
    {"error", error.message}
  };
  return createJsonResponse(httpStatusFor(error.code), json);
}

common::Response RestApiHandler::handleEnqueue(const common::Request& req) {
  nlohmann::json body;
  try {
    body = parseRequestBody(req.body());
  } catch (const std::invalid_argument& e) {
    return createErrorResponse(http::status::bad_request, e.what());
  }
  if (!body.is_object() || !body.contains("video_id") || !body["video_id"].is_number_integer()) {
    return createErrorResponse(http::status::bad_request, "video_id (integer) is required");
  }
  const auto video_id = body["video_id"].get<int64_t>();
  if (body.contains("overwrite") && !body["overwrite"].is_boolean()) {
    return createErrorResponse(http::status::bad_request, "overwrite must be a boolean");
  }
  const bool overwrite = body.value("overwrite", false);
  if (!authorized(req, video_id)) {
    return errorResponse(Error::unauthorized("Not allowed to transcode this video"));
  }

  nlohmann::json jobs = nlohmann::json::array();
  if (body.contains("profile") && body["profile"].is_string()) {
    auto profile = body["profile"].get<std::string>();
    auto result = queue_->enqueue(video_id, profile, overwrite);
    if (!result) {
      return errorResponse(result.error());
    }
    jobs.push_back({{"profile", profile}, {"job_id", result->job_id}, {"coalesced", result->coalesced}});
  } else {
    for (const auto& outcome : queue_->enqueueAll(video_id, overwrite)) {
      if (outcome.result) {
        jobs.push_back({{"profile", outcome.profile},
                        {"job_id", outcome.result->job_id},
                        {"coalesced", outcome.result->coalesced}});
      } else {
        // an unknown video fails every profile the same way
        if (outcome.result.error().code == ErrorCode::NotFound) {
          return errorResponse(outcome.result.error());
        }
        jobs.push_back({{"profile", outcome.profile},
                        {"code", std::string(toString(outcome.result.error().code))},
                        {"error", outcome.result.error().message}});
      }
    }
  }
  return createJsonResponse(http::status::accepted, {{"success", true}, {"video_id", video_id}, {"jobs", jobs}});
}

common::Response RestApiHandler::handleGetJob(const common::Request& req, const std::string& job_id) {
  auto job = queue_->status(job_id);
  if (!job) {
    return errorResponse(job.error());
  }
  if (!authorized(req, job->video_id)) {
    return errorResponse(Error::unauthorized("Not allowed to read this job"));
  }
  return createJsonResponse(http::status::ok, {{"success", true}, {"job", jobToJson(*job)}});
}

common::Response RestApiHandler::handleCancelJob(const common::Request& req, const std::string& job_id) {
  auto job = queue_->status(job_id);
  if (!job) {
    return errorResponse(job.error());
  }
  if (!authorized(req, job->video_id)) {
    return errorResponse(Error::unauthorized("Not allowed to cancel this job"));
  }
  auto cancelled = queue_->cancel(job_id);
  if (!cancelled) {
    return errorResponse(cancelled.error());
  }
  return createJsonResponse(http::status::ok, {{"success", true}, {"job", jobToJson(*cancelled)}});
}

common::Response RestApiHandler::handleRemoveVideo(const common::Request& req, int64_t video_id) {
  if (!authorized(req, video_id)) {
    return errorResponse(Error::unauthorized("Not allowed to remove this video"));
  }
  auto cancelled = queue_->removeVideo(video_id);
  if (!cancelled) {
    return errorResponse(cancelled.error());
  }
  return createJsonResponse(http::status::ok, {
    {"success", true},
    {"video_id", video_id},
    {"cancelled_jobs", *cancelled}
  });
}

common::Response RestApiHandler::handleListRenditions(const common::Request& req, int64_t video_id) {
  if (!authorized(req, video_id)) {
    return errorResponse(Error::unauthorized("Not allowed to read this video"));
  }
  return createJsonResponse(http::status::ok, {
    {"success", true},
    {"video_id", video_id},
    {"profiles", catalog_->list(video_id)}
  });
}

common::Response RestApiHandler::handlePlaylist(const common::Request& req, int64_t video_id,
                                                const std::string& profile) {
  if (!authorized(req, video_id)) {
    return errorResponse(Error::unauthorized("Not allowed to stream this video"));
  }
  auto playlist = streaming_->getPlaylist(video_id, profile);
  if (!playlist) {
    return errorResponse(playlist.error());
  }
  auto res = createBodyResponse(http::status::ok, std::move(playlist->body), playlist->content_type);
  res.set(http::field::cache_control, "no-cache");
  return res;
}

common::Response RestApiHandler::handleSegment(const common::Request& req, int64_t video_id,
                                               const std::string& profile, const std::string& segment) {
  if (!authorized(req, video_id)) {
    return errorResponse(Error::unauthorized("Not allowed to stream this video"));
  }

  std::string_view range;
  if (auto it = req.find(http::field::range); it != req.end()) {
    range = std::string_view(it->value().data(), it->value().size());
  }

  auto payload = streaming_->getSegment(video_id, profile, segment, range);
  if (!payload) {
    auto res = errorResponse(payload.error());
    if (payload.error().code == ErrorCode::RangeNotSatisfiable) {
      // the message carries the "bytes */<size>" value
      res.set(http::field::content_range, payload.error().message);
    }
    return res;
  }

  const auto length = payload->body.size();
  auto res = createBodyResponse(payload->partial ? http::status::partial_content : http::status::ok,
                                std::move(payload->body), payload->content_type);
  res.set(http::field::accept_ranges, "bytes");
  if (payload->partial) {
    res.set(http::field::content_range, std::format("bytes {}-{}/{}",
      payload->offset, payload->offset + length - 1, payload->total_size));
  }
  return res;
}

} // namespace transcode_service
