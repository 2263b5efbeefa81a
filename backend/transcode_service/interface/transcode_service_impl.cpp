#include "transcode_service_impl.hpp"

namespace transcode_service {

namespace {

void fillJob(const Job& job, transcode::Job* out) {
  out->set_id(job.id);
  out->set_video_id(job.video_id);
  out->set_profile(job.profile);
  out->set_overwrite(job.overwrite);
  out->set_status(std::string(toString(job.status)));
  out->set_attempts(job.attempts);
  out->set_last_error(job.last_error);
  out->set_created_at_ms(toEpochMillis(job.created_at));
  out->set_started_at_ms(toEpochMillis(job.started_at));
  out->set_finished_at_ms(toEpochMillis(job.finished_at));
}

} // namespace

TranscodeServiceImpl::TranscodeServiceImpl(std::shared_ptr<JobQueue> queue,
                                           std::shared_ptr<RenditionCatalog> catalog,
                                           std::shared_ptr<Authorizer> authorizer)
  : queue_(std::move(queue)),
    catalog_(std::move(catalog)),
    authorizer_(std::move(authorizer)) {}

grpc::Status TranscodeServiceImpl::Enqueue(grpc::ServerContext* context,
                                           const transcode::EnqueueRequest* request,
                                           transcode::EnqueueResponse* response) {
  if (!authorizer_->isAuthorized(request->auth_token(), request->video_id())) {
    response->set_success(false);
    response->set_message("unauthorized");
    return grpc::Status::OK;
  }

  std::vector<ProfileEnqueueOutcome> outcomes;
  if (request->profile().empty()) {
    outcomes = queue_->enqueueAll(request->video_id(), request->overwrite());
  } else {
    outcomes.push_back(ProfileEnqueueOutcome{
      request->profile(), queue_->enqueue(request->video_id(), request->profile(), request->overwrite())});
  }

  bool any_accepted = false;
  for (const auto& outcome : outcomes) {
    auto* out = response->add_outcomes();
    out->set_profile(outcome.profile);
    if (outcome.result) {
      any_accepted = true;
      out->set_success(true);
      out->set_job_id(outcome.result->job_id);
      out->set_coalesced(outcome.result->coalesced);
    } else {
      out->set_success(false);
      out->set_error_code(std::string(toString(outcome.result.error().code)));
      out->set_message(outcome.result.error().message);
      response->set_message(outcome.result.error().message);
    }
  }
  response->set_success(any_accepted);
  return grpc::Status::OK;
}

grpc::Status TranscodeServiceImpl::GetJob(grpc::ServerContext* context,
                                          const transcode::GetJobRequest* request,
                                          transcode::GetJobResponse* response) {
  auto job = queue_->status(request->job_id());
  if (!job) {
    response->set_success(false);
    response->set_message(job.error().describe());
    return grpc::Status::OK;
  }
  if (!authorizer_->isAuthorized(request->auth_token(), job->video_id)) {
    response->set_success(false);
    response->set_message("unauthorized");
    return grpc::Status::OK;
  }
  response->set_success(true);
  fillJob(*job, response->mutable_job());
  return grpc::Status::OK;
}

grpc::Status TranscodeServiceImpl::CancelJob(grpc::ServerContext* context,
                                             const transcode::CancelJobRequest* request,
                                             transcode::CancelJobResponse* response) {
  auto job = queue_->status(request->job_id());
  if (!job) {
    response->set_success(false);
    response->set_message(job.error().describe());
    return grpc::Status::OK;
  }
  if (!authorizer_->isAuthorized(request->auth_token(), job->video_id)) {
    response->set_success(false);
    response->set_message("unauthorized");
    return grpc::Status::OK;
  }

  auto cancelled = queue_->cancel(request->job_id());
  if (!cancelled) {
    response->set_success(false);
    response->set_message(cancelled.error().describe());
    return grpc::Status::OK;
  }
  response->set_success(true);
  fillJob(*cancelled, response->mutable_job());
  return grpc::Status::OK;
}

grpc::Status TranscodeServiceImpl::ListRenditions(grpc::ServerContext* context,
                                                  const transcode::ListRenditionsRequest* request,
                                                  transcode::ListRenditionsResponse* response) {
  if (!authorizer_->isAuthorized(request->auth_token(), request->video_id())) {
    response->set_success(false);
    response->set_message("unauthorized");
    return grpc::Status::OK;
  }
  response->set_success(true);
  for (const auto& profile : catalog_->list(request->video_id())) {
    response->add_profiles(profile);
  }
  return grpc::Status::OK;
}

} // namespace transcode_service
