#include "interface/transcode_service_impl.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace transcode_service;

namespace {

class TokenAuthorizer final : public Authorizer {
public:
  bool isAuthorized(const std::string& caller_token, int64_t) override { return caller_token == "good"; }
};

struct GrpcFixture {
  GrpcFixture()
    : pipeline(dir),
      service(pipeline.queue, pipeline.catalog, std::make_shared<TokenAuthorizer>()) {
    pipeline.addVideo(42);
  }

  transcode::EnqueueResponse enqueue(const std::string& token, int64_t video_id,
                                     const std::string& profile = "", bool overwrite = false) {
    grpc::ServerContext context;
    transcode::EnqueueRequest request;
    request.set_auth_token(token);
    request.set_video_id(video_id);
    request.set_profile(profile);
    request.set_overwrite(overwrite);
    transcode::EnqueueResponse response;
    EXPECT_TRUE(service.Enqueue(&context, &request, &response).ok());
    return response;
  }

  transcode::GetJobResponse getJob(const std::string& token, const std::string& job_id) {
    grpc::ServerContext context;
    transcode::GetJobRequest request;
    request.set_auth_token(token);
    request.set_job_id(job_id);
    transcode::GetJobResponse response;
    EXPECT_TRUE(service.GetJob(&context, &request, &response).ok());
    return response;
  }

  transcode::CancelJobResponse cancelJob(const std::string& token, const std::string& job_id) {
    grpc::ServerContext context;
    transcode::CancelJobRequest request;
    request.set_auth_token(token);
    request.set_job_id(job_id);
    transcode::CancelJobResponse response;
    EXPECT_TRUE(service.CancelJob(&context, &request, &response).ok());
    return response;
  }

  transcode::ListRenditionsResponse listRenditions(const std::string& token, int64_t video_id) {
    grpc::ServerContext context;
    transcode::ListRenditionsRequest request;
    request.set_auth_token(token);
    request.set_video_id(video_id);
    transcode::ListRenditionsResponse response;
    EXPECT_TRUE(service.ListRenditions(&context, &request, &response).ok());
    return response;
  }

  test::TempDir dir;
  test::Pipeline pipeline;
  TranscodeServiceImpl service;
};

} // namespace

TEST(TranscodeServiceImplTest, RejectsUnauthorizedCallers) {
  GrpcFixture f;

  auto enqueued = f.enqueue("bad", 42, "480p");
  EXPECT_FALSE(enqueued.success());
  EXPECT_EQ(enqueued.message(), "unauthorized");
  EXPECT_EQ(enqueued.outcomes_size(), 0);
  auto jobs = f.pipeline.queue->jobsForVideo(42);
  ASSERT_TRUE(jobs.has_value());
  EXPECT_TRUE(jobs->empty());

  auto accepted = f.enqueue("good", 42, "480p");
  ASSERT_TRUE(accepted.success());
  const auto job_id = accepted.outcomes(0).job_id();

  auto read = f.getJob("bad", job_id);
  EXPECT_FALSE(read.success());
  EXPECT_EQ(read.message(), "unauthorized");
  EXPECT_FALSE(read.has_job());

  auto cancelled = f.cancelJob("bad", job_id);
  EXPECT_FALSE(cancelled.success());
  auto still_queued = f.pipeline.queue->status(job_id);
  ASSERT_TRUE(still_queued.has_value());
  EXPECT_EQ(still_queued->status, JobStatus::Queued);

  auto listed = f.listRenditions("bad", 42);
  EXPECT_FALSE(listed.success());
  EXPECT_EQ(listed.profiles_size(), 0);
}

TEST(TranscodeServiceImplTest, EnqueueReportsEveryProfile) {
  GrpcFixture f;
  auto response = f.enqueue("good", 42);
  ASSERT_TRUE(response.success());
  ASSERT_EQ(response.outcomes_size(), static_cast<int>(f.pipeline.profiles.size()));

  std::vector<std::string> names;
  for (const auto& outcome : response.outcomes()) {
    EXPECT_TRUE(outcome.success()) << outcome.profile();
    EXPECT_FALSE(outcome.job_id().empty());
    EXPECT_FALSE(outcome.coalesced());
    names.push_back(outcome.profile());
  }
  EXPECT_EQ(names.front(), f.pipeline.profiles.all().front().name);

  // a second request coalesces into the queued jobs
  auto again = f.enqueue("good", 42);
  ASSERT_TRUE(again.success());
  for (int i = 0; i < again.outcomes_size(); ++i) {
    EXPECT_TRUE(again.outcomes(i).coalesced());
    EXPECT_EQ(again.outcomes(i).job_id(), response.outcomes(i).job_id());
  }
}

TEST(TranscodeServiceImplTest, EnqueueMapsFailuresInBand) {
  GrpcFixture f;

  auto unknown_profile = f.enqueue("good", 42, "4k");
  EXPECT_FALSE(unknown_profile.success());
  ASSERT_EQ(unknown_profile.outcomes_size(), 1);
  EXPECT_FALSE(unknown_profile.outcomes(0).success());
  EXPECT_EQ(unknown_profile.outcomes(0).error_code(), toString(ErrorCode::InvalidArgument));

  auto unknown_video = f.enqueue("good", 7, "480p");
  EXPECT_FALSE(unknown_video.success());
  ASSERT_EQ(unknown_video.outcomes_size(), 1);
  EXPECT_EQ(unknown_video.outcomes(0).error_code(), toString(ErrorCode::NotFound));
  EXPECT_FALSE(unknown_video.message().empty());
}

TEST(TranscodeServiceImplTest, EnqueueMapsConflictAfterSuccess) {
  GrpcFixture f;
  ASSERT_TRUE(f.pipeline.queue->start().has_value());
  auto first = f.enqueue("good", 42, "480p");
  ASSERT_TRUE(first.success());
  auto job = f.pipeline.queue->waitFor(first.outcomes(0).job_id(), std::chrono::seconds(20));
  ASSERT_TRUE(job.has_value());
  ASSERT_EQ(job->status, JobStatus::Succeeded);

  auto repeated = f.enqueue("good", 42, "480p");
  EXPECT_FALSE(repeated.success());
  ASSERT_EQ(repeated.outcomes_size(), 1);
  EXPECT_EQ(repeated.outcomes(0).error_code(), toString(ErrorCode::Conflict));

  auto listed = f.listRenditions("good", 42);
  ASSERT_TRUE(listed.success());
  ASSERT_EQ(listed.profiles_size(), 1);
  EXPECT_EQ(listed.profiles(0), "480p");

  auto read = f.getJob("good", first.outcomes(0).job_id());
  ASSERT_TRUE(read.success());
  EXPECT_EQ(read.job().status(), "succeeded");
  EXPECT_EQ(read.job().video_id(), 42);
  EXPECT_EQ(read.job().attempts(), 1);
  EXPECT_GT(read.job().finished_at_ms(), 0);

  // only queued jobs can be cancelled
  auto cancelled = f.cancelJob("good", first.outcomes(0).job_id());
  EXPECT_FALSE(cancelled.success());
  EXPECT_TRUE(cancelled.message().starts_with("conflict")) << cancelled.message();
  f.pipeline.queue->stop();
}

TEST(TranscodeServiceImplTest, CancelQueuedJob) {
  GrpcFixture f;
  auto enqueued = f.enqueue("good", 42, "720p");
  ASSERT_TRUE(enqueued.success());

  auto cancelled = f.cancelJob("good", enqueued.outcomes(0).job_id());
  ASSERT_TRUE(cancelled.success());
  EXPECT_EQ(cancelled.job().status(), "failed");
  EXPECT_EQ(cancelled.job().last_error(), "cancelled");
}

TEST(TranscodeServiceImplTest, UnknownJobIsNotFound) {
  GrpcFixture f;
  auto read = f.getJob("good", "no-such-job");
  EXPECT_FALSE(read.success());
  EXPECT_TRUE(read.message().starts_with("not_found")) << read.message();

  auto cancelled = f.cancelJob("good", "no-such-job");
  EXPECT_FALSE(cancelled.success());
  EXPECT_TRUE(cancelled.message().starts_with("not_found")) << cancelled.message();
}
