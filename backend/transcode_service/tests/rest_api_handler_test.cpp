#include "interface/rest_api_handler.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace transcode_service;

namespace {

// Only "good" may touch anything.
class TokenAuthorizer final : public Authorizer {
public:
  bool isAuthorized(const std::string& caller_token, int64_t) override { return caller_token == "good"; }
};

common::Request makeRequest(http::verb verb, const std::string& target, const std::string& token = "good") {
  common::Request req{verb, target, 11};
  if (!token.empty()) {
    req.set(http::field::authorization, "Bearer " + token);
  }
  return req;
}

struct ApiFixture {
  ApiFixture() : pipeline(dir) {
    pipeline.addVideo(42);
    handler = std::make_shared<RestApiHandler>(pipeline.queue, pipeline.catalog, pipeline.streaming,
                                               std::make_shared<TokenAuthorizer>());
  }

  void transcode480p() {
    ASSERT_TRUE(pipeline.queue->start().has_value());
    auto enqueued = pipeline.queue->enqueue(42, "480p");
    ASSERT_TRUE(enqueued.has_value());
    auto job = pipeline.queue->waitFor(enqueued->job_id, std::chrono::seconds(20));
    ASSERT_TRUE(job.has_value());
    ASSERT_EQ(job->status, JobStatus::Succeeded);
  }

  common::Response send(common::Request req) { return handler->handleRequest(std::move(req)); }

  test::TempDir dir;
  test::Pipeline pipeline;
  std::shared_ptr<RestApiHandler> handler;
};

} // namespace

TEST(RestApiHandlerTest, StatusMapping) {
  EXPECT_EQ(httpStatusFor(ErrorCode::Conflict), http::status::conflict);
  EXPECT_EQ(httpStatusFor(ErrorCode::NotFound), http::status::not_found);
  EXPECT_EQ(httpStatusFor(ErrorCode::InvalidArgument), http::status::bad_request);
  EXPECT_EQ(httpStatusFor(ErrorCode::Unauthorized), http::status::unauthorized);
  EXPECT_EQ(httpStatusFor(ErrorCode::RangeNotSatisfiable), http::status::range_not_satisfiable);
  EXPECT_EQ(httpStatusFor(ErrorCode::DeliveryError), http::status::internal_server_error);
}

TEST(RestApiHandlerTest, HealthAndPreflight) {
  ApiFixture f;
  EXPECT_EQ(f.send(makeRequest(http::verb::get, "/healthz", "")).result(), http::status::ok);

  auto preflight = f.send(makeRequest(http::verb::options, "/api/video/42/480p/000.ts", ""));
  EXPECT_EQ(preflight.result(), http::status::no_content);
  EXPECT_EQ(preflight[http::field::access_control_allow_origin], "*");

  EXPECT_EQ(f.send(makeRequest(http::verb::get, "/api/nothing/here")).result(), http::status::not_found);
}

TEST(RestApiHandlerTest, EnqueueValidatesRequest) {
  ApiFixture f;

  auto req = makeRequest(http::verb::post, "/api/transcode");
  req.body() = "not json";
  req.prepare_payload();
  EXPECT_EQ(f.send(std::move(req)).result(), http::status::bad_request);

  req = makeRequest(http::verb::post, "/api/transcode");
  req.body() = R"({"video_id": 42, "profile": "4k"})";
  req.prepare_payload();
  EXPECT_EQ(f.send(std::move(req)).result(), http::status::bad_request);

  req = makeRequest(http::verb::post, "/api/transcode");
  req.body() = R"({"video_id": 7})";
  req.prepare_payload();
  EXPECT_EQ(f.send(std::move(req)).result(), http::status::not_found);

  req = makeRequest(http::verb::post, "/api/transcode", "bad");
  req.body() = R"({"video_id": 42})";
  req.prepare_payload();
  EXPECT_EQ(f.send(std::move(req)).result(), http::status::unauthorized);

  req = makeRequest(http::verb::post, "/api/transcode");
  req.body() = R"({"video_id": 42, "profile": "480p", "overwrite": "yes"})";
  req.prepare_payload();
  auto not_boolean = f.send(std::move(req));
  EXPECT_EQ(not_boolean.result(), http::status::bad_request);
  EXPECT_EQ(nlohmann::json::parse(not_boolean.body())["error"], "overwrite must be a boolean");
  EXPECT_TRUE(f.pipeline.queue->jobsForVideo(42)->empty());

  req = makeRequest(http::verb::post, "/api/transcode");
  req.body() = R"({"video_id": 42, "profile": "480p", "overwrite": true})";
  req.prepare_payload();
  EXPECT_EQ(f.send(std::move(req)).result(), http::status::accepted);
}

TEST(RestApiHandlerTest, RemoveVideo) {
  ApiFixture f;
  f.transcode480p();

  EXPECT_EQ(f.send(makeRequest(http::verb::delete_, "/api/video/42", "bad")).result(), http::status::unauthorized);
  EXPECT_EQ(f.send(makeRequest(http::verb::get, "/api/video/42")).result(), http::status::method_not_allowed);
  EXPECT_EQ(f.send(makeRequest(http::verb::delete_, "/api/video/abc")).result(), http::status::bad_request);
  EXPECT_EQ(f.send(makeRequest(http::verb::delete_, "/api/video/7")).result(), http::status::not_found);

  auto removed = f.send(makeRequest(http::verb::delete_, "/api/video/42"));
  ASSERT_EQ(removed.result(), http::status::ok);
  auto body = nlohmann::json::parse(removed.body());
  EXPECT_EQ(body["video_id"], 42);
  EXPECT_EQ(body["cancelled_jobs"], 0);

  EXPECT_EQ(f.send(makeRequest(http::verb::get, "/api/video/42/480p/index.m3u8")).result(), http::status::not_found);
  EXPECT_EQ(nlohmann::json::parse(f.send(makeRequest(http::verb::get, "/api/video/42/renditions")).body())["profiles"],
            nlohmann::json::array());
}

TEST(RestApiHandlerTest, EnqueueThenCancel) {
  ApiFixture f;

  auto req = makeRequest(http::verb::post, "/api/transcode");
  req.body() = R"({"video_id": 42, "profile": "720p"})";
  req.prepare_payload();
  auto res = f.send(std::move(req));
  ASSERT_EQ(res.result(), http::status::accepted);

  auto body = nlohmann::json::parse(res.body());
  ASSERT_EQ(body["jobs"].size(), 1u);
  const auto job_id = body["jobs"][0]["job_id"].get<std::string>();

  auto status = f.send(makeRequest(http::verb::get, "/api/jobs/" + job_id));
  ASSERT_EQ(status.result(), http::status::ok);
  EXPECT_EQ(nlohmann::json::parse(status.body())["job"]["status"], "queued");

  EXPECT_EQ(f.send(makeRequest(http::verb::delete_, "/api/jobs/" + job_id)).result(), http::status::ok);
  auto again = f.send(makeRequest(http::verb::delete_, "/api/jobs/" + job_id));
  EXPECT_EQ(again.result(), http::status::conflict);
  EXPECT_EQ(nlohmann::json::parse(again.body())["code"], "conflict");
}

TEST(RestApiHandlerTest, ServesPlaylistAndSegments) {
  ApiFixture f;
  f.transcode480p();

  auto renditions = f.send(makeRequest(http::verb::get, "/api/video/42/renditions"));
  ASSERT_EQ(renditions.result(), http::status::ok);
  EXPECT_EQ(nlohmann::json::parse(renditions.body())["profiles"], nlohmann::json::array({"480p"}));

  auto playlist = f.send(makeRequest(http::verb::get, "/api/video/42/480p/index.m3u8"));
  ASSERT_EQ(playlist.result(), http::status::ok);
  EXPECT_EQ(playlist[http::field::content_type], "application/vnd.apple.mpegurl");
  EXPECT_EQ(playlist.body().rfind("#EXTM3U", 0), 0u);

  auto segment = f.send(makeRequest(http::verb::get, "/api/video/42/480p/000.ts"));
  ASSERT_EQ(segment.result(), http::status::ok);
  EXPECT_EQ(segment.body(), "video42.mp4:480p:segment-0");
  EXPECT_EQ(segment[http::field::accept_ranges], "bytes");

  EXPECT_EQ(f.send(makeRequest(http::verb::get, "/api/video/42/480p/3")).result(), http::status::not_found);
  EXPECT_EQ(f.send(makeRequest(http::verb::get, "/api/video/42/720p/index.m3u8")).result(), http::status::not_found);
  EXPECT_EQ(f.send(makeRequest(http::verb::get, "/api/video/42/480p/index.m3u8", "")).result(),
            http::status::unauthorized);
}

TEST(RestApiHandlerTest, RangeRequests) {
  ApiFixture f;
  f.transcode480p();
  const std::string full = "video42.mp4:480p:segment-1";

  auto req = makeRequest(http::verb::get, "/api/video/42/480p/001.ts");
  req.set(http::field::range, "bytes=0-4");
  auto partial = f.send(std::move(req));
  ASSERT_EQ(partial.result(), http::status::partial_content);
  EXPECT_EQ(partial.body(), "video");
  EXPECT_EQ(std::string(partial[http::field::content_range]), "bytes 0-4/" + std::to_string(full.size()));

  req = makeRequest(http::verb::get, "/api/video/42/480p/001.ts");
  req.set(http::field::range, "bytes=1000-");
  auto unsatisfiable = f.send(std::move(req));
  EXPECT_EQ(unsatisfiable.result(), http::status::range_not_satisfiable);
  EXPECT_EQ(std::string(unsatisfiable[http::field::content_range]), "bytes */" + std::to_string(full.size()));

  req = makeRequest(http::verb::get, "/api/video/42/480p/001.ts");
  req.set(http::field::range, "bytes=0-1,4-5");
  auto multi = f.send(std::move(req));
  EXPECT_EQ(multi.result(), http::status::ok);
  EXPECT_EQ(multi.body(), full);
}
