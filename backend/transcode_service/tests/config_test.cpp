#include "common/config/config.hpp"
#include "domain/profile.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace transcode_service;

TEST(ConfigTest, Defaults) {
  auto cfg = config::Config::defaults();

  EXPECT_EQ(cfg.getDatabase().backend, "sqlite");
  EXPECT_EQ(cfg.getHttp().port, 8080);
  EXPECT_EQ(cfg.getHttp().idle_timeout, std::chrono::seconds(30));
  EXPECT_EQ(cfg.getHttp().max_body_bytes, 64u * 1024u);
  EXPECT_EQ(cfg.getGrpcIpPort(), "0.0.0.0:50053");
  EXPECT_EQ(cfg.getAuth().mode, "grpc");
  EXPECT_EQ(cfg.getTranscode().segment_index_width, 3);
  EXPECT_EQ(cfg.getTranscode().segment_duration, std::chrono::seconds(10));
  EXPECT_LT(cfg.getTranscode().job_timeout, cfg.getTranscode().lease_timeout);
  ASSERT_EQ(cfg.getTranscode().profiles.size(), 3u);
  EXPECT_EQ(cfg.getTranscode().profiles[0].name, "480p");
  EXPECT_EQ(cfg.getTranscode().profiles[2].name, "1080p");
}

TEST(ConfigTest, MissingFileYieldsDefaults) {
  auto cfg = config::Config::fromFile("/nonexistent/streamforge.json");
  EXPECT_EQ(cfg.getDatabase().backend, "sqlite");
  EXPECT_EQ(cfg.getTranscode().profiles.size(), 3u);
}

TEST(ConfigTest, JsonOverridesDefaults) {
  auto cfg = config::Config::fromJson(R"({
    "database": {"backend": "mysql", "host": "db.internal", "port": 3307},
    "storage": {"media_root": "/srv/media"},
    "auth": {"mode": "disabled"},
    "transcode": {
      "worker_count": 2,
      "max_attempts": 5,
      "backoff_base_ms": 500,
      "profiles": [
        {"name": "360p", "height": 360, "video_bitrate": 800000},
        {"name": "720p", "height": 720, "video_bitrate": 2800000, "audio_bitrate": 160000}
      ]
    }
  })");

  EXPECT_EQ(cfg.getDatabase().backend, "mysql");
  EXPECT_EQ(cfg.getDatabase().host, "db.internal");
  EXPECT_EQ(cfg.getDatabase().port, 3307u);
  EXPECT_EQ(cfg.getStorage().media_root, "/srv/media");
  EXPECT_EQ(cfg.getStorage().hls_root, "/srv/media/hls");
  EXPECT_EQ(cfg.getAuth().mode, "disabled");

  const auto& tc = cfg.getTranscode();
  EXPECT_EQ(tc.worker_count, 2u);
  EXPECT_EQ(tc.max_attempts, 5);
  EXPECT_EQ(tc.backoff_base, std::chrono::milliseconds(500));
  ASSERT_EQ(tc.profiles.size(), 2u);
  EXPECT_EQ(tc.profiles[0].name, "360p");
  EXPECT_EQ(tc.profiles[0].audio_bitrate, 128000);
  EXPECT_EQ(tc.profiles[1].audio_bitrate, 160000);
}

TEST(ConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(config::Config::fromJson("{not json"), std::runtime_error);
  EXPECT_THROW(config::Config::fromJson(R"({"database": {"backend": "postgres"}})"), std::runtime_error);
  EXPECT_THROW(config::Config::fromJson(R"({"auth": {"mode": "basic"}})"), std::runtime_error);
  EXPECT_THROW(config::Config::fromJson(R"({"transcode": {"worker_count": 0}})"), std::runtime_error);
  EXPECT_THROW(config::Config::fromJson(R"({"transcode": {"segment_index_width": 10}})"), std::runtime_error);
  EXPECT_THROW(config::Config::fromJson(R"({"transcode": {"profiles": []}})"), std::runtime_error);
  EXPECT_THROW(config::Config::fromJson(R"({"transcode": {"job_timeout_s": 600, "lease_timeout_s": 600}})"),
               std::runtime_error);
  EXPECT_THROW(config::Config::fromJson(R"({"transcode": {"worker_count": "many"}})"), std::runtime_error);
}

TEST(ProfileSetTest, ParseKnownAndUnknown) {
  auto profiles = ProfileSet::fromConfig(config::Config::defaults().getTranscode().profiles);

  auto p480 = profiles.parse("480p");
  ASSERT_TRUE(p480.has_value());
  EXPECT_EQ(p480->height, 480);
  EXPECT_EQ(p480->rank, 0u);

  auto p1080 = profiles.parse("1080p");
  ASSERT_TRUE(p1080.has_value());
  EXPECT_EQ(p1080->rank, 2u);

  auto unknown = profiles.parse("4k");
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().code, ErrorCode::InvalidArgument);
  EXPECT_NE(unknown.error().message.find("480p"), std::string::npos);
}

TEST(ProfileSetTest, RejectsBadLadders) {
  using P = config::ProfileConfig;
  EXPECT_THROW(ProfileSet::fromConfig({}), std::runtime_error);
  EXPECT_THROW(ProfileSet::fromConfig({P{"720p", 720, 1, 1}, P{"480p", 480, 1, 1}}), std::runtime_error);
  EXPECT_THROW(ProfileSet::fromConfig({P{"480p", 480, 1, 1}, P{"480p", 576, 1, 1}}), std::runtime_error);
  EXPECT_THROW(ProfileSet::fromConfig({P{"480p", 0, 1, 1}}), std::runtime_error);
  EXPECT_THROW(ProfileSet::fromConfig({P{"../x", 480, 1, 1}}), std::runtime_error);
}
