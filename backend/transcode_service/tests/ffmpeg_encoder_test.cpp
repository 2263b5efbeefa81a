#include "infrastructure/ffmpeg_encoder.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using namespace transcode_service;

namespace {

EncodeRequest sampleRequest() {
  auto profiles = test::testProfiles();
  return EncodeRequest{
    .source = "/srv/media/video42.mp4",
    .output_dir = "/srv/media/hls/42/720p.staging",
    .profile = *profiles.parse("720p"),
    .segment_duration = std::chrono::seconds(6),
    .segment_index_width = 3,
    .deadline = std::chrono::steady_clock::now() + std::chrono::minutes(1)
  };
}

bool hasPair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
  auto it = std::find(args.begin(), args.end(), flag);
  return it != args.end() && std::next(it) != args.end() && *std::next(it) == value;
}

} // namespace

TEST(FfmpegEncoderTest, ArgumentsDescribeTheProfile) {
  FfmpegEncoder encoder("/nonexistent/ffmpeg");
  auto args = encoder.buildArguments(sampleRequest());

  EXPECT_TRUE(hasPair(args, "-i", "/srv/media/video42.mp4"));
  EXPECT_TRUE(hasPair(args, "-vf", "scale=-2:720"));
  EXPECT_TRUE(hasPair(args, "-b:v", "2800000"));
  EXPECT_TRUE(hasPair(args, "-hls_time", "6"));
  EXPECT_TRUE(hasPair(args, "-hls_playlist_type", "vod"));
  EXPECT_TRUE(hasPair(args, "-hls_segment_filename", "/srv/media/hls/42/720p.staging/%03d.ts"));
  ASSERT_FALSE(args.empty());
  EXPECT_EQ(args.back(), "/srv/media/hls/42/720p.staging/index.m3u8");
}

TEST(FfmpegEncoderTest, MissingBinaryIsFatal) {
  FfmpegEncoder encoder("/nonexistent/ffmpeg");
  auto result = encoder.encode(sampleRequest());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::EncodeError);
  EXPECT_FALSE(result.error().transient);
}

TEST(FfmpegEncoderTest, ClassifiesFailures) {
  auto corrupt = FfmpegEncoder::classifyFailure(1, false, "video.mp4: Invalid data found when processing input");
  EXPECT_EQ(corrupt.code, ErrorCode::EncodeError);
  EXPECT_FALSE(corrupt.transient);

  auto missing = FfmpegEncoder::classifyFailure(1, false, "video.mp4: No such file or directory");
  EXPECT_FALSE(missing.transient);

  auto memory = FfmpegEncoder::classifyFailure(1, false, "Cannot allocate memory");
  EXPECT_EQ(memory.code, ErrorCode::EncodeError);
  EXPECT_TRUE(memory.transient);

  auto killed = FfmpegEncoder::classifyFailure(9, true, "");
  EXPECT_TRUE(killed.transient);
  EXPECT_NE(killed.message.find("signal 9"), std::string::npos);

  auto disk = FfmpegEncoder::classifyFailure(1, false, "av_interleaved_write_frame(): No space left on device");
  EXPECT_EQ(disk.code, ErrorCode::StorageError);
  EXPECT_FALSE(disk.transient);

  auto unknown = FfmpegEncoder::classifyFailure(187, false, "something odd happened");
  EXPECT_EQ(unknown.code, ErrorCode::EncodeError);
  EXPECT_TRUE(unknown.transient);
  EXPECT_NE(unknown.message.find("code 187"), std::string::npos);
}
