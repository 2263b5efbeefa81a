#include "application/transcode_engine.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace transcode_service;
namespace fs = std::filesystem;

namespace {

struct EngineFixture {
  EngineFixture()
    : cfg(test::testTranscodeConfig()),
      profiles(test::testProfiles()),
      store(std::make_shared<LocalContentStore>(dir / "hls")),
      inspector(std::make_shared<test::FakeMediaInspector>(1080)),
      encoder(std::make_shared<test::FakeEncoder>()),
      engine(store, inspector, encoder, cfg) {
    source = dir / "media" / "video42.mp4";
    test::writeFile(source, "source bytes");
  }

  TranscodeRequest request(const std::string& profile, bool overwrite = false) const {
    auto p = *profiles.parse(profile);
    return TranscodeRequest{
      .video_id = 42,
      .source_path = source.string(),
      .profile = p,
      .output_dir = TranscodeEngine::outputDirFor(42, p),
      .overwrite = overwrite,
      .deadline = std::chrono::steady_clock::now() + std::chrono::minutes(5)
    };
  }

  test::TempDir dir;
  config::TranscodeConfig cfg;
  ProfileSet profiles;
  std::shared_ptr<LocalContentStore> store;
  std::shared_ptr<test::FakeMediaInspector> inspector;
  std::shared_ptr<test::FakeEncoder> encoder;
  TranscodeEngine engine;
  fs::path source;
};

} // namespace

TEST(TranscodeEngineTest, ProducesRenditionInOutputDir) {
  EngineFixture f;
  auto rendition = f.engine.transcode(f.request("480p"));
  ASSERT_TRUE(rendition.has_value()) << rendition.error().describe();

  EXPECT_EQ(rendition->video_id, 42);
  EXPECT_EQ(rendition->profile, "480p");
  EXPECT_EQ(rendition->directory, "42/480p");
  EXPECT_EQ(rendition->playlist, "index.m3u8");
  EXPECT_FALSE(rendition->ready);
  ASSERT_EQ(rendition->segments.size(), 3u);
  EXPECT_EQ(rendition->segments[0], "000.ts");
  EXPECT_EQ(rendition->segments[2], "002.ts");

  EXPECT_TRUE(fs::exists(f.dir / "hls/42/480p/index.m3u8"));
  EXPECT_TRUE(fs::exists(f.dir / "hls/42/480p/002.ts"));
  EXPECT_FALSE(fs::exists(f.dir / "hls/42/480p.staging"));
  EXPECT_EQ(f.engine.encoderInvocations(), 1u);
}

TEST(TranscodeEngineTest, CompleteOutputIsReusedWithoutEncoding) {
  EngineFixture f;
  ASSERT_TRUE(f.engine.transcode(f.request("480p")).has_value());
  auto again = f.engine.transcode(f.request("480p"));
  ASSERT_TRUE(again.has_value());

  EXPECT_EQ(again->segments.size(), 3u);
  EXPECT_EQ(f.engine.encoderInvocations(), 1u);
  EXPECT_EQ(f.encoder->calls(), 1);
}

TEST(TranscodeEngineTest, OverwriteEncodesAgain) {
  EngineFixture f;
  ASSERT_TRUE(f.engine.transcode(f.request("480p")).has_value());

  f.encoder->setSegmentCount(5);
  auto again = f.engine.transcode(f.request("480p", true));
  ASSERT_TRUE(again.has_value());

  EXPECT_EQ(f.engine.encoderInvocations(), 2u);
  EXPECT_EQ(again->segments.size(), 5u);
  EXPECT_TRUE(fs::exists(f.dir / "hls/42/480p/004.ts"));
}

TEST(TranscodeEngineTest, IncompleteOutputIsNotReused) {
  EngineFixture f;
  ASSERT_TRUE(f.engine.transcode(f.request("480p")).has_value());
  fs::remove(f.dir / "hls/42/480p/001.ts");

  ASSERT_TRUE(f.engine.transcode(f.request("480p")).has_value());
  EXPECT_EQ(f.engine.encoderInvocations(), 2u);
  EXPECT_TRUE(fs::exists(f.dir / "hls/42/480p/001.ts"));
}

TEST(TranscodeEngineTest, ProfileAboveSourceIsSkipped) {
  EngineFixture f;
  f.inspector->setHeight(480);

  auto result = f.engine.transcode(f.request("720p"));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::ProfileExceedsSource);
  EXPECT_FALSE(result.error().transient);
  EXPECT_EQ(f.engine.encoderInvocations(), 0u);
  EXPECT_FALSE(fs::exists(f.dir / "hls/42/720p"));
  EXPECT_FALSE(fs::exists(f.dir / "hls/42/720p.staging"));

  // equal height is not an upscale
  EXPECT_TRUE(f.engine.transcode(f.request("480p")).has_value());
}

TEST(TranscodeEngineTest, MissingSourceIsFatal) {
  EngineFixture f;
  fs::remove(f.source);

  auto result = f.engine.transcode(f.request("480p"));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::EncodeError);
  EXPECT_FALSE(result.error().transient);
  EXPECT_EQ(f.engine.encoderInvocations(), 0u);
}

TEST(TranscodeEngineTest, FailedEncodeLeavesNothingBehind) {
  EngineFixture f;
  f.encoder->failNext(Error::encodeTransient("ffmpeg exited with code 1"));

  auto result = f.engine.transcode(f.request("480p"));
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().transient);
  EXPECT_FALSE(fs::exists(f.dir / "hls/42/480p"));
  EXPECT_FALSE(fs::exists(f.dir / "hls/42/480p.staging"));
}

TEST(TranscodeEngineTest, FailedOverwriteKeepsPreviousOutput) {
  EngineFixture f;
  ASSERT_TRUE(f.engine.transcode(f.request("480p")).has_value());
  const auto before = test::readFile(f.dir / "hls/42/480p/000.ts");

  f.encoder->failNext(Error::encodeFatal("ffmpeg exited with code 1"));
  ASSERT_FALSE(f.engine.transcode(f.request("480p", true)).has_value());

  EXPECT_EQ(test::readFile(f.dir / "hls/42/480p/000.ts"), before);
  EXPECT_FALSE(fs::exists(f.dir / "hls/42/480p.staging"));
}

TEST(TranscodeEngineTest, OutputWithoutPlaylistIsRejected) {
  EngineFixture f;
  f.encoder->setWritePlaylist(false);

  auto result = f.engine.transcode(f.request("480p"));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::EncodeError);
  EXPECT_FALSE(result.error().transient);
  EXPECT_FALSE(fs::exists(f.dir / "hls/42/480p"));
}

TEST(TranscodeEngineTest, SegmentCountMustFitIndexWidth) {
  EngineFixture f;
  f.cfg.segment_index_width = 1;
  TranscodeEngine narrow(f.store, f.inspector, f.encoder, f.cfg);

  f.encoder->setSegmentCount(10);
  auto fits = narrow.transcode(f.request("480p"));
  ASSERT_TRUE(fits.has_value());
  EXPECT_EQ(fits->segments.back(), "9.ts");

  f.encoder->setSegmentCount(11);
  auto overflow = narrow.transcode(f.request("720p"));
  ASSERT_FALSE(overflow.has_value());
  EXPECT_EQ(overflow.error().code, ErrorCode::EncodeError);
  EXPECT_FALSE(fs::exists(f.dir / "hls/42/720p"));
}
