#include "application/streaming_service.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace transcode_service;
namespace fs = std::filesystem;

namespace {

struct StreamingFixture {
  StreamingFixture()
    : store(std::make_shared<LocalContentStore>(dir / "hls")),
      db(std::make_shared<SqliteStore>((dir / "streaming.db").string())),
      catalog(std::make_shared<RenditionCatalog>(store, db, test::testProfiles())),
      streaming(catalog, store, test::testProfiles()) {
    rendition = Rendition{
      .video_id = 42,
      .profile = "480p",
      .directory = "42/480p",
      .playlist = "index.m3u8",
      .segments = {"000.ts", "001.ts"},
      .ready = false
    };
    test::writeFile(dir / "hls/42/480p/000.ts", "0123456789");
    test::writeFile(dir / "hls/42/480p/001.ts", "abcdefghij");
    test::writeFile(dir / "hls/42/480p/index.m3u8",
                    hls::buildVodPlaylist(rendition.segments, std::chrono::seconds(10)));
  }

  void registerReady() {
    auto ret = catalog->registerRendition(rendition);
    ASSERT_TRUE(ret.has_value()) << ret.error().describe();
  }

  test::TempDir dir;
  std::shared_ptr<LocalContentStore> store;
  std::shared_ptr<SqliteStore> db;
  std::shared_ptr<RenditionCatalog> catalog;
  StreamingService streaming;
  Rendition rendition;
};

} // namespace

TEST(StreamingServiceTest, PlaylistOfReadyRendition) {
  StreamingFixture f;
  f.registerReady();

  auto playlist = f.streaming.getPlaylist(42, "480p");
  ASSERT_TRUE(playlist.has_value());
  EXPECT_EQ(playlist->content_type, "application/vnd.apple.mpegurl");
  EXPECT_EQ(playlist->body, test::readFile(f.dir / "hls/42/480p/index.m3u8"));
  EXPECT_EQ(hls::parseSegmentList(playlist->body), f.rendition.segments);
  EXPECT_FALSE(playlist->partial);
}

TEST(StreamingServiceTest, NotReadyRenditionIsNotFound) {
  StreamingFixture f;
  EXPECT_EQ(f.streaming.getPlaylist(42, "480p").error().code, ErrorCode::NotFound);
  EXPECT_EQ(f.streaming.getSegment(42, "480p", "0").error().code, ErrorCode::NotFound);
  EXPECT_EQ(f.streaming.getPlaylist(42, "4k").error().code, ErrorCode::InvalidArgument);
}

TEST(StreamingServiceTest, SegmentsByIndexAndName) {
  StreamingFixture f;
  f.registerReady();

  auto first = f.streaming.getSegment(42, "480p", "0");
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->body, "0123456789");
  EXPECT_EQ(first->content_type, "video/MP2T");
  EXPECT_EQ(first->total_size, 10u);
  EXPECT_FALSE(first->partial);

  auto second = f.streaming.getSegment(42, "480p", "001.ts");
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->body, "abcdefghij");

  // index == segment count is one past the end
  EXPECT_EQ(f.streaming.getSegment(42, "480p", "2").error().code, ErrorCode::NotFound);
  EXPECT_EQ(f.streaming.getSegment(42, "480p", "../../etc/passwd").error().code, ErrorCode::NotFound);
}

TEST(StreamingServiceTest, SegmentByteRange) {
  StreamingFixture f;
  f.registerReady();

  auto middle = f.streaming.getSegment(42, "480p", "1", "bytes=2-5");
  ASSERT_TRUE(middle.has_value());
  EXPECT_TRUE(middle->partial);
  EXPECT_EQ(middle->body, "cdef");
  EXPECT_EQ(middle->offset, 2u);
  EXPECT_EQ(middle->total_size, 10u);

  auto tail = f.streaming.getSegment(42, "480p", "1", "bytes=-3");
  ASSERT_TRUE(tail.has_value());
  EXPECT_EQ(tail->body, "hij");
  EXPECT_EQ(tail->offset, 7u);

  auto open = f.streaming.getSegment(42, "480p", "1", "bytes=8-");
  ASSERT_TRUE(open.has_value());
  EXPECT_EQ(open->body, "ij");

  auto beyond = f.streaming.getSegment(42, "480p", "1", "bytes=10-20");
  ASSERT_FALSE(beyond.has_value());
  EXPECT_EQ(beyond.error().code, ErrorCode::RangeNotSatisfiable);
  EXPECT_EQ(beyond.error().message, "bytes */10");
}

TEST(StreamingServiceTest, MissingReadyFileIsDeliveryError) {
  StreamingFixture f;
  f.registerReady();
  fs::remove(f.dir / "hls/42/480p/001.ts");
  fs::remove(f.dir / "hls/42/480p/index.m3u8");

  EXPECT_EQ(f.streaming.getSegment(42, "480p", "1").error().code, ErrorCode::DeliveryError);
  EXPECT_EQ(f.streaming.getPlaylist(42, "480p").error().code, ErrorCode::DeliveryError);
  EXPECT_TRUE(f.streaming.getSegment(42, "480p", "0").has_value());
}

TEST(StreamingServiceTest, RenditionReplacedElsewhereIsReread) {
  StreamingFixture f;
  f.registerReady();
  ASSERT_TRUE(f.streaming.getSegment(42, "480p", "1").has_value());

  // another process re-encodes the rendition with a single segment
  RenditionCatalog other(f.store, std::make_shared<SqliteStore>((f.dir / "streaming.db").string()),
                         test::testProfiles());
  ASSERT_TRUE(other.retract(42, "480p").has_value());
  fs::remove(f.dir / "hls/42/480p/001.ts");
  auto shorter = f.rendition;
  shorter.segments = {"000.ts"};
  test::writeFile(f.dir / "hls/42/480p/index.m3u8",
                  hls::buildVodPlaylist(shorter.segments, std::chrono::seconds(10)));
  ASSERT_TRUE(other.registerRendition(shorter).has_value());

  auto gone = f.streaming.getSegment(42, "480p", "1");
  ASSERT_FALSE(gone.has_value());
  EXPECT_EQ(gone.error().code, ErrorCode::NotFound);
  EXPECT_EQ(hls::parseSegmentList(f.streaming.getPlaylist(42, "480p")->body), shorter.segments);
  EXPECT_EQ(f.catalog->lookup(42, "480p")->segments.size(), 1u);
}

TEST(StreamingServiceTest, RenditionRetractedElsewhereIsNotFound) {
  StreamingFixture f;
  f.registerReady();

  RenditionCatalog other(f.store, std::make_shared<SqliteStore>((f.dir / "streaming.db").string()),
                         test::testProfiles());
  ASSERT_TRUE(other.retract(42, "480p").has_value());
  fs::remove_all(f.dir / "hls/42/480p");

  EXPECT_EQ(f.streaming.getSegment(42, "480p", "0").error().code, ErrorCode::NotFound);
  EXPECT_EQ(f.streaming.getPlaylist(42, "480p").error().code, ErrorCode::NotFound);
}

TEST(StreamingServiceTest, ResolveRange) {
  auto whole = [](std::string_view header, uint64_t size) {
    auto r = StreamingService::resolveRange(header, size);
    return r.has_value() && !r->has_value();
  };
  EXPECT_TRUE(whole("", 100));
  EXPECT_TRUE(whole("items=0-10", 100));
  EXPECT_TRUE(whole("bytes=0-10,20-30", 100));
  EXPECT_TRUE(whole("bytes=abc", 100));
  EXPECT_TRUE(whole("bytes=5-2", 100));
  EXPECT_TRUE(whole("bytes=-", 100));

  auto r = StreamingService::resolveRange("bytes=0-0", 100);
  ASSERT_TRUE(r.has_value() && r->has_value());
  EXPECT_EQ((*r)->first, 0u);
  EXPECT_EQ((*r)->length(), 1u);

  r = StreamingService::resolveRange("bytes=90-500", 100);
  ASSERT_TRUE(r.has_value() && r->has_value());
  EXPECT_EQ((*r)->last, 99u);

  r = StreamingService::resolveRange("bytes=-500", 100);
  ASSERT_TRUE(r.has_value() && r->has_value());
  EXPECT_EQ((*r)->first, 0u);
  EXPECT_EQ((*r)->last, 99u);

  EXPECT_FALSE(StreamingService::resolveRange("bytes=100-", 100).has_value());
  EXPECT_FALSE(StreamingService::resolveRange("bytes=-0", 100).has_value());
  EXPECT_FALSE(StreamingService::resolveRange("bytes=0-", 0).has_value());
}
