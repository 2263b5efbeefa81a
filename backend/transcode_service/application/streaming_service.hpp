#pragma once

#include "application/rendition_catalog.hpp"
#include "domain/content_store.hpp"
#include "domain/profile.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace transcode_service {

#define PLAYLIST_CONTENT_TYPE "application/vnd.apple.mpegurl"
#define SEGMENT_CONTENT_TYPE "video/MP2T"

// inclusive byte positions
struct ByteRange {
  uint64_t first{0};
  uint64_t last{0};

  uint64_t length() const { return last - first + 1; }
};

struct MediaPayload {
  std::string body;
  std::string content_type;
  uint64_t offset{0};      // first byte of body within the file
  uint64_t total_size{0};  // size of the whole file
  bool partial{false};
};

// Read side of the rendition store. Holds no per-request state; everything
// comes from the catalog and the content store. A failed read is checked
// against the stored rendition first, since another process may have
// replaced or retracted it.
class StreamingService {
public:
  StreamingService(std::shared_ptr<RenditionCatalog> catalog,
                   std::shared_ptr<ContentStore> store,
                   const ProfileSet& profiles);

  std::expected<MediaPayload, Error> getPlaylist(int64_t video_id, std::string_view profile) const;

  // `segment` is an index ("7") or a segment file name ("007.ts").
  // `range_header` is the raw Range header value, empty if absent.
  std::expected<MediaPayload, Error> getSegment(int64_t video_id, std::string_view profile,
                                                std::string_view segment,
                                                std::string_view range_header = {}) const;

  // Resolves a Range header against a file size. nullopt means "send the
  // whole file": no header, another unit, a malformed value or several
  // ranges. A well-formed single range that misses the file is
  // RangeNotSatisfiable.
  static std::expected<std::optional<ByteRange>, Error> resolveRange(std::string_view header, uint64_t size);

private:
  std::expected<Rendition, Error> readyRendition(int64_t video_id, std::string_view profile) const;
  std::expected<MediaPayload, Error> readPlaylist(const Rendition& rendition) const;
  std::expected<MediaPayload, Error> readSegment(const Rendition& rendition, std::string_view segment,
                                                 std::string_view range_header) const;
  // After a failed read: the stored entry if it differs from `used`, nullopt
  // if unchanged (a real integrity failure), NotFound if no longer ready.
  std::expected<std::optional<Rendition>, Error> revalidate(const Rendition& used) const;

  std::shared_ptr<RenditionCatalog> catalog_;
  std::shared_ptr<ContentStore> store_;
  ProfileSet profiles_;
};

} // namespace transcode_service
