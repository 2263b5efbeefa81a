#include "streaming_service.hpp"
#include "infrastructure/hls_playlist.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <charconv>
#include <format>
#include <iostream>

namespace transcode_service {

namespace {

std::optional<uint64_t> parseNumber(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

StreamingService::StreamingService(std::shared_ptr<RenditionCatalog> catalog,
                                   std::shared_ptr<ContentStore> store,
                                   const ProfileSet& profiles)
  : catalog_(std::move(catalog)),
    store_(std::move(store)),
    profiles_(profiles) {}

std::expected<Rendition, Error> StreamingService::readyRendition(int64_t video_id, std::string_view profile) const {
  auto parsed = profiles_.parse(profile);
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  return catalog_->lookup(video_id, parsed->name);
}

std::expected<MediaPayload, Error> StreamingService::getPlaylist(int64_t video_id, std::string_view profile) const {
  auto rendition = readyRendition(video_id, profile);
  if (!rendition) {
    return std::unexpected(rendition.error());
  }
  auto payload = readPlaylist(*rendition);
  if (payload || payload.error().code != ErrorCode::DeliveryError) {
    return payload;
  }
  auto current = revalidate(*rendition);
  if (!current) {
    return std::unexpected(current.error());
  }
  return *current ? readPlaylist(**current) : payload;
}

std::expected<MediaPayload, Error> StreamingService::getSegment(int64_t video_id, std::string_view profile,
                                                                std::string_view segment,
                                                                std::string_view range_header) const {
  auto rendition = readyRendition(video_id, profile);
  if (!rendition) {
    return std::unexpected(rendition.error());
  }
  auto payload = readSegment(*rendition, segment, range_header);
  if (payload || payload.error().code != ErrorCode::DeliveryError) {
    return payload;
  }
  auto current = revalidate(*rendition);
  if (!current) {
    return std::unexpected(current.error());
  }
  return *current ? readSegment(**current, segment, range_header) : payload;
}

std::expected<std::optional<Rendition>, Error> StreamingService::revalidate(const Rendition& used) const {
  auto current = catalog_->reload(used.video_id, used.profile);
  if (!current) {
    // retracted or removed meanwhile
    return std::unexpected(current.error());
  }
  if (current->directory == used.directory && current->playlist == used.playlist &&
      current->segments == used.segments) {
    return std::nullopt;
  }
  return std::optional<Rendition>(std::move(*current));
}

std::expected<MediaPayload, Error> StreamingService::readPlaylist(const Rendition& rendition) const {
  auto body = store_->read(rendition.playlistPath());
  if (!body) {
    std::cerr << "[StreamingService] ready playlist unreadable: " << body.error().message << std::endl;
    return std::unexpected(Error::delivery("Playlist of ready rendition " + rendition.directory +
                                           " is unreadable: " + body.error().message));
  }
  const auto size = body->size();
  return MediaPayload{
    .body = std::move(*body),
    .content_type = PLAYLIST_CONTENT_TYPE,
    .offset = 0,
    .total_size = size,
    .partial = false
  };
}

std::expected<MediaPayload, Error> StreamingService::readSegment(const Rendition& rendition,
                                                                 std::string_view segment,
                                                                 std::string_view range_header) const {
  auto index = hls::segmentIndexFromName(segment);
  if (!index || *index >= rendition.segments.size()) {
    return std::unexpected(Error::notFound(std::format(
      "No segment '{}' in {} ({} segments)", segment, rendition.directory, rendition.segments.size())));
  }

  const auto path = rendition.segmentPath(*index);
  auto size = store_->size(path);
  if (!size) {
    std::cerr << "[StreamingService] ready segment missing: " << size.error().message << std::endl;
    return std::unexpected(Error::delivery("Segment of ready rendition is unreadable: " + size.error().message));
  }

  auto range = resolveRange(range_header, *size);
  if (!range) {
    return std::unexpected(range.error());
  }

  const uint64_t offset = *range ? (*range)->first : 0;
  const uint64_t length = *range ? (*range)->length() : *size;
  auto body = store_->readRange(path, offset, length);
  if (!body) {
    std::cerr << "[StreamingService] ready segment unreadable: " << body.error().message << std::endl;
    return std::unexpected(Error::delivery("Segment of ready rendition is unreadable: " + body.error().message));
  }

  return MediaPayload{
    .body = std::move(*body),
    .content_type = SEGMENT_CONTENT_TYPE,
    .offset = offset,
    .total_size = *size,
    .partial = range->has_value()
  };
}

std::expected<std::optional<ByteRange>, Error> StreamingService::resolveRange(std::string_view header, uint64_t size) {
  std::string value(header);
  boost::algorithm::trim(value);
  if (value.empty() || !boost::algorithm::istarts_with(value, "bytes=")) {
    return std::nullopt;
  }
  std::string_view ranges = std::string_view(value).substr(6);
  if (ranges.find(',') != std::string_view::npos) {
    return std::nullopt;
  }
  auto dash = ranges.find('-');
  if (dash == std::string_view::npos) {
    return std::nullopt;
  }
  auto first_text = ranges.substr(0, dash);
  auto last_text = ranges.substr(dash + 1);

  auto unsatisfiable = [size]() {
    return std::unexpected(Error::rangeNotSatisfiable(std::format("bytes */{}", size)));
  };

  // bytes=-n, the last n bytes
  if (first_text.empty()) {
    auto suffix = parseNumber(last_text);
    if (!suffix) {
      return std::nullopt;
    }
    if (*suffix == 0 || size == 0) {
      return unsatisfiable();
    }
    auto n = std::min(*suffix, size);
    return ByteRange{size - n, size - 1};
  }

  auto first = parseNumber(first_text);
  if (!first) {
    return std::nullopt;
  }
  std::optional<uint64_t> last;
  if (!last_text.empty()) {
    last = parseNumber(last_text);
    if (!last || *last < *first) {
      return std::nullopt;
    }
  }
  if (*first >= size) {
    return unsatisfiable();
  }
  return ByteRange{*first, std::min(last.value_or(size - 1), size - 1)};
}

} // namespace transcode_service
