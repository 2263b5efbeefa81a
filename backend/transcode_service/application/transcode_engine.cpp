#include "transcode_engine.hpp"
#include "infrastructure/hls_playlist.hpp"

#include <cmath>
#include <format>
#include <iostream>

namespace transcode_service {

TranscodeEngine::TranscodeEngine(std::shared_ptr<ContentStore> store,
                                 std::shared_ptr<MediaInspector> inspector,
                                 std::shared_ptr<Encoder> encoder,
                                 const config::TranscodeConfig& cfg)
  : store_(std::move(store)),
    inspector_(std::move(inspector)),
    encoder_(std::move(encoder)),
    segment_duration_(cfg.segment_duration),
    segment_index_width_(cfg.segment_index_width) {}

std::string TranscodeEngine::outputDirFor(int64_t video_id, const Profile& profile) {
  return std::format("{}/{}", video_id, profile.name);
}

std::expected<Rendition, Error> TranscodeEngine::transcode(const TranscodeRequest& request) {
  const auto& profile = request.profile;

  if (request.source_path.empty() || !store_->exists(request.source_path)) {
    return std::unexpected(Error::encodeFatal("Source file does not exist: " + request.source_path));
  }

  if (!request.overwrite) {
    if (auto cached = existingRendition(request, request.output_dir)) {
      std::cout << "[TranscodeEngine] " << request.output_dir << " already complete ("
                << cached->segments.size() << " segments), skipping encode" << std::endl;
      return *cached;
    }
  }

  auto info = inspector_->inspect(store_->resolve(request.source_path));
  if (!info) {
    return std::unexpected(info.error());
  }

  // never upscale: a rung above the source is skipped, not re-targeted
  if (profile.height > info->height) {
    return std::unexpected(Error::profileExceedsSource(std::format(
      "skipped {}: profile height {} exceeds source height {}", profile.name, profile.height, info->height)));
  }

  const std::string staging = request.output_dir + STAGING_DIR_SUFFIX;
  if (auto ret = store_->removeAll(staging); !ret) {
    return std::unexpected(ret.error());
  }
  if (auto ret = store_->makeDirectory(staging); !ret) {
    return std::unexpected(ret.error());
  }

  auto discard = [this, &staging]() {
    if (auto ret = store_->removeAll(staging); !ret) {
      std::cerr << "[TranscodeEngine] cleanup failed: " << ret.error().message << std::endl;
    }
  };

  EncodeRequest encode_request{
    .source = store_->resolve(request.source_path),
    .output_dir = store_->resolve(staging),
    .profile = profile,
    .segment_duration = segment_duration_,
    .segment_index_width = segment_index_width_,
    .deadline = request.deadline
  };

  std::cout << "[TranscodeEngine] encoding " << request.source_path << " -> "
            << request.output_dir << " (" << profile.height << "p, " << profile.video_bitrate << " bps)" << std::endl;
  encoder_invocations_.fetch_add(1);
  if (auto ret = encoder_->encode(encode_request); !ret) {
    discard();
    return std::unexpected(ret.error());
  }

  auto segments = validateOutput(staging);
  if (!segments) {
    discard();
    return std::unexpected(segments.error());
  }

  if (auto ret = store_->replaceDirectory(staging, request.output_dir); !ret) {
    discard();
    return std::unexpected(ret.error());
  }

  return Rendition{
    .video_id = request.video_id,
    .profile = profile.name,
    .directory = request.output_dir,
    .playlist = PLAYLIST_FILE_NAME,
    .segments = std::move(*segments),
    .ready = false
  };
}

std::optional<Rendition> TranscodeEngine::existingRendition(const TranscodeRequest& request,
                                                           const std::string& dir) const {
  const auto playlist_path = std::filesystem::path(dir) / PLAYLIST_FILE_NAME;
  if (!store_->exists(playlist_path)) {
    return std::nullopt;
  }
  auto playlist = store_->read(playlist_path);
  if (!playlist) {
    return std::nullopt;
  }
  auto segments = hls::parseSegmentList(*playlist);
  if (segments.empty()) {
    return std::nullopt;
  }
  for (const auto& segment : segments) {
    auto bytes = store_->size(std::filesystem::path(dir) / segment);
    if (!bytes || *bytes == 0) {
      return std::nullopt;
    }
  }
  return Rendition{
    .video_id = request.video_id,
    .profile = request.profile.name,
    .directory = dir,
    .playlist = PLAYLIST_FILE_NAME,
    .segments = std::move(segments),
    .ready = false
  };
}

std::expected<std::vector<std::string>, Error> TranscodeEngine::validateOutput(const std::string& dir) const {
  auto playlist = store_->read(std::filesystem::path(dir) / PLAYLIST_FILE_NAME);
  if (!playlist) {
    return std::unexpected(Error::encodeFatal("Encoder produced no playlist in " + dir));
  }
  auto segments = hls::parseSegmentList(*playlist);
  if (segments.empty()) {
    return std::unexpected(Error::encodeFatal("Encoder produced an empty playlist in " + dir));
  }
  const auto max_segments = static_cast<size_t>(std::pow(10, segment_index_width_));
  if (segments.size() > max_segments) {
    return std::unexpected(Error::encodeFatal(std::format(
      "{} segments do not fit a {}-digit index", segments.size(), segment_index_width_)));
  }
  for (size_t i = 0; i < segments.size(); ++i) {
    if (segments[i] != hls::segmentFileName(i, segment_index_width_)) {
      return std::unexpected(Error::encodeFatal(std::format(
        "playlist entry {} is '{}', expected '{}'", i, segments[i], hls::segmentFileName(i, segment_index_width_))));
    }
    auto bytes = store_->size(std::filesystem::path(dir) / segments[i]);
    if (!bytes) {
      return std::unexpected(Error::storage("Segment missing after encode: " + segments[i] + " (" + bytes.error().message + ")"));
    }
    if (*bytes == 0) {
      return std::unexpected(Error::storage("Segment is empty after encode: " + segments[i]));
    }
  }
  return segments;
}

} // namespace transcode_service
