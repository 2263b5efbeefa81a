#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace transcode_service {

// Owned by the video catalog; this service only reads id and source path.
struct Video {
  int64_t id{0};
  std::string source_path;
  std::string title;
};

// One playable encoding of a video at one profile. `directory` is relative to
// the HLS root ("42/480p"); `segments` are file names inside it, in
// presentation order.
struct Rendition {
  int64_t video_id{0};
  std::string profile;
  std::string directory;
  std::string playlist{"index.m3u8"};
  std::vector<std::string> segments;
  bool ready{false};

  std::filesystem::path playlistPath() const { return std::filesystem::path(directory) / playlist; }
  std::filesystem::path segmentPath(size_t index) const { return std::filesystem::path(directory) / segments.at(index); }
};

#define STAGING_DIR_SUFFIX ".staging"
#define PLAYLIST_FILE_NAME "index.m3u8"
#define SEGMENT_FILE_EXTENSION ".ts"

} // namespace transcode_service
