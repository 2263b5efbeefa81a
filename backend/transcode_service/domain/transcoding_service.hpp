#pragma once
#include "domain/error.hpp"
#include "domain/profile.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <string>

namespace transcode_service {

struct SourceInfo {
  int width{0};
  int height{0};
  double duration{0.0};  // seconds, 0 when the container does not say
  std::string codec;
};

// Reads stream geometry of a source file.
class MediaInspector {
public:
  virtual ~MediaInspector() = default;
  virtual std::expected<SourceInfo, Error> inspect(const std::filesystem::path& source) = 0;
};

struct EncodeRequest {
  std::filesystem::path source;
  std::filesystem::path output_dir;  // absolute, already exists and is empty
  Profile profile;
  std::chrono::seconds segment_duration{10};
  int segment_index_width{3};
  std::chrono::steady_clock::time_point deadline;
};

// Produces index.m3u8 plus %0Nd.ts segments for one profile in output_dir.
// Errors carry the transient/fatal classification.
class Encoder {
public:
  virtual ~Encoder() = default;
  virtual std::expected<void, Error> encode(const EncodeRequest& request) = 0;
};

} // namespace transcode_service
