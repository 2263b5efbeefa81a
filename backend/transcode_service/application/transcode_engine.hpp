#pragma once

#include "common/config/config.hpp"
#include "domain/content_store.hpp"
#include "domain/profile.hpp"
#include "domain/transcoding_service.hpp"
#include "domain/video.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace transcode_service {

struct TranscodeRequest {
  int64_t video_id{0};
  std::string source_path;
  Profile profile;
  std::string output_dir;  // relative to the content store root
  bool overwrite{false};
  std::chrono::steady_clock::time_point deadline;
};

// (source, profile) -> Rendition artifact. Output is built in a sibling
// staging directory and moved into place only once complete, so a failed or
// interrupted run never leaves a half-written rendition under output_dir.
class TranscodeEngine {
public:
  TranscodeEngine(std::shared_ptr<ContentStore> store,
                  std::shared_ptr<MediaInspector> inspector,
                  std::shared_ptr<Encoder> encoder,
                  const config::TranscodeConfig& cfg);

  std::expected<Rendition, Error> transcode(const TranscodeRequest& request);

  // "<video_id>/<profile>"
  static std::string outputDirFor(int64_t video_id, const Profile& profile);

  uint64_t encoderInvocations() const { return encoder_invocations_.load(); }

private:
  // A complete rendition already present in `dir`, or nullopt.
  std::optional<Rendition> existingRendition(const TranscodeRequest& request, const std::string& dir) const;
  std::expected<std::vector<std::string>, Error> validateOutput(const std::string& dir) const;

  std::shared_ptr<ContentStore> store_;
  std::shared_ptr<MediaInspector> inspector_;
  std::shared_ptr<Encoder> encoder_;
  std::chrono::seconds segment_duration_;
  int segment_index_width_;
  std::atomic<uint64_t> encoder_invocations_{0};
};

} // namespace transcode_service
