// ffmpeg_encoder.hpp
#pragma once

#include "domain/transcoding_service.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace transcode_service {

// Runs the ffmpeg CLI as a child process to segment one profile into HLS.
class FfmpegEncoder final : public Encoder {
public:
  explicit FfmpegEncoder(const std::string& ffmpeg_path);

  std::expected<void, Error> encode(const EncodeRequest& request) override;

  std::vector<std::string> buildArguments(const EncodeRequest& request) const;

  // Maps a failed run onto the error taxonomy. `stderr_tail` is the end of
  // ffmpeg's diagnostic output.
  static Error classifyFailure(int exit_code, bool killed_by_signal, const std::string& stderr_tail);

private:
  static std::string readTail(const std::filesystem::path& path, size_t max_bytes);

  std::filesystem::path ffmpeg_;
  bool ffmpeg_available_;
};

} // namespace transcode_service
