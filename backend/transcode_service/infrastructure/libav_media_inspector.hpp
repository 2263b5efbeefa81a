#pragma once

// project
#include "domain/transcoding_service.hpp"

// ffmpeg
extern "C" {
  #include <libavformat/avformat.h>
  #include <libavcodec/avcodec.h>
  #include <libavutil/log.h>
}

namespace transcode_service {

// Opens the container with libavformat and reads the best video stream's
// parameters. Nothing is decoded.
class LibavMediaInspector final : public MediaInspector {
public:
  // AV_LOG_QUIET   = -8
  // AV_LOG_ERROR   = 16
  // AV_LOG_WARNING = 24
  // AV_LOG_INFO    = 32
  explicit LibavMediaInspector(int loglevel = AV_LOG_ERROR);

  std::expected<SourceInfo, Error> inspect(const std::filesystem::path& source) override;
};

} // namespace transcode_service
