#include "libav_media_inspector.hpp"
#include <memory>

namespace transcode_service {

namespace {

struct FormatContextCloser {
  void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};

std::string avError(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, AV_ERROR_MAX_STRING_SIZE);
  return buf;
}

} // namespace

LibavMediaInspector::LibavMediaInspector(int loglevel) {
  av_log_set_level(loglevel);
}

std::expected<SourceInfo, Error> LibavMediaInspector::inspect(const std::filesystem::path& source) {
  AVFormatContext* raw = nullptr;
  if (int ret = avformat_open_input(&raw, source.c_str(), nullptr, nullptr); ret < 0) {
    if (ret == AVERROR(ENOENT)) {
      return std::unexpected(Error::encodeFatal("Source file does not exist: " + source.string()));
    }
    return std::unexpected(Error::encodeFatal("Could not open source " + source.string() + ": " + avError(ret)));
  }
  std::unique_ptr<AVFormatContext, FormatContextCloser> input_ctx(raw);

  if (int ret = avformat_find_stream_info(input_ctx.get(), nullptr); ret < 0) {
    return std::unexpected(Error::encodeFatal("Could not find stream info in " + source.string() + ": " + avError(ret)));
  }

  int video_stream_idx = av_find_best_stream(input_ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    return std::unexpected(Error::encodeFatal("Could not find video stream in " + source.string()));
  }

  const AVCodecParameters* par = input_ctx->streams[video_stream_idx]->codecpar;
  if (par->width <= 0 || par->height <= 0) {
    return std::unexpected(Error::encodeFatal("Video stream has no frame size in " + source.string()));
  }

  SourceInfo info;
  info.width = par->width;
  info.height = par->height;
  info.codec = avcodec_get_name(par->codec_id);
  if (input_ctx->duration != AV_NOPTS_VALUE) {
    info.duration = static_cast<double>(input_ctx->duration) / AV_TIME_BASE;
  }
  return info;
}

} // namespace transcode_service
